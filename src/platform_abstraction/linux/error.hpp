#pragma once

#include <cerrno>

namespace ipc {
    inline constexpr bool isNonBlockingError(int _errno) noexcept {
        if constexpr(EAGAIN == EWOULDBLOCK) {
            return _errno == EWOULDBLOCK;
        } else {
            return _errno == EWOULDBLOCK || _errno == EAGAIN;
        }
    }

    inline constexpr bool isRetryableError(int _errno) noexcept {
        return _errno == EINTR || isNonBlockingError(_errno);
    }
} // namespace ipc
