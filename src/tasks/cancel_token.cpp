#include "cancel_token.hpp"

namespace tasks {

    void CancelToken::cancel() noexcept {
        std::unique_lock guard{_mutex};
        _cancelled = true;
        _wake.notify_all();
    }

    bool CancelToken::stall(const ExpireTime &end) const noexcept {
        std::unique_lock guard{_mutex};
        auto cancelled = [this]() -> bool { return _cancelled.load(); };
        if(end.isInfinite()) {
            _wake.wait(guard, cancelled);
            return false;
        }
        return !_wake.wait_until(guard, end.toTimePoint(), cancelled);
    }
} // namespace tasks
