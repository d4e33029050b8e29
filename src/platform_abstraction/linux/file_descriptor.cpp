#include "file_descriptor.hpp"
#include "error.hpp"
#include <array>
#include <system_error>
#include <tuple>
#include <unistd.h>

namespace ipc {

    void FileDescriptor::reset(int newFd) noexcept {
        if(int old = std::exchange(_fd, newFd); old != -1) {
            std::ignore = ::close(old);
        }
    }

    bool FileDescriptor::readAvailable(std::string &output) const {
        if(!*this) {
            return false;
        }

        static constexpr size_t defaultBufferSize = 0xFFF;
        std::array<char, defaultBufferSize> buffer{};

        for(;;) {
            ssize_t bytesRead = ::read(_fd, buffer.data(), buffer.size());
            if(bytesRead == -1) {
                if(errno == EINTR) {
                    continue;
                }
                if(isNonBlockingError(errno)) {
                    return true;
                }
                throw std::system_error(errno, std::generic_category());
            }
            if(bytesRead == 0) {
                return false;
            }
            output.append(buffer.data(), static_cast<size_t>(bytesRead));
            if(static_cast<size_t>(bytesRead) < buffer.size()) {
                return true;
            }
        }
    }
} // namespace ipc
