#pragma once

#include <string>
#include <sys/types.h>
#include <utility>

namespace ipc {

    class FileDescriptor {
        int _fd{-1};

    public:
        explicit constexpr FileDescriptor(int fd) noexcept : _fd{fd} {
        }

        constexpr FileDescriptor() noexcept = default;

        // returns true if _fd is initialized to a valid file descriptor
        [[nodiscard]] explicit constexpr operator bool() const noexcept {
            return _fd >= 0;
        }

        FileDescriptor &operator=(const FileDescriptor &) = delete;
        FileDescriptor(const FileDescriptor &) = delete;

        FileDescriptor(FileDescriptor &&other) noexcept : _fd(other.release()) {
        }

        FileDescriptor &operator=(FileDescriptor &&other) noexcept {
            reset(other.release());
            return *this;
        }

        ~FileDescriptor() noexcept {
            close();
        }

        // Releases ownership of the current file descriptor
        [[nodiscard]] int release() noexcept {
            return std::exchange(_fd, -1);
        }

        void close() noexcept {
            reset(-1);
        }

        // Close the current file descriptor and take ownership of a new one
        void reset(int newFd) noexcept;

        // Appends whatever is currently readable; returns false once end-of-file is reached
        [[nodiscard]] bool readAvailable(std::string &output) const;

        [[nodiscard]] constexpr int get() const noexcept {
            return _fd;
        }
    };
} // namespace ipc
