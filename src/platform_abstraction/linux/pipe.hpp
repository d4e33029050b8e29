#pragma once
#include "file_descriptor.hpp"
#include <utility>

namespace ipc {
    // Pipe owns both ends; the read end is non-blocking, the write end is for the child
    class Pipe {
        FileDescriptor _output;
        FileDescriptor _input;

        static std::pair<FileDescriptor, FileDescriptor> MakePipe();

        explicit Pipe(std::pair<FileDescriptor, FileDescriptor> fds) noexcept
            : _output{std::move(fds.first)}, _input{std::move(fds.second)} {
        }

    public:
        Pipe() : Pipe(MakePipe()) {
        }

        // read end
        [[nodiscard]] FileDescriptor &output() noexcept {
            return _output;
        }

        // write end
        [[nodiscard]] FileDescriptor &input() noexcept {
            return _input;
        }
    };
} // namespace ipc
