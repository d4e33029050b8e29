#include "pipe.hpp"

#include <array>
#include <cerrno>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>

namespace ipc {
    std::pair<FileDescriptor, FileDescriptor> Pipe::MakePipe() {
        std::array<int, 2> fds{};
        if(pipe2(fds.data(), O_CLOEXEC) == -1) {
            throw std::system_error(errno, std::generic_category());
        }
        FileDescriptor readEnd{fds[0]};
        FileDescriptor writeEnd{fds[1]};
        int flags = fcntl(readEnd.get(), F_GETFL);
        if(flags == -1 || fcntl(readEnd.get(), F_SETFL, flags | O_NONBLOCK) == -1) {
            throw std::system_error(errno, std::generic_category());
        }
        return std::make_pair(std::move(readEnd), std::move(writeEnd));
    }
} // namespace ipc
