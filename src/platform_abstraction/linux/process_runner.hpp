#pragma once

#include "platform_abstraction/abstract_process.hpp"
#include <chrono>
#include <sys/types.h>

namespace ipc {

    /**
     * Runs commands with fork/exec. The child gets its own process group so a timeout can
     * terminate everything it spawned. Standard output and error are captured in full.
     */
    class LinuxProcessRunner final : public CommandRunner {
        std::chrono::milliseconds _killGrace;

        static pid_t spawn(const Startable &startable, int outFd, int errFd);
        static int waitForExit(pid_t pid);

    public:
        static constexpr std::chrono::milliseconds DEFAULT_KILL_GRACE{2000};

        explicit LinuxProcessRunner(std::chrono::milliseconds killGrace = DEFAULT_KILL_GRACE)
            : _killGrace(killGrace) {
        }

        [[nodiscard]] CommandResult run(const Startable &startable) override;
    };

    using ProcessRunner = LinuxProcessRunner;
} // namespace ipc
