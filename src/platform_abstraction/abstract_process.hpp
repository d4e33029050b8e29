#pragma once
#include "startable.hpp"

#include <string>

namespace ipc {

    /**
     * Completed result of an external command. A non-zero return code is data, not an error.
     */
    struct CommandResult {
        // Exit code reported when the per-call timeout fires
        static constexpr int TIMED_OUT = 124;
        // Exit code reported when the child could not be prepared (e.g. bad working directory)
        static constexpr int CANNOT_START = 126;
        // Exit code reported when the program could not be executed
        static constexpr int NOT_EXECUTABLE = 127;

        int returnCode{0};
        std::string out;
        std::string err;
        bool timedOut{false};

        [[nodiscard]] bool ok() const noexcept {
            return returnCode == 0;
        }
    };

    /**
     * Runs an external command to completion. Implementations only throw when the command
     * could not be started at all (e.g. resources exhausted).
     */
    class CommandRunner {
    public:
        CommandRunner() noexcept = default;
        CommandRunner(const CommandRunner &) = delete;
        CommandRunner(CommandRunner &&) = delete;
        CommandRunner &operator=(const CommandRunner &) = delete;
        CommandRunner &operator=(CommandRunner &&) = delete;
        virtual ~CommandRunner() noexcept = default;

        [[nodiscard]] virtual CommandResult run(const Startable &startable) = 0;
    };

} // namespace ipc
