#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ipc {

    // class for configuring an executable invocation; does not itself run anything
    class Startable {
        std::string _command;
        std::vector<std::string> _args;
        std::optional<std::filesystem::path> _workingDir;
        std::optional<std::chrono::milliseconds> _timeout;

    public:
        Startable() = default;

        explicit Startable(std::string command, std::vector<std::string> arguments = {})
            : _command(std::move(command)), _args(std::move(arguments)) {
        }

        Startable &withWorkingDirectory(std::filesystem::path dir) noexcept {
            _workingDir = std::move(dir);
            return *this;
        }

        // Process group is terminated when the timeout expires
        Startable &withTimeout(std::optional<std::chrono::milliseconds> timeout) noexcept {
            _timeout = timeout;
            return *this;
        }

        [[nodiscard]] const std::string &getCommand() const noexcept {
            return _command;
        }

        [[nodiscard]] const std::vector<std::string> &getArguments() const noexcept {
            return _args;
        }

        [[nodiscard]] const std::optional<std::filesystem::path> &getWorkingDirectory()
            const noexcept {
            return _workingDir;
        }

        [[nodiscard]] const std::optional<std::chrono::milliseconds> &getTimeout() const noexcept {
            return _timeout;
        }

        // Command line as a single string, for logging
        [[nodiscard]] std::string toString() const {
            std::string line{_command};
            for(const auto &arg : _args) {
                line += ' ';
                line += arg;
            }
            return line;
        }
    };
} // namespace ipc
