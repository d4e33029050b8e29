#pragma once
#include "backport_config.hpp"
#include "platform_abstraction/startable.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace backport {

    /**
     * Builds the external command invocations used to inspect and change the host. Privileged
     * commands are prefixed with sudo unless the configuration disables it, and every command
     * carries the configured per-call timeout.
     */
    class SystemCommands {
        const BackportConfig &_config;

        [[nodiscard]] ipc::Startable plain(std::string program, std::vector<std::string> args) const;
        [[nodiscard]] ipc::Startable privileged(
            std::string program, std::vector<std::string> args) const;

    public:
        explicit SystemCommands(const BackportConfig &config) noexcept : _config(config) {
        }

        [[nodiscard]] ipc::Startable versionQuery() const;
        [[nodiscard]] ipc::Startable fetch(const std::filesystem::path &target) const;
        [[nodiscard]] ipc::Startable checksum(const std::filesystem::path &file) const;
        [[nodiscard]] ipc::Startable extract(const std::filesystem::path &archive) const;
        [[nodiscard]] ipc::Startable list(const std::filesystem::path &archive) const;
        [[nodiscard]] ipc::Startable installPackages(
            const std::vector<std::filesystem::path> &packages) const;
        [[nodiscard]] ipc::Startable repairDependencies() const;
        [[nodiscard]] ipc::Startable restartService(const std::string &service) const;
        [[nodiscard]] ipc::Startable isServiceActive(const std::string &service) const;
    };
} // namespace backport
