#pragma once
#include "backport_config.hpp"
#include "data/struct_model.hpp"
#include "platform_abstraction/abstract_process.hpp"
#include "status_inspector.hpp"
#include "tasks/cancel_token.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace backport {

    enum class InstallAction { Skipped, Installed, Failed, Cancelled };

    struct InstallResult {
        bool success{false};
        InstallAction action{InstallAction::Failed};
        std::string message;
        std::optional<std::string> error;
        std::optional<std::string> version;
        std::optional<bool> isBackported;
        // Non-fatal problems after packages were installed
        std::vector<std::string> warnings;
        std::vector<std::string> errors;

        [[nodiscard]] static std::string toString(InstallAction action);
        [[nodiscard]] data::Struct toStruct() const;
    };

    /**
     * Download, extract, install and restart sequence. Calls on one instance are serialized;
     * a second caller waits and then normally finds the target already active.
     */
    class InstallProcedure {
        ipc::CommandRunner &_runner;
        const StatusInspector &_inspector;
        std::mutex _installMutex;

        void fetchArchive(const BackportConfig &config, const std::filesystem::path &target);
        void extractArchive(const BackportConfig &config);
        void installPackages(
            const BackportConfig &config, const std::vector<std::filesystem::path> &packages);
        [[nodiscard]] bool restartServices(
            const BackportConfig &config,
            const tasks::CancelToken &cancel,
            InstallResult &result);

    public:
        InstallProcedure(ipc::CommandRunner &runner, const StatusInspector &inspector) noexcept
            : _runner(runner), _inspector(inspector) {
        }
        InstallProcedure(const InstallProcedure &) = delete;
        InstallProcedure(InstallProcedure &&) = delete;
        InstallProcedure &operator=(const InstallProcedure &) = delete;
        InstallProcedure &operator=(InstallProcedure &&) = delete;
        ~InstallProcedure() noexcept = default;

        /**
         * Bring the host to the configured target version. With force false and the target
         * already active, nothing is touched. Failures are returned, never thrown.
         */
        [[nodiscard]] InstallResult install(
            const std::shared_ptr<const BackportConfig> &config,
            bool force,
            const tasks::CancelToken &cancel) noexcept;

        /**
         * Compare the SHA-256 of a file against the configured checksum. Throws ChecksumError
         * on mismatch or if the digest could not be computed.
         */
        void verifyChecksum(const BackportConfig &config, const std::filesystem::path &file);
    };
} // namespace backport
