#pragma once
#include "backport_config.hpp"
#include "data/struct_model.hpp"
#include "platform_abstraction/abstract_process.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace backport {

    enum class InstallState { Installed, NeedsInstall, Error };

    /**
     * Snapshot of what is currently on the host compared against one configuration generation.
     */
    struct InstallationStatus {
        static constexpr std::string_view UNKNOWN_VERSION{"unknown"};

        std::shared_ptr<const BackportConfig> config;
        std::string currentVersion{UNKNOWN_VERSION};
        bool isTargetActive{false};
        bool leftoversExist{false};
        InstallState state{InstallState::NeedsInstall};
        std::optional<std::string> error;

        [[nodiscard]] static std::string toString(InstallState state);
        [[nodiscard]] data::Struct toStruct() const;
    };

    struct VersionQuery {
        bool ok{false};
        std::string version;
        std::string error;
    };

    /**
     * Reads installed version and service state. Only reads; never changes the host.
     */
    class StatusInspector {
        ipc::CommandRunner &_runner;

    public:
        explicit StatusInspector(ipc::CommandRunner &runner) noexcept : _runner(runner) {
        }

        /**
         * All failures are reported through the snapshot (state Error) rather than thrown.
         */
        [[nodiscard]] InstallationStatus inspect(
            const std::shared_ptr<const BackportConfig> &config) const noexcept;

        // Throws if the query command could not be started
        [[nodiscard]] VersionQuery queryVersion(const BackportConfig &config) const;

        [[nodiscard]] bool isServiceActive(
            const BackportConfig &config, const std::string &service) const;

        // Substring match of target inside the reported version text
        [[nodiscard]] static bool isTargetVersion(
            std::string_view currentVersion, std::string_view targetVersion) noexcept;
    };
} // namespace backport
