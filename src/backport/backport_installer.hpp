#pragma once
#include "archive_validator.hpp"
#include "backport_config.hpp"
#include "command_dispatcher.hpp"
#include "install_procedure.hpp"
#include "reconcile_loop.hpp"
#include "status_inspector.hpp"
#include "tasks/cancel_token.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

namespace backport {

    /**
     * One configured installer instance. Owns the configuration generation, the background
     * reconciliation loop and the request surface. Public operations never throw; failures
     * are reported in the returned structures.
     */
    class BackportInstaller {
    public:
        static constexpr std::string_view CHECK_STATUS{"check_status"};
        static constexpr std::string_view INSTALL_BACKPORT{"install_backport"};
        static constexpr std::string_view GET_NM_VERSION{"get_nm_version"};
        static constexpr std::string_view GET_CONFIG{"get_config"};
        static constexpr std::string_view LIST_BACKPORTS{"list_backports"};
        static constexpr std::string_view VALIDATE_ARCHIVE{"validate_archive"};
        static constexpr std::string_view HEALTH_CHECK{"health_check"};
        static constexpr std::string_view CLEANUP_FILES{"cleanup_files"};

    private:
        std::shared_ptr<ipc::CommandRunner> _runner;
        const ConfigDefaults _defaults;
        StatusInspector _inspector;
        InstallProcedure _procedure;
        ArchiveValidator _validator;
        ConfigState _state;
        CommandDispatcher _dispatcher;

        // Serializes reconfigure/shutdown and guards _loop
        mutable std::mutex _lifecycleMutex;
        std::unique_ptr<ReconcileLoop> _loop;
        // Cancels installs started from requests
        tasks::CancelToken _requestCancel;
        std::atomic_bool _shutdown{false};

        void stopLoop();
        [[nodiscard]] data::Struct notConfigured() const;

    public:
        BackportInstaller(std::shared_ptr<ipc::CommandRunner> runner, ConfigDefaults defaults);
        BackportInstaller(const BackportInstaller &) = delete;
        BackportInstaller(BackportInstaller &&) = delete;
        BackportInstaller &operator=(const BackportInstaller &) = delete;
        BackportInstaller &operator=(BackportInstaller &&) = delete;
        ~BackportInstaller() noexcept;

        /**
         * Validate and apply a complete set of attributes. The running loop is stopped and
         * joined before the new generation takes effect. On rejection the instance becomes
         * unconfigured. Returns whether the attributes were accepted.
         */
        bool reconfigure(const data::Struct &attributes) noexcept;

        // Request entry point, {command: <name>, ...}
        [[nodiscard]] data::Struct doCommand(const data::Struct &request) noexcept;

        void shutdown() noexcept;

        [[nodiscard]] bool isConfigured() const {
            return _state.isConfigured();
        }

        [[nodiscard]] std::shared_ptr<const BackportConfig> getConfig() const {
            return _state.current();
        }

        [[nodiscard]] LoopState loopState() const;
        [[nodiscard]] std::optional<StopReason> loopStopReason() const;
        [[nodiscard]] uint64_t loopPasses() const;

        [[nodiscard]] data::Struct checkStatus(
            const std::shared_ptr<const BackportConfig> &config) const;
        [[nodiscard]] data::Struct installBackport(const data::Struct &request);
        [[nodiscard]] data::Struct getVersion(const BackportConfig &config) const;
        [[nodiscard]] data::Struct describeConfig(const BackportConfig &config) const;
        [[nodiscard]] data::Struct listBackports() const;
        [[nodiscard]] data::Struct validateArchive(const BackportConfig &config);
        [[nodiscard]] data::Struct healthCheck(const std::shared_ptr<const BackportConfig> &config);
        [[nodiscard]] data::Struct cleanupFiles(const BackportConfig &config) const;
    };
} // namespace backport
