#pragma once
#include "data/struct_model.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace backport {

    namespace keys {
        inline constexpr std::string_view BACKPORT_URL{"backport_url"};
        inline constexpr std::string_view TARGET_VERSION{"target_version"};
        inline constexpr std::string_view WORK_DIR{"work_dir"};
        inline constexpr std::string_view PLATFORM{"platform"};
        inline constexpr std::string_view AUTO_INSTALL{"auto_install"};
        inline constexpr std::string_view CHECK_INTERVAL{"check_interval"};
        inline constexpr std::string_view FORCE_REINSTALL{"force_reinstall"};
        inline constexpr std::string_view CLEANUP_AFTER_INSTALL{"cleanup_after_install"};
        inline constexpr std::string_view RESTART_VIAM_AGENT{"restart_viam_agent"};
        inline constexpr std::string_view DESCRIPTION{"description"};
        inline constexpr std::string_view ARCHIVE_NAME{"archive_name"};
        inline constexpr std::string_view VERIFY_CHECKSUM{"verify_checksum"};
        inline constexpr std::string_view EXPECTED_CHECKSUM{"expected_checksum"};
        inline constexpr std::string_view COMMAND_TIMEOUT{"command_timeout"};
        inline constexpr std::string_view SERVICE_SETTLE_SECONDS{"service_settle_seconds"};
        inline constexpr std::string_view AGENT_SETTLE_SECONDS{"agent_settle_seconds"};
        inline constexpr std::string_view MANAGED_SERVICE{"managed_service"};
        inline constexpr std::string_view DEPENDENT_SERVICE{"dependent_service"};
        inline constexpr std::string_view USE_SUDO{"use_sudo"};
        inline constexpr std::string_view BASE_DIR{"base_dir"};
        inline constexpr std::string_view BACKUP_DIR{"backup_dir"};
    } // namespace keys

    using Seconds = std::chrono::duration<double>;

    /**
     * One generation of validated settings. Never modified after validation; a reconfiguration
     * produces a new instance.
     */
    struct BackportConfig {
        static constexpr std::string_view PACKAGE_EXTENSION{".deb"};
        static constexpr double DEFAULT_CHECK_INTERVAL_SECONDS{60.0};
        static constexpr double DEFAULT_SERVICE_SETTLE_SECONDS{5.0};
        static constexpr double DEFAULT_AGENT_SETTLE_SECONDS{10.0};
        // upper bound for every duration attribute
        static constexpr double MAX_SECONDS{365.0 * 24 * 60 * 60};

        std::string backportUrl;
        std::string targetVersion;
        std::string archiveName;
        std::string workDirName;
        std::string platform;
        std::string description;
        std::filesystem::path workDir;

        bool autoInstall{true};
        Seconds checkInterval{DEFAULT_CHECK_INTERVAL_SECONDS};
        bool forceReinstall{false};
        bool cleanupAfterInstall{true};
        bool restartDependentService{true};

        bool verifyChecksum{false};
        std::string expectedChecksum;
        std::optional<std::chrono::milliseconds> commandTimeout;
        Seconds serviceSettle{DEFAULT_SERVICE_SETTLE_SECONDS};
        Seconds agentSettle{DEFAULT_AGENT_SETTLE_SECONDS};
        std::string managedService{"NetworkManager"};
        std::string dependentService{"viam-agent"};
        bool useSudo{true};

        [[nodiscard]] std::filesystem::path archivePath() const {
            return workDir / archiveName;
        }

        [[nodiscard]] data::Struct toStruct() const;
    };

    struct ConfigDefaults {
        // Work directory is created under this location unless base_dir is configured
        std::filesystem::path baseDir;
    };

    class ConfigValidator {
    public:
        /**
         * Validate and normalize raw attributes. Every rule is checked; the thrown ConfigError
         * lists all failures separated by "; ".
         */
        [[nodiscard]] static BackportConfig validate(
            const data::Struct &attributes, const ConfigDefaults &defaults);

        /**
         * Final path segment of an http(s) URL, ignoring query and fragment. Empty if the URL
         * has no path or ends in '/'.
         */
        [[nodiscard]] static std::string deriveArchiveName(std::string_view url);
    };

    /**
     * Holds the current configuration generation, or the reason the last one was rejected.
     * Replacement is atomic: readers see either the old or the new generation in full.
     */
    class ConfigState {
        mutable std::mutex _mutex;
        std::shared_ptr<const BackportConfig> _config;
        std::string _rejection{"no configuration applied"};

    public:
        void apply(std::shared_ptr<const BackportConfig> config);
        void reject(std::string reason);

        [[nodiscard]] std::shared_ptr<const BackportConfig> current() const {
            std::unique_lock guard{_mutex};
            return _config;
        }

        [[nodiscard]] bool isConfigured() const {
            return static_cast<bool>(current());
        }

        [[nodiscard]] std::string rejection() const {
            std::unique_lock guard{_mutex};
            return _rejection;
        }
    };
} // namespace backport
