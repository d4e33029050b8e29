#include "backport_config.hpp"
#include "errors/errors.hpp"
#include "logging/logging.hpp"
#include "util/string_util.hpp"
#include <cmath>
#include <vector>

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("nmbackport.backport.Config");

namespace backport {

    namespace {
        class AttributeReader {
            const data::Struct &_attributes;
            std::vector<std::string> _failures;

        public:
            explicit AttributeReader(const data::Struct &attributes) : _attributes(attributes) {
            }

            void fail(std::string_view key, std::string_view rule) {
                _failures.emplace_back(std::string{key} + " " + std::string{rule});
            }

            [[nodiscard]] const std::vector<std::string> &failures() const noexcept {
                return _failures;
            }

            std::optional<std::string> requiredString(std::string_view key) {
                auto value = _attributes.get(key);
                if(value.isNull()) {
                    fail(key, "is required");
                    return {};
                }
                if(!value.isString() || util::trim(value.getString()).empty()) {
                    fail(key, "must be a non-empty string");
                    return {};
                }
                return std::string{util::trim(value.getString())};
            }

            std::optional<std::string> optionalString(std::string_view key) {
                auto value = _attributes.get(key);
                if(value.isNull()) {
                    return {};
                }
                if(!value.isString() || util::trim(value.getString()).empty()) {
                    fail(key, "must be a non-empty string");
                    return {};
                }
                return std::string{util::trim(value.getString())};
            }

            bool flag(std::string_view key, bool dflt) {
                auto value = _attributes.get(key);
                if(value.isNull()) {
                    return dflt;
                }
                if(!value.isBool()) {
                    fail(key, "must be a boolean");
                    return dflt;
                }
                return value.getBool();
            }

            std::optional<double> number(std::string_view key, bool allowZero) {
                auto value = _attributes.get(key);
                if(value.isNull()) {
                    return {};
                }
                if(!value.isNumber()) {
                    fail(key, "must be a number");
                    return {};
                }
                double d = value.getDouble();
                if(!std::isfinite(d)) {
                    fail(key, "must be a finite number");
                    return {};
                }
                if(d > BackportConfig::MAX_SECONDS) {
                    fail(key, "must not exceed one year");
                    return {};
                }
                if(allowZero ? d < 0.0 : d <= 0.0) {
                    fail(key, allowZero ? "must not be negative" : "must be a positive number");
                    return {};
                }
                return d;
            }
        };

        bool escapesBase(const std::filesystem::path &relative) {
            for(const auto &part : relative) {
                if(part == "..") {
                    return true;
                }
            }
            return relative.lexically_normal() == ".";
        }
    } // namespace

    std::string ConfigValidator::deriveArchiveName(std::string_view url) {
        std::string_view rest = url;
        if(util::startsWith(rest, "https://")) {
            rest.remove_prefix(8);
        } else if(util::startsWith(rest, "http://")) {
            rest.remove_prefix(7);
        }
        auto end = rest.find_first_of("?#");
        if(end != std::string_view::npos) {
            rest = rest.substr(0, end);
        }
        auto pathStart = rest.find('/');
        if(pathStart == std::string_view::npos) {
            return {};
        }
        auto path = rest.substr(pathStart);
        return std::string{path.substr(path.rfind('/') + 1)};
    }

    BackportConfig ConfigValidator::validate(
        const data::Struct &attributes, const ConfigDefaults &defaults) {
        AttributeReader reader{attributes};
        BackportConfig config;

        auto url = reader.requiredString(keys::BACKPORT_URL);
        if(url.has_value()) {
            if(!util::startsWith(*url, "http://") && !util::startsWith(*url, "https://")) {
                reader.fail(keys::BACKPORT_URL, "must be a valid HTTP/HTTPS URL");
            } else {
                config.backportUrl = *url;
                config.archiveName = deriveArchiveName(*url);
                if(config.archiveName.empty()) {
                    reader.fail(keys::BACKPORT_URL, "must name an archive file in its path");
                }
            }
        }
        auto archiveName = reader.optionalString(keys::ARCHIVE_NAME);
        if(archiveName.has_value()) {
            if(archiveName->find('/') != std::string::npos || *archiveName == ".."
               || *archiveName == ".") {
                reader.fail(keys::ARCHIVE_NAME, "must be a plain file name");
            } else {
                config.archiveName = *archiveName;
            }
        }

        config.targetVersion = reader.requiredString(keys::TARGET_VERSION).value_or("");
        config.workDirName = reader.requiredString(keys::WORK_DIR).value_or("");
        config.platform = reader.requiredString(keys::PLATFORM).value_or("");

        config.autoInstall = reader.flag(keys::AUTO_INSTALL, true);
        config.forceReinstall = reader.flag(keys::FORCE_REINSTALL, false);
        config.cleanupAfterInstall = reader.flag(keys::CLEANUP_AFTER_INSTALL, true);
        config.restartDependentService = reader.flag(keys::RESTART_VIAM_AGENT, true);
        config.verifyChecksum = reader.flag(keys::VERIFY_CHECKSUM, false);
        config.useSudo = reader.flag(keys::USE_SUDO, true);

        auto interval = reader.number(keys::CHECK_INTERVAL, false);
        if(interval.has_value()) {
            config.checkInterval = Seconds{*interval};
        }
        auto timeout = reader.number(keys::COMMAND_TIMEOUT, false);
        if(timeout.has_value()) {
            auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(Seconds{*timeout});
            if(millis.count() <= 0) {
                reader.fail(keys::COMMAND_TIMEOUT, "must be at least one millisecond");
            } else {
                config.commandTimeout = millis;
            }
        }
        auto serviceSettle = reader.number(keys::SERVICE_SETTLE_SECONDS, true);
        if(serviceSettle.has_value()) {
            config.serviceSettle = Seconds{*serviceSettle};
        }
        auto agentSettle = reader.number(keys::AGENT_SETTLE_SECONDS, true);
        if(agentSettle.has_value()) {
            config.agentSettle = Seconds{*agentSettle};
        }

        auto checksum = reader.optionalString(keys::EXPECTED_CHECKSUM);
        if(config.verifyChecksum && !checksum.has_value()) {
            reader.fail(keys::EXPECTED_CHECKSUM, "must be provided when verify_checksum is true");
        }
        config.expectedChecksum = checksum.value_or("");

        config.managedService = reader.optionalString(keys::MANAGED_SERVICE)
                                    .value_or(config.managedService);
        config.dependentService = reader.optionalString(keys::DEPENDENT_SERVICE)
                                      .value_or(config.dependentService);

        std::filesystem::path baseDir =
            reader.optionalString(keys::BASE_DIR).value_or(defaults.baseDir.string());
        if(baseDir.empty()) {
            reader.fail(keys::BASE_DIR, "is required when no home directory is known");
        }
        if(!config.workDirName.empty()) {
            std::filesystem::path workPath{config.workDirName};
            if(workPath.is_absolute() || escapesBase(workPath)) {
                reader.fail(keys::WORK_DIR, "must be a directory name below the base directory");
            }
        }
        config.workDir = std::filesystem::absolute(baseDir / config.workDirName);

        auto description = reader.optionalString(keys::DESCRIPTION);
        config.description = description.value_or(
            config.managedService + " " + config.targetVersion + " backport for "
            + config.platform);

        if(!reader.failures().empty()) {
            std::string reason;
            for(const auto &failure : reader.failures()) {
                if(!reason.empty()) {
                    reason += "; ";
                }
                reason += failure;
            }
            LOG.atWarn("config-rejected").logAndThrow(errors::ConfigError{reason});
        }
        return config;
    }

    data::Struct BackportConfig::toStruct() const {
        data::Struct s;
        s.put(keys::BACKPORT_URL, backportUrl)
            .put(keys::TARGET_VERSION, targetVersion)
            .put(keys::ARCHIVE_NAME, archiveName)
            .put(keys::WORK_DIR, workDirName)
            .put(keys::PLATFORM, platform)
            .put(keys::DESCRIPTION, description)
            .put(keys::AUTO_INSTALL, autoInstall)
            .put(keys::CHECK_INTERVAL, checkInterval.count())
            .put(keys::FORCE_REINSTALL, forceReinstall)
            .put(keys::CLEANUP_AFTER_INSTALL, cleanupAfterInstall)
            .put(keys::RESTART_VIAM_AGENT, restartDependentService)
            .put(keys::VERIFY_CHECKSUM, verifyChecksum)
            .put(keys::SERVICE_SETTLE_SECONDS, serviceSettle.count())
            .put(keys::AGENT_SETTLE_SECONDS, agentSettle.count())
            .put(keys::MANAGED_SERVICE, managedService)
            .put(keys::DEPENDENT_SERVICE, dependentService)
            .put(keys::USE_SUDO, useSudo)
            .put(keys::BACKUP_DIR, workDir.string());
        if(commandTimeout.has_value()) {
            s.put(keys::COMMAND_TIMEOUT, Seconds{commandTimeout.value()}.count());
        } else {
            s.put(keys::COMMAND_TIMEOUT, data::StructElement{});
        }
        return s;
    }

    void ConfigState::apply(std::shared_ptr<const BackportConfig> config) {
        std::unique_lock guard{_mutex};
        _config = std::move(config);
        _rejection.clear();
    }

    void ConfigState::reject(std::string reason) {
        std::unique_lock guard{_mutex};
        _config.reset();
        _rejection = std::move(reason);
    }
} // namespace backport
