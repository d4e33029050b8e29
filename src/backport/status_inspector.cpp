#include "status_inspector.hpp"
#include "logging/logging.hpp"
#include "system_commands.hpp"
#include "util/string_util.hpp"
#include "work_area.hpp"

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("nmbackport.backport.StatusInspector");

namespace backport {

    bool StatusInspector::isTargetVersion(
        std::string_view currentVersion, std::string_view targetVersion) noexcept {
        if(targetVersion.empty() || currentVersion == InstallationStatus::UNKNOWN_VERSION) {
            return false;
        }
        return currentVersion.find(targetVersion) != std::string_view::npos;
    }

    VersionQuery StatusInspector::queryVersion(const BackportConfig &config) const {
        auto result = _runner.run(SystemCommands{config}.versionQuery());
        VersionQuery query;
        if(result.ok()) {
            query.ok = true;
            query.version = std::string{util::trim(result.out)};
        } else {
            query.error = std::string{util::trim(result.err)};
            LOG.atDebug("version-query-failed")
                .kv("returnCode", result.returnCode)
                .log(query.error);
        }
        return query;
    }

    bool StatusInspector::isServiceActive(
        const BackportConfig &config, const std::string &service) const {
        return _runner.run(SystemCommands{config}.isServiceActive(service)).ok();
    }

    InstallationStatus StatusInspector::inspect(
        const std::shared_ptr<const BackportConfig> &config) const noexcept {
        InstallationStatus status;
        status.config = config;
        try {
            auto query = queryVersion(*config);
            if(query.ok && !query.version.empty()) {
                status.currentVersion = query.version;
            }
            status.isTargetActive = isTargetVersion(status.currentVersion, config->targetVersion);
            status.leftoversExist = WorkArea{config->workDir}.hasPackages();
            status.state =
                status.isTargetActive ? InstallState::Installed : InstallState::NeedsInstall;
        } catch(const std::exception &e) {
            status.state = InstallState::Error;
            status.isTargetActive = false;
            status.error = e.what();
            LOG.atError("status-check-failed").cause(e).log();
        }
        return status;
    }

    std::string InstallationStatus::toString(InstallState state) {
        switch(state) {
            case InstallState::Installed:
                return "installed";
            case InstallState::NeedsInstall:
                return "needs_install";
            default:
                return "error";
        }
    }

    data::Struct InstallationStatus::toStruct() const {
        data::Struct s;
        s.put("is_backported", isTargetActive)
            .put("current_version", currentVersion)
            .put("backport_files_exist", leftoversExist);
        if(config) {
            s.put("target_version", config->targetVersion)
                .put("auto_install_enabled", config->autoInstall)
                .put("platform", config->platform)
                .put("description", config->description)
                .put("backport_url", config->backportUrl);
        }
        s.put("status", toString(state));
        if(error.has_value()) {
            s.put("error", error.value());
        }
        return s;
    }
} // namespace backport
