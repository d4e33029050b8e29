#include "install_procedure.hpp"
#include "errors/errors.hpp"
#include "logging/logging.hpp"
#include "system_commands.hpp"
#include "util/string_util.hpp"
#include "work_area.hpp"

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("nmbackport.backport.InstallProcedure");

namespace backport {

    namespace {
        std::string errorText(const ipc::CommandResult &result) {
            auto text = util::trim(result.err);
            if(text.empty()) {
                return "exit code " + std::to_string(result.returnCode);
            }
            return std::string{text};
        }
    } // namespace

    InstallResult InstallProcedure::install(
        const std::shared_ptr<const BackportConfig> &config,
        bool force,
        const tasks::CancelToken &cancel) noexcept {
        std::unique_lock guard{_installMutex};
        InstallResult result;
        try {
            auto status = _inspector.inspect(config);
            if(status.isTargetActive && !force) {
                result.success = true;
                result.action = InstallAction::Skipped;
                result.message = config->managedService + " backport already installed";
                result.version = status.currentVersion;
                result.isBackported = true;
                LOG.atInfo("install-skipped").kv("version", status.currentVersion).log();
                return result;
            }
            if(cancel.isCancelled()) {
                result.action = InstallAction::Cancelled;
                result.error = "Install cancelled";
                return result;
            }

            LOG.atInfo("install-start")
                .kv("url", config->backportUrl)
                .kv("target", config->targetVersion)
                .kv("force", force)
                .log();
            WorkArea workArea{config->workDir};
            workArea.ensure();
            fetchArchive(*config, config->archivePath());
            if(config->verifyChecksum) {
                verifyChecksum(*config, config->archivePath());
            }
            extractArchive(*config);
            auto packages = workArea.packages();
            if(packages.empty()) {
                LOG.atError("install-no-packages")
                    .kv("dir", config->workDir.string())
                    .logAndThrow(errors::InstallError{"No .deb files found in extracted archive"});
            }
            installPackages(*config, packages);

            if(!restartServices(*config, cancel, result)) {
                result.success = false;
                result.action = InstallAction::Cancelled;
                result.error = "Install cancelled while waiting for services";
                LOG.atWarn("install-cancelled").log(result.error.value());
                return result;
            }

            if(config->cleanupAfterInstall) {
                auto cleanup = workArea.remove();
                if(!cleanup.success) {
                    result.warnings.emplace_back(cleanup.error.value_or("cleanup failed"));
                }
            }

            auto finalStatus = _inspector.inspect(config);
            result.success = true;
            result.action = InstallAction::Installed;
            result.message = config->managedService + " backport installed successfully";
            result.version = finalStatus.currentVersion;
            result.isBackported = finalStatus.isTargetActive;
            LOG.atInfo("install-complete")
                .kv("version", finalStatus.currentVersion)
                .kv("isBackported", finalStatus.isTargetActive)
                .log();
        } catch(const std::exception &e) {
            result.success = false;
            result.action = InstallAction::Failed;
            result.message.clear();
            result.error = e.what();
            LOG.atError("install-failed").cause(e).log();
        }
        return result;
    }

    void InstallProcedure::fetchArchive(
        const BackportConfig &config, const std::filesystem::path &target) {
        auto result = _runner.run(SystemCommands{config}.fetch(target));
        if(!result.ok()) {
            throw errors::InstallError{"Failed to download backport: " + errorText(result)};
        }
    }

    void InstallProcedure::verifyChecksum(
        const BackportConfig &config, const std::filesystem::path &file) {
        auto result = _runner.run(SystemCommands{config}.checksum(file));
        if(!result.ok()) {
            throw errors::ChecksumError{
                "Failed to compute archive checksum: " + errorText(result)};
        }
        auto trimmed = util::trim(result.out);
        auto digest = util::lower(trimmed.substr(0, trimmed.find_first_of(util::WHITESPACE)));
        if(digest != util::lower(config.expectedChecksum)) {
            LOG.atError("checksum-mismatch")
                .kv("expected", config.expectedChecksum)
                .kv("actual", digest)
                .logAndThrow(errors::ChecksumError{});
        }
    }

    void InstallProcedure::extractArchive(const BackportConfig &config) {
        auto result = _runner.run(SystemCommands{config}.extract(config.archivePath()));
        if(!result.ok()) {
            throw errors::InstallError{"Failed to extract archive: " + errorText(result)};
        }
    }

    void InstallProcedure::installPackages(
        const BackportConfig &config, const std::vector<std::filesystem::path> &packages) {
        SystemCommands commands{config};
        auto result = _runner.run(commands.installPackages(packages));
        if(result.ok()) {
            return;
        }
        LOG.atWarn("install-packages-failed")
            .kv("returnCode", result.returnCode)
            .log("Package install failed, attempting dependency repair");
        auto repair = _runner.run(commands.repairDependencies());
        if(!repair.ok()) {
            LOG.atError("dependency-repair-failed").kv("returnCode", repair.returnCode).log();
            throw errors::InstallError{"Failed to install packages: " + errorText(result)};
        }
    }

    bool InstallProcedure::restartServices(
        const BackportConfig &config, const tasks::CancelToken &cancel, InstallResult &result) {
        SystemCommands commands{config};
        auto restart = _runner.run(commands.restartService(config.managedService));
        if(!restart.ok()) {
            result.warnings.emplace_back(
                "Failed to restart " + config.managedService + ": " + errorText(restart));
            LOG.atWarn("service-restart-failed").kv("service", config.managedService).log();
            return true;
        }
        if(!cancel.sleepFor(config.serviceSettle)) {
            return false;
        }
        if(!_inspector.isServiceActive(config, config.managedService)) {
            result.errors.emplace_back(config.managedService + " service is not active after restart");
            LOG.atError("service-not-active").kv("service", config.managedService).log();
            return true;
        }
        if(!config.restartDependentService) {
            return true;
        }
        auto dependent = _runner.run(commands.restartService(config.dependentService));
        if(!dependent.ok()) {
            result.warnings.emplace_back(
                "Failed to restart " + config.dependentService + ": " + errorText(dependent));
            LOG.atWarn("service-restart-failed").kv("service", config.dependentService).log();
            return true;
        }
        return cancel.sleepFor(config.agentSettle);
    }

    std::string InstallResult::toString(InstallAction action) {
        switch(action) {
            case InstallAction::Skipped:
                return "skipped";
            case InstallAction::Installed:
                return "installed";
            case InstallAction::Cancelled:
                return "cancelled";
            default:
                return "failed";
        }
    }

    data::Struct InstallResult::toStruct() const {
        data::Struct s;
        s.put("success", success).put("action", toString(action));
        if(!message.empty()) {
            s.put("message", message);
        }
        if(version.has_value()) {
            s.put("version", version.value());
        }
        if(isBackported.has_value()) {
            s.put("is_backported", isBackported.value());
        }
        if(error.has_value()) {
            s.put("error", error.value());
        }
        s.put("warnings", data::List{warnings});
        s.put("errors", data::List{errors});
        return s;
    }
} // namespace backport
