#include "backport_installer.hpp"
#include "logging/logging.hpp"
#include "work_area.hpp"
#include <chrono>

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("nmbackport.backport.BackportInstaller");

namespace backport {

    namespace {
        struct CatalogEntry {
            std::string_view version;
            std::string_view platform;
            std::string_view url;
            std::string_view description;
            std::string_view feature;
        };

        constexpr CatalogEntry KNOWN_BACKPORTS[] = {
            {"1.42.8",
             "ubuntu-22.04",
             "https://storage.googleapis.com/packages.viam.com/ubuntu/jammy-nm-backports.tar",
             "NetworkManager 1.42.8 backport for Ubuntu 22.04 (Jammy)",
             "scanning-in-ap-mode"},
        };

        double epochSeconds() {
            return std::chrono::duration_cast<std::chrono::duration<double>>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }
    } // namespace

    BackportInstaller::BackportInstaller(
        std::shared_ptr<ipc::CommandRunner> runner, ConfigDefaults defaults)
        : _runner(std::move(runner)), _defaults(std::move(defaults)), _inspector(*_runner),
          _procedure(*_runner, _inspector), _validator(*_runner, _procedure) {

        // Handlers run with a configuration present, checked in doCommand
        auto withConfig = [this](auto handler) -> CommandDispatcher::Handler {
            return [this, handler](const data::Struct &request) -> data::Struct {
                auto config = _state.current();
                if(!config) {
                    return notConfigured();
                }
                return handler(config, request);
            };
        };
        using ConfigPtr = std::shared_ptr<const BackportConfig>;

        _dispatcher
            .add(
                std::string{CHECK_STATUS},
                withConfig([this](const ConfigPtr &config, const data::Struct &) {
                    return checkStatus(config);
                }))
            .add(
                std::string{INSTALL_BACKPORT},
                withConfig([this](const ConfigPtr &, const data::Struct &request) {
                    return installBackport(request);
                }))
            .add(
                std::string{GET_NM_VERSION},
                withConfig([this](const ConfigPtr &config, const data::Struct &) {
                    return getVersion(*config);
                }))
            .add(
                std::string{GET_CONFIG},
                withConfig([this](const ConfigPtr &config, const data::Struct &) {
                    return describeConfig(*config);
                }))
            .add(
                std::string{LIST_BACKPORTS},
                [this](const data::Struct &) { return listBackports(); })
            .add(
                std::string{VALIDATE_ARCHIVE},
                withConfig([this](const ConfigPtr &config, const data::Struct &) {
                    return validateArchive(*config);
                }))
            .add(
                std::string{HEALTH_CHECK},
                withConfig([this](const ConfigPtr &config, const data::Struct &) {
                    return healthCheck(config);
                }))
            .add(
                std::string{CLEANUP_FILES},
                withConfig([this](const ConfigPtr &config, const data::Struct &) {
                    return cleanupFiles(*config);
                }));
    }

    BackportInstaller::~BackportInstaller() noexcept {
        shutdown();
    }

    bool BackportInstaller::reconfigure(const data::Struct &attributes) noexcept {
        try {
            std::shared_ptr<const BackportConfig> config;
            std::string rejection;
            try {
                config = std::make_shared<const BackportConfig>(
                    ConfigValidator::validate(attributes, _defaults));
            } catch(const std::exception &e) {
                rejection = e.what();
            }

            std::unique_lock guard{_lifecycleMutex};
            if(_shutdown.load()) {
                LOG.atWarn("reconfigure-after-shutdown").log("Ignoring configuration");
                return false;
            }
            stopLoop();
            _loop.reset();
            if(!config) {
                _state.reject(rejection);
                LOG.atError("config-invalid").log(rejection);
                return false;
            }
            _state.apply(config);
            LOG.atInfo("configured")
                .kv("url", config->backportUrl)
                .kv("target", config->targetVersion)
                .kv("workDir", config->workDir.string())
                .kv("autoInstall", config->autoInstall)
                .log();
            if(config->autoInstall) {
                _loop = std::make_unique<ReconcileLoop>(config, _inspector, _procedure);
                _loop->start();
            }
            return true;
        } catch(const std::exception &e) {
            LOG.atError("reconfigure-failed").cause(e).log();
            _state.reject(e.what());
            return false;
        }
    }

    void BackportInstaller::stopLoop() {
        if(_loop) {
            _loop->stop();
        }
    }

    void BackportInstaller::shutdown() noexcept {
        std::unique_lock guard{_lifecycleMutex};
        if(_shutdown.exchange(true)) {
            return;
        }
        _requestCancel.cancel();
        stopLoop();
        LOG.atInfo("shutdown").log();
    }

    LoopState BackportInstaller::loopState() const {
        std::unique_lock guard{_lifecycleMutex};
        return _loop ? _loop->state() : LoopState::Stopped;
    }

    std::optional<StopReason> BackportInstaller::loopStopReason() const {
        std::unique_lock guard{_lifecycleMutex};
        if(!_loop) {
            return {};
        }
        return _loop->stopReason();
    }

    uint64_t BackportInstaller::loopPasses() const {
        std::unique_lock guard{_lifecycleMutex};
        return _loop ? _loop->passCount() : 0;
    }

    data::Struct BackportInstaller::notConfigured() const {
        data::Struct s;
        s.put("error", "not configured")
            .put("status", "not_configured")
            .put("reason", _state.rejection());
        return s;
    }

    data::Struct BackportInstaller::doCommand(const data::Struct &request) noexcept {
        try {
            auto name = CommandDispatcher::commandName(request);
            if(_dispatcher.has(name) && name != LIST_BACKPORTS && !_state.isConfigured()) {
                return notConfigured();
            }
            return _dispatcher.dispatch(request);
        } catch(const std::exception &e) {
            LOG.atError("command-failed").cause(e).log();
            data::Struct s;
            s.put("error", std::string{e.what()});
            return s;
        }
    }

    data::Struct BackportInstaller::checkStatus(
        const std::shared_ptr<const BackportConfig> &config) const {
        return _inspector.inspect(config).toStruct();
    }

    data::Struct BackportInstaller::installBackport(const data::Struct &request) {
        auto config = _state.current();
        if(!config) {
            return notConfigured();
        }
        bool force = config->forceReinstall;
        auto forceOverride = request.get("force");
        if(forceOverride.isBool()) {
            force = forceOverride.getBool();
        }
        return _procedure.install(config, force, _requestCancel).toStruct();
    }

    data::Struct BackportInstaller::getVersion(const BackportConfig &config) const {
        data::Struct s;
        try {
            auto query = _inspector.queryVersion(config);
            if(query.ok) {
                s.put("version", query.version)
                    .put(
                        "is_target_version",
                        StatusInspector::isTargetVersion(query.version, config.targetVersion));
            } else {
                s.put("error", "Failed to get " + config.managedService + " version")
                    .put("stderr", query.error);
            }
        } catch(const std::exception &e) {
            LOG.atError("version-query-failed").cause(e).log();
            s.put("error", std::string{e.what()});
        }
        return s;
    }

    data::Struct BackportInstaller::describeConfig(const BackportConfig &config) const {
        auto s = config.toStruct();
        std::unique_lock guard{_lifecycleMutex};
        if(_loop) {
            s.put("loop_state", ReconcileLoop::toString(_loop->state()))
                .put("loop_passes", static_cast<int64_t>(_loop->passCount()));
            auto lastError = _loop->lastError();
            s.put(
                "loop_last_error",
                lastError.has_value() ? data::StructElement{lastError.value()}
                                      : data::StructElement{});
        } else {
            s.put("loop_state", ReconcileLoop::toString(LoopState::Stopped))
                .put("loop_passes", int64_t{0})
                .put("loop_last_error", data::StructElement{});
        }
        return s;
    }

    data::Struct BackportInstaller::listBackports() const {
        data::List available;
        for(const auto &entry : KNOWN_BACKPORTS) {
            data::Struct item;
            item.put("version", entry.version)
                .put("platform", entry.platform)
                .put("url", entry.url)
                .put("description", entry.description)
                .put("features", data::List{}.push(entry.feature));
            available.push(std::move(item));
        }
        data::Struct current;
        auto config = _state.current();
        if(config) {
            current.put("target_version", config->targetVersion)
                .put("platform", config->platform);
        } else {
            current.put("target_version", data::StructElement{})
                .put("platform", data::StructElement{});
        }
        data::Struct s;
        s.put("available_backports", std::move(available)).put("current_config", std::move(current));
        return s;
    }

    data::Struct BackportInstaller::validateArchive(const BackportConfig &config) {
        return _validator.validate(config);
    }

    data::Struct BackportInstaller::healthCheck(
        const std::shared_ptr<const BackportConfig> &config) {
        data::Struct s;
        try {
            bool serviceActive = _inspector.isServiceActive(*config, config->managedService);
            auto status = _inspector.inspect(config);
            bool shouldAutoInstall = !status.isTargetActive && config->autoInstall;
            bool healthy = serviceActive && status.isTargetActive;
            s.put("overall_health", healthy ? "healthy" : "degraded")
                .put("networkmanager_service_active", serviceActive)
                .put("backport_status", status.toStruct())
                .put("should_auto_install", shouldAutoInstall)
                .put("timestamp", epochSeconds());
            if(shouldAutoInstall) {
                LOG.atInfo("health-auto-install").log();
                auto result = _procedure.install(config, config->forceReinstall, _requestCancel);
                s.put("auto_install_result", result.toStruct());
            }
        } catch(const std::exception &e) {
            LOG.atError("health-check-failed").cause(e).log();
            data::Struct failed;
            failed.put("overall_health", "error").put("error", std::string{e.what()});
            return failed;
        }
        return s;
    }

    data::Struct BackportInstaller::cleanupFiles(const BackportConfig &config) const {
        return WorkArea{config.workDir}.remove().toStruct();
    }
} // namespace backport
