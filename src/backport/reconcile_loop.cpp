#include "reconcile_loop.hpp"
#include "logging/logging.hpp"
#include "work_area.hpp"

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("nmbackport.backport.ReconcileLoop");

namespace backport {

    void ReconcileLoop::runLoop() noexcept {
        if(!stall(tasks::ExpireTime::fromNow(_config->checkInterval))) {
            return;
        }
        if(pass()) {
            auto expected = StopReason::None;
            _stopReason.compare_exchange_strong(expected, StopReason::Converged);
            LOG.atInfo("loop-converged").kv("passes", passCount()).log();
            shutdown();
        }
    }

    bool ReconcileLoop::pass() noexcept {
        auto passNumber = ++_passes;
        LOG.atDebug("loop-pass").kv("pass", passNumber).log();
        try {
            auto status = _inspector.inspect(_config);
            if(status.state == InstallState::Error) {
                recordError(status.error.value_or("status check failed"));
                return false;
            }
            if(status.isTargetActive) {
                if(status.leftoversExist && _config->cleanupAfterInstall) {
                    auto cleanup = WorkArea{_config->workDir}.remove();
                    if(!cleanup.success) {
                        LOG.atWarn("loop-cleanup-failed")
                            .log(cleanup.error.value_or("cleanup failed"));
                    }
                }
                recordError({});
                return true;
            }
            auto result = _procedure.install(_config, _config->forceReinstall, shutdownToken());
            if(result.action == InstallAction::Cancelled) {
                return false;
            }
            if(!result.success) {
                recordError(result.error.value_or("install failed"));
                return false;
            }
            if(!result.isBackported.value_or(false)) {
                recordError(
                    "Installed version " + result.version.value_or("unknown")
                    + " does not match target " + _config->targetVersion);
                return false;
            }
            recordError({});
            return true;
        } catch(const std::exception &e) {
            LOG.atError("loop-pass-failed").cause(e).log();
            recordError(std::string{e.what()});
            return false;
        }
    }

    void ReconcileLoop::recordError(std::optional<std::string> error) {
        if(error.has_value()) {
            LOG.atWarn("loop-pass-error").kv("pass", passCount()).log(error.value());
        }
        std::unique_lock guard{_mutex};
        _lastError = std::move(error);
    }

    void ReconcileLoop::stop() noexcept {
        auto expected = StopReason::None;
        _stopReason.compare_exchange_strong(expected, StopReason::Cancelled);
        join();
    }

    std::string ReconcileLoop::toString(LoopState state) {
        return state == LoopState::Running ? "running" : "stopped";
    }
} // namespace backport
