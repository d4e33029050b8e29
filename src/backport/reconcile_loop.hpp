#pragma once
#include "backport_config.hpp"
#include "install_procedure.hpp"
#include "status_inspector.hpp"
#include "tasks/task_threads.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace backport {

    enum class LoopState { Stopped, Running };
    enum class StopReason { None, Converged, Cancelled };

    /**
     * Background reconciliation for one configuration generation. Sleeps for the poll interval,
     * then runs one pass. Stops itself once the target version is active; a reconfiguration
     * replaces the whole object rather than restarting it.
     */
    class ReconcileLoop final : public tasks::TaskWorker {
        const std::shared_ptr<const BackportConfig> _config;
        const StatusInspector &_inspector;
        InstallProcedure &_procedure;

        std::atomic<StopReason> _stopReason{StopReason::None};
        std::atomic_uint64_t _passes{0};
        mutable std::mutex _mutex;
        std::optional<std::string> _lastError;

        void recordError(std::optional<std::string> error);

    protected:
        void runLoop() noexcept override;

    public:
        ReconcileLoop(
            std::shared_ptr<const BackportConfig> config,
            const StatusInspector &inspector,
            InstallProcedure &procedure) noexcept
            : _config(std::move(config)), _inspector(inspector), _procedure(procedure) {
        }
        ReconcileLoop(const ReconcileLoop &) = delete;
        ReconcileLoop(ReconcileLoop &&) = delete;
        ReconcileLoop &operator=(const ReconcileLoop &) = delete;
        ReconcileLoop &operator=(ReconcileLoop &&) = delete;

        ~ReconcileLoop() noexcept override {
            stop();
        }

        // Cancel and wait for the worker thread to leave its current pass
        void stop() noexcept;

        // One reconciliation pass; returns true once the target version is active
        bool pass() noexcept;

        [[nodiscard]] LoopState state() const noexcept {
            return isActive() ? LoopState::Running : LoopState::Stopped;
        }

        [[nodiscard]] StopReason stopReason() const noexcept {
            return _stopReason.load();
        }

        [[nodiscard]] uint64_t passCount() const noexcept {
            return _passes.load();
        }

        [[nodiscard]] std::optional<std::string> lastError() const {
            std::unique_lock guard{_mutex};
            return _lastError;
        }

        [[nodiscard]] const std::shared_ptr<const BackportConfig> &getConfig() const noexcept {
            return _config;
        }

        [[nodiscard]] static std::string toString(LoopState state);
    };
} // namespace backport
