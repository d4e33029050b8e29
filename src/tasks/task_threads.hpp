#pragma once
#include "cancel_token.hpp"
#include <atomic>
#include <memory>
#include <thread>

namespace tasks {

    /**
     * Dedicated worker thread. Subclasses implement runLoop(), which is called repeatedly until
     * shutdown is requested. Sleeps performed through stall() end early on shutdown.
     */
    class TaskWorker {
    private:
        std::thread _thread;
        std::atomic_bool _running{false};
        std::atomic_bool _active{false};
        std::shared_ptr<CancelToken> _shutdown{std::make_shared<CancelToken>()};

        void runner() noexcept;

    protected:
        [[nodiscard]] bool isShutdown() const noexcept {
            return _shutdown->isCancelled();
        }

        [[nodiscard]] const CancelToken &shutdownToken() const noexcept {
            return *_shutdown;
        }

        // returns false if shutdown before end time
        bool stall(const ExpireTime &end) const noexcept {
            return _shutdown->stall(end);
        }

        virtual void runLoop() noexcept = 0;

    public:
        TaskWorker() = default;
        TaskWorker(const TaskWorker &) = delete;
        TaskWorker(TaskWorker &&) = delete;
        TaskWorker &operator=(const TaskWorker &) = delete;
        TaskWorker &operator=(TaskWorker &&) = delete;

        virtual ~TaskWorker() noexcept {
            // subclasses must join in their own destructor, runLoop is pure virtual
            shutdown();
        }

        void start();
        void shutdown() noexcept;
        void join() noexcept;

        // true from start() until the worker thread leaves its loop
        [[nodiscard]] bool isActive() const noexcept {
            return _active.load();
        }
    };

} // namespace tasks
