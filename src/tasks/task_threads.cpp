#include "task_threads.hpp"
#include "logging/logging.hpp"

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("nmbackport.tasks.TaskWorker");

namespace tasks {

    void TaskWorker::start() {
        // Do not call in constructor, see notes in runner()
        if(!_running.exchange(true)) {
            // Max one start
            _active = true;
            _thread = std::thread(&TaskWorker::runner, this);
        }
    }

    void TaskWorker::runner() noexcept {
        // TaskWorker must be fully initialized before this
        while(!isShutdown()) {
            runLoop();
        }
        _active = false;
        LOG.atTrace("worker-exit").log();
    }

    void TaskWorker::join() noexcept {
        shutdown();
        if(_running.exchange(false)) {
            // Max one join
            if(_thread.get_id() == std::this_thread::get_id()) {
                _thread.detach();
            } else {
                _thread.join();
            }
        }
    }

    void TaskWorker::shutdown() noexcept {
        _shutdown->cancel();
    }
} // namespace tasks
