#include "log_queue.hpp"
#include "log_manager.hpp"
#include <iostream>

namespace logging {

    void LogQueue::publish(QueueEntry entry) {
        std::scoped_lock guard{_drainMutex, _mutex};
        if(_terminate.load()) {
            return; // if terminating, drop everything
        }
        _entries.emplace_back(std::move(entry));
        if(!_running.exchange(true)) {
            _thread = std::thread(&LogQueue::publishThread, this);
        }
        _wake.notify_one();
    }

    void LogQueue::reconfigure() {
        publish({});
    }

    void LogQueue::stop() {
        std::unique_lock guard{_mutex};
        _terminate.store(true); // happens before _wake and _running check
        _wake.notify_all();
        if(_running.exchange(false)) {
            guard.unlock();
            _thread.join();
        }
    }

    void LogQueue::publishThread() {
        for(;;) {
            auto entry = pickupEntry();
            if(!entry.has_value()) {
                break; // queue is empty and terminated
            }

            processEntry(entry.value());

            std::unique_lock guard{_mutex};
            // assumes single-reader (i.e. this publish thread)
            _entries.pop_front();
            if(_entries.empty()) {
                _drained.notify_all();
            }
        }
        _manager.syncOutput();
    }

    bool LogQueue::drainQueue() {
        std::unique_lock drainGuard{_drainMutex, std::defer_lock};
        std::unique_lock guard{_mutex, std::defer_lock};
        std::lock(drainGuard, guard);
        if(!_running.load()) {
            return _entries.empty();
        }
        _drained.wait(guard, [this]() -> bool { return _entries.empty(); });
        return true;
    }

    std::optional<LogQueue::QueueEntry> LogQueue::pickupEntry() {
        std::unique_lock guard{_mutex};
        if(_needsSync && _entries.empty() && !_terminate.load()) {
            _needsSync = false;
            guard.unlock();
            _manager.syncOutput();
            guard.lock();
        }
        _wake.wait(guard, [this]() -> bool { return !_entries.empty() || _terminate.load(); });
        if(_entries.empty()) {
            return {}; // terminated and empty
        }

        auto entry = _entries.front();
        return entry;
    }

    void LogQueue::processEntry(const QueueEntry &entry) {
        try {
            if(entry.has_value()) {
                _manager.writeLog(entry.value());
                std::unique_lock guard{_mutex};
                _needsSync = true;
            } else {
                _manager.changeOutput();
            }
        } catch(const std::exception &e) {
            // logging cannot log its own failures
            std::cerr << "Log output failure: " << e.what() << '\n';
        }
    }

    LogQueue::~LogQueue() noexcept {
        stop();
    }
} // namespace logging
