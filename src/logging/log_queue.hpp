#pragma once

#include "data/struct_model.hpp"
#include <atomic>
#include <condition_variable>
#include <list>
#include <mutex>
#include <optional>
#include <thread>

namespace logging {
    class LogManager;

    /**
     * LogQueue is a dedicated thread to handle log publishes, in particular,
     * all log entries are strictly serialized when pushed to this queue
     */
    // NOLINTNEXTLINE(*-special-member-functions)
    class LogQueue {
    public:
        // An empty entry is a request to reopen the output
        using QueueEntry = std::optional<data::Struct>;

    private:
        LogManager &_manager;
        mutable std::mutex _mutex;
        mutable std::mutex _drainMutex;
        std::thread _thread;
        std::list<QueueEntry> _entries;
        std::condition_variable _wake;
        std::condition_variable _drained;
        std::atomic_bool _running{false};
        std::atomic_bool _terminate{false};
        bool _needsSync{false};

    public:
        explicit LogQueue(LogManager &manager) : _manager(manager) {
        }
        ~LogQueue() noexcept;
        void publish(QueueEntry entry);
        void reconfigure();
        std::optional<QueueEntry> pickupEntry();
        void processEntry(const QueueEntry &entry);
        void stop();
        void publishThread();
        bool drainQueue();
    };
} // namespace logging
