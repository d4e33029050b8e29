#pragma once

#include "data/struct_model.hpp"
#include "errors/error_base.hpp"
#include "log_manager.hpp"
#include <chrono>
#include <exception>
#include <string>
#include <string_view>
#include <type_traits>

/**
 * When logging an item, it isn't simply logging a string, but logging structured data. A
 * characteristic of logging is to do minimal work when a log-level is disabled.
 */
namespace logging {

    /**
     * Builder to build a single event. An inactive event ignores everything.
     */
    class Event {
        LogManager *_manager{nullptr};
        std::string _loggerName;
        Level _level{Level::None};
        data::Struct _context;
        data::Struct _data;
        const std::chrono::system_clock::time_point _timestamp = std::chrono::system_clock::now();

        [[nodiscard]] bool active() const noexcept {
            return _manager != nullptr;
        }

        void commit() {
            if(!active()) {
                return;
            }
            _data.put(LogManager::LEVEL_KEY, LogManager::toString(_level));
            _data.put(
                LogManager::TIMESTAMP_KEY,
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    _timestamp.time_since_epoch())
                    .count());
            _data.put(LogManager::LOGGER_NAME_KEY, _loggerName);
            if(!_context.empty()) {
                _data.put(LogManager::CONTEXTS_KEY, _context);
            }
            _manager->logEvent(std::move(_data));
            _manager = nullptr;
        }

    public:
        Event() = default;

        Event(LogManager &manager, std::string_view loggerName, Level level)
            : _manager(&manager), _loggerName(loggerName), _level(level) {
        }

        /**
         * Log a cause of error/event
         */
        Event &cause(const errors::Error &cause) {
            if(active()) {
                data::Struct causeData;
                causeData.put(LogManager::CAUSE_KIND_KEY, cause.kind());
                causeData.put(LogManager::CAUSE_MESSAGE_KEY, std::string{cause.what()});
                _data.put(LogManager::CAUSE_KEY, std::move(causeData));
                _data.put(LogManager::MESSAGE_KEY, std::string{cause.what()});
            }
            return *this;
        }

        Event &cause(const std::exception &cause) {
            return this->cause(errors::Error::of(cause));
        }

        Event &cause(const std::exception_ptr &cause) {
            return this->cause(errors::Error::of(cause));
        }

        /**
         * Log an event type - this is expected to be a 'constant' string
         */
        Event &event(std::string_view eventType) {
            if(active()) {
                _data.put(LogManager::EVENT_KEY, eventType);
            }
            return *this;
        }

        /**
         * Add context information to event
         */
        Event &kv(std::string_view key, const data::StructElement &value) {
            if(active()) {
                _context.put(key, value);
            }
            return *this;
        }

        /**
         * Commit the log entry and throw exception
         */
        template<typename ErrorType>
        [[noreturn]] void logAndThrow(const ErrorType &err) {
            static_assert(std::is_base_of_v<errors::Error, ErrorType>);
            cause(err);
            commit();
            throw err;
        }

        /**
         * Commit the log entry with no/existing message
         */
        void log() {
            commit();
        }

        /**
         * Commit the log entry with a message
         */
        void log(std::string_view message) {
            if(active()) {
                _data.put(LogManager::MESSAGE_KEY, message);
            }
            commit();
        }
    };

    /**
     * Event factory for logging to a given tag
     */
    class Logger {
        std::string _loggerName;

    public:
        explicit Logger(std::string_view loggerName) : _loggerName(loggerName) {
        }

        /**
         * Retrieve logger for given name. The returned value may be stored statically and is
         * thread safe.
         */
        static Logger of(std::string_view loggerName) {
            return Logger{loggerName};
        }

        /**
         * Builder for an enum log level. If not logging, the returned Event is a no-op.
         */
        [[nodiscard]] Event atLevel(Level level) const {
            auto &manager = LogManager::get();
            if(manager.isEnabled(level)) {
                return Event{manager, _loggerName, level};
            }
            return {};
        }

        [[nodiscard]] Event atTrace(std::string_view eventType = {}) const {
            return withEvent(atLevel(Level::Trace), eventType);
        }

        [[nodiscard]] Event atDebug(std::string_view eventType = {}) const {
            return withEvent(atLevel(Level::Debug), eventType);
        }

        [[nodiscard]] Event atInfo(std::string_view eventType = {}) const {
            return withEvent(atLevel(Level::Info), eventType);
        }

        [[nodiscard]] Event atWarn(std::string_view eventType = {}) const {
            return withEvent(atLevel(Level::Warn), eventType);
        }

        [[nodiscard]] Event atError(std::string_view eventType = {}) const {
            return withEvent(atLevel(Level::Error), eventType);
        }

    private:
        static Event withEvent(Event event, std::string_view eventType) {
            if(!eventType.empty()) {
                event.event(eventType);
            }
            return event;
        }
    };
} // namespace logging
