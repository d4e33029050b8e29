#include "log_manager.hpp"
#include "conv/json_conv.hpp"
#include "log_queue.hpp"
#include "util/string_util.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <tuple>

namespace logging {

    LogManager::LogManager() : _queue(std::make_shared<LogQueue>(*this)) {
    }

    LogManager::~LogManager() noexcept {
        _queue->stop();
        _queue.reset();
    }

    LogManager &LogManager::get() {
        static LogManager manager;
        return manager;
    }

    std::string LogManager::toString(Level level) {
        switch(level) {
            case Level::Trace:
                return "TRACE";
            case Level::Debug:
                return "DEBUG";
            case Level::Info:
                return "INFO";
            case Level::Warn:
                return "WARN";
            case Level::Error:
                return "ERROR";
            default:
                return "NONE";
        }
    }

    std::optional<Level> LogManager::toLevel(std::string_view level) {
        auto upLevel = util::upper(level);
        if(upLevel == "TRACE") {
            return Level::Trace;
        } else if(upLevel == "DEBUG") {
            return Level::Debug;
        } else if(upLevel == "INFO") {
            return Level::Info;
        } else if(upLevel == "WARN") {
            return Level::Warn;
        } else if(upLevel == "ERROR") {
            return Level::Error;
        } else if(upLevel == "NONE") {
            return Level::None;
        }
        return {};
    }

    void LogManager::logEvent(data::Struct entry) {
        _queue->publish(std::move(entry));
    }

    void LogManager::reconfigure(const LogConfigUpdate &config) {
        setLevel(config.getLevel().value_or(Level::Info));
        {
            std::unique_lock guard{_mutex};
            _format = config.getFormat().value_or(Format::Text);
            _outputType = config.getOutputType().value_or(OutputType::Console);
            _outputDirectory = config.getOutputDirectory().value_or(std::filesystem::path{});
            if(_outputType == OutputType::File && _outputDirectory.empty()) {
                _outputDirectory = std::filesystem::current_path();
            }
        }
        _queue->reconfigure(); // synchronize through queue
    }

    void LogManager::drain() {
        std::ignore = _queue->drainQueue();
    }

    std::filesystem::path LogManager::getLogPath() const {
        std::shared_lock guard{_mutex};
        if(_outputType != OutputType::File || _outputDirectory.empty()) {
            return {};
        }
        std::string baseName{DEFAULT_LOG_BASE};
        baseName += LOG_EXTENSION;
        return _outputDirectory / baseName;
    }

    std::ostream &LogManager::stream() {
        if(_stream.is_open()) {
            return _stream;
        } else {
            return std::cerr;
        }
    }

    void LogManager::changeOutput() {
        if(_stream.is_open()) {
            _stream.close();
        }
        auto fullPath = getLogPath();
        if(!fullPath.empty()) {
            std::filesystem::create_directories(fullPath.parent_path());
            _stream.exceptions(std::ios::failbit | std::ios::badbit);
            _stream.open(fullPath, std::ios_base::app | std::ios_base::out);
        }
    }

    void LogManager::syncOutput() {
        stream().flush();
    }

    void LogManager::writeLog(const data::Struct &entry) {
        if(getFormat() == Format::Json) {
            writeJson(entry);
        } else {
            writeText(entry);
        }
    }

    void LogManager::writeJson(const data::Struct &entry) {
        stream() << conv::JsonHelper::serialize(entry)
                 << "\n"; // intentionally not endl - data not flushed immediately
    }

    void LogManager::writeText(const data::Struct &entry) {
        // timestamp [LEVEL] (loggerName) event: message. {key=value, ...}
        std::ostringstream line;
        auto millis = entry.get(TIMESTAMP_KEY).getInt();
        std::time_t seconds = static_cast<std::time_t>(millis / 1000);
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        line << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
             << std::setfill('0') << (millis % 1000) << "Z";
        line << " [" << entry.get(LEVEL_KEY).getString() << "]";
        line << " (" << entry.get(LOGGER_NAME_KEY).getString() << ")";
        auto event = entry.get(EVENT_KEY);
        if(!event.isNull()) {
            line << " " << event.getString() << ":";
        }
        auto message = entry.get(MESSAGE_KEY);
        if(!message.isNull()) {
            line << " " << message.getString() << ".";
        }
        auto contexts = entry.get(CONTEXTS_KEY).getStruct();
        if(contexts && !contexts->empty()) {
            line << " {";
            bool first = true;
            for(const auto &[key, value] : *contexts) {
                if(!first) {
                    line << ", ";
                }
                first = false;
                line << key << "="
                     << (value.isScalar() ? value.getString() : conv::JsonHelper::serialize(value));
            }
            line << "}";
        }
        auto cause = entry.get(CAUSE_KEY).getStruct();
        if(cause) {
            line << " " << cause->get(CAUSE_KIND_KEY).getString() << ": "
                 << cause->get(CAUSE_MESSAGE_KEY).getString();
        }
        stream() << line.str() << "\n";
    }

    std::optional<std::string> LogConfigUpdate::getUpCaseString(std::string_view key) const {
        auto value = _configs.get(key);
        if(!value.isScalar()) {
            return {};
        }
        return util::upper(util::trim(value.getString()));
    }

    std::optional<Level> LogConfigUpdate::getLevel() const {
        auto level = getUpCaseString(LogManager::CONFIG_LEVEL_KEY);
        if(level.has_value()) {
            return LogManager::toLevel(level.value());
        }
        return {};
    }

    std::optional<Format> LogConfigUpdate::getFormat() const {
        auto format = getUpCaseString(LogManager::CONFIG_FORMAT_KEY);
        if(format == "JSON") {
            return Format::Json;
        } else if(format == "TEXT") {
            return Format::Text;
        }
        return {};
    }

    std::optional<OutputType> LogConfigUpdate::getOutputType() const {
        auto outType = getUpCaseString(LogManager::CONFIG_OUTPUT_TYPE_KEY);
        if(outType == "FILE") {
            return OutputType::File;
        } else if(outType == "CONSOLE") {
            return OutputType::Console;
        }
        return {};
    }

    std::optional<std::filesystem::path> LogConfigUpdate::getOutputDirectory() const {
        auto value = _configs.get(LogManager::CONFIG_OUTPUT_DIRECTORY_KEY);
        if(!value.isString() || util::trim(value.getString()).empty()) {
            return {};
        }
        return std::filesystem::absolute(std::string{util::trim(value.getString())});
    }
} // namespace logging
