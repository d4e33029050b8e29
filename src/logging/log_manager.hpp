#pragma once
#include "data/struct_model.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace logging {

    enum class Level { None, Trace, Debug, Info, Warn, Error };
    enum class Format { Text, Json };
    enum class OutputType { File, Console };

    class LogQueue;
    class LogManager;

    /**
     * Reads logging settings from a "logging" configuration section. Absent or unrecognized values
     * are reported as empty so defaults can be applied.
     */
    class LogConfigUpdate {
        data::Struct _configs;

    public:
        explicit LogConfigUpdate(data::Struct configs) : _configs(std::move(configs)) {
        }
        [[nodiscard]] std::optional<Level> getLevel() const;
        [[nodiscard]] std::optional<Format> getFormat() const;
        [[nodiscard]] std::optional<OutputType> getOutputType() const;
        [[nodiscard]] std::optional<std::filesystem::path> getOutputDirectory() const;
        [[nodiscard]] std::optional<std::string> getUpCaseString(std::string_view key) const;
    };

    /**
     * Process wide owner of log settings and the log output stream.
     */
    class LogManager {
        constexpr static std::string_view DEFAULT_LOG_BASE{"nm-backport"};
        constexpr static std::string_view LOG_EXTENSION{".log"};

        mutable std::shared_mutex _mutex;
        std::shared_ptr<LogQueue> _queue;
        std::atomic<Level> _level{Level::Info};
        Format _format{Format::Text};
        OutputType _outputType{OutputType::Console};
        std::filesystem::path _outputDirectory;
        std::ofstream _stream;

        void writeText(const data::Struct &entry);
        void writeJson(const data::Struct &entry);
        std::ostream &stream();

    public:
        // Structured entry keys
        constexpr static std::string_view CAUSE_KEY{"cause"};
        constexpr static std::string_view CONTEXTS_KEY{"contexts"};
        constexpr static std::string_view EVENT_KEY{"event"};
        constexpr static std::string_view LEVEL_KEY{"level"};
        constexpr static std::string_view LOGGER_NAME_KEY{"loggerName"};
        constexpr static std::string_view MESSAGE_KEY{"message"};
        constexpr static std::string_view TIMESTAMP_KEY{"timestamp"};
        constexpr static std::string_view CAUSE_MESSAGE_KEY{"message"};
        constexpr static std::string_view CAUSE_KIND_KEY{"kind"};

        // Config keys
        constexpr static std::string_view CONFIG_LEVEL_KEY{"level"};
        constexpr static std::string_view CONFIG_FORMAT_KEY{"format"};
        constexpr static std::string_view CONFIG_OUTPUT_TYPE_KEY{"outputType"};
        constexpr static std::string_view CONFIG_OUTPUT_DIRECTORY_KEY{"outputDirectory"};

        LogManager();
        LogManager(const LogManager &) = delete;
        LogManager(LogManager &&) = delete;
        LogManager &operator=(const LogManager &) = delete;
        LogManager &operator=(LogManager &&) = delete;
        ~LogManager() noexcept;

        static LogManager &get();

        static std::string toString(Level level);
        static std::optional<Level> toLevel(std::string_view level);

        [[nodiscard]] Level getLevel() const noexcept {
            return _level.load();
        }

        void setLevel(Level level) noexcept {
            _level.store(level);
        }

        [[nodiscard]] bool isEnabled(Level level) const noexcept {
            Level current = getLevel();
            return level != Level::None && current != Level::None && current <= level;
        }

        [[nodiscard]] Format getFormat() const {
            std::shared_lock guard{_mutex};
            return _format;
        }

        [[nodiscard]] std::filesystem::path getLogPath() const;

        void reconfigure(const LogConfigUpdate &config);
        void logEvent(data::Struct entry);
        void writeLog(const data::Struct &entry);
        void changeOutput();
        void syncOutput();
        // Blocks until every published entry has been written
        void drain();
    };
} // namespace logging
