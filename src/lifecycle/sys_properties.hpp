#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace lifecycle {
    using namespace std::string_view_literals;

    // Snapshot of the process environment
    class SysProperties {
    private:
        mutable std::shared_mutex _mutex;
        std::map<std::string, std::string, std::less<>> _cache;

    public:
        static constexpr auto HOME = "HOME"sv;

        SysProperties() = default;

        // Null-terminated array of NAME=value strings, as passed to main
        void parseEnv(char *envp[]);

        [[nodiscard]] std::optional<std::string> get(std::string_view name) const;

        void put(std::string name, std::string value);

        inline void put(std::string_view name, std::string_view value) {
            put(std::string(name), std::string(value));
        }

        [[nodiscard]] bool exists(std::string_view name) const;
    };
} // namespace lifecycle
