#pragma once
#include "data/struct_model.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace backport {

    /**
     * Maps request names to handlers. Requests are structures with a "command" field; unknown
     * names produce an error result listing the registered names in registration order.
     */
    class CommandDispatcher {
    public:
        using Handler = std::function<data::Struct(const data::Struct &)>;

        static constexpr std::string_view COMMAND_KEY{"command"};

    private:
        std::vector<std::pair<std::string, Handler>> _handlers;

    public:
        CommandDispatcher &add(std::string name, Handler handler);

        [[nodiscard]] bool has(std::string_view name) const;

        [[nodiscard]] std::vector<std::string> names() const;

        // Name of the requested command, empty if missing or not a string
        [[nodiscard]] static std::string commandName(const data::Struct &request);

        [[nodiscard]] data::Struct unknown(std::string_view name) const;

        [[nodiscard]] data::Struct dispatch(const data::Struct &request) const;
    };
} // namespace backport
