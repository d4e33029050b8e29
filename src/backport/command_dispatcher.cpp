#include "command_dispatcher.hpp"
#include "logging/logging.hpp"
#include <algorithm>

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("nmbackport.backport.CommandDispatcher");

namespace backport {

    CommandDispatcher &CommandDispatcher::add(std::string name, Handler handler) {
        _handlers.emplace_back(std::move(name), std::move(handler));
        return *this;
    }

    bool CommandDispatcher::has(std::string_view name) const {
        return std::any_of(_handlers.begin(), _handlers.end(), [name](const auto &entry) {
            return entry.first == name;
        });
    }

    std::vector<std::string> CommandDispatcher::names() const {
        std::vector<std::string> names;
        names.reserve(_handlers.size());
        for(const auto &entry : _handlers) {
            names.emplace_back(entry.first);
        }
        return names;
    }

    std::string CommandDispatcher::commandName(const data::Struct &request) {
        auto command = request.get(COMMAND_KEY);
        if(!command.isString()) {
            return {};
        }
        return command.getString();
    }

    data::Struct CommandDispatcher::unknown(std::string_view name) const {
        data::Struct s;
        s.put("error", "Unknown command: " + std::string{name})
            .put("available_commands", data::List{names()});
        return s;
    }

    data::Struct CommandDispatcher::dispatch(const data::Struct &request) const {
        auto name = commandName(request);
        auto found = std::find_if(_handlers.begin(), _handlers.end(), [&name](const auto &entry) {
            return entry.first == name;
        });
        if(found == _handlers.end()) {
            LOG.atWarn("unknown-command").kv("command", name).log();
            return unknown(name);
        }
        LOG.atDebug("dispatch").kv("command", name).log();
        return found->second(request);
    }
} // namespace backport
