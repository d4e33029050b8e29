#include "sys_properties.hpp"

namespace lifecycle {
    void SysProperties::parseEnv(char *envp[]) {
        if(envp == nullptr) {
            return;
        }
        for(auto env = envp; *env != nullptr; ++env) {
            std::string_view entry{*env};
            if(auto pos = entry.find('='); pos != std::string_view::npos) {
                put(entry.substr(0, pos), entry.substr(pos + 1));
            } else {
                put(entry, {});
            }
        }
    }

    std::optional<std::string> SysProperties::get(std::string_view name) const {
        std::shared_lock guard{_mutex};
        if(auto i = _cache.find(name); i == _cache.end()) {
            return {};
        } else {
            return i->second;
        }
    }

    bool SysProperties::exists(std::string_view name) const {
        std::shared_lock guard{_mutex};
        return _cache.find(name) != _cache.cend();
    }

    void SysProperties::put(std::string name, std::string value) {
        std::unique_lock guard{_mutex};
        _cache.insert_or_assign(std::move(name), std::move(value));
    }

} // namespace lifecycle
