#include "struct_model.hpp"
#include "errors/errors.hpp"
#include "util/string_util.hpp"
#include <algorithm>
#include <cmath>

namespace data {

    bool StructElement::getBool() const {
        switch(getType()) {
            case NONE:
                return false;
            case BOOL:
                return std::get<bool>(_value);
            case INT:
                return std::get<int64_t>(_value) != 0;
            case DOUBLE:
                return std::get<double>(_value) != 0.0;
            case STRING: {
                auto s = util::lower(util::trim(std::get<std::string>(_value)));
                return !s.empty() && s != "false" && s != "no" && s != "0";
            }
            default:
                throw errors::InvalidTypeError("Expected a boolean value");
        }
    }

    int64_t StructElement::getInt() const {
        switch(getType()) {
            case NONE:
                return 0;
            case BOOL:
                return std::get<bool>(_value) ? 1 : 0;
            case INT:
                return std::get<int64_t>(_value);
            case DOUBLE:
                return static_cast<int64_t>(std::get<double>(_value));
            case STRING:
                try {
                    return std::stoll(std::get<std::string>(_value));
                } catch(const std::logic_error &) {
                    throw errors::InvalidTypeError("Expected an integer value");
                }
            default:
                throw errors::InvalidTypeError("Expected an integer value");
        }
    }

    double StructElement::getDouble() const {
        switch(getType()) {
            case NONE:
                return std::nan("");
            case BOOL:
                return std::get<bool>(_value) ? 1.0 : 0.0;
            case INT:
                return static_cast<double>(std::get<int64_t>(_value));
            case DOUBLE:
                return std::get<double>(_value);
            case STRING:
                try {
                    return std::stod(std::get<std::string>(_value));
                } catch(const std::logic_error &) {
                    throw errors::InvalidTypeError("Expected a numeric value");
                }
            default:
                throw errors::InvalidTypeError("Expected a numeric value");
        }
    }

    std::string StructElement::getString() const {
        switch(getType()) {
            case NONE:
                return {};
            case BOOL:
                return std::get<bool>(_value) ? "true" : "false";
            case INT:
                return std::to_string(std::get<int64_t>(_value));
            case DOUBLE:
                return std::to_string(std::get<double>(_value));
            case STRING:
                return std::get<std::string>(_value);
            default:
                throw errors::InvalidTypeError("Expected a string value");
        }
    }

    std::shared_ptr<List> StructElement::getList() const {
        if(isNull()) {
            return {};
        }
        if(!isList()) {
            throw errors::InvalidTypeError("Expected a list value");
        }
        return std::get<std::shared_ptr<List>>(_value);
    }

    std::shared_ptr<Struct> StructElement::getStruct() const {
        if(isNull()) {
            return {};
        }
        if(!isStruct()) {
            throw errors::InvalidTypeError("Expected a structure value");
        }
        return std::get<std::shared_ptr<Struct>>(_value);
    }

    // NOLINTNEXTLINE(*-no-recursion)
    bool StructElement::operator==(const StructElement &other) const {
        if(getType() != other.getType()) {
            return false;
        }
        switch(getType()) {
            case LIST: {
                auto left = getList();
                auto right = other.getList();
                if(!left || !right) {
                    return left == right;
                }
                return *left == *right;
            }
            case STRUCT: {
                auto left = getStruct();
                auto right = other.getStruct();
                if(!left || !right) {
                    return left == right;
                }
                return *left == *right;
            }
            default:
                return _value.base() == other._value.base();
        }
    }

    std::vector<std::string> List::toStrings() const {
        std::vector<std::string> strings;
        strings.reserve(_elements.size());
        for(const auto &el : _elements) {
            strings.emplace_back(el.getString());
        }
        return strings;
    }

    std::vector<std::pair<std::string, StructElement>>::const_iterator Struct::find(
        std::string_view key) const {
        return std::find_if(_elements.begin(), _elements.end(), [key](const auto &entry) {
            return entry.first == key;
        });
    }

    Struct &Struct::put(std::string_view key, StructElement value) {
        auto iter = std::find_if(_elements.begin(), _elements.end(), [key](const auto &entry) {
            return entry.first == key;
        });
        if(iter != _elements.end()) {
            iter->second = std::move(value);
        } else {
            _elements.emplace_back(std::string{key}, std::move(value));
        }
        return *this;
    }

    StructElement Struct::get(std::string_view key) const {
        auto iter = find(key);
        if(iter == _elements.end()) {
            return {};
        }
        return iter->second;
    }

    std::vector<std::string> Struct::getKeys() const {
        std::vector<std::string> keys;
        keys.reserve(_elements.size());
        for(const auto &entry : _elements) {
            keys.emplace_back(entry.first);
        }
        return keys;
    }

} // namespace data
