#pragma once

#include <algorithm>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace util {

    inline bool startsWith(std::string_view target, std::string_view prefix) {
        if(prefix.length() > target.length()) {
            return false;
        }
        return target.substr(0, prefix.length()) == prefix;
    }

    inline bool endsWith(std::string_view target, std::string_view suffix) {
        if(suffix.length() > target.length()) {
            return false;
        }
        return target.substr(target.length() - suffix.length(), suffix.length()) == suffix;
    }

    inline constexpr std::string_view WHITESPACE{" \t\r\n\f\v"};

    inline std::string_view trim(std::string_view target) {
        auto first = target.find_first_not_of(WHITESPACE);
        if(first == std::string_view::npos) {
            return {};
        }
        auto last = target.find_last_not_of(WHITESPACE);
        return target.substr(first, last - first + 1);
    }

    // Splits on token, dropping blank entries
    inline std::vector<std::string> splitWith(const std::string &target, const char token) {
        std::istringstream ss(target);
        std::string item;
        std::vector<std::string> result;
        while(std::getline(ss, item, token)) {
            if(!trim(item).empty()) {
                result.emplace_back(trim(item));
            }
        }
        return result;
    }

    inline int lowerChar(int c) {
        // important: ignore Locale to ensure portability
        if(c >= 'A' && c <= 'Z') {
            return c - 'A' + 'a';
        } else {
            return c;
        }
    }

    inline int upperChar(int c) {
        if(c >= 'a' && c <= 'z') {
            return c - 'a' + 'A';
        } else {
            return c;
        }
    }

    inline std::string lower(std::string_view source) {
        std::string target;
        target.resize(source.size());
        std::transform(source.begin(), source.end(), target.begin(), lowerChar);
        return target;
    }

    inline std::string upper(std::string_view source) {
        std::string target;
        target.resize(source.size());
        std::transform(source.begin(), source.end(), target.begin(), upperChar);
        return target;
    }
} // namespace util
