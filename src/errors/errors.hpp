#pragma once
#include "error_base.hpp"

namespace errors {

    class InvalidTypeError : public Error {
    public:
        explicit InvalidTypeError(const std::string &what = "Unexpected value type") noexcept
            : Error("InvalidTypeError", what) {
        }
    };

    class ConfigError : public Error {
    public:
        explicit ConfigError(const std::string &what = "Invalid configuration") noexcept
            : Error("ConfigError", what) {
        }
    };

    class InstallError : public Error {
    public:
        explicit InstallError(const std::string &what = "Install failed") noexcept
            : Error("InstallError", what) {
        }
    };

    class ChecksumError : public Error {
    public:
        explicit ChecksumError(
            const std::string &what = "Archive checksum verification failed") noexcept
            : Error("ChecksumError", what) {
        }
    };

    class CommandLineArgumentError : public Error {
    public:
        explicit CommandLineArgumentError(const std::string &what) noexcept
            : Error("CommandLineArgumentError", what) {
        }
    };

    class JsonParseError : public Error {
    public:
        explicit JsonParseError(const std::string &what = "Unable to parse JSON") noexcept
            : Error("JsonParseError", what) {
        }
    };

    class YamlParseError : public Error {
    public:
        explicit YamlParseError(const std::string &what = "Unable to parse YAML") noexcept
            : Error("YamlParseError", what) {
        }
    };

    class BootError : public Error {
    public:
        explicit BootError(const std::string &what) noexcept : Error("BootError", what) {
        }
    };

} // namespace errors
