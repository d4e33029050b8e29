#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace errors {

    using namespace std::literals;

    /**
     * Errors raised inside the backport installer are described by the tuple {Kind,Message}
     * where Kind is a short non-empty name, and Message is a human readable string. Any
     * exception crossing a component boundary is translated to this form before being
     * reported as structured data.
     */
    class Error : public std::runtime_error {
        inline static const auto DEFAULT_ERROR_TEXT = "Unspecified Error"s; // NOLINT(*-err58-cpp)
        std::string _kind;

    public:
        inline static const auto UNSPECIFIED_KIND = "UnspecifiedError"s; // NOLINT(*-err58-cpp)
        inline static const auto SYSTEM_ERROR_KIND = "std::system_error"s; // NOLINT(*-err58-cpp)
        inline static const auto RUNTIME_ERROR_KIND = "std::runtime_error"s; // NOLINT(*-err58-cpp)
        inline static const auto LOGICAL_ERROR_KIND = "std::logic_error"s; // NOLINT(*-err58-cpp)
        inline static const auto STD_ERROR_KIND = "std::exception"s; // NOLINT(*-err58-cpp)

        Error(const Error &) = default;
        Error(Error &&) = default;
        Error &operator=(const Error &) = default;
        Error &operator=(Error &&) = default;
        ~Error() noexcept override = default;

        explicit Error(std::string_view kind, const std::string &what = DEFAULT_ERROR_TEXT) noexcept
            : std::runtime_error(what), _kind(kind.empty() ? UNSPECIFIED_KIND : kind) {
        }

        explicit Error(const char *kind, const std::string &what = DEFAULT_ERROR_TEXT) noexcept
            : Error(std::string_view(kind), what) {
        }

        /**
         * Convert an in-flight exception to an Error, preserving the kind if the exception
         * is already an Error.
         *
         * @param error Exception pointer
         * @return Wrapped error
         */
        [[nodiscard]] static Error of(const std::exception_ptr &error) noexcept;

        /**
         * Convert a caught standard exception to an Error.
         */
        [[nodiscard]] static Error of(const std::exception &error) noexcept;

        [[nodiscard]] static Error unspecified() noexcept {
            return Error(UNSPECIFIED_KIND);
        }

        [[nodiscard]] const std::string &kind() const noexcept {
            return _kind;
        }
    };

} // namespace errors
