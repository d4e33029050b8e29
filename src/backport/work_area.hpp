#pragma once
#include "data/struct_model.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace backport {

    struct CleanupResult {
        bool success{false};
        bool removed{false};
        std::string message;
        std::optional<std::string> error;

        [[nodiscard]] data::Struct toStruct() const;
    };

    /**
     * The per-configuration scratch directory that holds the downloaded archive and the
     * packages extracted from it.
     */
    class WorkArea {
        std::filesystem::path _dir;

    public:
        explicit WorkArea(std::filesystem::path dir) : _dir(std::move(dir)) {
        }

        [[nodiscard]] const std::filesystem::path &getDir() const noexcept {
            return _dir;
        }

        void ensure() const;


        // Package files directly inside the directory, sorted by name
        [[nodiscard]] std::vector<std::filesystem::path> packages() const;

        [[nodiscard]] bool hasPackages() const {
            return !packages().empty();
        }

        // Recursive delete, never throws
        [[nodiscard]] CleanupResult remove() const noexcept;
    };
} // namespace backport
