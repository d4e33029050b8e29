#pragma once

#include "backport/backport_installer.hpp"
#include "data/struct_model.hpp"
#include "platform_abstraction/abstract_process.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace lifecycle {

    /**
     * Owns the installer component for the life of the process. Reads the YAML configuration,
     * applies its logging section and hands the component attributes to the installer. Runs
     * either the queued one-shot requests or a daemon loop driven by signals.
     */
    class Kernel {
    public:
        static constexpr std::string_view LOGGING_KEY{"logging"};
        static constexpr std::string_view COMPONENT_KEY{"component"};
        static constexpr std::string_view NAME_KEY{"name"};
        static constexpr std::string_view ATTRIBUTES_KEY{"attributes"};

    private:
        std::shared_ptr<ipc::CommandRunner> _runner;
        std::ostream &_out;
        std::filesystem::path _configPath;
        std::filesystem::path _baseDir;
        std::vector<std::string> _commands;
        std::unique_ptr<backport::BackportInstaller> _installer;

        int runCommands();
        int runDaemon();

    public:
        explicit Kernel(std::shared_ptr<ipc::CommandRunner> runner, std::ostream &out = std::cout);
        Kernel(const Kernel &) = delete;
        Kernel(Kernel &&) = delete;
        Kernel &operator=(const Kernel &) = delete;
        Kernel &operator=(Kernel &&) = delete;
        ~Kernel() noexcept;

        // Block the handled signals; call before any thread is created
        static void blockSignals();

        void setConfigPath(std::filesystem::path path) noexcept {
            _configPath = std::move(path);
        }

        void setBaseDir(std::filesystem::path path) noexcept {
            _baseDir = std::move(path);
        }

        void addCommand(std::string json) {
            _commands.emplace_back(std::move(json));
        }

        [[nodiscard]] const std::filesystem::path &getConfigPath() const noexcept {
            return _configPath;
        }

        [[nodiscard]] const std::filesystem::path &getBaseDir() const noexcept {
            return _baseDir;
        }

        [[nodiscard]] const std::vector<std::string> &getCommands() const noexcept {
            return _commands;
        }

        [[nodiscard]] backport::BackportInstaller &getInstaller();

        // Read the configuration file, apply logging and return the component attributes
        [[nodiscard]] data::Struct readConfig() const;

        // Create the installer and apply the configuration
        void preLaunch();

        // Re-read the configuration file and reconfigure the installer
        bool reload() noexcept;

        // Serve one JSON request; malformed JSON is answered with an error response
        [[nodiscard]] data::Struct serve(std::string_view json) noexcept;

        int launch();
        void shutdown() noexcept;
    };
} // namespace lifecycle
