#include "kernel.hpp"
#include "conv/json_conv.hpp"
#include "conv/yaml_conv.hpp"
#include "errors/errors.hpp"
#include "logging/logging.hpp"

#include <csignal>
#include <pthread.h>
#include <system_error>
#include <tuple>

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("nmbackport.lifecycle.Kernel");

namespace lifecycle {

    namespace {
        sigset_t handledSignals() {
            sigset_t set;
            sigemptyset(&set);
            sigaddset(&set, SIGINT);
            sigaddset(&set, SIGTERM);
            sigaddset(&set, SIGHUP);
            return set;
        }
    } // namespace

    Kernel::Kernel(std::shared_ptr<ipc::CommandRunner> runner, std::ostream &out)
        : _runner(std::move(runner)), _out(out) {
    }

    Kernel::~Kernel() noexcept {
        shutdown();
    }

    void Kernel::blockSignals() {
        auto set = handledSignals();
        int err = pthread_sigmask(SIG_BLOCK, &set, nullptr);
        if(err != 0) {
            throw std::system_error(err, std::generic_category(), "pthread_sigmask");
        }
    }

    backport::BackportInstaller &Kernel::getInstaller() {
        if(!_installer) {
            LOG.atError("boot").logAndThrow(errors::BootError{"Installer not created"});
        }
        return *_installer;
    }

    data::Struct Kernel::readConfig() const {
        if(_configPath.empty()) {
            LOG.atError("boot").logAndThrow(
                errors::BootError{"No configuration file given, use --config"});
        }
        auto root = conv::YamlReader::read(_configPath);
        auto loggingSection = root.get(LOGGING_KEY);
        if(loggingSection.isStruct()) {
            logging::LogManager::get().reconfigure(
                logging::LogConfigUpdate{*loggingSection.getStruct()});
        }
        auto component = root.get(COMPONENT_KEY);
        if(!component.isStruct()) {
            LOG.atWarn("config-no-component")
                .kv("file", _configPath.string())
                .log("No component section in configuration");
            return {};
        }
        auto attributes = component.getStruct()->get(ATTRIBUTES_KEY);
        if(!attributes.isStruct()) {
            return {};
        }
        return *attributes.getStruct();
    }

    void Kernel::preLaunch() {
        auto attributes = readConfig();
        _installer = std::make_unique<backport::BackportInstaller>(
            _runner, backport::ConfigDefaults{_baseDir});
        if(!_installer->reconfigure(attributes)) {
            LOG.atWarn("boot").log("Starting unconfigured");
        }
    }

    bool Kernel::reload() noexcept {
        try {
            LOG.atInfo("reload").kv("file", _configPath.string()).log();
            return getInstaller().reconfigure(readConfig());
        } catch(const std::exception &e) {
            LOG.atError("reload-failed").cause(e).log();
            return false;
        }
    }

    data::Struct Kernel::serve(std::string_view json) noexcept {
        try {
            return getInstaller().doCommand(conv::JsonReader::parseObject(json));
        } catch(const std::exception &e) {
            LOG.atWarn("request-rejected").cause(e).log();
            data::Struct response;
            response.put("error", std::string{e.what()});
            return response;
        }
    }

    int Kernel::launch() {
        int rc = _commands.empty() ? runDaemon() : runCommands();
        shutdown();
        return rc;
    }

    int Kernel::runCommands() {
        int rc = 0;
        for(const auto &command : _commands) {
            auto response = serve(command);
            _out << conv::JsonHelper::serialize(response) << std::endl;
            if(response.hasKey("error")) {
                rc = 1;
            }
        }
        return rc;
    }

    int Kernel::runDaemon() {
        auto set = handledSignals();
        LOG.atInfo("daemon-start").log("Waiting for signals");
        for(;;) {
            int sig = 0;
            int err = sigwait(&set, &sig);
            if(err != 0) {
                LOG.atError("sigwait-failed")
                    .logAndThrow(errors::Error::of(
                        std::system_error(err, std::generic_category(), "sigwait")));
            }
            if(sig == SIGHUP) {
                std::ignore = reload();
                continue;
            }
            LOG.atInfo("daemon-stop").kv("signal", sig).log();
            return 0;
        }
    }

    void Kernel::shutdown() noexcept {
        if(_installer) {
            _installer->shutdown();
        }
    }
} // namespace lifecycle
