// Main blocking thread, called by containing process
#include "errors/errors.hpp"
#include "lifecycle/command_line.hpp"
#include "lifecycle/kernel.hpp"
#include "lifecycle/sys_properties.hpp"
#include "logging/logging.hpp"
#include "platform_abstraction/linux/process_runner.hpp"

#include <iostream>

extern "C" {
#include "nm_backport.h"
}

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("nmbackport.api.Main");

// NOLINTNEXTLINE(*-avoid-c-arrays)
int nmBackportMain(int argc, char *argv[], char *envp[]) noexcept {
    int rc = 1;
    try {
        // before any thread exists, so only sigwait sees these signals
        lifecycle::Kernel::blockSignals();
        lifecycle::SysProperties env;
        env.parseEnv(envp);
        lifecycle::Kernel kernel{std::make_shared<ipc::ProcessRunner>()};
        bool helpOnly = false;
        // limited scope
        {
            lifecycle::CommandLine commandLine{kernel};
            commandLine.parseEnv(env);
            commandLine.parseRawProgramNameAndArgs(argc, argv);
            helpOnly = commandLine.isHelpRequested();
        }
        if(helpOnly) {
            lifecycle::CommandLine::printHelp(std::cout);
            rc = 0;
        } else {
            kernel.preLaunch();
            // Blocks until signalled unless one-shot requests were given
            rc = kernel.launch();
        }
    } catch(const errors::CommandLineArgumentError &e) {
        std::cerr << e.what() << '\n';
        lifecycle::CommandLine::printHelp(std::cerr);
        rc = 2;
    } catch(const std::exception &e) {
        auto err = errors::Error::of(e);
        LOG.atError("main-failed").cause(err).log();
        std::cerr << err.kind() << ": " << err.what() << '\n';
        rc = 1;
    }
    logging::LogManager::get().drain();
    return rc;
}
