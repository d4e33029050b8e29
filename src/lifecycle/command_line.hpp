#pragma once

#include "command_line_arguments.hpp"
#include "sys_properties.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace lifecycle {

    class Kernel;

    class CommandLine final {
    private:
        lifecycle::Kernel &_kernel;
        bool _helpRequested{false};

    public:
        explicit CommandLine(lifecycle::Kernel &kernel) : _kernel(kernel) {
        }

        void parseEnv(const SysProperties &env);
        void parseRawProgramNameAndArgs(int argc, char *argv[]);
        void parseArgs(const std::vector<std::string> &args);

        static void printHelp(std::ostream &out);

        [[nodiscard]] Kernel &getKernel() noexcept {
            return _kernel;
        }

        [[nodiscard]] bool isHelpRequested() const noexcept {
            return _helpRequested;
        }

        void requestHelp() noexcept {
            _helpRequested = true;
        }
    };

} // namespace lifecycle
