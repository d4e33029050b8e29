#include "command_line.hpp"

#include "argument_iterator.hpp"
#include "kernel.hpp"
#include "logging/logging.hpp"

#include <tuple>

namespace fs = std::filesystem;

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("nmbackport.lifecycle.CommandLine");

namespace lifecycle {

    static inline constexpr std::tuple argumentList{
        makeArgumentFlag(
            [](CommandLine &cli) { cli.requestHelp(); },
            "h",
            "help",
            "Print this usage information"),
        makeArgumentValue<std::string_view>(
            [](CommandLine &cli, std::string_view arg) {
                cli.getKernel().setConfigPath(fs::absolute(fs::path{arg}));
            },
            "c",
            "config",
            "YAML configuration file"),
        makeArgumentValue<std::string>(
            [](CommandLine &cli, std::string arg) { cli.getKernel().addCommand(std::move(arg)); },
            "x",
            "command",
            "JSON request to run once, e.g. {\"command\":\"check_status\"} (repeatable)"),
        makeArgumentValue<std::string_view>(
            [](CommandLine &cli, std::string_view arg) {
                cli.getKernel().setBaseDir(fs::absolute(fs::path{arg}));
            },
            "b",
            "base-dir",
            "Directory that holds the work directory (default $HOME)")};

    void CommandLine::parseRawProgramNameAndArgs(int argc, char *argv[]) {
        if(argc <= 0 || argv == nullptr || argv[0] == nullptr) {
            throw errors::CommandLineArgumentError("No program name given");
        }
        std::vector<std::string> args;
        for(int i = 1; i < argc; ++i) {
            if(argv[i] == nullptr) {
                throw errors::CommandLineArgumentError("Null pointer in arguments");
            }
            args.emplace_back(argv[i]);
        }
        parseArgs(args);
    }

    void CommandLine::parseEnv(const SysProperties &env) {
        std::optional<std::string> homePath = env.get(SysProperties::HOME);
        if(homePath.has_value() && !homePath.value().empty()) {
            _kernel.setBaseDir(fs::absolute(fs::path(homePath.value())));
        } else {
            _kernel.setBaseDir(fs::absolute("."));
        }
    }

    void CommandLine::printHelp(std::ostream &out) {
        out << "Usage: nm-backport -c <config.yaml> [options]\n";
        std::apply([&out](auto &&...args) { Argument::printHelp(out, args...); }, argumentList);
    }

    void CommandLine::parseArgs(const std::vector<std::string> &args) {
        for(auto i = args.begin(); i != args.end(); i++) {
            if(!std::apply(
                   [](auto &&...args) { return Argument::processArg(args...); },
                   std::tuple_cat(
                       std::pair{std::ref(*this), ArgumentIterator{args, i}}, argumentList))) {
                LOG.atError()
                    .event("parse-args-error")
                    .logAndThrow(errors::CommandLineArgumentError{
                        std::string("Unrecognized option: ") + *i});
            }
        }
    }

} // namespace lifecycle
