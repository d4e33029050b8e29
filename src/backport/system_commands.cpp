#include "system_commands.hpp"

namespace backport {

    ipc::Startable SystemCommands::plain(
        std::string program, std::vector<std::string> args) const {
        ipc::Startable startable{std::move(program), std::move(args)};
        startable.withTimeout(_config.commandTimeout);
        return startable;
    }

    ipc::Startable SystemCommands::privileged(
        std::string program, std::vector<std::string> args) const {
        if(!_config.useSudo) {
            return plain(std::move(program), std::move(args));
        }
        args.insert(args.begin(), std::move(program));
        return plain("sudo", std::move(args));
    }

    ipc::Startable SystemCommands::versionQuery() const {
        return plain(_config.managedService, {"--version"});
    }

    ipc::Startable SystemCommands::fetch(const std::filesystem::path &target) const {
        return plain("curl", {"-fsSL", _config.backportUrl, "-o", target.string()});
    }

    ipc::Startable SystemCommands::checksum(const std::filesystem::path &file) const {
        return plain("sha256sum", {file.string()});
    }

    ipc::Startable SystemCommands::extract(const std::filesystem::path &archive) const {
        auto startable = plain("tar", {"-xvf", archive.filename().string()});
        startable.withWorkingDirectory(archive.parent_path());
        return startable;
    }

    ipc::Startable SystemCommands::list(const std::filesystem::path &archive) const {
        auto startable = plain("tar", {"-tf", archive.filename().string()});
        startable.withWorkingDirectory(archive.parent_path());
        return startable;
    }

    ipc::Startable SystemCommands::installPackages(
        const std::vector<std::filesystem::path> &packages) const {
        std::vector<std::string> args{"-i"};
        for(const auto &package : packages) {
            args.emplace_back(package.string());
        }
        return privileged("dpkg", std::move(args));
    }

    ipc::Startable SystemCommands::repairDependencies() const {
        return privileged("apt-get", {"install", "-f", "-y"});
    }

    ipc::Startable SystemCommands::restartService(const std::string &service) const {
        return privileged("systemctl", {"restart", service});
    }

    ipc::Startable SystemCommands::isServiceActive(const std::string &service) const {
        return plain("systemctl", {"is-active", service});
    }
} // namespace backport
