#pragma once
#include "backport_config.hpp"
#include "data/struct_model.hpp"
#include "install_procedure.hpp"
#include "platform_abstraction/abstract_process.hpp"

namespace backport {

    /**
     * Dry run of the download: fetches the archive into a private temporary directory, lists
     * its content without extracting and reports the packages found. The temporary directory
     * is always removed before returning.
     */
    class ArchiveValidator {
        ipc::CommandRunner &_runner;
        InstallProcedure &_procedure;

    public:
        ArchiveValidator(ipc::CommandRunner &runner, InstallProcedure &procedure) noexcept
            : _runner(runner), _procedure(procedure) {
        }

        [[nodiscard]] data::Struct validate(const BackportConfig &config) noexcept;
    };
} // namespace backport
