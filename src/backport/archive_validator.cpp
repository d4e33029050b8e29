#include "archive_validator.hpp"
#include "logging/logging.hpp"
#include "system_commands.hpp"
#include "util/string_util.hpp"
#include "util/temp_dir.hpp"
#include <system_error>

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("nmbackport.backport.ArchiveValidator");

namespace backport {

    namespace {
        data::Struct invalid(const std::string &error) {
            data::Struct s;
            s.put("valid", false).put("error", error);
            return s;
        }
    } // namespace

    data::Struct ArchiveValidator::validate(const BackportConfig &config) noexcept {
        try {
            util::TempDir tempDir{"nm-backport-validate-"};
            auto archive = tempDir.getDir() / config.archiveName;
            SystemCommands commands{config};

            auto fetched = _runner.run(commands.fetch(archive));
            if(!fetched.ok()) {
                return invalid("Failed to download: " + std::string{util::trim(fetched.err)});
            }
            if(config.verifyChecksum) {
                _procedure.verifyChecksum(config, archive);
            }
            auto listed = _runner.run(commands.list(archive));
            if(!listed.ok()) {
                return invalid(
                    "Failed to examine archive: " + std::string{util::trim(listed.err)});
            }

            data::List allFiles;
            data::List debFiles;
            for(const auto &line : util::splitWith(listed.out, '\n')) {
                allFiles.push(line);
                if(util::endsWith(line, BackportConfig::PACKAGE_EXTENSION)) {
                    debFiles.push(line);
                }
            }
            std::error_code ec;
            auto size = std::filesystem::file_size(archive, ec);

            data::Struct s;
            s.put("valid", true)
                .put("archive_size", ec ? int64_t{0} : static_cast<int64_t>(size))
                .put("file_count", static_cast<int64_t>(allFiles.size()))
                .put("deb_count", static_cast<int64_t>(debFiles.size()))
                .put("deb_files", std::move(debFiles))
                .put("all_files", std::move(allFiles));
            LOG.atInfo("archive-validated").kv("url", config.backportUrl).log();
            return s;
        } catch(const std::exception &e) {
            LOG.atWarn("archive-validation-failed").cause(e).log();
            return invalid(e.what());
        }
    }
} // namespace backport
