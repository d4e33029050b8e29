#include "work_area.hpp"
#include "backport_config.hpp"
#include "logging/logging.hpp"
#include "util/string_util.hpp"
#include <algorithm>
#include <system_error>

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("nmbackport.backport.WorkArea");

namespace backport {

    void WorkArea::ensure() const {
        std::filesystem::create_directories(_dir);
    }

    std::vector<std::filesystem::path> WorkArea::packages() const {
        std::vector<std::filesystem::path> found;
        if(!std::filesystem::is_directory(_dir)) {
            return found;
        }
        for(const auto &entry : std::filesystem::directory_iterator(_dir)) {
            if(entry.is_regular_file()
               && util::endsWith(
                   entry.path().filename().string(), BackportConfig::PACKAGE_EXTENSION)) {
                found.emplace_back(entry.path());
            }
        }
        std::sort(found.begin(), found.end());
        return found;
    }

    CleanupResult WorkArea::remove() const noexcept {
        CleanupResult result;
        try {
            if(!std::filesystem::exists(_dir)) {
                result.success = true;
                result.message = "No files to clean up";
                return result;
            }
            std::error_code ec;
            std::filesystem::remove_all(_dir, ec);
            if(ec) {
                result.error = "Failed to clean up " + _dir.string() + ": " + ec.message();
                LOG.atWarn("cleanup-failed").kv("dir", _dir.string()).log(ec.message());
                return result;
            }
            result.success = true;
            result.removed = true;
            result.message = "Cleaned up " + _dir.string();
            LOG.atInfo("cleanup-done").kv("dir", _dir.string()).log();
        } catch(const std::exception &e) {
            result.success = false;
            result.error = e.what();
        }
        return result;
    }

    data::Struct CleanupResult::toStruct() const {
        data::Struct s;
        s.put("success", success);
        if(success) {
            s.put("message", message);
        } else {
            s.put("error", error.value_or("cleanup failed"));
        }
        return s;
    }
} // namespace backport
