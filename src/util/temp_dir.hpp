#pragma once
#include <filesystem>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>

namespace util {
    using namespace std::literals;

    /**
     * Uniquely named directory under the system temporary location, removed with all of its
     * content when this object goes out of scope.
     */
    class TempDir final {
        std::filesystem::path _tempDir;

    public:
        // NOLINTNEXTLINE(*-err58-cpp) Exceptions in static
        inline static const auto DEFAULT_PREFIX = "nm-backport-"s;
        inline static const auto MAX_ITERATIONS = 1000;

    private:
        static std::filesystem::path genPath(const std::string &prefix) {
            auto tempdir = std::filesystem::temp_directory_path();
            std::random_device rd;
            std::mt19937 gen(rd());

            for(int i = 0; i < MAX_ITERATIONS; ++i) {
                auto num = gen();
                auto path = tempdir / (prefix + std::to_string(num));
                if(std::filesystem::create_directory(path)) {
                    return path;
                }
            }
            throw std::runtime_error("Tried too many times creating temporary directory");
        }

    public:
        explicit TempDir(const std::string &prefix = DEFAULT_PREFIX) : _tempDir(genPath(prefix)) {
        }
        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;
        TempDir(TempDir &&) = delete;
        TempDir &operator=(TempDir &&) = delete;
        ~TempDir() noexcept {
            remove();
        }

        [[nodiscard]] const std::filesystem::path &getDir() const noexcept {
            return _tempDir;
        }

        void remove() noexcept {
            if(_tempDir.empty()) {
                return;
            }
            std::error_code ec;
            std::filesystem::remove_all(_tempDir, ec);
            _tempDir.clear();
        }
    };

} // namespace util
