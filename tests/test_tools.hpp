#pragma once
#include "data/struct_model.hpp"
#include "platform_abstraction/abstract_process.hpp"
#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace test {

    //
    // Access samples directory
    //
    inline std::filesystem::path samples() {
        std::array<std::filesystem::path, 2> alts = {"samples", "../samples"};
        for(const auto &alt : alts) {
            if(std::filesystem::exists(alt)) {
                return std::filesystem::absolute(alt);
            }
        }
        throw std::runtime_error("Cannot find samples directory");
    }

    //
    // Generate temporary directory for testing
    //
    class TempDir {
        std::filesystem::path _tempDir;

    private:
        std::filesystem::path genPath() {
            auto tempdir = std::filesystem::temp_directory_path();
            std::string prefix = "nm-backport-test-";
            std::random_device rd;
            std::mt19937 gen(rd());

            for(int i = 0; i < 1000; ++i) {
                auto num = gen();
                std::string tail = prefix + std::to_string(num);
                auto path = tempdir / tail;
                if(std::filesystem::create_directory(path)) {
                    return path;
                }
            }
            throw std::runtime_error("Tried too many times creating temporary directory");
        }

    public:
        TempDir() : _tempDir(genPath()) {
        }

        std::filesystem::path getDir() {
            return _tempDir;
        }

        void remove() {
            if(_tempDir.empty()) {
                return;
            }

            std::error_code ec;
            std::filesystem::remove_all(_tempDir, ec);
            if(ec) {
                std::cerr << "Failed to clean up temporary directory" << std::endl;
            }
            _tempDir.clear();
        }

        ~TempDir() {
            remove();
        }
    };

    inline void touch(const std::filesystem::path &file, const std::string &content = "x") {
        std::filesystem::create_directories(file.parent_path());
        std::ofstream stream{file};
        stream << content;
    }

    //
    // Fake command runner. Rules match on program (sudo prefix removed) and leading
    // arguments; the most recently added matching rule answers. Unmatched commands
    // report exit code 127.
    //
    class ScriptedRunner final : public ipc::CommandRunner {
    public:
        using Handler = std::function<ipc::CommandResult(const ipc::Startable &)>;

    private:
        struct Rule {
            std::string program;
            std::vector<std::string> prefix;
            Handler handler;
            int remaining{-1};
        };

        mutable std::mutex _mutex;
        std::vector<Rule> _rules;
        std::vector<ipc::Startable> _calls;
        std::atomic_int _active{0};
        std::atomic_int _maxActive{0};
        std::chrono::milliseconds _delay{0};

        static bool matches(const Rule &rule, const ipc::Startable &startable) {
            if(program(startable) != rule.program) {
                return false;
            }
            auto actual = args(startable);
            if(rule.prefix.size() > actual.size()) {
                return false;
            }
            return std::equal(rule.prefix.begin(), rule.prefix.end(), actual.begin());
        }

    public:
        static std::string program(const ipc::Startable &startable) {
            if(startable.getCommand() == "sudo" && !startable.getArguments().empty()) {
                return startable.getArguments().front();
            }
            return startable.getCommand();
        }

        static std::vector<std::string> args(const ipc::Startable &startable) {
            const auto &all = startable.getArguments();
            if(startable.getCommand() == "sudo" && !all.empty()) {
                return {std::next(all.begin()), all.end()};
            }
            return all;
        }

        static ipc::CommandResult result(int rc, std::string out = {}, std::string err = {}) {
            ipc::CommandResult r;
            r.returnCode = rc;
            r.out = std::move(out);
            r.err = std::move(err);
            return r;
        }

        ScriptedRunner &onCall(std::string prog, std::vector<std::string> prefix, Handler handler) {
            std::unique_lock guard{_mutex};
            _rules.push_back(Rule{std::move(prog), std::move(prefix), std::move(handler)});
            return *this;
        }

        ScriptedRunner &on(
            std::string prog,
            std::vector<std::string> prefix,
            int rc,
            std::string out = {},
            std::string err = {}) {
            auto fixed = result(rc, std::move(out), std::move(err));
            return onCall(std::move(prog), std::move(prefix), [fixed](const ipc::Startable &) {
                return fixed;
            });
        }

        // Most recent rule answers only once
        ScriptedRunner &once() {
            std::unique_lock guard{_mutex};
            if(!_rules.empty()) {
                _rules.back().remaining = 1;
            }
            return *this;
        }

        void setDelay(std::chrono::milliseconds delay) {
            std::unique_lock guard{_mutex};
            _delay = delay;
        }

        ipc::CommandResult run(const ipc::Startable &startable) override {
            int active = ++_active;
            int seen = _maxActive.load();
            while(active > seen && !_maxActive.compare_exchange_weak(seen, active)) {
            }
            Handler handler;
            std::chrono::milliseconds delay;
            {
                std::unique_lock guard{_mutex};
                _calls.push_back(startable);
                delay = _delay;
                for(auto i = _rules.rbegin(); i != _rules.rend(); ++i) {
                    if(i->remaining != 0 && matches(*i, startable)) {
                        if(i->remaining > 0) {
                            --i->remaining;
                        }
                        handler = i->handler;
                        break;
                    }
                }
            }
            if(delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            auto r = handler ? handler(startable) : result(127, {}, "not scripted");
            --_active;
            return r;
        }

        std::vector<ipc::Startable> calls() const {
            std::unique_lock guard{_mutex};
            return _calls;
        }

        size_t countCalls(const std::string &prog, const std::string &firstArg = {}) const {
            std::unique_lock guard{_mutex};
            return std::count_if(_calls.begin(), _calls.end(), [&](const auto &call) {
                auto a = args(call);
                return program(call) == prog
                       && (firstArg.empty() || (!a.empty() && a.front() == firstArg));
            });
        }

        int maxConcurrent() const {
            return _maxActive.load();
        }
    };

    //
    // A host where NetworkManager reports oldVersion until dpkg succeeds, then newVersion.
    // The fetch creates the archive, extraction drops the given package files next to it.
    //
    class FakeHost {
    public:
        std::shared_ptr<ScriptedRunner> runner{std::make_shared<ScriptedRunner>()};
        std::shared_ptr<std::atomic_bool> installed{std::make_shared<std::atomic_bool>(false)};

        explicit FakeHost(
            std::string oldVersion = "1.36.6",
            std::string newVersion = "1.42.8 (Backport)",
            std::vector<std::string> packages = {"network-manager_1.42.8_amd64.deb"}) {
            auto flag = installed;
            runner->onCall(
                "NetworkManager",
                {"--version"},
                [flag, oldVersion, newVersion](const ipc::Startable &) {
                    return ScriptedRunner::result(0, (*flag ? newVersion : oldVersion) + "\n");
                });
            runner->onCall("curl", {}, [](const ipc::Startable &s) {
                auto a = s.getArguments();
                auto out = std::find(a.begin(), a.end(), "-o");
                if(out != a.end() && std::next(out) != a.end()) {
                    touch(*std::next(out), "archive");
                }
                return ScriptedRunner::result(0);
            });
            runner->onCall("tar", {"-xvf"}, [packages](const ipc::Startable &s) {
                std::string listing;
                for(const auto &p : packages) {
                    touch(s.getWorkingDirectory().value_or(".") / p);
                    listing += p + "\n";
                }
                return ScriptedRunner::result(0, listing);
            });
            runner->onCall("tar", {"-tf"}, [packages](const ipc::Startable &) {
                std::string listing{"./\n"};
                for(const auto &p : packages) {
                    listing += p + "\n";
                }
                return ScriptedRunner::result(0, listing);
            });
            runner->onCall("dpkg", {"-i"}, [flag](const ipc::Startable &) {
                *flag = true;
                return ScriptedRunner::result(0);
            });
            runner->on("apt-get", {"install", "-f", "-y"}, 0);
            runner->on("systemctl", {"restart"}, 0);
            runner->on("systemctl", {"is-active"}, 0, "active\n");
        }
    };

    // Attributes for a fast test configuration under baseDir
    inline data::Struct attributes(const std::filesystem::path &baseDir) {
        data::Struct s;
        s.put("backport_url",
              "https://storage.googleapis.com/packages.viam.com/ubuntu/jammy-nm-backports.tar")
            .put("target_version", "1.42.8")
            .put("work_dir", "nm-backport")
            .put("platform", "ubuntu-22.04")
            .put("base_dir", baseDir.string())
            .put("check_interval", 0.05)
            .put("service_settle_seconds", 0)
            .put("agent_settle_seconds", 0);
        return s;
    }

    // Poll until predicate holds or the timeout passes
    template<typename Predicate>
    bool waitFor(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto end = std::chrono::steady_clock::now() + timeout;
        while(std::chrono::steady_clock::now() < end) {
            if(predicate()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return predicate();
    }

} // namespace test
