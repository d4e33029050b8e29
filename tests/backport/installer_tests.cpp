#include "backport/backport_installer.hpp"
#include "test_tools.hpp"
#include <catch2/catch_all.hpp>

// NOLINTBEGIN

namespace {
    data::Struct request(std::string_view command) {
        data::Struct s;
        s.put("command", command);
        return s;
    }

    // Restores the working directory of the test process on exit
    class WorkingDirectory {
        std::filesystem::path _saved{std::filesystem::current_path()};

    public:
        explicit WorkingDirectory(const std::filesystem::path &dir) {
            std::filesystem::current_path(dir);
        }
        WorkingDirectory(const WorkingDirectory &) = delete;
        WorkingDirectory(WorkingDirectory &&) = delete;
        WorkingDirectory &operator=(const WorkingDirectory &) = delete;
        WorkingDirectory &operator=(WorkingDirectory &&) = delete;
        ~WorkingDirectory() {
            std::error_code ec;
            std::filesystem::current_path(_saved, ec);
        }
    };

    data::Struct manualAttributes(const std::filesystem::path &base) {
        auto attributes = test::attributes(base);
        attributes.put("auto_install", false);
        return attributes;
    }
} // namespace

SCENARIO("Requests are routed by command name", "[installer]") {
    test::TempDir tempDir;
    test::FakeHost host;
    backport::BackportInstaller installer{host.runner, {tempDir.getDir()}};
    REQUIRE(installer.reconfigure(manualAttributes(tempDir.getDir())));

    WHEN("An unknown command is requested") {
        auto response = installer.doCommand(request("reboot"));
        THEN("The registered commands are listed in order") {
            REQUIRE(response.get("error").getString() == "Unknown command: reboot");
            std::vector<std::string> expected{
                "check_status",
                "install_backport",
                "get_nm_version",
                "get_config",
                "list_backports",
                "validate_archive",
                "health_check",
                "cleanup_files"};
            REQUIRE(response.get("available_commands").getList()->toStrings() == expected);
        }
    }
    WHEN("The command field is missing") {
        auto response = installer.doCommand(data::Struct{});
        THEN("It is treated as an unknown empty name") {
            REQUIRE(response.get("error").getString() == "Unknown command: ");
        }
    }
    WHEN("The command field is not a string") {
        data::Struct bad;
        bad.put("command", 42);
        auto response = installer.doCommand(bad);
        THEN("It is treated as an unknown empty name") {
            REQUIRE(response.get("error").getString() == "Unknown command: ");
        }
    }
    WHEN("check_status is requested") {
        auto response = installer.doCommand(request("check_status"));
        THEN("The installation status is reported") {
            REQUIRE_FALSE(response.get("is_backported").getBool());
            REQUIRE(response.get("current_version").getString() == "1.36.6");
            REQUIRE(response.get("target_version").getString() == "1.42.8");
            REQUIRE(response.get("status").getString() == "needs_install");
            REQUIRE_FALSE(response.get("auto_install_enabled").getBool());
        }
    }
}

SCENARIO("An unconfigured installer refuses work", "[installer]") {
    test::TempDir tempDir;
    test::FakeHost host;
    backport::BackportInstaller installer{host.runner, {tempDir.getDir()}};

    WHEN("Nothing was configured") {
        auto response = installer.doCommand(request("check_status"));
        THEN("A not configured response is returned") {
            REQUIRE(response.get("error").getString() == "not configured");
            REQUIRE(response.get("status").getString() == "not_configured");
            REQUIRE(response.get("reason").getString() == "no configuration applied");
            REQUIRE(host.runner->calls().empty());
        }
    }
    WHEN("The configuration was rejected") {
        auto attributes = manualAttributes(tempDir.getDir());
        attributes.put("backport_url", "ftp://example.com/a.tar");
        REQUIRE_FALSE(installer.reconfigure(attributes));
        auto response = installer.doCommand(request("install_backport"));
        THEN("The rejection reason is reported") {
            REQUIRE(response.get("status").getString() == "not_configured");
            REQUIRE_THAT(
                response.get("reason").getString(),
                Catch::Matchers::ContainsSubstring("must be a valid HTTP/HTTPS URL"));
            REQUIRE(host.runner->countCalls("curl") == 0);
        }
    }
    WHEN("A good configuration is replaced by a bad one") {
        REQUIRE(installer.reconfigure(manualAttributes(tempDir.getDir())));
        REQUIRE(installer.isConfigured());
        auto attributes = manualAttributes(tempDir.getDir());
        attributes.put("target_version", "");
        REQUIRE_FALSE(installer.reconfigure(attributes));
        THEN("The instance becomes unconfigured") {
            REQUIRE_FALSE(installer.isConfigured());
            REQUIRE(
                installer.doCommand(request("get_config")).get("status").getString()
                == "not_configured");
        }
    }
    WHEN("A running loop is replaced by a configuration that cannot be resolved") {
        host.runner->on("curl", {}, 6, "", "Could not resolve host");
        auto running = test::attributes(tempDir.getDir());
        running.put("check_interval", 3600);
        REQUIRE(installer.reconfigure(running));
        REQUIRE(test::waitFor([&]() {
            return installer.loopState() == backport::LoopState::Running
                   && host.runner->countCalls("curl") >= 1;
        }));
        auto attributes = test::attributes(tempDir.getDir());
        attributes.put("base_dir", "relative");
        bool accepted = true;
        {
            auto gone = tempDir.getDir() / "gone";
            std::filesystem::create_directories(gone);
            WorkingDirectory cwd{gone};
            std::filesystem::remove_all(gone);
            accepted = installer.reconfigure(attributes);
        }
        THEN("The configuration is rejected and the old loop is stopped") {
            REQUIRE_FALSE(accepted);
            REQUIRE_FALSE(installer.isConfigured());
            REQUIRE(installer.loopState() == backport::LoopState::Stopped);
            REQUIRE(
                installer.doCommand(request("check_status")).get("status").getString()
                == "not_configured");
        }
    }
    WHEN("The catalog is requested") {
        auto response = installer.doCommand(request("list_backports"));
        THEN("It is available without a configuration") {
            auto available = response.get("available_backports").getList();
            REQUIRE(available->size() == 1);
            auto entry = available->get(0).getStruct();
            REQUIRE(entry->get("version").getString() == "1.42.8");
            REQUIRE(entry->get("platform").getString() == "ubuntu-22.04");
            REQUIRE(
                entry->get("features").getList()->toStrings()
                == std::vector<std::string>{"scanning-in-ap-mode"});
            auto current = response.get("current_config").getStruct();
            REQUIRE(current->get("target_version").isNull());
            REQUIRE(current->get("platform").isNull());
        }
    }
}

SCENARIO("Configuration and version queries", "[installer]") {
    test::TempDir tempDir;
    test::FakeHost host;
    backport::BackportInstaller installer{host.runner, {tempDir.getDir()}};
    REQUIRE(installer.reconfigure(manualAttributes(tempDir.getDir())));

    WHEN("get_config is requested") {
        auto response = installer.doCommand(request("get_config"));
        THEN("The effective settings and loop state are returned") {
            REQUIRE(
                response.get("backup_dir").getString()
                == (tempDir.getDir() / "nm-backport").string());
            REQUIRE(response.get("archive_name").getString() == "jammy-nm-backports.tar");
            REQUIRE(response.get("loop_state").getString() == "stopped");
            REQUIRE(response.get("loop_passes").getInt() == 0);
            REQUIRE(response.get("loop_last_error").isNull());
            REQUIRE(response.get("command_timeout").isNull());
        }
    }
    WHEN("list_backports is requested") {
        auto response = installer.doCommand(request("list_backports"));
        THEN("The current configuration is echoed") {
            auto current = response.get("current_config").getStruct();
            REQUIRE(current->get("target_version").getString() == "1.42.8");
            REQUIRE(current->get("platform").getString() == "ubuntu-22.04");
        }
    }
    WHEN("The version query succeeds") {
        auto response = installer.doCommand(request("get_nm_version"));
        THEN("The version is compared with the target") {
            REQUIRE(response.get("version").getString() == "1.36.6");
            REQUIRE_FALSE(response.get("is_target_version").getBool());
        }
    }
    WHEN("The version query fails") {
        host.runner->on("NetworkManager", {"--version"}, 127, "", "NetworkManager: not found");
        auto response = installer.doCommand(request("get_nm_version"));
        THEN("The failure is reported with its stderr") {
            REQUIRE(response.get("error").getString() == "Failed to get NetworkManager version");
            REQUIRE(response.get("stderr").getString() == "NetworkManager: not found");
        }
    }
}

SCENARIO("Manual install and cleanup requests", "[installer]") {
    test::TempDir tempDir;
    test::FakeHost host;
    backport::BackportInstaller installer{host.runner, {tempDir.getDir()}};
    auto attributes = manualAttributes(tempDir.getDir());
    attributes.put("cleanup_after_install", false);
    REQUIRE(installer.reconfigure(attributes));
    auto workDir = tempDir.getDir() / "nm-backport";

    WHEN("Cleanup is requested with nothing present") {
        auto response = installer.doCommand(request("cleanup_files"));
        THEN("There is nothing to clean") {
            REQUIRE(response.get("success").getBool());
            REQUIRE(response.get("message").getString() == "No files to clean up");
        }
    }
    WHEN("An install is requested") {
        auto response = installer.doCommand(request("install_backport"));
        THEN("The install result is returned and files are kept") {
            REQUIRE(response.get("success").getBool());
            REQUIRE(response.get("action").getString() == "installed");
            REQUIRE(response.get("is_backported").getBool());
            REQUIRE(std::filesystem::exists(workDir));
        }
        AND_WHEN("Cleanup is requested") {
            auto cleanup = installer.doCommand(request("cleanup_files"));
            THEN("The work directory is removed") {
                REQUIRE(cleanup.get("success").getBool());
                REQUIRE(cleanup.get("message").getString() == "Cleaned up " + workDir.string());
                REQUIRE_FALSE(std::filesystem::exists(workDir));
            }
        }
        AND_WHEN("A second install is requested") {
            auto again = installer.doCommand(request("install_backport"));
            THEN("It is skipped") {
                REQUIRE(again.get("action").getString() == "skipped");
                REQUIRE(host.runner->countCalls("dpkg") == 1);
            }
        }
        AND_WHEN("A forced install is requested") {
            auto forced = request("install_backport");
            forced.put("force", true);
            auto again = installer.doCommand(forced);
            THEN("The packages are installed again") {
                REQUIRE(again.get("action").getString() == "installed");
                REQUIRE(host.runner->countCalls("dpkg") == 2);
            }
        }
    }
}

SCENARIO("Archive validation uses a throwaway directory", "[installer]") {
    test::TempDir tempDir;
    test::FakeHost host;
    backport::BackportInstaller installer{host.runner, {tempDir.getDir()}};
    REQUIRE(installer.reconfigure(manualAttributes(tempDir.getDir())));

    auto downloadDir = [&host]() {
        for(const auto &call : host.runner->calls()) {
            if(call.getCommand() == "curl") {
                return std::filesystem::path{call.getArguments().back()}.parent_path();
            }
        }
        return std::filesystem::path{};
    };

    WHEN("The archive is valid") {
        auto response = installer.doCommand(request("validate_archive"));
        THEN("Its content is summarized") {
            REQUIRE(response.get("valid").getBool());
            REQUIRE(response.get("archive_size").getInt() == 7);
            REQUIRE(response.get("file_count").getInt() == 2);
            REQUIRE(response.get("deb_count").getInt() == 1);
            REQUIRE(
                response.get("deb_files").getList()->toStrings()
                == std::vector<std::string>{"network-manager_1.42.8_amd64.deb"});
        }
        THEN("Nothing is installed and the temporary directory is gone") {
            REQUIRE(host.runner->countCalls("dpkg") == 0);
            REQUIRE_FALSE(downloadDir().empty());
            REQUIRE_FALSE(std::filesystem::exists(downloadDir()));
            REQUIRE_FALSE(std::filesystem::exists(tempDir.getDir() / "nm-backport"));
        }
    }
    WHEN("The download fails") {
        host.runner->onCall("curl", {}, [](const ipc::Startable &s) {
            test::touch(s.getArguments().back(), "partial");
            return test::ScriptedRunner::result(22, "", "HTTP 403");
        });
        auto response = installer.doCommand(request("validate_archive"));
        THEN("The archive is reported invalid and the directory is gone") {
            REQUIRE_FALSE(response.get("valid").getBool());
            REQUIRE(response.get("error").getString() == "Failed to download: HTTP 403");
            REQUIRE_FALSE(std::filesystem::exists(downloadDir()));
        }
    }
    WHEN("The listing fails") {
        host.runner->on("tar", {"-tf"}, 2, "", "unexpected end of file");
        auto response = installer.doCommand(request("validate_archive"));
        THEN("The archive is reported invalid") {
            REQUIRE_FALSE(response.get("valid").getBool());
            REQUIRE(
                response.get("error").getString()
                == "Failed to examine archive: unexpected end of file");
            REQUIRE_FALSE(downloadDir().empty());
            REQUIRE_FALSE(std::filesystem::exists(downloadDir()));
        }
    }
    WHEN("Checksum verification is enabled and the digest differs") {
        auto attributes = manualAttributes(tempDir.getDir());
        attributes.put("verify_checksum", true).put("expected_checksum", "abc");
        REQUIRE(installer.reconfigure(attributes));
        host.runner->on("sha256sum", {}, 0, "def  archive.tar\n");
        auto response = installer.doCommand(request("validate_archive"));
        THEN("The archive is reported invalid before it is listed") {
            REQUIRE_FALSE(response.get("valid").getBool());
            REQUIRE(response.get("error").getString() == "Archive checksum verification failed");
            REQUIRE(host.runner->countCalls("tar") == 0);
        }
        THEN("The temporary directory is gone") {
            REQUIRE_FALSE(downloadDir().empty());
            REQUIRE_FALSE(std::filesystem::exists(downloadDir()));
        }
    }
}

SCENARIO("Health check combines service and version state", "[installer]") {
    test::TempDir tempDir;

    GIVEN("A host running the target version") {
        test::FakeHost host{"1.42.8 (Backport)"};
        backport::BackportInstaller installer{host.runner, {tempDir.getDir()}};
        REQUIRE(installer.reconfigure(manualAttributes(tempDir.getDir())));
        auto response = installer.doCommand(request("health_check"));
        THEN("The host is healthy") {
            REQUIRE(response.get("overall_health").getString() == "healthy");
            REQUIRE(response.get("networkmanager_service_active").getBool());
            REQUIRE_FALSE(response.get("should_auto_install").getBool());
            REQUIRE(response.get("timestamp").getDouble() > 0.0);
            REQUIRE(
                response.get("backport_status").getStruct()->get("status").getString()
                == "installed");
            REQUIRE_FALSE(response.hasKey("auto_install_result"));
        }
    }
    GIVEN("A host with an old version and auto install disabled") {
        test::FakeHost host;
        backport::BackportInstaller installer{host.runner, {tempDir.getDir()}};
        REQUIRE(installer.reconfigure(manualAttributes(tempDir.getDir())));
        auto response = installer.doCommand(request("health_check"));
        THEN("The host is degraded and nothing is installed") {
            REQUIRE(response.get("overall_health").getString() == "degraded");
            REQUIRE_FALSE(response.get("should_auto_install").getBool());
            REQUIRE(host.runner->countCalls("dpkg") == 0);
        }
    }
    GIVEN("A host with an old version and auto install enabled") {
        test::FakeHost host;
        backport::BackportInstaller installer{host.runner, {tempDir.getDir()}};
        auto attributes = test::attributes(tempDir.getDir());
        attributes.put("check_interval", 3600);
        REQUIRE(installer.reconfigure(attributes));
        auto response = installer.doCommand(request("health_check"));
        THEN("An install is attempted inline") {
            REQUIRE(response.get("overall_health").getString() == "degraded");
            REQUIRE(response.get("should_auto_install").getBool());
            auto result = response.get("auto_install_result").getStruct();
            REQUIRE(result);
            REQUIRE(result->get("action").getString() == "installed");
            REQUIRE(host.runner->countCalls("dpkg") == 1);
        }
    }
}

SCENARIO("Reconfiguration replaces the background loop", "[installer]") {
    test::TempDir tempDir;
    test::FakeHost host;
    host.runner->setDelay(std::chrono::milliseconds(20));
    backport::BackportInstaller installer{host.runner, {tempDir.getDir()}};

    WHEN("Auto install is enabled") {
        REQUIRE(installer.reconfigure(test::attributes(tempDir.getDir())));
        REQUIRE(installer.loopState() == backport::LoopState::Running);
        REQUIRE(test::waitFor([&]() { return host.runner->countCalls("curl") > 0; }));

        AND_WHEN("It is reconfigured during an install") {
            auto attributes = test::attributes(tempDir.getDir());
            attributes.put("work_dir", "nm-backport-2");
            REQUIRE(installer.reconfigure(attributes));
            REQUIRE(test::waitFor([&]() {
                return installer.loopStopReason() == backport::StopReason::Converged;
            }));
            THEN("Only one worker ever ran commands at a time") {
                REQUIRE(host.runner->maxConcurrent() == 1);
                REQUIRE(installer.getConfig()->workDirName == "nm-backport-2");
            }
        }
        AND_WHEN("The installer shuts down") {
            installer.shutdown();
            THEN("The loop is stopped and further reconfiguration is refused") {
                REQUIRE(installer.loopState() == backport::LoopState::Stopped);
                REQUIRE_FALSE(installer.reconfigure(test::attributes(tempDir.getDir())));
            }
        }
    }
    WHEN("The loop converges by itself") {
        REQUIRE(installer.reconfigure(test::attributes(tempDir.getDir())));
        REQUIRE(test::waitFor([&]() {
            return installer.loopState() == backport::LoopState::Stopped;
        }));
        THEN("get_config reports the stopped loop") {
            auto response = installer.doCommand(request("get_config"));
            REQUIRE(installer.loopStopReason() == backport::StopReason::Converged);
            REQUIRE(response.get("loop_state").getString() == "stopped");
            REQUIRE(response.get("loop_passes").getInt() == 1);
        }
    }
}

// NOLINTEND
