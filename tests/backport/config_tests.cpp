#include "backport/backport_config.hpp"
#include "conv/yaml_conv.hpp"
#include "errors/errors.hpp"
#include "test_tools.hpp"
#include <catch2/catch_all.hpp>
#include <limits>
#include <tuple>

// NOLINTBEGIN

namespace {
    std::string rejection(const data::Struct &attributes) {
        try {
            std::ignore = backport::ConfigValidator::validate(attributes, {"/home/tester"});
        } catch(const errors::ConfigError &e) {
            return e.what();
        }
        return {};
    }
} // namespace

SCENARIO("Archive name is taken from the URL", "[config]") {
    using backport::ConfigValidator;
    THEN("The final path segment is used") {
        REQUIRE(
            ConfigValidator::deriveArchiveName(
                "https://storage.googleapis.com/packages.viam.com/ubuntu/jammy-nm-backports.tar")
            == "jammy-nm-backports.tar");
    }
    THEN("Query and fragment are ignored") {
        REQUIRE(
            ConfigValidator::deriveArchiveName("http://host/a/b.tar?sig=abc/def#frag")
            == "b.tar");
    }
    THEN("A trailing slash gives an empty name") {
        REQUIRE(ConfigValidator::deriveArchiveName("https://host/pkgs/").empty());
    }
    THEN("A URL without a path gives an empty name") {
        REQUIRE(ConfigValidator::deriveArchiveName("https://host").empty());
    }
}

SCENARIO("Valid attributes produce a configuration", "[config]") {
    GIVEN("Only the required attributes") {
        data::Struct attributes;
        attributes.put("backport_url", "https://example.com/ubuntu/jammy-nm-backports.tar")
            .put("target_version", "  1.42.8  ")
            .put("work_dir", "nm-backport")
            .put("platform", "ubuntu-22.04");
        auto config = backport::ConfigValidator::validate(attributes, {"/home/tester"});
        THEN("Derived fields are filled") {
            REQUIRE(config.archiveName == "jammy-nm-backports.tar");
            REQUIRE(config.workDir == std::filesystem::path{"/home/tester/nm-backport"});
            REQUIRE(config.archivePath() == "/home/tester/nm-backport/jammy-nm-backports.tar");
        }
        THEN("The target version is trimmed") {
            REQUIRE(config.targetVersion == "1.42.8");
        }
        THEN("Defaults apply") {
            REQUIRE(config.autoInstall);
            REQUIRE(config.checkInterval.count() == 60.0);
            REQUIRE_FALSE(config.forceReinstall);
            REQUIRE(config.cleanupAfterInstall);
            REQUIRE(config.restartDependentService);
            REQUIRE_FALSE(config.verifyChecksum);
            REQUIRE_FALSE(config.commandTimeout.has_value());
            REQUIRE(config.serviceSettle.count() == 5.0);
            REQUIRE(config.agentSettle.count() == 10.0);
            REQUIRE(config.managedService == "NetworkManager");
            REQUIRE(config.dependentService == "viam-agent");
            REQUIRE(config.useSudo);
            REQUIRE(config.description == "NetworkManager 1.42.8 backport for ubuntu-22.04");
        }
        THEN("The echoed settings include the backup directory") {
            auto s = config.toStruct();
            REQUIRE(s.get("backup_dir").getString() == "/home/tester/nm-backport");
            REQUIRE(s.get("command_timeout").isNull());
            REQUIRE(s.get("archive_name").getString() == "jammy-nm-backports.tar");
        }
    }
    GIVEN("Optional attributes") {
        test::TempDir tempDir;
        auto attributes = test::attributes(tempDir.getDir());
        attributes.put("command_timeout", 90)
            .put("archive_name", "custom.tar")
            .put("verify_checksum", true)
            .put("expected_checksum", "ABC123")
            .put("use_sudo", false);
        auto config = backport::ConfigValidator::validate(attributes, {"/ignored"});
        THEN("They override the defaults") {
            REQUIRE(config.commandTimeout == std::chrono::milliseconds(90000));
            REQUIRE(config.archiveName == "custom.tar");
            REQUIRE(config.verifyChecksum);
            REQUIRE(config.expectedChecksum == "ABC123");
            REQUIRE_FALSE(config.useSudo);
            REQUIRE(config.workDir == tempDir.getDir() / "nm-backport");
        }
    }
}

SCENARIO("Invalid attributes are rejected", "[config]") {
    test::TempDir tempDir;
    auto valid = test::attributes(tempDir.getDir());
    REQUIRE(rejection(valid).empty());

    GIVEN("Missing required attributes") {
        auto reason = rejection(data::Struct{});
        THEN("Every missing attribute is reported") {
            REQUIRE_THAT(reason, Catch::Matchers::ContainsSubstring("backport_url is required"));
            REQUIRE_THAT(reason, Catch::Matchers::ContainsSubstring("target_version is required"));
            REQUIRE_THAT(reason, Catch::Matchers::ContainsSubstring("work_dir is required"));
            REQUIRE_THAT(reason, Catch::Matchers::ContainsSubstring("platform is required"));
        }
    }
    GIVEN("A URL that is not http or https") {
        auto attributes = valid;
        attributes.put("backport_url", "ftp://example.com/a.tar");
        THEN("It is rejected") {
            REQUIRE_THAT(
                rejection(attributes),
                Catch::Matchers::ContainsSubstring("must be a valid HTTP/HTTPS URL"));
        }
    }
    GIVEN("A URL with an empty final segment") {
        auto attributes = valid;
        attributes.put("backport_url", "https://example.com/pkgs/");
        THEN("It is rejected") {
            REQUIRE_THAT(
                rejection(attributes), Catch::Matchers::ContainsSubstring("archive file"));
        }
    }
    GIVEN("A blank target version") {
        auto attributes = valid;
        attributes.put("target_version", "   ");
        THEN("It is rejected") {
            REQUIRE_FALSE(rejection(attributes).empty());
        }
    }
    GIVEN("A numeric target version") {
        auto attributes = valid;
        attributes.put("target_version", 1.42);
        THEN("It is rejected as not a string") {
            REQUIRE_THAT(
                rejection(attributes),
                Catch::Matchers::ContainsSubstring("target_version must be a non-empty string"));
        }
    }
    GIVEN("A flag that is not boolean") {
        auto attributes = valid;
        attributes.put("auto_install", "yes");
        THEN("It is rejected") {
            REQUIRE_THAT(
                rejection(attributes),
                Catch::Matchers::ContainsSubstring("auto_install must be a boolean"));
        }
    }
    GIVEN("A check interval that is not positive") {
        auto attributes = valid;
        attributes.put("check_interval", 0);
        THEN("It is rejected") {
            REQUIRE_THAT(
                rejection(attributes),
                Catch::Matchers::ContainsSubstring("check_interval must be a positive number"));
        }
        attributes.put("check_interval", "60");
        THEN("A string is not a number") {
            REQUIRE_THAT(
                rejection(attributes),
                Catch::Matchers::ContainsSubstring("check_interval must be a number"));
        }
    }
    GIVEN("Durations that are not finite") {
        auto attributes = valid;
        auto yaml = conv::YamlReader::readString("check_interval: .nan\ncommand_timeout: .inf\n");
        attributes.put("check_interval", yaml.get("check_interval"));
        attributes.put("command_timeout", yaml.get("command_timeout"));
        attributes.put("service_settle_seconds", -std::numeric_limits<double>::infinity());
        THEN("Each is rejected") {
            auto reason = rejection(attributes);
            REQUIRE_THAT(
                reason, Catch::Matchers::ContainsSubstring("check_interval must be a finite number"));
            REQUIRE_THAT(
                reason, Catch::Matchers::ContainsSubstring("command_timeout must be a finite number"));
            REQUIRE_THAT(
                reason,
                Catch::Matchers::ContainsSubstring("service_settle_seconds must be a finite number"));
        }
    }
    GIVEN("A command timeout beyond the supported range") {
        auto attributes = valid;
        attributes.put("command_timeout", 1e13);
        THEN("It is rejected") {
            REQUIRE_THAT(
                rejection(attributes),
                Catch::Matchers::ContainsSubstring("command_timeout must not exceed one year"));
        }
    }
    GIVEN("A command timeout shorter than a millisecond") {
        auto attributes = valid;
        attributes.put("command_timeout", 0.0001);
        THEN("It is rejected") {
            REQUIRE_THAT(
                rejection(attributes),
                Catch::Matchers::ContainsSubstring("command_timeout must be at least one millisecond"));
        }
    }
    GIVEN("The largest accepted command timeout") {
        auto attributes = valid;
        attributes.put("command_timeout", backport::BackportConfig::MAX_SECONDS);
        THEN("It is kept in milliseconds") {
            auto config = backport::ConfigValidator::validate(attributes, {"/home/tester"});
            REQUIRE(config.commandTimeout == std::chrono::milliseconds{31536000000LL});
        }
    }
    GIVEN("Checksum verification without a checksum") {
        auto attributes = valid;
        attributes.put("verify_checksum", true);
        THEN("It is rejected") {
            REQUIRE_THAT(
                rejection(attributes), Catch::Matchers::ContainsSubstring("expected_checksum"));
        }
    }
    GIVEN("A work directory that escapes the base directory") {
        auto attributes = valid;
        attributes.put("work_dir", "../outside");
        THEN("It is rejected") {
            REQUIRE_THAT(rejection(attributes), Catch::Matchers::ContainsSubstring("work_dir"));
        }
    }
}

SCENARIO("Configuration state is replaced as a whole", "[config]") {
    backport::ConfigState state;
    THEN("It starts unconfigured") {
        REQUIRE_FALSE(state.isConfigured());
    }
    GIVEN("An applied configuration") {
        auto config = std::make_shared<const backport::BackportConfig>();
        state.apply(config);
        REQUIRE(state.isConfigured());
        WHEN("A rejection follows") {
            state.reject("backport_url is required");
            THEN("The state is unconfigured with the reason kept") {
                REQUIRE_FALSE(state.isConfigured());
                REQUIRE(state.rejection() == "backport_url is required");
            }
        }
    }
}

SCENARIO("The shipped sample configuration is valid", "[config]") {
    GIVEN("The sample YAML file") {
        auto root = conv::YamlReader::read(test::samples() / "nm_backport.yaml");
        auto attributes = root.get("component").getStruct()->get("attributes").getStruct();
        WHEN("Its attributes are validated") {
            auto config = backport::ConfigValidator::validate(*attributes, {"/home/tester"});
            THEN("The documented values are taken") {
                REQUIRE(config.targetVersion == "1.42.8");
                REQUIRE(config.archiveName == "jammy-nm-backports.tar");
                REQUIRE(config.workDir == std::filesystem::path{"/home/tester/nm-backport"});
                REQUIRE(config.checkInterval.count() == 60.0);
                REQUIRE(config.commandTimeout == std::chrono::milliseconds{600000});
            }
        }
    }
}

// NOLINTEND
