#include "util/config.hpp"

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

using namespace scape;

namespace {

auto data_path(const char* name) -> std::string {
    return std::string(SCAPE_SOURCE_DIR) + "/tests/util/test_data/" + name;
}

} // namespace

TEST_CASE("default_config returns expected values", "[config]") {
    auto config = default_config();

    SECTION("Backend defaults") {
        REQUIRE(config.backend.kind == BackendKind::automatic);
        REQUIRE(config.script.path.empty());
    }

    SECTION("Input defaults") {
        REQUIRE(config.input.focus_mode == FocusMode::follows_pointer);
        REQUIRE_FALSE(config.input.raise_on_focus);
        REQUIRE(config.input.keyboard_layout == "us");
    }

    SECTION("Frame pacing defaults") {
        REQUIRE(config.render.frame_retry_initial_ms == 16);
        REQUIRE(config.render.frame_retry_max_ms == 2000);
    }

    SECTION("Policy defaults") {
        REQUIRE(config.policy.tick_interval_ms == 0);
        REQUIRE(config.policy.reload_debounce_ms == 200);
        REQUIRE(config.policy.instruction_limit == 10'000'000);
    }

    SECTION("Logging defaults") {
        REQUIRE(config.logging.level == "info");
        REQUIRE(config.logging.file.empty());
    }
}

TEST_CASE("load_config handles missing file", "[config]") {
    const std::string nonexistent_file = data_path("nonexistent.toml");
    auto result = load_config(nonexistent_file);

    REQUIRE(!result.has_value());
    REQUIRE(result.error().code == ErrorCode::file_not_found);
    REQUIRE(result.error().message.find("Configuration file not found") != std::string::npos);
    REQUIRE(result.error().message.find(nonexistent_file) != std::string::npos);
}

TEST_CASE("load_config parses valid configuration", "[config]") {
    auto result = load_config(data_path("valid_config.toml"));

    REQUIRE(result.has_value());
    auto config = result.value();

    SECTION("Backend and script") {
        REQUIRE(config.backend.kind == BackendKind::headless);
        REQUIRE(config.script.path == "/etc/scape/init.lua");
    }

    SECTION("Input section") {
        REQUIRE(config.input.focus_mode == FocusMode::click);
        REQUIRE(config.input.raise_on_focus);
        REQUIRE(config.input.keyboard_layout == "de");
    }

    SECTION("Render section") {
        REQUIRE(config.render.frame_retry_initial_ms == 8);
        REQUIRE(config.render.frame_retry_max_ms == 500);
    }

    SECTION("Policy and limits") {
        REQUIRE(config.policy.tick_interval_ms == 1000);
        REQUIRE(config.policy.reload_debounce_ms == 50);
        REQUIRE(config.policy.instruction_limit == 200000);
        REQUIRE(config.limits.max_clients == 16);
        REQUIRE(config.limits.max_surfaces == 256);
    }

    SECTION("Screencast section") {
        REQUIRE(config.screencast.policy == ScreencastPolicy::periodic);
        REQUIRE(config.screencast.interval_ms == 250);
    }

    SECTION("Logging section") {
        REQUIRE(config.logging.level == "debug");
        REQUIRE(config.logging.file == "test.log");
    }
}

TEST_CASE("load_config uses defaults for partial configuration", "[config]") {
    auto result = load_config(data_path("partial_config.toml"));

    REQUIRE(result.has_value());
    auto config = result.value();

    REQUIRE(config.input.raise_on_focus);
    REQUIRE(config.input.focus_mode == FocusMode::follows_pointer);
    REQUIRE(config.backend.kind == BackendKind::automatic);
    REQUIRE(config.logging.level == "info");
}

TEST_CASE("load_config validates backend values", "[config]") {
    auto result = load_config(data_path("invalid_config.toml"));

    REQUIRE(!result.has_value());
    REQUIRE(result.error().code == ErrorCode::invalid_config);
    REQUIRE(result.error().message.find("Invalid backend kind") != std::string::npos);
    REQUIRE(result.error().message.find("invalid_backend") != std::string::npos);
}

TEST_CASE("load_config handles TOML parse errors", "[config]") {
    auto result = load_config(data_path("malformed_config.toml"));

    REQUIRE(!result.has_value());
    REQUIRE(result.error().code == ErrorCode::parse_error);
    REQUIRE(result.error().message.find("Failed to parse TOML") != std::string::npos);
}

TEST_CASE("parse_config validates numeric ranges", "[config]") {
    SECTION("Retry interval below minimum") {
        auto result = parse_config("[render]\nframe_retry_initial_ms = 0\n");
        REQUIRE(!result);
        REQUIRE(result.error().code == ErrorCode::invalid_config);
        REQUIRE(result.error().message.find("render.frame_retry_initial_ms") !=
                std::string::npos);
    }

    SECTION("Retry ceiling below initial interval") {
        auto result =
            parse_config("[render]\nframe_retry_initial_ms = 100\nframe_retry_max_ms = 50\n");
        REQUIRE(!result);
        REQUIRE(result.error().code == ErrorCode::invalid_config);
    }

    SECTION("Instruction limit too small") {
        auto result = parse_config("[policy]\ninstruction_limit = 10\n");
        REQUIRE(!result);
        REQUIRE(result.error().message.find("policy.instruction_limit") != std::string::npos);
    }

    SECTION("Zero tick interval disables the tick hook") {
        auto result = parse_config("[policy]\ntick_interval_ms = 0\n");
        REQUIRE(result);
        REQUIRE(result->policy.tick_interval_ms == 0);
    }
}

TEST_CASE("parse_config rejects wrong value types", "[config]") {
    auto result = parse_config("[input]\nraise_on_focus = \"yes\"\n");

    REQUIRE(!result);
    REQUIRE(result.error().code == ErrorCode::invalid_config);
    REQUIRE(result.error().message.find("Invalid value type") != std::string::npos);
}

TEST_CASE("parse_config validates enumerations", "[config]") {
    SECTION("Focus mode") {
        auto result = parse_config("[input]\nfocus_mode = \"sloppy\"\n");
        REQUIRE(!result);
        REQUIRE(result.error().message.find("sloppy") != std::string::npos);
    }

    SECTION("Screencast policy") {
        auto result = parse_config("[screencast]\npolicy = \"always\"\n");
        REQUIRE(!result);
        REQUIRE(result.error().message.find("best_effort or periodic") != std::string::npos);
    }

    SECTION("Log level") {
        auto result = parse_config("[logging]\nlevel = \"invalid_level\"\n");
        REQUIRE(!result);
        REQUIRE(result.error().message.find("trace, debug, info, warn, error, critical") !=
                std::string::npos);
    }
}

TEST_CASE("parse_config accepts all valid log levels", "[config]") {
    const std::vector<std::string> valid_levels = {"trace", "debug", "info",
                                                   "warn",  "error", "critical"};
    for (const auto& level : valid_levels) {
        auto result = parse_config("[logging]\nlevel = \"" + level + "\"\n");
        REQUIRE(result.has_value());
        REQUIRE(result->logging.level == level);
    }
}

TEST_CASE("parse_config reads path overrides", "[config]") {
    auto result = parse_config("[paths]\nconfig_dir = \"/tmp/cfg\"\nstate_dir = \"/tmp/state\"\n"
                               "runtime_dir = \"/tmp/run\"\n[snapshot]\npath = \"/tmp/l.bin\"\n");

    REQUIRE(result);
    REQUIRE(result->paths.config_dir == "/tmp/cfg");
    REQUIRE(result->paths.state_dir == "/tmp/state");
    REQUIRE(result->paths.runtime_dir == "/tmp/run");
    REQUIRE(result->snapshot.path == "/tmp/l.bin");
}
