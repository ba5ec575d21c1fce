#include "util/paths.hpp"

#include "support/temp_dir.hpp"
#include "util/config.hpp"

#include <catch2/catch_test_macros.hpp>
#include <filesystem>

using scape::test::EnvVarGuard;
using scape::test::TempDir;

TEST_CASE("paths: merge_overrides prefers high", "[paths]") {
    scape::util::PathOverrides low{};
    low.state_dir = "/low/state";
    low.runtime_dir = "/low/run";

    scape::util::PathOverrides high{};
    high.state_dir = "/high/state";

    auto merged = scape::util::merge_overrides({.high = high, .low = low});
    REQUIRE(merged.state_dir == std::filesystem::path("/high/state"));
    REQUIRE(merged.runtime_dir == std::filesystem::path("/low/run"));
    REQUIRE(merged.config_dir.empty());
}

TEST_CASE("paths: overrides_from_config copies the paths section", "[paths]") {
    scape::Config config = scape::default_config();
    config.paths.config_dir = "/cfg";
    config.paths.runtime_dir = "/run/user/1000";

    auto overrides = scape::util::overrides_from_config(config);
    REQUIRE(overrides.config_dir == std::filesystem::path("/cfg"));
    REQUIRE(overrides.state_dir.empty());
    REQUIRE(overrides.runtime_dir == std::filesystem::path("/run/user/1000"));
}

TEST_CASE("paths: resolve_config_dir uses override", "[paths]") {
    scape::util::PathOverrides overrides{};
    overrides.config_dir = "/tmp/scape-test-config";
    auto result = scape::util::resolve_config_dir(overrides);
    REQUIRE(result.has_value());
    REQUIRE(result.value() == std::filesystem::path("/tmp/scape-test-config"));
}

TEST_CASE("paths: resolve_config_dir uses XDG_CONFIG_HOME", "[paths]") {
    TempDir tmp("scape_paths");
    auto xdg_config = (tmp.path() / "xdg_config").string();

    EnvVarGuard home("HOME", (tmp.path() / "home").string());
    EnvVarGuard xdg("XDG_CONFIG_HOME", xdg_config);

    auto result = scape::util::resolve_config_dir({});
    REQUIRE(result.has_value());
    REQUIRE(result.value() == std::filesystem::path(xdg_config) / "scape");
}

TEST_CASE("paths: resolve_config_dir falls back to HOME", "[paths]") {
    TempDir tmp("scape_paths");
    EnvVarGuard home("HOME", (tmp.path() / "home").string());
    EnvVarGuard xdg("XDG_CONFIG_HOME", std::nullopt);

    auto result = scape::util::resolve_config_dir({});
    REQUIRE(result.has_value());
    REQUIRE(result.value() == (tmp.path() / "home" / ".config" / "scape").lexically_normal());
}

TEST_CASE("paths: resolve_app_dirs resolves XDG roots", "[paths]") {
    TempDir tmp("scape_paths");
    const auto xdg_config = tmp.path() / "xdg_config";
    const auto xdg_state = tmp.path() / "xdg_state";
    const auto xdg_runtime = tmp.path() / "xdg_runtime";

    EnvVarGuard home("HOME", (tmp.path() / "home").string());
    EnvVarGuard config_home("XDG_CONFIG_HOME", xdg_config.string());
    EnvVarGuard state_home("XDG_STATE_HOME", xdg_state.string());
    EnvVarGuard runtime_dir("XDG_RUNTIME_DIR", xdg_runtime.string());

    auto result = scape::util::resolve_app_dirs({});
    REQUIRE(result.has_value());

    const auto& dirs = result.value();
    REQUIRE(dirs.config_dir == (xdg_config / "scape").lexically_normal());
    REQUIRE(dirs.state_dir == (xdg_state / "scape").lexically_normal());
    REQUIRE(dirs.runtime_dir == xdg_runtime.lexically_normal());
}

TEST_CASE("paths: resolve_app_dirs ignores relative XDG variables", "[paths]") {
    TempDir tmp("scape_paths");
    EnvVarGuard home("HOME", (tmp.path() / "home").string());
    EnvVarGuard state_home("XDG_STATE_HOME", "relative/state");

    auto result = scape::util::resolve_app_dirs({});
    REQUIRE(result.has_value());
    REQUIRE(result->state_dir ==
            (tmp.path() / "home" / ".local" / "state" / "scape").lexically_normal());
}

TEST_CASE("paths: resolve_app_dirs rejects relative overrides", "[paths]") {
    scape::util::PathOverrides overrides{};
    overrides.state_dir = "relative/state";
    auto result = scape::util::resolve_app_dirs(overrides);
    REQUIRE(!result.has_value());
    REQUIRE(result.error().code == scape::ErrorCode::invalid_config);
}

TEST_CASE("paths: join helpers normalize", "[paths]") {
    scape::util::AppDirs dirs{
        .config_dir = "/tmp/scape_cfg",
        .state_dir = "/tmp/scape_state",
        .runtime_dir = "/tmp/scape_run",
    };

    REQUIRE(scape::util::config_path(dirs, "x/./y") ==
            std::filesystem::path("/tmp/scape_cfg/x/y"));
    REQUIRE(scape::util::state_path(dirs, "a/../layout.bin") ==
            std::filesystem::path("/tmp/scape_state/layout.bin"));
    REQUIRE(scape::util::runtime_path(dirs, "scape-wayland-1.sock") ==
            std::filesystem::path("/tmp/scape_run/scape-wayland-1.sock"));
}
