#pragma once

#include "error.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace scape {

enum class BackendKind : uint8_t {
    automatic,
    headless,
};

enum class FocusMode : uint8_t {
    follows_pointer,
    click,
};

enum class ScreencastPolicy : uint8_t {
    best_effort,
    periodic,
};

[[nodiscard]] constexpr auto to_string(BackendKind kind) -> const char* {
    switch (kind) {
    case BackendKind::automatic:
        return "auto";
    case BackendKind::headless:
        return "headless";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto to_string(FocusMode mode) -> const char* {
    switch (mode) {
    case FocusMode::follows_pointer:
        return "follows_pointer";
    case FocusMode::click:
        return "click";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto to_string(ScreencastPolicy policy) -> const char* {
    switch (policy) {
    case ScreencastPolicy::best_effort:
        return "best_effort";
    case ScreencastPolicy::periodic:
        return "periodic";
    }
    return "unknown";
}

struct Config {
    struct Backend {
        BackendKind kind = BackendKind::automatic;
    } backend;

    struct Script {
        // Empty means <config_dir>/init.lua
        std::string path;
    } script;

    struct Input {
        FocusMode focus_mode = FocusMode::follows_pointer;
        bool raise_on_focus = false;
        std::string keyboard_layout = "us";
    } input;

    struct Render {
        uint32_t frame_retry_initial_ms = 16;
        uint32_t frame_retry_max_ms = 2000;
    } render;

    struct Policy {
        uint32_t tick_interval_ms = 0; // 0 disables on_tick
        uint32_t reload_debounce_ms = 200;
        uint64_t instruction_limit = 10'000'000;
    } policy;

    struct Limits {
        uint32_t max_clients = 128;
        uint32_t max_surfaces = 4096;
    } limits;

    struct Screencast {
        ScreencastPolicy policy = ScreencastPolicy::best_effort;
        uint32_t interval_ms = 100;
    } screencast;

    struct Snapshot {
        // Empty means <state_dir>/layout.bin
        std::string path;
    } snapshot;

    struct Paths {
        std::string config_dir;
        std::string state_dir;
        std::string runtime_dir;
    } paths;

    struct Logging {
        std::string level = "info";
        std::string file;
    } logging;
};

[[nodiscard]] auto load_config(const std::filesystem::path& path) -> Result<Config>;
[[nodiscard]] auto parse_config(std::string_view text) -> Result<Config>;
[[nodiscard]] auto default_config() -> Config;

} // namespace scape
