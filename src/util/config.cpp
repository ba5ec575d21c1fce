#include "config.hpp"

#include "logging.hpp"

#include <sstream>
#include <toml.hpp>

namespace scape {

namespace {

auto read_bounded(const toml::value& table, const char* key, int64_t min, int64_t max,
                  const char* section) -> Result<int64_t> {
    auto value = toml::find<int64_t>(table, key);
    if (value < min || value > max) {
        return make_error<int64_t>(ErrorCode::invalid_config,
                                   std::string("Invalid ") + section + "." + key + ": " +
                                       std::to_string(value) + " (expected: " +
                                       std::to_string(min) + "-" + std::to_string(max) + ")");
    }
    return value;
}

auto apply_sections(const toml::value& data) -> Result<Config> {
    Config config = default_config();

    if (data.contains("backend")) {
        const auto backend = toml::find(data, "backend");
        if (backend.contains("kind")) {
            auto kind = toml::find<std::string>(backend, "kind");
            if (kind == "auto") {
                config.backend.kind = BackendKind::automatic;
            } else if (kind == "headless") {
                config.backend.kind = BackendKind::headless;
            } else {
                return make_error<Config>(ErrorCode::invalid_config,
                                          "Invalid backend kind: " + kind +
                                              " (expected: auto or headless)");
            }
        }
    }

    if (data.contains("script")) {
        const auto script = toml::find(data, "script");
        if (script.contains("path")) {
            config.script.path = toml::find<std::string>(script, "path");
        }
    }

    if (data.contains("input")) {
        const auto input = toml::find(data, "input");
        if (input.contains("focus_mode")) {
            auto mode = toml::find<std::string>(input, "focus_mode");
            if (mode == "follows_pointer") {
                config.input.focus_mode = FocusMode::follows_pointer;
            } else if (mode == "click") {
                config.input.focus_mode = FocusMode::click;
            } else {
                return make_error<Config>(ErrorCode::invalid_config,
                                          "Invalid focus_mode: " + mode +
                                              " (expected: follows_pointer or click)");
            }
        }
        if (input.contains("raise_on_focus")) {
            config.input.raise_on_focus = toml::find<bool>(input, "raise_on_focus");
        }
        if (input.contains("keyboard_layout")) {
            config.input.keyboard_layout = toml::find<std::string>(input, "keyboard_layout");
        }
    }

    if (data.contains("render")) {
        const auto render = toml::find(data, "render");
        if (render.contains("frame_retry_initial_ms")) {
            config.render.frame_retry_initial_ms = static_cast<uint32_t>(
                SCAPE_TRY(read_bounded(render, "frame_retry_initial_ms", 1, 10'000, "render")));
        }
        if (render.contains("frame_retry_max_ms")) {
            config.render.frame_retry_max_ms = static_cast<uint32_t>(
                SCAPE_TRY(read_bounded(render, "frame_retry_max_ms", 1, 60'000, "render")));
        }
        if (config.render.frame_retry_max_ms < config.render.frame_retry_initial_ms) {
            return make_error<Config>(
                ErrorCode::invalid_config,
                "render.frame_retry_max_ms must not be below render.frame_retry_initial_ms");
        }
    }

    if (data.contains("policy")) {
        const auto policy = toml::find(data, "policy");
        if (policy.contains("tick_interval_ms")) {
            config.policy.tick_interval_ms = static_cast<uint32_t>(
                SCAPE_TRY(read_bounded(policy, "tick_interval_ms", 0, 3'600'000, "policy")));
        }
        if (policy.contains("reload_debounce_ms")) {
            config.policy.reload_debounce_ms = static_cast<uint32_t>(
                SCAPE_TRY(read_bounded(policy, "reload_debounce_ms", 0, 10'000, "policy")));
        }
        if (policy.contains("instruction_limit")) {
            config.policy.instruction_limit = static_cast<uint64_t>(SCAPE_TRY(
                read_bounded(policy, "instruction_limit", 1000, 1'000'000'000, "policy")));
        }
    }

    if (data.contains("limits")) {
        const auto limits = toml::find(data, "limits");
        if (limits.contains("max_clients")) {
            config.limits.max_clients = static_cast<uint32_t>(
                SCAPE_TRY(read_bounded(limits, "max_clients", 1, 65'536, "limits")));
        }
        if (limits.contains("max_surfaces")) {
            config.limits.max_surfaces = static_cast<uint32_t>(
                SCAPE_TRY(read_bounded(limits, "max_surfaces", 1, 1'048'576, "limits")));
        }
    }

    if (data.contains("screencast")) {
        const auto screencast = toml::find(data, "screencast");
        if (screencast.contains("policy")) {
            auto policy = toml::find<std::string>(screencast, "policy");
            if (policy == "best_effort") {
                config.screencast.policy = ScreencastPolicy::best_effort;
            } else if (policy == "periodic") {
                config.screencast.policy = ScreencastPolicy::periodic;
            } else {
                return make_error<Config>(ErrorCode::invalid_config,
                                          "Invalid screencast policy: " + policy +
                                              " (expected: best_effort or periodic)");
            }
        }
        if (screencast.contains("interval_ms")) {
            config.screencast.interval_ms = static_cast<uint32_t>(
                SCAPE_TRY(read_bounded(screencast, "interval_ms", 1, 60'000, "screencast")));
        }
    }

    if (data.contains("snapshot")) {
        const auto snapshot = toml::find(data, "snapshot");
        if (snapshot.contains("path")) {
            config.snapshot.path = toml::find<std::string>(snapshot, "path");
        }
    }

    if (data.contains("paths")) {
        const auto paths = toml::find(data, "paths");
        if (paths.contains("config_dir")) {
            config.paths.config_dir = toml::find<std::string>(paths, "config_dir");
        }
        if (paths.contains("state_dir")) {
            config.paths.state_dir = toml::find<std::string>(paths, "state_dir");
        }
        if (paths.contains("runtime_dir")) {
            config.paths.runtime_dir = toml::find<std::string>(paths, "runtime_dir");
        }
    }

    if (data.contains("logging")) {
        const auto logging = toml::find(data, "logging");
        if (logging.contains("level")) {
            config.logging.level = toml::find<std::string>(logging, "level");
            if (!parse_log_level(config.logging.level)) {
                return make_error<Config>(
                    ErrorCode::invalid_config,
                    "Invalid log level: " + config.logging.level +
                        " (expected: trace, debug, info, warn, error, critical)");
            }
        }
        if (logging.contains("file")) {
            config.logging.file = toml::find<std::string>(logging, "file");
        }
    }

    return config;
}

auto apply_checked(const toml::value& data) -> Result<Config> {
    try {
        return apply_sections(data);
    } catch (const toml::type_error& e) {
        return make_error<Config>(ErrorCode::invalid_config,
                                  "Invalid value type: " + std::string(e.what()));
    } catch (const std::out_of_range& e) {
        return make_error<Config>(ErrorCode::invalid_config,
                                  "Missing value: " + std::string(e.what()));
    }
}

} // namespace

auto default_config() -> Config {
    return Config{};
}

auto load_config(const std::filesystem::path& path) -> Result<Config> {
    if (!std::filesystem::exists(path)) {
        return make_error<Config>(ErrorCode::file_not_found,
                                  "Configuration file not found: " + path.string());
    }

    toml::value data;
    try {
        data = toml::parse(path);
    } catch (const std::exception& e) {
        return make_error<Config>(ErrorCode::parse_error,
                                  "Failed to parse TOML: " + std::string(e.what()));
    }

    return apply_checked(data);
}

auto parse_config(std::string_view text) -> Result<Config> {
    toml::value data;
    try {
        std::istringstream stream{std::string(text)};
        data = toml::parse(stream, "<inline>");
    } catch (const std::exception& e) {
        return make_error<Config>(ErrorCode::parse_error,
                                  "Failed to parse TOML: " + std::string(e.what()));
    }

    return apply_checked(data);
}

} // namespace scape
