#include "paths.hpp"

#include "config.hpp"
#include "profiling.hpp"

#include <cstdlib>
#include <optional>
#include <string>

namespace scape::util {

namespace {

auto is_absolute_or_empty(const std::filesystem::path& path) -> bool {
    return path.empty() || path.is_absolute();
}

auto get_env(std::string_view key) -> std::optional<std::string> {
    const char* value = std::getenv(std::string(key).c_str());
    if (value == nullptr || value[0] == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

auto get_env_path(std::string_view key) -> std::optional<std::filesystem::path> {
    auto value = get_env(key);
    if (!value) {
        return std::nullopt;
    }
    std::filesystem::path p(*value);
    if (!p.is_absolute()) {
        return std::nullopt;
    }
    return p;
}

auto resolve_xdg_root(std::string_view xdg_key, const std::filesystem::path& home_suffix)
    -> std::optional<std::filesystem::path> {
    if (auto env = get_env_path(xdg_key)) {
        return env;
    }
    auto home = get_env_path("HOME");
    if (!home) {
        return std::nullopt;
    }
    return *home / home_suffix;
}

auto resolve_runtime_root() -> std::filesystem::path {
    if (auto env = get_env_path("XDG_RUNTIME_DIR")) {
        return *env;
    }
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return "/tmp";
    }
    return tmp;
}

} // namespace

auto merge_overrides(const OverrideMerge& merge) -> PathOverrides {
    PathOverrides merged = merge.low;

    if (!merge.high.config_dir.empty()) {
        merged.config_dir = merge.high.config_dir;
    }
    if (!merge.high.state_dir.empty()) {
        merged.state_dir = merge.high.state_dir;
    }
    if (!merge.high.runtime_dir.empty()) {
        merged.runtime_dir = merge.high.runtime_dir;
    }

    return merged;
}

auto overrides_from_config(const Config& config) -> PathOverrides {
    PathOverrides overrides{};
    overrides.config_dir = config.paths.config_dir;
    overrides.state_dir = config.paths.state_dir;
    overrides.runtime_dir = config.paths.runtime_dir;
    return overrides;
}

auto resolve_config_dir(const PathOverrides& overrides) -> Result<std::filesystem::path> {
    SCAPE_PROFILE_FUNCTION();
    if (!is_absolute_or_empty(overrides.config_dir)) {
        return make_error<std::filesystem::path>(ErrorCode::invalid_config,
                                                 "paths.config_dir must be an absolute path");
    }

    if (!overrides.config_dir.empty()) {
        return overrides.config_dir.lexically_normal();
    }

    auto root = resolve_xdg_root("XDG_CONFIG_HOME", ".config");
    if (!root) {
        return make_error<std::filesystem::path>(ErrorCode::invalid_data,
                                                 "Unable to resolve XDG config directory");
    }

    return (*root / "scape").lexically_normal();
}

auto resolve_app_dirs(const PathOverrides& overrides) -> Result<AppDirs> {
    SCAPE_PROFILE_FUNCTION();
    if (!is_absolute_or_empty(overrides.config_dir) ||
        !is_absolute_or_empty(overrides.state_dir) ||
        !is_absolute_or_empty(overrides.runtime_dir)) {
        return make_error<AppDirs>(ErrorCode::invalid_config,
                                   "paths.* overrides must be absolute paths");
    }

    auto config_dir = SCAPE_TRY(resolve_config_dir(overrides));

    std::filesystem::path state_dir;
    if (!overrides.state_dir.empty()) {
        state_dir = overrides.state_dir.lexically_normal();
    } else {
        auto root = resolve_xdg_root("XDG_STATE_HOME", std::filesystem::path(".local") / "state");
        if (!root) {
            return make_error<AppDirs>(ErrorCode::invalid_data,
                                       "Unable to resolve XDG state directory");
        }
        state_dir = (*root / "scape").lexically_normal();
    }

    std::filesystem::path runtime_dir;
    if (!overrides.runtime_dir.empty()) {
        runtime_dir = overrides.runtime_dir.lexically_normal();
    } else {
        runtime_dir = resolve_runtime_root().lexically_normal();
    }

    return AppDirs{
        .config_dir = std::move(config_dir),
        .state_dir = std::move(state_dir),
        .runtime_dir = std::move(runtime_dir),
    };
}

auto config_path(const AppDirs& dirs, const std::filesystem::path& rel) -> std::filesystem::path {
    return (dirs.config_dir / rel).lexically_normal();
}

auto state_path(const AppDirs& dirs, const std::filesystem::path& rel) -> std::filesystem::path {
    return (dirs.state_dir / rel).lexically_normal();
}

auto runtime_path(const AppDirs& dirs, const std::filesystem::path& rel) -> std::filesystem::path {
    return (dirs.runtime_dir / rel).lexically_normal();
}

} // namespace scape::util
