#pragma once

#include "error.hpp"

#include <filesystem>

namespace scape {
struct Config;
}

namespace scape::util {

/**
 * @brief Stores optional directory root overrides for path resolution.
 *
 * Leave fields empty to use XDG/environment defaults. Non-empty overrides must be absolute paths.
 */
struct PathOverrides {
    std::filesystem::path config_dir;
    std::filesystem::path state_dir;
    std::filesystem::path runtime_dir;
};

/**
 * @brief Holds resolved directory roots for compositor filesystem operations.
 */
struct AppDirs {
    std::filesystem::path config_dir;
    std::filesystem::path state_dir;
    std::filesystem::path runtime_dir;
};

/**
 * @brief Groups override inputs to avoid ambiguous parameter ordering.
 */
struct OverrideMerge {
    const PathOverrides& high;
    const PathOverrides& low;
};

/**
 * @brief Merges override sets, preferring non-empty fields from @p merge.high.
 *
 * @param merge The override sets to combine.
 * @return The merged overrides.
 */
[[nodiscard]] auto merge_overrides(const OverrideMerge& merge) -> PathOverrides;

/**
 * @brief Extracts path overrides from a parsed configuration.
 *
 * @param config The parsed compositor configuration.
 * @return The overrides defined by the configuration.
 */
[[nodiscard]] auto overrides_from_config(const Config& config) -> PathOverrides;

/**
 * @brief Resolves the config directory (`$XDG_CONFIG_HOME/scape`).
 *
 * @param overrides The optional config directory override.
 * @return The resolved config directory.
 */
[[nodiscard]] auto resolve_config_dir(const PathOverrides& overrides)
    -> Result<std::filesystem::path>;

/**
 * @brief Resolves directory roots using overrides and XDG defaults.
 *
 * @param overrides The optional directory root overrides.
 * @return The resolved directory roots.
 */
[[nodiscard]] auto resolve_app_dirs(const PathOverrides& overrides) -> Result<AppDirs>;

/**
 * @brief Joins @p rel under the resolved config directory.
 */
[[nodiscard]] auto config_path(const AppDirs& dirs, const std::filesystem::path& rel)
    -> std::filesystem::path;

/**
 * @brief Joins @p rel under the resolved state directory.
 */
[[nodiscard]] auto state_path(const AppDirs& dirs, const std::filesystem::path& rel)
    -> std::filesystem::path;

/**
 * @brief Joins @p rel under the resolved runtime directory.
 */
[[nodiscard]] auto runtime_path(const AppDirs& dirs, const std::filesystem::path& rel)
    -> std::filesystem::path;

} // namespace scape::util
