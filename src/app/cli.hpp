#pragma once

#include <cstdint>
#include <filesystem>
#include <ipc/control_protocol.hpp>
#include <optional>
#include <string>
#include <util/error.hpp>

namespace scape::app {

struct CliOptions {
    /// Empty means `<config_dir>/scape.toml`.
    std::filesystem::path config_path;
    /// Overrides `script.path` from the config file.
    std::filesystem::path script_path;
    bool headless = false;
    int headless_outputs = 1;
    bool no_xwayland = false;
    std::string log_file;
    std::string log_level;
    /// Set for `scape ctl ...`; the process sends one request and exits.
    std::optional<ipc::ControlRequest> control;
    /// Control socket to talk to; empty derives it from the environment.
    std::filesystem::path socket_path;
};

enum class CliAction : std::uint8_t {
    run,
    control,
    exit_ok,
};

struct CliParseOutcome {
    CliAction action = CliAction::run;
    CliOptions options;
};

using CliResult = Result<CliParseOutcome>;

[[nodiscard]] auto parse_cli(int argc, char** argv) -> CliResult;

} // namespace scape::app
