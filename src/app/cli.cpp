#include "app/cli.hpp"

#include <CLI/CLI.hpp>
#include <util/logging.hpp>
#include <util/profiling.hpp>
#include <vector>

namespace scape::app {
namespace {

struct ControlArgs {
    std::string command;
    std::string argument;
};

auto register_options(CLI::App& app, CliOptions& options) -> void {
    app.add_option("-c,--config", options.config_path, "Path to configuration file");
    app.add_option("-s,--script", options.script_path, "Policy script (overrides script.path)")
        ->check(CLI::ExistingFile);
    app.add_flag("--headless", options.headless, "Use the headless backend");
    app.add_option("--outputs", options.headless_outputs, "Outputs created in headless mode")
        ->check(CLI::Range(1, 16));
    app.add_flag("--no-xwayland", options.no_xwayland, "Do not start XWayland");
    app.add_option("-l,--log-file", options.log_file, "Also write the log to this file");
    app.add_option("--log-level", options.log_level, "Override logging.level")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical"}));
}

auto register_control(CLI::App& app, ControlArgs& args, CliOptions& options) -> CLI::App* {
    auto* ctl = app.add_subcommand("ctl", "Send a command to a running compositor");
    std::vector<std::string> names;
    for (auto command : {ipc::ControlCommand::list_outputs, ipc::ControlCommand::list_windows,
                         ipc::ControlCommand::focus_window, ipc::ControlCommand::close_window,
                         ipc::ControlCommand::reload_config, ipc::ControlCommand::quit}) {
        names.emplace_back(ipc::to_string(command));
    }
    ctl->add_option("command", args.command, "Control command")
        ->required()
        ->check(CLI::IsMember(names));
    ctl->add_option("argument", args.argument, "Window id or app id for focus/close");
    ctl->add_option("--socket", options.socket_path, "Control socket path");
    return ctl;
}

[[nodiscard]] auto build_request(const ControlArgs& args) -> Result<ipc::ControlRequest> {
    SCAPE_PROFILE_FUNCTION();
    auto command = ipc::parse_command(args.command);
    if (!command) {
        return make_error<ipc::ControlRequest>(ErrorCode::parse_error,
                                               "unknown control command '" + args.command + "'");
    }
    bool needs_argument = *command == ipc::ControlCommand::focus_window ||
                          *command == ipc::ControlCommand::close_window;
    if (needs_argument && args.argument.empty()) {
        return make_error<ipc::ControlRequest>(ErrorCode::parse_error,
                                               args.command + " needs a window id or app id");
    }
    if (!needs_argument && !args.argument.empty()) {
        return make_error<ipc::ControlRequest>(ErrorCode::parse_error,
                                               args.command + " takes no argument");
    }
    return ipc::ControlRequest{.command = *command, .argument = args.argument};
}

} // namespace

auto parse_cli(int argc, char** argv) -> CliResult {
    SCAPE_PROFILE_FUNCTION();
    CLI::App app{SCAPE_PROJECT_NAME " - scriptable Wayland compositor"};
    app.set_version_flag("--version,-v", SCAPE_PROJECT_NAME " v" SCAPE_VERSION);
    app.footer(R"(Usage:
  scape [options]
  scape ctl <command> [argument]

Control commands: list-outputs, list-windows, focus-window <id|app_id>,
close-window <id|app_id>, reload, quit)");

    CliOptions options;
    ControlArgs control_args;
    register_options(app, options);
    auto* ctl = register_control(app, control_args, options);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        if (e.get_exit_code() == 0) {
            (void)app.exit(e);
            return CliParseOutcome{.action = CliAction::exit_ok, .options = {}};
        }
        (void)app.exit(e);
        return make_error<CliParseOutcome>(ErrorCode::parse_error,
                                           "Failed to parse command line arguments.");
    }

    if (ctl->parsed()) {
        auto request = build_request(control_args);
        if (!request) {
            return make_error<CliParseOutcome>(request.error().code, request.error().message,
                                               request.error().location);
        }
        options.control = *request;
        return CliParseOutcome{.action = CliAction::control, .options = std::move(options)};
    }

    if (options.headless_outputs != 1 && !options.headless) {
        return make_error<CliParseOutcome>(ErrorCode::parse_error,
                                           "--outputs only applies with --headless");
    }
    return CliParseOutcome{.action = CliAction::run, .options = std::move(options)};
}

} // namespace scape::app
