#include "cli.hpp"
#include "process_launcher.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <map>
#include <core/compositor.hpp>
#include <core/layout_snapshot.hpp>
#include <ipc/control_handler.hpp>
#include <ipc/control_server.hpp>
#include <loop/event_loop.hpp>
#include <script/lua_policy.hpp>
#include <util/config.hpp>
#include <util/error.hpp>
#include <util/logging.hpp>
#include <util/paths.hpp>
#include <util/profiling.hpp>
#include <wlr/wlr_server.hpp>

namespace {

constexpr const char* SOCKET_ENV = "SCAPE_SOCKET";

auto load_configuration(const scape::app::CliOptions& cli) -> scape::Config {
    std::filesystem::path path = cli.config_path;
    if (path.empty()) {
        auto config_dir = scape::util::resolve_config_dir({});
        if (!config_dir) {
            SCAPE_LOG_WARN("No config directory: {}", config_dir.error().message);
            return scape::default_config();
        }
        path = *config_dir / "scape.toml";
    }

    auto config = scape::load_config(path);
    if (!config) {
        const auto& error = config.error();
        if (error.code == scape::ErrorCode::file_not_found && cli.config_path.empty()) {
            SCAPE_LOG_INFO("No config at '{}', using defaults", path.string());
        } else {
            SCAPE_LOG_ERROR("Failed to load configuration from '{}': {} ({})", path.string(),
                            error.message, scape::error_code_name(error.code));
            SCAPE_LOG_INFO("Using default configuration");
        }
        return scape::default_config();
    }
    return *config;
}

void apply_log_level(const scape::app::CliOptions& cli, const scape::Config& config) {
    const std::string& name = cli.log_level.empty() ? config.logging.level : cli.log_level;
    if (auto level = scape::parse_log_level(name)) {
        scape::set_log_level(*level);
    } else {
        SCAPE_LOG_WARN("Unknown log level '{}', keeping info", name);
    }
}

auto script_path(const scape::app::CliOptions& cli, const scape::Config& config,
                 const scape::util::AppDirs& dirs) -> std::filesystem::path {
    if (!cli.script_path.empty()) {
        return cli.script_path;
    }
    if (!config.script.path.empty()) {
        return config.script.path;
    }
    return scape::util::config_path(dirs, "init.lua");
}

auto snapshot_path(const scape::Config& config, const scape::util::AppDirs& dirs)
    -> std::filesystem::path {
    if (!config.snapshot.path.empty()) {
        return config.snapshot.path;
    }
    return scape::util::state_path(dirs, "layout.bin");
}

auto run_control(const scape::app::CliOptions& cli) -> int {
    std::filesystem::path socket = cli.socket_path;
    if (socket.empty()) {
        if (const char* env = std::getenv(SOCKET_ENV)) {
            socket = env;
        } else {
            auto dirs = scape::util::resolve_app_dirs({});
            if (!dirs) {
                std::fprintf(stderr, "scape: %s\n", dirs.error().message.c_str());
                return EXIT_FAILURE;
            }
            const char* display = std::getenv("WAYLAND_DISPLAY");
            socket = scape::ipc::control_socket_path(dirs->runtime_dir, display ? display : "");
        }
    }

    auto response = scape::ipc::send_request(socket, *cli.control);
    if (!response) {
        std::fprintf(stderr, "scape: %s\n", response.error().message.c_str());
        return EXIT_FAILURE;
    }
    for (const auto& output : response->outputs) {
        std::printf("%s\t%dx%d+%d+%d\tscale=%.2f\t%s\n", output.name.c_str(), output.rect.width,
                    output.rect.height, output.rect.x, output.rect.y, output.scale,
                    output.enabled ? "enabled" : "disabled");
    }
    for (const auto& window : response->windows) {
        std::printf("%u\t%s\t%s\t%s\t%dx%d+%d+%d%s%s\n", window.id, window.app_id.c_str(),
                    window.title.c_str(), window.output.c_str(), window.geometry.width,
                    window.geometry.height, window.geometry.x, window.geometry.y,
                    window.focused ? "\tfocused" : "", window.xwayland ? "\txwayland" : "");
    }
    if (!response->message.empty()) {
        std::fprintf(response->ok ? stdout : stderr, "%s\n", response->message.c_str());
    }
    return response->ok ? EXIT_SUCCESS : EXIT_FAILURE;
}

auto run_compositor(const scape::app::CliOptions& cli) -> int {
    scape::initialize_logger("scape", cli.log_file);
    SCAPE_LOG_INFO(SCAPE_PROJECT_NAME " v" SCAPE_VERSION " starting");

    scape::Config config = load_configuration(cli);
    apply_log_level(cli, config);

    auto dirs = scape::util::resolve_app_dirs(scape::util::overrides_from_config(config));
    if (!dirs) {
        SCAPE_LOG_CRITICAL("Cannot resolve directories: {}", dirs.error().message);
        return EXIT_FAILURE;
    }

    SCAPE_LOG_DEBUG("Configuration loaded:");
    SCAPE_LOG_DEBUG("  Backend: {}", scape::to_string(config.backend.kind));
    SCAPE_LOG_DEBUG("  Focus mode: {}", scape::to_string(config.input.focus_mode));
    SCAPE_LOG_DEBUG("  Screencast: {}", scape::to_string(config.screencast.policy));
    SCAPE_LOG_DEBUG("  Runtime dir: {}", dirs->runtime_dir.string());

    scape::wlr::ServerOptions server_options;
    server_options.backend = cli.headless ? scape::BackendKind::headless : config.backend.kind;
    server_options.keyboard_layout = config.input.keyboard_layout;
    server_options.headless_outputs = cli.headless_outputs;
    server_options.xwayland = !cli.no_xwayland;

    auto server_result = scape::wlr::WlrServer::create(server_options);
    if (!server_result) {
        SCAPE_LOG_CRITICAL("Failed to create server: {} ({})", server_result.error().message,
                           scape::error_code_name(server_result.error().code));
        return EXIT_FAILURE;
    }
    auto& server = **server_result;

    scape::app::ShellLauncher launcher;
    scape::core::Compositor compositor(
        scape::core::Collaborators{
            .render = server, .sink = server, .launcher = launcher, .session = server},
        scape::core::compositor_config_from(config));

    const auto layout_file = snapshot_path(config, *dirs);
    compositor.set_snapshot(scape::core::load_snapshot_or_default(layout_file));
    compositor.set_policy_engine(std::make_unique<scape::script::LuaPolicyEngine>(
        compositor,
        scape::script::LuaPolicyOptions{.instruction_limit = config.policy.instruction_limit}));
    server.attach(compositor);

    auto loop_result = scape::loop::EventLoop::create(server.event_loop());
    if (!loop_result) {
        SCAPE_LOG_CRITICAL("Failed to create event loop: {}", loop_result.error().message);
        return EXIT_FAILURE;
    }
    auto& loop = **loop_result;
    compositor.set_quit_handler([&loop] { loop.stop(); });

    auto started = server.start();
    if (!started) {
        SCAPE_LOG_CRITICAL("Failed to start server: {}", started.error().message);
        return EXIT_FAILURE;
    }

    const auto socket = scape::ipc::control_socket_path(dirs->runtime_dir,
                                                        server.wayland_display());
    std::map<std::string, std::string> child_env{
        {"WAYLAND_DISPLAY", server.wayland_display()},
        {SOCKET_ENV, socket.string()},
    };
    if (auto x11 = server.x11_display(); !x11.empty()) {
        child_env.emplace("DISPLAY", x11);
    }
    compositor.set_spawn_environment(std::move(child_env));

    const auto script = script_path(cli, config, *dirs);
    if (std::filesystem::exists(script)) {
        auto loaded = compositor.load_policy(script);
        if (!loaded) {
            SCAPE_LOG_ERROR("Policy script failed, running without bindings: {}",
                            loaded.error().message);
        }
        auto watched = loop.watch_file(script, [&compositor] { compositor.request_reload(); });
        if (!watched) {
            SCAPE_LOG_WARN("Script changes will not reload automatically: {}",
                           watched.error().message);
        }
    } else {
        SCAPE_LOG_INFO("No policy script at '{}'", script.string());
    }

    for (int signo : {SIGINT, SIGTERM}) {
        auto added = loop.add_signal(signo, [&compositor] { compositor.quit(); });
        if (!added) {
            SCAPE_LOG_WARN("Signal {} not handled: {}", signo, added.error().message);
        }
    }
    auto reaper = loop.add_signal(SIGCHLD, [] { (void)scape::app::reap_children(); });
    if (!reaper) {
        SCAPE_LOG_WARN("Child reaping disabled: {}", reaper.error().message);
    }

    auto& inbox = loop.create_inbox();
    auto control = scape::ipc::ControlServer::create(
        socket, inbox, [&compositor](const scape::ipc::ControlRequest& request) {
            return scape::ipc::handle_control_request(compositor, request);
        });
    if (!control) {
        SCAPE_LOG_WARN("Remote control unavailable: {}", control.error().message);
    }

    loop.set_deadline([&compositor] { return compositor.next_deadline(); },
                      [&compositor] { compositor.tick(); });
    loop.set_before_wait([&server] {
        server.sync_outputs();
        server.flush_clients();
    });

    compositor.startup();
    auto ran = loop.run();
    if (!ran) {
        SCAPE_LOG_ERROR("Event loop failed: {}", ran.error().message);
    }

    SCAPE_LOG_INFO("Shutting down...");
    if (control) {
        (*control)->shutdown();
    }
    auto saved = scape::core::save_snapshot(layout_file, compositor.snapshot());
    if (!saved) {
        SCAPE_LOG_WARN("Layout not saved: {}", saved.error().message);
    }
    server.stop();
    SCAPE_LOG_INFO("scape terminated");
    return ran ? EXIT_SUCCESS : EXIT_FAILURE;
}

auto run_app(int argc, char** argv) -> int {
    auto cli_result = scape::app::parse_cli(argc, argv);
    if (!cli_result) {
        std::fprintf(stderr, "scape: %s\n", cli_result.error().message.c_str());
        return EXIT_FAILURE;
    }
    switch (cli_result->action) {
    case scape::app::CliAction::exit_ok:
        return EXIT_SUCCESS;
    case scape::app::CliAction::control:
        return run_control(cli_result->options);
    case scape::app::CliAction::run:
        break;
    }
    std::signal(SIGPIPE, SIG_IGN);
    return run_compositor(cli_result->options);
}

} // namespace

auto main(int argc, char** argv) -> int {
    try {
        return run_app(argc, argv);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "[CRITICAL] Unhandled exception: %s\n", e.what());
        try {
            SCAPE_LOG_CRITICAL("Unhandled exception caught in main: {}", e.what());
            spdlog::shutdown();
        } catch (const std::exception& log_error) {
            std::fprintf(stderr, "[CRITICAL] Logger failed to handle exception: %s\n",
                         log_error.what());
        }
        return EXIT_FAILURE;
    }
}
