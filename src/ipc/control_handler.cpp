#include "control_handler.hpp"

#include <charconv>
#include <core/compositor.hpp>
#include <util/logging.hpp>

namespace scape::ipc {

namespace {

auto failure(std::string message) -> ControlResponse {
    ControlResponse response;
    response.ok = false;
    response.message = std::move(message);
    return response;
}

auto resolve_window(const core::Compositor& compositor, const std::string& argument)
    -> std::optional<core::WindowId> {
    core::WindowId id = core::INVALID_ID;
    const char* end = argument.data() + argument.size();
    auto [ptr, ec] = std::from_chars(argument.data(), end, id);
    if (ec == std::errc{} && ptr == end) {
        if (compositor.window_info(id)) {
            return id;
        }
        return std::nullopt;
    }
    return compositor.find_window_by_app_id(argument);
}

} // namespace

auto handle_control_request(core::Compositor& compositor, const ControlRequest& request)
    -> ControlResponse {
    ControlResponse response;
    switch (request.command) {
    case ControlCommand::list_outputs:
        response.outputs = compositor.output_infos();
        return response;
    case ControlCommand::list_windows:
        response.windows = compositor.window_infos();
        return response;
    case ControlCommand::focus_window: {
        auto window = resolve_window(compositor, request.argument);
        if (!window) {
            return failure("No window matches '" + request.argument + "'");
        }
        if (!compositor.focus_window(*window)) {
            return failure("Window " + std::to_string(*window) + " cannot take focus");
        }
        response.message = "Focused window " + std::to_string(*window);
        return response;
    }
    case ControlCommand::close_window: {
        auto window = resolve_window(compositor, request.argument);
        if (!window) {
            return failure("No window matches '" + request.argument + "'");
        }
        compositor.close_window(*window);
        response.message = "Asked window " + std::to_string(*window) + " to close";
        return response;
    }
    case ControlCommand::reload_config:
        compositor.request_reload();
        response.message = "Reload scheduled";
        return response;
    case ControlCommand::quit:
        SCAPE_LOG_INFO("Quit requested over the control socket");
        compositor.quit();
        response.message = "Shutting down";
        return response;
    }
    return failure("Unknown command");
}

} // namespace scape::ipc
