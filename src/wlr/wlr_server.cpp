#include "wlr_server.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <ctime>
#include <fcntl.h>
#include <map>
#include <optional>
#include <unistd.h>
#include <utility>
#include <vector>

extern "C" {
#include <pixman.h>
#include <wayland-server-core.h>
#include <wlr/backend.h>
#include <wlr/backend/headless.h>
#include <wlr/backend/session.h>
#include <wlr/render/allocator.h>
#include <wlr/render/pass.h>
#include <wlr/render/wlr_renderer.h>
#include <wlr/render/wlr_texture.h>
#include <wlr/types/wlr_buffer.h>
#include <wlr/types/wlr_compositor.h>
#include <wlr/types/wlr_cursor.h>
#include <wlr/types/wlr_data_device.h>
#include <wlr/types/wlr_input_device.h>
#include <wlr/types/wlr_keyboard.h>
#include <wlr/types/wlr_output.h>
#include <wlr/types/wlr_output_layout.h>
#include <wlr/types/wlr_pointer.h>
#include <wlr/types/wlr_pointer_constraints_v1.h>
#include <wlr/types/wlr_relative_pointer_v1.h>
#include <wlr/types/wlr_seat.h>
#include <wlr/types/wlr_subcompositor.h>
#include <wlr/types/wlr_touch.h>
#include <wlr/types/wlr_xcursor_manager.h>
#include <wlr/util/box.h>
#include <wlr/util/log.h>
#include <xkbcommon/xkbcommon.h>

// xwayland.h contains 'char *class' which conflicts with C++ keyword
#define class class_
#include <wlr/xwayland/xwayland.h>
#undef class

#include <wlr/types/wlr_xdg_shell.h>
}

#include <core/compositor.hpp>
#include <util/logging.hpp>
#include <util/profiling.hpp>

namespace scape::wlr {

namespace {

constexpr int XDG_SHELL_VERSION = 3;
constexpr int COMPOSITOR_VERSION = 6;
constexpr int CURSOR_SIZE = 24;
constexpr int32_t KEY_REPEAT_RATE = 25;
constexpr int32_t KEY_REPEAT_DELAY = 600;
constexpr int32_t HEADLESS_WIDTH = 1920;
constexpr int32_t HEADLESS_HEIGHT = 1080;
constexpr wlr_render_color BACKGROUND{.r = 0.1F, .g = 0.1F, .b = 0.12F, .a = 1.0F};

enum class WlrLogFormatStatus : std::uint8_t { ok, null_format, format_error };

struct FormattedWlrMessage {
    std::string message;
    WlrLogFormatStatus status = WlrLogFormatStatus::ok;
};

auto format_wlr_message(const char* format, va_list args) -> FormattedWlrMessage {
    if (!format) {
        return {.message = {}, .status = WlrLogFormatStatus::null_format};
    }

    va_list args_copy;
    va_copy(args_copy, args);
    int length = std::vsnprintf(nullptr, 0, format, args_copy);
    va_end(args_copy);
    if (length < 0) {
        return {.message = {}, .status = WlrLogFormatStatus::format_error};
    }

    std::string message(static_cast<size_t>(length) + 1, '\0');
    va_copy(args_copy, args);
    std::vsnprintf(message.data(), message.size(), format, args_copy);
    va_end(args_copy);
    message.resize(static_cast<size_t>(length));
    while (!message.empty() && message.back() == '\n') {
        message.pop_back();
    }
    return {.message = std::move(message), .status = WlrLogFormatStatus::ok};
}

auto wlr_importance_from_log_level(spdlog::level::level_enum level) -> wlr_log_importance {
    if (level <= spdlog::level::debug) {
        return WLR_DEBUG;
    }
    if (level <= spdlog::level::info) {
        return WLR_INFO;
    }
    if (level <= spdlog::level::critical) {
        return WLR_ERROR;
    }
    return WLR_SILENT;
}

void wlr_log_bridge(wlr_log_importance importance, const char* format, va_list args) {
    const FormattedWlrMessage formatted = format_wlr_message(format, args);
    if (formatted.status != WlrLogFormatStatus::ok) {
        SCAPE_LOG_WARN("[wlr] log formatting failed for format '{}'", format ? format : "<null>");
        return;
    }
    if (formatted.message.empty()) {
        return;
    }

    switch (importance) {
    case WLR_ERROR:
        SCAPE_LOG_ERROR("[wlr] {}", formatted.message);
        return;
    case WLR_INFO:
        SCAPE_LOG_INFO("[wlr] {}", formatted.message);
        return;
    case WLR_DEBUG:
        SCAPE_LOG_DEBUG("[wlr] {}", formatted.message);
        return;
    case WLR_SILENT:
    case WLR_LOG_IMPORTANCE_LAST:
        return;
    }
}

// XWayland and xkbcomp write warnings straight to stderr; keep them out of info-level output.
class StderrSuppressor {
public:
    StderrSuppressor() {
        if (get_logger()->level() <= spdlog::level::debug) {
            return;
        }
        m_saved_stderr = dup(STDERR_FILENO);
        if (m_saved_stderr < 0) {
            return;
        }
        int null_fd = open("/dev/null", O_WRONLY | O_CLOEXEC);
        if (null_fd >= 0) {
            dup2(null_fd, STDERR_FILENO);
            ::close(null_fd);
        } else {
            ::close(m_saved_stderr);
            m_saved_stderr = -1;
        }
    }
    ~StderrSuppressor() {
        if (m_saved_stderr >= 0) {
            dup2(m_saved_stderr, STDERR_FILENO);
            ::close(m_saved_stderr);
        }
    }
    StderrSuppressor(const StderrSuppressor&) = delete;
    StderrSuppressor& operator=(const StderrSuppressor&) = delete;

private:
    int m_saved_stderr = -1;
};

void listen(wl_signal* signal, wl_listener& listener, wl_notify_func_t notify) {
    listener.notify = notify;
    wl_signal_add(signal, &listener);
}

void unlisten(wl_listener& listener) {
    if (listener.link.next != nullptr) {
        wl_list_remove(&listener.link);
        listener.link.next = nullptr;
        listener.link.prev = nullptr;
    }
}

template <typename T>
auto owner_of(wl_listener* listener, size_t offset) -> T* {
    return reinterpret_cast<T*>(reinterpret_cast<char*>(listener) - offset);
}

auto surface_damage(wlr_surface* surface) -> core::Region {
    pixman_region32_t damage;
    pixman_region32_init(&damage);
    wlr_surface_get_effective_damage(surface, &damage);
    int count = 0;
    const pixman_box32_t* boxes = pixman_region32_rectangles(&damage, &count);
    core::Region region;
    for (int i = 0; i < count; ++i) {
        region.add(core::Rect{boxes[i].x1, boxes[i].y1, boxes[i].x2 - boxes[i].x1,
                              boxes[i].y2 - boxes[i].y1});
    }
    pixman_region32_fini(&damage);
    return region;
}

auto scaled_box(const core::Rect& rect, core::Point origin, double scale) -> wlr_box {
    return wlr_box{
        .x = static_cast<int>((rect.x - origin.x) * scale),
        .y = static_cast<int>((rect.y - origin.y) * scale),
        .width = static_cast<int>(rect.width * scale),
        .height = static_cast<int>(rect.height * scale),
    };
}

auto now_timespec() -> timespec {
    timespec now{};
    clock_gettime(CLOCK_MONOTONIC, &now);
    return now;
}

auto now_msec() -> uint32_t {
    const timespec now = now_timespec();
    return static_cast<uint32_t>(now.tv_sec * 1000 + now.tv_nsec / 1000000);
}

} // namespace

struct WlrServer::Impl {
    struct ClientHooks {
        Impl* impl = nullptr;
        wl_client* client = nullptr;
        core::ClientId id = core::INVALID_ID;
        bool refused = false;
        wl_listener destroy{};
    };

    enum class SurfaceKind : std::uint8_t { toplevel, popup, subsurface, xwayland };

    struct SurfaceHooks {
        Impl* impl = nullptr;
        SurfaceKind kind = SurfaceKind::toplevel;
        wlr_surface* surface = nullptr;
        wlr_xdg_toplevel* toplevel = nullptr;
        wlr_xdg_popup* popup = nullptr;
        wlr_subsurface* subsurface = nullptr;
        wlr_xwayland_surface* xsurface = nullptr;
        core::SurfaceId id = core::INVALID_ID;
        core::WindowId window = core::INVALID_ID;

        wl_listener commit{};
        wl_listener map{};
        wl_listener unmap{};
        wl_listener destroy{};
        wl_listener new_subsurface{};
        wl_listener set_title{};
        wl_listener set_app_id{};
        wl_listener role_destroy{};
    };

    struct XWaylandHooks {
        Impl* impl = nullptr;
        wlr_xwayland_surface* xsurface = nullptr;
        SurfaceHooks* tracked = nullptr;

        wl_listener associate{};
        wl_listener dissociate{};
        wl_listener request_configure{};
        wl_listener set_title{};
        wl_listener set_class{};
        wl_listener destroy{};
    };

    struct OutputHooks {
        Impl* impl = nullptr;
        wlr_output* output = nullptr;
        core::OutputId id = core::INVALID_ID;
        bool applied_enabled = true;
        double applied_scale = 1.0;
        core::Point applied_position{-1.0, -1.0};
        bool in_layout = false;

        wl_listener frame{};
        wl_listener request_state{};
        wl_listener destroy{};
    };

    struct KeyboardHooks {
        Impl* impl = nullptr;
        wlr_keyboard* keyboard = nullptr;

        wl_listener key{};
        wl_listener modifiers{};
        wl_listener destroy{};
    };

    struct ConstraintHooks {
        Impl* impl = nullptr;
        wlr_pointer_constraint_v1* constraint = nullptr;

        wl_listener set_region{};
        wl_listener destroy{};
    };

    /// Client buffer locked for as long as the core holds its token.
    struct ImportedBuffer {
        wlr_buffer* buffer = nullptr;
        wlr_texture* texture = nullptr;
    };

    struct Listeners {
        Impl* impl = nullptr;

        wl_listener new_output{};
        wl_listener new_input{};
        wl_listener new_xdg_toplevel{};
        wl_listener new_xdg_popup{};
        wl_listener new_xwayland_surface{};
        wl_listener cursor_motion{};
        wl_listener cursor_motion_absolute{};
        wl_listener cursor_button{};
        wl_listener cursor_axis{};
        wl_listener cursor_frame{};
        wl_listener touch_down{};
        wl_listener touch_up{};
        wl_listener touch_motion{};
        wl_listener touch_frame{};
        wl_listener request_set_cursor{};
        wl_listener new_pointer_constraint{};
    };

    ServerOptions options;
    core::Compositor* core = nullptr;

    wl_display* display = nullptr;
    wl_event_loop* event_loop = nullptr;
    wlr_backend* backend = nullptr;
    wlr_session* session = nullptr;
    wlr_renderer* renderer = nullptr;
    wlr_allocator* allocator = nullptr;
    wlr_compositor* compositor = nullptr;
    wlr_xdg_shell* xdg_shell = nullptr;
    wlr_output_layout* output_layout = nullptr;
    wlr_cursor* cursor = nullptr;
    wlr_xcursor_manager* cursor_manager = nullptr;
    wlr_seat* seat = nullptr;
    wlr_relative_pointer_manager_v1* relative_pointer_manager = nullptr;
    wlr_pointer_constraints_v1* pointer_constraints = nullptr;
    wlr_pointer_constraint_v1* active_constraint = nullptr;
    wlr_xwayland* xwayland = nullptr;
    xkb_context* xkb_ctx = nullptr;
    wl_event_source* disconnect_idle = nullptr;

    std::vector<std::unique_ptr<ClientHooks>> clients;
    std::vector<std::unique_ptr<SurfaceHooks>> surfaces;
    std::vector<std::unique_ptr<XWaylandHooks>> xwayland_surfaces;
    std::vector<std::unique_ptr<OutputHooks>> outputs;
    std::vector<std::unique_ptr<KeyboardHooks>> keyboards;
    std::vector<std::unique_ptr<ConstraintHooks>> constraints;
    std::map<core::BufferToken, ImportedBuffer> imported_buffers;
    core::BufferToken next_buffer_token = 1;
    std::vector<wl_client*> pending_disconnects;
    std::string socket_name;
    core::ClientId next_client_id = 1;
    bool has_touch = false;
    Listeners listeners;

    Impl() { listeners.impl = this; }

    [[nodiscard]] auto setup_backend() -> Result<void>;
    [[nodiscard]] auto setup_protocols() -> Result<void>;
    [[nodiscard]] auto setup_input() -> Result<void>;
    [[nodiscard]] auto setup_xwayland() -> Result<void>;
    void detach_listeners();

    auto ensure_client(wl_client* client) -> std::optional<core::ClientId>;
    void handle_client_destroy(ClientHooks* hooks);
    void schedule_disconnect(wl_client* client);
    void flush_disconnects();

    auto track_surface(wlr_surface* surface, SurfaceKind kind, core::SurfaceRole role,
                       core::SurfaceId parent, core::Point offset) -> SurfaceHooks*;
    void untrack_surface(SurfaceHooks* hooks);
    void handle_commit(SurfaceHooks* hooks);
    void handle_new_subsurface(SurfaceHooks* parent, wlr_subsurface* subsurface);
    void handle_new_xdg_toplevel(wlr_xdg_toplevel* toplevel);
    void handle_new_xdg_popup(wlr_xdg_popup* popup);
    void handle_new_xwayland_surface(wlr_xwayland_surface* xsurface);
    void handle_xwayland_associate(XWaylandHooks* hooks);
    void handle_xwayland_dissociate(XWaylandHooks* hooks);
    void create_window(SurfaceHooks* hooks, const char* app_id, const char* title, bool xwayland);
    void unconstrain_popup(SurfaceHooks* hooks);

    void handle_new_output(wlr_output* output);
    void handle_output_destroy(OutputHooks* hooks);
    void apply_output(OutputHooks* hooks);

    void handle_new_input(wlr_input_device* device);
    void handle_new_keyboard(wlr_input_device* device);
    void handle_key(KeyboardHooks* hooks, const wlr_keyboard_key_event* event);
    void update_capabilities();

    void handle_new_pointer_constraint(wlr_pointer_constraint_v1* constraint);
    void handle_constraint_set_region(ConstraintHooks* hooks);
    void handle_constraint_destroy(ConstraintHooks* hooks);
    void activate_constraint(wlr_pointer_constraint_v1* constraint);
    void deactivate_constraint();
    void confine_motion(double& dx, double& dy) const;
    void release_imported_buffers();

    [[nodiscard]] auto find_surface(core::SurfaceId id) const -> SurfaceHooks*;
    [[nodiscard]] auto find_surface(const wlr_surface* surface) const -> SurfaceHooks*;
    [[nodiscard]] auto find_window(core::WindowId id) const -> SurfaceHooks*;
    [[nodiscard]] auto find_output(core::OutputId id) const -> OutputHooks*;
    [[nodiscard]] auto find_client(core::ClientId id) const -> ClientHooks*;
    [[nodiscard]] auto seat_id() const -> core::SeatId { return core->default_seat(); }
};

// =============================================================================
// Setup
// =============================================================================

auto WlrServer::Impl::setup_backend() -> Result<void> {
    display = wl_display_create();
    if (!display) {
        return make_error<void>(ErrorCode::backend_init_failed, "Failed to create Wayland display");
    }
    event_loop = wl_display_get_event_loop(display);

    if (options.backend == BackendKind::headless) {
        backend = wlr_headless_backend_create(event_loop);
    } else {
        backend = wlr_backend_autocreate(event_loop, &session);
    }
    if (!backend) {
        return make_error<void>(ErrorCode::backend_init_failed,
                                "Failed to create wlroots backend");
    }

    renderer = wlr_renderer_autocreate(backend);
    if (!renderer) {
        return make_error<void>(ErrorCode::backend_init_failed, "Failed to create renderer");
    }
    if (!wlr_renderer_init_wl_display(renderer, display)) {
        return make_error<void>(ErrorCode::backend_init_failed,
                                "Failed to initialize renderer protocols");
    }

    allocator = wlr_allocator_autocreate(backend, renderer);
    if (!allocator) {
        return make_error<void>(ErrorCode::backend_init_failed, "Failed to create allocator");
    }

    output_layout = wlr_output_layout_create(display);
    if (!output_layout) {
        return make_error<void>(ErrorCode::backend_init_failed,
                                "Failed to create output layout");
    }

    listen(&backend->events.new_output, listeners.new_output, [](wl_listener* listener,
                                                                 void* data) {
        auto* list = owner_of<Listeners>(listener, offsetof(Listeners, new_output));
        list->impl->handle_new_output(static_cast<wlr_output*>(data));
    });
    listen(&backend->events.new_input, listeners.new_input, [](wl_listener* listener,
                                                               void* data) {
        auto* list = owner_of<Listeners>(listener, offsetof(Listeners, new_input));
        list->impl->handle_new_input(static_cast<wlr_input_device*>(data));
    });
    return {};
}

auto WlrServer::Impl::setup_protocols() -> Result<void> {
    compositor = wlr_compositor_create(display, COMPOSITOR_VERSION, renderer);
    if (!compositor) {
        return make_error<void>(ErrorCode::backend_init_failed, "Failed to create compositor");
    }
    if (!wlr_subcompositor_create(display)) {
        return make_error<void>(ErrorCode::backend_init_failed,
                                "Failed to create subcompositor");
    }
    if (!wlr_data_device_manager_create(display)) {
        return make_error<void>(ErrorCode::backend_init_failed,
                                "Failed to create data device manager");
    }

    xdg_shell = wlr_xdg_shell_create(display, XDG_SHELL_VERSION);
    if (!xdg_shell) {
        return make_error<void>(ErrorCode::backend_init_failed, "Failed to create xdg-shell");
    }
    listen(&xdg_shell->events.new_toplevel, listeners.new_xdg_toplevel,
           [](wl_listener* listener, void* data) {
               auto* list = owner_of<Listeners>(listener, offsetof(Listeners, new_xdg_toplevel));
               list->impl->handle_new_xdg_toplevel(static_cast<wlr_xdg_toplevel*>(data));
           });
    listen(&xdg_shell->events.new_popup, listeners.new_xdg_popup,
           [](wl_listener* listener, void* data) {
               auto* list = owner_of<Listeners>(listener, offsetof(Listeners, new_xdg_popup));
               list->impl->handle_new_xdg_popup(static_cast<wlr_xdg_popup*>(data));
           });

    relative_pointer_manager = wlr_relative_pointer_manager_v1_create(display);
    if (!relative_pointer_manager) {
        return make_error<void>(ErrorCode::backend_init_failed,
                                "Failed to create relative pointer manager");
    }
    pointer_constraints = wlr_pointer_constraints_v1_create(display);
    if (!pointer_constraints) {
        return make_error<void>(ErrorCode::backend_init_failed,
                                "Failed to create pointer constraints");
    }
    listen(&pointer_constraints->events.new_constraint, listeners.new_pointer_constraint,
           [](wl_listener* listener, void* data) {
               auto* list =
                   owner_of<Listeners>(listener, offsetof(Listeners, new_pointer_constraint));
               list->impl->handle_new_pointer_constraint(
                   static_cast<wlr_pointer_constraint_v1*>(data));
           });
    return {};
}

auto WlrServer::Impl::setup_input() -> Result<void> {
    xkb_ctx = xkb_context_new(XKB_CONTEXT_NO_FLAGS);
    if (!xkb_ctx) {
        return make_error<void>(ErrorCode::backend_init_failed, "Failed to create xkb context");
    }

    seat = wlr_seat_create(display, "seat0");
    if (!seat) {
        return make_error<void>(ErrorCode::backend_init_failed, "Failed to create seat");
    }

    cursor = wlr_cursor_create();
    if (!cursor) {
        return make_error<void>(ErrorCode::backend_init_failed, "Failed to create cursor");
    }
    wlr_cursor_attach_output_layout(cursor, output_layout);
    cursor_manager = wlr_xcursor_manager_create(nullptr, CURSOR_SIZE);
    if (!cursor_manager) {
        SCAPE_LOG_WARN("Cursor theme unavailable; pointer image left to clients");
    }

    listen(&cursor->events.motion, listeners.cursor_motion, [](wl_listener* listener,
                                                               void* data) {
        auto* impl = owner_of<Listeners>(listener, offsetof(Listeners, cursor_motion))->impl;
        auto* event = static_cast<wlr_pointer_motion_event*>(data);
        if (impl->relative_pointer_manager) {
            wlr_relative_pointer_manager_v1_send_relative_motion(
                impl->relative_pointer_manager, impl->seat,
                static_cast<uint64_t>(event->time_msec) * 1000, event->delta_x, event->delta_y,
                event->unaccel_dx, event->unaccel_dy);
        }
        // A locked pointer keeps its position; clients only see relative motion
        if (impl->active_constraint &&
            impl->active_constraint->type == WLR_POINTER_CONSTRAINT_V1_LOCKED) {
            return;
        }
        double dx = event->delta_x;
        double dy = event->delta_y;
        impl->confine_motion(dx, dy);
        wlr_cursor_move(impl->cursor, &event->pointer->base, dx, dy);
        if (impl->core) {
            impl->core->pointer_motion(impl->seat_id(), {impl->cursor->x, impl->cursor->y},
                                       event->time_msec);
        }
    });
    listen(&cursor->events.motion_absolute, listeners.cursor_motion_absolute,
           [](wl_listener* listener, void* data) {
               auto* impl =
                   owner_of<Listeners>(listener, offsetof(Listeners, cursor_motion_absolute))
                       ->impl;
               auto* event = static_cast<wlr_pointer_motion_absolute_event*>(data);
               wlr_cursor_warp_absolute(impl->cursor, &event->pointer->base, event->x,
                                        event->y);
               if (impl->core) {
                   impl->core->pointer_motion(impl->seat_id(),
                                              {impl->cursor->x, impl->cursor->y},
                                              event->time_msec);
               }
           });
    listen(&cursor->events.button, listeners.cursor_button, [](wl_listener* listener,
                                                               void* data) {
        auto* impl = owner_of<Listeners>(listener, offsetof(Listeners, cursor_button))->impl;
        auto* event = static_cast<wlr_pointer_button_event*>(data);
        if (impl->core) {
            impl->core->pointer_button(impl->seat_id(), event->button,
                                       event->state == WL_POINTER_BUTTON_STATE_PRESSED,
                                       event->time_msec);
        }
    });
    listen(&cursor->events.axis, listeners.cursor_axis, [](wl_listener* listener, void* data) {
        auto* impl = owner_of<Listeners>(listener, offsetof(Listeners, cursor_axis))->impl;
        auto* event = static_cast<wlr_pointer_axis_event*>(data);
        if (impl->core) {
            impl->core->pointer_axis(impl->seat_id(),
                                     event->orientation == WL_POINTER_AXIS_HORIZONTAL_SCROLL,
                                     event->delta, event->time_msec);
        }
    });
    listen(&cursor->events.frame, listeners.cursor_frame, [](wl_listener* listener,
                                                             void* /*data*/) {
        auto* impl = owner_of<Listeners>(listener, offsetof(Listeners, cursor_frame))->impl;
        wlr_seat_pointer_notify_frame(impl->seat);
    });
    listen(&cursor->events.touch_down, listeners.touch_down, [](wl_listener* listener,
                                                                void* data) {
        auto* impl = owner_of<Listeners>(listener, offsetof(Listeners, touch_down))->impl;
        auto* event = static_cast<wlr_touch_down_event*>(data);
        double lx = 0.0;
        double ly = 0.0;
        wlr_cursor_absolute_to_layout_coords(impl->cursor, &event->touch->base, event->x,
                                             event->y, &lx, &ly);
        if (impl->core) {
            impl->core->touch_down(impl->seat_id(), event->touch_id, {lx, ly},
                                   event->time_msec);
        }
    });
    listen(&cursor->events.touch_motion, listeners.touch_motion, [](wl_listener* listener,
                                                                    void* data) {
        auto* impl = owner_of<Listeners>(listener, offsetof(Listeners, touch_motion))->impl;
        auto* event = static_cast<wlr_touch_motion_event*>(data);
        double lx = 0.0;
        double ly = 0.0;
        wlr_cursor_absolute_to_layout_coords(impl->cursor, &event->touch->base, event->x,
                                             event->y, &lx, &ly);
        if (impl->core) {
            impl->core->touch_motion(impl->seat_id(), event->touch_id, {lx, ly},
                                     event->time_msec);
        }
    });
    listen(&cursor->events.touch_up, listeners.touch_up, [](wl_listener* listener, void* data) {
        auto* impl = owner_of<Listeners>(listener, offsetof(Listeners, touch_up))->impl;
        auto* event = static_cast<wlr_touch_up_event*>(data);
        if (impl->core) {
            impl->core->touch_up(impl->seat_id(), event->touch_id, event->time_msec);
        }
    });
    listen(&cursor->events.touch_frame, listeners.touch_frame, [](wl_listener* listener,
                                                                  void* /*data*/) {
        auto* impl = owner_of<Listeners>(listener, offsetof(Listeners, touch_frame))->impl;
        wlr_seat_touch_notify_frame(impl->seat);
    });
    listen(&seat->events.request_set_cursor, listeners.request_set_cursor,
           [](wl_listener* listener, void* data) {
               auto* impl =
                   owner_of<Listeners>(listener, offsetof(Listeners, request_set_cursor))->impl;
               auto* event = static_cast<wlr_seat_pointer_request_set_cursor_event*>(data);
               if (impl->seat->pointer_state.focused_client == event->seat_client) {
                   wlr_cursor_set_surface(impl->cursor, event->surface, event->hotspot_x,
                                          event->hotspot_y);
               }
           });
    return {};
}

auto WlrServer::Impl::setup_xwayland() -> Result<void> {
    {
        StderrSuppressor suppress;
        xwayland = wlr_xwayland_create(display, compositor, true);
    }
    if (!xwayland) {
        return make_error<void>(ErrorCode::backend_init_failed,
                                "Failed to create XWayland server");
    }

    listen(&xwayland->events.new_surface, listeners.new_xwayland_surface,
           [](wl_listener* listener, void* data) {
               auto* list =
                   owner_of<Listeners>(listener, offsetof(Listeners, new_xwayland_surface));
               list->impl->handle_new_xwayland_surface(static_cast<wlr_xwayland_surface*>(data));
           });
    wlr_xwayland_set_seat(xwayland, seat);
    return {};
}

void WlrServer::Impl::detach_listeners() {
    for (wl_listener* listener :
         {&listeners.new_output, &listeners.new_input, &listeners.new_xdg_toplevel,
          &listeners.new_xdg_popup, &listeners.new_xwayland_surface, &listeners.cursor_motion,
          &listeners.cursor_motion_absolute, &listeners.cursor_button, &listeners.cursor_axis,
          &listeners.cursor_frame, &listeners.touch_down, &listeners.touch_up,
          &listeners.touch_motion, &listeners.touch_frame, &listeners.request_set_cursor,
          &listeners.new_pointer_constraint}) {
        unlisten(*listener);
    }
}

// =============================================================================
// Clients
// =============================================================================

auto WlrServer::Impl::ensure_client(wl_client* client) -> std::optional<core::ClientId> {
    for (const auto& hooks : clients) {
        if (hooks->client == client) {
            if (hooks->refused) {
                return std::nullopt;
            }
            return hooks->id;
        }
    }

    auto hooks = std::make_unique<ClientHooks>();
    hooks->impl = this;
    hooks->client = client;
    hooks->id = next_client_id++;
    hooks->destroy.notify = [](wl_listener* listener, void* /*data*/) {
        auto* h = owner_of<ClientHooks>(listener, offsetof(ClientHooks, destroy));
        h->impl->handle_client_destroy(h);
    };
    wl_client_add_destroy_listener(client, &hooks->destroy);

    auto connected = core->client_connected(hooks->id);
    if (!connected) {
        SCAPE_LOG_WARN("Refusing client {}: {}", hooks->id, connected.error().message);
        hooks->refused = true;
        wl_client_post_no_memory(client);
        schedule_disconnect(client);
        clients.push_back(std::move(hooks));
        return std::nullopt;
    }
    core::ClientId id = hooks->id;
    clients.push_back(std::move(hooks));
    return id;
}

void WlrServer::Impl::handle_client_destroy(ClientHooks* hooks) {
    unlisten(hooks->destroy);
    std::erase(pending_disconnects, hooks->client);
    if (core && !hooks->refused) {
        core->client_disconnected(hooks->id);
    }
    std::erase_if(clients, [hooks](const auto& c) { return c.get() == hooks; });
}

void WlrServer::Impl::schedule_disconnect(wl_client* client) {
    if (std::find(pending_disconnects.begin(), pending_disconnects.end(), client) ==
        pending_disconnects.end()) {
        pending_disconnects.push_back(client);
    }
    if (disconnect_idle) {
        return;
    }
    disconnect_idle = wl_event_loop_add_idle(
        event_loop,
        [](void* data) {
            auto* impl = static_cast<Impl*>(data);
            impl->disconnect_idle = nullptr;
            impl->flush_disconnects();
        },
        this);
}

void WlrServer::Impl::flush_disconnects() {
    // Destroying a client runs handle_client_destroy, which edits the pending list
    while (!pending_disconnects.empty()) {
        wl_client* client = pending_disconnects.back();
        pending_disconnects.pop_back();
        wl_client_destroy(client);
    }
}

// =============================================================================
// Surfaces
// =============================================================================

auto WlrServer::Impl::track_surface(wlr_surface* surface, SurfaceKind kind,
                                    core::SurfaceRole role, core::SurfaceId parent,
                                    core::Point offset) -> SurfaceHooks* {
    if (!core) {
        return nullptr;
    }
    auto client = ensure_client(wl_resource_get_client(surface->resource));
    if (!client) {
        return nullptr;
    }
    auto id = core->create_surface(*client, role, parent, offset);
    if (!id) {
        SCAPE_LOG_WARN("Surface rejected for client {}: {}", *client, id.error().message);
        wl_resource_post_no_memory(surface->resource);
        return nullptr;
    }

    auto hooks = std::make_unique<SurfaceHooks>();
    hooks->impl = this;
    hooks->kind = kind;
    hooks->surface = surface;
    hooks->id = *id;

    listen(&surface->events.commit, hooks->commit, [](wl_listener* listener, void* /*data*/) {
        auto* h = owner_of<SurfaceHooks>(listener, offsetof(SurfaceHooks, commit));
        h->impl->handle_commit(h);
    });
    listen(&surface->events.new_subsurface, hooks->new_subsurface,
           [](wl_listener* listener, void* data) {
               auto* h = owner_of<SurfaceHooks>(listener, offsetof(SurfaceHooks, new_subsurface));
               h->impl->handle_new_subsurface(h, static_cast<wlr_subsurface*>(data));
           });
    listen(&surface->events.destroy, hooks->destroy, [](wl_listener* listener, void* /*data*/) {
        auto* h = owner_of<SurfaceHooks>(listener, offsetof(SurfaceHooks, destroy));
        h->impl->untrack_surface(h);
    });

    auto* raw = hooks.get();
    surfaces.push_back(std::move(hooks));
    return raw;
}

void WlrServer::Impl::untrack_surface(SurfaceHooks* hooks) {
    for (wl_listener* listener :
         {&hooks->commit, &hooks->map, &hooks->unmap, &hooks->destroy, &hooks->new_subsurface,
          &hooks->set_title, &hooks->set_app_id, &hooks->role_destroy}) {
        unlisten(*listener);
    }
    for (const auto& xhooks : xwayland_surfaces) {
        if (xhooks->tracked == hooks) {
            xhooks->tracked = nullptr;
        }
    }
    if (core) {
        core->destroy_surface(hooks->id);
    }
    std::erase_if(surfaces, [hooks](const auto& s) { return s.get() == hooks; });
}

void WlrServer::Impl::handle_commit(SurfaceHooks* hooks) {
    SCAPE_PROFILE_FUNCTION();
    if (!core) {
        return;
    }

    switch (hooks->kind) {
    case SurfaceKind::toplevel:
        if (hooks->toplevel && hooks->toplevel->base->initial_commit) {
            // Zero size lets the client pick; placement resizes after map
            wlr_xdg_toplevel_set_size(hooks->toplevel, 0, 0);
        }
        break;
    case SurfaceKind::popup:
        if (hooks->popup && hooks->popup->base->initial_commit) {
            unconstrain_popup(hooks);
            wlr_xdg_surface_schedule_configure(hooks->popup->base);
            if (hooks->popup->seat) {
                auto grabbed = core->request_popup_grab(seat_id(), hooks->id);
                if (!grabbed) {
                    SCAPE_LOG_DEBUG("Popup {} grab refused: {}", hooks->id,
                                    grabbed.error().message);
                }
            }
        } else if (hooks->popup) {
            const wlr_box& geometry = hooks->popup->current.geometry;
            core->set_surface_offset(hooks->id, {static_cast<double>(geometry.x),
                                                 static_cast<double>(geometry.y)});
        }
        break;
    case SurfaceKind::subsurface:
        if (hooks->subsurface) {
            core->set_surface_offset(hooks->id,
                                     {static_cast<double>(hooks->subsurface->current.x),
                                      static_cast<double>(hooks->subsurface->current.y)});
        }
        break;
    case SurfaceKind::xwayland:
        break;
    }

    std::optional<core::BufferHandle> buffer;
    if (hooks->surface->buffer) {
        buffer = reinterpret_cast<uintptr_t>(hooks->surface->buffer);
    }
    core::Size size{hooks->surface->current.width, hooks->surface->current.height};
    auto committed = core->commit(hooks->id, buffer, size, surface_damage(hooks->surface));
    if (!committed) {
        SCAPE_LOG_DEBUG("Commit on surface {} ignored: {}", hooks->id,
                        committed.error().message);
    }
}

void WlrServer::Impl::handle_new_subsurface(SurfaceHooks* parent, wlr_subsurface* subsurface) {
    auto* hooks = track_surface(subsurface->surface, SurfaceKind::subsurface,
                                core::SurfaceRole::subsurface, parent->id,
                                {static_cast<double>(subsurface->current.x),
                                 static_cast<double>(subsurface->current.y)});
    if (hooks) {
        hooks->subsurface = subsurface;
        listen(&subsurface->events.destroy, hooks->role_destroy,
               [](wl_listener* listener, void* /*data*/) {
                   auto* h = owner_of<SurfaceHooks>(listener, offsetof(SurfaceHooks, role_destroy));
                   unlisten(h->role_destroy);
                   h->subsurface = nullptr;
               });
    }
}

void WlrServer::Impl::create_window(SurfaceHooks* hooks, const char* app_id, const char* title,
                                    bool xwayland_window) {
    auto window = core->create_window(hooks->id, app_id ? app_id : "", title ? title : "",
                                      xwayland_window);
    if (!window) {
        // The core already disconnected the client for a protocol violation
        if (window.error().code == ErrorCode::protocol_violation) {
            SCAPE_LOG_DEBUG("Window creation refused for surface {}: {}", hooks->id,
                            window.error().message);
        } else {
            SCAPE_LOG_WARN("Window creation failed for surface {}: {}", hooks->id,
                           window.error().message);
        }
        return;
    }
    hooks->window = *window;

    listen(&hooks->surface->events.map, hooks->map, [](wl_listener* listener, void* /*data*/) {
        auto* h = owner_of<SurfaceHooks>(listener, offsetof(SurfaceHooks, map));
        if (!h->impl->core) {
            return;
        }
        auto placed = h->impl->core->map_window(h->window);
        if (!placed) {
            SCAPE_LOG_WARN("Map of window {} failed: {}", h->window, placed.error().message);
        }
    });
    listen(&hooks->surface->events.unmap, hooks->unmap, [](wl_listener* listener,
                                                           void* /*data*/) {
        auto* h = owner_of<SurfaceHooks>(listener, offsetof(SurfaceHooks, unmap));
        if (h->impl->core) {
            h->impl->core->unmap_window(h->window);
        }
    });
}

void WlrServer::Impl::handle_new_xdg_toplevel(wlr_xdg_toplevel* toplevel) {
    auto* hooks = track_surface(toplevel->base->surface, SurfaceKind::toplevel,
                                core::SurfaceRole::toplevel, core::INVALID_ID, {});
    if (!hooks) {
        return;
    }
    hooks->toplevel = toplevel;
    create_window(hooks, toplevel->app_id, toplevel->title, false);

    listen(&toplevel->events.set_title, hooks->set_title, [](wl_listener* listener,
                                                             void* /*data*/) {
        auto* h = owner_of<SurfaceHooks>(listener, offsetof(SurfaceHooks, set_title));
        if (h->impl->core && h->toplevel && h->window != core::INVALID_ID) {
            h->impl->core->set_window_identity(h->window,
                                               h->toplevel->app_id ? h->toplevel->app_id : "",
                                               h->toplevel->title ? h->toplevel->title : "");
        }
    });
    listen(&toplevel->events.set_app_id, hooks->set_app_id, [](wl_listener* listener,
                                                               void* /*data*/) {
        auto* h = owner_of<SurfaceHooks>(listener, offsetof(SurfaceHooks, set_app_id));
        if (h->impl->core && h->toplevel && h->window != core::INVALID_ID) {
            h->impl->core->set_window_identity(h->window,
                                               h->toplevel->app_id ? h->toplevel->app_id : "",
                                               h->toplevel->title ? h->toplevel->title : "");
        }
    });
    listen(&toplevel->events.destroy, hooks->role_destroy, [](wl_listener* listener,
                                                              void* /*data*/) {
        auto* h = owner_of<SurfaceHooks>(listener, offsetof(SurfaceHooks, role_destroy));
        unlisten(h->role_destroy);
        unlisten(h->set_title);
        unlisten(h->set_app_id);
        h->toplevel = nullptr;
    });
}

void WlrServer::Impl::handle_new_xdg_popup(wlr_xdg_popup* popup) {
    SurfaceHooks* parent = popup->parent ? find_surface(popup->parent) : nullptr;
    if (!parent) {
        SCAPE_LOG_DEBUG("Ignoring popup without a tracked parent");
        return;
    }
    auto* hooks = track_surface(popup->base->surface, SurfaceKind::popup,
                                core::SurfaceRole::popup, parent->id,
                                {static_cast<double>(popup->scheduled.geometry.x),
                                 static_cast<double>(popup->scheduled.geometry.y)});
    if (!hooks) {
        return;
    }
    hooks->popup = popup;
    listen(&popup->events.destroy, hooks->role_destroy, [](wl_listener* listener,
                                                           void* /*data*/) {
        auto* h = owner_of<SurfaceHooks>(listener, offsetof(SurfaceHooks, role_destroy));
        unlisten(h->role_destroy);
        h->popup = nullptr;
    });
}

void WlrServer::Impl::unconstrain_popup(SurfaceHooks* hooks) {
    const core::Surface* surface = core->tree().find_surface(hooks->id);
    if (!surface) {
        return;
    }
    core::Point parent_origin = core->tree().surface_origin(surface->parent);
    const core::Output* output = nullptr;
    if (const core::Window* window = core->tree().find_window(surface->window)) {
        output = core->outputs().find(window->home);
    }
    if (!output) {
        return;
    }
    core::Rect bounds = output->rect();
    wlr_box box{
        .x = static_cast<int>(bounds.x - parent_origin.x),
        .y = static_cast<int>(bounds.y - parent_origin.y),
        .width = bounds.width,
        .height = bounds.height,
    };
    wlr_xdg_popup_unconstrain_from_box(hooks->popup, &box);
}

// =============================================================================
// XWayland
// =============================================================================

void WlrServer::Impl::handle_new_xwayland_surface(wlr_xwayland_surface* xsurface) {
    auto hooks = std::make_unique<XWaylandHooks>();
    hooks->impl = this;
    hooks->xsurface = xsurface;

    listen(&xsurface->events.associate, hooks->associate, [](wl_listener* listener,
                                                             void* /*data*/) {
        auto* h = owner_of<XWaylandHooks>(listener, offsetof(XWaylandHooks, associate));
        h->impl->handle_xwayland_associate(h);
    });
    listen(&xsurface->events.dissociate, hooks->dissociate, [](wl_listener* listener,
                                                               void* /*data*/) {
        auto* h = owner_of<XWaylandHooks>(listener, offsetof(XWaylandHooks, dissociate));
        h->impl->handle_xwayland_dissociate(h);
    });
    listen(&xsurface->events.request_configure, hooks->request_configure,
           [](wl_listener* listener, void* data) {
               auto* event = static_cast<wlr_xwayland_surface_configure_event*>(data);
               auto* h =
                   owner_of<XWaylandHooks>(listener, offsetof(XWaylandHooks, request_configure));
               // Placement owns the position once mapped; before that the request stands
               const core::Window* window =
                   (h->impl->core && h->tracked)
                       ? h->impl->core->tree().find_window(h->tracked->window)
                       : nullptr;
               if (!window || !window->mapped) {
                   wlr_xwayland_surface_configure(event->surface, event->x, event->y,
                                                  event->width, event->height);
               }
           });
    listen(&xsurface->events.set_title, hooks->set_title, [](wl_listener* listener,
                                                             void* /*data*/) {
        auto* h = owner_of<XWaylandHooks>(listener, offsetof(XWaylandHooks, set_title));
        if (h->impl->core && h->tracked && h->tracked->window != core::INVALID_ID) {
            h->impl->core->set_window_identity(h->tracked->window,
                                               h->xsurface->class_ ? h->xsurface->class_ : "",
                                               h->xsurface->title ? h->xsurface->title : "");
        }
    });
    listen(&xsurface->events.set_class, hooks->set_class, [](wl_listener* listener,
                                                             void* /*data*/) {
        auto* h = owner_of<XWaylandHooks>(listener, offsetof(XWaylandHooks, set_class));
        if (h->impl->core && h->tracked && h->tracked->window != core::INVALID_ID) {
            h->impl->core->set_window_identity(h->tracked->window,
                                               h->xsurface->class_ ? h->xsurface->class_ : "",
                                               h->xsurface->title ? h->xsurface->title : "");
        }
    });
    listen(&xsurface->events.destroy, hooks->destroy, [](wl_listener* listener,
                                                         void* /*data*/) {
        auto* h = owner_of<XWaylandHooks>(listener, offsetof(XWaylandHooks, destroy));
        if (h->tracked) {
            h->impl->handle_xwayland_dissociate(h);
        }
        for (wl_listener* l : {&h->associate, &h->dissociate, &h->request_configure,
                               &h->set_title, &h->set_class, &h->destroy}) {
            unlisten(*l);
        }
        auto& list = h->impl->xwayland_surfaces;
        std::erase_if(list, [h](const auto& x) { return x.get() == h; });
    });

    xwayland_surfaces.push_back(std::move(hooks));
}

void WlrServer::Impl::handle_xwayland_associate(XWaylandHooks* hooks) {
    wlr_xwayland_surface* xsurface = hooks->xsurface;
    if (!xsurface->surface) {
        return;
    }
    auto* tracked = track_surface(xsurface->surface, SurfaceKind::xwayland,
                                  core::SurfaceRole::toplevel, core::INVALID_ID, {});
    if (!tracked) {
        return;
    }
    tracked->xsurface = xsurface;
    hooks->tracked = tracked;
    create_window(tracked, xsurface->class_, xsurface->title, true);
}

void WlrServer::Impl::handle_xwayland_dissociate(XWaylandHooks* hooks) {
    if (hooks->tracked) {
        SurfaceHooks* tracked = hooks->tracked;
        hooks->tracked = nullptr;
        untrack_surface(tracked);
    }
}

// =============================================================================
// Outputs
// =============================================================================

void WlrServer::Impl::handle_new_output(wlr_output* output) {
    if (!wlr_output_init_render(output, allocator, renderer)) {
        SCAPE_LOG_ERROR("Failed to initialize rendering on output {}", output->name);
        return;
    }

    wlr_output_state state;
    wlr_output_state_init(&state);
    wlr_output_state_set_enabled(&state, true);
    if (wlr_output_mode* mode = wlr_output_preferred_mode(output)) {
        wlr_output_state_set_mode(&state, mode);
    }
    bool committed = wlr_output_commit_state(output, &state);
    wlr_output_state_finish(&state);
    if (!committed) {
        SCAPE_LOG_ERROR("Output {} rejected its initial mode", output->name);
        return;
    }
    if (!core) {
        return;
    }

    auto hooks = std::make_unique<OutputHooks>();
    hooks->impl = this;
    hooks->output = output;
    listen(&output->events.frame, hooks->frame, [](wl_listener* listener, void* /*data*/) {
        auto* h = owner_of<OutputHooks>(listener, offsetof(OutputHooks, frame));
        if (h->impl->core && h->id != core::INVALID_ID) {
            h->impl->core->frame_done(h->id);
        }
    });
    listen(&output->events.request_state, hooks->request_state, [](wl_listener* listener,
                                                                   void* data) {
        auto* h = owner_of<OutputHooks>(listener, offsetof(OutputHooks, request_state));
        auto* event = static_cast<wlr_output_event_request_state*>(data);
        if (!wlr_output_commit_state(h->output, event->state)) {
            SCAPE_LOG_WARN("Output {} state request rejected", h->output->name);
        }
    });
    listen(&output->events.destroy, hooks->destroy, [](wl_listener* listener, void* /*data*/) {
        auto* h = owner_of<OutputHooks>(listener, offsetof(OutputHooks, destroy));
        h->impl->handle_output_destroy(h);
    });

    auto* raw = hooks.get();
    outputs.push_back(std::move(hooks));

    core::OutputMode mode{output->width, output->height, output->refresh};
    // Every wlroots backend delivers frame events, so pacing follows the hardware
    raw->id = core->output_added(output->name, mode, true);
    SCAPE_LOG_INFO("Output {} added ({}x{} @ {} mHz)", output->name, mode.width, mode.height,
                   mode.refresh_mhz);
    apply_output(raw);
    wlr_output_schedule_frame(output);
}

void WlrServer::Impl::handle_output_destroy(OutputHooks* hooks) {
    unlisten(hooks->frame);
    unlisten(hooks->request_state);
    unlisten(hooks->destroy);
    if (hooks->in_layout) {
        wlr_output_layout_remove(output_layout, hooks->output);
    }
    if (core && hooks->id != core::INVALID_ID) {
        SCAPE_LOG_INFO("Output {} removed", hooks->output->name);
        core->output_removed(hooks->id);
    }
    std::erase_if(outputs, [hooks](const auto& o) { return o.get() == hooks; });
}

void WlrServer::Impl::apply_output(OutputHooks* hooks) {
    const core::Output* info = core->outputs().find(hooks->id);
    if (!info) {
        return;
    }

    if (info->enabled != hooks->applied_enabled || info->scale != hooks->applied_scale) {
        wlr_output_state state;
        wlr_output_state_init(&state);
        wlr_output_state_set_enabled(&state, info->enabled);
        wlr_output_state_set_scale(&state, static_cast<float>(info->scale));
        if (wlr_output_commit_state(hooks->output, &state)) {
            hooks->applied_enabled = info->enabled;
            hooks->applied_scale = info->scale;
        } else {
            SCAPE_LOG_WARN("Output {} rejected enabled={} scale={}", info->name, info->enabled,
                           info->scale);
        }
        wlr_output_state_finish(&state);
    }

    if (info->enabled) {
        if (!hooks->in_layout || info->position != hooks->applied_position) {
            wlr_output_layout_add(output_layout, hooks->output,
                                  static_cast<int>(info->position.x),
                                  static_cast<int>(info->position.y));
            hooks->in_layout = true;
            hooks->applied_position = info->position;
        }
    } else if (hooks->in_layout) {
        wlr_output_layout_remove(output_layout, hooks->output);
        hooks->in_layout = false;
    }
}

// =============================================================================
// Input devices
// =============================================================================

void WlrServer::Impl::handle_new_input(wlr_input_device* device) {
    switch (device->type) {
    case WLR_INPUT_DEVICE_KEYBOARD:
        handle_new_keyboard(device);
        break;
    case WLR_INPUT_DEVICE_POINTER:
        wlr_cursor_attach_input_device(cursor, device);
        break;
    case WLR_INPUT_DEVICE_TOUCH:
        wlr_cursor_attach_input_device(cursor, device);
        has_touch = true;
        break;
    default:
        SCAPE_LOG_DEBUG("Ignoring input device '{}'", device->name ? device->name : "");
        return;
    }
    update_capabilities();
}

void WlrServer::Impl::handle_new_keyboard(wlr_input_device* device) {
    wlr_keyboard* keyboard = wlr_keyboard_from_input_device(device);

    xkb_rule_names rules{};
    rules.layout = options.keyboard_layout.c_str();
    xkb_keymap* keymap = xkb_keymap_new_from_names(xkb_ctx, &rules, XKB_KEYMAP_COMPILE_NO_FLAGS);
    if (!keymap) {
        SCAPE_LOG_WARN("Keymap for layout '{}' failed, falling back to defaults",
                       options.keyboard_layout);
        keymap = xkb_keymap_new_from_names(xkb_ctx, nullptr, XKB_KEYMAP_COMPILE_NO_FLAGS);
    }
    if (!keymap) {
        SCAPE_LOG_ERROR("No usable keymap; keyboard '{}' ignored",
                        device->name ? device->name : "");
        return;
    }
    wlr_keyboard_set_keymap(keyboard, keymap);
    xkb_keymap_unref(keymap);
    wlr_keyboard_set_repeat_info(keyboard, KEY_REPEAT_RATE, KEY_REPEAT_DELAY);

    auto hooks = std::make_unique<KeyboardHooks>();
    hooks->impl = this;
    hooks->keyboard = keyboard;
    listen(&keyboard->events.key, hooks->key, [](wl_listener* listener, void* data) {
        auto* h = owner_of<KeyboardHooks>(listener, offsetof(KeyboardHooks, key));
        h->impl->handle_key(h, static_cast<wlr_keyboard_key_event*>(data));
    });
    listen(&keyboard->events.modifiers, hooks->modifiers, [](wl_listener* listener,
                                                             void* /*data*/) {
        auto* h = owner_of<KeyboardHooks>(listener, offsetof(KeyboardHooks, modifiers));
        wlr_seat_set_keyboard(h->impl->seat, h->keyboard);
        if (h->impl->core) {
            h->impl->core->modifiers(h->impl->seat_id(), wlr_keyboard_get_modifiers(h->keyboard));
        }
    });
    listen(&device->events.destroy, hooks->destroy, [](wl_listener* listener, void* /*data*/) {
        auto* h = owner_of<KeyboardHooks>(listener, offsetof(KeyboardHooks, destroy));
        unlisten(h->key);
        unlisten(h->modifiers);
        unlisten(h->destroy);
        auto* impl = h->impl;
        std::erase_if(impl->keyboards, [h](const auto& k) { return k.get() == h; });
        impl->update_capabilities();
    });

    wlr_seat_set_keyboard(seat, keyboard);
    keyboards.push_back(std::move(hooks));
}

void WlrServer::Impl::handle_key(KeyboardHooks* hooks, const wlr_keyboard_key_event* event) {
    SCAPE_PROFILE_FUNCTION();
    if (!core) {
        return;
    }
    xkb_keycode_t keycode = event->keycode + 8;
    xkb_layout_index_t layout = xkb_state_key_get_layout(hooks->keyboard->xkb_state, keycode);
    const xkb_keysym_t* syms = nullptr;
    int count =
        xkb_keymap_key_get_syms_by_level(hooks->keyboard->keymap, keycode, layout, 0, &syms);

    core::KeyEvent key{};
    key.keycode = event->keycode;
    key.keysym = count > 0 ? xkb_keysym_to_lower(syms[0]) : XKB_KEY_NoSymbol;
    key.pressed = event->state == WL_KEYBOARD_KEY_STATE_PRESSED;
    key.time_ms = event->time_msec;

    wlr_seat_set_keyboard(seat, hooks->keyboard);
    core->key(seat_id(), key);
}

void WlrServer::Impl::update_capabilities() {
    uint32_t caps = WL_SEAT_CAPABILITY_POINTER;
    if (!keyboards.empty()) {
        caps |= WL_SEAT_CAPABILITY_KEYBOARD;
    }
    if (has_touch) {
        caps |= WL_SEAT_CAPABILITY_TOUCH;
    }
    wlr_seat_set_capabilities(seat, caps);
}

// =============================================================================
// Pointer constraints
// =============================================================================

void WlrServer::Impl::handle_new_pointer_constraint(wlr_pointer_constraint_v1* constraint) {
    auto hooks = std::make_unique<ConstraintHooks>();
    hooks->impl = this;
    hooks->constraint = constraint;
    listen(&constraint->events.set_region, hooks->set_region,
           [](wl_listener* listener, void* /*data*/) {
               auto* h = owner_of<ConstraintHooks>(listener, offsetof(ConstraintHooks, set_region));
               h->impl->handle_constraint_set_region(h);
           });
    listen(&constraint->events.destroy, hooks->destroy, [](wl_listener* listener,
                                                           void* /*data*/) {
        auto* h = owner_of<ConstraintHooks>(listener, offsetof(ConstraintHooks, destroy));
        h->impl->handle_constraint_destroy(h);
    });
    constraints.push_back(std::move(hooks));

    if (constraint->surface == seat->keyboard_state.focused_surface) {
        activate_constraint(constraint);
    }
}

void WlrServer::Impl::handle_constraint_set_region(ConstraintHooks* hooks) {
    if (active_constraint != hooks->constraint ||
        active_constraint->type != WLR_POINTER_CONSTRAINT_V1_CONFINED) {
        return;
    }
    // A zero move pulls the cursor back inside a region that shrank under it
    double dx = 0.0;
    double dy = 0.0;
    confine_motion(dx, dy);
    if (dx != 0.0 || dy != 0.0) {
        wlr_cursor_move(cursor, nullptr, dx, dy);
        if (core) {
            core->pointer_motion(seat_id(), {cursor->x, cursor->y}, now_msec());
        }
    }
}

void WlrServer::Impl::handle_constraint_destroy(ConstraintHooks* hooks) {
    if (active_constraint == hooks->constraint) {
        active_constraint = nullptr;
    }
    unlisten(hooks->set_region);
    unlisten(hooks->destroy);
    std::erase_if(constraints, [hooks](const auto& c) { return c.get() == hooks; });
}

void WlrServer::Impl::activate_constraint(wlr_pointer_constraint_v1* constraint) {
    if (active_constraint == constraint) {
        return;
    }
    deactivate_constraint();
    active_constraint = constraint;
    wlr_pointer_constraint_v1_send_activated(constraint);
    SCAPE_LOG_DEBUG("Pointer constraint activated: type={}",
                    constraint->type == WLR_POINTER_CONSTRAINT_V1_LOCKED ? "locked" : "confined");
}

void WlrServer::Impl::deactivate_constraint() {
    if (!active_constraint) {
        return;
    }
    wlr_pointer_constraint_v1_send_deactivated(active_constraint);
    SCAPE_LOG_DEBUG("Pointer constraint deactivated");
    active_constraint = nullptr;
}

void WlrServer::Impl::confine_motion(double& dx, double& dy) const {
    if (!core || !active_constraint ||
        active_constraint->type != WLR_POINTER_CONSTRAINT_V1_CONFINED ||
        !pixman_region32_not_empty(&active_constraint->region)) {
        return;
    }
    auto* hooks = find_surface(active_constraint->surface);
    if (!hooks) {
        return;
    }
    // Region is surface-local
    const core::Point origin = core->tree().surface_origin(hooks->id);
    const double local_x = cursor->x + dx - origin.x;
    const double local_y = cursor->y + dy - origin.y;
    if (pixman_region32_contains_point(&active_constraint->region,
                                       static_cast<int>(std::floor(local_x)),
                                       static_cast<int>(std::floor(local_y)), nullptr)) {
        return;
    }
    int box_count = 0;
    const pixman_box32_t* boxes =
        pixman_region32_rectangles(&active_constraint->region, &box_count);
    if (!boxes || box_count == 0) {
        return;
    }
    const auto& box = boxes[0];
    const double clamped_x =
        std::clamp(local_x, static_cast<double>(box.x1), static_cast<double>(box.x2 - 1));
    const double clamped_y =
        std::clamp(local_y, static_cast<double>(box.y1), static_cast<double>(box.y2 - 1));
    dx = clamped_x + origin.x - cursor->x;
    dy = clamped_y + origin.y - cursor->y;
}

// =============================================================================
// Lookup
// =============================================================================

auto WlrServer::Impl::find_surface(core::SurfaceId id) const -> SurfaceHooks* {
    for (const auto& hooks : surfaces) {
        if (hooks->id == id) {
            return hooks.get();
        }
    }
    return nullptr;
}

auto WlrServer::Impl::find_surface(const wlr_surface* surface) const -> SurfaceHooks* {
    for (const auto& hooks : surfaces) {
        if (hooks->surface == surface) {
            return hooks.get();
        }
    }
    return nullptr;
}

auto WlrServer::Impl::find_window(core::WindowId id) const -> SurfaceHooks* {
    for (const auto& hooks : surfaces) {
        if (hooks->window == id) {
            return hooks.get();
        }
    }
    return nullptr;
}

auto WlrServer::Impl::find_output(core::OutputId id) const -> OutputHooks* {
    for (const auto& hooks : outputs) {
        if (hooks->id == id) {
            return hooks.get();
        }
    }
    return nullptr;
}

auto WlrServer::Impl::find_client(core::ClientId id) const -> ClientHooks* {
    for (const auto& hooks : clients) {
        if (hooks->id == id) {
            return hooks.get();
        }
    }
    return nullptr;
}

// =============================================================================
// WlrServer
// =============================================================================

WlrServer::WlrServer() : m_impl(std::make_unique<Impl>()) {}

WlrServer::~WlrServer() {
    stop();
}

auto WlrServer::create(const ServerOptions& options) -> ResultPtr<WlrServer> {
    SCAPE_PROFILE_FUNCTION();
    wlr_log_init(wlr_importance_from_log_level(get_logger()->level()), wlr_log_bridge);

    auto server = std::make_unique<WlrServer>();
    auto& impl = *server->m_impl;
    impl.options = options;

    auto backend = impl.setup_backend();
    if (!backend) {
        return make_result_ptr_error<WlrServer>(backend.error().code, backend.error().message);
    }
    auto protocols = impl.setup_protocols();
    if (!protocols) {
        return make_result_ptr_error<WlrServer>(protocols.error().code,
                                                protocols.error().message);
    }
    auto input = impl.setup_input();
    if (!input) {
        return make_result_ptr_error<WlrServer>(input.error().code, input.error().message);
    }
    return make_result_ptr(std::move(server));
}

void WlrServer::attach(core::Compositor& compositor) {
    m_impl->core = &compositor;
}

auto WlrServer::start() -> Result<void> {
    auto& impl = *m_impl;
    if (!impl.core) {
        return make_error<void>(ErrorCode::backend_init_failed,
                                "Server started before a compositor was attached");
    }

    const char* socket = wl_display_add_socket_auto(impl.display);
    if (!socket) {
        return make_error<void>(ErrorCode::backend_init_failed,
                                "Failed to bind a Wayland socket");
    }
    impl.socket_name = socket;

    if (!wlr_backend_start(impl.backend)) {
        return make_error<void>(ErrorCode::backend_init_failed, "Failed to start backend");
    }

    if (impl.options.backend == BackendKind::headless) {
        for (int i = 0; i < impl.options.headless_outputs; ++i) {
            if (!wlr_headless_add_output(impl.backend, HEADLESS_WIDTH, HEADLESS_HEIGHT)) {
                SCAPE_LOG_WARN("Failed to add headless output {}", i);
            }
        }
    }

    if (impl.options.xwayland) {
        auto xwayland = impl.setup_xwayland();
        if (!xwayland) {
            SCAPE_LOG_WARN("XWayland disabled: {}", xwayland.error().message);
        }
    }

    if (impl.cursor_manager) {
        wlr_cursor_set_xcursor(impl.cursor, impl.cursor_manager, "default");
    }
    SCAPE_LOG_INFO("Listening on WAYLAND_DISPLAY={}", impl.socket_name);
    return {};
}

void WlrServer::sync_outputs() {
    if (!m_impl->core) {
        return;
    }
    for (const auto& hooks : m_impl->outputs) {
        m_impl->apply_output(hooks.get());
    }
}

void WlrServer::flush_clients() {
    if (m_impl->display) {
        wl_display_flush_clients(m_impl->display);
    }
}

void WlrServer::stop() {
    auto& impl = *m_impl;
    if (!impl.display) {
        return;
    }
    impl.core = nullptr;

    if (impl.disconnect_idle) {
        wl_event_source_remove(impl.disconnect_idle);
        impl.disconnect_idle = nullptr;
    }
    if (impl.xwayland) {
        unlisten(impl.listeners.new_xwayland_surface);
        wlr_xwayland_destroy(impl.xwayland);
        impl.xwayland = nullptr;
    }
    wl_display_destroy_clients(impl.display);
    impl.detach_listeners();
    impl.release_imported_buffers();

    if (impl.backend) {
        wlr_backend_destroy(impl.backend);
        impl.backend = nullptr;
    }
    if (impl.cursor_manager) {
        wlr_xcursor_manager_destroy(impl.cursor_manager);
        impl.cursor_manager = nullptr;
    }
    if (impl.cursor) {
        wlr_cursor_destroy(impl.cursor);
        impl.cursor = nullptr;
    }
    if (impl.allocator) {
        wlr_allocator_destroy(impl.allocator);
        impl.allocator = nullptr;
    }
    if (impl.renderer) {
        wlr_renderer_destroy(impl.renderer);
        impl.renderer = nullptr;
    }
    if (impl.xkb_ctx) {
        xkb_context_unref(impl.xkb_ctx);
        impl.xkb_ctx = nullptr;
    }
    // Destroys the globals (seat, xdg-shell, compositor, output layout)
    wl_display_destroy(impl.display);
    impl.display = nullptr;
    impl.event_loop = nullptr;
    impl.session = nullptr;
}

auto WlrServer::display() const -> wl_display* {
    return m_impl->display;
}

auto WlrServer::event_loop() const -> wl_event_loop* {
    return m_impl->event_loop;
}

auto WlrServer::wayland_display() const -> std::string {
    return m_impl->socket_name;
}

auto WlrServer::x11_display() const -> std::string {
    if (!m_impl->xwayland || !m_impl->xwayland->display_name) {
        return {};
    }
    return m_impl->xwayland->display_name;
}

// =============================================================================
// ClientSink
// =============================================================================

void WlrServer::pointer_enter(core::SeatId /*seat*/, core::SurfaceId surface, core::Point local) {
    auto* hooks = m_impl->find_surface(surface);
    if (!hooks) {
        return;
    }
    wlr_seat_pointer_notify_enter(m_impl->seat, hooks->surface, local.x, local.y);
}

void WlrServer::pointer_leave(core::SeatId /*seat*/, core::SurfaceId surface) {
    auto* hooks = m_impl->find_surface(surface);
    if (hooks && m_impl->seat->pointer_state.focused_surface != hooks->surface) {
        return;
    }
    wlr_seat_pointer_notify_clear_focus(m_impl->seat);
    if (m_impl->cursor_manager) {
        wlr_cursor_set_xcursor(m_impl->cursor, m_impl->cursor_manager, "default");
    }
}

void WlrServer::pointer_motion(core::SeatId /*seat*/, core::SurfaceId surface, core::Point local,
                               uint32_t time_ms) {
    auto* hooks = m_impl->find_surface(surface);
    if (!hooks) {
        return;
    }
    if (m_impl->seat->pointer_state.focused_surface != hooks->surface) {
        wlr_seat_pointer_notify_enter(m_impl->seat, hooks->surface, local.x, local.y);
    }
    wlr_seat_pointer_notify_motion(m_impl->seat, time_ms, local.x, local.y);
}

void WlrServer::pointer_button(core::SeatId /*seat*/, core::SurfaceId surface, uint32_t button,
                               bool pressed, uint32_t time_ms) {
    if (!m_impl->find_surface(surface)) {
        return;
    }
    wlr_seat_pointer_notify_button(m_impl->seat, time_ms, button,
                                   pressed ? WL_POINTER_BUTTON_STATE_PRESSED
                                           : WL_POINTER_BUTTON_STATE_RELEASED);
}

void WlrServer::pointer_axis(core::SeatId /*seat*/, core::SurfaceId surface, bool horizontal,
                             double delta, uint32_t time_ms) {
    if (!m_impl->find_surface(surface)) {
        return;
    }
    wlr_seat_pointer_notify_axis(
        m_impl->seat, time_ms,
        horizontal ? WL_POINTER_AXIS_HORIZONTAL_SCROLL : WL_POINTER_AXIS_VERTICAL_SCROLL, delta, 0,
        WL_POINTER_AXIS_SOURCE_WHEEL, WL_POINTER_AXIS_RELATIVE_DIRECTION_IDENTICAL);
}

void WlrServer::keyboard_enter(core::SeatId /*seat*/, core::SurfaceId surface,
                               const std::vector<uint32_t>& pressed_keys) {
    auto* hooks = m_impl->find_surface(surface);
    if (!hooks) {
        return;
    }
    wlr_keyboard* keyboard = wlr_seat_get_keyboard(m_impl->seat);
    wlr_seat_keyboard_notify_enter(m_impl->seat, hooks->surface, pressed_keys.data(),
                                   pressed_keys.size(),
                                   keyboard ? &keyboard->modifiers : nullptr);

    // Constraints follow keyboard focus
    m_impl->deactivate_constraint();
    if (m_impl->pointer_constraints) {
        if (auto* constraint = wlr_pointer_constraints_v1_constraint_for_surface(
                m_impl->pointer_constraints, hooks->surface, m_impl->seat)) {
            m_impl->activate_constraint(constraint);
        }
    }
}

void WlrServer::keyboard_leave(core::SeatId /*seat*/, core::SurfaceId surface) {
    auto* hooks = m_impl->find_surface(surface);
    if (hooks && m_impl->seat->keyboard_state.focused_surface != hooks->surface) {
        return;
    }
    m_impl->deactivate_constraint();
    wlr_seat_keyboard_notify_clear_focus(m_impl->seat);
}

void WlrServer::key(core::SeatId /*seat*/, core::SurfaceId surface, uint32_t keycode,
                    bool pressed, uint32_t time_ms) {
    auto* hooks = m_impl->find_surface(surface);
    if (!hooks || m_impl->seat->keyboard_state.focused_surface != hooks->surface) {
        return;
    }
    wlr_seat_keyboard_notify_key(m_impl->seat, time_ms, keycode,
                                 pressed ? WL_KEYBOARD_KEY_STATE_PRESSED
                                         : WL_KEYBOARD_KEY_STATE_RELEASED);
}

void WlrServer::modifiers(core::SeatId /*seat*/, core::SurfaceId surface, uint32_t /*mask*/) {
    // The seat forwards the full xkb state (depressed, latched, locked, group)
    auto* hooks = m_impl->find_surface(surface);
    wlr_keyboard* keyboard = wlr_seat_get_keyboard(m_impl->seat);
    if (!hooks || !keyboard) {
        return;
    }
    wlr_seat_keyboard_notify_modifiers(m_impl->seat, &keyboard->modifiers);
}

void WlrServer::touch_down(core::SeatId /*seat*/, core::SurfaceId surface, int32_t touch_id,
                           core::Point local, uint32_t time_ms) {
    auto* hooks = m_impl->find_surface(surface);
    if (!hooks) {
        return;
    }
    wlr_seat_touch_notify_down(m_impl->seat, hooks->surface, time_ms, touch_id, local.x,
                               local.y);
}

void WlrServer::touch_motion(core::SeatId /*seat*/, core::SurfaceId surface, int32_t touch_id,
                             core::Point local, uint32_t time_ms) {
    if (!m_impl->find_surface(surface)) {
        return;
    }
    wlr_seat_touch_notify_motion(m_impl->seat, time_ms, touch_id, local.x, local.y);
}

void WlrServer::touch_up(core::SeatId /*seat*/, core::SurfaceId surface, int32_t touch_id,
                         uint32_t time_ms) {
    if (!m_impl->find_surface(surface)) {
        return;
    }
    wlr_seat_touch_notify_up(m_impl->seat, time_ms, touch_id);
}

void WlrServer::configure(core::WindowId window, core::Size size, bool activated) {
    auto* hooks = m_impl->find_window(window);
    if (!hooks) {
        return;
    }
    if (hooks->toplevel) {
        if (!hooks->toplevel->base->initialized) {
            return;
        }
        wlr_xdg_toplevel_set_size(hooks->toplevel, size.width, size.height);
        wlr_xdg_toplevel_set_activated(hooks->toplevel, activated);
        return;
    }
    if (hooks->xsurface && m_impl->core) {
        const core::Window* info = m_impl->core->tree().find_window(window);
        if (!info) {
            return;
        }
        wlr_xwayland_surface_configure(hooks->xsurface, static_cast<int16_t>(info->geometry.x),
                                       static_cast<int16_t>(info->geometry.y),
                                       static_cast<uint16_t>(size.width),
                                       static_cast<uint16_t>(size.height));
        wlr_xwayland_surface_activate(hooks->xsurface, activated);
    }
}

void WlrServer::close(core::WindowId window) {
    auto* hooks = m_impl->find_window(window);
    if (!hooks) {
        return;
    }
    if (hooks->toplevel) {
        wlr_xdg_toplevel_send_close(hooks->toplevel);
    } else if (hooks->xsurface) {
        wlr_xwayland_surface_close(hooks->xsurface);
    }
}

void WlrServer::popup_done(core::SurfaceId popup) {
    auto* hooks = m_impl->find_surface(popup);
    if (hooks && hooks->popup) {
        wlr_xdg_popup_destroy(hooks->popup);
    }
}

void WlrServer::disconnect(core::ClientId client, const std::string& reason) {
    auto* hooks = m_impl->find_client(client);
    if (!hooks) {
        return;
    }
    SCAPE_LOG_WARN("Disconnecting client {}: {}", client, reason);
    wl_client_post_implementation_error(hooks->client, "%s", reason.c_str());
    // Destroying the client here would free resources still on the caller's stack
    m_impl->schedule_disconnect(hooks->client);
}

// =============================================================================
// RenderBackend
// =============================================================================

void WlrServer::Impl::release_imported_buffers() {
    for (auto& [token, imported] : imported_buffers) {
        wlr_buffer_unlock(imported.buffer);
    }
    imported_buffers.clear();
}

auto WlrServer::import_buffer(core::BufferHandle handle) -> std::optional<core::BufferToken> {
    // Handles are the wlr_client_buffer a surface committed
    auto* client_buffer = reinterpret_cast<wlr_client_buffer*>(static_cast<uintptr_t>(handle));
    if (!client_buffer || !client_buffer->texture) {
        return std::nullopt;
    }
    auto& impl = *m_impl;
    const core::BufferToken token = impl.next_buffer_token++;
    impl.imported_buffers.emplace(
        token, Impl::ImportedBuffer{.buffer = wlr_buffer_lock(&client_buffer->base),
                                    .texture = client_buffer->texture});
    return token;
}

void WlrServer::release_buffer(core::BufferToken token) {
    auto it = m_impl->imported_buffers.find(token);
    if (it == m_impl->imported_buffers.end()) {
        return;
    }
    wlr_buffer_unlock(it->second.buffer);
    m_impl->imported_buffers.erase(it);
}

auto WlrServer::compose(core::OutputId output, const std::vector<core::RenderItem>& items,
                        const core::Region& damage) -> core::ComposeOutcome {
    SCAPE_PROFILE_FUNCTION();
    auto& impl = *m_impl;
    auto* hooks = impl.find_output(output);
    const core::Output* info = impl.core ? impl.core->outputs().find(output) : nullptr;
    if (!hooks || !info || !info->enabled) {
        return {};
    }
    wlr_output* wlr_out = hooks->output;

    wlr_output_state state;
    wlr_output_state_init(&state);
    wlr_render_pass* pass = wlr_output_begin_render_pass(wlr_out, &state, nullptr, nullptr);
    if (!pass) {
        wlr_output_state_finish(&state);
        SCAPE_LOG_WARN("Render pass unavailable on {}", info->name);
        return {};
    }

    const core::Rect bounds = info->rect();
    const core::Point origin{static_cast<double>(bounds.x), static_cast<double>(bounds.y)};
    const double scale = info->scale;

    wlr_render_rect_options background{};
    background.box = wlr_box{.x = 0, .y = 0, .width = wlr_out->width, .height = wlr_out->height};
    background.color = BACKGROUND;
    wlr_render_pass_add_rect(pass, &background);

    const timespec now = now_timespec();
    // Items arrive top-first; paint bottom-up
    for (auto it = items.rbegin(); it != items.rend(); ++it) {
        auto* surface = impl.find_surface(it->surface);
        auto imported = impl.imported_buffers.find(it->buffer);
        if (!surface || imported == impl.imported_buffers.end()) {
            continue;
        }
        wlr_texture* texture = imported->second.texture;
        wlr_render_texture_options tex_opts{};
        tex_opts.texture = texture;
        tex_opts.src_box = wlr_fbox{
            .x = 0.0,
            .y = 0.0,
            .width = static_cast<double>(texture->width),
            .height = static_cast<double>(texture->height),
        };
        tex_opts.dst_box = scaled_box(it->rect, origin, scale);
        tex_opts.filter_mode = WLR_SCALE_FILTER_BILINEAR;
        tex_opts.blend_mode = WLR_RENDER_BLEND_MODE_PREMULTIPLIED;
        wlr_render_pass_add_texture(pass, &tex_opts);
        wlr_surface_send_frame_done(surface->surface, &now);
    }

    wlr_output_add_software_cursors_to_render_pass(wlr_out, pass, nullptr);
    if (!wlr_render_pass_submit(pass)) {
        wlr_output_state_finish(&state);
        return {};
    }

    pixman_region32_t frame_damage;
    pixman_region32_init(&frame_damage);
    for (const auto& rect : damage.rects()) {
        wlr_box box = scaled_box(rect, origin, scale);
        pixman_region32_union_rect(&frame_damage, &frame_damage, box.x, box.y,
                                   static_cast<unsigned>(box.width),
                                   static_cast<unsigned>(box.height));
    }
    wlr_output_state_set_damage(&state, &frame_damage);
    pixman_region32_fini(&frame_damage);

    core::ComposeOutcome outcome;
    if (wlr_output_commit_state(wlr_out, &state)) {
        outcome.result = core::ComposeResult::presented;
        outcome.buffer = reinterpret_cast<uintptr_t>(state.buffer);
    }
    wlr_output_state_finish(&state);
    SCAPE_PROFILE_FRAME("scape");
    return outcome;
}

void WlrServer::schedule_frame(core::OutputId output) {
    if (auto* hooks = m_impl->find_output(output)) {
        wlr_output_schedule_frame(hooks->output);
    }
}

// =============================================================================
// SessionControl
// =============================================================================

auto WlrServer::switch_vt(uint32_t vt) -> Result<void> {
    if (!m_impl->session) {
        return make_error<void>(ErrorCode::backend_init_failed,
                                "No session to switch VTs (nested or headless backend)");
    }
    if (!wlr_session_change_vt(m_impl->session, vt)) {
        return make_error<void>(ErrorCode::backend_init_failed,
                                "VT switch to " + std::to_string(vt) + " failed");
    }
    return {};
}

} // namespace scape::wlr
