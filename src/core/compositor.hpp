#pragma once

#include "frame_scheduler.hpp"
#include "hook_queue.hpp"
#include "input_router.hpp"
#include "interfaces.hpp"
#include "layout_snapshot.hpp"
#include "output_registry.hpp"
#include "policy.hpp"
#include "screencast.hpp"
#include "seat.hpp"
#include "surface_tree.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <util/config.hpp>
#include <util/error.hpp>

namespace scape::core {

struct CompositorConfig {
    RouterConfig input;
    BackoffPolicy backoff;
    uint32_t max_clients = 128;
    uint32_t max_surfaces = 4096;
    ScreencastPolicy screencast_policy = ScreencastPolicy::best_effort;
    std::chrono::milliseconds screencast_interval{100};
    std::chrono::milliseconds reload_debounce{200};
    std::chrono::milliseconds tick_interval{0};
};

[[nodiscard]] auto compositor_config_from(const Config& config) -> CompositorConfig;

/// @brief External collaborators the compositor drives. All must outlive the compositor.
struct Collaborators {
    RenderBackend& render;
    ClientSink& sink;
    ProcessLauncher& launcher;
    SessionControl& session;
    std::function<Clock::time_point()> clock = [] { return Clock::now(); };
};

/// @brief Process-lifetime context object owning every piece of compositor state.
///
/// Every entry point runs on the loop thread. Backend glue, the remote control and tests only
/// talk to this class; the components it owns never call back into the glue directly.
class Compositor final : public DamageListener,
                         public FrameTarget,
                         public PolicyHost,
                         public BindingHandler {
public:
    Compositor(Collaborators collaborators, CompositorConfig config);
    ~Compositor() override;

    Compositor(const Compositor&) = delete;
    Compositor& operator=(const Compositor&) = delete;
    Compositor(Compositor&&) = delete;
    Compositor& operator=(Compositor&&) = delete;

    void set_policy_engine(std::unique_ptr<PolicyEngine> engine);
    /// @brief Variables added to every spawned process (WAYLAND_DISPLAY, DISPLAY).
    void set_spawn_environment(std::map<std::string, std::string> env);
    void set_quit_handler(std::function<void()> handler);
    /// @brief Layout hints used when outputs appear; restores seat pointers immediately.
    void set_snapshot(LayoutSnapshot snapshot);
    [[nodiscard]] auto snapshot() const -> LayoutSnapshot;

    // Policy
    /// @brief Loads the script at @p path right away. On failure the previous tables stay.
    [[nodiscard]] auto load_policy(const std::filesystem::path& path) -> Result<void>;
    /// @brief Debounced reload of the current script; calls inside the window coalesce.
    void request_reload();
    /// @brief Runs the startup hook. Call once after the first load.
    void startup();

    // Outputs
    auto output_added(std::string name, OutputMode mode, bool hardware_sync) -> OutputId;
    void output_removed(OutputId id);
    auto configure_output(OutputId id, const OutputChange& change) -> bool;
    /// @brief Backend frame event: previous frame presented, next opportunity open.
    void frame_done(OutputId id);

    // Clients and surfaces
    [[nodiscard]] auto client_connected(ClientId client) -> Result<void>;
    void client_disconnected(ClientId client);
    void protocol_violation(ClientId client, const std::string& reason);
    [[nodiscard]] auto create_surface(ClientId client, SurfaceRole role = SurfaceRole::none,
                                      SurfaceId parent = INVALID_ID, Point offset = {})
        -> Result<SurfaceId>;
    void destroy_surface(SurfaceId surface);
    [[nodiscard]] auto commit(SurfaceId surface, std::optional<BufferHandle> buffer, Size size,
                              const Region& damage) -> Result<void>;
    [[nodiscard]] auto create_window(SurfaceId surface, std::string app_id, std::string title,
                                     bool xwayland) -> Result<WindowId>;
    void set_window_identity(WindowId window, std::string app_id, std::string title);
    [[nodiscard]] auto map_window(WindowId window, std::optional<OutputId> output_hint = {})
        -> Result<Placement>;
    void unmap_window(WindowId window);
    auto restack_window(WindowId window, StackDirection direction) -> bool;
    auto move_window(WindowId window, Point position) -> bool;
    auto resize_window(WindowId window, Size size) -> bool;
    /// @brief Moves a popup or subsurface relative to its parent.
    auto set_surface_offset(SurfaceId surface, Point offset) -> bool;
    [[nodiscard]] auto request_grab(SeatId seat, GrabKind kind, WindowId window) -> Result<void>;
    auto release_grab(SeatId seat) -> bool;
    /// @brief Client popup grab: the popup's window takes the seat's pointer until the popup
    /// is destroyed.
    [[nodiscard]] auto request_popup_grab(SeatId seat, SurfaceId popup) -> Result<void>;

    // Input
    auto key(SeatId seat, const KeyEvent& event) -> KeyDisposition;
    void modifiers(SeatId seat, uint32_t mask);
    void pointer_motion(SeatId seat, Point position, uint32_t time_ms);
    void pointer_motion_relative(SeatId seat, double dx, double dy, uint32_t time_ms);
    void pointer_button(SeatId seat, uint32_t button, bool pressed, uint32_t time_ms);
    void pointer_axis(SeatId seat, bool horizontal, double delta, uint32_t time_ms);
    void touch_down(SeatId seat, int32_t touch_id, Point position, uint32_t time_ms);
    void touch_motion(SeatId seat, int32_t touch_id, Point position, uint32_t time_ms);
    void touch_up(SeatId seat, int32_t touch_id, uint32_t time_ms);

    /// @brief Runs @p work through the hook queue (remote control requests).
    auto submit_hook(std::string name, std::function<void()> work) -> bool;

    /// @brief Fires every expired deadline: reload debounce, frame retries, policy tick,
    /// periodic screencast.
    void tick();
    /// @brief Earliest time tick() has work to do.
    [[nodiscard]] auto next_deadline() const -> std::optional<Clock::time_point>;

    [[nodiscard]] auto quit_requested() const -> bool { return m_quit; }
    [[nodiscard]] auto default_seat() const -> SeatId { return m_seat; }
    [[nodiscard]] auto outputs() const -> const OutputRegistry& { return m_outputs; }
    [[nodiscard]] auto seats() const -> const SeatState& { return m_seats; }
    [[nodiscard]] auto tree() const -> const SurfaceTree& { return m_tree; }
    [[nodiscard]] auto router() const -> const InputRouter& { return m_router; }
    [[nodiscard]] auto hooks() const -> const HookQueue& { return m_hooks; }
    [[nodiscard]] auto scheduler(OutputId output) const -> const FrameScheduler*;
    [[nodiscard]] auto screencast() -> ScreencastHub& { return m_screencast; }
    [[nodiscard]] auto focused_window(SeatId seat) const -> std::optional<WindowId>;
    [[nodiscard]] auto find_window_by_app_id(std::string_view app_id) const
        -> std::optional<WindowId>;
    [[nodiscard]] auto window_info(WindowId window) const -> std::optional<WindowInfo>;
    [[nodiscard]] auto reload_count() const -> uint64_t { return m_reload_count; }

    // DamageListener
    void on_damage(OutputId output, const Region& damage) override;

    // FrameTarget
    auto submit_frame(OutputId output, const Region& damage) -> bool override;
    void schedule_frame(OutputId output) override;

    // PolicyHost
    void spawn(const std::string& command) override;
    void focus_or_spawn(const std::string& app_id, const std::string& command) override;
    auto move_to_zone(const std::string& zone) -> bool override;
    auto focus_window(WindowId window) -> bool override;
    auto close_window(WindowId window) -> bool override;
    [[nodiscard]] auto window_infos() const -> std::vector<WindowInfo> override;
    [[nodiscard]] auto output_infos() const -> std::vector<OutputInfo> override;
    auto configure_output(const std::string& name, const OutputChange& change) -> bool override;
    auto grab_input(WindowId window, GrabKind kind) -> bool override;
    auto release_input() -> bool override;
    void quit() override;

    // BindingHandler
    void run_binding(SeatId seat, const Binding& binding) override;

private:
    [[nodiscard]] auto now() const -> Clock::time_point { return m_clock(); }
    void run_action(SeatId seat, const Action& action);
    void reload_now();
    void apply_tables(PolicyTables tables);
    void after_unmap(const UnmapResult& result);
    void release_popup_grabs(SurfaceId popup, WindowId owner);
    void fallback_focus(SeatId seat);
    void refresh_pointers();
    void sync_output_flags(OutputId output);
    void notify_output_change();
    void report(const char* hook, const Result<void>& result) const;
    [[nodiscard]] auto scheduler_mut(OutputId output) -> FrameScheduler*;
    [[nodiscard]] auto pointer_output(SeatId seat) const -> const Output*;

    RenderBackend& m_render;
    ClientSink& m_sink;
    ProcessLauncher& m_launcher;
    SessionControl& m_session;
    std::function<Clock::time_point()> m_clock;
    CompositorConfig m_config;

    OutputRegistry m_outputs;
    SeatState m_seats;
    SurfaceTree m_tree;
    InputRouter m_router;
    HookQueue m_hooks;
    ScreencastHub m_screencast;
    std::map<OutputId, std::unique_ptr<FrameScheduler>> m_schedulers;
    std::map<OutputId, uint64_t> m_last_buffer;
    std::map<SeatId, SurfaceId> m_popup_grabs;
    std::unique_ptr<PolicyEngine> m_engine;

    SeatId m_seat = INVALID_ID;
    std::set<ClientId> m_clients;
    std::map<std::string, std::string> m_spawn_env;
    std::function<void()> m_quit_handler;
    LayoutSnapshot m_snapshot;

    std::filesystem::path m_script_path;
    std::optional<Clock::time_point> m_reload_due;
    bool m_composing = false;
    bool m_reload_after_compose = false;
    uint64_t m_reload_count = 0;
    std::chrono::milliseconds m_tick_interval{0};
    std::optional<Clock::time_point> m_next_policy_tick;
    bool m_quit = false;
};

} // namespace scape::core
