#pragma once

#include "geometry.hpp"
#include "output_registry.hpp"
#include "policy.hpp"
#include "seat.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace scape::core {

enum class SurfaceRole : uint8_t {
    none,
    toplevel,
    popup,
    subsurface,
    cursor,
};

struct Surface {
    SurfaceId id = INVALID_ID;
    ClientId client = INVALID_ID;
    SurfaceRole role = SurfaceRole::none;
    std::optional<BufferToken> buffer;
    Size size;
    /// Surface-local damage not yet composed on every output in pending_outputs.
    Region damage;
    std::set<OutputId> pending_outputs;
    SurfaceId parent = INVALID_ID;
    Point offset;
    /// Window this surface belongs to (its own, or the one its parent chain leads to).
    WindowId window = INVALID_ID;
};

struct Window {
    WindowId id = INVALID_ID;
    SurfaceId surface = INVALID_ID;
    std::string app_id;
    std::string title;
    bool xwayland = false;
    Rect geometry;
    bool mapped = false;
    /// Mapped while no enabled output existed; placed once one appears.
    bool detached = false;
    std::set<OutputId> outputs;
    OutputId home = INVALID_ID;
    bool focusable = true;
    bool click_through = false;
    std::vector<SurfaceId> popups;
};

enum class StackDirection : uint8_t {
    raise,
    lower,
    up,
    down,
};

/// @brief Receives damage in global coordinates, already clipped to one output.
class DamageListener {
public:
    virtual ~DamageListener() = default;
    virtual void on_damage(OutputId output, const Region& damage) = 0;
};

struct Placement {
    OutputId output = INVALID_ID;
    Rect geometry;
    bool detached = false;
    bool focus = true;
    /// The requested output was missing or disabled.
    bool fell_back = false;
};

struct UnmapResult {
    Rect vacated;
    std::vector<SurfaceId> detached_popups;
    std::vector<SeatId> lost_focus;
};

struct HitResult {
    WindowId window = INVALID_ID;
    SurfaceId surface = INVALID_ID;
    Point local;
};

/// @brief Surfaces, windows and per-output stacking order.
///
/// Stacking is kept as one global bottom-to-top order of mapped windows; each output's stack is
/// that order filtered by membership, so indices are unique per output by construction.
class SurfaceTree {
public:
    SurfaceTree(OutputRegistry& outputs, SeatState& seats, DamageListener& listener);

    auto create_surface(ClientId client, SurfaceRole role = SurfaceRole::none,
                        SurfaceId parent = INVALID_ID, Point offset = {}) -> SurfaceId;
    /// @brief Destroys a surface. A window rooted on it is unmapped and destroyed as well.
    auto destroy_surface(SurfaceId id) -> std::optional<UnmapResult>;
    /// @brief Latches a new buffer and accumulates surface-local damage.
    [[nodiscard]] auto commit(SurfaceId id, std::optional<BufferToken> buffer, Size size,
                              const Region& damage) -> Result<void>;
    auto set_offset(SurfaceId id, Point offset) -> bool;

    [[nodiscard]] auto create_window(SurfaceId surface, std::string app_id, std::string title,
                                     bool xwayland) -> Result<WindowId>;
    auto set_window_identity(WindowId id, std::string app_id, std::string title) -> bool;

    [[nodiscard]] auto map(WindowId id, std::optional<OutputId> output_hint,
                           std::optional<Point> pointer) -> Result<Placement>;
    /// @brief Unmaps a window. Returns nullopt when it was not mapped.
    auto unmap(WindowId id) -> std::optional<UnmapResult>;

    auto restack(WindowId id, StackDirection direction) -> bool;
    auto move(WindowId id, Point position) -> bool;
    auto resize(WindowId id, Size size) -> bool;
    auto set_click_through(WindowId id, bool click_through) -> bool;
    auto mark_damaged(SurfaceId id, const Region& local_damage) -> bool;

    /// Top-to-bottom.
    [[nodiscard]] auto windows_on(OutputId output) const -> std::vector<WindowId>;
    [[nodiscard]] auto hit_test(Point point) const -> std::optional<HitResult>;

    void set_placement_rules(std::vector<PlacementRule> rules);
    void set_zones(std::vector<Zone> zones);
    [[nodiscard]] auto zones() const -> const std::vector<Zone>& { return m_zones; }
    [[nodiscard]] auto find_zone(std::string_view name) const -> const Zone*;
    [[nodiscard]] auto placement_rules() const -> const std::vector<PlacementRule>& {
        return m_rules;
    }

    /// @brief Clears damage of surfaces whose every pending output has now composed.
    void frame_composed(OutputId output);

    /// @brief Places detached windows and recomputes membership after a new output appears.
    auto output_added(OutputId id) -> std::vector<WindowId>;
    /// @brief Moves windows living only on @p id to the nearest enabled output.
    /// @param old_rect The output's rectangle before it went away.
    /// @return Re-homed windows.
    auto output_removed(OutputId id, Rect old_rect) -> std::vector<WindowId>;
    /// @brief Recomputes membership of every mapped window after a layout change.
    void layout_changed();

    [[nodiscard]] auto find_surface(SurfaceId id) const -> const Surface*;
    [[nodiscard]] auto find_window(WindowId id) const -> const Window*;
    [[nodiscard]] auto window_for_surface(SurfaceId id) const -> std::optional<WindowId>;
    [[nodiscard]] auto surface_origin(SurfaceId id) const -> Point;
    [[nodiscard]] auto surface_rect(SurfaceId id) const -> Rect;
    [[nodiscard]] auto surfaces_of(ClientId client) const -> std::vector<SurfaceId>;
    /// Subsurfaces attached anywhere below @p window, in creation order.
    [[nodiscard]] auto subsurfaces_of(WindowId window) const -> std::vector<SurfaceId>;
    [[nodiscard]] auto surface_count() const -> size_t { return m_surfaces.size(); }
    [[nodiscard]] auto windows() const -> const std::map<WindowId, Window>& { return m_windows; }
    /// Mapped windows, bottom-to-top.
    [[nodiscard]] auto stacking_order() const -> const std::vector<WindowId>& { return m_order; }

private:
    auto find_surface_mut(SurfaceId id) -> Surface*;
    auto find_window_mut(WindowId id) -> Window*;
    [[nodiscard]] auto match_rule(const Window& window) const -> const PlacementRule*;
    auto resolve_target(const PlacementRule* rule, std::optional<OutputId> hint,
                        std::optional<Point> pointer, bool& fell_back) const -> const Output*;
    void place_on(Window& window, const Output& output, const PlacementRule* rule);
    void recompute_outputs(Window& window);
    void rebuild_stacks();
    void damage_rect(const Rect& rect, const std::set<OutputId>& outputs);
    void damage_surface_global(Surface& surface, const Region& global);
    void detach_children(SurfaceId parent);

    OutputRegistry& m_outputs;
    SeatState& m_seats;
    DamageListener& m_listener;

    std::map<SurfaceId, Surface> m_surfaces;
    std::map<WindowId, Window> m_windows;
    std::vector<WindowId> m_order;
    std::map<OutputId, std::vector<WindowId>> m_stacks;
    std::vector<PlacementRule> m_rules;
    std::vector<Zone> m_zones;
    SurfaceId m_next_surface = 1;
    WindowId m_next_window = 1;
};

} // namespace scape::core
