#pragma once

#include "geometry.hpp"
#include "seat.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <util/error.hpp>
#include <utility>
#include <variant>
#include <vector>

namespace scape::core {

/// @brief Handle to a script function kept alive by the policy engine.
using CallbackRef = int;

namespace action {
struct None {};
struct Quit {};
struct VtSwitch {
    uint32_t vt = 1;
};
struct Spawn {
    std::string command;
};
struct FocusOrSpawn {
    std::string app_id;
    std::string command;
};
struct MoveToZone {
    std::string zone;
};
struct Tab {
    uint32_t index = 0;
};
struct CloseWindow {};
struct Callback {
    CallbackRef ref = 0;
};
} // namespace action

using Action = std::variant<action::None, action::Quit, action::VtSwitch, action::Spawn,
                            action::FocusOrSpawn, action::MoveToZone, action::Tab,
                            action::CloseWindow, action::Callback>;

[[nodiscard]] auto action_name(const Action& action) -> const char*;

struct Binding {
    uint32_t modifiers = 0;
    uint32_t keysym = 0;
    Action action;
    bool consume = true;
};

/// @brief Exact (modifier set, keysym) lookup. Replaced wholesale, never patched.
class BindingTable {
public:
    BindingTable() = default;
    explicit BindingTable(const std::vector<Binding>& bindings);

    /// Only modifiers in modifier::BINDING_MASK take part in matching.
    [[nodiscard]] auto find(uint32_t modifiers, uint32_t keysym) const -> const Binding*;
    [[nodiscard]] auto size() const -> size_t { return m_bindings.size(); }
    [[nodiscard]] auto empty() const -> bool { return m_bindings.empty(); }

private:
    std::map<std::pair<uint32_t, uint32_t>, Binding> m_bindings;
};

enum class WindowKind : uint8_t {
    any,
    wayland,
    xwayland,
};

struct PlacementMatcher {
    std::optional<std::string> app_id;
    std::optional<std::string> title_contains;
    WindowKind kind = WindowKind::any;
};

struct PlacementDirective {
    std::optional<std::string> output;
    std::optional<std::string> zone;
    /// Relative to the chosen output's origin.
    std::optional<Point> position;
    std::optional<Size> size;
    std::optional<bool> focus;
    std::optional<bool> click_through;
};

struct PlacementRule {
    PlacementMatcher matcher;
    PlacementDirective directive;

    [[nodiscard]] auto matches(std::string_view app_id, std::string_view title,
                               bool xwayland) const -> bool;
};

struct Zone {
    std::string name;
    Rect rect;
    bool is_default = false;
};

/// @brief Everything a successful script load produces.
struct PolicyTables {
    std::vector<Binding> bindings;
    std::vector<PlacementRule> rules;
    std::vector<Zone> zones;
    uint32_t tick_interval_ms = 0;
};

struct WindowInfo {
    WindowId id = INVALID_ID;
    std::string app_id;
    std::string title;
    bool xwayland = false;
    Rect geometry;
    std::string output;
    bool focused = false;
    bool mapped = false;
};

struct OutputInfo {
    OutputId id = INVALID_ID;
    std::string name;
    Rect rect;
    double scale = 1.0;
    bool enabled = false;
};

struct OutputChange {
    std::optional<Point> position;
    std::optional<double> scale;
    std::optional<bool> enabled;
};

/// @brief Narrow surface of compositor operations a policy script may call.
class PolicyHost {
public:
    virtual ~PolicyHost() = default;

    virtual void spawn(const std::string& command) = 0;
    virtual void focus_or_spawn(const std::string& app_id, const std::string& command) = 0;
    virtual auto move_to_zone(const std::string& zone) -> bool = 0;
    virtual auto focus_window(WindowId window) -> bool = 0;
    virtual auto close_window(WindowId window) -> bool = 0;
    [[nodiscard]] virtual auto window_infos() const -> std::vector<WindowInfo> = 0;
    [[nodiscard]] virtual auto output_infos() const -> std::vector<OutputInfo> = 0;
    virtual auto configure_output(const std::string& name, const OutputChange& change)
        -> bool = 0;
    /// @brief Grabs the default seat for @p window. False if the seat already holds a grab or
    /// the window is not mapped.
    virtual auto grab_input(WindowId window, GrabKind kind) -> bool = 0;
    /// @brief Releases the default seat's grab. False if it held none.
    virtual auto release_input() -> bool = 0;
    virtual void quit() = 0;
};

/// @brief Sandboxed script runtime producing policy tables and answering hook points.
///
/// Every hook returns an error instead of throwing; callers log it and carry on.
class PolicyEngine {
public:
    virtual ~PolicyEngine() = default;

    /// @brief Evaluates @p source in a fresh interpreter. The current interpreter is replaced
    /// only on success.
    [[nodiscard]] virtual auto load(std::string_view source, std::string_view chunk_name)
        -> Result<PolicyTables> = 0;

    [[nodiscard]] virtual auto on_startup() -> Result<void> = 0;
    [[nodiscard]] virtual auto on_window_map(const WindowInfo& window) -> Result<void> = 0;
    [[nodiscard]] virtual auto on_window_unmap(const WindowInfo& window) -> Result<void> = 0;
    [[nodiscard]] virtual auto on_output_change(const std::vector<OutputInfo>& outputs)
        -> Result<void> = 0;
    [[nodiscard]] virtual auto on_tick() -> Result<void> = 0;
    [[nodiscard]] virtual auto invoke_callback(CallbackRef ref) -> Result<void> = 0;
};

} // namespace scape::core
