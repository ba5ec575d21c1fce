#pragma once

#include "geometry.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scape::core {

struct OutputMode {
    int32_t width = 0;
    int32_t height = 0;
    int32_t refresh_mhz = 0;
};

/// @brief One display output in the global layout.
struct Output {
    OutputId id = INVALID_ID;
    std::string name;
    OutputMode mode;
    Point position;
    double scale = 1.0;
    bool enabled = true;
    bool pending_frame = false;
    bool degraded = false;
    bool hardware_sync = true;

    /// Global rectangle in logical coordinates (mode divided by scale).
    [[nodiscard]] auto rect() const -> Rect;
};

/// @brief Placement hint for a newly added output, usually from the layout snapshot.
struct OutputPlacementHint {
    Point position;
    double scale = 1.0;
    bool enabled = true;
};

/// @brief Authoritative output list in registry (insertion) order.
class OutputRegistry {
public:
    /// @brief Adds an output. Without a hint it is packed right of the rightmost output at y=0.
    /// @return The new output id.
    auto add(std::string name, OutputMode mode, bool hardware_sync,
             const std::optional<OutputPlacementHint>& hint = std::nullopt) -> OutputId;
    /// @brief Removes an output. Returns false when the id is unknown.
    auto remove(OutputId id) -> bool;

    [[nodiscard]] auto find(OutputId id) -> Output*;
    [[nodiscard]] auto find(OutputId id) const -> const Output*;
    [[nodiscard]] auto find_by_name(std::string_view name) const -> const Output*;
    [[nodiscard]] auto outputs() const -> const std::vector<Output>& { return m_outputs; }
    [[nodiscard]] auto empty() const -> bool { return m_outputs.empty(); }

    [[nodiscard]] auto first_enabled() const -> const Output*;
    /// First enabled output (registry order) whose rectangle contains @p p.
    [[nodiscard]] auto output_at(Point p) const -> const Output*;
    /// Enabled output closest to @p p, excluding @p exclude. Ties keep registry order.
    [[nodiscard]] auto nearest_enabled(Point p, OutputId exclude = INVALID_ID) const
        -> const Output*;
    /// Union bounding box of all enabled outputs.
    [[nodiscard]] auto layout_bounds() const -> Rect;
    /// Clamps @p p into the closest enabled output.
    [[nodiscard]] auto clamp_to_layout(Point p) const -> Point;

    auto set_position(OutputId id, Point position) -> bool;
    auto set_scale(OutputId id, double scale) -> bool;
    auto set_enabled(OutputId id, bool enabled) -> bool;
    auto set_mode(OutputId id, OutputMode mode) -> bool;

private:
    std::vector<Output> m_outputs;
    OutputId m_next_id = 1;
};

} // namespace scape::core
