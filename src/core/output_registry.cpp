#include "output_registry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace scape::core {

auto Output::rect() const -> Rect {
    double s = scale > 0.0 ? scale : 1.0;
    return {static_cast<int32_t>(std::lround(position.x)),
            static_cast<int32_t>(std::lround(position.y)),
            static_cast<int32_t>(std::lround(mode.width / s)),
            static_cast<int32_t>(std::lround(mode.height / s))};
}

auto OutputRegistry::add(std::string name, OutputMode mode, bool hardware_sync,
                         const std::optional<OutputPlacementHint>& hint) -> OutputId {
    Output output;
    output.id = m_next_id++;
    output.name = std::move(name);
    output.mode = mode;
    output.hardware_sync = hardware_sync;

    if (hint) {
        output.position = hint->position;
        output.scale = hint->scale > 0.0 ? hint->scale : 1.0;
        output.enabled = hint->enabled;
    } else {
        int32_t right_edge = 0;
        for (const auto& existing : m_outputs) {
            right_edge = std::max(right_edge, existing.rect().right());
        }
        output.position = {static_cast<double>(right_edge), 0.0};
    }

    m_outputs.push_back(std::move(output));
    return m_outputs.back().id;
}

auto OutputRegistry::remove(OutputId id) -> bool {
    return std::erase_if(m_outputs, [id](const Output& o) { return o.id == id; }) > 0;
}

auto OutputRegistry::find(OutputId id) -> Output* {
    auto it = std::find_if(m_outputs.begin(), m_outputs.end(),
                           [id](const Output& o) { return o.id == id; });
    return it == m_outputs.end() ? nullptr : &*it;
}

auto OutputRegistry::find(OutputId id) const -> const Output* {
    auto it = std::find_if(m_outputs.begin(), m_outputs.end(),
                           [id](const Output& o) { return o.id == id; });
    return it == m_outputs.end() ? nullptr : &*it;
}

auto OutputRegistry::find_by_name(std::string_view name) const -> const Output* {
    auto it = std::find_if(m_outputs.begin(), m_outputs.end(),
                           [name](const Output& o) { return o.name == name; });
    return it == m_outputs.end() ? nullptr : &*it;
}

auto OutputRegistry::first_enabled() const -> const Output* {
    auto it = std::find_if(m_outputs.begin(), m_outputs.end(),
                           [](const Output& o) { return o.enabled; });
    return it == m_outputs.end() ? nullptr : &*it;
}

auto OutputRegistry::output_at(Point p) const -> const Output* {
    for (const auto& output : m_outputs) {
        if (output.enabled && output.rect().contains(p)) {
            return &output;
        }
    }
    return nullptr;
}

auto OutputRegistry::nearest_enabled(Point p, OutputId exclude) const -> const Output* {
    const Output* best = nullptr;
    double best_distance = std::numeric_limits<double>::max();
    for (const auto& output : m_outputs) {
        if (!output.enabled || output.id == exclude) {
            continue;
        }
        double d = output.rect().distance_squared(p);
        if (d < best_distance) {
            best_distance = d;
            best = &output;
        }
    }
    return best;
}

auto OutputRegistry::layout_bounds() const -> Rect {
    Region region;
    for (const auto& output : m_outputs) {
        if (output.enabled) {
            region.add(output.rect());
        }
    }
    return region.extents();
}

auto OutputRegistry::clamp_to_layout(Point p) const -> Point {
    if (output_at(p) != nullptr) {
        return p;
    }
    const Output* nearest = nearest_enabled(p);
    if (nearest == nullptr) {
        return p;
    }
    Rect r = nearest->rect();
    // Far edges are exclusive; stay one unit inside.
    return {std::clamp(p.x, static_cast<double>(r.x), static_cast<double>(r.right() - 1)),
            std::clamp(p.y, static_cast<double>(r.y), static_cast<double>(r.bottom() - 1))};
}

auto OutputRegistry::set_position(OutputId id, Point position) -> bool {
    auto* output = find(id);
    if (output == nullptr) {
        return false;
    }
    output->position = position;
    return true;
}

auto OutputRegistry::set_scale(OutputId id, double scale) -> bool {
    auto* output = find(id);
    if (output == nullptr || !(scale > 0.0)) {
        return false;
    }
    output->scale = scale;
    return true;
}

auto OutputRegistry::set_enabled(OutputId id, bool enabled) -> bool {
    auto* output = find(id);
    if (output == nullptr) {
        return false;
    }
    output->enabled = enabled;
    return true;
}

auto OutputRegistry::set_mode(OutputId id, OutputMode mode) -> bool {
    auto* output = find(id);
    if (output == nullptr) {
        return false;
    }
    output->mode = mode;
    return true;
}

} // namespace scape::core
