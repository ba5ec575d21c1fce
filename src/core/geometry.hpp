#pragma once

#include <algorithm>
#include <cstdint>
#include <vector>

namespace scape::core {

using OutputId = uint32_t;
using SurfaceId = uint32_t;
using WindowId = uint32_t;
using SeatId = uint32_t;
using ClientId = uint32_t;

/// @brief Client buffer as the protocol layer identifies it.
using BufferHandle = uint64_t;
/// @brief Render-ready buffer issued by RenderBackend::import_buffer().
using BufferToken = uint64_t;

/// @brief Reserved id value meaning "no object".
inline constexpr uint32_t INVALID_ID = 0;

struct Point {
    double x = 0.0;
    double y = 0.0;

    [[nodiscard]] auto operator==(const Point&) const -> bool = default;
};

struct Size {
    int32_t width = 0;
    int32_t height = 0;

    [[nodiscard]] auto operator==(const Size&) const -> bool = default;
};

/// @brief Axis-aligned rectangle in global (layout) coordinates, half-open on the far edges.
struct Rect {
    int32_t x = 0;
    int32_t y = 0;
    int32_t width = 0;
    int32_t height = 0;

    [[nodiscard]] auto operator==(const Rect&) const -> bool = default;

    [[nodiscard]] auto empty() const -> bool { return width <= 0 || height <= 0; }
    [[nodiscard]] auto right() const -> int32_t { return x + width; }
    [[nodiscard]] auto bottom() const -> int32_t { return y + height; }

    [[nodiscard]] auto contains(Point p) const -> bool {
        return !empty() && p.x >= x && p.y >= y && p.x < right() && p.y < bottom();
    }

    [[nodiscard]] auto intersects(const Rect& other) const -> bool {
        return !empty() && !other.empty() && x < other.right() && other.x < right() &&
               y < other.bottom() && other.y < bottom();
    }

    [[nodiscard]] auto intersection(const Rect& other) const -> Rect {
        if (!intersects(other)) {
            return {};
        }
        int32_t nx = std::max(x, other.x);
        int32_t ny = std::max(y, other.y);
        return {nx, ny, std::min(right(), other.right()) - nx,
                std::min(bottom(), other.bottom()) - ny};
    }

    [[nodiscard]] auto translated(int32_t dx, int32_t dy) const -> Rect {
        return {x + dx, y + dy, width, height};
    }

    [[nodiscard]] auto center() const -> Point {
        return {x + width / 2.0, y + height / 2.0};
    }

    /// Squared distance from @p p to the closest point of this rectangle; zero when inside.
    [[nodiscard]] auto distance_squared(Point p) const -> double {
        double cx = std::clamp(p.x, static_cast<double>(x), static_cast<double>(right()));
        double cy = std::clamp(p.y, static_cast<double>(y), static_cast<double>(bottom()));
        return (p.x - cx) * (p.x - cx) + (p.y - cy) * (p.y - cy);
    }
};

/// @brief Set of rectangles. Rectangles may overlap; consumers only need coverage.
class Region {
public:
    Region() = default;
    explicit Region(Rect rect) { add(rect); }

    void add(Rect rect) {
        if (rect.empty()) {
            return;
        }
        for (const auto& existing : m_rects) {
            if (existing.intersection(rect) == rect) {
                return;
            }
        }
        std::erase_if(m_rects, [&](const Rect& r) { return rect.intersection(r) == r; });
        m_rects.push_back(rect);
    }

    void add(const Region& other) {
        for (const auto& r : other.m_rects) {
            add(r);
        }
    }

    void clear() { m_rects.clear(); }

    [[nodiscard]] auto empty() const -> bool { return m_rects.empty(); }
    [[nodiscard]] auto rects() const -> const std::vector<Rect>& { return m_rects; }

    [[nodiscard]] auto translated(int32_t dx, int32_t dy) const -> Region {
        Region out;
        for (const auto& r : m_rects) {
            out.add(r.translated(dx, dy));
        }
        return out;
    }

    [[nodiscard]] auto clipped(const Rect& bounds) const -> Region {
        Region out;
        for (const auto& r : m_rects) {
            out.add(r.intersection(bounds));
        }
        return out;
    }

    /// Smallest rectangle covering every member; empty for an empty region.
    [[nodiscard]] auto extents() const -> Rect {
        if (m_rects.empty()) {
            return {};
        }
        int32_t x1 = m_rects.front().x;
        int32_t y1 = m_rects.front().y;
        int32_t x2 = m_rects.front().right();
        int32_t y2 = m_rects.front().bottom();
        for (const auto& r : m_rects) {
            x1 = std::min(x1, r.x);
            y1 = std::min(y1, r.y);
            x2 = std::max(x2, r.right());
            y2 = std::max(y2, r.bottom());
        }
        return {x1, y1, x2 - x1, y2 - y1};
    }

private:
    std::vector<Rect> m_rects;
};

} // namespace scape::core
