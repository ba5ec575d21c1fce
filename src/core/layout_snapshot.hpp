#pragma once

#include "output_registry.hpp"
#include "seat.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <util/error.hpp>
#include <vector>

namespace scape::core {

inline constexpr uint32_t SNAPSHOT_MAGIC = 0x4C504353; // "SCPL"
inline constexpr uint32_t SNAPSHOT_VERSION = 1;

struct OutputSnapshot {
    std::string name;
    int32_t x = 0;
    int32_t y = 0;
    int32_t width = 0;
    int32_t height = 0;
    double scale = 1.0;
    bool enabled = true;
};

struct SeatSnapshot {
    std::string name;
    double pointer_x = 0.0;
    double pointer_y = 0.0;
};

/// @brief Output arrangement and seat pointers persisted across restarts.
struct LayoutSnapshot {
    std::vector<OutputSnapshot> outputs;
    std::vector<SeatSnapshot> seats;

    [[nodiscard]] auto find_output(std::string_view name) const -> const OutputSnapshot*;
    [[nodiscard]] auto find_seat(std::string_view name) const -> const SeatSnapshot*;
};

[[nodiscard]] auto capture_snapshot(const OutputRegistry& outputs, const SeatState& seats)
    -> LayoutSnapshot;

[[nodiscard]] auto encode_snapshot(const LayoutSnapshot& snapshot) -> Result<std::vector<char>>;
[[nodiscard]] auto decode_snapshot(std::span<const char> bytes) -> Result<LayoutSnapshot>;

[[nodiscard]] auto save_snapshot(const std::filesystem::path& path,
                                 const LayoutSnapshot& snapshot) -> Result<void>;
[[nodiscard]] auto load_snapshot(const std::filesystem::path& path) -> Result<LayoutSnapshot>;

/// @brief Loads a snapshot, falling back to an empty one (default layout) on any error.
[[nodiscard]] auto load_snapshot_or_default(const std::filesystem::path& path) -> LayoutSnapshot;

} // namespace scape::core
