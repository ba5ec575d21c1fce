#include "layout_snapshot.hpp"

#include <algorithm>
#include <cmath>
#include <util/logging.hpp>
#include <util/serializer.hpp>

namespace scape::core {

namespace {

struct SnapshotHeader {
    uint32_t magic;
    uint32_t version;
    uint32_t payload_size;
    uint32_t checksum;
};

constexpr int32_t MAX_DIMENSION = 1 << 16;

auto write_output(util::BinaryWriter& w, const OutputSnapshot& output) -> Result<void> {
    SCAPE_TRY(w.write_str(output.name));
    w.write_pod(output.x);
    w.write_pod(output.y);
    w.write_pod(output.width);
    w.write_pod(output.height);
    w.write_pod(output.scale);
    w.write_bool(output.enabled);
    return {};
}

auto read_output(util::BinaryReader& r, OutputSnapshot& output) -> bool {
    if (!r.read_str(output.name) || !r.read_pod(output.x) || !r.read_pod(output.y) ||
        !r.read_pod(output.width) || !r.read_pod(output.height) || !r.read_pod(output.scale) ||
        !r.read_bool(output.enabled)) {
        return false;
    }
    return std::isfinite(output.scale) && output.scale > 0.0 && output.width >= 0 &&
           output.height >= 0 && output.width < MAX_DIMENSION && output.height < MAX_DIMENSION;
}

auto write_seat(util::BinaryWriter& w, const SeatSnapshot& seat) -> Result<void> {
    SCAPE_TRY(w.write_str(seat.name));
    w.write_pod(seat.pointer_x);
    w.write_pod(seat.pointer_y);
    return {};
}

auto read_seat(util::BinaryReader& r, SeatSnapshot& seat) -> bool {
    return r.read_str(seat.name) && r.read_pod(seat.pointer_x) && r.read_pod(seat.pointer_y) &&
           std::isfinite(seat.pointer_x) && std::isfinite(seat.pointer_y);
}

} // namespace

auto LayoutSnapshot::find_output(std::string_view name) const -> const OutputSnapshot* {
    auto it = std::find_if(outputs.begin(), outputs.end(),
                           [name](const OutputSnapshot& o) { return o.name == name; });
    return it == outputs.end() ? nullptr : &*it;
}

auto LayoutSnapshot::find_seat(std::string_view name) const -> const SeatSnapshot* {
    auto it = std::find_if(seats.begin(), seats.end(),
                           [name](const SeatSnapshot& s) { return s.name == name; });
    return it == seats.end() ? nullptr : &*it;
}

auto capture_snapshot(const OutputRegistry& outputs, const SeatState& seats) -> LayoutSnapshot {
    LayoutSnapshot snapshot;
    for (const auto& output : outputs.outputs()) {
        Rect r = output.rect();
        snapshot.outputs.push_back(OutputSnapshot{.name = output.name,
                                                  .x = r.x,
                                                  .y = r.y,
                                                  .width = output.mode.width,
                                                  .height = output.mode.height,
                                                  .scale = output.scale,
                                                  .enabled = output.enabled});
    }
    for (const auto& seat : seats.seats()) {
        snapshot.seats.push_back(
            SeatSnapshot{.name = seat.name, .pointer_x = seat.pointer.x, .pointer_y = seat.pointer.y});
    }
    return snapshot;
}

auto encode_snapshot(const LayoutSnapshot& snapshot) -> Result<std::vector<char>> {
    util::BinaryWriter payload;
    SCAPE_TRY(payload.write_vec(snapshot.outputs, write_output));
    SCAPE_TRY(payload.write_vec(snapshot.seats, write_seat));

    util::BinaryWriter out;
    out.write_pod(SnapshotHeader{
        .magic = SNAPSHOT_MAGIC,
        .version = SNAPSHOT_VERSION,
        .payload_size = static_cast<uint32_t>(payload.buffer.size()),
        .checksum = util::fnv1a32(payload.buffer),
    });
    out.write(payload.buffer);
    return std::move(out.buffer);
}

auto decode_snapshot(std::span<const char> bytes) -> Result<LayoutSnapshot> {
    util::BinaryReader reader(bytes);

    SnapshotHeader header{};
    if (!reader.read_pod(header)) {
        return make_error<LayoutSnapshot>(ErrorCode::invalid_data, "Snapshot header truncated");
    }
    if (header.magic != SNAPSHOT_MAGIC) {
        return make_error<LayoutSnapshot>(ErrorCode::invalid_data, "Snapshot magic mismatch");
    }
    if (header.version != SNAPSHOT_VERSION) {
        return make_error<LayoutSnapshot>(ErrorCode::invalid_data,
                                          "Unsupported snapshot version " +
                                              std::to_string(header.version));
    }
    if (header.payload_size != reader.rest().size()) {
        return make_error<LayoutSnapshot>(ErrorCode::invalid_data, "Snapshot size mismatch");
    }
    if (util::fnv1a32(reader.rest()) != header.checksum) {
        return make_error<LayoutSnapshot>(ErrorCode::invalid_data, "Snapshot checksum mismatch");
    }

    LayoutSnapshot snapshot;
    if (!reader.read_vec(snapshot.outputs, read_output) ||
        !reader.read_vec(snapshot.seats, read_seat) || !reader.exhausted()) {
        return make_error<LayoutSnapshot>(ErrorCode::invalid_data, "Snapshot payload malformed");
    }
    return snapshot;
}

auto save_snapshot(const std::filesystem::path& path, const LayoutSnapshot& snapshot)
    -> Result<void> {
    auto bytes = SCAPE_TRY(encode_snapshot(snapshot));
    return util::write_file_binary(path, bytes);
}

auto load_snapshot(const std::filesystem::path& path) -> Result<LayoutSnapshot> {
    auto bytes = SCAPE_TRY(util::read_file_binary(path));
    return decode_snapshot(bytes);
}

auto load_snapshot_or_default(const std::filesystem::path& path) -> LayoutSnapshot {
    auto result = load_snapshot(path);
    if (!result) {
        if (result.error().code == ErrorCode::file_not_found) {
            SCAPE_LOG_DEBUG("No layout snapshot at {}", path.string());
        } else {
            SCAPE_LOG_WARN("Ignoring layout snapshot {}: {}", path.string(),
                           result.error().message);
        }
        return {};
    }
    SCAPE_LOG_INFO("Loaded layout snapshot with {} output(s)", result->outputs.size());
    return std::move(*result);
}

} // namespace scape::core
