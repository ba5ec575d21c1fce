#include "control_protocol.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <util/serializer.hpp>

namespace scape::ipc {

namespace {

void write_rect(util::BinaryWriter& w, const core::Rect& rect) {
    w.write_pod(rect.x);
    w.write_pod(rect.y);
    w.write_pod(rect.width);
    w.write_pod(rect.height);
}

auto read_rect(util::BinaryReader& r, core::Rect& rect) -> bool {
    return r.read_pod(rect.x) && r.read_pod(rect.y) && r.read_pod(rect.width) &&
           r.read_pod(rect.height);
}

auto write_output(util::BinaryWriter& w, const core::OutputInfo& output) -> Result<void> {
    w.write_pod(output.id);
    SCAPE_TRY(w.write_str(output.name));
    write_rect(w, output.rect);
    w.write_pod(output.scale);
    w.write_bool(output.enabled);
    return {};
}

auto read_output(util::BinaryReader& r, core::OutputInfo& output) -> bool {
    return r.read_pod(output.id) && r.read_str(output.name) && read_rect(r, output.rect) &&
           r.read_pod(output.scale) && r.read_bool(output.enabled);
}

auto write_window(util::BinaryWriter& w, const core::WindowInfo& window) -> Result<void> {
    w.write_pod(window.id);
    SCAPE_TRY(w.write_str(window.app_id));
    SCAPE_TRY(w.write_str(window.title));
    write_rect(w, window.geometry);
    SCAPE_TRY(w.write_str(window.output));
    auto flags = static_cast<uint8_t>((window.xwayland ? 1 : 0) | (window.focused ? 2 : 0) |
                                      (window.mapped ? 4 : 0));
    w.write_pod(flags);
    return {};
}

auto read_window(util::BinaryReader& r, core::WindowInfo& window) -> bool {
    uint8_t flags = 0;
    if (!r.read_pod(window.id) || !r.read_str(window.app_id) || !r.read_str(window.title) ||
        !read_rect(r, window.geometry) || !r.read_str(window.output) || !r.read_pod(flags)) {
        return false;
    }
    window.xwayland = (flags & 1) != 0;
    window.focused = (flags & 2) != 0;
    window.mapped = (flags & 4) != 0;
    return true;
}

auto frame(util::BinaryWriter payload) -> Result<std::vector<char>> {
    if (payload.buffer.size() > MAX_PAYLOAD_SIZE) {
        return make_error<std::vector<char>>(ErrorCode::invalid_data,
                                             "Control message exceeds size limit");
    }
    util::BinaryWriter out;
    FrameHeader header{};
    header.payload_size = static_cast<uint32_t>(payload.buffer.size());
    out.write_pod(header);
    out.write(payload.buffer);
    return std::move(out.buffer);
}

auto remaining_ms(std::chrono::steady_clock::time_point deadline) -> int {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

auto receive_exact(int fd, char* dest, size_t size,
                   std::chrono::steady_clock::time_point deadline) -> Result<void> {
    size_t received = 0;
    while (received < size) {
        ssize_t n = recv(fd, dest + received, size - received, MSG_DONTWAIT);
        if (n > 0) {
            received += static_cast<size_t>(n);
            continue;
        }
        if (n == 0) {
            return make_error<void>(ErrorCode::ipc_failed, "Peer closed the connection");
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            return make_error<void>(ErrorCode::ipc_failed,
                                    std::string("Receive failed: ") + std::strerror(errno));
        }
        int wait = remaining_ms(deadline);
        if (wait == 0) {
            return make_error<void>(ErrorCode::ipc_failed, "Timed out waiting for data");
        }
        pollfd pfd{fd, POLLIN, 0};
        poll(&pfd, 1, wait);
    }
    return {};
}

} // namespace

auto parse_command(std::string_view name) -> std::optional<ControlCommand> {
    for (auto command : {ControlCommand::list_outputs, ControlCommand::list_windows,
                         ControlCommand::focus_window, ControlCommand::close_window,
                         ControlCommand::reload_config, ControlCommand::quit}) {
        if (name == to_string(command)) {
            return command;
        }
    }
    return std::nullopt;
}

auto encode_request(const ControlRequest& request) -> Result<std::vector<char>> {
    util::BinaryWriter w;
    w.write_pod(static_cast<uint32_t>(request.command));
    SCAPE_TRY(w.write_str(request.argument));
    return frame(std::move(w));
}

auto encode_response(const ControlResponse& response) -> Result<std::vector<char>> {
    util::BinaryWriter w;
    w.write_bool(response.ok);
    SCAPE_TRY(w.write_str(response.message));
    SCAPE_TRY(w.write_vec(response.outputs, write_output));
    SCAPE_TRY(w.write_vec(response.windows, write_window));
    return frame(std::move(w));
}

auto decode_header(std::span<const char> bytes) -> Result<uint32_t> {
    util::BinaryReader r(bytes);
    FrameHeader header{};
    if (!r.read_pod(header)) {
        return make_error<uint32_t>(ErrorCode::invalid_data, "Truncated control header");
    }
    if (header.magic != CONTROL_MAGIC) {
        return make_error<uint32_t>(ErrorCode::invalid_data, "Bad control message magic");
    }
    if (header.version != CONTROL_VERSION) {
        return make_error<uint32_t>(ErrorCode::invalid_data,
                                    "Unsupported control protocol version " +
                                        std::to_string(header.version));
    }
    if (header.payload_size > MAX_PAYLOAD_SIZE) {
        return make_error<uint32_t>(ErrorCode::invalid_data, "Control payload too large");
    }
    return header.payload_size;
}

auto decode_request(std::span<const char> payload) -> Result<ControlRequest> {
    util::BinaryReader r(payload);
    uint32_t command = 0;
    ControlRequest request;
    if (!r.read_pod(command) || !r.read_str(request.argument) || !r.exhausted()) {
        return make_error<ControlRequest>(ErrorCode::invalid_data, "Malformed control request");
    }
    if (command < static_cast<uint32_t>(ControlCommand::list_outputs) ||
        command > static_cast<uint32_t>(ControlCommand::quit)) {
        return make_error<ControlRequest>(ErrorCode::invalid_data,
                                          "Unknown control command " + std::to_string(command));
    }
    request.command = static_cast<ControlCommand>(command);
    return request;
}

auto decode_response(std::span<const char> payload) -> Result<ControlResponse> {
    util::BinaryReader r(payload);
    ControlResponse response;
    if (!r.read_bool(response.ok) || !r.read_str(response.message) ||
        !r.read_vec(response.outputs, read_output) || !r.read_vec(response.windows, read_window) ||
        !r.exhausted()) {
        return make_error<ControlResponse>(ErrorCode::invalid_data, "Malformed control response");
    }
    return response;
}

auto send_all(int fd, std::span<const char> bytes, int timeout_ms) -> Result<void> {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    size_t total_sent = 0;
    while (total_sent < bytes.size()) {
        ssize_t sent = send(fd, bytes.data() + total_sent, bytes.size() - total_sent,
                            MSG_NOSIGNAL | MSG_DONTWAIT);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                int wait = remaining_ms(deadline);
                if (wait == 0) {
                    return make_error<void>(ErrorCode::ipc_failed, "Timed out sending");
                }
                pollfd pfd{fd, POLLOUT, 0};
                poll(&pfd, 1, wait);
                continue;
            }
            return make_error<void>(ErrorCode::ipc_failed,
                                    std::string("Send failed: ") + std::strerror(errno));
        }
        total_sent += static_cast<size_t>(sent);
    }
    return {};
}

auto receive_frame(int fd, int timeout_ms) -> Result<std::vector<char>> {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::vector<char> header(sizeof(FrameHeader));
    SCAPE_TRY(receive_exact(fd, header.data(), header.size(), deadline));
    uint32_t payload_size = SCAPE_TRY(decode_header(header));
    std::vector<char> payload(payload_size);
    if (payload_size > 0) {
        SCAPE_TRY(receive_exact(fd, payload.data(), payload.size(), deadline));
    }
    return payload;
}

auto control_socket_path(const std::filesystem::path& runtime_dir,
                         std::string_view wayland_display) -> std::filesystem::path {
    std::string name = "scape-";
    name += wayland_display.empty() ? std::string_view("0") : wayland_display;
    name += ".sock";
    return runtime_dir / name;
}

} // namespace scape::ipc
