#pragma once

#include <core/policy.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <util/error.hpp>
#include <vector>

namespace scape::ipc {

constexpr uint32_t CONTROL_MAGIC = 0x4C544353; // "SCTL"
constexpr uint32_t CONTROL_VERSION = 1;
constexpr uint32_t MAX_PAYLOAD_SIZE = 1u << 20;

// NOLINTNEXTLINE(performance-enum-size) - uint32_t required for wire format stability
enum class ControlCommand : uint32_t {
    list_outputs = 1,
    list_windows = 2,
    focus_window = 3,
    close_window = 4,
    reload_config = 5,
    quit = 6,
};

[[nodiscard]] constexpr auto to_string(ControlCommand command) -> const char* {
    switch (command) {
    case ControlCommand::list_outputs:
        return "list-outputs";
    case ControlCommand::list_windows:
        return "list-windows";
    case ControlCommand::focus_window:
        return "focus-window";
    case ControlCommand::close_window:
        return "close-window";
    case ControlCommand::reload_config:
        return "reload";
    case ControlCommand::quit:
        return "quit";
    }
    return "unknown";
}

[[nodiscard]] auto parse_command(std::string_view name) -> std::optional<ControlCommand>;

struct ControlRequest {
    ControlCommand command = ControlCommand::list_outputs;
    /// Window id or app id for focus/close.
    std::string argument;
};

struct ControlResponse {
    bool ok = true;
    std::string message;
    std::vector<core::OutputInfo> outputs;
    std::vector<core::WindowInfo> windows;
};

struct FrameHeader {
    uint32_t magic = CONTROL_MAGIC;
    uint32_t version = CONTROL_VERSION;
    uint32_t payload_size = 0;
};

static_assert(sizeof(FrameHeader) == 12);

/// @brief Header plus payload, ready to send.
[[nodiscard]] auto encode_request(const ControlRequest& request) -> Result<std::vector<char>>;
[[nodiscard]] auto encode_response(const ControlResponse& response) -> Result<std::vector<char>>;
/// @brief Validates a header and returns its payload size.
[[nodiscard]] auto decode_header(std::span<const char> bytes) -> Result<uint32_t>;
/// @brief Decodes a payload (without header).
[[nodiscard]] auto decode_request(std::span<const char> payload) -> Result<ControlRequest>;
[[nodiscard]] auto decode_response(std::span<const char> payload) -> Result<ControlResponse>;

/// @brief Writes all of @p bytes, retrying on EINTR/EAGAIN until @p timeout_ms passes.
[[nodiscard]] auto send_all(int fd, std::span<const char> bytes, int timeout_ms) -> Result<void>;
/// @brief Reads one framed message and returns its payload.
[[nodiscard]] auto receive_frame(int fd, int timeout_ms) -> Result<std::vector<char>>;

/// @brief `<runtime_dir>/scape-<wayland_display>.sock`
[[nodiscard]] auto control_socket_path(const std::filesystem::path& runtime_dir,
                                       std::string_view wayland_display) -> std::filesystem::path;

} // namespace scape::ipc
