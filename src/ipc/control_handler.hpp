#pragma once

#include "control_protocol.hpp"

namespace scape::core {
class Compositor;
}

namespace scape::ipc {

/// @brief Executes one control request against the compositor. Loop thread only.
///
/// focus-window and close-window accept either a numeric window id or an app id; an app id
/// picks the topmost matching window.
[[nodiscard]] auto handle_control_request(core::Compositor& compositor,
                                          const ControlRequest& request) -> ControlResponse;

} // namespace scape::ipc
