#pragma once

#include <core/interfaces.hpp>

namespace scape::app {

/// @brief Starts commands with `/bin/sh -c` in their own session.
///
/// Children are not waited on here; call reap_children() when SIGCHLD arrives.
class ShellLauncher final : public core::ProcessLauncher {
public:
    [[nodiscard]] auto spawn(const std::string& command,
                             const std::map<std::string, std::string>& env)
        -> Result<int> override;
};

/// @brief Collects every exited child without blocking. Returns the number reaped.
auto reap_children() -> int;

} // namespace scape::app
