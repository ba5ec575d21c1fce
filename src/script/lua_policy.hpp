#pragma once

#include <core/policy.hpp>
#include <cstdint>
#include <memory>
#include <util/error.hpp>

namespace scape::script {

struct LuaPolicyOptions {
    /// Instructions a single hook invocation may execute before it is aborted.
    uint64_t instruction_limit = 10'000'000;
};

/// @brief Lua 5.4 policy runtime exposing the global `scape` module.
///
/// The interpreter is sandboxed (base, string, table, math and utf8 libraries only; `load`,
/// `loadfile`, `dofile` and `require` removed). Table-producing calls (`map_key`,
/// `add_window_rule`, `set_zones`) are only accepted while a script is loading, so a reload
/// always rebuilds the tables from scratch. Host calls are only accepted from callbacks.
class LuaPolicyEngine final : public core::PolicyEngine {
public:
    LuaPolicyEngine(core::PolicyHost& host, LuaPolicyOptions options = {});
    ~LuaPolicyEngine() override;

    LuaPolicyEngine(const LuaPolicyEngine&) = delete;
    LuaPolicyEngine& operator=(const LuaPolicyEngine&) = delete;
    LuaPolicyEngine(LuaPolicyEngine&&) = delete;
    LuaPolicyEngine& operator=(LuaPolicyEngine&&) = delete;

    [[nodiscard]] auto load(std::string_view source, std::string_view chunk_name)
        -> Result<core::PolicyTables> override;

    [[nodiscard]] auto on_startup() -> Result<void> override;
    [[nodiscard]] auto on_window_map(const core::WindowInfo& window) -> Result<void> override;
    [[nodiscard]] auto on_window_unmap(const core::WindowInfo& window) -> Result<void> override;
    [[nodiscard]] auto on_output_change(const std::vector<core::OutputInfo>& outputs)
        -> Result<void> override;
    [[nodiscard]] auto on_tick() -> Result<void> override;
    [[nodiscard]] auto invoke_callback(core::CallbackRef ref) -> Result<void> override;

    [[nodiscard]] auto loaded() const -> bool { return m_state != nullptr; }

    struct State;

private:
    core::PolicyHost& m_host;
    LuaPolicyOptions m_options;
    std::unique_ptr<State> m_state;
};

/// @brief Parses "logo|shift"-style modifier strings into modifier bits.
[[nodiscard]] auto parse_modifiers(std::string_view mods) -> Result<uint32_t>;

/// @brief Resolves a key name to a level-zero keysym. A single upper-case letter adds shift.
[[nodiscard]] auto parse_key(std::string_view key, uint32_t& modifiers) -> Result<uint32_t>;

} // namespace scape::script
