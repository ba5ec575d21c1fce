#include "policy.hpp"

#include "seat.hpp"

namespace scape::core {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

auto action_name(const Action& action) -> const char* {
    return std::visit(Overloaded{
                          [](const action::None&) { return "none"; },
                          [](const action::Quit&) { return "quit"; },
                          [](const action::VtSwitch&) { return "vt_switch"; },
                          [](const action::Spawn&) { return "spawn"; },
                          [](const action::FocusOrSpawn&) { return "focus_or_spawn"; },
                          [](const action::MoveToZone&) { return "move_to_zone"; },
                          [](const action::Tab&) { return "tab"; },
                          [](const action::CloseWindow&) { return "close_window"; },
                          [](const action::Callback&) { return "callback"; },
                      },
                      action);
}

BindingTable::BindingTable(const std::vector<Binding>& bindings) {
    for (const auto& binding : bindings) {
        // Later definitions of the same chord replace earlier ones
        m_bindings.insert_or_assign({binding.modifiers & modifier::BINDING_MASK, binding.keysym},
                                    binding);
    }
}

auto BindingTable::find(uint32_t modifiers, uint32_t keysym) const -> const Binding* {
    auto it = m_bindings.find({modifiers & modifier::BINDING_MASK, keysym});
    return it == m_bindings.end() ? nullptr : &it->second;
}

auto PlacementRule::matches(std::string_view app_id, std::string_view title,
                            bool xwayland) const -> bool {
    if (matcher.app_id && *matcher.app_id != app_id) {
        return false;
    }
    if (matcher.title_contains && title.find(*matcher.title_contains) == std::string_view::npos) {
        return false;
    }
    if (matcher.kind == WindowKind::wayland && xwayland) {
        return false;
    }
    if (matcher.kind == WindowKind::xwayland && !xwayland) {
        return false;
    }
    return true;
}

} // namespace scape::core
