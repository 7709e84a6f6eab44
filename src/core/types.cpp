#include "pricesched/core/types.hpp"

namespace pricesched {

auto registration_state_to_string(RegistrationState state) -> std::string_view {
    switch (state) {
        case RegistrationState::Ready: return "ready";
        case RegistrationState::Running: return "running";
        case RegistrationState::Disabled: return "disabled";
        case RegistrationState::Failed: return "failed";
        case RegistrationState::Unknown:
        default: return "unknown";
    }
}

void to_json(json& j, const RegistrationInfo& info) {
    j = json{
        {"identity", info.identity},
        {"state", info.state},
    };
    j["last_run"] = info.last_run ? json(*info.last_run) : json(nullptr);
    j["next_run"] = info.next_run ? json(*info.next_run) : json(nullptr);
}

} // namespace pricesched
