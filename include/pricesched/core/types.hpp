#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace pricesched {

using json = nlohmann::json;

/// Deterministic key of one scheduled registration, e.g. "PriceMonitor_0600".
using TaskIdentity = std::string;

/// A daily wall-clock time in the fixed reference timezone.
struct TimeSlot {
    int hour = 0;    // 0-23
    int minute = 0;  // 0-59

    [[nodiscard]] auto minute_of_day() const noexcept -> int { return hour * 60 + minute; }

    auto operator==(const TimeSlot&) const -> bool = default;
};

/// Daily recurrence. `local` is the nominal time in the reference zone,
/// `utc` the same instant expressed in UTC.
struct TriggerSpec {
    TimeSlot local;
    TimeSlot utc;
    int utc_offset_minutes = 0;
};

/// The worker command line shared by every registration.
struct ActionSpec {
    std::string executable;
    std::vector<std::string> arguments;
    std::string working_directory;
};

struct RunPolicy {
    bool allow_on_battery = true;
    bool keep_running_on_power_change = true;
    bool start_when_available = true;   // catch up a missed start
    bool restart_on_failure = false;
    int restart_delay_sec = 300;
};

enum class LogonMode {
    Service,  // no interactive session or cached password required
    Session,  // requires a logged-in user session
};

NLOHMANN_JSON_SERIALIZE_ENUM(LogonMode, {
    {LogonMode::Service, "service"},
    {LogonMode::Session, "session"},
})

struct Principal {
    std::string user = "root";
    LogonMode logon_mode = LogonMode::Service;
};

/// Everything the OS scheduler needs to create one live entry.
struct Registration {
    TaskIdentity identity;
    std::string description;
    ActionSpec action;
    TriggerSpec trigger;
    RunPolicy policy;
    Principal principal;
};

enum class RegistrationState {
    Unknown,
    Ready,
    Running,
    Disabled,
    Failed,
};

NLOHMANN_JSON_SERIALIZE_ENUM(RegistrationState, {
    {RegistrationState::Unknown, "unknown"},
    {RegistrationState::Ready, "ready"},
    {RegistrationState::Running, "running"},
    {RegistrationState::Disabled, "disabled"},
    {RegistrationState::Failed, "failed"},
})

auto registration_state_to_string(RegistrationState state) -> std::string_view;

/// One row of a scheduler query.
struct RegistrationInfo {
    TaskIdentity identity;
    RegistrationState state = RegistrationState::Unknown;
    std::optional<std::string> last_run;
    std::optional<std::string> next_run;
};

void to_json(json& j, const RegistrationInfo& info);

} // namespace pricesched
