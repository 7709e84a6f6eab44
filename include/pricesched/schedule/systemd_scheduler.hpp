#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "pricesched/infra/command_runner.hpp"
#include "pricesched/schedule/task_scheduler.hpp"

namespace pricesched::schedule {

/// TaskScheduler backed by systemd timers.
///
/// Each registration is a `<identity>.service` (the worker, Type=oneshot)
/// plus a `<identity>.timer` that fires it daily. Unit files are written to
/// `unit_dir` and activated through `systemctl`, so they survive reboots and
/// are owned by systemd rather than by this process.
class SystemdTimerScheduler : public TaskScheduler {
public:
    SystemdTimerScheduler(std::filesystem::path unit_dir, infra::CommandRunner& runner,
                          std::string systemctl = "systemctl");

    auto probe() -> Result<void> override;
    auto register_task(const Registration& registration) -> Result<void> override;
    auto unregister_task(std::string_view identity) -> Result<void> override;
    auto query(std::string_view pattern) -> Result<std::vector<RegistrationInfo>> override;
    auto start_now(std::string_view identity) -> Result<void> override;

    [[nodiscard]] auto service_path(std::string_view identity) const -> std::filesystem::path;
    [[nodiscard]] auto timer_path(std::string_view identity) const -> std::filesystem::path;

private:
    /// Run systemctl; failure to start it at all is SchedulerUnavailable.
    auto systemctl(std::vector<std::string> args) -> Result<infra::CommandOutput>;

    /// Read `systemctl show` properties for one unit.
    auto show(const std::string& unit, const std::vector<std::string>& properties)
        -> Result<std::vector<std::pair<std::string, std::string>>>;

    void remove_unit_files(std::string_view identity);

    std::filesystem::path unit_dir_;
    infra::CommandRunner& runner_;
    std::string systemctl_;
};

/// Render the `.service` unit for a registration.
auto render_service_unit(const Registration& registration) -> std::string;

/// Render the `.timer` unit for a registration. OnCalendar is expressed in
/// UTC so host daylight-saving rules never move the trigger.
auto render_timer_unit(const Registration& registration) -> std::string;

/// Quote one ExecStart= word following systemd's command-line rules.
auto systemd_quote(std::string_view arg) -> std::string;

/// Format an offset in minutes as `UTC-03:00`.
auto format_utc_offset(int offset_minutes) -> std::string;

} // namespace pricesched::schedule
