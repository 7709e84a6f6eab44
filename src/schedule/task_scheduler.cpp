#include "pricesched/schedule/task_scheduler.hpp"
#include "pricesched/core/config.hpp"
#include "pricesched/schedule/systemd_scheduler.hpp"

namespace pricesched::schedule {

auto make_task_scheduler(const BackendConfig& backend, infra::CommandRunner& runner)
    -> Result<std::unique_ptr<TaskScheduler>>
{
    if (backend.type == "systemd") {
        return std::make_unique<SystemdTimerScheduler>(backend.unit_dir, runner, backend.systemctl);
    }

    return std::unexpected(make_error(
        ErrorCode::SchedulerUnavailable,
        "Unsupported scheduler backend",
        backend.type));
}

} // namespace pricesched::schedule
