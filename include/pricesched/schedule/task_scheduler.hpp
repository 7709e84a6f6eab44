#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "pricesched/core/error.hpp"
#include "pricesched/core/types.hpp"

namespace pricesched {
struct BackendConfig;
}

namespace pricesched::infra {
class CommandRunner;
}

namespace pricesched::schedule {

/// The host's task-scheduling subsystem.
///
/// Registrations live outside this process and survive reboots; this
/// interface is the only way the rest of the code touches them, so tests
/// can substitute an in-memory table.
class TaskScheduler {
public:
    virtual ~TaskScheduler() = default;

    /// Check that the scheduler can be reached at all.
    /// @returns ErrorCode::SchedulerUnavailable when it cannot.
    virtual auto probe() -> Result<void> = 0;

    /// Create a registration. The identity must not currently exist.
    virtual auto register_task(const Registration& registration) -> Result<void> = 0;

    /// Remove a registration.
    /// @returns ErrorCode::NotFound if nothing is registered under `identity`.
    virtual auto unregister_task(std::string_view identity) -> Result<void> = 0;

    /// List registrations whose identity matches a `*`/`?` pattern.
    virtual auto query(std::string_view pattern) -> Result<std::vector<RegistrationInfo>> = 0;

    /// Start a registration's action immediately, outside its trigger.
    virtual auto start_now(std::string_view identity) -> Result<void> = 0;
};

/// Construct the scheduler named by `backend.type`.
/// Only "systemd" is supported; anything else is SchedulerUnavailable.
auto make_task_scheduler(const BackendConfig& backend, infra::CommandRunner& runner)
    -> Result<std::unique_ptr<TaskScheduler>>;

} // namespace pricesched::schedule
