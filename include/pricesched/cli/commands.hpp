#pragma once

#include <iosfwd>
#include <string_view>

#include "pricesched/core/config.hpp"
#include "pricesched/infra/privilege.hpp"
#include "pricesched/schedule/task_scheduler.hpp"

namespace pricesched::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitPartialFailure = 1;  // some identities failed
inline constexpr int kExitFatal = 2;           // nothing (or not everything) was attempted

/// Plan the configured times and converge the scheduler to them.
/// Prints the per-identity summary to `out`.
auto run_setup(const Config& config, schedule::TaskScheduler& scheduler,
               const infra::PrivilegeCheck& privilege_check, std::ostream& out) -> int;

/// Print every registration belonging to the configured base name, as a
/// table or, with `as_json`, as a JSON array.
auto run_list(const Config& config, schedule::TaskScheduler& scheduler, std::ostream& out,
              bool as_json = false) -> int;

/// Start one registration immediately. Only identities derived from the
/// configured base name are accepted.
auto run_start_now(const Config& config, std::string_view identity, schedule::TaskScheduler& scheduler,
                   const infra::PrivilegeCheck& privilege_check, std::ostream& out) -> int;

/// Remove every registration belonging to the configured base name.
auto run_uninstall(const Config& config, schedule::TaskScheduler& scheduler,
                   const infra::PrivilegeCheck& privilege_check, std::ostream& out) -> int;

/// Print the units a setup run would install, without touching the system.
auto run_dry_run(const Config& config, std::ostream& out) -> int;

} // namespace pricesched::cli
