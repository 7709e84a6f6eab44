#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pricesched/core/error.hpp"
#include "pricesched/core/types.hpp"
#include "pricesched/infra/privilege.hpp"
#include "pricesched/schedule/planner.hpp"
#include "pricesched/schedule/task_scheduler.hpp"

namespace pricesched::schedule {

enum class Outcome {
    Registered,  // no prior registration existed
    Replaced,    // a prior registration was removed first
    Removed,     // stale identity no longer in the plan
    Failed,
};

auto outcome_to_string(Outcome outcome) -> std::string_view;

struct ReconcileEntry {
    TaskIdentity identity;
    std::optional<TimeSlot> slot;  // unset for stale identities
    Outcome outcome = Outcome::Failed;
    std::string reason;            // set when outcome == Failed
};

struct ReconcileReport {
    std::vector<ReconcileEntry> entries;
    std::optional<Error> aborted;  // fatal error that stopped the run part-way


    [[nodiscard]] auto ok() const -> bool;
    [[nodiscard]] auto failures() const -> std::vector<const ReconcileEntry*>;
    [[nodiscard]] auto find(std::string_view identity) const -> const ReconcileEntry*;
};

/// Shared template for every registration in one run.
struct ReconcileRequest {
    std::vector<PlannedTask> planned;
    std::string base_name;       // used to find stale identities
    std::string description;
    ActionSpec action;
    RunPolicy policy;
    Principal principal;
    int utc_offset_minutes = -180;
    bool prune_stale = true;
};

/// Converges the OS scheduler to exactly the planned registrations.
///
/// The run has two phases. Pre-flight checks privilege, the planned set,
/// the action and scheduler availability; any failure there returns an
/// error before a single mutation. After that each identity is removed (a
/// missing one is fine) and registered afresh, and a failure is recorded
/// against that identity only. SchedulerUnavailable during the loop still
/// aborts, since every remaining call would fail the same way; the report
/// then holds the identities already processed and `aborted` is set.
///
/// Running reconcile() twice with the same request leaves the same live
/// set as running it once.
class Reconciler {
public:
    Reconciler(TaskScheduler& scheduler, infra::PrivilegeCheck privilege_check);

    auto reconcile(const ReconcileRequest& request) -> Result<ReconcileReport>;

    /// Unregister every `<base_name>_HHMM` registration.
    auto remove_all(std::string_view base_name) -> Result<ReconcileReport>;

private:
    auto preflight(const ReconcileRequest& request) -> Result<void>;
    auto reconcile_one(const ReconcileRequest& request, const PlannedTask& task)
        -> Result<ReconcileEntry>;
    auto prune(const ReconcileRequest& request, ReconcileReport& report) -> Result<void>;
    auto remove_matching(std::string_view base_name, const std::vector<std::string>& keep,
                         ReconcileReport& report) -> Result<void>;

    TaskScheduler& scheduler_;
    infra::PrivilegeCheck privilege_check_;
};

/// Pattern matching every identity derived from `base_name`.
auto identity_pattern(std::string_view base_name) -> std::string;

/// Human-readable per-identity summary, one line each plus a totals line.
auto format_report(const ReconcileReport& report) -> std::string;

} // namespace pricesched::schedule
