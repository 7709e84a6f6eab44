#include "pricesched/schedule/reconciler.hpp"
#include "pricesched/core/logger.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace pricesched::schedule {

namespace {

constexpr size_t kSlotDigits = 4;

auto failed(TaskIdentity identity, std::optional<TimeSlot> slot, std::string reason) -> ReconcileEntry {
    return ReconcileEntry{
        .identity = std::move(identity),
        .slot = slot,
        .outcome = Outcome::Failed,
        .reason = std::move(reason),
    };
}

} // anonymous namespace

auto outcome_to_string(Outcome outcome) -> std::string_view {
    switch (outcome) {
        case Outcome::Registered: return "registered";
        case Outcome::Replaced: return "replaced";
        case Outcome::Removed: return "removed";
        case Outcome::Failed: return "failed";
        default: return "unknown";
    }
}

auto ReconcileReport::ok() const -> bool {
    return !aborted &&
           std::ranges::none_of(entries, [](const auto& e) { return e.outcome == Outcome::Failed; });
}

auto ReconcileReport::failures() const -> std::vector<const ReconcileEntry*> {
    std::vector<const ReconcileEntry*> result;
    for (const auto& e : entries) {
        if (e.outcome == Outcome::Failed) result.push_back(&e);
    }
    return result;
}

auto ReconcileReport::find(std::string_view identity) const -> const ReconcileEntry* {
    for (const auto& e : entries) {
        if (e.identity == identity) return &e;
    }
    return nullptr;
}

auto identity_pattern(std::string_view base_name) -> std::string {
    return std::string(base_name) + "_" + std::string(kSlotDigits, '?');
}

// ---------------------------------------------------------------------------
// Reconciler
// ---------------------------------------------------------------------------

Reconciler::Reconciler(TaskScheduler& scheduler, infra::PrivilegeCheck privilege_check)
    : scheduler_(scheduler)
    , privilege_check_(std::move(privilege_check))
{
}

auto Reconciler::preflight(const ReconcileRequest& request) -> Result<void> {
    if (privilege_check_) {
        if (auto r = privilege_check_(); !r) {
            return std::unexpected(r.error());
        }
    }

    if (request.planned.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "Nothing to register: the planned set is empty"));
    }

    std::unordered_set<std::string> seen;
    for (const auto& task : request.planned) {
        if (!seen.insert(task.identity).second) {
            return std::unexpected(make_error(
                ErrorCode::InvalidArgument,
                "Identity collision",
                task.identity));
        }
    }

    if (request.action.executable.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "Worker executable is not configured"));
    }
    if (request.principal.user.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "Execution principal is not configured"));
    }

    return scheduler_.probe();
}

auto Reconciler::reconcile(const ReconcileRequest& request) -> Result<ReconcileReport> {
    if (auto r = preflight(request); !r) {
        LOG_ERROR("Pre-flight check failed: {}", r.error().what());
        return std::unexpected(r.error());
    }

    LOG_INFO("Reconciling {} scheduled task(s)", request.planned.size());

    ReconcileReport report;
    for (const auto& task : request.planned) {
        auto entry = reconcile_one(request, task);
        if (!entry) {
            LOG_FATAL("{}: {}; aborting remaining work", task.identity, entry.error().what());
            report.aborted = entry.error();
            return report;
        }

        if (entry->outcome == Outcome::Failed) {
            LOG_ERROR("{} ({}): {}", entry->identity, format_time_of_day(task.slot), entry->reason);
        } else {
            LOG_INFO("{} ({}): {}", entry->identity, format_time_of_day(task.slot),
                     outcome_to_string(entry->outcome));
        }
        report.entries.push_back(std::move(*entry));
    }

    if (request.prune_stale) {
        if (auto r = prune(request, report); !r) {
            LOG_FATAL("Pruning stale tasks aborted: {}", r.error().what());
            report.aborted = r.error();
        }
    }

    return report;
}

auto Reconciler::reconcile_one(const ReconcileRequest& request, const PlannedTask& task)
    -> Result<ReconcileEntry>
{
    if (!is_valid_slot(task.slot)) {
        return failed(task.identity, task.slot,
                      "invalid trigger time " + std::to_string(task.slot.hour) + ":" +
                          std::to_string(task.slot.minute));
    }

    bool replaced = true;
    if (auto removed = scheduler_.unregister_task(task.identity); !removed) {
        const auto& err = removed.error();
        if (err.code() == ErrorCode::NotFound) {
            replaced = false;
        } else if (err.is_fatal()) {
            return std::unexpected(err);
        } else {
            return failed(task.identity, task.slot, "cannot remove existing registration: " + err.what());
        }
    }

    Registration registration{
        .identity = task.identity,
        .description = request.description,
        .action = request.action,
        .trigger = make_trigger(task.slot, request.utc_offset_minutes),
        .policy = request.policy,
        .principal = request.principal,
    };

    if (auto created = scheduler_.register_task(registration); !created) {
        if (created.error().is_fatal()) {
            return std::unexpected(created.error());
        }
        return failed(task.identity, task.slot, created.error().what());
    }

    return ReconcileEntry{
        .identity = task.identity,
        .slot = task.slot,
        .outcome = replaced ? Outcome::Replaced : Outcome::Registered,
    };
}

auto Reconciler::prune(const ReconcileRequest& request, ReconcileReport& report) -> Result<void> {
    if (request.base_name.empty()) return {};

    std::vector<std::string> keep;
    keep.reserve(request.planned.size());
    for (const auto& task : request.planned) {
        keep.push_back(task.identity);
    }

    return remove_matching(request.base_name, keep, report);
}

auto Reconciler::remove_matching(std::string_view base_name, const std::vector<std::string>& keep,
                                 ReconcileReport& report) -> Result<void>
{
    auto live = scheduler_.query(identity_pattern(base_name));
    if (!live) {
        if (live.error().is_fatal()) return std::unexpected(live.error());
        LOG_WARN("Cannot list existing tasks for {}: {}", base_name, live.error().what());
        return {};
    }

    for (const auto& info : *live) {
        if (!is_derived_identity(base_name, info.identity)) continue;
        if (std::ranges::find(keep, info.identity) != keep.end()) continue;

        auto removed = scheduler_.unregister_task(info.identity);
        if (!removed) {
            const auto& err = removed.error();
            if (err.code() == ErrorCode::NotFound) continue;
            if (err.is_fatal()) return std::unexpected(err);

            LOG_ERROR("{}: cannot remove: {}", info.identity, err.what());
            report.entries.push_back(failed(info.identity, std::nullopt, "cannot remove: " + err.what()));
            continue;
        }

        LOG_INFO("{}: removed", info.identity);
        report.entries.push_back(ReconcileEntry{
            .identity = info.identity,
            .outcome = Outcome::Removed,
        });
    }
    return {};
}

auto Reconciler::remove_all(std::string_view base_name) -> Result<ReconcileReport> {
    if (privilege_check_) {
        if (auto r = privilege_check_(); !r) {
            return std::unexpected(r.error());
        }
    }
    if (auto id = make_identity(base_name, TimeSlot{}); !id) {
        return std::unexpected(id.error());
    }
    if (auto r = scheduler_.probe(); !r) {
        return std::unexpected(r.error());
    }

    ReconcileReport report;
    if (auto r = remove_matching(base_name, {}, report); !r) {
        LOG_FATAL("Removing tasks aborted: {}", r.error().what());
        report.aborted = r.error();
    }
    return report;
}

auto format_report(const ReconcileReport& report) -> std::string {
    std::ostringstream out;
    size_t counts[4] = {0, 0, 0, 0};

    for (const auto& e : report.entries) {
        ++counts[static_cast<size_t>(e.outcome)];
        out << "  " << e.identity;
        if (e.slot) {
            out << "  " << format_time_of_day(*e.slot);
        }
        out << "  " << outcome_to_string(e.outcome);
        if (e.outcome == Outcome::Failed && !e.reason.empty()) {
            out << ": " << e.reason;
        }
        out << "\n";
    }

    out << report.entries.size() << " task(s): "
        << counts[static_cast<size_t>(Outcome::Registered)] << " registered, "
        << counts[static_cast<size_t>(Outcome::Replaced)] << " replaced, "
        << counts[static_cast<size_t>(Outcome::Removed)] << " removed, "
        << counts[static_cast<size_t>(Outcome::Failed)] << " failed\n";
    return out.str();
}

} // namespace pricesched::schedule
