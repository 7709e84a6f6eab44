#include "pricesched/cli/commands.hpp"
#include "pricesched/core/logger.hpp"
#include "pricesched/schedule/planner.hpp"
#include "pricesched/schedule/reconciler.hpp"
#include "pricesched/schedule/systemd_scheduler.hpp"

#include <iomanip>
#include <ostream>

namespace pricesched::cli {

namespace {

auto build_request(const Config& config) -> Result<schedule::ReconcileRequest> {
    auto planned = schedule::plan(config.task.base_name, config.scheduling.scheduled_times);
    if (!planned) return std::unexpected(planned.error());

    return schedule::ReconcileRequest{
        .planned = std::move(*planned),
        .base_name = config.task.base_name,
        .description = config.task.description,
        .action = action_from_config(config.worker),
        .policy = policy_from_config(config.policy),
        .principal = principal_from_config(config.principal),
        .utc_offset_minutes = config.scheduling.utc_offset_minutes,
        .prune_stale = config.scheduling.prune_stale,
    };
}

auto report_fatal(const Error& err, std::ostream& out) -> int {
    out << "error [" << error_code_to_string(err.code()) << "]: " << err.what() << "\n";
    return kExitFatal;
}

} // anonymous namespace

auto run_setup(const Config& config, schedule::TaskScheduler& scheduler,
               const infra::PrivilegeCheck& privilege_check, std::ostream& out) -> int
{
    // Privilege is checked before the config is even planned so an
    // unprivileged run does nothing at all.
    if (privilege_check) {
        if (auto r = privilege_check(); !r) {
            LOG_ERROR("{}", r.error().what());
            return report_fatal(r.error(), out);
        }
    }

    auto request = build_request(config);
    if (!request) {
        LOG_ERROR("Invalid schedule: {}", request.error().what());
        return report_fatal(request.error(), out);
    }

    schedule::Reconciler reconciler(scheduler, privilege_check);
    auto report = reconciler.reconcile(*request);
    if (!report) {
        return report_fatal(report.error(), out);
    }

    out << schedule::format_report(*report);
    if (report->aborted) {
        return report_fatal(*report->aborted, out);
    }
    if (!report->ok()) {
        LOG_WARN("{} task(s) failed to register; re-run to retry", report->failures().size());
        return kExitPartialFailure;
    }
    return kExitOk;
}

auto run_list(const Config& config, schedule::TaskScheduler& scheduler, std::ostream& out,
              bool as_json) -> int
{
    auto infos = scheduler.query(schedule::identity_pattern(config.task.base_name));
    if (!infos) {
        return report_fatal(infos.error(), out);
    }

    if (as_json) {
        json arr = json::array();
        for (const auto& info : *infos) {
            arr.push_back(info);
        }
        out << arr.dump(2) << "\n";
        return kExitOk;
    }

    if (infos->empty()) {
        out << "No scheduled tasks for " << config.task.base_name << "\n";
        return kExitOk;
    }

    for (const auto& info : *infos) {
        out << std::left << std::setw(24) << info.identity << " "
            << std::setw(9) << registration_state_to_string(info.state)
            << " last: " << info.last_run.value_or("never")
            << "  next: " << info.next_run.value_or("-") << "\n";
    }
    return kExitOk;
}

auto run_start_now(const Config& config, std::string_view identity, schedule::TaskScheduler& scheduler,
                   const infra::PrivilegeCheck& privilege_check, std::ostream& out) -> int
{
    if (!schedule::is_derived_identity(config.task.base_name, identity)) {
        return report_fatal(make_error(
            ErrorCode::InvalidArgument,
            "Not a task managed for " + config.task.base_name,
            std::string(identity)), out);
    }

    if (privilege_check) {
        if (auto r = privilege_check(); !r) {
            return report_fatal(r.error(), out);
        }
    }

    if (auto r = scheduler.start_now(identity); !r) {
        return report_fatal(r.error(), out);
    }

    LOG_INFO("{}: started", identity);
    out << "Started " << identity << "\n";
    return kExitOk;
}

auto run_uninstall(const Config& config, schedule::TaskScheduler& scheduler,
                   const infra::PrivilegeCheck& privilege_check, std::ostream& out) -> int
{
    schedule::Reconciler reconciler(scheduler, privilege_check);
    auto report = reconciler.remove_all(config.task.base_name);
    if (!report) {
        return report_fatal(report.error(), out);
    }

    out << schedule::format_report(*report);
    if (report->aborted) {
        return report_fatal(*report->aborted, out);
    }
    return report->ok() ? kExitOk : kExitPartialFailure;
}

auto run_dry_run(const Config& config, std::ostream& out) -> int {
    auto request = build_request(config);
    if (!request) {
        return report_fatal(request.error(), out);
    }

    for (const auto& task : request->planned) {
        Registration registration{
            .identity = task.identity,
            .description = request->description,
            .action = request->action,
            .trigger = schedule::make_trigger(task.slot, request->utc_offset_minutes),
            .policy = request->policy,
            .principal = request->principal,
        };

        out << "### " << task.identity << ".service\n"
            << schedule::render_service_unit(registration) << "\n"
            << "### " << task.identity << ".timer\n"
            << schedule::render_timer_unit(registration) << "\n";
    }
    return kExitOk;
}

} // namespace pricesched::cli
