#include "pricesched/schedule/systemd_scheduler.hpp"
#include "pricesched/core/logger.hpp"
#include "pricesched/core/utils.hpp"
#include "pricesched/schedule/planner.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace pricesched::schedule {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kManagedHeader =
    "# Managed by pricesched. Manual edits are replaced on the next run.\n";

constexpr int kCommandNotFound = 127;

auto write_file_atomic(const fs::path& path, const std::string& content) -> Result<void> {
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            return std::unexpected(make_error(
                ErrorCode::IoError,
                "Cannot write unit file",
                tmp.string()));
        }
        out << content;
        out.flush();
        if (!out) {
            return std::unexpected(make_error(
                ErrorCode::IoError,
                "Short write to unit file",
                tmp.string()));
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return std::unexpected(make_error(
            ErrorCode::IoError,
            "Cannot install unit file",
            path.string()));
    }
    return {};
}

auto unit_exists(const fs::path& path) -> Result<bool> {
    std::error_code ec;
    bool found = fs::exists(path, ec);
    if (ec) {
        return std::unexpected(make_error(
            ErrorCode::IoError,
            "Cannot stat unit file",
            path.string() + ": " + ec.message()));
    }
    return found;
}

auto has_control_chars(std::string_view value) -> bool {
    return std::ranges::any_of(value, [](char c) {
        return static_cast<unsigned char>(c) < 0x20 || c == '\x7f';
    });
}

/// Unit files are line-based; a control character in any rendered value
/// would split or corrupt the line it lands on.
auto validate_for_unit(const Registration& reg) -> Result<void> {
    auto reject = [&](std::string_view field) -> Result<void> {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "Control character in " + std::string(field),
            reg.identity));
    };
    if (has_control_chars(reg.identity)) return reject("identity");
    if (has_control_chars(reg.description)) return reject("description");
    if (has_control_chars(reg.principal.user)) return reject("user");
    if (has_control_chars(reg.action.executable)) return reject("executable");
    if (has_control_chars(reg.action.working_directory)) return reject("working directory");
    if (std::ranges::any_of(reg.action.arguments, has_control_chars)) return reject("arguments");
    return {};
}

auto is_unset(std::string_view value) -> bool {
    return value.empty() || value == "n/a" || value == "0";
}

auto to_state(std::string_view timer_active, std::string_view timer_file_state,
              std::string_view service_active, std::string_view service_result)
    -> RegistrationState
{
    if (service_active == "activating" || service_active == "active" ||
        service_active == "deactivating") {
        return RegistrationState::Running;
    }
    if (!service_result.empty() && service_result != "success") {
        return RegistrationState::Failed;
    }
    if (timer_file_state == "disabled" || timer_active == "inactive") {
        return RegistrationState::Disabled;
    }
    if (timer_active == "active") {
        return RegistrationState::Ready;
    }
    return RegistrationState::Unknown;
}

auto escape_specifiers(std::string_view value) -> std::string {
    std::string result;
    for (char c : value) {
        if (c == '%') result += '%';
        result += c;
    }
    return result;
}

auto command_failure(std::string_view what, const infra::CommandOutput& out) -> std::string {
    return std::string(what) + " exited with status " + std::to_string(out.exit_code) +
           (out.output.empty() ? "" : ": " + out.output);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Unit rendering
// ---------------------------------------------------------------------------

auto systemd_quote(std::string_view arg) -> std::string {
    bool needs_quotes = arg.empty();
    std::string escaped;
    escaped.reserve(arg.size());

    for (char c : arg) {
        switch (c) {
            case '%': escaped += "%%"; break;
            case '$': escaped += "$$"; break;
            case '\\': escaped += "\\\\"; needs_quotes = true; break;
            case '"': escaped += "\\\""; needs_quotes = true; break;
            case ' ':
            case '\t':
            case '\'':
            case ';':
                escaped += c;
                needs_quotes = true;
                break;
            default: escaped += c; break;
        }
    }

    if (!needs_quotes) return escaped;
    return "\"" + escaped + "\"";
}

auto format_utc_offset(int offset_minutes) -> std::string {
    char sign = offset_minutes < 0 ? '-' : '+';
    int abs_minutes = std::abs(offset_minutes);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "UTC%c%02d:%02d", sign, abs_minutes / 60, abs_minutes % 60);
    return buf;
}

auto render_service_unit(const Registration& reg) -> std::string {
    std::ostringstream out;
    out << kManagedHeader;
    out << "[Unit]\n";
    out << "Description=" << escape_specifiers(reg.description) << " ("
        << format_time_of_day(reg.trigger.local) << " "
        << format_utc_offset(reg.trigger.utc_offset_minutes) << ")\n";
    out << "Wants=network-online.target\n";
    out << "After=network-online.target\n";
    if (!reg.policy.allow_on_battery) {
        out << "ConditionACPower=true\n";
    }
    if (reg.principal.logon_mode == LogonMode::Session) {
        out << "Requires=systemd-user-sessions.service\n";
        out << "After=systemd-user-sessions.service\n";
    }
    out << "\n";

    out << "[Service]\n";
    out << "Type=oneshot\n";
    out << "User=" << escape_specifiers(reg.principal.user) << "\n";
    if (!reg.action.working_directory.empty()) {
        // Taken literally apart from specifier expansion.
        out << "WorkingDirectory=" << escape_specifiers(reg.action.working_directory) << "\n";
    }
    out << "ExecStart=" << systemd_quote(reg.action.executable);
    for (const auto& arg : reg.action.arguments) {
        out << " " << systemd_quote(arg);
    }
    out << "\n";
    out << "SyslogIdentifier=" << reg.identity << "\n";
    if (reg.policy.restart_on_failure) {
        out << "Restart=on-failure\n";
        out << "RestartSec=" << reg.policy.restart_delay_sec << "\n";
    }
    return out.str();
}

auto render_timer_unit(const Registration& reg) -> std::string {
    std::ostringstream out;
    out << kManagedHeader;
    out << "[Unit]\n";
    out << "Description=Daily trigger for " << reg.identity << " at "
        << format_time_of_day(reg.trigger.local) << " "
        << format_utc_offset(reg.trigger.utc_offset_minutes) << "\n";
    out << "\n";

    out << "[Timer]\n";
    out << "OnCalendar=*-*-* " << format_time_of_day(reg.trigger.utc) << ":00 UTC\n";
    out << "Persistent=" << (reg.policy.start_when_available ? "true" : "false") << "\n";
    out << "AccuracySec=1min\n";
    out << "Unit=" << reg.identity << ".service\n";
    out << "\n";

    out << "[Install]\n";
    out << "WantedBy=timers.target\n";
    return out.str();
}

// ---------------------------------------------------------------------------
// SystemdTimerScheduler
// ---------------------------------------------------------------------------

SystemdTimerScheduler::SystemdTimerScheduler(fs::path unit_dir, infra::CommandRunner& runner,
                                             std::string systemctl)
    : unit_dir_(std::move(unit_dir))
    , runner_(runner)
    , systemctl_(std::move(systemctl))
{
}

auto SystemdTimerScheduler::service_path(std::string_view identity) const -> fs::path {
    return unit_dir_ / (std::string(identity) + ".service");
}

auto SystemdTimerScheduler::timer_path(std::string_view identity) const -> fs::path {
    return unit_dir_ / (std::string(identity) + ".timer");
}

auto SystemdTimerScheduler::systemctl(std::vector<std::string> args) -> Result<infra::CommandOutput> {
    args.insert(args.begin(), systemctl_);
    auto out = runner_.run(args);
    if (!out) {
        return std::unexpected(make_error(
            ErrorCode::SchedulerUnavailable,
            "Cannot run systemctl",
            out.error().what()));
    }
    if (out->exit_code == kCommandNotFound) {
        return std::unexpected(make_error(
            ErrorCode::SchedulerUnavailable,
            "systemctl not found",
            systemctl_));
    }
    return out;
}

auto SystemdTimerScheduler::probe() -> Result<void> {
    std::error_code ec;
    if (!fs::is_directory(unit_dir_, ec)) {
        return std::unexpected(make_error(
            ErrorCode::SchedulerUnavailable,
            "Unit directory does not exist",
            unit_dir_.string()));
    }

    auto out = systemctl({"--version"});
    if (!out) return std::unexpected(out.error());
    if (!out->ok()) {
        return std::unexpected(make_error(
            ErrorCode::SchedulerUnavailable,
            "systemd is not available",
            command_failure("systemctl --version", *out)));
    }

    auto first_line = utils::split(out->output, '\n');
    LOG_DEBUG("Using {}", first_line.empty() ? "systemd" : first_line.front());
    return {};
}

auto SystemdTimerScheduler::register_task(const Registration& reg) -> Result<void> {
    if (auto r = validate_for_unit(reg); !r) return r;

    auto timer_found = unit_exists(timer_path(reg.identity));
    if (!timer_found) return std::unexpected(timer_found.error());
    auto service_found = unit_exists(service_path(reg.identity));
    if (!service_found) return std::unexpected(service_found.error());

    if (*timer_found || *service_found) {
        return std::unexpected(make_error(
            ErrorCode::RegistrationFailed,
            "Task is already registered",
            reg.identity));
    }

    if (!reg.policy.keep_running_on_power_change) {
        // systemd evaluates ConditionACPower only at start and never stops a
        // running unit when the power source changes.
        LOG_WARN("{}: stopping on power change is not supported by systemd timers", reg.identity);
    }

    if (auto r = write_file_atomic(service_path(reg.identity), render_service_unit(reg)); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = write_file_atomic(timer_path(reg.identity), render_timer_unit(reg)); !r) {
        remove_unit_files(reg.identity);
        return std::unexpected(r.error());
    }

    auto reload = systemctl({"daemon-reload"});
    if (!reload) {
        remove_unit_files(reg.identity);
        return std::unexpected(reload.error());
    }
    if (!reload->ok()) {
        remove_unit_files(reg.identity);
        return std::unexpected(make_error(
            ErrorCode::RegistrationFailed,
            "Cannot reload systemd",
            command_failure("systemctl daemon-reload", *reload)));
    }

    auto enable = systemctl({"enable", "--now", reg.identity + ".timer"});
    if (!enable) {
        remove_unit_files(reg.identity);
        return std::unexpected(enable.error());
    }
    if (!enable->ok()) {
        // Leave nothing half-registered behind.
        remove_unit_files(reg.identity);
        if (auto r = systemctl({"daemon-reload"}); !r || !r->ok()) {
            LOG_WARN("{}: daemon-reload after failed enable did not succeed", reg.identity);
        }
        return std::unexpected(make_error(
            ErrorCode::RegistrationFailed,
            "Cannot enable timer",
            command_failure("systemctl enable --now " + reg.identity + ".timer", *enable)));
    }

    LOG_DEBUG("{}: installed {} and {}", reg.identity,
              service_path(reg.identity).string(), timer_path(reg.identity).string());
    return {};
}

auto SystemdTimerScheduler::unregister_task(std::string_view identity) -> Result<void> {
    auto timer = timer_path(identity);
    auto service = service_path(identity);

    auto timer_found = unit_exists(timer);
    if (!timer_found) return std::unexpected(timer_found.error());
    auto service_found = unit_exists(service);
    if (!service_found) return std::unexpected(service_found.error());

    if (!*timer_found && !*service_found) {
        return std::unexpected(make_error(
            ErrorCode::NotFound,
            "No registration with this identity",
            std::string(identity)));
    }

    auto disable = systemctl({"disable", "--now", std::string(identity) + ".timer"});
    if (!disable) return std::unexpected(disable.error());
    if (!disable->ok()) {
        // The unit files are removed regardless; a timer that failed to
        // disable loses its definition on the reload below.
        LOG_WARN("{}: {}", identity, command_failure("systemctl disable", *disable));
    }

    std::error_code ec;
    fs::remove(timer, ec);
    if (ec) {
        return std::unexpected(make_error(
            ErrorCode::IoError,
            "Cannot remove timer unit",
            timer.string() + ": " + ec.message()));
    }
    fs::remove(service, ec);
    if (ec) {
        return std::unexpected(make_error(
            ErrorCode::IoError,
            "Cannot remove service unit",
            service.string() + ": " + ec.message()));
    }

    auto reload = systemctl({"daemon-reload"});
    if (!reload) return std::unexpected(reload.error());
    if (!reload->ok()) {
        return std::unexpected(make_error(
            ErrorCode::CommandFailed,
            "Cannot reload systemd",
            command_failure("systemctl daemon-reload", *reload)));
    }
    return {};
}

auto SystemdTimerScheduler::show(const std::string& unit, const std::vector<std::string>& properties)
    -> Result<std::vector<std::pair<std::string, std::string>>>
{
    std::vector<std::string> args = {"show", unit};
    for (const auto& p : properties) {
        args.push_back("--property=" + p);
    }

    auto out = systemctl(std::move(args));
    if (!out) return std::unexpected(out.error());
    if (!out->ok()) {
        return std::unexpected(make_error(
            ErrorCode::CommandFailed,
            "Cannot query unit",
            command_failure("systemctl show " + unit, *out)));
    }

    std::vector<std::pair<std::string, std::string>> values;
    for (const auto& line : utils::split(out->output, '\n')) {
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        values.emplace_back(line.substr(0, eq), utils::trim(line.substr(eq + 1)));
    }
    return values;
}

auto SystemdTimerScheduler::query(std::string_view pattern) -> Result<std::vector<RegistrationInfo>> {
    std::error_code ec;
    fs::directory_iterator it(unit_dir_, ec);
    if (ec) {
        return std::unexpected(make_error(
            ErrorCode::SchedulerUnavailable,
            "Cannot read unit directory",
            unit_dir_.string() + ": " + ec.message()));
    }

    std::vector<std::string> identities;
    for (const auto& entry : it) {
        auto name = entry.path().filename().string();
        if (!utils::ends_with(name, ".timer")) continue;
        auto identity = name.substr(0, name.size() - std::string_view(".timer").size());
        if (utils::glob_match(pattern, identity)) {
            identities.push_back(std::move(identity));
        }
    }
    std::ranges::sort(identities);

    auto lookup = [](const auto& values, std::string_view key) -> std::string {
        for (const auto& [k, v] : values) {
            if (k == key) return v;
        }
        return {};
    };

    std::vector<RegistrationInfo> infos;
    for (const auto& identity : identities) {
        auto timer = show(identity + ".timer",
                          {"ActiveState", "UnitFileState", "LastTriggerUSec", "NextElapseUSecRealtime"});
        if (!timer) {
            if (timer.error().is_fatal()) return std::unexpected(timer.error());
            LOG_WARN("{}: {}", identity, timer.error().what());
            infos.push_back(RegistrationInfo{.identity = identity});
            continue;
        }
        auto service = show(identity + ".service", {"ActiveState", "Result"});
        if (!service) {
            if (service.error().is_fatal()) return std::unexpected(service.error());
            LOG_WARN("{}: {}", identity, service.error().what());
        }
        auto service_values = service ? *service : std::vector<std::pair<std::string, std::string>>{};

        RegistrationInfo info;
        info.identity = identity;
        info.state = to_state(lookup(*timer, "ActiveState"), lookup(*timer, "UnitFileState"),
                              lookup(service_values, "ActiveState"), lookup(service_values, "Result"));
        if (auto last = lookup(*timer, "LastTriggerUSec"); !is_unset(last)) {
            info.last_run = last;
        }
        if (auto next = lookup(*timer, "NextElapseUSecRealtime"); !is_unset(next)) {
            info.next_run = next;
        }
        infos.push_back(std::move(info));
    }
    return infos;
}

auto SystemdTimerScheduler::start_now(std::string_view identity) -> Result<void> {
    auto found = unit_exists(service_path(identity));
    if (!found) return std::unexpected(found.error());
    if (!*found) {
        return std::unexpected(make_error(
            ErrorCode::NotFound,
            "No registration with this identity",
            std::string(identity)));
    }

    // --no-block: the worker may run for minutes; the timer owns its lifetime.
    auto out = systemctl({"start", "--no-block", std::string(identity) + ".service"});
    if (!out) return std::unexpected(out.error());
    if (!out->ok()) {
        return std::unexpected(make_error(
            ErrorCode::CommandFailed,
            "Cannot start task",
            command_failure("systemctl start", *out)));
    }
    return {};
}

void SystemdTimerScheduler::remove_unit_files(std::string_view identity) {
    std::error_code ec;
    fs::remove(timer_path(identity), ec);
    if (ec) LOG_WARN("Cannot remove {}: {}", timer_path(identity).string(), ec.message());
    fs::remove(service_path(identity), ec);
    if (ec) LOG_WARN("Cannot remove {}: {}", service_path(identity).string(), ec.message());
}

} // namespace pricesched::schedule
