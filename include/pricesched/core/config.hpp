#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "pricesched/core/error.hpp"
#include "pricesched/core/types.hpp"

// std::optional serializer for nlohmann/json so the NLOHMANN_DEFINE macros
// to work with optional fields via j.value("key", default_val)
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace pricesched {

/// Default location of the configuration file.
inline constexpr std::string_view kDefaultConfigPath = "/etc/pricesched/config.json";

/// Argument that makes the worker run one check and exit.
inline constexpr std::string_view kSingleShotFlag = "--once";

struct TaskConfig {
    std::string base_name = "PriceMonitor";
    std::string description = "Price monitor check";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(TaskConfig, base_name, description)

struct SchedulingConfig {
    std::vector<std::string> scheduled_times = {"12:00", "18:00"};
    int utc_offset_minutes = -180;  // Brasília, fixed offset
    bool prune_stale = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SchedulingConfig, scheduled_times, utc_offset_minutes, prune_stale)

struct WorkerConfig {
    std::string executable;
    std::vector<std::string> arguments = {"price_monitor.py", "--once"};
    std::string working_directory;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(WorkerConfig, executable, arguments, working_directory)

struct PrincipalConfig {
    std::string user = "root";
    LogonMode logon_mode = LogonMode::Service;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(PrincipalConfig, user, logon_mode)

struct PolicyConfig {
    bool allow_on_battery = true;
    bool keep_running_on_power_change = true;
    bool start_when_available = true;
    bool restart_on_failure = false;
    int restart_delay_sec = 300;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(PolicyConfig, allow_on_battery, keep_running_on_power_change,
                                                start_when_available, restart_on_failure, restart_delay_sec)

struct BackendConfig {
    std::string type = "systemd";
    std::string unit_dir = "/etc/systemd/system";
    std::string systemctl = "systemctl";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(BackendConfig, type, unit_dir, systemctl)

struct Config {
    TaskConfig task;
    SchedulingConfig scheduling;
    WorkerConfig worker;
    PrincipalConfig principal;
    PolicyConfig policy;
    BackendConfig backend;
    std::string log_level = "info";
    std::optional<std::string> log_file;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, task, scheduling, worker, principal, policy, backend,
                                                log_level, log_file)

/// Load a JSON configuration file. Keys that are absent keep their defaults.
auto load_config(const std::filesystem::path& path) -> Result<Config>;

/// Overlay PRICESCHED_* environment variables onto `config`.
void apply_env_overrides(Config& config);

auto default_config() -> Config;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

/// Build the worker invocation from config, expanding env refs and making
/// sure the single-shot flag is present.
auto action_from_config(const WorkerConfig& worker) -> ActionSpec;

auto policy_from_config(const PolicyConfig& policy) -> RunPolicy;

auto principal_from_config(const PrincipalConfig& principal) -> Principal;

} // namespace pricesched
