#include "pricesched/core/config.hpp"
#include "pricesched/core/logger.hpp"
#include "pricesched/core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace pricesched {

auto load_config(const std::filesystem::path& path) -> Result<Config> {
    if (!std::filesystem::exists(path)) {
        return std::unexpected(make_error(
            ErrorCode::NotFound,
            "Config file not found",
            path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(
            ErrorCode::IoError,
            "Cannot open config file",
            path.string()));
    }

    try {
        json j = json::parse(file);

        // Accept the worker's own scheduling section layout where the times
        // live under "scheduling.times".
        if (j.contains("scheduling") && j["scheduling"].is_object()) {
            auto& sched = j["scheduling"];
            if (!sched.contains("scheduled_times") && sched.contains("times")) {
                LOG_DEBUG("Config: using scheduling.times as scheduling.scheduled_times");
                sched["scheduled_times"] = sched["times"];
            }
        }

        auto config = j.get<Config>();
        LOG_DEBUG("Loaded configuration from {}", path.string());
        return config;
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "Failed to parse config",
            path.string() + ": " + e.what()));
    }
}

void apply_env_overrides(Config& config) {
    if (auto* val = std::getenv("PRICESCHED_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("PRICESCHED_TASK_NAME")) {
        config.task.base_name = val;
    }
    if (auto* val = std::getenv("PRICESCHED_TIMES")) {
        std::vector<std::string> times;
        for (const auto& part : utils::split(val, ',')) {
            auto t = utils::trim(part);
            if (!t.empty()) times.push_back(std::move(t));
        }
        config.scheduling.scheduled_times = std::move(times);
    }
    if (auto* val = std::getenv("PRICESCHED_WORKER")) {
        config.worker.executable = val;
    }
    if (auto* val = std::getenv("PRICESCHED_WORKDIR")) {
        config.worker.working_directory = val;
    }
    if (auto* val = std::getenv("PRICESCHED_USER")) {
        config.principal.user = val;
    }
}

auto default_config() -> Config {
    return Config{};
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // Check for $$ escape
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            // Escaped: $${VAR} -> literal ${VAR}
            result += '$';
            i += 2;
            continue;
        }

        // Check for ${VAR} pattern
        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                auto var_name = input.substr(i + 2, close - i - 2);
                std::string var_name_str(var_name);

                if (auto* val = std::getenv(var_name_str.c_str())) {
                    result += val;
                } else {
                    // Preserve unresolved refs
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

auto action_from_config(const WorkerConfig& worker) -> ActionSpec {
    ActionSpec action;
    action.executable = resolve_env_refs(worker.executable);
    action.working_directory = resolve_env_refs(worker.working_directory);
    for (const auto& arg : worker.arguments) {
        action.arguments.push_back(resolve_env_refs(arg));
    }

    if (std::ranges::find(action.arguments, kSingleShotFlag) == action.arguments.end()) {
        action.arguments.emplace_back(kSingleShotFlag);
    }
    return action;
}

auto policy_from_config(const PolicyConfig& policy) -> RunPolicy {
    return RunPolicy{
        .allow_on_battery = policy.allow_on_battery,
        .keep_running_on_power_change = policy.keep_running_on_power_change,
        .start_when_available = policy.start_when_available,
        .restart_on_failure = policy.restart_on_failure,
        .restart_delay_sec = policy.restart_delay_sec,
    };
}

auto principal_from_config(const PrincipalConfig& principal) -> Principal {
    return Principal{
        .user = resolve_env_refs(principal.user),
        .logon_mode = principal.logon_mode,
    };
}

} // namespace pricesched
