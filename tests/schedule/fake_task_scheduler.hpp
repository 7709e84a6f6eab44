#pragma once

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "pricesched/core/utils.hpp"
#include "pricesched/schedule/task_scheduler.hpp"

namespace pricesched::testing {

/// In-memory stand-in for the OS scheduler's registration table.
class FakeTaskScheduler : public schedule::TaskScheduler {
public:
    auto probe() -> Result<void> override {
        ++probe_calls;
        if (!available) {
            return std::unexpected(make_error(ErrorCode::SchedulerUnavailable, "fake scheduler offline"));
        }
        return {};
    }

    auto register_task(const Registration& registration) -> Result<void> override {
        ++register_calls;
        if (auto r = injected(registration.identity); !r) return r;
        if (live.contains(registration.identity)) {
            ++duplicate_registrations;
            return std::unexpected(make_error(
                ErrorCode::RegistrationFailed, "already registered", registration.identity));
        }
        live.emplace(registration.identity, registration);
        return {};
    }

    auto unregister_task(std::string_view identity) -> Result<void> override {
        ++unregister_calls;
        if (fail_unregister.contains(std::string(identity))) {
            return std::unexpected(make_error(
                ErrorCode::CommandFailed, "simulated unregister failure", std::string(identity)));
        }
        auto it = live.find(std::string(identity));
        if (it == live.end()) {
            return std::unexpected(make_error(ErrorCode::NotFound, "not registered", std::string(identity)));
        }
        live.erase(it);
        return {};
    }

    auto query(std::string_view pattern) -> Result<std::vector<RegistrationInfo>> override {
        ++query_calls;
        std::vector<RegistrationInfo> infos;
        for (const auto& [identity, _] : live) {
            if (utils::glob_match(pattern, identity)) {
                infos.push_back(RegistrationInfo{.identity = identity, .state = RegistrationState::Ready});
            }
        }
        return infos;
    }

    auto start_now(std::string_view identity) -> Result<void> override {
        if (!live.contains(std::string(identity))) {
            return std::unexpected(make_error(ErrorCode::NotFound, "not registered", std::string(identity)));
        }
        started.push_back(std::string(identity));
        return {};
    }

    [[nodiscard]] auto mutations() const -> int { return register_calls + unregister_calls; }

    [[nodiscard]] auto identities() const -> std::set<std::string> {
        std::set<std::string> ids;
        for (const auto& [identity, _] : live) ids.insert(identity);
        return ids;
    }

    std::map<std::string, Registration> live;
    std::set<std::string> fail_register;
    std::set<std::string> fail_unregister;
    std::set<std::string> unavailable_on_register;  // registering these reports SchedulerUnavailable
    std::vector<std::string> started;
    bool available = true;

    int probe_calls = 0;
    int register_calls = 0;
    int unregister_calls = 0;
    int query_calls = 0;
    int duplicate_registrations = 0;

private:
    auto injected(const std::string& identity) -> Result<void> {
        if (unavailable_on_register.contains(identity)) {
            return std::unexpected(make_error(ErrorCode::SchedulerUnavailable, "scheduler went away"));
        }
        if (fail_register.contains(identity)) {
            return std::unexpected(make_error(
                ErrorCode::RegistrationFailed, "simulated registration failure", identity));
        }
        return {};
    }
};

} // namespace pricesched::testing
