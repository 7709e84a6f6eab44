#include <catch2/catch_test_macros.hpp>

#include <set>

#include "pricesched/schedule/reconciler.hpp"
#include "fake_task_scheduler.hpp"

using namespace pricesched;
using namespace pricesched::schedule;
using pricesched::testing::FakeTaskScheduler;

namespace {

auto allow() -> infra::PrivilegeCheck {
    return []() -> Result<void> { return {}; };
}

auto deny() -> infra::PrivilegeCheck {
    return []() -> Result<void> {
        return std::unexpected(make_error(ErrorCode::PrivilegeRequired, "not root"));
    };
}

auto make_request(std::vector<std::string> times) -> ReconcileRequest {
    auto planned = plan("PriceMonitor", times);
    REQUIRE(planned.has_value());

    ReconcileRequest request;
    request.planned = std::move(*planned);
    request.base_name = "PriceMonitor";
    request.description = "Price monitor check";
    request.action = ActionSpec{
        .executable = "/opt/price-monitor/venv/bin/python",
        .arguments = {"price_monitor.py", "--once"},
        .working_directory = "/opt/price-monitor",
    };
    request.principal = Principal{.user = "pricemon", .logon_mode = LogonMode::Service};
    return request;
}

const std::vector<std::string> kFourTimes = {"06:00", "12:00", "18:00", "00:00"};

} // anonymous namespace

TEST_CASE("Reconciler registers every planned identity", "[reconciler]") {
    FakeTaskScheduler scheduler;
    Reconciler reconciler(scheduler, allow());

    auto report = reconciler.reconcile(make_request(kFourTimes));
    REQUIRE(report.has_value());
    CHECK(report->ok());
    REQUIRE(report->entries.size() == 4);

    for (const auto& entry : report->entries) {
        CHECK(entry.outcome == Outcome::Registered);
    }

    CHECK(scheduler.identities() == std::set<std::string>{
        "PriceMonitor_0000", "PriceMonitor_0600", "PriceMonitor_1200", "PriceMonitor_1800"});

    SECTION("each registration carries the matching daily trigger") {
        const auto& reg = scheduler.live.at("PriceMonitor_1800");
        CHECK(reg.trigger.local == TimeSlot{18, 0});
        CHECK(reg.trigger.utc == TimeSlot{21, 0});
        CHECK(reg.principal.user == "pricemon");
        CHECK(reg.action.arguments.back() == "--once");
        CHECK(reg.policy.start_when_available);
    }
}

TEST_CASE("Reconciler is idempotent", "[reconciler]") {
    FakeTaskScheduler scheduler;
    Reconciler reconciler(scheduler, allow());
    auto request = make_request(kFourTimes);

    auto first = reconciler.reconcile(request);
    REQUIRE(first.has_value());
    auto after_first = scheduler.identities();

    auto second = reconciler.reconcile(request);
    REQUIRE(second.has_value());
    CHECK(second->ok());

    CHECK(scheduler.identities() == after_first);
    CHECK(scheduler.live.size() == 4);
    CHECK(scheduler.duplicate_registrations == 0);
    for (const auto& entry : second->entries) {
        CHECK(entry.outcome == Outcome::Replaced);
    }
}

TEST_CASE("Reconciler replaces a prior registration", "[reconciler]") {
    FakeTaskScheduler scheduler;
    Registration prior;
    prior.identity = "PriceMonitor_1200";
    prior.action.executable = "/old/worker";
    scheduler.live.emplace(prior.identity, prior);

    Reconciler reconciler(scheduler, allow());
    auto report = reconciler.reconcile(make_request({"12:00"}));
    REQUIRE(report.has_value());

    const auto* entry = report->find("PriceMonitor_1200");
    REQUIRE(entry != nullptr);
    CHECK(entry->outcome == Outcome::Replaced);

    REQUIRE(scheduler.live.size() == 1);
    CHECK(scheduler.live.at("PriceMonitor_1200").action.executable == "/opt/price-monitor/venv/bin/python");
    CHECK(scheduler.duplicate_registrations == 0);
}

TEST_CASE("Reconciler makes no changes without privilege", "[reconciler]") {
    FakeTaskScheduler scheduler;
    Registration prior;
    prior.identity = "PriceMonitor_0600";
    scheduler.live.emplace(prior.identity, prior);

    Reconciler reconciler(scheduler, deny());
    auto report = reconciler.reconcile(make_request(kFourTimes));

    REQUIRE_FALSE(report.has_value());
    CHECK(report.error().code() == ErrorCode::PrivilegeRequired);
    CHECK(scheduler.mutations() == 0);
    CHECK(scheduler.identities() == std::set<std::string>{"PriceMonitor_0600"});
}

TEST_CASE("Reconciler tolerates a single registration failure", "[reconciler]") {
    FakeTaskScheduler scheduler;
    scheduler.fail_register.insert("PriceMonitor_1200");

    Reconciler reconciler(scheduler, allow());
    auto report = reconciler.reconcile(make_request(kFourTimes));
    REQUIRE(report.has_value());
    CHECK_FALSE(report->ok());

    auto failures = report->failures();
    REQUIRE(failures.size() == 1);
    CHECK(failures.front()->identity == "PriceMonitor_1200");
    CHECK(failures.front()->reason.find("simulated") != std::string::npos);

    CHECK(scheduler.identities() == std::set<std::string>{
        "PriceMonitor_0000", "PriceMonitor_0600", "PriceMonitor_1800"});
    CHECK(scheduler.register_calls == 4);
}

TEST_CASE("Reconciler records an unregister failure against that identity", "[reconciler]") {
    FakeTaskScheduler scheduler;
    scheduler.fail_unregister.insert("PriceMonitor_0600");

    Reconciler reconciler(scheduler, allow());
    auto report = reconciler.reconcile(make_request({"06:00", "18:00"}));
    REQUIRE(report.has_value());

    const auto* failed = report->find("PriceMonitor_0600");
    REQUIRE(failed != nullptr);
    CHECK(failed->outcome == Outcome::Failed);

    const auto* ok = report->find("PriceMonitor_1800");
    REQUIRE(ok != nullptr);
    CHECK(ok->outcome == Outcome::Registered);
}

TEST_CASE("Reconciler aborts when the scheduler is unavailable", "[reconciler]") {
    SECTION("at pre-flight") {
        FakeTaskScheduler scheduler;
        scheduler.available = false;

        Reconciler reconciler(scheduler, allow());
        auto report = reconciler.reconcile(make_request(kFourTimes));
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code() == ErrorCode::SchedulerUnavailable);
        CHECK(scheduler.mutations() == 0);
    }

    SECTION("mid-run stops the remaining work and keeps the partial report") {
        FakeTaskScheduler scheduler;
        scheduler.unavailable_on_register.insert("PriceMonitor_1200");

        Reconciler reconciler(scheduler, allow());
        auto report = reconciler.reconcile(make_request(kFourTimes));
        REQUIRE(report.has_value());
        REQUIRE(report->aborted.has_value());
        CHECK(report->aborted->code() == ErrorCode::SchedulerUnavailable);
        CHECK_FALSE(report->ok());
        CHECK(scheduler.register_calls == 2);
        CHECK(scheduler.identities() == std::set<std::string>{"PriceMonitor_0600"});

        REQUIRE(report->entries.size() == 1);
        const auto* done = report->find("PriceMonitor_0600");
        REQUIRE(done != nullptr);
        CHECK(done->outcome == Outcome::Registered);
        CHECK(report->find("PriceMonitor_1200") == nullptr);
    }
}

TEST_CASE("Reconciler pre-flight validation", "[reconciler]") {
    FakeTaskScheduler scheduler;
    Reconciler reconciler(scheduler, allow());

    SECTION("empty plan") {
        auto request = make_request({"06:00"});
        request.planned.clear();
        auto report = reconciler.reconcile(request);
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("identity collision") {
        auto request = make_request({"06:00"});
        request.planned.push_back(request.planned.front());
        auto report = reconciler.reconcile(request);
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("missing executable") {
        auto request = make_request({"06:00"});
        request.action.executable.clear();
        auto report = reconciler.reconcile(request);
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code() == ErrorCode::InvalidConfig);
    }

    CHECK(scheduler.mutations() == 0);
}

TEST_CASE("Reconciler rejects a malformed trigger per identity", "[reconciler]") {
    FakeTaskScheduler scheduler;
    Reconciler reconciler(scheduler, allow());

    auto request = make_request({"06:00"});
    request.planned.push_back(PlannedTask{.identity = "PriceMonitor_2561", .slot = TimeSlot{25, 61}});

    auto report = reconciler.reconcile(request);
    REQUIRE(report.has_value());

    const auto* bad = report->find("PriceMonitor_2561");
    REQUIRE(bad != nullptr);
    CHECK(bad->outcome == Outcome::Failed);
    CHECK(scheduler.identities() == std::set<std::string>{"PriceMonitor_0600"});
}

TEST_CASE("Reconciler prunes identities dropped from the plan", "[reconciler]") {
    FakeTaskScheduler scheduler;
    Reconciler reconciler(scheduler, allow());

    REQUIRE(reconciler.reconcile(make_request({"06:00", "09:00"})).has_value());

    Registration unrelated;
    unrelated.identity = "OtherJob_0900";
    scheduler.live.emplace(unrelated.identity, unrelated);

    SECTION("stale identity is removed") {
        auto report = reconciler.reconcile(make_request({"06:00", "18:00"}));
        REQUIRE(report.has_value());
        CHECK(report->ok());

        const auto* removed = report->find("PriceMonitor_0900");
        REQUIRE(removed != nullptr);
        CHECK(removed->outcome == Outcome::Removed);

        CHECK(scheduler.identities() == std::set<std::string>{
            "OtherJob_0900", "PriceMonitor_0600", "PriceMonitor_1800"});
    }

    SECTION("pruning can be disabled") {
        auto request = make_request({"06:00"});
        request.prune_stale = false;
        REQUIRE(reconciler.reconcile(request).has_value());
        CHECK(scheduler.live.contains("PriceMonitor_0900"));
    }
}

TEST_CASE("Reconciler remove_all clears only derived identities", "[reconciler]") {
    FakeTaskScheduler scheduler;
    Reconciler reconciler(scheduler, allow());
    REQUIRE(reconciler.reconcile(make_request(kFourTimes)).has_value());

    Registration unrelated;
    unrelated.identity = "PriceMonitor_manual";
    scheduler.live.emplace(unrelated.identity, unrelated);

    auto report = reconciler.remove_all("PriceMonitor");
    REQUIRE(report.has_value());
    CHECK(report->entries.size() == 4);
    CHECK(scheduler.identities() == std::set<std::string>{"PriceMonitor_manual"});

    SECTION("requires privilege") {
        Reconciler denied(scheduler, deny());
        auto before = scheduler.unregister_calls;
        auto result = denied.remove_all("PriceMonitor");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::PrivilegeRequired);
        CHECK(scheduler.unregister_calls == before);
    }
}

TEST_CASE("format_report lists every identity with its outcome", "[reconciler]") {
    ReconcileReport report;
    report.entries.push_back({.identity = "PriceMonitor_0600", .slot = TimeSlot{6, 0},
                              .outcome = Outcome::Registered});
    report.entries.push_back({.identity = "PriceMonitor_1200", .slot = TimeSlot{12, 0},
                              .outcome = Outcome::Failed, .reason = "boom"});

    auto text = format_report(report);
    CHECK(text.find("PriceMonitor_0600  06:00  registered") != std::string::npos);
    CHECK(text.find("PriceMonitor_1200  12:00  failed: boom") != std::string::npos);
    CHECK(text.find("2 task(s): 1 registered, 0 replaced, 0 removed, 1 failed") != std::string::npos);
}
