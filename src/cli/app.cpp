#include "pricesched/cli/app.hpp"
#include "pricesched/cli/commands.hpp"
#include "pricesched/core/logger.hpp"
#include "pricesched/infra/command_runner.hpp"
#include "pricesched/infra/privilege.hpp"
#include "pricesched/schedule/task_scheduler.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>

// Version string; typically injected by CMake via -DPRICESCHED_VERSION_STRING=...
#ifndef PRICESCHED_VERSION_STRING
#define PRICESCHED_VERSION_STRING "0.1.0-dev"
#endif

namespace pricesched::cli {

App::App()
    : cli_("pricesched", "Register the price monitor's daily runs with the system scheduler")
{
    cli_.set_version_flag("--version", PRICESCHED_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("PRICESCHED_CONFIG")
        ->capture_default_str();

    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical)");

    auto* list = cli_.add_flag("--list", list_,
                               "Show the registered tasks and their next run");
    cli_.add_flag("--json", json_, "Print --list output as JSON")->needs(list);
    auto* run_now = cli_.add_option("--run-now", run_now_,
                                    "Start the given task identity immediately");
    auto* uninstall = cli_.add_flag("--uninstall", uninstall_,
                                    "Remove every registered task for the configured name");
    auto* dry_run = cli_.add_flag("--dry-run", dry_run_,
                                  "Print the units that would be installed and exit");

    list->excludes(run_now)->excludes(uninstall)->excludes(dry_run);
    run_now->excludes(uninstall)->excludes(dry_run);
    uninstall->excludes(dry_run);
}

App::~App() = default;

auto App::load() -> Result<void> {
    std::filesystem::path path(config_path_);
    // Given on the command line or through PRICESCHED_CONFIG: must exist.
    bool explicit_path = cli_.get_option("--config")->count() > 0;

    std::error_code ec;
    if (explicit_path || std::filesystem::exists(path, ec)) {
        auto loaded = load_config(path);
        if (!loaded) return std::unexpected(loaded.error());
        config_ = std::move(*loaded);
    } else {
        config_ = default_config();
    }

    apply_env_overrides(config_);
    if (!log_level_.empty()) {
        config_.log_level = log_level_;
    }
    return {};
}

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    auto loaded = load();

    Logger::init("pricesched", config_.log_level, config_.log_file.value_or(""));

    if (!loaded) {
        LOG_ERROR("{}", loaded.error().what());
        std::cerr << "error [" << error_code_to_string(loaded.error().code()) << "]: "
                  << loaded.error().what() << "\n";
        return kExitFatal;
    }
    LOG_DEBUG("Configuration: {}", config_path_);

    if (dry_run_) {
        return run_dry_run(config_, std::cout);
    }

    infra::PopenCommandRunner runner;
    auto scheduler = schedule::make_task_scheduler(config_.backend, runner);
    if (!scheduler) {
        LOG_ERROR("{}", scheduler.error().what());
        std::cerr << "error [" << error_code_to_string(scheduler.error().code()) << "]: "
                  << scheduler.error().what() << "\n";
        return kExitFatal;
    }

    infra::PrivilegeCheck privilege_check = infra::check_elevated;

    int code = kExitOk;
    if (list_) {
        code = run_list(config_, **scheduler, std::cout, json_);
    } else if (!run_now_.empty()) {
        code = run_start_now(config_, run_now_, **scheduler, privilege_check, std::cout);
    } else if (uninstall_) {
        code = run_uninstall(config_, **scheduler, privilege_check, std::cout);
    } else {
        code = run_setup(config_, **scheduler, privilege_check, std::cout);
    }

    Logger::flush();
    return code;
}

auto App::config() const -> const Config& {
    return config_;
}

} // namespace pricesched::cli
