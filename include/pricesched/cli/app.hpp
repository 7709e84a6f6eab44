#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "pricesched/core/config.hpp"

namespace pricesched::cli {

/// Top-level CLI application.
///
/// A single entry point without subcommands: by default it reconciles the
/// configured schedule; `--list`, `--run-now`, `--uninstall` and
/// `--dry-run` select the auxiliary operations.
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected operation.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    /// The configuration resolved by the last run(): file, then
    /// environment, then `--log-level`.
    [[nodiscard]] auto config() const -> const Config&;

private:
    /// Load the config file and overlay environment and CLI overrides.
    auto load() -> Result<void>;

    CLI::App cli_;
    Config config_;
    std::string config_path_{kDefaultConfigPath};
    std::string log_level_;
    std::string run_now_;
    bool list_ = false;
    bool json_ = false;
    bool uninstall_ = false;
    bool dry_run_ = false;
};

} // namespace pricesched::cli
