#pragma once

#include <string>
#include <vector>

#include "pricesched/core/error.hpp"

namespace pricesched::infra {

struct CommandOutput {
    int exit_code = 0;
    std::string output;  // stdout and stderr, interleaved

    [[nodiscard]] auto ok() const noexcept -> bool { return exit_code == 0; }
};

/// Runs external programs to completion.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /// Run `argv` and wait for it. A non-zero exit status is reported in
    /// CommandOutput, not as an error; errors mean the program could not be
    /// started at all.
    virtual auto run(const std::vector<std::string>& argv) -> Result<CommandOutput> = 0;
};

/// CommandRunner backed by popen(3) and /bin/sh.
class PopenCommandRunner : public CommandRunner {
public:
    explicit PopenCommandRunner(size_t max_output_bytes = 65536);

    auto run(const std::vector<std::string>& argv) -> Result<CommandOutput> override;

private:
    size_t max_output_bytes_;
};

} // namespace pricesched::infra
