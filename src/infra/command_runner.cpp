#include "pricesched/infra/command_runner.hpp"
#include "pricesched/core/logger.hpp"
#include "pricesched/core/utils.hpp"

#include <algorithm>
#include <array>
#include <cstdio>

#include <sys/wait.h>

namespace pricesched::infra {

PopenCommandRunner::PopenCommandRunner(size_t max_output_bytes)
    : max_output_bytes_(max_output_bytes)
{
}

auto PopenCommandRunner::run(const std::vector<std::string>& argv) -> Result<CommandOutput> {
    if (argv.empty() || argv.front().empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "Empty command"));
    }

    std::string full_cmd;
    for (const auto& arg : argv) {
        if (!full_cmd.empty()) full_cmd += ' ';
        full_cmd += utils::shell_quote(arg);
    }
    full_cmd += " 2>&1";

    LOG_DEBUG("exec: {}", full_cmd);

    auto* pipe = ::popen(full_cmd.c_str(), "r");
    if (!pipe) {
        return std::unexpected(make_error(
            ErrorCode::IoError,
            "Failed to execute command",
            argv.front()));
    }

    CommandOutput result;
    std::array<char, 4096> buffer{};
    while (true) {
        auto n = std::fread(buffer.data(), 1, buffer.size(), pipe);
        if (n == 0) break;
        // Keep draining so the child never blocks on a full pipe.
        if (result.output.size() < max_output_bytes_) {
            result.output.append(buffer.data(), std::min(n, max_output_bytes_ - result.output.size()));
        }
    }

    int status = ::pclose(pipe);
    if (status == -1) {
        return std::unexpected(make_error(
            ErrorCode::IoError,
            "Failed to wait for command",
            argv.front()));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = status;
    }

    while (!result.output.empty() && (result.output.back() == '\n' || result.output.back() == '\r')) {
        result.output.pop_back();
    }

    return result;
}

} // namespace pricesched::infra
