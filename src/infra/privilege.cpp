#include "pricesched/infra/privilege.hpp"

#include <string>

#include <unistd.h>

namespace pricesched::infra {

auto check_elevated() -> Result<void> {
    auto euid = ::geteuid();
    if (euid != 0) {
        return std::unexpected(make_error(
            ErrorCode::PrivilegeRequired,
            "Managing scheduled tasks requires root; re-run with sudo",
            "euid " + std::to_string(euid)));
    }
    return {};
}

} // namespace pricesched::infra
