#pragma once

#include <functional>

#include "pricesched/core/error.hpp"

namespace pricesched::infra {

/// Pre-flight gate run before any scheduler mutation.
using PrivilegeCheck = std::function<Result<void>()>;

/// Succeeds when the effective user is root, otherwise
/// ErrorCode::PrivilegeRequired.
auto check_elevated() -> Result<void>;

} // namespace pricesched::infra
