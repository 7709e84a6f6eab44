#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace pricesched::utils {

auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto to_lower(std::string_view s) -> std::string;
auto ends_with(std::string_view s, std::string_view suffix) -> bool;

/// Shell-style wildcard match supporting `*` and `?`.
auto glob_match(std::string_view pattern, std::string_view text) -> bool;

/// Quote a single argument for /bin/sh using single quotes.
auto shell_quote(std::string_view arg) -> std::string;

} // namespace pricesched::utils
