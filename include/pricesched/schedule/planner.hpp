#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "pricesched/core/error.hpp"
#include "pricesched/core/types.hpp"

namespace pricesched::schedule {

/// One planned registration: the identity and the slot it fires at.
struct PlannedTask {
    TaskIdentity identity;
    TimeSlot slot;
};

/// Parse a time-of-day string.
///
/// Accepted forms are `HH:MM` and `H:MM` with optional surrounding
/// whitespace. Hour must be 0-23 and minute 0-59.
///
/// @param text  The time string, e.g. "06:00".
/// @returns     The parsed slot, or ErrorCode::InvalidTime naming the input.
auto parse_time_of_day(std::string_view text) -> Result<TimeSlot>;

/// Format a slot as zero-padded `HH:MM`.
auto format_time_of_day(const TimeSlot& slot) -> std::string;

/// Derive the identity for a slot: `<base>_<HH><MM>`.
///
/// Fails with ErrorCode::InvalidArgument when the base name is empty or
/// contains characters outside [A-Za-z0-9_.-], and with
/// ErrorCode::InvalidTime when the slot is out of range.
auto make_identity(std::string_view base_name, const TimeSlot& slot) -> Result<TaskIdentity>;

/// True when `identity` has the exact shape make_identity() produces for
/// `base_name`: `<base>_HHMM` with a valid hour and minute.
auto is_derived_identity(std::string_view base_name, std::string_view identity) -> bool;

/// Build the daily trigger for a slot given the reference zone offset
/// (minutes east of UTC; Brasília is -180).
auto make_trigger(const TimeSlot& slot, int utc_offset_minutes) -> TriggerSpec;

/// True when hour and minute are within the 24x60 domain.
auto is_valid_slot(const TimeSlot& slot) -> bool;

/// Plan one registration per distinct time of day.
///
/// Duplicates collapse onto the first occurrence, so the output preserves
/// input order. An empty list, a malformed time, or an invalid base name
/// fails the whole plan; nothing is skipped silently.
auto plan(std::string_view base_name, const std::vector<std::string>& times_of_day)
    -> Result<std::vector<PlannedTask>>;

/// Same as above for already-parsed slots.
auto plan(std::string_view base_name, const std::vector<TimeSlot>& slots)
    -> Result<std::vector<PlannedTask>>;

} // namespace pricesched::schedule
