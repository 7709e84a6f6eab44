#include "pricesched/schedule/planner.hpp"
#include "pricesched/core/utils.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <unordered_set>

namespace pricesched::schedule {

namespace {

constexpr int kMinutesPerDay = 24 * 60;
constexpr size_t kSlotDigits = 4;

auto invalid_time(std::string_view text, std::string_view why) -> Error {
    return make_error(
        ErrorCode::InvalidTime,
        "Invalid time of day",
        "'" + std::string(text) + "' (" + std::string(why) + ")");
}

auto parse_component(std::string_view part, int& out) -> bool {
    if (part.empty() || part.size() > 2) return false;
    auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), out);
    return ec == std::errc{} && ptr == part.data() + part.size();
}

auto is_identity_char(char c) -> bool {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
}

} // anonymous namespace

auto parse_time_of_day(std::string_view text) -> Result<TimeSlot> {
    auto trimmed = utils::trim(text);

    auto colon = trimmed.find(':');
    if (colon == std::string::npos) {
        return std::unexpected(invalid_time(text, "expected HH:MM"));
    }

    std::string_view view(trimmed);
    auto hour_part = view.substr(0, colon);
    auto minute_part = view.substr(colon + 1);

    TimeSlot slot;
    if (!parse_component(hour_part, slot.hour) || minute_part.size() != 2 ||
        !parse_component(minute_part, slot.minute)) {
        return std::unexpected(invalid_time(text, "expected HH:MM"));
    }

    if (slot.hour < 0 || slot.hour > 23) {
        return std::unexpected(invalid_time(text, "hour must be 0-23"));
    }
    if (slot.minute < 0 || slot.minute > 59) {
        return std::unexpected(invalid_time(text, "minute must be 0-59"));
    }

    return slot;
}

auto format_time_of_day(const TimeSlot& slot) -> std::string {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", slot.hour, slot.minute);
    return buf;
}

auto is_valid_slot(const TimeSlot& slot) -> bool {
    return slot.hour >= 0 && slot.hour <= 23 && slot.minute >= 0 && slot.minute <= 59;
}

auto make_identity(std::string_view base_name, const TimeSlot& slot) -> Result<TaskIdentity> {
    if (base_name.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "Task base name must not be empty"));
    }
    if (!std::ranges::all_of(base_name, is_identity_char)) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "Task base name may only contain letters, digits, '_', '-' and '.'",
            std::string(base_name)));
    }
    if (!is_valid_slot(slot)) {
        return std::unexpected(make_error(
            ErrorCode::InvalidTime,
            "Time slot out of range",
            std::to_string(slot.hour) + ":" + std::to_string(slot.minute)));
    }

    char suffix[8];
    std::snprintf(suffix, sizeof(suffix), "_%02d%02d", slot.hour, slot.minute);
    return std::string(base_name) + suffix;
}

auto is_derived_identity(std::string_view base_name, std::string_view identity) -> bool {
    if (base_name.empty()) return false;
    if (identity.size() != base_name.size() + 1 + kSlotDigits) return false;
    if (!identity.starts_with(base_name) || identity[base_name.size()] != '_') return false;

    auto digits = identity.substr(base_name.size() + 1);
    if (!std::ranges::all_of(digits, [](char c) { return c >= '0' && c <= '9'; })) return false;

    int hour = (digits[0] - '0') * 10 + (digits[1] - '0');
    int minute = (digits[2] - '0') * 10 + (digits[3] - '0');
    return is_valid_slot(TimeSlot{.hour = hour, .minute = minute});
}

auto make_trigger(const TimeSlot& slot, int utc_offset_minutes) -> TriggerSpec {
    // Local = UTC + offset, so UTC = local - offset, wrapped into one day.
    int utc_minute = (slot.minute_of_day() - utc_offset_minutes) % kMinutesPerDay;
    if (utc_minute < 0) utc_minute += kMinutesPerDay;

    return TriggerSpec{
        .local = slot,
        .utc = TimeSlot{.hour = utc_minute / 60, .minute = utc_minute % 60},
        .utc_offset_minutes = utc_offset_minutes,
    };
}

auto plan(std::string_view base_name, const std::vector<std::string>& times_of_day)
    -> Result<std::vector<PlannedTask>>
{
    std::vector<TimeSlot> slots;
    slots.reserve(times_of_day.size());

    for (const auto& text : times_of_day) {
        auto slot = parse_time_of_day(text);
        if (!slot) return std::unexpected(slot.error());
        slots.push_back(*slot);
    }

    return plan(base_name, slots);
}

auto plan(std::string_view base_name, const std::vector<TimeSlot>& slots)
    -> Result<std::vector<PlannedTask>>
{
    if (slots.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "At least one time of day is required"));
    }

    std::vector<PlannedTask> planned;
    std::unordered_set<int> seen_slots;
    std::unordered_set<std::string> seen_ids;

    for (const auto& slot : slots) {
        auto identity = make_identity(base_name, slot);
        if (!identity) return std::unexpected(identity.error());

        if (!seen_slots.insert(slot.minute_of_day()).second) {
            continue;
        }
        if (!seen_ids.insert(*identity).second) {
            return std::unexpected(make_error(
                ErrorCode::InvalidArgument,
                "Identity collision",
                *identity));
        }

        planned.push_back(PlannedTask{.identity = std::move(*identity), .slot = slot});
    }

    return planned;
}

} // namespace pricesched::schedule
