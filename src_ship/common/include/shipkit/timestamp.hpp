#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace shipkit {

/// Wall-clock instant with millisecond resolution, the precision of the persisted format.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

/// Injectable time source; tests replace it to pin `lastUpdate` and durations.
using ClockFn = std::function<Timestamp()>;

[[nodiscard]] Timestamp now_ms();

[[nodiscard]] ClockFn system_clock_fn();

/**
 * \brief Formats `ts` as UTC ISO-8601 with milliseconds, e.g. `2026-10-19T08:15:30.042Z`.
 */
[[nodiscard]] std::string format_iso8601(Timestamp ts);

/**
 * \brief Parses the output of format_iso8601().
 *
 * The fractional part is optional and may carry 1 to 3 digits; the trailing `Z`
 * is mandatory. Returns std::nullopt on any other shape.
 */
[[nodiscard]] std::optional<Timestamp> parse_iso8601(std::string_view text);

/// Filename-safe variant of format_iso8601(): `:` and `.` replaced with `-`.
[[nodiscard]] std::string file_stamp(Timestamp ts);

/// Milliseconds from `from` to `to`.
[[nodiscard]] std::int64_t elapsed_ms(Timestamp from, Timestamp to);

}  // namespace shipkit
