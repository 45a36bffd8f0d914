#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace time_utils
{

// Every timestamp in the process is UTC seconds since the epoch.
using TimePoint = std::chrono::sys_seconds;

class Clock
{
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual TimePoint now() const = 0;
};

class SystemClock final : public Clock
{
public:
    [[nodiscard]] TimePoint now() const override
    {
        return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    }

    static const SystemClock& instance();
};

[[nodiscard]] inline int64_t to_unix(TimePoint tp)
{
    return tp.time_since_epoch().count();
}

[[nodiscard]] inline TimePoint from_unix(int64_t secs)
{
    return TimePoint{std::chrono::seconds{secs}};
}

/**
 * The single conversion for timestamps that arrive as text (stored columns,
 * legacy rows, external input). Accepted forms:
 *   1700000000                    Unix seconds
 *   2025-11-30T12:00:00Z          UTC
 *   2025-11-30 12:00:00+02:00     explicit offset, shifted to UTC
 *   2025-11-30T12:00:00           naive, taken as UTC
 * Fractional seconds are truncated.
 */
[[nodiscard]] std::optional<TimePoint> normalize_utc(std::string_view text);

// "YYYY-MM-DD HH:MM:SS UTC"
[[nodiscard]] std::string format_utc(TimePoint tp);

// "YYYY-MM-DDTHH:MM:SSZ"
[[nodiscard]] std::string format_iso(TimePoint tp);

} // namespace time_utils
