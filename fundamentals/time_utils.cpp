#include "fundamentals/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <ctime>
#include <format>

namespace time_utils
{

namespace
{

bool read_fixed(std::string_view& sv, size_t width, int& out)
{
    if (sv.size() < width)
    {
        return false;
    }
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + width, out);
    if (ec != std::errc{} || ptr != sv.data() + width)
    {
        return false;
    }
    sv.remove_prefix(width);
    return true;
}

bool consume(std::string_view& sv, char ch)
{
    if (sv.empty() || sv.front() != ch)
    {
        return false;
    }
    sv.remove_prefix(1);
    return true;
}

std::string_view trim(std::string_view sv)
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

std::optional<std::chrono::seconds> parse_offset(std::string_view sv)
{
    if (sv.empty())
    {
        return std::chrono::seconds{0}; // naive
    }
    if (sv == "Z" || sv == "z")
    {
        return std::chrono::seconds{0};
    }

    int sign = 0;
    if (sv.front() == '+')
    {
        sign = 1;
    }
    else if (sv.front() == '-')
    {
        sign = -1;
    }
    else
    {
        return std::nullopt;
    }
    sv.remove_prefix(1);

    int hh = 0;
    int mm = 0;
    if (!read_fixed(sv, 2, hh))
    {
        return std::nullopt;
    }
    consume(sv, ':');
    if (!sv.empty() && !read_fixed(sv, 2, mm))
    {
        return std::nullopt;
    }
    if (!sv.empty() || hh > 23 || mm > 59)
    {
        return std::nullopt;
    }
    return std::chrono::seconds{sign * (hh * 3600 + mm * 60)};
}

std::tm to_tm(TimePoint tp)
{
    std::time_t t = static_cast<std::time_t>(to_unix(tp));
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

} // namespace

const SystemClock& SystemClock::instance()
{
    static const SystemClock clk;
    return clk;
}

std::optional<TimePoint> normalize_utc(std::string_view text)
{
    auto sv = trim(text);
    if (sv.empty())
    {
        return std::nullopt;
    }

    if (std::ranges::all_of(sv, [](unsigned char c){ return std::isdigit(c) != 0; }))
    {
        int64_t secs = 0;
        auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), secs);
        if (ec != std::errc{})
        {
            return std::nullopt;
        }
        return from_unix(secs);
    }

    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!read_fixed(sv, 4, y) || !consume(sv, '-') ||
        !read_fixed(sv, 2, mo) || !consume(sv, '-') ||
        !read_fixed(sv, 2, d))
    {
        return std::nullopt;
    }

    if (!sv.empty())
    {
        if (!consume(sv, 'T') && !consume(sv, ' '))
        {
            return std::nullopt;
        }
        if (!read_fixed(sv, 2, h) || !consume(sv, ':') || !read_fixed(sv, 2, mi))
        {
            return std::nullopt;
        }
        if (consume(sv, ':') && !read_fixed(sv, 2, s))
        {
            return std::nullopt;
        }
        if (consume(sv, '.'))
        {
            while (!sv.empty() && std::isdigit(static_cast<unsigned char>(sv.front())))
            {
                sv.remove_prefix(1);
            }
        }
    }

    if (h > 23 || mi > 59 || s > 60)
    {
        return std::nullopt;
    }

    std::chrono::year_month_day ymd{
        std::chrono::year{y},
        std::chrono::month{static_cast<unsigned>(mo)},
        std::chrono::day{static_cast<unsigned>(d)}};
    if (!ymd.ok())
    {
        return std::nullopt;
    }

    auto offset = parse_offset(sv);
    if (!offset)
    {
        return std::nullopt;
    }

    TimePoint local = std::chrono::sys_days{ymd}
        + std::chrono::hours{h} + std::chrono::minutes{mi} + std::chrono::seconds{s};
    return local - *offset;
}

std::string format_utc(TimePoint tp)
{
    auto tm = to_tm(tp);
    return std::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d} UTC",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec);
}

std::string format_iso(TimePoint tp)
{
    auto tm = to_tm(tp);
    return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec);
}

} // namespace time_utils
