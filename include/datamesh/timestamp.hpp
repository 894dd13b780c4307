#pragma once
#include <charconv>
#include <chrono>
#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

namespace datamesh {

// UTC instants with microsecond precision.
using TimePoint = std::chrono::sys_time<std::chrono::microseconds>;

namespace time_detail {

[[nodiscard]] inline int take_int(std::string_view& s, std::size_t digits, std::string_view what)
{
    if (s.size() < digits) throw std::invalid_argument("timestamp: truncated " + std::string(what));
    int v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + digits, v);
    if (ec != std::errc{} || ptr != s.data() + digits)
        throw std::invalid_argument("timestamp: bad " + std::string(what));
    s.remove_prefix(digits);
    return v;
}

inline void expect(std::string_view& s, char c)
{
    if (s.empty() || s.front() != c)
        throw std::invalid_argument(std::string("timestamp: expected '") + c + "'");
    s.remove_prefix(1);
}

} // namespace time_detail

/// Parse an ISO-8601 timestamp: "YYYY-MM-DD", optionally followed by
/// "THH:MM[:SS[.ffffff]]" (a space also separates) and a "Z" or "+HH:MM" offset.
/// Naive times are taken as UTC.
[[nodiscard]] inline TimePoint parse_timestamp(std::string_view text)
{
    using namespace std::chrono;
    using time_detail::take_int;
    auto s = text;

    int y = take_int(s, 4, "year");
    time_detail::expect(s, '-');
    int mo = take_int(s, 2, "month");
    time_detail::expect(s, '-');
    int d = take_int(s, 2, "day");

    year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) throw std::invalid_argument("timestamp: invalid date '" + std::string(text) + "'");
    TimePoint tp = sys_days{ymd};

    if (!s.empty() && (s.front() == 'T' || s.front() == ' ')) {
        s.remove_prefix(1);
        int hh = take_int(s, 2, "hour");
        time_detail::expect(s, ':');
        int mm = take_int(s, 2, "minute");
        int ss = 0;
        if (!s.empty() && s.front() == ':') {
            s.remove_prefix(1);
            ss = take_int(s, 2, "second");
        }
        if (hh > 23 || mm > 59 || ss > 60)
            throw std::invalid_argument("timestamp: invalid time '" + std::string(text) + "'");
        tp += hours{hh} + minutes{mm} + seconds{ss};

        if (!s.empty() && s.front() == '.') {
            s.remove_prefix(1);
            std::int64_t frac = 0;
            int n = 0;
            while (!s.empty() && s.front() >= '0' && s.front() <= '9') {
                if (n < 6) {
                    frac = frac * 10 + (s.front() - '0');
                    ++n;
                }
                s.remove_prefix(1);
            }
            if (n == 0) throw std::invalid_argument("timestamp: empty fraction");
            for (; n < 6; ++n) frac *= 10;
            tp += microseconds{frac};
        }
    }

    if (s == "Z" || s == "z") {
        s = {};
    } else if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
        int sign = s.front() == '-' ? -1 : 1;
        s.remove_prefix(1);
        int oh = take_int(s, 2, "offset hour");
        if (!s.empty() && s.front() == ':') s.remove_prefix(1);
        int om = s.empty() ? 0 : take_int(s, 2, "offset minute");
        tp -= sign * (hours{oh} + minutes{om});
    }
    if (!s.empty())
        throw std::invalid_argument("timestamp: trailing characters in '" + std::string(text) + "'");
    return tp;
}

/// "YYYY-MM-DDTHH:MM:SSZ", with ".ffffff" only when the instant has a fraction.
[[nodiscard]] inline std::string format_timestamp(TimePoint tp)
{
    using namespace std::chrono;
    auto secs = floor<seconds>(tp);
    auto frac = (tp - secs).count();
    if (frac == 0) return std::format("{:%Y-%m-%dT%H:%M:%S}Z", secs);
    return std::format("{:%Y-%m-%dT%H:%M:%S}.{:06}Z", secs, frac);
}

// ---------------------------------------------------------------------------
// ISO-8601 durations
// ---------------------------------------------------------------------------

// A signed ISO-8601 duration restricted to fixed-length units
// (weeks, days, hours, minutes, seconds). Calendar units are rejected.
struct Period {
    std::chrono::microseconds value{0};

    [[nodiscard]] bool negative() const noexcept { return value.count() < 0; }

    friend bool operator==(const Period&, const Period&) = default;
};

/// Parse "P1D", "PT6H", "-P2DT12H", "P1W", "PT0.5S".
[[nodiscard]] inline Period parse_period(std::string_view text)
{
    using namespace std::chrono;
    auto s = text;
    bool neg = false;
    if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
        neg = s.front() == '-';
        s.remove_prefix(1);
    }
    if (s.empty() || s.front() != 'P') throw std::invalid_argument("period: expected 'P' in '" + std::string(text) + "'");
    s.remove_prefix(1);
    if (s.empty()) throw std::invalid_argument("period: empty duration");

    microseconds total{0};
    bool in_time = false;
    bool any = false;
    while (!s.empty()) {
        if (s.front() == 'T') {
            if (in_time) throw std::invalid_argument("period: repeated 'T'");
            in_time = true;
            s.remove_prefix(1);
            continue;
        }
        double v = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec != std::errc{} || ptr == s.data() + s.size())
            throw std::invalid_argument("period: bad number in '" + std::string(text) + "'");
        s.remove_prefix(static_cast<std::size_t>(ptr - s.data()));
        char unit = s.front();
        s.remove_prefix(1);

        double us_per = 0;
        if (!in_time && unit == 'W') us_per = 7 * 86400e6;
        else if (!in_time && unit == 'D') us_per = 86400e6;
        else if (in_time && unit == 'H') us_per = 3600e6;
        else if (in_time && unit == 'M') us_per = 60e6;
        else if (in_time && unit == 'S') us_per = 1e6;
        else if (!in_time && (unit == 'Y' || unit == 'M'))
            throw std::invalid_argument("period: calendar units are not supported in '" + std::string(text) + "'");
        else throw std::invalid_argument("period: unknown unit in '" + std::string(text) + "'");

        total += microseconds{static_cast<std::int64_t>(v * us_per)};
        any = true;
    }
    if (!any) throw std::invalid_argument("period: no components in '" + std::string(text) + "'");
    return Period{neg ? -total : total};
}

[[nodiscard]] inline std::string format_period(Period p)
{
    using namespace std::chrono;
    auto us = p.value;
    std::string out = us.count() < 0 ? "-P" : "P";
    if (us.count() < 0) us = -us;

    auto d = duration_cast<days>(us);
    us -= d;
    auto h = duration_cast<hours>(us);
    us -= h;
    auto m = duration_cast<minutes>(us);
    us -= m;
    auto s = duration_cast<seconds>(us);
    us -= s;

    if (d.count()) out += std::format("{}D", d.count());
    if (h.count() || m.count() || s.count() || us.count() || !d.count()) {
        out += 'T';
        if (h.count()) out += std::format("{}H", h.count());
        if (m.count()) out += std::format("{}M", m.count());
        if (us.count()) out += std::format("{}.{:06}S", s.count(), us.count());
        else if (s.count() || (!h.count() && !m.count())) out += std::format("{}S", s.count());
    }
    return out;
}

} // namespace datamesh
