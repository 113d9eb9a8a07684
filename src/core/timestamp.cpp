#include <mediafetch/core/timestamp.h>

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace mediafetch {

namespace {

bool readDigits(std::string_view s, std::size_t pos, std::size_t count, int& out) {
    if (pos + count > s.size())
        return false;
    int v = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const auto c = static_cast<unsigned char>(s[pos + i]);
        if (!std::isdigit(c))
            return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

} // namespace

std::string formatIso8601(TimePoint tp) {
    using namespace std::chrono;
    const auto secs = time_point_cast<seconds>(tp);
    auto micros = duration_cast<microseconds>(tp - secs).count();
    if (micros < 0)
        micros = 0;
    const std::time_t t = system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<long long>(micros));
    return buf;
}

std::optional<TimePoint> parseIso8601(std::string_view text) {
    using namespace std::chrono;
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!readDigits(text, 0, 4, y) || text.size() < 19 || text[4] != '-' ||
        !readDigits(text, 5, 2, mo) || text[7] != '-' || !readDigits(text, 8, 2, d) ||
        (text[10] != 'T' && text[10] != ' ') || !readDigits(text, 11, 2, h) || text[13] != ':' ||
        !readDigits(text, 14, 2, mi) || text[16] != ':' || !readDigits(text, 17, 2, s)) {
        return std::nullopt;
    }

    const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)},
                             day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || h > 23 || mi > 59 || s > 60)
        return std::nullopt;

    std::size_t pos = 19;
    microseconds frac{0};
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        long long value = 0;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                value = value * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0)
            return std::nullopt;
        for (; digits < 6; ++digits)
            value *= 10;
        frac = microseconds{value};
    }

    minutes offset{0};
    if (pos < text.size()) {
        const char sign = text[pos];
        if (sign == 'Z' || sign == 'z') {
            ++pos;
        } else if (sign == '+' || sign == '-') {
            int oh = 0, om = 0;
            if (!readDigits(text, pos + 1, 2, oh))
                return std::nullopt;
            std::size_t next = pos + 3;
            if (next < text.size() && text[next] == ':')
                ++next;
            if (!readDigits(text, next, 2, om))
                return std::nullopt;
            offset = hours{oh} + minutes{om};
            if (sign == '-')
                offset = -offset;
            pos = next + 2;
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size())
        return std::nullopt;

    TimePoint tp = sys_days{ymd} + hours{h} + minutes{mi} + seconds{s};
    tp += duration_cast<system_clock::duration>(frac);
    tp -= offset;
    return tp;
}

} // namespace mediafetch
