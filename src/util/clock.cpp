#include "util/clock.hpp"
#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>

namespace warden::util {

double monotonic_seconds() {
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

double wall_seconds() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

std::string iso_timestamp(double epoch_seconds) {
    double whole = std::floor(epoch_seconds);
    time_t secs = static_cast<time_t>(whole);
    long micros = static_cast<long>(std::lround((epoch_seconds - whole) * 1e6));
    if (micros >= 1000000) {
        secs += 1;
        micros -= 1000000;
    }

    struct tm tm_utc{};
    gmtime_r(&secs, &tm_utc);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ld",
        tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday,
        tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec, micros);
    return buf;
}

std::string iso_now() {
    return iso_timestamp(wall_seconds());
}

std::optional<double> parse_iso_timestamp(const std::string& text) {
    struct tm tm_utc{};
    int consumed = 0;
    int n = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
        &tm_utc.tm_year, &tm_utc.tm_mon, &tm_utc.tm_mday,
        &tm_utc.tm_hour, &tm_utc.tm_min, &tm_utc.tm_sec, &consumed);
    if (n != 6) {
        return std::nullopt;
    }
    tm_utc.tm_year -= 1900;
    tm_utc.tm_mon -= 1;

    double fraction = 0.0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        double scale = 0.1;
        for (++pos; pos < text.size() && text[pos] >= '0' && text[pos] <= '9'; ++pos) {
            fraction += (text[pos] - '0') * scale;
            scale /= 10.0;
        }
    }
    if (pos < text.size() && text[pos] != 'Z') {
        return std::nullopt;
    }

    time_t secs = timegm(&tm_utc);
    return static_cast<double>(secs) + fraction;
}

} // namespace warden::util
