#include "time_utils.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>

static std::tm local_tm(std::time_t t) {
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return tm;
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::tm tm = local_tm(std::chrono::system_clock::to_time_t(now));
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

std::string clock_time() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm = local_tm(std::chrono::system_clock::to_time_t(now));
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    char out[24];
    std::snprintf(out, sizeof(out), "%s.%03d", buf, static_cast<int>(ms.count()));
    return std::string(out);
}

std::string format_duration_short(std::chrono::milliseconds dur) {
    long long total_ms = dur.count();
    if (total_ms < 0)
        total_ms = 0;
    if (total_ms < 1000)
        return std::to_string(total_ms) + "ms";
    long long total = total_ms / 1000;
    long long s = total % 60;
    long long m = (total / 60) % 60;
    long long h = (total / 3600) % 24;
    long long d = total / 86400;
    std::string out;
    if (d > 0)
        out += std::to_string(d) + "d";
    if (h > 0 || d > 0)
        out += std::to_string(h) + "h";
    if (m > 0 || h > 0 || d > 0)
        out += std::to_string(m) + "m";
    out += std::to_string(s) + "s";
    return out;
}
