#include "utils.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>

static struct tm local_tm(std::time_t t) {
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    return tm_buf;
}

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    struct tm tm_buf = local_tm(std::chrono::system_clock::to_time_t(now));
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::string now_clock() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf = local_tm(std::chrono::system_clock::to_time_t(now));

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    return std::string(ts);
}
