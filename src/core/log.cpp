#include "log.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <atomic>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

struct LogSink {
    std::mutex mu;
    std::string path;
    bool to_stderr = false;
};

// Never destroyed: detached forwarding threads may still log during exit.
LogSink& sink() {
    static LogSink* s = new LogSink;
    return *s;
}

std::atomic<size_t> g_warnings{0};

std::string default_log_path() {
    return (platform::temp_dir() / DEFAULT_LOG_FILE_NAME).string();
}

} // namespace

void roxy_log_configure(const std::filesystem::path& file, bool to_stderr) {
    auto& s = sink();
    std::lock_guard<std::mutex> lock(s.mu);
    s.path = file.empty() ? default_log_path() : file.string();
    s.to_stderr = to_stderr;
}

std::string roxy_log_path() {
    auto& s = sink();
    std::lock_guard<std::mutex> lock(s.mu);
    return s.path.empty() ? default_log_path() : s.path;
}

void roxy_log(const std::string& msg) {
    auto& s = sink();
    std::string line = fmt::format("[{}] {}\n", now_clock(), msg);

    std::lock_guard<std::mutex> lock(s.mu);
    if (s.path.empty()) s.path = default_log_path();
    if (s.to_stderr) std::cerr << line;

    std::ofstream out(s.path, std::ios::app);
    if (!out) return;
    out << line;
}

void roxy_warn(const std::string& msg) {
    g_warnings.fetch_add(1);
    roxy_log("warning: " + msg);
}

size_t roxy_warning_count() {
    return g_warnings.load();
}
