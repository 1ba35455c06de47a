#pragma once

#include <string>
#include <cstddef>
#include <filesystem>

// Process-wide log sink. Lines are "[HH:MM:SS.mmm] msg" appended to the log
// file and, when enabled, echoed to stderr. Safe to call from any thread.

// Redirect the sink. An empty path selects <temp>/roxy.log.
void roxy_log_configure(const std::filesystem::path& file, bool to_stderr);

std::string roxy_log_path();

void roxy_log(const std::string& msg);

// Same as roxy_log with a "warning: " prefix; also bumps the warning counter.
void roxy_warn(const std::string& msg);

// Number of warnings logged since process start.
size_t roxy_warning_count();
