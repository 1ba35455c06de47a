#pragma once

#include <string>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// HH:MM:SS.mmm for the current local time, used as a log line prefix.
std::string now_clock();
