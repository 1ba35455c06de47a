#pragma once

#include <core/types.hpp>

// High-water-mark allocation: an empty set starts at start_port, otherwise
// the next port is one past the highest port in use. high_water is the
// highest port ever handed out (deleted mappings included), so a vacated
// port is never handed out again.
Result<int> next_port(const MappingSet& existing, int start_port, int high_water = 0);

// Look up the port already assigned to (host, protocol), or -1.
int find_port(const MappingSet& existing, const std::string& host,
              const std::string& protocol);
