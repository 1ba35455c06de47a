#include "port_allocator.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>
#include <algorithm>

Result<int> next_port(const MappingSet& existing, int start_port, int high_water) {
    if (existing.empty() && high_water <= 0) {
        return Result<int>::Ok(start_port);
    }

    int highest = high_water;
    for (const auto& m : existing) {
        highest = std::max(highest, m.external_port);
    }

    int port = highest + 1;
    if (port > MAX_PORT) {
        return Result<int>::Err(fmt::format("port pool exhausted (highest assigned port is {})",
                                            highest));
    }
    return Result<int>::Ok(port);
}

int find_port(const MappingSet& existing, const std::string& host,
              const std::string& protocol) {
    for (const auto& m : existing) {
        if (m.host == host && m.protocol == protocol) return m.external_port;
    }
    return -1;
}
