#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Protocols a mapping can forward. The remote port is fixed per protocol.
enum class Protocol {
    SSH,
    TELNET,
    HTTP,
    HTTPS,
};

// One persisted association. The protocol is kept as text so records with
// an unknown protocol survive a load/persist cycle and can be reported.
struct MappingRecord {
    std::string host;
    std::string protocol;
    int external_port = 0;

    bool operator==(const MappingRecord& o) const {
        return host == o.host && protocol == o.protocol &&
               external_port == o.external_port;
    }
    bool operator!=(const MappingRecord& o) const { return !(*this == o); }
};

using MappingSet = std::vector<MappingRecord>;

// Where an active proxy sends its traffic.
struct ProxyTarget {
    std::string host;
    int port = 0;

    bool operator==(const ProxyTarget& o) const {
        return host == o.host && port == o.port;
    }
    bool operator!=(const ProxyTarget& o) const { return !(*this == o); }
};

// Read-only view of one running listener, for display.
struct ProxyStatus {
    int external_port = 0;
    std::string remote_host;
    int remote_port = 0;
    size_t connections = 0;      // currently forwarded pairs
    std::string started_at;      // ISO timestamp
};

// Configuration
struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    int start_port = 10000;
    std::string mappings_file = "port_mappings.yaml";
    int listen_backlog = 5;
    int connect_timeout_ms = 5000;
    int buffer_size = 4096;
    int accept_poll_ms = 200;            // bounds how long stop() waits
    int rescan_interval_secs = 5;        // 0 = bootstrap once
    std::string log_file;                // "" = <temp>/roxy.log
    bool log_to_stderr = true;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
