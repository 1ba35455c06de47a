#include "mapping_store.hpp"
#include "port_allocator.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/protocol.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <algorithm>
#include <set>
#include <system_error>
#include <utility>
#include <unistd.h>

MappingStore::MappingStore(fs::path path, int start_port)
    : store_path_(std::move(path)), start_port_(start_port) {}

// Same rules load() applies, so whatever is persisted loads back unchanged.
static Result<void> validate(const MappingSet& mappings) {
    std::set<int> ports;
    std::set<std::pair<std::string, std::string>> keys;
    for (const auto& m : mappings) {
        if (m.host.empty() || m.protocol.empty()) {
            return Result<void>::Err(fmt::format("mapping for port {} has no host or protocol",
                                                 m.external_port));
        }
        if (m.external_port < MIN_PORT || m.external_port > MAX_PORT) {
            return Result<void>::Err(fmt::format("mapping {}/{} has invalid port {}",
                                                 m.host, m.protocol, m.external_port));
        }
        if (!ports.insert(m.external_port).second) {
            return Result<void>::Err(fmt::format("port {} is assigned twice", m.external_port));
        }
        if (!keys.insert({m.host, m.protocol}).second) {
            return Result<void>::Err(fmt::format("{}/{} is mapped twice", m.host, m.protocol));
        }
    }
    return Result<void>::Ok();
}

MappingSet MappingStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_unlocked();
}

Result<void> MappingStore::persist(const MappingSet& mappings) {
    auto valid = validate(mappings);
    if (valid.is_err()) {
        return valid;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    int high_water = 0;
    load_unlocked(&high_water);
    return persist_unlocked(mappings, high_water);
}

int MappingStore::high_water_mark() {
    std::lock_guard<std::mutex> lock(mutex_);
    int high_water = 0;
    load_unlocked(&high_water);
    return high_water;
}

Result<int> MappingStore::resolve(const std::string& host, const std::string& protocol) {
    if (!parse_protocol(protocol)) {
        return Result<int>::Err(fmt::format("unsupported protocol '{}'", protocol));
    }
    if (host.empty()) {
        return Result<int>::Err("remote host must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    int high_water = 0;
    MappingSet mappings = load_unlocked(&high_water);

    int existing = find_port(mappings, host, protocol);
    if (existing > 0) {
        return Result<int>::Ok(existing);
    }

    auto port = next_port(mappings, start_port_, high_water);
    if (port.is_err()) {
        return port;
    }

    mappings.push_back({host, protocol, port.value});
    auto saved = persist_unlocked(mappings, high_water);
    if (saved.is_err()) {
        return Result<int>::Err(saved.error);
    }

    roxy_log(fmt::format("MappingStore: {}/{} -> port {}", host, protocol, port.value));
    return port;
}

Result<bool> MappingStore::remove(const std::string& host, const std::string& protocol) {
    std::lock_guard<std::mutex> lock(mutex_);
    int high_water = 0;
    MappingSet mappings = load_unlocked(&high_water);

    int port = find_port(mappings, host, protocol);
    if (port < 0) {
        return Result<bool>::Ok(false);
    }
    mappings.erase(std::remove_if(mappings.begin(), mappings.end(),
        [&](const MappingRecord& m) { return m.host == host && m.protocol == protocol; }),
        mappings.end());

    auto saved = persist_unlocked(mappings, std::max(high_water, port));
    if (saved.is_err()) {
        return Result<bool>::Err(saved.error);
    }
    roxy_log(fmt::format("MappingStore: removed {}/{}", host, protocol));
    return Result<bool>::Ok(true);
}

MappingSet MappingStore::load_unlocked(int* high_water) {
    MappingSet mappings;
    if (high_water) *high_water = 0;

    std::error_code ec;
    if (!fs::exists(store_path_, ec)) {
        return mappings;
    }

    try {
        YAML::Node root = YAML::LoadFile(store_path_.string());
        if (high_water && root.IsMap() && root["high_water_mark"]) {
            *high_water = root["high_water_mark"].as<int>(0);
        }
        if (!root["mappings"] || !root["mappings"].IsSequence()) {
            return mappings;
        }

        std::set<int> seen_ports;
        std::set<std::pair<std::string, std::string>> seen_keys;

        for (const auto& n : root["mappings"]) {
            if (!n.IsMap()) {
                roxy_warn("MappingStore: skipping non-map record");
                continue;
            }
            MappingRecord m;
            m.host = n["host"].as<std::string>("");
            m.protocol = n["protocol"].as<std::string>("");
            m.external_port = n["port"].as<int>(0);

            if (m.host.empty() || m.protocol.empty()) {
                roxy_warn(fmt::format("MappingStore: skipping record with missing host/protocol (port {})",
                                      m.external_port));
                continue;
            }
            if (m.external_port < MIN_PORT || m.external_port > MAX_PORT) {
                roxy_warn(fmt::format("MappingStore: skipping {}/{} with invalid port", m.host, m.protocol));
                continue;
            }
            if (!seen_ports.insert(m.external_port).second ||
                !seen_keys.insert({m.host, m.protocol}).second) {
                roxy_warn(fmt::format("MappingStore: skipping duplicate record {}/{} -> {}",
                                      m.host, m.protocol, m.external_port));
                continue;
            }
            mappings.push_back(m);
        }
    } catch (const std::exception& e) {
        // Corrupted store — treat as no mappings yet
        roxy_warn(fmt::format("MappingStore: {} is unreadable ({}), starting empty",
                              store_path_.string(), e.what()));
        if (high_water) *high_water = 0;
        return MappingSet{};
    }

    return mappings;
}

Result<void> MappingStore::persist_unlocked(const MappingSet& mappings, int high_water) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    if (high_water > 0) {
        out << YAML::Key << "high_water_mark" << YAML::Value << high_water;
    }
    out << YAML::Key << "mappings" << YAML::Value << YAML::BeginSeq;

    for (const auto& m : mappings) {
        out << YAML::BeginMap;
        out << YAML::Key << "host" << YAML::Value << m.host;
        out << YAML::Key << "protocol" << YAML::Value << m.protocol;
        out << YAML::Key << "port" << YAML::Value << m.external_port;
        out << YAML::EndMap;
    }

    out << YAML::EndSeq;
    out << YAML::EndMap;

    fs::path tmp = store_path_;
    tmp += fmt::format(".tmp.{}", static_cast<long>(getpid()));

    try {
        if (store_path_.has_parent_path()) {
            fs::create_directories(store_path_.parent_path());
        }

        {
            std::ofstream fout(tmp.string(), std::ios::trunc);
            if (!fout) {
                return Result<void>::Err("cannot write " + tmp.string());
            }
            fout << out.c_str() << "\n";
            fout.flush();
            if (!fout) {
                fs::remove(tmp);
                return Result<void>::Err("write to " + tmp.string() + " failed");
            }
        }

        fs::rename(tmp, store_path_);
    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove(tmp, ec);
        return Result<void>::Err(fmt::format("failed to persist mappings: {}", e.what()));
    }

    return Result<void>::Ok();
}
