#pragma once

#include <string>
#include <mutex>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Durable (host, protocol) -> external port registry backed by one YAML file.
//
// Every read-modify-write (resolve, remove) runs under a single mutex, so
// concurrent resolve() calls for the same new pair allocate exactly once.
// The file is re-read on each operation; it is the source of truth.
class MappingStore {
public:
    MappingStore(fs::path path, int start_port);

    // Return the port for (host, protocol), allocating and persisting a new
    // one if the pair is unseen. Unsupported protocols are rejected before
    // anything is read or written.
    Result<int> resolve(const std::string& host, const std::string& protocol);

    // Full current set. Missing, empty or corrupt storage reads as empty.
    MappingSet load();

    // Replace the stored set. The file is written to a temporary sibling and
    // renamed into place. The stored high-water mark is kept. A set that
    // would not load back as written (empty host, bad or duplicate port,
    // duplicate pair) is rejected and nothing is written.
    Result<void> persist(const MappingSet& mappings);

    // Delete the record for (host, protocol). Returns whether one existed.
    // The freed port is remembered as the high-water mark and not reused.
    Result<bool> remove(const std::string& host, const std::string& protocol);

    // Highest port ever allocated from this store, 0 if none was removed.
    int high_water_mark();

    const fs::path& path() const { return store_path_; }

private:
    MappingSet load_unlocked(int* high_water = nullptr);
    Result<void> persist_unlocked(const MappingSet& mappings, int high_water);

    fs::path store_path_;  // port_mappings.yaml
    int start_port_;
    std::mutex mutex_;
};
