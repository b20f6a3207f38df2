#pragma once
#include <string>
#include <cstdint>
#include <stdexcept>

namespace npcmem {

class MemoryStore;

// Thrown by snapshot_import on malformed or structurally invalid input.
class SnapshotError : public std::runtime_error {
public:
    explicit SnapshotError(const std::string& what) : std::runtime_error(what) {}
};

constexpr int SNAPSHOT_FORMAT_VERSION = 1;

// Serialize every entry of the store as pretty-printed JSON, each category
// in sequence order.
std::string snapshot_export(const MemoryStore& store);

// Replace the store's contents with a snapshot. Entries are restored as
// stored (ids, timestamps, sequence numbers, provenance) and the sequence
// counter is recalculated. The store is untouched if parsing fails.
// Returns the number of entries restored.
uint32_t snapshot_import(MemoryStore& store, const std::string& json_str);

} // namespace npcmem
