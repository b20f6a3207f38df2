#pragma once
#include <string>

namespace npcmem {

class MemoryStore;

// A leading next_sequence line, then one line per entry, categories in a
// fixed order and entries in sequence order. Doubles are printed round-trip
// exact.
std::string canonical_state_dump(const MemoryStore& store);

// Lowercase hex SHA-256 of canonical_state_dump(). Sequence numbers and
// timestamps are part of the hashed state.
std::string compute_state_hash(const MemoryStore& store);

} // namespace npcmem
