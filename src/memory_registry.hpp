#pragma once
#include "memory_store.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace npcmem {

// One MemoryStore per NPC, keyed by NPC id (ASCII/Latin-1 case-insensitive).
// All stores share the registry's clock and id generator.
class MemoryRegistry {
public:
    MemoryRegistry();
    MemoryRegistry(Clock& clock, IdGenerator& ids);

    MemoryRegistry(const MemoryRegistry&) = delete;
    MemoryRegistry& operator=(const MemoryRegistry&) = delete;

    // Applied to every existing store and to stores created later.
    void set_store_config(const StoreConfig& config);
    void set_event_bus(EventBus* bus);

    // Get or create the NPC's store. Throws std::invalid_argument on a blank id.
    MemoryStore& get_or_create(const std::string& npc_id);

    // nullptr if the NPC has no store yet
    MemoryStore* find(const std::string& npc_id);
    const MemoryStore* find(const std::string& npc_id) const;

    bool contains(const std::string& npc_id) const;
    bool remove(const std::string& npc_id);
    size_t size() const;

    // First spelling of each id, ordered by the folded id.
    std::vector<std::string> npc_ids() const;

    // World-level fact for every registered NPC. An NPC that already holds
    // `fact_id` gets a failed result and keeps its own fact.
    std::map<std::string, MutationResult> add_canonical_fact_to_all(const std::string& fact_id,
                                                                    const std::string& content,
                                                                    const std::string& domain = "");

    void apply_decay_all();

private:
    Clock* clock_;
    IdGenerator* ids_;
    EventBus* bus_ = nullptr;
    StoreConfig config_;
    std::map<CaseInsensitiveKey, std::unique_ptr<MemoryStore>> stores_;
    mutable std::mutex mutex_;
};

} // namespace npcmem
