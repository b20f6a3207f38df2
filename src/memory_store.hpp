#pragma once
#include "memory_types.hpp"
#include "relationship.hpp"
#include "clock.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

namespace npcmem {

class EventBus;
struct Event;
class MemoryStore;

struct StoreConfig {
    double episodic_decay_rate = 0.05;     // strength lost per apply_episodic_decay()
    uint32_t max_episodic_memories = 0;    // 0 = unbounded
};

// Map key compared by its ASCII-lowercased form. Keeps the first spelling
// for display.
class CaseInsensitiveKey {
public:
    explicit CaseInsensitiveKey(const std::string& raw);

    const std::string& original() const { return original_; }
    const std::string& normalized() const { return normalized_; }

    bool operator<(const CaseInsensitiveKey& other) const {
        return normalized_ < other.normalized_;
    }
    bool operator==(const CaseInsensitiveKey& other) const {
        return normalized_ == other.normalized_;
    }

private:
    std::string original_;
    std::string normalized_;
};

struct MemoryStatistics {
    size_t canonical_fact_count = 0;
    size_t world_state_count = 0;
    size_t episodic_memory_count = 0;
    size_t active_episodic_count = 0;
    size_t belief_count = 0;
    size_t active_belief_count = 0;
    size_t relationship_count = 0;

    std::string to_string() const;
};

// Mutable view of one stored belief, returned by MemoryStore::get_belief.
// Valid until the belief is replaced or the store is cleared.
class BeliefHandle {
public:
    const BeliefMemoryEntry& entry() const { return *entry_; }
    const BeliefMemoryEntry* operator->() const { return entry_; }

    // Flags the belief as contradicted. Stored confidence is left alone;
    // ranking applies the contradiction penalty instead.
    void mark_contradicted(const std::string& reason);
    void adjust_sentiment(double delta);

private:
    friend class MemoryStore;
    BeliefHandle(MemoryStore* store, BeliefMemoryEntry* entry) : store_(store), entry_(entry) {}

    MemoryStore* store_;
    BeliefMemoryEntry* entry_;
};

// Sole owner and writer of an NPC's memory. Every entry gets a store-assigned
// sequence number and provenance; all queries return copies.
//
// Not thread-safe: one owner per store, mutations and retrievals serialized.
class MemoryStore {
public:
    MemoryStore();
    MemoryStore(Clock& clock, IdGenerator& ids);

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    // Publish mutation events to `bus` (nullptr disables). Not owned.
    void set_event_bus(EventBus* bus) { bus_ = bus; }
    void set_config(const StoreConfig& config);
    const StoreConfig& config() const { return config_; }

    // ── Canonical facts ──────────────────────────────────────
    // Throws DuplicateIdError if `id` exists.
    const CanonicalFact& add_canonical_fact(const std::string& id,
                                            const std::string& content,
                                            const std::string& domain = "");
    bool remove_canonical_fact(const std::string& id);
    std::optional<CanonicalFact> get_canonical_fact(const std::string& id) const;
    std::vector<CanonicalFact> get_canonical_facts(
        const std::optional<std::string>& domain = std::nullopt) const;
    bool is_canonical_fact(const std::string& id) const;

    // Returns the fact a statement negates ("X is not Y" against "X is Y").
    std::optional<CanonicalFact> contradicts_canonical_fact(const std::string& statement) const;

    // ── World state ──────────────────────────────────────────
    MutationResult set_world_state(const std::string& key, const std::string& value,
                                   MutationSource source);
    std::optional<WorldStateEntry> get_world_state(const std::string& key) const;
    std::vector<WorldStateEntry> get_all_world_state() const;

    // ── Episodic memory ──────────────────────────────────────
    // A non-zero entry.created_at_ticks is kept; zero is stamped from the clock.
    MutationResult add_episodic_memory(EpisodicMemoryEntry entry, MutationSource source);
    MutationResult add_dialogue(const std::string& speaker, const std::string& text,
                                double significance = 0.5,
                                MutationSource source = MutationSource::ValidatedOutput);
    void apply_episodic_decay();
    // Reinforces every episode stored under `id` (ids may repeat).
    // Returns how many were touched.
    size_t reinforce_episodic_memory(const std::string& id,
                                     double amount = DEFAULT_REINFORCE_AMOUNT);
    std::vector<EpisodicMemoryEntry> get_active_episodic_memories(
        double strength_threshold = ACTIVE_STRENGTH_THRESHOLD) const;
    std::vector<EpisodicMemoryEntry> get_recent_memories(size_t count) const;
    std::vector<EpisodicMemoryEntry> get_all_episodic_memories() const;

    // ── Beliefs ──────────────────────────────────────────────
    MutationResult set_belief(const std::string& id, BeliefMemoryEntry entry,
                              MutationSource source);
    std::optional<BeliefHandle> get_belief(const std::string& id);
    std::optional<BeliefMemoryEntry> find_belief(const std::string& id) const;
    std::vector<BeliefMemoryEntry> get_beliefs_about(const std::string& subject) const;
    std::vector<BeliefMemoryEntry> get_active_beliefs() const;
    std::vector<BeliefMemoryEntry> get_all_beliefs() const;

    // ── Relationships ────────────────────────────────────────
    // Only the owning NPC may write its relationships.
    MutationResult set_relationship(const RelationshipEntry& entry,
                                    const std::string& acting_npc_id);
    std::optional<RelationshipEntry> get_relationship(const std::string& owner_npc_id,
                                                      const std::string& target_id) const;
    std::vector<RelationshipEntry> get_relationships(const std::string& owner_npc_id) const;
    std::vector<RelationshipEntry> get_all_relationships() const;

    // ── Unified access ───────────────────────────────────────
    std::vector<std::string> get_all_memories_for_prompt(size_t max_episodic = 10,
                                                         bool include_contradicted_beliefs = false) const;
    static bool validate_mutation(MemoryAuthority target, MutationSource source);
    MemoryStatistics get_statistics() const;
    void clear_all();

    // ── Sequencing ───────────────────────────────────────────
    int64_t next_sequence_number() const { return next_sequence_; }

    // Resets the counter to max(existing sequence numbers) + 1. Must run after
    // bulk-restoring entries and before the next mutation.
    void recalculate_next_sequence_number();
    void set_next_sequence_number(int64_t next) { next_sequence_ = next; }

    // Raw inserts used by the snapshot codec. Entries are stored as given:
    // no sequence, timestamp or authority processing.
    void restore_canonical_fact(const CanonicalFact& fact);
    void restore_world_state(const WorldStateEntry& entry);
    void restore_episodic_memory(const EpisodicMemoryEntry& entry);
    void restore_belief(const std::string& id, const BeliefMemoryEntry& entry);
    void restore_relationship(const RelationshipEntry& entry);

private:
    friend class BeliefHandle;

    using RelationshipKey = std::pair<std::string, std::string>;
    static RelationshipKey relationship_key(const std::string& owner, const std::string& target);

    MutationResult reject(const std::string& target, const std::string& reason);
    void publish(const Event& event);
    void publish_belief_changed(const BeliefMemoryEntry& belief);
    void prune_episodic_memories();

    Clock* clock_;
    IdGenerator* ids_;
    EventBus* bus_ = nullptr;
    StoreConfig config_;

    std::map<std::string, CanonicalFact> canonical_facts_;
    std::map<CaseInsensitiveKey, WorldStateEntry> world_state_;
    std::vector<EpisodicMemoryEntry> episodic_memories_;
    std::map<CaseInsensitiveKey, BeliefMemoryEntry> beliefs_;
    std::map<RelationshipKey, RelationshipEntry> relationships_;

    int64_t next_sequence_ = 1;
};

} // namespace npcmem
