#pragma once
#include "memory_types.hpp"
#include <string>
#include <cstdint>
#include <cstddef>

namespace npcmem {

// Tag-based event dispatch: no RTTI or dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* FactAdded            = "FactAdded";
    constexpr const char* FactRemoved          = "FactRemoved";
    constexpr const char* WorldStateChanged    = "WorldStateChanged";
    constexpr const char* EpisodeAdded         = "EpisodeAdded";
    constexpr const char* BeliefChanged        = "BeliefChanged";
    constexpr const char* RelationshipChanged  = "RelationshipChanged";
    constexpr const char* DecayApplied         = "DecayApplied";
    constexpr const char* EpisodeReinforced    = "EpisodeReinforced";
    constexpr const char* SequenceRecalculated = "SequenceRecalculated";
    constexpr const char* MutationRejected     = "MutationRejected";
    constexpr const char* ContextRetrieved     = "ContextRetrieved";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct FactAddedEvent : Event {
    static constexpr const char* TAG = event_tags::FactAdded;
    std::string id;
    std::string content;
    int64_t sequence_number = 0;

    FactAddedEvent() { type_tag = TAG; }
};

struct FactRemovedEvent : Event {
    static constexpr const char* TAG = event_tags::FactRemoved;
    std::string id;

    FactRemovedEvent() { type_tag = TAG; }
};

struct WorldStateChangedEvent : Event {
    static constexpr const char* TAG = event_tags::WorldStateChanged;
    std::string key;
    std::string value;
    MutationSource source = MutationSource::GameSystem;
    bool created = false;
    int64_t sequence_number = 0;

    WorldStateChangedEvent() { type_tag = TAG; }
};

struct EpisodeAddedEvent : Event {
    static constexpr const char* TAG = event_tags::EpisodeAdded;
    std::string id;
    std::string description;
    MutationSource source = MutationSource::ValidatedOutput;
    int64_t sequence_number = 0;

    EpisodeAddedEvent() { type_tag = TAG; }
};

struct BeliefChangedEvent : Event {
    static constexpr const char* TAG = event_tags::BeliefChanged;
    std::string id;
    std::string content;
    bool contradicted = false;
    int64_t sequence_number = 0;

    BeliefChangedEvent() { type_tag = TAG; }
};

struct RelationshipChangedEvent : Event {
    static constexpr const char* TAG = event_tags::RelationshipChanged;
    std::string owner_npc_id;
    std::string target_id;
    std::string relationship_label;

    RelationshipChangedEvent() { type_tag = TAG; }
};

struct DecayAppliedEvent : Event {
    static constexpr const char* TAG = event_tags::DecayApplied;
    double decay_rate = 0.0;
    size_t affected = 0;

    DecayAppliedEvent() { type_tag = TAG; }
};

struct EpisodeReinforcedEvent : Event {
    static constexpr const char* TAG = event_tags::EpisodeReinforced;
    std::string id;
    double amount = 0.0;
    size_t affected = 0;

    EpisodeReinforcedEvent() { type_tag = TAG; }
};

struct SequenceRecalculatedEvent : Event {
    static constexpr const char* TAG = event_tags::SequenceRecalculated;
    int64_t next_sequence_number = 0;

    SequenceRecalculatedEvent() { type_tag = TAG; }
};

struct MutationRejectedEvent : Event {
    static constexpr const char* TAG = event_tags::MutationRejected;
    std::string target;
    std::string reason;

    MutationRejectedEvent() { type_tag = TAG; }
};

struct ContextRetrievedEvent : Event {
    static constexpr const char* TAG = event_tags::ContextRetrieved;
    std::string query;
    size_t canonical_facts = 0;
    size_t world_state = 0;
    size_t episodic_memories = 0;
    size_t beliefs = 0;

    ContextRetrievedEvent() { type_tag = TAG; }
};

} // namespace npcmem
