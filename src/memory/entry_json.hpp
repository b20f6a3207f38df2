#pragma once
#include "../memory_types.hpp"
#include "../relationship.hpp"
#include <nlohmann/json.hpp>

namespace npcmem {

// JSON ↔ memory entry conversion shared by the snapshot codec.
// Missing fields fall back to the entry defaults.

inline std::vector<std::string> string_list_from_json(const nlohmann::json& item, const char* key) {
    std::vector<std::string> out;
    if (item.contains(key) && item[key].is_array()) {
        for (const auto& v : item[key]) {
            if (v.is_string()) out.push_back(v.get<std::string>());
        }
    }
    return out;
}

inline CanonicalFact fact_from_json(const nlohmann::json& item) {
    CanonicalFact fact;
    fact.id = item.value("id", "");
    fact.content = item.value("content", "");
    fact.domain = item.value("domain", "");
    fact.created_at_ticks = item.value("created_at_ticks", int64_t{0});
    fact.sequence_number = item.value("sequence_number", int64_t{0});
    fact.source = mutation_source_from_string(item.value("source", "designer"));
    return fact;
}

inline nlohmann::json fact_to_json(const CanonicalFact& fact) {
    return {
        {"id", fact.id},
        {"content", fact.content},
        {"domain", fact.domain},
        {"created_at_ticks", fact.created_at_ticks},
        {"sequence_number", fact.sequence_number},
        {"source", mutation_source_to_string(fact.source)}
    };
}

inline WorldStateEntry world_state_from_json(const nlohmann::json& item) {
    WorldStateEntry entry;
    entry.id = item.value("id", "");
    entry.key = item.value("key", "");
    entry.value = item.value("value", "");
    entry.source = mutation_source_from_string(item.value("source", "game_system"));
    entry.created_at_ticks = item.value("created_at_ticks", int64_t{0});
    entry.modified_at_ticks = item.value("modified_at_ticks", int64_t{0});
    entry.modification_count = item.value("modification_count", uint32_t{0});
    entry.sequence_number = item.value("sequence_number", int64_t{0});
    return entry;
}

inline nlohmann::json world_state_to_json(const WorldStateEntry& entry) {
    return {
        {"id", entry.id},
        {"key", entry.key},
        {"value", entry.value},
        {"source", mutation_source_to_string(entry.source)},
        {"created_at_ticks", entry.created_at_ticks},
        {"modified_at_ticks", entry.modified_at_ticks},
        {"modification_count", entry.modification_count},
        {"sequence_number", entry.sequence_number}
    };
}

inline EpisodicMemoryEntry episode_from_json(const nlohmann::json& item) {
    EpisodicMemoryEntry entry;
    entry.id = item.value("id", "");
    entry.description = item.value("description", "");
    entry.episode_type = episode_type_from_string(item.value("episode_type", "dialogue"));
    entry.participant = item.value("participant", "");
    entry.significance = checked_range(item.value("significance", 0.5), 0.0, 1.0, "significance");
    entry.strength = checked_range(item.value("strength", 1.0), 0.0, 1.0, "strength");
    entry.created_at_ticks = item.value("created_at_ticks", int64_t{0});
    entry.sequence_number = item.value("sequence_number", int64_t{0});
    entry.source = mutation_source_from_string(item.value("source", "validated_output"));
    return entry;
}

inline nlohmann::json episode_to_json(const EpisodicMemoryEntry& entry) {
    nlohmann::json item = {
        {"id", entry.id},
        {"description", entry.description},
        {"episode_type", episode_type_to_string(entry.episode_type)},
        {"significance", entry.significance},
        {"strength", entry.strength},
        {"created_at_ticks", entry.created_at_ticks},
        {"sequence_number", entry.sequence_number},
        {"source", mutation_source_to_string(entry.source)}
    };
    if (!entry.participant.empty()) {
        item["participant"] = entry.participant;
    }
    return item;
}

inline BeliefMemoryEntry belief_from_json(const nlohmann::json& item) {
    BeliefMemoryEntry entry;
    entry.id = item.value("id", "");
    entry.subject = item.value("subject", "");
    entry.content = item.value("content", "");
    entry.belief_type = belief_type_from_string(item.value("belief_type", "opinion"));
    entry.sentiment = checked_range(item.value("sentiment", 0.0), -1.0, 1.0, "sentiment");
    entry.confidence = checked_range(item.value("confidence", 0.5), 0.0, 1.0, "confidence");
    entry.is_contradicted = item.value("is_contradicted", false);
    entry.contradiction_reason = item.value("contradiction_reason", "");
    entry.evidence = item.value("evidence", "");
    entry.created_at_ticks = item.value("created_at_ticks", int64_t{0});
    entry.sequence_number = item.value("sequence_number", int64_t{0});
    entry.source = mutation_source_from_string(item.value("source", "validated_output"));
    return entry;
}

inline nlohmann::json belief_to_json(const BeliefMemoryEntry& entry) {
    nlohmann::json item = {
        {"id", entry.id},
        {"subject", entry.subject},
        {"content", entry.content},
        {"belief_type", belief_type_to_string(entry.belief_type)},
        {"sentiment", entry.sentiment},
        {"confidence", entry.confidence},
        {"is_contradicted", entry.is_contradicted},
        {"created_at_ticks", entry.created_at_ticks},
        {"sequence_number", entry.sequence_number},
        {"source", mutation_source_to_string(entry.source)}
    };
    if (!entry.contradiction_reason.empty()) {
        item["contradiction_reason"] = entry.contradiction_reason;
    }
    if (!entry.evidence.empty()) {
        item["evidence"] = entry.evidence;
    }
    return item;
}

inline RelationshipEntry relationship_from_json(const nlohmann::json& item) {
    RelationshipEntry entry;
    entry.owner_npc_id = item.value("owner_npc_id", "");
    entry.target_id = item.value("target_id", "");
    entry.relationship_label = item.value("relationship_label", "");
    entry.affinity = checked_range(item.value("affinity", 0.0), -1.0, 1.0, "affinity");
    entry.trust = checked_range(item.value("trust", 0.5), 0.0, 1.0, "trust");
    entry.familiarity = checked_range(item.value("familiarity", 0.0), 0.0, 1.0, "familiarity");
    entry.history = string_list_from_json(item, "history");
    entry.tags = string_list_from_json(item, "tags");
    return entry;
}

inline nlohmann::json relationship_to_json(const RelationshipEntry& entry) {
    nlohmann::json item = {
        {"owner_npc_id", entry.owner_npc_id},
        {"target_id", entry.target_id},
        {"relationship_label", entry.relationship_label},
        {"affinity", entry.affinity},
        {"trust", entry.trust},
        {"familiarity", entry.familiarity}
    };
    if (!entry.history.empty()) {
        item["history"] = entry.history;
    }
    if (!entry.tags.empty()) {
        item["tags"] = entry.tags;
    }
    return item;
}

} // namespace npcmem
