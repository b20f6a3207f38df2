#include "snapshot_io.hpp"
#include "entry_json.hpp"
#include "../memory_store.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

namespace npcmem {

namespace {

struct ParsedSnapshot {
    std::vector<CanonicalFact> facts;
    std::vector<WorldStateEntry> world_state;
    std::vector<EpisodicMemoryEntry> episodes;
    std::vector<BeliefMemoryEntry> beliefs;
    std::vector<RelationshipEntry> relationships;
    int64_t next_sequence_number = 0;

    size_t total() const {
        return facts.size() + world_state.size() + episodes.size() +
               beliefs.size() + relationships.size();
    }
};

const nlohmann::json& section(const nlohmann::json& j, const char* name) {
    static const nlohmann::json empty = nlohmann::json::array();
    if (!j.contains(name)) return empty;
    if (!j[name].is_array()) {
        throw SnapshotError(std::string("snapshot section '") + name + "' must be an array");
    }
    return j[name];
}

template <typename T, typename Convert>
std::vector<T> parse_section(const nlohmann::json& j, const char* name, Convert convert) {
    std::vector<T> out;
    for (const auto& item : section(j, name)) {
        if (!item.is_object()) {
            throw SnapshotError(std::string("snapshot section '") + name +
                                "' contains a non-object entry");
        }
        out.push_back(convert(item));
    }
    return out;
}

ParsedSnapshot parse(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        throw SnapshotError(std::string("malformed snapshot: ") + e.what());
    }
    if (!j.is_object()) throw SnapshotError("snapshot root must be a JSON object");

    int version = SNAPSHOT_FORMAT_VERSION;
    if (j.contains("version")) {
        if (!j["version"].is_number_integer()) throw SnapshotError("snapshot version must be an integer");
        version = j["version"].get<int>();
    }
    if (version != SNAPSHOT_FORMAT_VERSION) {
        throw SnapshotError("unsupported snapshot version " + std::to_string(version));
    }

    ParsedSnapshot parsed;
    try {
        parsed.facts = parse_section<CanonicalFact>(j, "canonical_facts", fact_from_json);
        parsed.world_state = parse_section<WorldStateEntry>(j, "world_state", world_state_from_json);
        parsed.episodes = parse_section<EpisodicMemoryEntry>(j, "episodic_memories", episode_from_json);
        parsed.beliefs = parse_section<BeliefMemoryEntry>(j, "beliefs", belief_from_json);
        parsed.relationships = parse_section<RelationshipEntry>(j, "relationships", relationship_from_json);
        parsed.next_sequence_number = j.value("next_sequence_number", int64_t{0});
    } catch (const nlohmann::json::exception& e) {
        throw SnapshotError(std::string("invalid snapshot entry: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw SnapshotError(std::string("invalid snapshot entry: ") + e.what());
    }

    for (const auto& fact : parsed.facts) {
        if (fact.id.empty()) throw SnapshotError("canonical fact without id");
    }
    for (const auto& entry : parsed.world_state) {
        if (entry.key.empty()) throw SnapshotError("world state entry without key");
    }
    for (const auto& belief : parsed.beliefs) {
        if (belief.id.empty()) throw SnapshotError("belief without id");
    }
    return parsed;
}

} // namespace

std::string snapshot_export(const MemoryStore& store) {
    nlohmann::json j;
    j["version"] = SNAPSHOT_FORMAT_VERSION;
    j["next_sequence_number"] = store.next_sequence_number();

    nlohmann::json facts = nlohmann::json::array();
    for (const auto& fact : store.get_canonical_facts()) facts.push_back(fact_to_json(fact));
    j["canonical_facts"] = std::move(facts);

    nlohmann::json state = nlohmann::json::array();
    for (const auto& entry : store.get_all_world_state()) state.push_back(world_state_to_json(entry));
    j["world_state"] = std::move(state);

    nlohmann::json episodes = nlohmann::json::array();
    for (const auto& entry : store.get_all_episodic_memories()) episodes.push_back(episode_to_json(entry));
    j["episodic_memories"] = std::move(episodes);

    nlohmann::json beliefs = nlohmann::json::array();
    for (const auto& entry : store.get_all_beliefs()) beliefs.push_back(belief_to_json(entry));
    j["beliefs"] = std::move(beliefs);

    nlohmann::json relationships = nlohmann::json::array();
    for (const auto& entry : store.get_all_relationships()) {
        relationships.push_back(relationship_to_json(entry));
    }
    j["relationships"] = std::move(relationships);

    return j.dump(2);
}

uint32_t snapshot_import(MemoryStore& store, const std::string& json_str) {
    ParsedSnapshot parsed = parse(json_str);

    // Duplicate fact ids would otherwise surface halfway through the restore
    std::vector<std::string> fact_ids;
    for (const auto& fact : parsed.facts) fact_ids.push_back(fact.id);
    std::sort(fact_ids.begin(), fact_ids.end());
    auto dup = std::adjacent_find(fact_ids.begin(), fact_ids.end());
    if (dup != fact_ids.end()) {
        throw SnapshotError("duplicate canonical fact id '" + *dup + "'");
    }

    store.clear_all();
    for (const auto& fact : parsed.facts) store.restore_canonical_fact(fact);
    for (const auto& entry : parsed.world_state) store.restore_world_state(entry);
    for (const auto& entry : parsed.episodes) store.restore_episodic_memory(entry);
    for (const auto& entry : parsed.beliefs) store.restore_belief(entry.id, entry);
    for (const auto& entry : parsed.relationships) store.restore_relationship(entry);

    store.recalculate_next_sequence_number();
    // A counter saved ahead of the surviving entries (e.g. after a removal) wins
    if (parsed.next_sequence_number > store.next_sequence_number()) {
        store.set_next_sequence_number(parsed.next_sequence_number);
    }

    return static_cast<uint32_t>(parsed.total());
}

} // namespace npcmem
