#include "memory_store.hpp"
#include "event_bus.hpp"
#include "util.hpp"
#include <algorithm>
#include <sstream>

namespace npcmem {

CaseInsensitiveKey::CaseInsensitiveKey(const std::string& raw)
    : original_(raw), normalized_(to_lower(raw)) {}

std::string MemoryStatistics::to_string() const {
    std::ostringstream ss;
    ss << "Memory Stats: " << canonical_fact_count << " facts, "
       << world_state_count << " state, "
       << active_episodic_count << "/" << episodic_memory_count << " episodes, "
       << active_belief_count << "/" << belief_count << " beliefs";
    return ss.str();
}

// ── BeliefHandle ─────────────────────────────────────────────

void BeliefHandle::mark_contradicted(const std::string& reason) {
    entry_->mark_contradicted(reason);
    store_->publish_belief_changed(*entry_);
}

void BeliefHandle::adjust_sentiment(double delta) {
    entry_->adjust_sentiment(delta);
    store_->publish_belief_changed(*entry_);
}

// ── Ordering helpers ─────────────────────────────────────────

template <typename T>
static void sort_by_sequence(std::vector<T>& items) {
    std::sort(items.begin(), items.end(), [](const T& a, const T& b) {
        return a.sequence_number < b.sequence_number;
    });
}

// Newest first; equal timestamps fall back to insertion order.
static void sort_newest_first(std::vector<EpisodicMemoryEntry>& items) {
    std::sort(items.begin(), items.end(),
              [](const EpisodicMemoryEntry& a, const EpisodicMemoryEntry& b) {
        if (a.created_at_ticks != b.created_at_ticks) return a.created_at_ticks > b.created_at_ticks;
        return a.sequence_number < b.sequence_number;
    });
}

// ── MemoryStore ──────────────────────────────────────────────

MemoryStore::MemoryStore() : MemoryStore(system_clock(), random_id_generator()) {}

MemoryStore::MemoryStore(Clock& clock, IdGenerator& ids) : clock_(&clock), ids_(&ids) {}

void MemoryStore::set_config(const StoreConfig& config) {
    config_ = config;
    config_.episodic_decay_rate =
        checked_range(config.episodic_decay_rate, 0.0, 1.0, "episodic_decay_rate");
}

void MemoryStore::publish(const Event& event) {
    if (bus_) bus_->publish(event);
}

void MemoryStore::publish_belief_changed(const BeliefMemoryEntry& belief) {
    if (!bus_) return;
    BeliefChangedEvent ev;
    ev.id = belief.id;
    ev.content = belief.content;
    ev.contradicted = belief.is_contradicted;
    ev.sequence_number = belief.sequence_number;
    bus_->publish(ev);
}

MutationResult MemoryStore::reject(const std::string& target, const std::string& reason) {
    if (bus_) {
        MutationRejectedEvent ev;
        ev.target = target;
        ev.reason = reason;
        bus_->publish(ev);
    }
    return MutationResult::failed(reason);
}

bool MemoryStore::validate_mutation(MemoryAuthority target, MutationSource source) {
    return static_cast<int>(source) >= static_cast<int>(target);
}

// ── Canonical facts ──────────────────────────────────────────

const CanonicalFact& MemoryStore::add_canonical_fact(const std::string& id,
                                                     const std::string& content,
                                                     const std::string& domain) {
    if (canonical_facts_.count(id)) {
        throw DuplicateIdError("Canonical fact", id);
    }

    CanonicalFact fact;
    fact.id = id;
    fact.content = content;
    fact.domain = domain;
    fact.created_at_ticks = clock_->now_ticks();
    fact.sequence_number = next_sequence_++;
    fact.source = MutationSource::Designer;

    auto& stored = canonical_facts_[id] = std::move(fact);

    FactAddedEvent ev;
    ev.id = stored.id;
    ev.content = stored.content;
    ev.sequence_number = stored.sequence_number;
    publish(ev);
    return stored;
}

bool MemoryStore::remove_canonical_fact(const std::string& id) {
    if (canonical_facts_.erase(id) == 0) return false;
    FactRemovedEvent ev;
    ev.id = id;
    publish(ev);
    return true;
}

std::optional<CanonicalFact> MemoryStore::get_canonical_fact(const std::string& id) const {
    auto it = canonical_facts_.find(id);
    if (it == canonical_facts_.end()) return std::nullopt;
    return it->second;
}

std::vector<CanonicalFact> MemoryStore::get_canonical_facts(
    const std::optional<std::string>& domain) const {
    std::vector<CanonicalFact> result;
    result.reserve(canonical_facts_.size());
    for (const auto& [id, fact] : canonical_facts_) {
        if (domain && fact.domain != *domain) continue;
        result.push_back(fact);
    }
    sort_by_sequence(result);
    return result;
}

bool MemoryStore::is_canonical_fact(const std::string& id) const {
    return canonical_facts_.count(id) > 0;
}

std::optional<CanonicalFact> MemoryStore::contradicts_canonical_fact(
    const std::string& statement) const {
    const std::string lower_statement = to_lower(statement);

    for (const auto& fact : get_canonical_facts()) {
        const std::string lower_fact = to_lower(fact.content);
        if (lower_fact.empty()) continue;

        // Negation in front of the fact
        if (lower_statement.find("not " + lower_fact) != std::string::npos ||
            lower_statement.find("isn't " + lower_fact) != std::string::npos ||
            lower_statement.find("never " + lower_fact) != std::string::npos) {
            return fact;
        }

        // Negation after the fact
        if (lower_statement.find(lower_fact + " is not") != std::string::npos ||
            lower_statement.find(lower_fact + " isn't") != std::string::npos) {
            return fact;
        }

        // "X is Y" against "X is not Y" / "X isn't Y"
        if (lower_fact.find(" is ") != std::string::npos &&
            (lower_statement == replace_all(lower_fact, " is ", " is not ") ||
             lower_statement == replace_all(lower_fact, " is ", " isn't "))) {
            return fact;
        }
    }
    return std::nullopt;
}

// ── World state ──────────────────────────────────────────────

MutationResult MemoryStore::set_world_state(const std::string& key, const std::string& value,
                                            MutationSource source) {
    if (!validate_mutation(MemoryAuthority::WorldState, source)) {
        return reject("world_state:" + key,
                      "Source '" + mutation_source_to_string(source) +
                      "' lacks authority to modify world state");
    }

    CaseInsensitiveKey k(key);
    auto it = world_state_.find(k);
    bool created = it == world_state_.end();
    WorldStateEntry* entry;
    if (created) {
        WorldStateEntry fresh;
        fresh.id = ids_->next_id();
        fresh.key = key;
        fresh.value = value;
        fresh.source = source;
        fresh.created_at_ticks = clock_->now_ticks();
        fresh.modified_at_ticks = fresh.created_at_ticks;
        fresh.sequence_number = next_sequence_++;
        entry = &world_state_.emplace(k, std::move(fresh)).first->second;
    } else {
        entry = &it->second;
        entry->value = value;
        entry->source = source;
        entry->modified_at_ticks = clock_->now_ticks();
        entry->modification_count++;
    }

    WorldStateChangedEvent ev;
    ev.key = entry->key;
    ev.value = entry->value;
    ev.source = source;
    ev.created = created;
    ev.sequence_number = entry->sequence_number;
    publish(ev);
    return MutationResult::ok();
}

std::optional<WorldStateEntry> MemoryStore::get_world_state(const std::string& key) const {
    auto it = world_state_.find(CaseInsensitiveKey(key));
    if (it == world_state_.end()) return std::nullopt;
    return it->second;
}

std::vector<WorldStateEntry> MemoryStore::get_all_world_state() const {
    std::vector<WorldStateEntry> result;
    result.reserve(world_state_.size());
    for (const auto& [key, entry] : world_state_) result.push_back(entry);
    sort_by_sequence(result);
    return result;
}

// ── Episodic memory ──────────────────────────────────────────

MutationResult MemoryStore::add_episodic_memory(EpisodicMemoryEntry entry, MutationSource source) {
    if (!validate_mutation(MemoryAuthority::Episodic, source)) {
        return reject("episodic",
                      "Source '" + mutation_source_to_string(source) +
                      "' lacks authority to add episodic memories");
    }

    entry.significance = checked_range(entry.significance, 0.0, 1.0, "significance");
    entry.strength = checked_range(entry.strength, 0.0, 1.0, "strength");
    entry.source = source;
    if (entry.id.empty()) entry.id = ids_->next_id();
    if (entry.created_at_ticks == 0) entry.created_at_ticks = clock_->now_ticks();
    entry.sequence_number = next_sequence_++;

    EpisodeAddedEvent ev;
    ev.id = entry.id;
    ev.description = entry.description;
    ev.source = source;
    ev.sequence_number = entry.sequence_number;

    episodic_memories_.push_back(std::move(entry));
    prune_episodic_memories();

    publish(ev);
    return MutationResult::ok();
}

MutationResult MemoryStore::add_dialogue(const std::string& speaker, const std::string& text,
                                         double significance, MutationSource source) {
    return add_episodic_memory(EpisodicMemoryEntry::from_dialogue(speaker, text, significance),
                               source);
}

void MemoryStore::prune_episodic_memories() {
    if (config_.max_episodic_memories == 0 ||
        episodic_memories_.size() <= config_.max_episodic_memories) {
        return;
    }

    // Weakest first; the survivors keep their insertion order.
    std::vector<const EpisodicMemoryEntry*> ranked;
    ranked.reserve(episodic_memories_.size());
    for (const auto& m : episodic_memories_) ranked.push_back(&m);
    std::sort(ranked.begin(), ranked.end(),
              [](const EpisodicMemoryEntry* a, const EpisodicMemoryEntry* b) {
        if (a->strength != b->strength) return a->strength < b->strength;
        if (a->significance != b->significance) return a->significance < b->significance;
        return a->sequence_number < b->sequence_number;
    });

    size_t excess = episodic_memories_.size() - config_.max_episodic_memories;
    std::vector<int64_t> doomed;
    doomed.reserve(excess);
    for (size_t i = 0; i < excess; ++i) doomed.push_back(ranked[i]->sequence_number);

    episodic_memories_.erase(
        std::remove_if(episodic_memories_.begin(), episodic_memories_.end(),
            [&doomed](const EpisodicMemoryEntry& m) {
                return std::find(doomed.begin(), doomed.end(), m.sequence_number) != doomed.end();
            }),
        episodic_memories_.end());
}

void MemoryStore::apply_episodic_decay() {
    size_t affected = 0;
    for (auto& memory : episodic_memories_) {
        if (memory.strength <= 0.0) continue;
        memory.strength = std::max(0.0, memory.strength - config_.episodic_decay_rate);
        affected++;
    }

    DecayAppliedEvent ev;
    ev.decay_rate = config_.episodic_decay_rate;
    ev.affected = affected;
    publish(ev);
}

size_t MemoryStore::reinforce_episodic_memory(const std::string& id, double amount) {
    double step = checked_range(amount, 0.0, 1.0, "reinforce amount");
    size_t affected = 0;
    for (auto& memory : episodic_memories_) {
        if (memory.id != id) continue;
        memory.reinforce(step);
        affected++;
    }
    if (affected == 0) return 0;

    EpisodeReinforcedEvent ev;
    ev.id = id;
    ev.amount = step;
    ev.affected = affected;
    publish(ev);
    return affected;
}

std::vector<EpisodicMemoryEntry> MemoryStore::get_active_episodic_memories(
    double strength_threshold) const {
    std::vector<EpisodicMemoryEntry> result;
    for (const auto& m : episodic_memories_) {
        if (m.strength > strength_threshold) result.push_back(m);
    }
    sort_newest_first(result);
    return result;
}

std::vector<EpisodicMemoryEntry> MemoryStore::get_recent_memories(size_t count) const {
    auto result = get_active_episodic_memories();
    if (result.size() > count) result.resize(count);
    return result;
}

std::vector<EpisodicMemoryEntry> MemoryStore::get_all_episodic_memories() const {
    auto result = episodic_memories_;
    sort_by_sequence(result);
    return result;
}

// ── Beliefs ──────────────────────────────────────────────────

MutationResult MemoryStore::set_belief(const std::string& id, BeliefMemoryEntry entry,
                                       MutationSource source) {
    // Beliefs sit at the lowest authority level but still need validated output
    if (source < MutationSource::ValidatedOutput) {
        return reject("belief:" + id,
                      "Source '" + mutation_source_to_string(source) +
                      "' lacks authority to modify beliefs");
    }

    entry.confidence = checked_range(entry.confidence, 0.0, 1.0, "confidence");
    entry.sentiment = checked_range(entry.sentiment, -1.0, 1.0, "sentiment");

    if (!entry.is_contradicted) {
        if (auto fact = contradicts_canonical_fact(entry.content)) {
            entry.mark_contradicted("Contradicts canonical fact: " + fact->content);
        }
    }

    entry.source = source;
    entry.id = id;
    if (entry.created_at_ticks == 0) entry.created_at_ticks = clock_->now_ticks();
    entry.sequence_number = next_sequence_++;

    CaseInsensitiveKey key(id);
    beliefs_.erase(key);
    auto& stored = beliefs_.emplace(key, std::move(entry)).first->second;
    publish_belief_changed(stored);
    return MutationResult::ok();
}

std::optional<BeliefHandle> MemoryStore::get_belief(const std::string& id) {
    auto it = beliefs_.find(CaseInsensitiveKey(id));
    if (it == beliefs_.end()) return std::nullopt;
    return BeliefHandle(this, &it->second);
}

std::optional<BeliefMemoryEntry> MemoryStore::find_belief(const std::string& id) const {
    auto it = beliefs_.find(CaseInsensitiveKey(id));
    if (it == beliefs_.end()) return std::nullopt;
    return it->second;
}

std::vector<BeliefMemoryEntry> MemoryStore::get_beliefs_about(const std::string& subject) const {
    std::vector<BeliefMemoryEntry> result;
    for (const auto& [key, belief] : beliefs_) {
        if (equals_ignore_case(belief.subject, subject)) result.push_back(belief);
    }
    sort_by_sequence(result);
    return result;
}

std::vector<BeliefMemoryEntry> MemoryStore::get_active_beliefs() const {
    std::vector<BeliefMemoryEntry> result;
    for (const auto& [key, belief] : beliefs_) {
        if (!belief.is_contradicted) result.push_back(belief);
    }
    sort_by_sequence(result);
    return result;
}

std::vector<BeliefMemoryEntry> MemoryStore::get_all_beliefs() const {
    std::vector<BeliefMemoryEntry> result;
    result.reserve(beliefs_.size());
    for (const auto& [key, belief] : beliefs_) result.push_back(belief);
    sort_by_sequence(result);
    return result;
}

// ── Relationships ────────────────────────────────────────────

MemoryStore::RelationshipKey MemoryStore::relationship_key(const std::string& owner,
                                                           const std::string& target) {
    return {to_lower(owner), to_lower(target)};
}

MutationResult MemoryStore::set_relationship(const RelationshipEntry& entry,
                                             const std::string& acting_npc_id) {
    auto check = authorize_relationship_write(entry, acting_npc_id);
    if (!check.authorized) {
        return reject("relationship:" + entry.owner_npc_id + "->" + entry.target_id,
                      check.error);
    }

    relationships_[relationship_key(entry.owner_npc_id, entry.target_id)] = entry;

    RelationshipChangedEvent ev;
    ev.owner_npc_id = entry.owner_npc_id;
    ev.target_id = entry.target_id;
    ev.relationship_label = entry.relationship_label;
    publish(ev);
    return MutationResult::ok();
}

std::optional<RelationshipEntry> MemoryStore::get_relationship(const std::string& owner_npc_id,
                                                               const std::string& target_id) const {
    auto it = relationships_.find(relationship_key(owner_npc_id, target_id));
    if (it == relationships_.end()) return std::nullopt;
    return it->second;
}

std::vector<RelationshipEntry> MemoryStore::get_relationships(const std::string& owner_npc_id) const {
    const std::string owner = to_lower(owner_npc_id);
    std::vector<RelationshipEntry> result;
    // Map order is (owner, target) byte-wise, so the result is ordered by target.
    for (const auto& [key, entry] : relationships_) {
        if (key.first == owner) result.push_back(entry);
    }
    return result;
}

std::vector<RelationshipEntry> MemoryStore::get_all_relationships() const {
    std::vector<RelationshipEntry> result;
    result.reserve(relationships_.size());
    for (const auto& [key, entry] : relationships_) result.push_back(entry);
    return result;
}

// ── Unified access ───────────────────────────────────────────

std::vector<std::string> MemoryStore::get_all_memories_for_prompt(
    size_t max_episodic, bool include_contradicted_beliefs) const {
    std::vector<std::string> memories;

    for (const auto& fact : get_canonical_facts()) {
        memories.push_back("[Fact] " + fact.content);
    }
    for (const auto& state : get_all_world_state()) {
        memories.push_back("[State] " + state.content());
    }
    for (const auto& episode : get_recent_memories(max_episodic)) {
        memories.push_back("[Memory] " + episode.description);
    }

    auto beliefs = include_contradicted_beliefs ? get_all_beliefs() : get_active_beliefs();
    for (const auto& belief : beliefs) {
        memories.push_back((belief.is_contradicted ? "[Uncertain] " : "") + belief.summary());
    }
    return memories;
}

MemoryStatistics MemoryStore::get_statistics() const {
    MemoryStatistics stats;
    stats.canonical_fact_count = canonical_facts_.size();
    stats.world_state_count = world_state_.size();
    stats.episodic_memory_count = episodic_memories_.size();
    stats.active_episodic_count = static_cast<size_t>(
        std::count_if(episodic_memories_.begin(), episodic_memories_.end(),
                      [](const EpisodicMemoryEntry& m) { return m.is_active(); }));
    stats.belief_count = beliefs_.size();
    for (const auto& [key, belief] : beliefs_) {
        if (!belief.is_contradicted) stats.active_belief_count++;
    }
    stats.relationship_count = relationships_.size();
    return stats;
}

void MemoryStore::clear_all() {
    canonical_facts_.clear();
    world_state_.clear();
    episodic_memories_.clear();
    beliefs_.clear();
    relationships_.clear();
    next_sequence_ = 1;
}

// ── Sequencing ───────────────────────────────────────────────

void MemoryStore::recalculate_next_sequence_number() {
    int64_t max_seq = 0;
    for (const auto& [id, fact] : canonical_facts_) max_seq = std::max(max_seq, fact.sequence_number);
    for (const auto& [key, entry] : world_state_) max_seq = std::max(max_seq, entry.sequence_number);
    for (const auto& m : episodic_memories_) max_seq = std::max(max_seq, m.sequence_number);
    for (const auto& [key, belief] : beliefs_) max_seq = std::max(max_seq, belief.sequence_number);

    next_sequence_ = max_seq + 1;

    SequenceRecalculatedEvent ev;
    ev.next_sequence_number = next_sequence_;
    publish(ev);
}

void MemoryStore::restore_canonical_fact(const CanonicalFact& fact) {
    if (canonical_facts_.count(fact.id)) {
        throw DuplicateIdError("Canonical fact", fact.id);
    }
    canonical_facts_[fact.id] = fact;
}

void MemoryStore::restore_world_state(const WorldStateEntry& entry) {
    world_state_.erase(CaseInsensitiveKey(entry.key));
    world_state_.emplace(CaseInsensitiveKey(entry.key), entry);
}

void MemoryStore::restore_episodic_memory(const EpisodicMemoryEntry& entry) {
    episodic_memories_.push_back(entry);
}

void MemoryStore::restore_belief(const std::string& id, const BeliefMemoryEntry& entry) {
    CaseInsensitiveKey key(id);
    beliefs_.erase(key);
    beliefs_.emplace(key, entry);
}

void MemoryStore::restore_relationship(const RelationshipEntry& entry) {
    relationships_[relationship_key(entry.owner_npc_id, entry.target_id)] = entry;
}

} // namespace npcmem
