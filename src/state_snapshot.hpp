#pragma once
#include "constraint.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

namespace npcmem {

class Clock;

enum class TriggerReason {
    PlayerUtterance,
    ZoneTrigger,
    TimeTrigger,
    QuestTrigger,
    NpcInteraction,
    WorldEvent,
    Custom
};

std::string trigger_reason_to_string(TriggerReason reason);

// What caused the NPC to speak.
struct InteractionContext {
    TriggerReason trigger_reason = TriggerReason::PlayerUtterance;
    std::string npc_id;
    std::string trigger_id;
    std::string player_input;
    std::string trigger_prompt;
    double game_time = 0.0;
    std::string scene_name;
    uint32_t interaction_count = 0;
    std::vector<std::string> tags;

    static InteractionContext from_player_utterance(const std::string& npc_id,
                                                    const std::string& player_input,
                                                    double game_time = 0.0);
    static InteractionContext from_zone_trigger(const std::string& npc_id,
                                                const std::string& trigger_id,
                                                const std::string& trigger_prompt,
                                                double game_time = 0.0);

    std::string to_string() const;

    bool operator==(const InteractionContext& other) const;
};

// Immutable bundle of everything the prompt builder needs for one generation
// attempt. Built by StateSnapshotBuilder; only for_retry derives new ones.
class StateSnapshot {
public:
    const std::string& snapshot_id() const { return snapshot_id_; }
    int64_t created_at_ticks() const { return created_at_ticks_; }

    const InteractionContext& context() const { return context_; }
    const ConstraintSet& constraints() const { return constraints_; }

    const std::vector<std::string>& canonical_facts() const { return canonical_facts_; }
    const std::vector<std::string>& world_state() const { return world_state_; }
    const std::vector<std::string>& episodic_memories() const { return episodic_memories_; }
    const std::vector<std::string>& beliefs() const { return beliefs_; }
    const std::vector<std::string>& dialogue_history() const { return dialogue_history_; }

    const std::string& system_prompt() const { return system_prompt_; }
    const std::string& player_input() const { return player_input_; }
    uint32_t attempt_number() const { return attempt_number_; }
    uint32_t max_attempts() const { return max_attempts_; }
    const std::map<std::string, std::string>& metadata() const { return metadata_; }

    size_t total_memory_count() const {
        return canonical_facts_.size() + world_state_.size() +
               episodic_memories_.size() + beliefs_.size();
    }

    bool can_retry() const { return attempt_number_ < max_attempts_; }

    // Facts, state and memories tagged "[Fact] ", "[State] ", "[Memory] ";
    // beliefs are already phrased and pass through as-is.
    std::vector<std::string> memory_for_prompt() const;

    // Copy with attempt_number + 1 and a fresh id. `additional` constraints
    // are appended after the originals, skipping ids already present.
    StateSnapshot for_retry(const std::optional<ConstraintSet>& additional = std::nullopt) const;

    std::string to_string() const;

private:
    friend class StateSnapshotBuilder;
    StateSnapshot() = default;

    std::string snapshot_id_;
    int64_t created_at_ticks_ = 0;
    InteractionContext context_;
    ConstraintSet constraints_;
    std::vector<std::string> canonical_facts_;
    std::vector<std::string> world_state_;
    std::vector<std::string> episodic_memories_;
    std::vector<std::string> beliefs_;
    std::vector<std::string> dialogue_history_;
    std::string system_prompt_;
    std::string player_input_;
    uint32_t attempt_number_ = 0;
    uint32_t max_attempts_ = 3;
    std::map<std::string, std::string> metadata_;
};

// Fluent builder. Each with_* call replaces the field; with_metadata adds
// one key.
class StateSnapshotBuilder {
public:
    StateSnapshotBuilder();
    explicit StateSnapshotBuilder(Clock& clock);

    StateSnapshotBuilder& with_context(const InteractionContext& context);
    StateSnapshotBuilder& with_constraints(const ConstraintSet& constraints);
    StateSnapshotBuilder& with_canonical_facts(const std::vector<std::string>& facts);
    StateSnapshotBuilder& with_world_state(const std::vector<std::string>& state);
    StateSnapshotBuilder& with_episodic_memories(const std::vector<std::string>& memories);
    StateSnapshotBuilder& with_beliefs(const std::vector<std::string>& beliefs);
    StateSnapshotBuilder& with_dialogue_history(const std::vector<std::string>& history);
    StateSnapshotBuilder& with_system_prompt(const std::string& prompt);
    StateSnapshotBuilder& with_player_input(const std::string& input);
    StateSnapshotBuilder& with_attempt_number(uint32_t attempt);
    StateSnapshotBuilder& with_max_attempts(uint32_t max_attempts);
    StateSnapshotBuilder& with_metadata(const std::string& key, const std::string& value);
    StateSnapshotBuilder& with_snapshot_time(int64_t ticks);

    // Each call yields a snapshot with a new id.
    StateSnapshot build() const;

private:
    Clock* clock_;
    std::optional<int64_t> snapshot_time_;
    StateSnapshot draft_;
};

} // namespace npcmem
