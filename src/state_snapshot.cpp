#include "state_snapshot.hpp"
#include "clock.hpp"
#include "util.hpp"

namespace npcmem {

std::string trigger_reason_to_string(TriggerReason reason) {
    switch (reason) {
        case TriggerReason::PlayerUtterance: return "PlayerUtterance";
        case TriggerReason::ZoneTrigger:     return "ZoneTrigger";
        case TriggerReason::TimeTrigger:     return "TimeTrigger";
        case TriggerReason::QuestTrigger:    return "QuestTrigger";
        case TriggerReason::NpcInteraction:  return "NpcInteraction";
        case TriggerReason::WorldEvent:      return "WorldEvent";
        case TriggerReason::Custom:          return "Custom";
    }
    return "Custom";
}

// ── InteractionContext ───────────────────────────────────────

InteractionContext InteractionContext::from_player_utterance(const std::string& npc_id,
                                                             const std::string& player_input,
                                                             double game_time) {
    InteractionContext ctx;
    ctx.trigger_reason = TriggerReason::PlayerUtterance;
    ctx.npc_id = npc_id;
    ctx.player_input = player_input;
    ctx.game_time = game_time;
    return ctx;
}

InteractionContext InteractionContext::from_zone_trigger(const std::string& npc_id,
                                                         const std::string& trigger_id,
                                                         const std::string& trigger_prompt,
                                                         double game_time) {
    InteractionContext ctx;
    ctx.trigger_reason = TriggerReason::ZoneTrigger;
    ctx.npc_id = npc_id;
    ctx.trigger_id = trigger_id;
    ctx.trigger_prompt = trigger_prompt;
    ctx.game_time = game_time;
    return ctx;
}

std::string InteractionContext::to_string() const {
    return "[InteractionContext] Trigger=" + trigger_reason_to_string(trigger_reason) +
           ", NPC=" + npc_id + ", TriggerId=" + trigger_id;
}

bool InteractionContext::operator==(const InteractionContext& other) const {
    return trigger_reason == other.trigger_reason && npc_id == other.npc_id &&
           trigger_id == other.trigger_id && player_input == other.player_input &&
           trigger_prompt == other.trigger_prompt && game_time == other.game_time &&
           scene_name == other.scene_name && interaction_count == other.interaction_count &&
           tags == other.tags;
}

// ── StateSnapshot ────────────────────────────────────────────

std::vector<std::string> StateSnapshot::memory_for_prompt() const {
    std::vector<std::string> lines;
    lines.reserve(total_memory_count());
    for (const auto& fact : canonical_facts_) lines.push_back("[Fact] " + fact);
    for (const auto& state : world_state_) lines.push_back("[State] " + state);
    for (const auto& memory : episodic_memories_) lines.push_back("[Memory] " + memory);
    for (const auto& belief : beliefs_) lines.push_back(belief);
    return lines;
}

StateSnapshot StateSnapshot::for_retry(const std::optional<ConstraintSet>& additional) const {
    StateSnapshot retry = *this;
    retry.snapshot_id_ = generate_id();
    retry.attempt_number_ = attempt_number_ + 1;
    if (additional) retry.constraints_.merge(*additional);
    return retry;
}

std::string StateSnapshot::to_string() const {
    return "StateSnapshot[" + snapshot_id_ + "] Attempt " +
           std::to_string(attempt_number_ + 1) + "/" + std::to_string(max_attempts_) + ", " +
           std::to_string(total_memory_count()) + " memories, " +
           std::to_string(constraints_.size()) + " constraints";
}

// ── StateSnapshotBuilder ─────────────────────────────────────

StateSnapshotBuilder::StateSnapshotBuilder() : clock_(&system_clock()) {}

StateSnapshotBuilder::StateSnapshotBuilder(Clock& clock) : clock_(&clock) {}

StateSnapshotBuilder& StateSnapshotBuilder::with_context(const InteractionContext& context) {
    draft_.context_ = context;
    return *this;
}

StateSnapshotBuilder& StateSnapshotBuilder::with_constraints(const ConstraintSet& constraints) {
    draft_.constraints_ = constraints;
    return *this;
}

StateSnapshotBuilder& StateSnapshotBuilder::with_canonical_facts(const std::vector<std::string>& facts) {
    draft_.canonical_facts_ = facts;
    return *this;
}

StateSnapshotBuilder& StateSnapshotBuilder::with_world_state(const std::vector<std::string>& state) {
    draft_.world_state_ = state;
    return *this;
}

StateSnapshotBuilder& StateSnapshotBuilder::with_episodic_memories(const std::vector<std::string>& memories) {
    draft_.episodic_memories_ = memories;
    return *this;
}

StateSnapshotBuilder& StateSnapshotBuilder::with_beliefs(const std::vector<std::string>& beliefs) {
    draft_.beliefs_ = beliefs;
    return *this;
}

StateSnapshotBuilder& StateSnapshotBuilder::with_dialogue_history(const std::vector<std::string>& history) {
    draft_.dialogue_history_ = history;
    return *this;
}

StateSnapshotBuilder& StateSnapshotBuilder::with_system_prompt(const std::string& prompt) {
    draft_.system_prompt_ = prompt;
    return *this;
}

StateSnapshotBuilder& StateSnapshotBuilder::with_player_input(const std::string& input) {
    draft_.player_input_ = input;
    return *this;
}

StateSnapshotBuilder& StateSnapshotBuilder::with_attempt_number(uint32_t attempt) {
    draft_.attempt_number_ = attempt;
    return *this;
}

StateSnapshotBuilder& StateSnapshotBuilder::with_max_attempts(uint32_t max_attempts) {
    draft_.max_attempts_ = max_attempts;
    return *this;
}

StateSnapshotBuilder& StateSnapshotBuilder::with_metadata(const std::string& key,
                                                          const std::string& value) {
    draft_.metadata_[key] = value;
    return *this;
}

StateSnapshotBuilder& StateSnapshotBuilder::with_snapshot_time(int64_t ticks) {
    snapshot_time_ = ticks;
    return *this;
}

StateSnapshot StateSnapshotBuilder::build() const {
    StateSnapshot snapshot = draft_;
    snapshot.snapshot_id_ = generate_id();
    snapshot.created_at_ticks_ = snapshot_time_ ? *snapshot_time_ : clock_->now_ticks();
    return snapshot;
}

} // namespace npcmem
