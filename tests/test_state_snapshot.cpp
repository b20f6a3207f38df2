#include <catch2/catch.hpp>
#include "state_snapshot.hpp"
#include "clock.hpp"

using namespace npcmem;

namespace {

struct SnapshotFixture {
    FixedClock clock{123456};
    InteractionContext context = InteractionContext::from_player_utterance("smith", "Hello there");
    ConstraintSet constraints{
        Constraint::requirement("stay_in_character", "Stay in character", "You are the smith."),
    };

    StateSnapshotBuilder builder() { return StateSnapshotBuilder(clock); }
};

} // namespace

// ── InteractionContext ───────────────────────────────────────────

TEST_CASE("InteractionContext: factories", "[state_snapshot]") {
    auto utter = InteractionContext::from_player_utterance("smith", "Hi", 12.5);
    REQUIRE(utter.trigger_reason == TriggerReason::PlayerUtterance);
    REQUIRE(utter.player_input == "Hi");
    REQUIRE(utter.game_time == 12.5);

    auto zone = InteractionContext::from_zone_trigger("guard", "gate", "A stranger approaches");
    REQUIRE(zone.trigger_reason == TriggerReason::ZoneTrigger);
    REQUIRE(zone.trigger_id == "gate");
    REQUIRE(zone.to_string() == "[InteractionContext] Trigger=ZoneTrigger, NPC=guard, TriggerId=gate");
}

// ── Builder ──────────────────────────────────────────────────────

TEST_CASE("StateSnapshotBuilder: sets every field", "[state_snapshot]") {
    SnapshotFixture f;
    auto snapshot = f.builder()
        .with_context(f.context)
        .with_constraints(f.constraints)
        .with_canonical_facts({"The king is Arthur", "The world is round"})
        .with_world_state({"door: open"})
        .with_episodic_memories({"Player said hello"})
        .with_beliefs({"I believe that the player is kind"})
        .with_dialogue_history({"Player: Hello", "Smith: Welcome"})
        .with_system_prompt("You are a smith.")
        .with_player_input("Hello there")
        .with_attempt_number(1)
        .with_max_attempts(5)
        .with_metadata("scene", "forge")
        .with_metadata("mood", "calm")
        .build();

    REQUIRE(snapshot.context() == f.context);
    REQUIRE(snapshot.constraints().size() == 1);
    REQUIRE(snapshot.canonical_facts().size() == 2);
    REQUIRE(snapshot.world_state() == std::vector<std::string>{"door: open"});
    REQUIRE(snapshot.dialogue_history().size() == 2);
    REQUIRE(snapshot.system_prompt() == "You are a smith.");
    REQUIRE(snapshot.player_input() == "Hello there");
    REQUIRE(snapshot.attempt_number() == 1);
    REQUIRE(snapshot.max_attempts() == 5);
    REQUIRE(snapshot.metadata().size() == 2);
    REQUIRE(snapshot.metadata().at("scene") == "forge");
    REQUIRE(snapshot.created_at_ticks() == 123456);
    REQUIRE(snapshot.total_memory_count() == 4);
}

TEST_CASE("StateSnapshotBuilder: defaults", "[state_snapshot]") {
    SnapshotFixture f;
    auto snapshot = f.builder().build();
    REQUIRE(snapshot.attempt_number() == 0);
    REQUIRE(snapshot.max_attempts() == 3);
    REQUIRE(snapshot.constraints().empty());
    REQUIRE(snapshot.total_memory_count() == 0);
    REQUIRE_FALSE(snapshot.snapshot_id().empty());
}

TEST_CASE("StateSnapshotBuilder: each build gets a unique id", "[state_snapshot]") {
    SnapshotFixture f;
    auto builder = f.builder();
    auto a = builder.build();
    auto b = builder.build();
    REQUIRE(a.snapshot_id() != b.snapshot_id());
}

TEST_CASE("StateSnapshotBuilder: explicit snapshot time wins over clock", "[state_snapshot]") {
    SnapshotFixture f;
    auto snapshot = f.builder().with_snapshot_time(42).build();
    REQUIRE(snapshot.created_at_ticks() == 42);
}

// ── Snapshot behavior ────────────────────────────────────────────

TEST_CASE("StateSnapshot: can_retry while attempt < max", "[state_snapshot]") {
    SnapshotFixture f;
    REQUIRE(f.builder().with_attempt_number(0).with_max_attempts(3).build().can_retry());
    REQUIRE(f.builder().with_attempt_number(2).with_max_attempts(3).build().can_retry());
    REQUIRE_FALSE(f.builder().with_attempt_number(3).with_max_attempts(3).build().can_retry());
    REQUIRE_FALSE(f.builder().with_max_attempts(0).build().can_retry());
}

TEST_CASE("StateSnapshot: memory_for_prompt prefixes categories", "[state_snapshot]") {
    SnapshotFixture f;
    auto snapshot = f.builder()
        .with_canonical_facts({"The king is Arthur"})
        .with_world_state({"door: open"})
        .with_episodic_memories({"Player said hello"})
        .with_beliefs({"Player is trustworthy"})
        .build();

    REQUIRE(snapshot.memory_for_prompt() == std::vector<std::string>{
        "[Fact] The king is Arthur",
        "[State] door: open",
        "[Memory] Player said hello",
        "Player is trustworthy"});
}

TEST_CASE("StateSnapshot: to_string", "[state_snapshot]") {
    SnapshotFixture f;
    auto snapshot = f.builder()
        .with_attempt_number(1)
        .with_max_attempts(3)
        .with_canonical_facts({"Fact 1", "Fact 2"})
        .with_constraints(f.constraints)
        .build();

    REQUIRE(snapshot.to_string() ==
            "StateSnapshot[" + snapshot.snapshot_id() + "] Attempt 2/3, 2 memories, 1 constraints");
}

// ── for_retry ────────────────────────────────────────────────────

TEST_CASE("StateSnapshot: for_retry increments attempt and copies fields", "[state_snapshot]") {
    SnapshotFixture f;
    auto original = f.builder()
        .with_context(f.context)
        .with_constraints(f.constraints)
        .with_canonical_facts({"The king is Arthur"})
        .with_episodic_memories({"Player said hello"})
        .with_system_prompt("You are a smith.")
        .with_metadata("scene", "forge")
        .build();

    auto retry = original.for_retry();
    REQUIRE(retry.snapshot_id() != original.snapshot_id());
    REQUIRE(retry.attempt_number() == 1);
    REQUIRE(original.attempt_number() == 0);
    REQUIRE(retry.max_attempts() == original.max_attempts());
    REQUIRE(retry.context() == original.context());
    REQUIRE(retry.constraints() == original.constraints());
    REQUIRE(retry.canonical_facts() == original.canonical_facts());
    REQUIRE(retry.episodic_memories() == original.episodic_memories());
    REQUIRE(retry.system_prompt() == original.system_prompt());
    REQUIRE(retry.metadata() == original.metadata());
}

TEST_CASE("StateSnapshot: for_retry merges additional constraints", "[state_snapshot]") {
    SnapshotFixture f;
    auto original = f.builder().with_constraints(f.constraints).build();

    ConstraintSet extra{
        Constraint::prohibition("no_prices", "Never quote prices", "Do not mention prices."),
        Constraint::requirement("stay_in_character", "duplicate", "ignored"),
    };
    auto retry = original.for_retry(extra);

    REQUIRE(retry.constraints().size() == 2);
    REQUIRE(retry.constraints().all()[0].id == "stay_in_character");
    REQUIRE(retry.constraints().all()[0].description == "Stay in character");
    REQUIRE(retry.constraints().all()[1].id == "no_prices");
    REQUIRE(original.constraints().size() == 1);
}

TEST_CASE("StateSnapshot: chained retries exhaust attempts", "[state_snapshot]") {
    SnapshotFixture f;
    auto snapshot = f.builder().with_max_attempts(3).build();
    int retries = 0;
    while (snapshot.can_retry()) {
        snapshot = snapshot.for_retry();
        retries++;
    }
    REQUIRE(retries == 3);
    REQUIRE(snapshot.attempt_number() == 3);
}
