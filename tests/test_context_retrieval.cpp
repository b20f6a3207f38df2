#include <catch2/catch.hpp>
#include "context_retrieval.hpp"
#include "event_bus.hpp"
#include "state_snapshot.hpp"
#include <limits>

using namespace npcmem;

namespace {

struct RetrievalFixture {
    FixedClock clock{1000};
    SequentialIdGenerator ids;
    MemoryStore store{clock, ids};

    void episode(const std::string& description, double significance = 0.5,
                 double strength = 1.0) {
        auto entry = EpisodicMemoryEntry::make(description, EpisodeType::Event, significance);
        entry.strength = strength;
        store.add_episodic_memory(entry, MutationSource::ValidatedOutput);
    }

    void belief(const std::string& id, const std::string& content, double confidence) {
        store.set_belief(id, BeliefMemoryEntry::create_belief("npc", content, confidence),
                         MutationSource::ValidatedOutput);
    }
};

} // namespace

// ── Relevance ────────────────────────────────────────────────────

TEST_CASE("ContextRetriever: relevance is keyword overlap ratio", "[retrieval]") {
    MemoryStore store;
    ContextRetriever retriever(store);

    // query keywords: dragon, castle (>= 4 chars)
    REQUIRE(retriever.relevance("The dragon attacked", "dragon castle", {}) == 0.5);
    REQUIRE(retriever.relevance("DRAGON near the Castle!", "dragon castle", {}) == 1.0);
    REQUIRE(retriever.relevance("A quiet morning", "dragon castle", {}) == 0.0);
}

TEST_CASE("ContextRetriever: short words and empty query score zero", "[retrieval]") {
    MemoryStore store;
    ContextRetriever retriever(store);

    REQUIRE(retriever.relevance("the cat sat", "the cat", {}) == 0.0);
    REQUIRE(retriever.relevance("anything here", "", {}) == 0.0);
    REQUIRE(retriever.relevance("", "dragon", {"dragon"}) == 0.0);
}

TEST_CASE("ContextRetriever: keyword length counts characters, not bytes", "[retrieval]") {
    MemoryStore store;
    ContextRetriever retriever(store);

    // "f\xC3\xBCr" is three characters in four bytes
    REQUIRE(retriever.relevance("F\xC3\xBCr den K\xC3\xB6nig", "f\xC3\xBCr", {}) == 0.0);
    REQUIRE(retriever.relevance("F\xC3\xBCr den K\xC3\xB6nig", "f\xC3\xBCr k\xC3\xB6nig", {}) == 1.0);
}

TEST_CASE("ContextRetriever: Latin-1 letters match case-insensitively", "[retrieval]") {
    MemoryStore store;
    ContextRetriever retriever(store);

    REQUIRE(retriever.relevance("F\xC3\xBCr den K\xC3\xB6nig", "K\xC3\x96NIG", {}) == 1.0);
    REQUIRE(retriever.relevance("F\xC3\xBCr den K\xC3\xB6nig", "", {"K\xC3\x96NIG"}) == 0.3);
}

TEST_CASE("ContextRetriever: topic boost is added and capped", "[retrieval]") {
    MemoryStore store;
    ContextRetriever retriever(store);

    REQUIRE(retriever.relevance("The dragon attacked", "", {"DRAGON"}) == 0.3);
    REQUIRE(retriever.relevance("The dragon near the castle", "dragon castle", {"dragon"}) == 1.0);

    ContextRetrievalConfig cfg;
    cfg.topic_boost = 0.5;
    cfg.relevance_cap = 0.6;
    retriever.set_config(cfg);
    REQUIRE(retriever.relevance("The dragon attacked", "dragon castle", {"dragon"}) == 0.6);
}

TEST_CASE("matches_any_topic: empty topics never match", "[retrieval]") {
    REQUIRE(matches_any_topic("Door: open", {"", "door"}));
    REQUIRE_FALSE(matches_any_topic("Door: open", {""}));
    REQUIRE_FALSE(matches_any_topic("Door: open", {}));
}

// ── Episodes ─────────────────────────────────────────────────────

TEST_CASE("ContextRetriever: episode score combines weights", "[retrieval]") {
    RetrievalFixture f;
    f.episode("The dragon attacked", 0.5, 1.0);

    ContextRetriever retriever(f.store);
    auto ranked = retriever.rank_episodes("dragon castle");
    REQUIRE(ranked.size() == 1);
    REQUIRE(ranked[0].relevance == 0.5);
    REQUIRE(ranked[0].score == 0.4 * 0.5 + 0.4 * 1.0 + 0.2 * 0.5);
}

TEST_CASE("ContextRetriever: relevant episodes rank first", "[retrieval]") {
    RetrievalFixture f;
    f.episode("Bought bread at the market");
    f.episode("The dragon burned the farm");
    f.episode("Discussed the weather");

    ContextRetriever retriever(f.store);
    auto ctx = retriever.retrieve_context("Tell me about the dragon");
    REQUIRE(ctx.episodic_memories.size() == 3);
    REQUIRE(ctx.episodic_memories[0] == "The dragon burned the farm");
}

TEST_CASE("ContextRetriever: weak episodes are filtered, never deleted", "[retrieval]") {
    RetrievalFixture f;
    f.episode("strong", 0.5, 1.0);
    f.episode("weak", 0.5, 0.05);
    f.episode("boundary", 0.5, 0.1);

    ContextRetriever retriever(f.store);
    auto ctx = retriever.retrieve_context("");
    REQUIRE(ctx.episodic_memories.size() == 2);
    REQUIRE(ctx.episodic_memories[0] == "strong");
    REQUIRE(ctx.episodic_memories[1] == "boundary");
    REQUIRE(f.store.get_all_episodic_memories().size() == 3);
}

TEST_CASE("ContextRetriever: episode limit truncates after sorting", "[retrieval]") {
    RetrievalFixture f;
    for (int i = 0; i < 5; i++) {
        f.episode("low " + std::to_string(i), 0.1);
    }
    f.episode("high", 0.9);

    ContextRetrievalConfig cfg;
    cfg.max_episodic_memories = 2;
    ContextRetriever retriever(f.store, cfg);

    auto ctx = retriever.retrieve_context("");
    REQUIRE(ctx.episodic_memories.size() == 2);
    REQUIRE(ctx.episodic_memories[0] == "high");
    REQUIRE(ctx.episodic_memories[1] == "low 0");
}

TEST_CASE("ContextRetriever: zero limit means unlimited", "[retrieval]") {
    RetrievalFixture f;
    for (int i = 0; i < 15; i++) f.episode("episode " + std::to_string(i));

    ContextRetrievalConfig cfg;
    cfg.max_episodic_memories = 0;
    ContextRetriever retriever(f.store, cfg);
    REQUIRE(retriever.retrieve_context("").episodic_memories.size() == 15);

    cfg.max_episodic_memories = 10;
    retriever.set_config(cfg);
    REQUIRE(retriever.retrieve_context("").episodic_memories.size() == 10);
}

// ── Beliefs ──────────────────────────────────────────────────────

TEST_CASE("ContextRetriever: belief confidence threshold is inclusive", "[retrieval]") {
    RetrievalFixture f;
    f.belief("at", "the miller is honest", 0.5);
    f.belief("below", "the baker is honest", 0.49);

    ContextRetriever retriever(f.store);
    auto ctx = retriever.retrieve_context("");
    REQUIRE(ctx.beliefs == std::vector<std::string>{"I believe that the miller is honest"});
}

TEST_CASE("ContextRetriever: contradicted beliefs excluded by default", "[retrieval]") {
    RetrievalFixture f;
    f.belief("b1", "the bridge is safe", 0.9);
    f.store.get_belief("b1")->mark_contradicted("the bridge collapsed");

    ContextRetriever retriever(f.store);
    REQUIRE(retriever.retrieve_context("").beliefs.empty());

    ContextRetrievalConfig cfg;
    cfg.include_contradicted_beliefs = true;
    retriever.set_config(cfg);
    auto ctx = retriever.retrieve_context("");
    REQUIRE(ctx.beliefs == std::vector<std::string>{"[Uncertain] I think that the bridge is safe"});
}

TEST_CASE("ContextRetriever: contradicted belief hedge follows the penalty", "[retrieval]") {
    RetrievalFixture f;
    f.belief("b1", "the tower is empty", 0.9);
    f.store.get_belief("b1")->mark_contradicted("footsteps upstairs");

    ContextRetrievalConfig cfg;
    cfg.include_contradicted_beliefs = true;
    cfg.contradiction_penalty = 0.2;
    ContextRetriever retriever(f.store, cfg);
    REQUIRE(retriever.retrieve_context("").beliefs ==
            std::vector<std::string>{"[Uncertain] I'm not sure, but the tower is empty"});

    cfg.contradiction_penalty = 1.0;
    retriever.set_config(cfg);
    REQUIRE(retriever.retrieve_context("").beliefs ==
            std::vector<std::string>{"[Uncertain] I know that the tower is empty"});
}

TEST_CASE("ContextRetriever: belief score uses effective confidence", "[retrieval]") {
    RetrievalFixture f;
    f.belief("b1", "the bridge is safe", 0.9);
    f.store.get_belief("b1")->mark_contradicted("collapsed");

    ContextRetrievalConfig cfg;
    cfg.include_contradicted_beliefs = true;
    cfg.contradiction_penalty = 0.25;
    ContextRetriever retriever(f.store, cfg);

    auto ranked = retriever.rank_beliefs("");
    REQUIRE(ranked.size() == 1);
    REQUIRE(ranked[0].score == 0.4 * (0.9 * 0.25));
    REQUIRE(f.store.find_belief("b1")->confidence == 0.9);
}

// ── Facts and world state ────────────────────────────────────────

TEST_CASE("ContextRetriever: facts in insertion order, filtered by topic", "[retrieval]") {
    RetrievalFixture f;
    f.store.add_canonical_fact("z", "The king is Arthur", "royalty");
    f.store.add_canonical_fact("a", "The river flows north", "geography");
    f.store.add_canonical_fact("m", "Dragons fear the king", "lore");

    ContextRetriever retriever(f.store);
    auto all = retriever.retrieve_context("");
    REQUIRE(all.canonical_facts == std::vector<std::string>{
        "The king is Arthur", "The river flows north", "Dragons fear the king"});

    auto king = retriever.retrieve_context("", {"KING"});
    REQUIRE(king.canonical_facts == std::vector<std::string>{
        "The king is Arthur", "Dragons fear the king"});

    auto geo = retriever.retrieve_context("", {"Geography"});
    REQUIRE(geo.canonical_facts == std::vector<std::string>{"The river flows north"});
}

TEST_CASE("ContextRetriever: fact and state limits", "[retrieval]") {
    RetrievalFixture f;
    f.store.add_canonical_fact("a", "one");
    f.store.add_canonical_fact("b", "two");
    f.store.set_world_state("x", "1", MutationSource::GameSystem);
    f.store.set_world_state("y", "2", MutationSource::GameSystem);

    ContextRetrievalConfig cfg;
    cfg.max_canonical_facts = 1;
    cfg.max_world_state = 1;
    ContextRetriever retriever(f.store, cfg);

    auto ctx = retriever.retrieve_context("");
    REQUIRE(ctx.canonical_facts == std::vector<std::string>{"one"});
    REQUIRE(ctx.world_state == std::vector<std::string>{"x: 1"});
}

TEST_CASE("ContextRetriever: world state formatted as key: value", "[retrieval]") {
    RetrievalFixture f;
    f.store.set_world_state("Weather", "rainy", MutationSource::GameSystem);
    f.store.set_world_state("Door", "open", MutationSource::GameSystem);

    ContextRetriever retriever(f.store);
    auto ctx = retriever.retrieve_context("");
    REQUIRE(ctx.world_state == std::vector<std::string>{"Weather: rainy", "Door: open"});
}

// ── Empty world ──────────────────────────────────────────────────

TEST_CASE("ContextRetriever: empty store yields empty context", "[retrieval]") {
    MemoryStore store;
    ContextRetriever retriever(store);
    auto ctx = retriever.retrieve_context("", {});
    REQUIRE(ctx.total_count() == 0);
    REQUIRE_FALSE(ctx.has_content());
}

TEST_CASE("ContextRetrievalConfig: NaN weights are rejected", "[retrieval]") {
    MemoryStore store;
    ContextRetrievalConfig cfg;
    cfg.recency_weight = std::numeric_limits<double>::quiet_NaN();
    REQUIRE_THROWS_AS(ContextRetriever(store, cfg), std::invalid_argument);

    ContextRetriever retriever(store);
    REQUIRE_THROWS_AS(retriever.set_config(cfg), std::invalid_argument);
    REQUIRE(retriever.config().recency_weight == 0.4);
}

TEST_CASE("ContextRetrievalConfig: negative weights are used as-is", "[retrieval]") {
    RetrievalFixture f;
    f.episode("important", 0.9);
    f.episode("trivial", 0.1);

    ContextRetrievalConfig cfg;
    cfg.relevance_weight = 0.0;
    cfg.recency_weight = 0.0;
    cfg.significance_weight = -1.0;
    ContextRetriever retriever(f.store, cfg);

    auto ctx = retriever.retrieve_context("");
    REQUIRE(ctx.episodic_memories == std::vector<std::string>{"trivial", "important"});
}

// ── Snapshot folding and events ──────────────────────────────────

TEST_CASE("RetrievedContext: apply_to fills a snapshot builder", "[retrieval]") {
    RetrievalFixture f;
    f.store.add_canonical_fact("king", "The king is Arthur");
    f.store.set_world_state("door", "open", MutationSource::GameSystem);
    f.episode("The dragon attacked");
    f.belief("b1", "the dragon is hungry", 0.6);

    ContextRetriever retriever(f.store);
    auto ctx = retriever.retrieve_context("dragon");

    StateSnapshotBuilder builder(f.clock);
    auto snapshot = ctx.apply_to(builder).with_player_input("What happened?").build();

    REQUIRE(snapshot.canonical_facts() == ctx.canonical_facts);
    REQUIRE(snapshot.world_state() == std::vector<std::string>{"door: open"});
    REQUIRE(snapshot.episodic_memories() == ctx.episodic_memories);
    REQUIRE(snapshot.beliefs() == std::vector<std::string>{"I believe that the dragon is hungry"});
    REQUIRE(snapshot.total_memory_count() == 4);
    REQUIRE(snapshot.player_input() == "What happened?");
}

TEST_CASE("ContextRetriever: publishes ContextRetrieved", "[retrieval]") {
    RetrievalFixture f;
    f.store.add_canonical_fact("king", "The king is Arthur");
    f.episode("The dragon attacked");

    EventBus bus;
    ContextRetriever retriever(f.store);
    retriever.set_event_bus(&bus);

    ContextRetrievedEvent captured;
    int calls = 0;
    subscribe<ContextRetrievedEvent>(bus, [&](const ContextRetrievedEvent& ev) {
        captured = ev;
        calls++;
    });

    retriever.retrieve_context("dragon");
    REQUIRE(calls == 1);
    REQUIRE(captured.query == "dragon");
    REQUIRE(captured.canonical_facts == 1);
    REQUIRE(captured.episodic_memories == 1);
    REQUIRE(captured.beliefs == 0);
}
