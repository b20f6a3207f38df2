#include <catch2/catch.hpp>
#include "memory/state_hash.hpp"
#include "memory/snapshot_io.hpp"
#include "memory_store.hpp"
#include "clock.hpp"
#include <cctype>

using namespace npcmem;

namespace {

struct HashFixture {
    FixedClock clock{5000, 1};
    SequentialIdGenerator ids;
    MemoryStore store{clock, ids};

    HashFixture() {
        store.add_canonical_fact("king", "The king is Arthur", "royalty");
        store.set_world_state("weather", "rain", MutationSource::GameSystem);
        store.add_dialogue("Player", "Asked about the weather", 0.4);
        store.set_belief("b1", BeliefMemoryEntry::create_belief("weather", "the rain will stop", 0.6),
                         MutationSource::ValidatedOutput);
    }
};

} // namespace

TEST_CASE("state_hash: 64 lowercase hex characters", "[state_hash]") {
    HashFixture f;
    auto hash = compute_state_hash(f.store);
    REQUIRE(hash.size() == 64);
    for (char c : hash) {
        REQUIRE((std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'f')));
    }
}

TEST_CASE("state_hash: stable across calls and snapshot round-trip", "[state_hash]") {
    HashFixture f;
    auto hash = compute_state_hash(f.store);
    REQUIRE(compute_state_hash(f.store) == hash);

    FixedClock other_clock{99};
    SequentialIdGenerator other_ids;
    MemoryStore copy(other_clock, other_ids);
    snapshot_import(copy, snapshot_export(f.store));
    REQUIRE(canonical_state_dump(copy) == canonical_state_dump(f.store));
    REQUIRE(compute_state_hash(copy) == hash);
}

TEST_CASE("state_hash: changes after a mutation", "[state_hash]") {
    HashFixture f;
    auto before = compute_state_hash(f.store);

    SECTION("world state") {
        f.store.set_world_state("weather", "sun", MutationSource::GameSystem);
        REQUIRE(compute_state_hash(f.store) != before);
    }
    SECTION("decay") {
        f.store.apply_episodic_decay();
        REQUIRE(compute_state_hash(f.store) != before);
    }
    SECTION("contradiction") {
        f.store.get_belief("b1")->mark_contradicted("It kept raining");
        REQUIRE(compute_state_hash(f.store) != before);
    }
}

TEST_CASE("state_hash: rejected mutation leaves hash unchanged", "[state_hash]") {
    HashFixture f;
    auto before = compute_state_hash(f.store);
    REQUIRE_FALSE(f.store.set_world_state("weather", "sun", MutationSource::LlmSuggestion).success);
    REQUIRE(compute_state_hash(f.store) == before);
}

TEST_CASE("state_hash: empty store dumps only the sequence counter", "[state_hash]") {
    FixedClock clock{0};
    SequentialIdGenerator ids;
    MemoryStore store(clock, ids);
    REQUIRE(canonical_state_dump(store) == "next_sequence\x1f" "1\n");
}

TEST_CASE("state_hash: sequence counter is part of the state", "[state_hash]") {
    FixedClock clock{0};
    SequentialIdGenerator ids;
    MemoryStore removed(clock, ids);
    removed.add_canonical_fact("king", "The king is Arthur");
    removed.add_canonical_fact("queen", "The queen is Guinevere");
    REQUIRE(removed.remove_canonical_fact("queen"));

    MemoryStore plain(clock, ids);
    plain.add_canonical_fact("king", "The king is Arthur");

    REQUIRE(removed.next_sequence_number() == 3);
    REQUIRE(plain.next_sequence_number() == 2);
    REQUIRE(compute_state_hash(removed) != compute_state_hash(plain));

    plain.set_next_sequence_number(3);
    REQUIRE(compute_state_hash(removed) == compute_state_hash(plain));
}
