#pragma once
#include "memory_store.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace npcmem {

class EventBus;
class StateSnapshotBuilder;

// Options for ContextRetriever. Limits of 0 mean unlimited. Weights and
// limits are used as given (no normalization); NaN is rejected.
struct ContextRetrievalConfig {
    uint32_t max_canonical_facts = 0;
    uint32_t max_world_state = 0;
    uint32_t max_episodic_memories = 10;
    uint32_t max_beliefs = 10;

    double min_episodic_strength = 0.1;
    double min_belief_confidence = 0.5;
    bool include_contradicted_beliefs = false;

    // Episode score weights
    double relevance_weight = 0.4;
    double recency_weight = 0.4;
    double significance_weight = 0.2;

    // Belief score weights
    double belief_relevance_weight = 0.6;
    double belief_confidence_weight = 0.4;

    double topic_boost = 0.3;
    double relevance_cap = 1.0;
    double contradiction_penalty = DEFAULT_CONTRADICTION_PENALTY;
    uint32_t min_keyword_length = 4;   // shorter query/content words are ignored

    // Throws std::invalid_argument if any real-valued field is NaN.
    void validate() const;
};

struct RetrievedContext {
    std::vector<std::string> canonical_facts;
    std::vector<std::string> world_state;        // "key: value"
    std::vector<std::string> episodic_memories;  // descriptions
    std::vector<std::string> beliefs;            // summaries, "[Uncertain] " when contradicted

    size_t total_count() const {
        return canonical_facts.size() + world_state.size() +
               episodic_memories.size() + beliefs.size();
    }
    bool has_content() const { return total_count() > 0; }

    // Copy the four sections into a snapshot builder.
    StateSnapshotBuilder& apply_to(StateSnapshotBuilder& builder) const;

    bool operator==(const RetrievedContext& other) const {
        return canonical_facts == other.canonical_facts &&
               world_state == other.world_state &&
               episodic_memories == other.episodic_memories &&
               beliefs == other.beliefs;
    }
    bool operator!=(const RetrievedContext& other) const { return !(*this == other); }
};

struct ScoredEpisode {
    EpisodicMemoryEntry entry;
    double relevance = 0.0;
    double score = 0.0;
};

struct ScoredBelief {
    BeliefMemoryEntry entry;
    double relevance = 0.0;
    double score = 0.0;
};

// Ranks the store's contents against a query into a bounded, fully
// deterministic context bundle.
//
// Ordering within a category is score descending, then created_at_ticks
// descending, then id ascending (byte-wise), then sequence_number ascending.
// Scores are compared exactly; ties are left to the secondary keys.
class ContextRetriever {
public:
    explicit ContextRetriever(const MemoryStore& store,
                              ContextRetrievalConfig config = ContextRetrievalConfig{});

    void set_event_bus(EventBus* bus) { bus_ = bus; }
    void set_config(const ContextRetrievalConfig& config);
    const ContextRetrievalConfig& config() const { return config_; }

    // Empty query and empty topics are valid and yield zero relevance.
    RetrievedContext retrieve_context(const std::string& query,
                                      const std::vector<std::string>& topics = {}) const;

    // Filtered, ranked and truncated candidates with their scores.
    std::vector<ScoredEpisode> rank_episodes(const std::string& query,
                                             const std::vector<std::string>& topics = {}) const;
    std::vector<ScoredBelief> rank_beliefs(const std::string& query,
                                           const std::vector<std::string>& topics = {}) const;

    std::vector<std::string> select_canonical_facts(const std::vector<std::string>& topics) const;
    std::vector<std::string> select_world_state(const std::vector<std::string>& topics) const;

    // Keyword overlap of `content` with `query` in [0, 1], plus the topic
    // boost, capped at relevance_cap. Keyword length is counted in code
    // points; case folding covers ASCII and Latin-1 only.
    double relevance(const std::string& content, const std::string& query,
                     const std::vector<std::string>& topics) const;

private:
    std::vector<std::string> keywords(const std::string& text) const;

    const MemoryStore& store_;
    ContextRetrievalConfig config_;
    EventBus* bus_ = nullptr;
};

// True if any non-empty topic occurs in `content` (case-insensitive, see to_lower).
bool matches_any_topic(const std::string& content, const std::vector<std::string>& topics);

} // namespace npcmem
