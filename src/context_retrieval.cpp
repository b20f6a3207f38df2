#include "context_retrieval.hpp"
#include "event_bus.hpp"
#include "state_snapshot.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace npcmem {

static const char* const WORD_DELIMITERS = " \t\r\n.,!?;:";

void ContextRetrievalConfig::validate() const {
    const std::pair<const char*, double> fields[] = {
        {"min_episodic_strength", min_episodic_strength},
        {"min_belief_confidence", min_belief_confidence},
        {"relevance_weight", relevance_weight},
        {"recency_weight", recency_weight},
        {"significance_weight", significance_weight},
        {"belief_relevance_weight", belief_relevance_weight},
        {"belief_confidence_weight", belief_confidence_weight},
        {"topic_boost", topic_boost},
        {"relevance_cap", relevance_cap},
        {"contradiction_penalty", contradiction_penalty},
    };
    for (const auto& [name, value] : fields) {
        if (std::isnan(value)) {
            throw std::invalid_argument(std::string("retrieval config: ") + name + " must not be NaN");
        }
    }
}

StateSnapshotBuilder& RetrievedContext::apply_to(StateSnapshotBuilder& builder) const {
    return builder.with_canonical_facts(canonical_facts)
                  .with_world_state(world_state)
                  .with_episodic_memories(episodic_memories)
                  .with_beliefs(beliefs);
}

bool matches_any_topic(const std::string& content, const std::vector<std::string>& topics) {
    if (content.empty()) return false;
    const std::string lower = to_lower(content);
    for (const auto& topic : topics) {
        if (topic.empty()) continue;
        if (lower.find(to_lower(topic)) != std::string::npos) return true;
    }
    return false;
}

// Strict total order shared by episodes and beliefs.
template <typename Scored>
static bool ranks_before(const Scored& a, const Scored& b) {
    if (a.score != b.score) return a.score > b.score;
    if (a.entry.created_at_ticks != b.entry.created_at_ticks) {
        return a.entry.created_at_ticks > b.entry.created_at_ticks;
    }
    // std::string::compare is byte-wise (unsigned char), independent of locale
    int c = a.entry.id.compare(b.entry.id);
    if (c != 0) return c < 0;
    return a.entry.sequence_number < b.entry.sequence_number;
}

template <typename T>
static void truncate(std::vector<T>& items, uint32_t limit) {
    if (limit > 0 && items.size() > limit) items.resize(limit);
}

// ── ContextRetriever ─────────────────────────────────────────

ContextRetriever::ContextRetriever(const MemoryStore& store, ContextRetrievalConfig config)
    : store_(store) {
    set_config(config);
}

void ContextRetriever::set_config(const ContextRetrievalConfig& config) {
    config.validate();
    config_ = config;
}

std::vector<std::string> ContextRetriever::keywords(const std::string& text) const {
    std::set<std::string> unique;
    for (auto& word : split_any(to_lower(text), WORD_DELIMITERS)) {
        if (utf8_length(word) >= config_.min_keyword_length) unique.insert(std::move(word));
    }
    return std::vector<std::string>(unique.begin(), unique.end());
}

double ContextRetriever::relevance(const std::string& content, const std::string& query,
                                   const std::vector<std::string>& topics) const {
    if (content.empty()) return 0.0;

    double score = 0.0;
    auto query_words = keywords(query);
    if (!query_words.empty()) {
        auto content_words = keywords(content);
        std::vector<std::string> overlap;
        std::set_intersection(query_words.begin(), query_words.end(),
                              content_words.begin(), content_words.end(),
                              std::back_inserter(overlap));
        score = static_cast<double>(overlap.size()) / static_cast<double>(query_words.size());
    }

    if (matches_any_topic(content, topics)) {
        score = std::min(config_.relevance_cap, score + config_.topic_boost);
    }
    return score;
}

std::vector<ScoredEpisode> ContextRetriever::rank_episodes(
    const std::string& query, const std::vector<std::string>& topics) const {
    std::vector<ScoredEpisode> ranked;
    for (auto& memory : store_.get_all_episodic_memories()) {
        if (memory.strength < config_.min_episodic_strength) continue;

        ScoredEpisode scored;
        scored.relevance = relevance(memory.description, query, topics);
        scored.score = config_.relevance_weight * scored.relevance +
                       config_.recency_weight * memory.strength +
                       config_.significance_weight * memory.significance;
        scored.entry = std::move(memory);
        ranked.push_back(std::move(scored));
    }

    std::stable_sort(ranked.begin(), ranked.end(), ranks_before<ScoredEpisode>);
    truncate(ranked, config_.max_episodic_memories);
    return ranked;
}

std::vector<ScoredBelief> ContextRetriever::rank_beliefs(
    const std::string& query, const std::vector<std::string>& topics) const {
    std::vector<ScoredBelief> ranked;
    for (auto& belief : store_.get_all_beliefs()) {
        // Contradicted beliefs pass on stored confidence, then rank at their
        // penalized effective confidence.
        if (belief.is_contradicted && !config_.include_contradicted_beliefs) continue;
        if (belief.confidence < config_.min_belief_confidence) continue;

        ScoredBelief scored;
        scored.relevance = relevance(belief.content, query, topics);
        scored.score = config_.belief_relevance_weight * scored.relevance +
                       config_.belief_confidence_weight *
                           belief.effective_confidence(config_.contradiction_penalty);
        scored.entry = std::move(belief);
        ranked.push_back(std::move(scored));
    }

    std::stable_sort(ranked.begin(), ranked.end(), ranks_before<ScoredBelief>);
    truncate(ranked, config_.max_beliefs);
    return ranked;
}

std::vector<std::string> ContextRetriever::select_canonical_facts(
    const std::vector<std::string>& topics) const {
    std::vector<std::string> result;
    // Candidates arrive in sequence (insertion) order
    for (const auto& fact : store_.get_canonical_facts()) {
        if (!topics.empty()) {
            bool domain_match = !fact.domain.empty() &&
                std::any_of(topics.begin(), topics.end(), [&fact](const std::string& t) {
                    return equals_ignore_case(t, fact.domain);
                });
            if (!domain_match && !matches_any_topic(fact.content, topics)) continue;
        }
        result.push_back(fact.content);
    }
    truncate(result, config_.max_canonical_facts);
    return result;
}

std::vector<std::string> ContextRetriever::select_world_state(
    const std::vector<std::string>& topics) const {
    std::vector<std::string> result;
    for (const auto& state : store_.get_all_world_state()) {
        std::string content = state.content();
        if (!topics.empty() && !matches_any_topic(content, topics)) continue;
        result.push_back(std::move(content));
    }
    truncate(result, config_.max_world_state);
    return result;
}

RetrievedContext ContextRetriever::retrieve_context(const std::string& query,
                                                    const std::vector<std::string>& topics) const {
    RetrievedContext context;
    context.canonical_facts = select_canonical_facts(topics);
    context.world_state = select_world_state(topics);

    for (const auto& scored : rank_episodes(query, topics)) {
        context.episodic_memories.push_back(scored.entry.description);
    }
    for (const auto& scored : rank_beliefs(query, topics)) {
        const auto& belief = scored.entry;
        std::string summary = belief.summary(config_.contradiction_penalty);
        context.beliefs.push_back(belief.is_contradicted ? "[Uncertain] " + summary : summary);
    }

    if (bus_) {
        ContextRetrievedEvent ev;
        ev.query = query;
        ev.canonical_facts = context.canonical_facts.size();
        ev.world_state = context.world_state.size();
        ev.episodic_memories = context.episodic_memories.size();
        ev.beliefs = context.beliefs.size();
        bus_->publish(ev);
    }
    return context;
}

} // namespace npcmem
