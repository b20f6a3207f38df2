#include "memory_types.hpp"
#include <algorithm>
#include <cmath>

namespace npcmem {

std::string mutation_source_to_string(MutationSource source) {
    switch (source) {
        case MutationSource::LlmSuggestion:   return "llm_suggestion";
        case MutationSource::ValidatedOutput: return "validated_output";
        case MutationSource::GameSystem:      return "game_system";
        case MutationSource::Designer:        return "designer";
    }
    return "validated_output";
}

MutationSource mutation_source_from_string(const std::string& s) {
    if (s == "llm_suggestion") return MutationSource::LlmSuggestion;
    if (s == "game_system")    return MutationSource::GameSystem;
    if (s == "designer")       return MutationSource::Designer;
    return MutationSource::ValidatedOutput;
}

std::string episode_type_to_string(EpisodeType type) {
    switch (type) {
        case EpisodeType::Dialogue:    return "dialogue";
        case EpisodeType::Observation: return "observation";
        case EpisodeType::Thought:     return "thought";
        case EpisodeType::Event:       return "event";
        case EpisodeType::LearnedInfo: return "learned_info";
    }
    return "dialogue";
}

EpisodeType episode_type_from_string(const std::string& s) {
    if (s == "observation")  return EpisodeType::Observation;
    if (s == "thought")      return EpisodeType::Thought;
    if (s == "event")        return EpisodeType::Event;
    if (s == "learned_info") return EpisodeType::LearnedInfo;
    return EpisodeType::Dialogue;
}

std::string belief_type_to_string(BeliefType type) {
    switch (type) {
        case BeliefType::Opinion:      return "opinion";
        case BeliefType::Relationship: return "relationship";
        case BeliefType::Belief:       return "belief";
        case BeliefType::Assumption:   return "assumption";
        case BeliefType::Preference:   return "preference";
    }
    return "opinion";
}

BeliefType belief_type_from_string(const std::string& s) {
    if (s == "relationship") return BeliefType::Relationship;
    if (s == "belief")       return BeliefType::Belief;
    if (s == "assumption")   return BeliefType::Assumption;
    if (s == "preference")   return BeliefType::Preference;
    return BeliefType::Opinion;
}

double checked_range(double value, double lo, double hi, const char* field) {
    if (std::isnan(value)) {
        throw std::invalid_argument(std::string(field) + " must not be NaN");
    }
    return std::clamp(value, lo, hi);
}

// ── EpisodicMemoryEntry ──────────────────────────────────────

EpisodicMemoryEntry EpisodicMemoryEntry::make(const std::string& description,
                                              EpisodeType type, double significance) {
    EpisodicMemoryEntry entry;
    entry.description = description;
    entry.episode_type = type;
    entry.significance = significance;
    return entry;
}

void EpisodicMemoryEntry::reinforce(double amount) {
    double step = checked_range(amount, 0.0, 1.0, "reinforce amount");
    strength = std::min(1.0, strength + step);
}

EpisodicMemoryEntry EpisodicMemoryEntry::from_dialogue(const std::string& speaker,
                                                       const std::string& content,
                                                       double significance) {
    auto entry = make(speaker + ": " + content, EpisodeType::Dialogue, significance);
    entry.participant = speaker;
    return entry;
}

EpisodicMemoryEntry EpisodicMemoryEntry::from_observation(const std::string& observation,
                                                          double significance) {
    return make(observation, EpisodeType::Observation, significance);
}

EpisodicMemoryEntry EpisodicMemoryEntry::from_learned_info(const std::string& info,
                                                           const std::string& source,
                                                           double significance) {
    auto entry = make(info, EpisodeType::LearnedInfo, significance);
    entry.participant = source;
    return entry;
}

// ── BeliefMemoryEntry ────────────────────────────────────────

std::string BeliefMemoryEntry::summary(double penalty) const {
    double level = effective_confidence(penalty);
    const char* prefix;
    if (level >= 0.8)      prefix = "I know that";
    else if (level >= 0.5) prefix = "I believe that";
    else if (level >= 0.3) prefix = "I think that";
    else                        prefix = "I'm not sure, but";
    return std::string(prefix) + " " + content;
}

void BeliefMemoryEntry::mark_contradicted(const std::string& reason) {
    is_contradicted = true;
    contradiction_reason = reason;
    std::string previous = evidence;
    evidence = "[CONTRADICTED] " + reason;
    if (!previous.empty()) evidence += ". Previous: " + previous;
}

void BeliefMemoryEntry::adjust_sentiment(double delta) {
    sentiment = checked_range(sentiment + delta, -1.0, 1.0, "sentiment");
}

BeliefMemoryEntry BeliefMemoryEntry::create_opinion(const std::string& subject,
                                                    const std::string& opinion,
                                                    double sentiment, double confidence) {
    BeliefMemoryEntry entry;
    entry.subject = subject;
    entry.content = opinion;
    entry.belief_type = BeliefType::Opinion;
    entry.sentiment = sentiment;
    entry.confidence = confidence;
    return entry;
}

BeliefMemoryEntry BeliefMemoryEntry::create_belief(const std::string& subject,
                                                   const std::string& belief,
                                                   double confidence,
                                                   const std::string& evidence) {
    BeliefMemoryEntry entry;
    entry.subject = subject;
    entry.content = belief;
    entry.belief_type = BeliefType::Belief;
    entry.confidence = confidence;
    entry.evidence = evidence;
    return entry;
}

BeliefMemoryEntry BeliefMemoryEntry::create_relationship(const std::string& subject,
                                                         const std::string& relationship,
                                                         double sentiment) {
    BeliefMemoryEntry entry;
    entry.subject = subject;
    entry.content = relationship;
    entry.belief_type = BeliefType::Relationship;
    entry.sentiment = sentiment;
    entry.confidence = 0.7;
    return entry;
}

} // namespace npcmem
