#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>

namespace npcmem {

constexpr double DEFAULT_CONTRADICTION_PENALTY = 0.5;

// Episodes at or below this strength are considered faded.
constexpr double ACTIVE_STRENGTH_THRESHOLD = 0.1;

constexpr double DEFAULT_REINFORCE_AMOUNT = 0.2;

// Who is asking for a mutation. Higher value = more authority.
enum class MutationSource {
    LlmSuggestion = 25,
    ValidatedOutput = 50,
    GameSystem = 75,
    Designer = 100
};

// Authority level of each memory category. A source may mutate a category
// when its level is >= the category's level.
enum class MemoryAuthority {
    Belief = 25,
    Episodic = 50,
    WorldState = 75,
    Canonical = 100
};

enum class EpisodeType { Dialogue, Observation, Thought, Event, LearnedInfo };

enum class BeliefType { Opinion, Relationship, Belief, Assumption, Preference };

std::string mutation_source_to_string(MutationSource source);
MutationSource mutation_source_from_string(const std::string& s);
std::string episode_type_to_string(EpisodeType type);
EpisodeType episode_type_from_string(const std::string& s);
std::string belief_type_to_string(BeliefType type);
BeliefType belief_type_from_string(const std::string& s);

// Outcome of an authority-checked mutation.
struct MutationResult {
    bool success = false;
    std::string failure_reason;

    static MutationResult ok() { return MutationResult{true, ""}; }
    static MutationResult failed(const std::string& reason) { return MutationResult{false, reason}; }
};

// Thrown when a mutation would insert an entry whose id already exists.
class DuplicateIdError : public std::runtime_error {
public:
    DuplicateIdError(const std::string& kind, const std::string& id)
        : std::runtime_error(kind + " '" + id + "' already exists"), id_(id) {}

    const std::string& id() const { return id_; }

private:
    std::string id_;
};

// Reject NaN, clamp finite values into [lo, hi].
double checked_range(double value, double lo, double hi, const char* field);

struct CanonicalFact {
    std::string id;
    std::string content;
    std::string domain;
    int64_t created_at_ticks = 0;
    int64_t sequence_number = 0;
    MutationSource source = MutationSource::Designer;
};

struct WorldStateEntry {
    std::string id;
    std::string key;    // original spelling of the first writer
    std::string value;
    MutationSource source = MutationSource::GameSystem;  // last mutation source
    int64_t created_at_ticks = 0;
    int64_t modified_at_ticks = 0;
    uint32_t modification_count = 0;
    int64_t sequence_number = 0;

    std::string content() const { return key + ": " + value; }
};

struct EpisodicMemoryEntry {
    std::string id;
    std::string description;
    EpisodeType episode_type = EpisodeType::Dialogue;
    std::string participant;
    double significance = 0.5;
    double strength = 1.0;
    int64_t created_at_ticks = 0;   // 0 = stamp from the store clock
    int64_t sequence_number = 0;
    MutationSource source = MutationSource::ValidatedOutput;

    bool is_active() const { return strength > ACTIVE_STRENGTH_THRESHOLD; }

    // Raise strength by `amount` (clamped to [0, 1]), capped at 1.0.
    // Throws std::invalid_argument on NaN.
    void reinforce(double amount = DEFAULT_REINFORCE_AMOUNT);

    static EpisodicMemoryEntry make(const std::string& description,
                                    EpisodeType type = EpisodeType::Dialogue,
                                    double significance = 0.5);
    static EpisodicMemoryEntry from_dialogue(const std::string& speaker,
                                             const std::string& content,
                                             double significance = 0.5);
    static EpisodicMemoryEntry from_observation(const std::string& observation,
                                                double significance = 0.3);
    static EpisodicMemoryEntry from_learned_info(const std::string& info,
                                                 const std::string& source = "",
                                                 double significance = 0.6);
};

struct BeliefMemoryEntry {
    std::string id;
    std::string subject;
    std::string content;
    BeliefType belief_type = BeliefType::Opinion;
    double sentiment = 0.0;     // [-1, 1]
    double confidence = 0.5;    // [0, 1], never lowered by contradiction
    bool is_contradicted = false;
    std::string contradiction_reason;
    std::string evidence;
    int64_t created_at_ticks = 0;
    int64_t sequence_number = 0;
    MutationSource source = MutationSource::ValidatedOutput;

    // Confidence as seen by ranking: stored confidence times the penalty
    // when contradicted.
    double effective_confidence(double penalty = DEFAULT_CONTRADICTION_PENALTY) const {
        return is_contradicted ? confidence * penalty : confidence;
    }

    // Content with a hedge picked from the effective confidence,
    // e.g. "I believe that the mayor is corrupt".
    std::string summary(double penalty = DEFAULT_CONTRADICTION_PENALTY) const;

    void mark_contradicted(const std::string& reason);
    void adjust_sentiment(double delta);

    static BeliefMemoryEntry create_opinion(const std::string& subject,
                                            const std::string& opinion,
                                            double sentiment = 0.0,
                                            double confidence = 0.5);
    static BeliefMemoryEntry create_belief(const std::string& subject,
                                           const std::string& belief,
                                           double confidence = 0.5,
                                           const std::string& evidence = "");
    static BeliefMemoryEntry create_relationship(const std::string& subject,
                                                 const std::string& relationship,
                                                 double sentiment = 0.0);
};

} // namespace npcmem
