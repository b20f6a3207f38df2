#pragma once
#include <string>
#include <vector>

namespace npcmem {

// How one NPC relates to another entity. Owned by `owner_npc_id`: only that
// NPC may authorize changes to it.
struct RelationshipEntry {
    std::string owner_npc_id;
    std::string target_id;
    std::string relationship_label;
    double affinity = 0.0;      // [-1, 1]
    double trust = 0.5;         // [0, 1]
    double familiarity = 0.0;   // [0, 1]
    std::vector<std::string> history;
    std::vector<std::string> tags;

    static RelationshipEntry create(const std::string& owner, const std::string& target,
                                    const std::string& label = "acquaintance");
    static RelationshipEntry create_friendly(const std::string& owner, const std::string& target,
                                             double affinity = 0.5);
    static RelationshipEntry create_hostile(const std::string& owner, const std::string& target,
                                            double affinity = -0.5);

    RelationshipEntry& with_history(const std::string& entry);
    RelationshipEntry& with_tag(const std::string& tag);

    std::string to_string() const;
};

struct AuthorityCheck {
    bool authorized = false;
    std::string error;
    std::string failed_rule;

    static AuthorityCheck allow() { return AuthorityCheck{true, "", ""}; }
    static AuthorityCheck deny(const std::string& error, const std::string& rule) {
        return AuthorityCheck{false, error, rule};
    }
};

// True when `npc_id` owns the relationship (ASCII case-insensitive).
bool can_modify(const RelationshipEntry& relationship, const std::string& npc_id);

// Required fields present and numeric fields in range.
AuthorityCheck validate_relationship(const RelationshipEntry& relationship);

// Ownership plus field validation for a write by `acting_npc_id`.
AuthorityCheck authorize_relationship_write(const RelationshipEntry& relationship,
                                            const std::string& acting_npc_id);

} // namespace npcmem
