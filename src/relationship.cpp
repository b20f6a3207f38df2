#include "relationship.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace npcmem {

RelationshipEntry RelationshipEntry::create(const std::string& owner, const std::string& target,
                                            const std::string& label) {
    RelationshipEntry entry;
    entry.owner_npc_id = owner;
    entry.target_id = target;
    entry.relationship_label = label;
    return entry;
}

RelationshipEntry RelationshipEntry::create_friendly(const std::string& owner,
                                                     const std::string& target,
                                                     double affinity) {
    auto entry = create(owner, target, "friend");
    entry.affinity = affinity;
    entry.trust = 0.6;
    entry.familiarity = 0.4;
    return entry;
}

RelationshipEntry RelationshipEntry::create_hostile(const std::string& owner,
                                                    const std::string& target,
                                                    double affinity) {
    auto entry = create(owner, target, "rival");
    entry.affinity = affinity;
    entry.trust = 0.1;
    entry.familiarity = 0.2;
    return entry;
}

RelationshipEntry& RelationshipEntry::with_history(const std::string& entry) {
    history.push_back(entry);
    return *this;
}

RelationshipEntry& RelationshipEntry::with_tag(const std::string& tag) {
    if (std::find(tags.begin(), tags.end(), tag) == tags.end()) {
        tags.push_back(tag);
    }
    return *this;
}

std::string RelationshipEntry::to_string() const {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "Affinity=%.2f, Trust=%.2f, Familiarity=%.2f",
                  affinity, trust, familiarity);
    return "Relationship[" + owner_npc_id + " -> " + target_id + "] Type=" +
           relationship_label + ", " + buf;
}

bool can_modify(const RelationshipEntry& relationship, const std::string& npc_id) {
    if (npc_id.empty()) return false;
    return equals_ignore_case(relationship.owner_npc_id, npc_id);
}

static bool in_range(double v, double lo, double hi) {
    return !std::isnan(v) && v >= lo && v <= hi;
}

AuthorityCheck validate_relationship(const RelationshipEntry& relationship) {
    if (trim(relationship.owner_npc_id).empty())
        return AuthorityCheck::deny("owner_npc_id is required", "owner_npc_id");
    if (trim(relationship.target_id).empty())
        return AuthorityCheck::deny("target_id is required", "target_id");
    if (trim(relationship.relationship_label).empty())
        return AuthorityCheck::deny("relationship_label is required", "relationship_label");
    if (!in_range(relationship.affinity, -1.0, 1.0))
        return AuthorityCheck::deny("affinity must be between -1 and 1", "affinity");
    if (!in_range(relationship.trust, 0.0, 1.0))
        return AuthorityCheck::deny("trust must be between 0 and 1", "trust");
    if (!in_range(relationship.familiarity, 0.0, 1.0))
        return AuthorityCheck::deny("familiarity must be between 0 and 1", "familiarity");
    return AuthorityCheck::allow();
}

AuthorityCheck authorize_relationship_write(const RelationshipEntry& relationship,
                                            const std::string& acting_npc_id) {
    if (!can_modify(relationship, acting_npc_id)) {
        return AuthorityCheck::deny("NPC '" + acting_npc_id +
                                    "' cannot modify relationship owned by '" +
                                    relationship.owner_npc_id + "'",
                                    "owner_check");
    }
    return validate_relationship(relationship);
}

} // namespace npcmem
