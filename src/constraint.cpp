#include "constraint.hpp"
#include <algorithm>
#include <utility>

namespace npcmem {

std::string constraint_type_to_string(ConstraintType type) {
    switch (type) {
        case ConstraintType::Prohibition: return "Prohibition";
        case ConstraintType::Requirement: return "Requirement";
        case ConstraintType::Permission:  return "Permission";
    }
    return "Prohibition";
}

std::string constraint_severity_to_string(ConstraintSeverity severity) {
    switch (severity) {
        case ConstraintSeverity::Soft:     return "Soft";
        case ConstraintSeverity::Hard:     return "Hard";
        case ConstraintSeverity::Critical: return "Critical";
    }
    return "Hard";
}

Constraint Constraint::prohibition(const std::string& id, const std::string& description,
                                   const std::string& prompt_injection,
                                   std::vector<std::string> patterns) {
    Constraint c;
    c.id = id;
    c.type = ConstraintType::Prohibition;
    c.description = description;
    c.prompt_injection = prompt_injection;
    c.validation_patterns = std::move(patterns);
    return c;
}

Constraint Constraint::requirement(const std::string& id, const std::string& description,
                                   const std::string& prompt_injection) {
    Constraint c;
    c.id = id;
    c.type = ConstraintType::Requirement;
    c.description = description;
    c.prompt_injection = prompt_injection;
    return c;
}

Constraint Constraint::permission(const std::string& id, const std::string& description,
                                  const std::string& prompt_injection) {
    Constraint c;
    c.id = id;
    c.type = ConstraintType::Permission;
    c.description = description;
    c.prompt_injection = prompt_injection;
    return c;
}

std::string Constraint::to_string() const {
    return "[" + constraint_type_to_string(type) + ":" +
           constraint_severity_to_string(severity) + "] " + description;
}

static bool same_constraint(const Constraint& a, const Constraint& b) {
    return a.id == b.id && a.type == b.type && a.severity == b.severity &&
           a.description == b.description && a.prompt_injection == b.prompt_injection &&
           a.validation_patterns == b.validation_patterns && a.source_rule == b.source_rule;
}

ConstraintSet::ConstraintSet(std::initializer_list<Constraint> constraints) {
    for (const auto& c : constraints) add(c);
}

void ConstraintSet::add(Constraint constraint) {
    constraints_.push_back(std::move(constraint));
}

bool ConstraintSet::contains(const std::string& id) const {
    return std::any_of(constraints_.begin(), constraints_.end(),
                       [&id](const Constraint& c) { return c.id == id; });
}

void ConstraintSet::merge(const ConstraintSet& other) {
    for (const auto& c : other.constraints_) {
        // Constraints without an id are never considered duplicates
        if (!c.id.empty() && contains(c.id)) continue;
        constraints_.push_back(c);
    }
}

std::vector<Constraint> ConstraintSet::of_type(ConstraintType type) const {
    std::vector<Constraint> result;
    for (const auto& c : constraints_) {
        if (c.type == type) result.push_back(c);
    }
    return result;
}

bool ConstraintSet::operator==(const ConstraintSet& other) const {
    return std::equal(constraints_.begin(), constraints_.end(),
                      other.constraints_.begin(), other.constraints_.end(),
                      same_constraint);
}

} // namespace npcmem
