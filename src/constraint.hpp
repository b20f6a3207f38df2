#pragma once
#include <string>
#include <vector>
#include <initializer_list>
#include <cstddef>

namespace npcmem {

enum class ConstraintType { Prohibition, Requirement, Permission };

enum class ConstraintSeverity { Soft, Hard, Critical };

std::string constraint_type_to_string(ConstraintType type);
std::string constraint_severity_to_string(ConstraintSeverity severity);

// A rule the generated response must honor. `prompt_injection` is the text
// handed to the prompt builder; `validation_patterns` are checked by the
// (external) response validator.
struct Constraint {
    std::string id;
    ConstraintType type = ConstraintType::Prohibition;
    ConstraintSeverity severity = ConstraintSeverity::Hard;
    std::string description;
    std::string prompt_injection;
    std::vector<std::string> validation_patterns;
    std::string source_rule;

    static Constraint prohibition(const std::string& id, const std::string& description,
                                  const std::string& prompt_injection,
                                  std::vector<std::string> patterns = {});
    static Constraint requirement(const std::string& id, const std::string& description,
                                  const std::string& prompt_injection);
    static Constraint permission(const std::string& id, const std::string& description,
                                 const std::string& prompt_injection);

    // "[Prohibition:Hard] description"
    std::string to_string() const;
};

// Ordered collection of constraints, kept in insertion order.
class ConstraintSet {
public:
    ConstraintSet() = default;
    ConstraintSet(std::initializer_list<Constraint> constraints);

    void add(Constraint constraint);
    bool contains(const std::string& id) const;

    // Appends every constraint of `other` whose id is not already present.
    void merge(const ConstraintSet& other);

    const std::vector<Constraint>& all() const { return constraints_; }
    size_t size() const { return constraints_.size(); }
    bool empty() const { return constraints_.empty(); }

    std::vector<Constraint> prohibitions() const { return of_type(ConstraintType::Prohibition); }
    std::vector<Constraint> requirements() const { return of_type(ConstraintType::Requirement); }
    std::vector<Constraint> permissions() const { return of_type(ConstraintType::Permission); }

    bool operator==(const ConstraintSet& other) const;

private:
    std::vector<Constraint> of_type(ConstraintType type) const;

    std::vector<Constraint> constraints_;
};

} // namespace npcmem
