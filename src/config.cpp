#include "config.hpp"
#include "util.hpp"

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace npcmem {

nlohmann::json Config::defaults_json() {
    return {
        {"retrieval", {
            {"max_canonical_facts", 0},
            {"max_world_state", 0},
            {"max_episodic_memories", 10},
            {"max_beliefs", 10},
            {"min_episodic_strength", 0.1},
            {"min_belief_confidence", 0.5},
            {"include_contradicted_beliefs", false},
            {"relevance_weight", 0.4},
            {"recency_weight", 0.4},
            {"significance_weight", 0.2},
            {"belief_relevance_weight", 0.6},
            {"belief_confidence_weight", 0.4},
            {"topic_boost", 0.3},
            {"relevance_cap", 1.0},
            {"contradiction_penalty", DEFAULT_CONTRADICTION_PENALTY},
            {"min_keyword_length", 4}
        }},
        {"store", {
            {"episodic_decay_rate", 0.05},
            {"max_episodic_memories", 0}
        }}
    };
}

nlohmann::json merge_defaults(const nlohmann::json& existing, const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_uint(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_unsigned())
        out = obj[key].get<uint32_t>();
}

static void read_double(const nlohmann::json& obj, const char* key, double& out) {
    if (obj.contains(key) && obj[key].is_number())
        out = obj[key].get<double>();
}

static void read_bool(const nlohmann::json& obj, const char* key, bool& out) {
    if (obj.contains(key) && obj[key].is_boolean())
        out = obj[key].get<bool>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("retrieval") && j["retrieval"].is_object()) {
        auto& r = j["retrieval"];
        auto& out = cfg.retrieval;
        read_uint(r, "max_canonical_facts", out.max_canonical_facts);
        read_uint(r, "max_world_state", out.max_world_state);
        read_uint(r, "max_episodic_memories", out.max_episodic_memories);
        read_uint(r, "max_beliefs", out.max_beliefs);
        read_double(r, "min_episodic_strength", out.min_episodic_strength);
        read_double(r, "min_belief_confidence", out.min_belief_confidence);
        read_bool(r, "include_contradicted_beliefs", out.include_contradicted_beliefs);
        read_double(r, "relevance_weight", out.relevance_weight);
        read_double(r, "recency_weight", out.recency_weight);
        read_double(r, "significance_weight", out.significance_weight);
        read_double(r, "belief_relevance_weight", out.belief_relevance_weight);
        read_double(r, "belief_confidence_weight", out.belief_confidence_weight);
        read_double(r, "topic_boost", out.topic_boost);
        read_double(r, "relevance_cap", out.relevance_cap);
        read_double(r, "contradiction_penalty", out.contradiction_penalty);
        read_uint(r, "min_keyword_length", out.min_keyword_length);
    }

    if (j.contains("store") && j["store"].is_object()) {
        auto& s = j["store"];
        read_double(s, "episodic_decay_rate", cfg.store.episodic_decay_rate);
        read_uint(s, "max_episodic_memories", cfg.store.max_episodic_memories);
    }

    return cfg;
}

Config Config::load(const std::string& path) {
    std::string config_path = expand_home(path);
    nlohmann::json j = defaults_json();

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            if (original.is_object()) {
                j = merge_defaults(original, defaults_json());
            } else {
                std::cerr << "[config] Expected a JSON object in " << config_path
                          << ", using defaults\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config " << config_path << ": " << e.what()
                      << ", using defaults\n";
        }
    }

    return from_json(j);
}

} // namespace npcmem
