#pragma once
#include "context_retrieval.hpp"
#include "memory_store.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace npcmem {

struct Config {
    ContextRetrievalConfig retrieval;
    StoreConfig store;

    // Load a JSON config file merged over defaults_json(). A missing file
    // yields the defaults; a malformed one yields the defaults plus a warning.
    static Config load(const std::string& path);

    // Parse already-merged JSON. Fields with the wrong type keep their default.
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();
};

// Recursively fill keys missing from `existing` with values from `defaults`.
nlohmann::json merge_defaults(const nlohmann::json& existing, const nlohmann::json& defaults);

} // namespace npcmem
