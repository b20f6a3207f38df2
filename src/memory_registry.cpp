#include "memory_registry.hpp"
#include "clock.hpp"
#include "util.hpp"
#include <stdexcept>

namespace npcmem {

MemoryRegistry::MemoryRegistry() : MemoryRegistry(system_clock(), random_id_generator()) {}

MemoryRegistry::MemoryRegistry(Clock& clock, IdGenerator& ids) : clock_(&clock), ids_(&ids) {}

void MemoryRegistry::set_store_config(const StoreConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, store] : stores_) store->set_config(config);
    config_ = config;
}

void MemoryRegistry::set_event_bus(EventBus* bus) {
    std::lock_guard<std::mutex> lock(mutex_);
    bus_ = bus;
    for (auto& [id, store] : stores_) store->set_event_bus(bus);
}

MemoryStore& MemoryRegistry::get_or_create(const std::string& npc_id) {
    if (trim(npc_id).empty()) {
        throw std::invalid_argument("NPC id must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    CaseInsensitiveKey key(npc_id);
    auto it = stores_.find(key);
    if (it != stores_.end()) return *it->second;

    auto store = std::make_unique<MemoryStore>(*clock_, *ids_);
    store->set_config(config_);
    store->set_event_bus(bus_);
    auto& stored = *store;
    stores_.emplace(std::move(key), std::move(store));
    return stored;
}

MemoryStore* MemoryRegistry::find(const std::string& npc_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stores_.find(CaseInsensitiveKey(npc_id));
    return it == stores_.end() ? nullptr : it->second.get();
}

const MemoryStore* MemoryRegistry::find(const std::string& npc_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stores_.find(CaseInsensitiveKey(npc_id));
    return it == stores_.end() ? nullptr : it->second.get();
}

bool MemoryRegistry::contains(const std::string& npc_id) const {
    return find(npc_id) != nullptr;
}

bool MemoryRegistry::remove(const std::string& npc_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return stores_.erase(CaseInsensitiveKey(npc_id)) > 0;
}

size_t MemoryRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stores_.size();
}

std::vector<std::string> MemoryRegistry::npc_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(stores_.size());
    for (const auto& [key, _] : stores_) {
        ids.push_back(key.original());
    }
    return ids;
}

std::map<std::string, MutationResult> MemoryRegistry::add_canonical_fact_to_all(
    const std::string& fact_id, const std::string& content, const std::string& domain) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, MutationResult> results;
    for (auto& [key, store] : stores_) {
        try {
            store->add_canonical_fact(fact_id, content, domain);
            results[key.original()] = MutationResult::ok();
        } catch (const DuplicateIdError& e) {
            results[key.original()] = MutationResult::failed(e.what());
        }
    }
    return results;
}

void MemoryRegistry::apply_decay_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [key, store] : stores_) store->apply_episodic_decay();
}

} // namespace npcmem
