#include "state_hash.hpp"
#include "../memory_store.hpp"
#include "../util.hpp"

#include <openssl/sha.h>
#include <cstdio>
#include <cstdint>

namespace npcmem {

namespace {

// Unit separator keeps free text from colliding with field boundaries
constexpr char FIELD_SEP = '\x1f';

std::string num(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    return buf;
}

class LineWriter {
public:
    explicit LineWriter(std::string& out) : out_(out) {}

    LineWriter& field(const std::string& value) {
        if (!first_) out_ += FIELD_SEP;
        out_ += value;
        first_ = false;
        return *this;
    }
    LineWriter& field(int64_t value) { return field(std::to_string(value)); }
    LineWriter& field(double value) { return field(num(value)); }
    LineWriter& field(bool value) { return field(std::string(value ? "1" : "0")); }

    void end() {
        out_ += '\n';
        first_ = true;
    }

private:
    std::string& out_;
    bool first_ = true;
};

} // namespace

std::string canonical_state_dump(const MemoryStore& store) {
    std::string out;
    LineWriter w(out);

    w.field(std::string("next_sequence")).field(store.next_sequence_number());
    w.end();

    for (const auto& f : store.get_canonical_facts()) {
        w.field(std::string("fact")).field(f.id).field(f.content).field(f.domain)
         .field(f.created_at_ticks).field(f.sequence_number)
         .field(mutation_source_to_string(f.source));
        w.end();
    }
    for (const auto& s : store.get_all_world_state()) {
        w.field(std::string("state")).field(s.id).field(s.key).field(s.value)
         .field(mutation_source_to_string(s.source)).field(s.created_at_ticks)
         .field(s.modified_at_ticks).field(static_cast<int64_t>(s.modification_count))
         .field(s.sequence_number);
        w.end();
    }
    for (const auto& e : store.get_all_episodic_memories()) {
        w.field(std::string("episode")).field(e.id).field(e.description)
         .field(episode_type_to_string(e.episode_type)).field(e.participant)
         .field(e.significance).field(e.strength).field(e.created_at_ticks)
         .field(e.sequence_number).field(mutation_source_to_string(e.source));
        w.end();
    }
    for (const auto& b : store.get_all_beliefs()) {
        w.field(std::string("belief")).field(b.id).field(b.subject).field(b.content)
         .field(belief_type_to_string(b.belief_type)).field(b.sentiment).field(b.confidence)
         .field(b.is_contradicted).field(b.contradiction_reason).field(b.evidence)
         .field(b.created_at_ticks).field(b.sequence_number)
         .field(mutation_source_to_string(b.source));
        w.end();
    }
    for (const auto& r : store.get_all_relationships()) {
        w.field(std::string("relationship")).field(r.owner_npc_id).field(r.target_id)
         .field(r.relationship_label).field(r.affinity).field(r.trust).field(r.familiarity);
        for (const auto& h : r.history) w.field("history=" + h);
        for (const auto& t : r.tags) w.field("tag=" + t);
        w.end();
    }
    return out;
}

std::string compute_state_hash(const MemoryStore& store) {
    std::string dump = canonical_state_dump(store);
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(dump.data()), dump.size(), hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

} // namespace npcmem
