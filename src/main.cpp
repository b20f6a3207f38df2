#include "config.hpp"
#include "context_retrieval.hpp"
#include "event_bus.hpp"
#include "event.hpp"
#include "memory_store.hpp"
#include "memory/snapshot_io.hpp"
#include "memory/state_hash.hpp"
#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

static void print_usage() {
    std::cout << "Usage: npcmem --state FILE [options]\n"
              << "\n"
              << "Loads an NPC memory snapshot and prints the context retrieved for a query.\n"
              << "\n"
              << "Options:\n"
              << "  --state FILE         Memory snapshot (JSON) to load\n"
              << "  --config FILE        Retrieval/store config (JSON), defaults if absent\n"
              << "  -q, --query TEXT     Free-text query to rank against\n"
              << "  -t, --topic TOPIC    Topic filter, may be repeated\n"
              << "  --decay N            Apply N episodic decay steps before retrieval\n"
              << "  --scores             Print ranked episodes and beliefs with their scores\n"
              << "  --hash               Print the SHA-256 state hash\n"
              << "  -v, --verbose        Log store and retrieval events to stderr\n"
              << "  -h, --help           Show this help\n";
}

static bool read_file(const std::string& path, std::string& out) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    std::ostringstream ss;
    ss << file.rdbuf();
    out = ss.str();
    return true;
}

static void print_section(const char* title, const std::vector<std::string>& lines) {
    std::cout << title << " (" << lines.size() << ")\n";
    for (const auto& line : lines) {
        std::cout << "  " << line << "\n";
    }
}

static std::string fmt_score(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4f", v);
    return buf;
}

static void attach_logging(npcmem::EventBus& bus) {
    npcmem::subscribe<npcmem::FactAddedEvent>(bus,
        [](const npcmem::FactAddedEvent& ev) {
            std::cerr << "[memory] fact " << ev.id << " #" << ev.sequence_number << "\n";
        });
    npcmem::subscribe<npcmem::WorldStateChangedEvent>(bus,
        [](const npcmem::WorldStateChangedEvent& ev) {
            std::cerr << "[memory] state " << ev.key << " = " << ev.value
                      << (ev.created ? " (new)" : "") << "\n";
        });
    npcmem::subscribe<npcmem::EpisodeAddedEvent>(bus,
        [](const npcmem::EpisodeAddedEvent& ev) {
            std::cerr << "[memory] episode " << ev.id << " #" << ev.sequence_number << "\n";
        });
    npcmem::subscribe<npcmem::BeliefChangedEvent>(bus,
        [](const npcmem::BeliefChangedEvent& ev) {
            std::cerr << "[memory] belief " << ev.id
                      << (ev.contradicted ? " (contradicted)" : "") << "\n";
        });
    npcmem::subscribe<npcmem::DecayAppliedEvent>(bus,
        [](const npcmem::DecayAppliedEvent& ev) {
            std::cerr << "[memory] decay " << ev.decay_rate << " applied to "
                      << ev.affected << " episodes\n";
        });
    npcmem::subscribe<npcmem::EpisodeReinforcedEvent>(bus,
        [](const npcmem::EpisodeReinforcedEvent& ev) {
            std::cerr << "[memory] reinforced " << ev.id << " by " << ev.amount
                      << " (" << ev.affected << " episodes)\n";
        });
    npcmem::subscribe<npcmem::SequenceRecalculatedEvent>(bus,
        [](const npcmem::SequenceRecalculatedEvent& ev) {
            std::cerr << "[memory] next sequence number " << ev.next_sequence_number << "\n";
        });
    npcmem::subscribe<npcmem::MutationRejectedEvent>(bus,
        [](const npcmem::MutationRejectedEvent& ev) {
            std::cerr << "[memory] rejected " << ev.target << ": " << ev.reason << "\n";
        });
    npcmem::subscribe<npcmem::ContextRetrievedEvent>(bus,
        [](const npcmem::ContextRetrievedEvent& ev) {
            std::cerr << "[retrieval] \"" << ev.query << "\": "
                      << ev.canonical_facts << " facts, " << ev.world_state << " state, "
                      << ev.episodic_memories << " episodes, " << ev.beliefs << " beliefs\n";
        });
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string state_path;
    std::string config_path;
    std::string query;
    std::vector<std::string> topics;
    long decay_steps = 0;
    bool show_scores = false;
    bool show_hash = false;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--state") == 0 && i + 1 < argc) {
            state_path = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((std::strcmp(argv[i], "-q") == 0 || std::strcmp(argv[i], "--query") == 0) && i + 1 < argc) {
            query = argv[++i];
        } else if ((std::strcmp(argv[i], "-t") == 0 || std::strcmp(argv[i], "--topic") == 0) && i + 1 < argc) {
            topics.emplace_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--decay") == 0 && i + 1 < argc) {
            char* end = nullptr;
            decay_steps = std::strtol(argv[++i], &end, 10);
            if (*end != '\0' || decay_steps < 0) {
                std::cerr << "Invalid --decay value: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--scores") == 0) {
            show_scores = true;
        } else if (std::strcmp(argv[i], "--hash") == 0) {
            show_hash = true;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (state_path.empty()) {
        std::cerr << "Error: --state is required\n";
        print_usage();
        return 1;
    }

    npcmem::Config config;
    if (!config_path.empty()) {
        config = npcmem::Config::load(config_path);
    }

    npcmem::EventBus bus;
    if (verbose) attach_logging(bus);

    npcmem::MemoryStore store;
    store.set_config(config.store);
    store.set_event_bus(&bus);

    std::string snapshot;
    if (!read_file(state_path, snapshot)) {
        std::cerr << "Error: cannot read " << state_path << "\n";
        return 1;
    }
    uint32_t restored = 0;
    try {
        restored = npcmem::snapshot_import(store, snapshot);
    } catch (const npcmem::SnapshotError& e) {
        std::cerr << "Error: " << state_path << ": " << e.what() << "\n";
        return 1;
    }
    if (verbose) {
        std::cerr << "[memory] restored " << restored << " entries from " << state_path << "\n";
    }

    for (long step = 0; step < decay_steps; step++) {
        store.apply_episodic_decay();
    }

    npcmem::ContextRetriever retriever(store, config.retrieval);
    retriever.set_event_bus(&bus);

    auto context = retriever.retrieve_context(query, topics);
    print_section("Canonical facts", context.canonical_facts);
    print_section("World state", context.world_state);
    print_section("Episodic memories", context.episodic_memories);
    print_section("Beliefs", context.beliefs);

    if (show_scores) {
        std::cout << "\nEpisode scores\n";
        for (const auto& s : retriever.rank_episodes(query, topics)) {
            std::cout << "  " << fmt_score(s.score) << "  rel=" << fmt_score(s.relevance)
                      << "  " << s.entry.id << "  " << s.entry.description << "\n";
        }
        std::cout << "Belief scores\n";
        for (const auto& s : retriever.rank_beliefs(query, topics)) {
            std::cout << "  " << fmt_score(s.score) << "  rel=" << fmt_score(s.relevance)
                      << "  " << s.entry.id << "  " << s.entry.content << "\n";
        }
    }

    if (show_hash) {
        std::cout << "\nState hash: " << npcmem::compute_state_hash(store) << "\n";
    }

    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
