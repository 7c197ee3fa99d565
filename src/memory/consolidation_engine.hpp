#pragma once
#include "../memory.hpp"
#include "fact_distiller.hpp"
#include <cstddef>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace memoria {

class Embedder;   // forward declare
class Summarizer; // forward declare
struct Config;    // forward declare

struct EngineOptions {
    double relevance_floor = 0.25;
    size_t pool_size = 24;
    size_t mmr_k = 10;
    double mmr_lambda = 0.7;
    size_t budget_chars = 1000;
    double salience_bump = 0.05;
    size_t min_turns = 4;
    double default_salience = 0.7;
    size_t min_manual_chars = 10;

    static EngineOptions from_config(const Config& config);
};

// Orchestrates retrieval (embed, fetch, score, floor, MMR, compress,
// salience write-back) and ingestion (distill, embed, dedup-upsert).
//
// Text arriving from callers is UTF-8 sanitized (malformed bytes become
// U+FFFD) before it reaches any collaborator.
// Every collaborator failure degrades to an empty result; only contract
// violations (empty owner, invalid options) throw std::invalid_argument.
// Collaborators are borrowed and must outlive the engine. Embedder,
// distiller and summarizer may be null.
class ConsolidationEngine {
public:
    ConsolidationEngine(MemoryStore& store,
                        Embedder* embedder,
                        FactDistiller* distiller,
                        Summarizer* summarizer,
                        EngineOptions options = {});
    ~ConsolidationEngine();

    ConsolidationEngine(const ConsolidationEngine&) = delete;
    ConsolidationEngine& operator=(const ConsolidationEngine&) = delete;

    // Memory block for the query, or "" when nothing relevant is available.
    // Salience of the selected memories is bumped in the background.
    std::string build_context(const std::string& owner, const std::string& query);

    // Distill the recent turns and store the admitted facts. Returns the
    // number stored; 0 when fewer than min_turns turns are given.
    uint32_t maybe_auto_distill(const std::string& owner,
                                const std::string& conversation_id,
                                const std::vector<Turn>& recent_turns);

    // Scored memories sorted by similarity descending, no MMR and no
    // compression. Entries below min_similarity are dropped.
    std::vector<ScoredMemory> search_memories(const std::string& owner,
                                              const std::string& query,
                                              size_t limit,
                                              double min_similarity = -1.0);

    // Delete every memory of owner. Returns the count removed.
    uint32_t clear_user_memories(const std::string& owner);

    // Manual write path (origin "manual"). False if the content is shorter
    // than min_manual_chars or could not be embedded or stored.
    bool store_memory(const std::string& owner,
                      const std::string& content,
                      MemoryKind kind = MemoryKind::Fact,
                      const std::vector<std::string>& tags = {},
                      std::optional<double> salience = std::nullopt);

    MemoryStats memory_stats(const std::string& owner);

    // Remove expired memories of every owner.
    uint32_t purge_expired();

    // Block until all background salience bumps have finished.
    void wait_for_writebacks();

    const EngineOptions& options() const { return options_; }

private:
    Embedding embed_text(const std::string& text);
    void schedule_salience_bump(std::vector<std::string> ids);

    MemoryStore& store_;
    Embedder* embedder_;
    FactDistiller* distiller_;
    Summarizer* summarizer_;
    EngineOptions options_;

    std::mutex pending_mutex_;
    std::vector<std::future<void>> pending_;
};

} // namespace memoria
