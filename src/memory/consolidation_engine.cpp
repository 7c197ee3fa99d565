#include "consolidation_engine.hpp"
#include "context_compressor.hpp"
#include "diversity_reranker.hpp"
#include "relevance_scorer.hpp"
#include "../config.hpp"
#include "../embedder.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace memoria {

EngineOptions EngineOptions::from_config(const Config& config) {
    EngineOptions o;
    o.relevance_floor = config.retrieval.relevance_floor;
    o.pool_size = config.retrieval.pool_size;
    o.mmr_k = config.retrieval.mmr_k;
    o.mmr_lambda = config.retrieval.mmr_lambda;
    o.budget_chars = config.retrieval.budget_chars;
    o.salience_bump = config.retrieval.salience_bump;
    o.min_turns = config.distill.min_turns;
    o.default_salience = config.distill.default_salience;
    return o;
}

static void require_owner(const std::string& owner, const char* operation) {
    if (owner.empty()) {
        throw std::invalid_argument(std::string(operation) + " requires an owner");
    }
}

ConsolidationEngine::ConsolidationEngine(MemoryStore& store,
                                         Embedder* embedder,
                                         FactDistiller* distiller,
                                         Summarizer* summarizer,
                                         EngineOptions options)
    : store_(store),
      embedder_(embedder),
      distiller_(distiller),
      summarizer_(summarizer),
      options_(options) {
    if (!(options_.mmr_lambda >= 0.0 && options_.mmr_lambda <= 1.0)) {
        throw std::invalid_argument("mmr_lambda must be within [0, 1]");
    }
    if (!(options_.relevance_floor >= 0.0 && options_.relevance_floor <= 1.0)) {
        throw std::invalid_argument("relevance_floor must be within [0, 1]");
    }
    if (options_.budget_chars == 0) {
        throw std::invalid_argument("budget_chars must be positive");
    }
}

ConsolidationEngine::~ConsolidationEngine() {
    wait_for_writebacks();
}

Embedding ConsolidationEngine::embed_text(const std::string& text) {
    if (!embedder_) return {};
    try {
        return embedder_->embed(text);
    } catch (const CollaboratorUnavailable& e) {
        std::cerr << "[engine] embedder failed: " << e.what() << "\n";
        return {};
    }
}

std::string ConsolidationEngine::build_context(const std::string& owner,
                                               const std::string& query) {
    require_owner(owner, "build_context");

    Embedding query_vec = embed_text(utf8_sanitize(query));
    if (query_vec.empty()) return "";

    std::vector<Memory> active;
    try {
        active = store_.find_active(owner, epoch_seconds());
    } catch (const CollaboratorUnavailable& e) {
        std::cerr << "[engine] store read failed: " << e.what() << "\n";
        return "";
    }
    if (active.empty()) return "";

    auto relevant = apply_relevance_floor(score_candidates(active, query_vec),
                                          options_.relevance_floor);
    if (relevant.empty()) return "";

    sort_by_similarity(relevant);
    if (relevant.size() > options_.pool_size) relevant.resize(options_.pool_size);

    auto selected = mmr_select(relevant, options_.mmr_k, options_.mmr_lambda);

    std::vector<Memory> memories;
    std::vector<std::string> ids;
    memories.reserve(selected.size());
    ids.reserve(selected.size());
    for (auto& s : selected) {
        ids.push_back(s.memory.id);
        memories.push_back(std::move(s.memory));
    }

    ContextCompressor compressor(summarizer_);
    std::string block = compressor.compress(memories, options_.budget_chars);

    schedule_salience_bump(std::move(ids));
    return block;
}

void ConsolidationEngine::schedule_salience_bump(std::vector<std::string> ids) {
    if (ids.empty() || options_.salience_bump == 0.0) return;

    double delta = options_.salience_bump;
    auto task = std::async(std::launch::async, [this, ids = std::move(ids), delta]() {
        try {
            store_.bump_salience(ids, delta);
        } catch (const std::exception& e) {
            std::cerr << "[engine] salience write-back failed: " << e.what() << "\n";
        }
    });

    std::lock_guard<std::mutex> lock(pending_mutex_);
    // Drop futures that have already completed
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }
    pending_.push_back(std::move(task));
}

void ConsolidationEngine::wait_for_writebacks() {
    std::vector<std::future<void>> pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending.swap(pending_);
    }
    for (auto& f : pending) {
        f.wait();
    }
}

uint32_t ConsolidationEngine::maybe_auto_distill(const std::string& owner,
                                                 const std::string& conversation_id,
                                                 const std::vector<Turn>& recent_turns) {
    require_owner(owner, "maybe_auto_distill");
    if (recent_turns.size() < options_.min_turns) return 0;
    if (!distiller_) return 0;

    std::vector<Turn> turns;
    turns.reserve(recent_turns.size());
    for (const auto& t : recent_turns) {
        turns.push_back({utf8_sanitize(t.role), utf8_sanitize(t.content)});
    }

    auto facts = distiller_->distill_from_turns(turns, utf8_sanitize(conversation_id));
    if (facts.empty()) return 0;

    uint32_t stored = 0;
    for (auto& fact : facts) {
        fact.content = utf8_sanitize(fact.content);
        for (auto& tag : fact.tags) tag = utf8_sanitize(tag);

        Embedding vec = embed_text(fact.content);
        if (vec.empty()) {
            std::cerr << "[engine] dropping fact, no embedding\n";
            continue;
        }

        NewMemory m;
        m.content = std::move(fact.content);
        m.kind = fact.kind;
        m.tags = std::move(fact.tags);
        m.embedding = std::move(vec);
        m.salience = fact.salience;
        m.source = std::move(fact.source);

        try {
            store_.upsert(owner, m);
            ++stored;
        } catch (const CollaboratorUnavailable& e) {
            std::cerr << "[engine] store write failed: " << e.what() << "\n";
        }
    }
    return stored;
}

std::vector<ScoredMemory> ConsolidationEngine::search_memories(const std::string& owner,
                                                               const std::string& query,
                                                               size_t limit,
                                                               double min_similarity) {
    require_owner(owner, "search_memories");
    if (limit == 0) return {};

    Embedding query_vec = embed_text(utf8_sanitize(query));
    if (query_vec.empty()) return {};

    std::vector<Memory> active;
    try {
        active = store_.find_active(owner, epoch_seconds());
    } catch (const CollaboratorUnavailable& e) {
        std::cerr << "[engine] store read failed: " << e.what() << "\n";
        return {};
    }

    auto scored = apply_relevance_floor(score_candidates(active, query_vec), min_similarity);
    sort_by_similarity(scored);
    if (scored.size() > limit) scored.resize(limit);
    return scored;
}

uint32_t ConsolidationEngine::clear_user_memories(const std::string& owner) {
    require_owner(owner, "clear_user_memories");
    try {
        return store_.delete_all_for(owner);
    } catch (const CollaboratorUnavailable& e) {
        std::cerr << "[engine] store delete failed: " << e.what() << "\n";
        return 0;
    }
}

bool ConsolidationEngine::store_memory(const std::string& owner,
                                       const std::string& content,
                                       MemoryKind kind,
                                       const std::vector<std::string>& tags,
                                       std::optional<double> salience) {
    require_owner(owner, "store_memory");
    std::string text = utf8_sanitize(trim(content));
    if (text.empty()) {
        throw std::invalid_argument("store_memory requires content");
    }
    if (utf8_length(text) < options_.min_manual_chars) {
        std::cerr << "[engine] not storing memory shorter than "
                  << options_.min_manual_chars << " characters\n";
        return false;
    }

    Embedding vec = embed_text(text);
    if (vec.empty()) {
        std::cerr << "[engine] cannot store memory, no embedding\n";
        return false;
    }

    NewMemory m;
    m.content = text;
    m.kind = kind;
    m.tags.reserve(tags.size());
    for (const auto& tag : tags) m.tags.push_back(utf8_sanitize(tag));
    m.embedding = std::move(vec);
    m.salience = salience.value_or(options_.default_salience);
    m.source.origin = "manual";
    m.source.extracted_at = epoch_seconds();

    try {
        store_.upsert(owner, m);
        return true;
    } catch (const CollaboratorUnavailable& e) {
        std::cerr << "[engine] store write failed: " << e.what() << "\n";
        return false;
    }
}

MemoryStats ConsolidationEngine::memory_stats(const std::string& owner) {
    require_owner(owner, "memory_stats");
    try {
        return store_.stats(owner);
    } catch (const CollaboratorUnavailable& e) {
        std::cerr << "[engine] store stats failed: " << e.what() << "\n";
        return {};
    }
}

uint32_t ConsolidationEngine::purge_expired() {
    try {
        return store_.purge_expired(epoch_seconds());
    } catch (const CollaboratorUnavailable& e) {
        std::cerr << "[engine] store purge failed: " << e.what() << "\n";
        return 0;
    }
}

} // namespace memoria
