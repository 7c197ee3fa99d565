#pragma once
#include "../embedder.hpp"
#include "../memory/embedding_cache.hpp"
#include <memory>

namespace memoria {

// Decorator: serves repeated texts from an EmbeddingCache and only asks the
// wrapped embedder on a miss. Failed (empty) embeddings are not cached.
class CachingEmbedder : public Embedder {
public:
    CachingEmbedder(std::unique_ptr<Embedder> inner, std::shared_ptr<EmbeddingCache> cache);

    Embedding embed(const std::string& text) override;
    uint32_t dimensions() const override { return inner_->dimensions(); }
    std::string embedder_name() const override { return inner_->embedder_name(); }

    EmbeddingCache& cache() { return *cache_; }

private:
    std::unique_ptr<Embedder> inner_;
    std::shared_ptr<EmbeddingCache> cache_;
};

} // namespace memoria
