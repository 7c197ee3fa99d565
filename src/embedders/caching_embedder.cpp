#include "caching_embedder.hpp"
#include <stdexcept>

namespace memoria {

CachingEmbedder::CachingEmbedder(std::unique_ptr<Embedder> inner,
                                 std::shared_ptr<EmbeddingCache> cache)
    : inner_(std::move(inner)), cache_(std::move(cache)) {
    if (!inner_ || !cache_) {
        throw std::invalid_argument("CachingEmbedder: embedder and cache are required");
    }
}

Embedding CachingEmbedder::embed(const std::string& text) {
    const std::string model = inner_->embedder_name();
    if (auto hit = cache_->get(model, text)) {
        return std::move(*hit);
    }

    Embedding vec = inner_->embed(text);
    cache_->put(model, text, vec);
    return vec;
}

} // namespace memoria
