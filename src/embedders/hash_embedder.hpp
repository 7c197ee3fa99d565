#pragma once
#include "../embedder.hpp"

namespace memoria {

// Offline bag-of-words embedder: every lower-cased token is hashed (FNV-1a,
// 32 bit) into one of `dims` buckets and the result is L2-normalized.
// Deterministic, needs no network, and good enough to rank memories that
// share vocabulary with the query.
class HashEmbedder : public Embedder {
public:
    explicit HashEmbedder(uint32_t dims = 1536);

    Embedding embed(const std::string& text) override;
    uint32_t dimensions() const override { return dims_; }
    std::string embedder_name() const override { return "hash"; }

private:
    uint32_t dims_;
};

} // namespace memoria
