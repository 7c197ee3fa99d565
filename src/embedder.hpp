#pragma once
#include "memory/vector.hpp"
#include <string>
#include <memory>
#include <cstdint>

namespace memoria {

class HttpClient; // forward declare
struct Config;    // forward declare

// Abstract embedding provider interface.
// An empty result means the embedding could not be produced; callers treat
// it as "skip" and never as an error.
class Embedder {
public:
    virtual ~Embedder() = default;

    // Compute embedding vector for the given text
    virtual Embedding embed(const std::string& text) = 0;

    // Dimensionality of the embedding vectors
    virtual uint32_t dimensions() const = 0;

    // Human-readable name (e.g. "openai", "ollama", "hash")
    virtual std::string embedder_name() const = 0;
};

// Create an embedder from config. Returns nullptr if embeddings are disabled
// or the configured provider is not recognized. The result is wrapped in a
// CachingEmbedder when embeddings.cache is enabled.
std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http);

} // namespace memoria
