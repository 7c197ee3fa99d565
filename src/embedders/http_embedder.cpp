#include "http_embedder.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <iostream>

namespace memoria {

HttpEmbedder::HttpEmbedder(Config config, HttpClient& http)
    : config_(std::move(config)), http_(http), dimensions_(config_.default_dims) {}

std::vector<Header> HttpEmbedder::request_headers() const {
    std::vector<Header> headers{{"Content-Type", "application/json"}};
    if (!config_.api_key.empty()) {
        headers.emplace_back("Authorization", "Bearer " + config_.api_key);
    }
    return headers;
}

Embedding HttpEmbedder::read_vector(const std::string& body) const {
    nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded()) {
        std::cerr << "[embedder] " << config_.name << " sent invalid JSON\n";
        return {};
    }

    nlohmann::json::json_pointer ptr(config_.response_path);
    if (!doc.contains(ptr) || !doc[ptr].is_array()) {
        std::cerr << "[embedder] " << config_.name << " response has no "
                  << config_.response_path << "\n";
        return {};
    }

    Embedding out;
    out.reserve(doc[ptr].size());
    for (const auto& v : doc[ptr]) {
        if (!v.is_number()) {
            std::cerr << "[embedder] " << config_.name << " vector has a non-numeric entry\n";
            return {};
        }
        float x = v.get<float>();
        if (!std::isfinite(x)) {
            std::cerr << "[embedder] " << config_.name << " vector has a non-finite entry\n";
            return {};
        }
        out.push_back(x);
    }
    return out;
}

Embedding HttpEmbedder::embed(const std::string& text) {
    std::string input = trim(text);
    if (input.empty()) return {};

    nlohmann::json request{{"model", config_.model}, {"input", input}};
    std::string body = request.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    auto response = http_.post(config_.base_url + config_.endpoint, body,
                               request_headers(), config_.timeout_seconds);
    if (response.status_code == 0) {
        std::cerr << "[embedder] " << config_.name << " unreachable at "
                  << config_.base_url << "\n";
        return {};
    }
    if (response.status_code != 200) {
        std::cerr << "[embedder] " << config_.name << " returned HTTP "
                  << response.status_code << "\n";
        return {};
    }

    Embedding vec = read_vector(response.body);
    if (vec.empty()) return {};

    auto dims = static_cast<uint32_t>(vec.size());
    if (dimensions_fixed_.load()) {
        if (dims != dimensions_.load()) {
            std::cerr << "[embedder] " << config_.name << " changed dimensions from "
                      << dimensions_.load() << " to " << dims << ", vector refused\n";
            return {};
        }
    } else {
        dimensions_.store(dims);
        dimensions_fixed_.store(true);
    }
    return vec;
}

std::unique_ptr<Embedder> create_openai_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model, long timeout_seconds) {
    HttpEmbedder::Config cfg;
    cfg.name = "openai";
    cfg.api_key = api_key;
    cfg.base_url = base_url.empty() ? "https://api.openai.com/v1" : base_url;
    cfg.model = model.empty() ? "text-embedding-3-small" : model;
    cfg.endpoint = "/embeddings";
    cfg.response_path = "/data/0/embedding";
    cfg.default_dims = 1536;
    cfg.timeout_seconds = timeout_seconds;
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

std::unique_ptr<Embedder> create_ollama_embedder(
    HttpClient& http, const std::string& base_url, const std::string& model,
    long timeout_seconds) {
    HttpEmbedder::Config cfg;
    cfg.name = "ollama";
    cfg.base_url = base_url.empty() ? "http://localhost:11434" : base_url;
    cfg.model = model.empty() ? "nomic-embed-text" : model;
    cfg.endpoint = "/api/embed";
    cfg.response_path = "/embeddings/0";
    cfg.default_dims = 768;
    cfg.timeout_seconds = timeout_seconds;
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

} // namespace memoria
