#include "config.hpp"
#include "embedder.hpp"
#include "http.hpp"
#include "memory.hpp"
#include "provider.hpp"
#include "util.hpp"
#include "memory/consolidation_engine.hpp"
#include "memory/fact_distiller.hpp"
#include "memory/fact_extractor.hpp"
#include "memory/summarizer.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

static void print_usage() {
    std::cout << "Usage: memoria <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  context   --user U --query Q           Print the memory block for a query\n"
              << "  search    --user U --query Q [--limit N]\n"
              << "                                         List memories by similarity\n"
              << "  remember  --user U --text T [--kind K] [--tag T]... [--salience S]\n"
              << "                                         Store a memory manually\n"
              << "  distill   --user U --conversation C [--file F]\n"
              << "                                         Extract facts from a JSON array of\n"
              << "                                         {role, content} turns (stdin if no file)\n"
              << "  stats     --user U                     Per-kind counts and salience\n"
              << "  clear     --user U                     Delete every memory of a user\n"
              << "  purge                                  Remove expired memories\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  OPENAI_API_KEY              API key for OpenAI (embeddings, LLM)\n"
              << "  OPENROUTER_API_KEY          API key for OpenRouter (LLM)\n"
              << "  MEMORIA_EMBEDDINGS_PROVIDER openai, ollama or hash\n"
              << "  MEMORIA_STORE_PATH          Store file location\n"
              << "  OLLAMA_BASE_URL             Base URL for Ollama (default: http://localhost:11434)\n";
}

struct CliArgs {
    std::string command;
    std::string user;
    std::string query;
    std::string text;
    std::string kind = "fact";
    std::vector<std::string> tags;
    std::optional<double> salience;
    std::string conversation;
    std::string file;
    size_t limit = 0;
};

static std::vector<memoria::Turn> read_turns(const std::string& file) {
    nlohmann::json j;
    if (file.empty()) {
        j = nlohmann::json::parse(std::cin);
    } else {
        std::ifstream in(file);
        if (!in.is_open()) {
            throw std::runtime_error("cannot open " + file);
        }
        j = nlohmann::json::parse(in);
    }
    if (!j.is_array()) {
        throw std::runtime_error("turns must be a JSON array");
    }

    std::vector<memoria::Turn> turns;
    for (const auto& item : j) {
        if (!item.is_object()) continue;
        turns.push_back({item.value("role", ""), item.value("content", "")});
    }
    return turns;
}

static int run_command(const CliArgs& args, const memoria::Config& config,
                       memoria::CurlHttpClient& http) {
    std::unique_ptr<memoria::MemoryStore> store;
    try {
        store = memoria::create_memory_store(config);
    } catch (const std::exception& e) {
        std::cerr << "Error opening store: " << e.what() << "\n";
        return 1;
    }

    auto embedder = memoria::create_embedder(config, http);
    auto provider = memoria::create_provider(config, http);

    std::unique_ptr<memoria::FactExtractor> extractor;
    std::unique_ptr<memoria::FactDistiller> distiller;
    std::unique_ptr<memoria::Summarizer> summarizer;
    if (provider) {
        extractor = std::make_unique<memoria::LlmFactExtractor>(
            *provider, config.llm.model, config.llm.extraction_temperature);
        memoria::DistillOptions opts;
        opts.max_turns = config.distill.max_turns;
        opts.min_content_chars = config.distill.min_content_chars;
        opts.min_salience = config.distill.min_salience;
        distiller = std::make_unique<memoria::FactDistiller>(*extractor, opts);
        summarizer = std::make_unique<memoria::LlmSummarizer>(
            *provider, config.llm.model, config.llm.summary_temperature);
    } else {
        summarizer = std::make_unique<memoria::TruncatingSummarizer>();
    }

    memoria::ConsolidationEngine engine(*store, embedder.get(), distiller.get(),
                                        summarizer.get(),
                                        memoria::EngineOptions::from_config(config));

    if (args.command == "context") {
        std::cout << engine.build_context(args.user, args.query) << "\n";
    } else if (args.command == "search") {
        size_t limit = args.limit > 0 ? args.limit : config.retrieval.search_limit;
        for (const auto& s : engine.search_memories(args.user, args.query, limit)) {
            std::printf("%.4f\t%s\t%s\n", s.similarity,
                        memoria::kind_to_string(s.memory.kind).c_str(),
                        s.memory.content.c_str());
        }
    } else if (args.command == "remember") {
        if (!memoria::is_known_kind(args.kind)) {
            std::cerr << "Unknown kind: " << args.kind << "\n";
            return 1;
        }
        bool ok = engine.store_memory(args.user, args.text,
                                      memoria::kind_from_string(args.kind),
                                      args.tags, args.salience);
        std::cout << (ok ? "Stored." : "Not stored.") << "\n";
        if (!ok) return 1;
    } else if (args.command == "distill") {
        auto turns = read_turns(args.file);
        std::cout << engine.maybe_auto_distill(args.user, args.conversation, turns) << "\n";
    } else if (args.command == "stats") {
        auto stats = engine.memory_stats(args.user);
        std::cout << "Total: " << stats.total << "\n";
        for (const auto& [kind, ks] : stats.by_kind) {
            std::printf("  %-10s %u (avg salience %.2f)\n",
                        memoria::kind_to_string(kind).c_str(), ks.count, ks.avg_salience);
        }
    } else if (args.command == "clear") {
        std::cout << "Deleted " << engine.clear_user_memories(args.user) << " memories.\n";
    } else if (args.command == "purge") {
        std::cout << "Purged " << engine.purge_expired() << " expired memories.\n";
    }

    engine.wait_for_writebacks();
    return 0;
}

int main(int argc, char* argv[]) try {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    CliArgs args;
    args.command = argv[1];
    if (args.command == "-h" || args.command == "--help") {
        print_usage();
        return 0;
    }

    for (int i = 2; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--user") == 0 && i + 1 < argc) {
            args.user = argv[++i];
        } else if (std::strcmp(argv[i], "--query") == 0 && i + 1 < argc) {
            args.query = argv[++i];
        } else if (std::strcmp(argv[i], "--text") == 0 && i + 1 < argc) {
            args.text = argv[++i];
        } else if (std::strcmp(argv[i], "--kind") == 0 && i + 1 < argc) {
            args.kind = argv[++i];
        } else if (std::strcmp(argv[i], "--tag") == 0 && i + 1 < argc) {
            args.tags.emplace_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--salience") == 0 && i + 1 < argc) {
            args.salience = std::stod(argv[++i]);
        } else if (std::strcmp(argv[i], "--conversation") == 0 && i + 1 < argc) {
            args.conversation = argv[++i];
        } else if (std::strcmp(argv[i], "--file") == 0 && i + 1 < argc) {
            args.file = argv[++i];
        } else if (std::strcmp(argv[i], "--limit") == 0 && i + 1 < argc) {
            args.limit = static_cast<size_t>(std::stoul(argv[++i]));
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    const std::vector<std::string> known = {
        "context", "search", "remember", "distill", "stats", "clear", "purge"};
    bool known_command = false;
    for (const auto& k : known) {
        if (args.command == k) known_command = true;
    }
    if (!known_command) {
        std::cerr << "Unknown command: " << args.command << "\n";
        print_usage();
        return 1;
    }
    if (args.command != "purge" && args.user.empty()) {
        std::cerr << "Missing --user\n";
        return 1;
    }
    if ((args.command == "context" || args.command == "search") && args.query.empty()) {
        std::cerr << "Missing --query\n";
        return 1;
    }
    if (args.command == "remember" && memoria::trim(args.text).empty()) {
        std::cerr << "Missing --text\n";
        return 1;
    }

    memoria::http_init();
    auto config = memoria::Config::load();

    int rc;
    {
        memoria::CurlHttpClient http_client;
        rc = run_command(args, config, http_client);
    }

    memoria::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
