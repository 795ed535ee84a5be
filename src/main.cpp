#include "config.hpp"
#include "http.hpp"
#include "embedder.hpp"
#include "corpus.hpp"
#include "competitor.hpp"
#include "curriculum.hpp"
#include "report.hpp"
#include "errors.hpp"
#include "fanout.hpp"
#include "cancel.hpp"
#include "retrieval_engine.hpp"
#include "benchmark_engine.hpp"
#include "store/competitor_db.hpp"
#include "store/response_cache.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <fstream>
#include <string>
#include <cstring>
#include <memory>
#include <vector>

static void print_usage() {
    std::cout << "Usage: curbench <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  search [options] QUERY             Semantic search over the corpus\n"
              << "  ingest FILE                        Add entries from a JSON array (missing vectors are embedded)\n"
              << "  forget ID...                       Delete corpus entries by id\n"
              << "  stats                              Corpus statistics\n"
              << "  competitors import FILE            Import competitor programs from a JSON array\n"
              << "  competitors list                   List competitor programs, newest first\n"
              << "  competitors remove ID              Delete a competitor program\n"
              << "  benchmark FILE                     Benchmark a curriculum JSON against all competitors\n"
              << "\n"
              << "Search options:\n"
              << "  --domain D           Restrict to a domain (repeatable)\n"
              << "  --min-similarity X   Similarity floor in [0, 1]\n"
              << "  --min-credibility N  Credibility floor in [0, 100]\n"
              << "  --limit N            Maximum results\n"
              << "  --recency-weight W   Blend recency into the score, W in [0, 1]\n"
              << "  --include-undated    Admit entries with no publication date\n"
              << "  --ranked             Rank by the similarity/credibility/recency composite\n"
              << "  --variant TEXT       Additional query variant (repeatable)\n"
              << "  --expand             Also search generated rephrasings of the query\n"
              << "  --hybrid             Merge semantic and keyword matches\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  OPENAI_API_KEY                API key for OpenAI embeddings\n"
              << "  OLLAMA_BASE_URL               Base URL for Ollama (default: http://localhost:11434)\n"
              << "  CURBENCH_EMBEDDING_PROVIDER   openai | ollama\n"
              << "  CURBENCH_EMBEDDING_MODEL      Embedding model name\n"
              << "  CURBENCH_DATA_DIR             Directory for corpus, competitors and cache\n";
}

static nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }
    return nlohmann::json::parse(file);
}

// Accept either a bare array or an object holding the array under `key`.
static const nlohmann::json& array_field(const nlohmann::json& j, const char* key) {
    if (j.is_array()) return j;
    if (j.is_object() && j.contains(key) && j[key].is_array()) return j[key];
    throw std::invalid_argument(std::string("expected a JSON array or an object with \"") +
                                key + "\"");
}

struct Services {
    curbench::Config config;
    curbench::PlatformHttpClient http;
    std::unique_ptr<curbench::ResponseCache> cache;
    std::unique_ptr<curbench::Embedder> embedder;
};

static bool init_embedder(Services& svc) {
    if (svc.config.cache.enabled) {
        svc.cache = std::make_unique<curbench::ResponseCache>(
            svc.config.cache_path(), svc.config.cache.search_ttl, svc.config.cache.max_entries);
    }
    svc.embedder = curbench::create_embedder(svc.config, svc.http, svc.cache.get());
    if (!svc.embedder) {
        std::cerr << "Error: no usable embedding provider (check embeddings.provider and credentials)\n";
        return false;
    }
    return true;
}

static std::unique_ptr<curbench::CorpusStore> open_corpus(const curbench::Config& config) {
    auto corpus = curbench::create_corpus_store(config);
    if (!corpus) {
        throw std::runtime_error("unknown corpus backend: " + config.storage.corpus_backend);
    }
    return corpus;
}

static int run_search(Services& svc, int argc, char* argv[], int start) {
    std::string query;
    std::vector<std::string> variants;
    bool ranked = false;
    bool hybrid = false;
    bool expand = false;
    curbench::RetrievalOptions opts = curbench::RetrievalOptions::from_config(svc.config.retrieval);

    for (int i = start; i < argc; i++) {
        if (std::strcmp(argv[i], "--domain") == 0 && i + 1 < argc) {
            opts.domains.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--min-similarity") == 0 && i + 1 < argc) {
            opts.min_similarity = std::stod(argv[++i]);
        } else if (std::strcmp(argv[i], "--min-credibility") == 0 && i + 1 < argc) {
            opts.min_credibility = std::stoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--limit") == 0 && i + 1 < argc) {
            int limit = std::stoi(argv[++i]);
            opts.limit = limit > 0 ? static_cast<uint32_t>(limit) : 0;
        } else if (std::strcmp(argv[i], "--recency-weight") == 0 && i + 1 < argc) {
            opts.recency_weight = std::stod(argv[++i]);
        } else if (std::strcmp(argv[i], "--include-undated") == 0) {
            opts.include_undated = true;
        } else if (std::strcmp(argv[i], "--ranked") == 0) {
            ranked = true;
        } else if (std::strcmp(argv[i], "--hybrid") == 0) {
            hybrid = true;
        } else if (std::strcmp(argv[i], "--expand") == 0) {
            expand = true;
        } else if (std::strcmp(argv[i], "--variant") == 0 && i + 1 < argc) {
            variants.push_back(argv[++i]);
        } else if (argv[i][0] == '-' && argv[i][1] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            return 1;
        } else if (query.empty()) {
            query = argv[i];
        } else {
            query += " ";
            query += argv[i];
        }
    }

    if (query.empty()) {
        std::cerr << "Error: search requires a query\n";
        return 1;
    }
    bool multi = expand || !variants.empty();
    if (static_cast<int>(ranked) + static_cast<int>(hybrid) + static_cast<int>(multi) > 1) {
        std::cerr << "Error: --ranked, --hybrid and multi-query search (--variant, --expand)"
                     " are mutually exclusive\n";
        return 1;
    }
    if (!init_embedder(svc)) return 1;

    auto corpus = open_corpus(svc.config);
    curbench::RetrievalEngine engine(*corpus, *svc.embedder, svc.config, svc.cache.get());

    std::vector<curbench::RetrievalResult> results;
    if (multi) {
        std::vector<std::string> all = expand ? curbench::generate_query_variations(query)
                                              : std::vector<std::string>{query};
        all.insert(all.end(), variants.begin(), variants.end());
        results = engine.multi_query_search(all, opts);
    } else if (ranked) {
        results = engine.search_with_ranking(query, opts);
    } else if (hybrid) {
        results = engine.hybrid_search(query, opts);
    } else {
        results = engine.search(query, opts);
    }

    std::cout << curbench::results_to_json(results, false).dump(2) << "\n";
    return 0;
}

static int run_ingest(Services& svc, const std::string& path) {
    auto doc = read_json_file(path);

    std::vector<curbench::EmbeddedEntry> entries;
    std::vector<size_t> missing;
    for (const auto& item : array_field(doc, "entries")) {
        entries.push_back(curbench::entry_from_json(item));
        if (entries.back().vector.empty()) missing.push_back(entries.size() - 1);
    }

    if (!missing.empty()) {
        if (!init_embedder(svc)) return 1;
        std::vector<std::string> texts;
        texts.reserve(missing.size());
        for (size_t idx : missing) texts.push_back(entries[idx].content);

        curbench::CancelToken cancel;
        auto vectors = curbench::embed_all(*svc.embedder, texts, cancel,
                                           svc.config.embeddings.max_concurrency);
        for (size_t i = 0; i < missing.size(); ++i) {
            entries[missing[i]].vector = std::move(vectors[i]);
        }
    }

    auto corpus = open_corpus(svc.config);
    auto ids = corpus->insert(entries);
    std::cerr << "[corpus] Ingested " << ids.size() << " entries (" << missing.size()
              << " embedded)\n";
    std::cout << nlohmann::json{{"inserted", ids}}.dump(2) << "\n";
    return 0;
}

static int run_forget(Services& svc, const std::vector<std::string>& ids) {
    auto corpus = open_corpus(svc.config);
    uint32_t removed = corpus->delete_by_ids(ids);
    std::cout << nlohmann::json{{"deleted", removed}}.dump(2) << "\n";
    return 0;
}

static int run_stats(Services& svc) {
    auto corpus = open_corpus(svc.config);
    std::cout << curbench::stats_to_json(corpus->stats()).dump(2) << "\n";
    return 0;
}

static int run_competitors(Services& svc, int argc, char* argv[], int start) {
    if (start >= argc) {
        std::cerr << "Error: competitors requires import, list or remove\n";
        return 1;
    }
    std::string sub = argv[start];
    curbench::CompetitorDb store(svc.config.competitors_path());

    if (sub == "list") {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& p : store.list()) out.push_back(curbench::program_to_json(p));
        std::cout << out.dump(2) << "\n";
        return 0;
    }
    if (sub == "import" && start + 1 < argc) {
        auto doc = read_json_file(argv[start + 1]);
        std::vector<curbench::CompetitorProgram> programs;
        for (const auto& item : array_field(doc, "programs")) {
            programs.push_back(curbench::program_from_json(item));
        }
        auto stored = store.import_programs(programs);
        nlohmann::json out = nlohmann::json::array();
        for (const auto& p : stored) out.push_back(curbench::program_to_json(p));
        std::cout << out.dump(2) << "\n";
        return 0;
    }
    if (sub == "remove" && start + 1 < argc) {
        bool removed = store.remove(argv[start + 1]);
        std::cout << nlohmann::json{{"deleted", removed}}.dump(2) << "\n";
        return removed ? 0 : 1;
    }

    std::cerr << "Error: unknown competitors command: " << sub << "\n";
    return 1;
}

static int run_benchmark(Services& svc, const std::string& path) {
    auto curriculum = curbench::curriculum_from_json(read_json_file(path));
    if (!init_embedder(svc)) return 1;

    curbench::CompetitorDb store(svc.config.competitors_path());
    curbench::BenchmarkEngine engine(*svc.embedder, svc.config, &store);
    auto report = engine.benchmark_program(curriculum);
    std::cout << curbench::report_to_json(report).dump(2) << "\n";
    return 0;
}

static int dispatch(Services& svc, int argc, char* argv[]) {
    std::string command = argv[1];

    if (command == "search") return run_search(svc, argc, argv, 2);
    if (command == "ingest" && argc > 2) return run_ingest(svc, argv[2]);
    if (command == "forget" && argc > 2) {
        return run_forget(svc, std::vector<std::string>(argv + 2, argv + argc));
    }
    if (command == "stats") return run_stats(svc);
    if (command == "competitors") return run_competitors(svc, argc, argv, 2);
    if (command == "benchmark" && argc > 2) return run_benchmark(svc, argv[2]);

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 1;
}

int main(int argc, char* argv[]) try {
    if (argc < 2) {
        print_usage();
        return 1;
    }
    if (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_usage();
        return 0;
    }

    curbench::http_init();
    Services svc;
    svc.config = curbench::Config::load();

    int rc = 1;
    try {
        rc = dispatch(svc, argc, argv);
    } catch (const curbench::OperationFailed& e) {
        std::cerr << "Error: " << e.what() << "\n";
        if (e.rate_limited()) {
            std::cerr << "The embedding provider is rate limiting requests; retry later.\n";
        }
    } catch (const curbench::InvalidQuery& e) {
        std::cerr << "Error: " << e.what() << "\n";
    } catch (const curbench::EmbedError& e) {
        std::cerr << "Error: embedding failed (" << curbench::embed_error_kind_name(e.kind())
                  << "): " << e.what() << "\n";
    }

    curbench::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
