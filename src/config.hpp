#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace clipmind {

struct EncoderConfig {
    std::string provider = "ollama";   // "ollama", "openai", "none"
    std::string base_url;              // empty = provider default on localhost
    std::string model;
    std::string api_key;
    uint32_t dimensions = 384;
};

struct EmbeddingConfig {
    uint32_t max_input_chars = 1000;
    uint32_t batch_concurrency = 10;
    bool normalize = true;
};

struct IndexConfig {
    uint32_t m = 16;
    uint32_t ef_construction = 200;
    uint32_t ef_search = 100;
    uint64_t seed = 42;
    std::string snapshot_path;          // empty = ~/.clipmind/index.bin
};

struct GraphConfig {
    uint32_t k = 10;
};

struct ClusterConfig {
    double resolution = 1.0;
    uint32_t max_iterations = 50;
    double min_modularity_gain = 1e-6;
    uint32_t min_cluster_size = 1;      // 1 = keep singletons
    double stability_threshold = 0.85;
    double recluster_growth = 0.10;     // fraction of items added since last pass
    uint32_t label_terms = 3;
};

struct SearchConfig {
    std::string fusion = "rrf";         // "rrf" or "weighted"
    uint32_t rrf_k = 60;
    uint32_t vector_top_k = 20;
    uint32_t max_results = 100;
    double keyword_weight = 0.4;
    double vector_weight = 0.6;
    uint32_t path_timeout_ms = 2000;
};

struct StoreConfig {
    std::string backend = "sqlite";     // "sqlite" or "memory"
    std::string path;                   // empty = ~/.clipmind/library.db
};

struct Config {
    EncoderConfig encoder;
    EmbeddingConfig embedding;
    IndexConfig index;
    GraphConfig graph;
    ClusterConfig cluster;
    SearchConfig search;
    StoreConfig store;
    uint32_t worker_threads = 2;

    // Load from ~/.clipmind/config.json (or `path`) + env vars.
    // Missing files are created with defaults; missing keys are merged in.
    static Config load(const std::string& path = "");

    // Parse a config document. Unknown or ill-typed keys keep their defaults.
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    std::string snapshot_path() const;
    std::string store_path() const;
};

} // namespace clipmind
