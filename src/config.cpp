#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace clipmind {

nlohmann::json Config::defaults_json() {
    return {
        {"worker_threads", 2},
        {"encoder", {
            {"provider", "ollama"},
            {"base_url", ""},
            {"model", ""},
            {"api_key", ""},
            {"dimensions", 384}
        }},
        {"embedding", {
            {"max_input_chars", 1000},
            {"batch_concurrency", 10},
            {"normalize", true}
        }},
        {"index", {
            {"m", 16},
            {"ef_construction", 200},
            {"ef_search", 100},
            {"seed", 42},
            {"snapshot_path", ""}
        }},
        {"graph", {
            {"k", 10}
        }},
        {"cluster", {
            {"resolution", 1.0},
            {"max_iterations", 50},
            {"min_modularity_gain", 1e-6},
            {"min_cluster_size", 1},
            {"stability_threshold", 0.85},
            {"recluster_growth", 0.10},
            {"label_terms", 3}
        }},
        {"search", {
            {"fusion", "rrf"},
            {"rrf_k", 60},
            {"vector_top_k", 20},
            {"max_results", 100},
            {"keyword_weight", 0.4},
            {"vector_weight", 0.6},
            {"path_timeout_ms", 2000}
        }},
        {"store", {
            {"backend", "sqlite"},
            {"path", ""}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string()) out = obj[key].get<std::string>();
}

// Integer literals built in C++ are signed; parsed ones are unsigned. Accept both.
static bool is_non_negative_integer(const nlohmann::json& v) {
    return v.is_number_unsigned() || (v.is_number_integer() && v.get<int64_t>() >= 0);
}

static void read_uint(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && is_non_negative_integer(obj[key])) out = obj[key].get<uint32_t>();
}

static void read_uint64(const nlohmann::json& obj, const char* key, uint64_t& out) {
    if (obj.contains(key) && is_non_negative_integer(obj[key])) out = obj[key].get<uint64_t>();
}

static void read_double(const nlohmann::json& obj, const char* key, double& out) {
    if (obj.contains(key) && obj[key].is_number()) out = obj[key].get<double>();
}

static void read_bool(const nlohmann::json& obj, const char* key, bool& out) {
    if (obj.contains(key) && obj[key].is_boolean()) out = obj[key].get<bool>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    read_uint(j, "worker_threads", cfg.worker_threads);

    if (j.contains("encoder") && j["encoder"].is_object()) {
        auto& e = j["encoder"];
        read_string(e, "provider", cfg.encoder.provider);
        read_string(e, "base_url", cfg.encoder.base_url);
        read_string(e, "model", cfg.encoder.model);
        read_string(e, "api_key", cfg.encoder.api_key);
        read_uint(e, "dimensions", cfg.encoder.dimensions);
    }

    if (j.contains("embedding") && j["embedding"].is_object()) {
        auto& e = j["embedding"];
        read_uint(e, "max_input_chars", cfg.embedding.max_input_chars);
        read_uint(e, "batch_concurrency", cfg.embedding.batch_concurrency);
        read_bool(e, "normalize", cfg.embedding.normalize);
    }

    if (j.contains("index") && j["index"].is_object()) {
        auto& i = j["index"];
        read_uint(i, "m", cfg.index.m);
        read_uint(i, "ef_construction", cfg.index.ef_construction);
        read_uint(i, "ef_search", cfg.index.ef_search);
        read_uint64(i, "seed", cfg.index.seed);
        read_string(i, "snapshot_path", cfg.index.snapshot_path);
    }

    if (j.contains("graph") && j["graph"].is_object()) {
        read_uint(j["graph"], "k", cfg.graph.k);
    }

    if (j.contains("cluster") && j["cluster"].is_object()) {
        auto& c = j["cluster"];
        read_double(c, "resolution", cfg.cluster.resolution);
        read_uint(c, "max_iterations", cfg.cluster.max_iterations);
        read_double(c, "min_modularity_gain", cfg.cluster.min_modularity_gain);
        read_uint(c, "min_cluster_size", cfg.cluster.min_cluster_size);
        read_double(c, "stability_threshold", cfg.cluster.stability_threshold);
        read_double(c, "recluster_growth", cfg.cluster.recluster_growth);
        read_uint(c, "label_terms", cfg.cluster.label_terms);
    }

    if (j.contains("search") && j["search"].is_object()) {
        auto& s = j["search"];
        read_string(s, "fusion", cfg.search.fusion);
        read_uint(s, "rrf_k", cfg.search.rrf_k);
        read_uint(s, "vector_top_k", cfg.search.vector_top_k);
        read_uint(s, "max_results", cfg.search.max_results);
        read_double(s, "keyword_weight", cfg.search.keyword_weight);
        read_double(s, "vector_weight", cfg.search.vector_weight);
        read_uint(s, "path_timeout_ms", cfg.search.path_timeout_ms);
    }

    if (j.contains("store") && j["store"].is_object()) {
        auto& s = j["store"];
        read_string(s, "backend", cfg.store.backend);
        read_string(s, "path", cfg.store.path);
    }

    // Clamp values the algorithms cannot work with
    if (cfg.index.m < 2) cfg.index.m = 2;
    if (cfg.embedding.batch_concurrency == 0) cfg.embedding.batch_concurrency = 1;
    if (cfg.worker_threads == 0) cfg.worker_threads = 1;
    if (cfg.cluster.label_terms < 3) cfg.cluster.label_terms = 3;
    if (cfg.cluster.label_terms > 5) cfg.cluster.label_terms = 5;

    return cfg;
}

Config Config::load(const std::string& path) {
    std::string config_path = path.empty() ? expand_home("~/.clipmind/config.json") : path;
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config, using defaults: " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("CLIPMIND_ENCODER"))
        cfg.encoder.provider = v;
    if (const char* v = std::getenv("CLIPMIND_ENCODER_URL"))
        cfg.encoder.base_url = v;
    if (const char* v = std::getenv("CLIPMIND_ENCODER_MODEL"))
        cfg.encoder.model = v;
    if (const char* v = std::getenv("CLIPMIND_DB"))
        cfg.store.path = v;

    return cfg;
}

std::string Config::snapshot_path() const {
    if (!index.snapshot_path.empty()) return expand_home(index.snapshot_path);
    return expand_home("~/.clipmind/index.bin");
}

std::string Config::store_path() const {
    if (!store.path.empty()) return expand_home(store.path);
    return expand_home("~/.clipmind/library.db");
}

} // namespace clipmind
