#include <catch2/catch.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include <cmath>

using namespace clipmind;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.encoder.provider == "ollama");
    REQUIRE(cfg.index.m == 16);
    REQUIRE(cfg.index.ef_construction == 200);
    REQUIRE(cfg.graph.k == 10);
    REQUIRE(cfg.cluster.resolution == 1.0);
    REQUIRE(cfg.search.fusion == "rrf");
    REQUIRE(cfg.search.rrf_k == 60);
    REQUIRE(cfg.embedding.batch_concurrency == 10);
}

TEST_CASE("Config::from_json: defaults_json matches struct defaults", "[config]") {
    Config a = Config::from_json(Config::defaults_json());
    Config b;
    REQUIRE(a.index.seed == b.index.seed);
    REQUIRE(a.cluster.label_terms == b.cluster.label_terms);
    REQUIRE(a.search.path_timeout_ms == b.search.path_timeout_ms);
    REQUIRE(a.store.backend == b.store.backend);
    REQUIRE(a.worker_threads == b.worker_threads);
}

TEST_CASE("Config::from_json: reads nested sections", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "encoder": { "provider": "openai", "model": "text-embedding-3-small", "dimensions": 1536 },
        "index": { "m": 8, "seed": 7 },
        "cluster": { "resolution": 0.5, "label_terms": 4 },
        "search": { "fusion": "weighted", "keyword_weight": 0.3 }
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.encoder.provider == "openai");
    REQUIRE(cfg.encoder.dimensions == 1536);
    REQUIRE(cfg.index.m == 8);
    REQUIRE(cfg.index.seed == 7);
    REQUIRE(std::abs(cfg.cluster.resolution - 0.5) < 1e-6);
    REQUIRE(cfg.cluster.label_terms == 4);
    REQUIRE(cfg.search.fusion == "weighted");
    REQUIRE(std::abs(cfg.search.keyword_weight - 0.3) < 1e-6);
    // untouched keys keep defaults
    REQUIRE(cfg.index.ef_search == 100);
}

TEST_CASE("Config::from_json: ill-typed values keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "index": { "m": "lots", "ef_search": -5 },
        "graph": { "k": 2.5 },
        "worker_threads": true
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.index.m == 16);
    REQUIRE(cfg.index.ef_search == 100);
    REQUIRE(cfg.graph.k == 10);
    REQUIRE(cfg.worker_threads == 2);
}

TEST_CASE("Config::from_json: clamps unusable values", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "index": { "m": 1 },
        "cluster": { "label_terms": 9 },
        "embedding": { "batch_concurrency": 0 },
        "worker_threads": 0
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.index.m == 2);
    REQUIRE(cfg.cluster.label_terms == 5);
    REQUIRE(cfg.embedding.batch_concurrency == 1);
    REQUIRE(cfg.worker_threads == 1);
}

TEST_CASE("Config::from_json: non-object yields defaults", "[config]") {
    Config cfg = Config::from_json(nlohmann::json::array());
    REQUIRE(cfg.encoder.provider == "ollama");
}

// ── Config::load ────────────────────────────────────────────────

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "clipmind_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("CLIPMIND_ENCODER");
        unsetenv("CLIPMIND_ENCODER_URL");
        unsetenv("CLIPMIND_ENCODER_MODEL");
        unsetenv("CLIPMIND_DB");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.clipmind/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.clipmind");
        std::ofstream f(config_path());
        f << content;
    }

    nlohmann::json read_config() const {
        std::ifstream f(config_path());
        return nlohmann::json::parse(f);
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());
    g.write_config(R"({
        "store": { "backend": "memory" },
        "graph": { "k": 5 }
    })");

    Config cfg = Config::load();
    REQUIRE(cfg.store.backend == "memory");
    REQUIRE(cfg.graph.k == 5);
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({ "encoder": { "provider": "openai" } })");
    setenv("CLIPMIND_ENCODER", "none", 1);
    setenv("CLIPMIND_DB", "/tmp/elsewhere.db", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.encoder.provider == "none");
    REQUIRE(cfg.store_path() == "/tmp/elsewhere.db");

    unsetenv("CLIPMIND_ENCODER");
    unsetenv("CLIPMIND_DB");
}

TEST_CASE("Config::load: CLIPMIND_ENCODER_MODEL overrides the model", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({ "encoder": { "model": "from-file" } })");
    setenv("CLIPMIND_ENCODER_MODEL", "from-env", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.encoder.model == "from-env");

    unsetenv("CLIPMIND_ENCODER_MODEL");
    REQUIRE(Config::load().encoder.model == "from-file");
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config("{ not json");
    Config cfg = Config::load();
    REQUIRE(cfg.graph.k == 10);
    REQUIRE(cfg.store.backend == "sqlite");
}

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(std::filesystem::exists(g.config_path()));
    Config::load();
    REQUIRE(std::filesystem::exists(g.config_path()));
    REQUIRE(g.read_config() == Config::defaults_json());
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({ "cluster": { "resolution": 2.0 } })");

    Config cfg = Config::load();
    REQUIRE(std::abs(cfg.cluster.resolution - 2.0) < 1e-6);

    auto j = g.read_config();
    REQUIRE(j["cluster"]["resolution"] == 2.0);
    REQUIRE(j["cluster"].contains("label_terms"));
    REQUIRE(j.contains("search"));
}

TEST_CASE("Config::load: explicit path is honored", "[config]") {
    ConfigTestGuard g;
    std::string path = g.dir + "/custom.json";
    {
        std::ofstream f(path);
        f << R"({ "worker_threads": 4 })";
    }
    Config cfg = Config::load(path);
    REQUIRE(cfg.worker_threads == 4);
}

TEST_CASE("Config: default paths live under ~/.clipmind", "[config]") {
    ConfigTestGuard g;
    Config cfg;
    REQUIRE(cfg.snapshot_path() == g.dir + "/.clipmind/index.bin");
    REQUIRE(cfg.store_path() == g.dir + "/.clipmind/library.db");
    cfg.index.snapshot_path = "/var/tmp/x.bin";
    REQUIRE(cfg.snapshot_path() == "/var/tmp/x.bin");
}
