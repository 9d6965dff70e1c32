#include "config.hpp"
#include "encoder.hpp"
#include "engine.hpp"
#include "http.hpp"
#include "item_json.hpp"
#include "item_store.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <csignal>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: clipmind [options] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  import FILE          Import items from a JSON array (or {\"items\": [...]})\n"
              << "  remove ID            Remove an item from the library\n"
              << "  embed                Embed items that have no embedding yet\n"
              << "  index                Rebuild the vector index and save a snapshot\n"
              << "  cluster              Run a clustering pass\n"
              << "  clusters [--json]    List clusters\n"
              << "  show CLUSTER         List the items of one cluster\n"
              << "  rename CLUSTER LABEL Set a custom cluster label\n"
              << "  merge INTO FROM      Merge cluster FROM into INTO\n"
              << "  search QUERY         Hybrid keyword + semantic search\n"
              << "  stats                Library and index statistics\n"
              << "\n"
              << "Search options:\n"
              << "  --source NAME        youtube or local\n"
              << "  --cluster ID         Only items in this cluster\n"
              << "  --min-duration SECS  Minimum duration\n"
              << "  --max-duration SECS  Maximum duration\n"
              << "  --after EPOCH        Published at or after\n"
              << "  --before EPOCH       Published at or before\n"
              << "  --json               Print results as JSON\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH        Config file (default: ~/.clipmind/config.json)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  CLIPMIND_ENCODER     Encoder provider (ollama, openai, none)\n"
              << "  CLIPMIND_ENCODER_URL Base URL of the local model runtime\n"
              << "  CLIPMIND_ENCODER_MODEL Embedding model name\n"
              << "  CLIPMIND_DB          Library database path\n";
}

static bool parse_number(const char* text, double& out) {
    try {
        size_t used = 0;
        out = std::stod(text, &used);
        return used == std::strlen(text);
    } catch (const std::exception&) {
        return false;
    }
}

static int cmd_import(clipmind::Engine& engine, const std::string& path) {
    std::string content;
    if (!clipmind::read_file(path, content)) {
        std::cerr << "Error: cannot read " << path << "\n";
        return 1;
    }
    auto doc = nlohmann::json::parse(content, nullptr, false);
    if (doc.is_discarded()) {
        std::cerr << "Error: " << path << " is not valid JSON\n";
        return 1;
    }
    const nlohmann::json& list = doc.is_object() && doc.contains("items") ? doc["items"] : doc;
    if (!list.is_array()) {
        std::cerr << "Error: expected an array of items\n";
        return 1;
    }

    size_t imported = 0;
    size_t skipped = 0;
    for (const auto& entry : list) {
        if (g_shutdown.load()) break;
        if (!entry.is_object()) {
            skipped++;
            continue;
        }
        auto item = clipmind::item_from_json(entry);
        if (item.id.empty()) {
            skipped++;
            continue;
        }
        engine.add_item(std::move(item));
        imported++;
    }
    engine.save_index();
    std::cout << "Imported " << imported << " items";
    if (skipped) std::cout << " (" << skipped << " skipped)";
    std::cout << "\n";
    return 0;
}

static void print_cluster_line(const clipmind::Cluster& c) {
    std::cout << std::left << std::setw(8) << c.id << " "
              << std::right << std::setw(5) << c.item_count << "  "
              << std::fixed << std::setprecision(2) << c.confidence_score << "  "
              << c.label << (c.custom_label ? " *" : "") << "\n";
}

static int cmd_search(clipmind::Engine& engine, const std::vector<std::string>& args) {
    clipmind::SearchFilters filters;
    std::string query;
    bool as_json = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];
        bool has_value = i + 1 < args.size();
        double number = 0.0;
        if (a == "--json") {
            as_json = true;
        } else if (a == "--source" && has_value) {
            filters.source = clipmind::source_from_string(args[++i]);
        } else if (a == "--cluster" && has_value) {
            filters.cluster_id = args[++i];
        } else if ((a == "--min-duration" || a == "--max-duration" ||
                    a == "--after" || a == "--before") && has_value) {
            if (!parse_number(args[i + 1].c_str(), number) || number < 0) {
                std::cerr << "Error: " << a << " expects a non-negative number\n";
                return 1;
            }
            i++;
            if (a == "--min-duration") filters.min_duration = number;
            else if (a == "--max-duration") filters.max_duration = number;
            else if (a == "--after") filters.published_after = static_cast<uint64_t>(number);
            else filters.published_before = static_cast<uint64_t>(number);
        } else {
            if (!query.empty()) query += ' ';
            query += a;
        }
    }

    auto outcome = engine.search(query, filters);
    if (!outcome.ok) {
        std::cerr << "Error: search failed: " << outcome.error << "\n";
        return 1;
    }

    if (as_json) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& hit : outcome.hits) {
            auto item = engine.get_item(hit.id);
            nlohmann::json entry = item ? clipmind::item_to_json(*item)
                                        : nlohmann::json{{"id", hit.id}};
            entry["score"] = hit.score;
            entry["keyword_rank"] = hit.keyword_rank;
            entry["vector_rank"] = hit.vector_rank;
            out.push_back(std::move(entry));
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    if (outcome.hits.empty()) {
        std::cout << "No results.\n";
        return 0;
    }
    for (const auto& hit : outcome.hits) {
        std::cout << std::fixed << std::setprecision(4) << hit.score << "  " << hit.id;
        if (hit.keyword_rank) std::cout << "  kw#" << hit.keyword_rank;
        if (hit.vector_rank) std::cout << "  vec#" << hit.vector_rank;
        std::cout << "\n";
    }
    return 0;
}

static int run_command(clipmind::Engine& engine, const std::string& command,
                       const std::vector<std::string>& args) {
    if (command == "import") {
        if (args.size() != 1) {
            std::cerr << "Usage: clipmind import FILE\n";
            return 1;
        }
        return cmd_import(engine, args[0]);
    }

    if (command == "remove") {
        if (args.size() != 1) {
            std::cerr << "Usage: clipmind remove ID\n";
            return 1;
        }
        if (!engine.remove_item(args[0])) {
            std::cerr << "No item with id " << args[0] << "\n";
            return 1;
        }
        engine.save_index();
        std::cout << "Removed " << args[0] << "\n";
        return 0;
    }

    if (command == "embed") {
        auto summary = engine.embed_pending();
        engine.save_index();
        std::cout << "Embedded " << summary.embedded << ", failed " << summary.failed
                  << ", indexed " << summary.indexed << "\n";
        return summary.failed > 0 ? 2 : 0;
    }

    if (command == "index") {
        size_t n = engine.rebuild_index();
        if (!engine.save_index()) {
            std::cerr << "Error: could not write " << engine.config().snapshot_path() << "\n";
            return 1;
        }
        std::cout << "Indexed " << n << " items\n";
        return 0;
    }

    if (command == "cluster") {
        auto result = engine.recluster();
        if (result.cancelled) {
            std::cout << "Clustering cancelled.\n";
            return 1;
        }
        if (!result.ok) {
            std::cerr << "Error: clustering failed: " << result.error << "\n";
            return 1;
        }
        std::cout << result.cluster_count << " clusters over " << result.clustered_items
                  << " items (modularity " << std::fixed << std::setprecision(3)
                  << result.modularity << ")\n";
        return 0;
    }

    if (command == "clusters") {
        auto clusters = engine.list_clusters();
        if (!args.empty() && args[0] == "--json") {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& c : clusters) out.push_back(clipmind::cluster_to_json(c));
            std::cout << out.dump(2) << "\n";
            return 0;
        }
        if (clusters.empty()) {
            std::cout << "No clusters yet. Run `clipmind cluster`.\n";
            return 0;
        }
        for (const auto& c : clusters) print_cluster_line(c);
        return 0;
    }

    if (command == "show") {
        if (args.size() != 1) {
            std::cerr << "Usage: clipmind show CLUSTER\n";
            return 1;
        }
        auto cluster = engine.get_cluster(args[0]);
        if (!cluster) {
            std::cerr << "No cluster with id " << args[0] << "\n";
            return 1;
        }
        print_cluster_line(*cluster);
        for (const auto& id : cluster->member_ids) std::cout << "  " << id << "\n";
        return 0;
    }

    if (command == "rename") {
        if (args.size() < 2) {
            std::cerr << "Usage: clipmind rename CLUSTER LABEL\n";
            return 1;
        }
        std::string label;
        for (size_t i = 1; i < args.size(); i++) {
            if (i > 1) label += ' ';
            label += args[i];
        }
        if (!engine.rename_cluster(args[0], label)) {
            std::cerr << "Cannot rename " << args[0] << " to \"" << label << "\"\n";
            return 1;
        }
        std::cout << "Renamed " << args[0] << "\n";
        return 0;
    }

    if (command == "merge") {
        if (args.size() != 2) {
            std::cerr << "Usage: clipmind merge INTO FROM\n";
            return 1;
        }
        if (!engine.merge_clusters(args[0], args[1])) {
            std::cerr << "Cannot merge " << args[1] << " into " << args[0] << "\n";
            return 1;
        }
        std::cout << "Merged " << args[1] << " into " << args[0] << "\n";
        return 0;
    }

    if (command == "search") {
        if (args.empty()) {
            std::cerr << "Usage: clipmind search QUERY [filters]\n";
            return 1;
        }
        return cmd_search(engine, args);
    }

    if (command == "stats") {
        auto s = engine.stats();
        std::cout << "Items:       " << s.items << "\n"
                  << "Embedded:    " << s.embedded << "\n"
                  << "Indexed:     " << s.indexed << " (" << s.tombstones << " tombstones)\n"
                  << "Clusters:    " << s.clusters << " (" << s.clustered_items << " items)\n"
                  << "Recluster:   " << (engine.should_recluster() ? "due" : "not needed") << "\n";
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 1;
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (command.empty() && std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (command.empty()) {
            command = argv[i];
        } else {
            args.emplace_back(argv[i]);
        }
    }

    if (command.empty()) {
        print_usage();
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    clipmind::http_init();
    clipmind::http_set_abort_flag(&g_shutdown);
    auto config = clipmind::Config::load(config_path);

    clipmind::CurlHttpClient http_client;
    auto encoder = clipmind::create_text_encoder(config, http_client);
    if (!encoder) {
        std::cerr << "[main] No text encoder configured; search is keyword-only\n";
    }

    std::unique_ptr<clipmind::ItemStore> store;
    try {
        store = clipmind::create_item_store(config);
    } catch (const std::exception& e) {
        std::cerr << "Error opening library: " << e.what() << "\n";
        clipmind::http_cleanup();
        return 1;
    }

    int rc = 0;
    {
        clipmind::Engine engine(config, *store, encoder.get());
        engine.load_index();
        rc = run_command(engine, command, args);
    }

    clipmind::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
