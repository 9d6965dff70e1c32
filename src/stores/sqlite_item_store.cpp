#include "sqlite_item_store.hpp"
#include "../util.hpp"
#include "../vector_math.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace clipmind {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

static const char* kItemColumns =
    "id, title, channel, description, tags, ocr_text, text_content, embedding,"
    " cluster_id, source, duration, published_at, added_at, needs_indexing";

static std::string column_string(sqlite3_stmt* stmt, int col) {
    if (auto* v = sqlite3_column_text(stmt, col)) return reinterpret_cast<const char*>(v);
    return {};
}

static std::string column_blob(sqlite3_stmt* stmt, int col) {
    const void* blob = sqlite3_column_blob(stmt, col);
    int size = sqlite3_column_bytes(stmt, col);
    if (!blob || size <= 0) return {};
    return std::string(static_cast<const char*>(blob), static_cast<size_t>(size));
}

static std::vector<std::string> tags_from_column(const std::string& text) {
    std::vector<std::string> tags;
    if (text.empty()) return tags;
    try {
        auto j = nlohmann::json::parse(text);
        if (!j.is_array()) return tags;
        for (const auto& t : j) {
            if (t.is_string()) tags.push_back(t.get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[store] Malformed tags column: " << e.what() << "\n";
    }
    return tags;
}

// Helper: read a full Item from a statement that selected kItemColumns.
static Item item_from_stmt(sqlite3_stmt* stmt) {
    Item item;
    item.id           = column_string(stmt, 0);
    item.title        = column_string(stmt, 1);
    item.channel      = column_string(stmt, 2);
    item.description  = column_string(stmt, 3);
    item.tags         = tags_from_column(column_string(stmt, 4));
    item.ocr_text     = column_string(stmt, 5);
    item.text_content = column_string(stmt, 6);
    auto emb = deserialize_vector(column_blob(stmt, 7));
    if (!emb.empty()) item.embedding = std::move(emb);
    if (sqlite3_column_type(stmt, 8) != SQLITE_NULL) item.cluster_id = column_string(stmt, 8);
    item.source           = source_from_string(column_string(stmt, 9));
    item.duration_seconds = sqlite3_column_double(stmt, 10);
    item.published_at     = static_cast<uint64_t>(sqlite3_column_int64(stmt, 11));
    item.added_at         = static_cast<uint64_t>(sqlite3_column_int64(stmt, 12));
    item.needs_indexing   = sqlite3_column_int(stmt, 13) != 0;
    return item;
}

SqliteItemStore::SqliteItemStore(const std::string& path) : path_(path) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteItemStore: failed to open database: " + err);
    }

    // Performance pragmas
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA temp_store=MEMORY;", nullptr, nullptr, nullptr);

    init_schema();
}

SqliteItemStore::~SqliteItemStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteItemStore::init_schema() {
    const char* create_items =
        "CREATE TABLE IF NOT EXISTS items ("
        "  id             TEXT PRIMARY KEY,"
        "  title          TEXT NOT NULL,"
        "  channel        TEXT NOT NULL,"
        "  description    TEXT NOT NULL,"
        "  tags           TEXT NOT NULL,"
        "  ocr_text       TEXT NOT NULL,"
        "  text_content   TEXT NOT NULL,"
        "  embedding      BLOB,"
        "  cluster_id     TEXT,"
        "  source         TEXT NOT NULL,"
        "  duration       REAL NOT NULL,"
        "  published_at   INTEGER NOT NULL,"
        "  added_at       INTEGER NOT NULL,"
        "  needs_indexing INTEGER NOT NULL"
        ");";
    const char* create_clusters =
        "CREATE TABLE IF NOT EXISTS clusters ("
        "  id           TEXT PRIMARY KEY,"
        "  label        TEXT NOT NULL,"
        "  custom_label INTEGER NOT NULL,"
        "  centroid     BLOB,"
        "  confidence   REAL NOT NULL,"
        "  updated_at   INTEGER NOT NULL"
        ");";

    char* err = nullptr;
    for (const char* sql : {create_items, create_clusters}) {
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : "unknown error";
            sqlite3_free(err);
            throw std::runtime_error("SqliteItemStore: schema creation failed: " + msg);
        }
    }
    sqlite3_exec(db_, "CREATE INDEX IF NOT EXISTS items_cluster ON items(cluster_id);",
                 nullptr, nullptr, nullptr);
}

std::vector<Item> SqliteItemStore::select_items(const char* where_clause) {
    std::string sql = std::string("SELECT ") + kItemColumns + " FROM items " +
                      where_clause + " ORDER BY id;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[store] Query failed: " << sqlite3_errmsg(db_) << "\n";
        return {};
    }
    std::vector<Item> items;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        items.push_back(item_from_stmt(g.stmt));
    }
    return items;
}

std::vector<Item> SqliteItemStore::all_items() {
    std::lock_guard<std::mutex> lock(mutex_);
    return select_items("");
}

std::vector<Item> SqliteItemStore::all_items_with_embeddings() {
    std::lock_guard<std::mutex> lock(mutex_);
    return select_items("WHERE embedding IS NOT NULL AND length(embedding) > 0");
}

std::optional<Item> SqliteItemStore::get_item(const ItemId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string("SELECT ") + kItemColumns + " FROM items WHERE id = ?;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_text(g.stmt, 1, id.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return std::nullopt;
    return item_from_stmt(g.stmt);
}

uint32_t SqliteItemStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM items;", -1, &g.stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
}

void SqliteItemStore::put_item(const Item& item) {
    bool existed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        {
            StmtGuard g;
            const char* sql = "SELECT 1 FROM items WHERE id = ?;";
            if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) == SQLITE_OK) {
                sqlite3_bind_text(g.stmt, 1, item.id.c_str(), -1, SQLITE_STATIC);
                existed = sqlite3_step(g.stmt) == SQLITE_ROW;
            }
        }

        std::string sql = std::string("INSERT OR REPLACE INTO items (") + kItemColumns +
                          ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
        StmtGuard g;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
            std::cerr << "[store] Failed to prepare insert: " << sqlite3_errmsg(db_) << "\n";
            return;
        }

        std::string tags = nlohmann::json(item.tags).dump();
        std::string blob = item.embedding ? serialize_vector(*item.embedding) : std::string();
        std::string source = source_to_string(item.source);

        sqlite3_bind_text(g.stmt, 1, item.id.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(g.stmt, 2, item.title.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(g.stmt, 3, item.channel.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(g.stmt, 4, item.description.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(g.stmt, 5, tags.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(g.stmt, 6, item.ocr_text.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(g.stmt, 7, item.text_content.c_str(), -1, SQLITE_STATIC);
        if (blob.empty()) {
            sqlite3_bind_null(g.stmt, 8);
        } else {
            sqlite3_bind_blob(g.stmt, 8, blob.data(), static_cast<int>(blob.size()), SQLITE_STATIC);
        }
        if (item.cluster_id) {
            sqlite3_bind_text(g.stmt, 9, item.cluster_id->c_str(), -1, SQLITE_STATIC);
        } else {
            sqlite3_bind_null(g.stmt, 9);
        }
        sqlite3_bind_text(g.stmt, 10, source.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_double(g.stmt, 11, item.duration_seconds);
        sqlite3_bind_int64(g.stmt, 12, static_cast<int64_t>(item.published_at));
        sqlite3_bind_int64(g.stmt, 13, static_cast<int64_t>(item.added_at));
        sqlite3_bind_int(g.stmt, 14, item.needs_indexing ? 1 : 0);

        if (sqlite3_step(g.stmt) != SQLITE_DONE) {
            std::cerr << "[store] Failed to store item " << item.id << ": "
                      << sqlite3_errmsg(db_) << "\n";
            return;
        }
    }
    if (existed) notify_updated(item.id);
    else notify_added(item.id);
}

bool SqliteItemStore::remove_item(const ItemId& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        StmtGuard g;
        const char* sql = "DELETE FROM items WHERE id = ?;";
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return false;
        sqlite3_bind_text(g.stmt, 1, id.c_str(), -1, SQLITE_STATIC);
        sqlite3_step(g.stmt);
        if (sqlite3_changes(db_) == 0) return false;
    }
    notify_removed(id);
    return true;
}

bool SqliteItemStore::update_embedding(const ItemId& id, const Embedding& embedding) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    const char* sql = "UPDATE items SET embedding = ?, needs_indexing = 1 WHERE id = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return false;
    std::string blob = serialize_vector(embedding);
    sqlite3_bind_blob(g.stmt, 1, blob.data(), static_cast<int>(blob.size()), SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, id.c_str(), -1, SQLITE_STATIC);
    sqlite3_step(g.stmt);
    return sqlite3_changes(db_) > 0;
}

bool SqliteItemStore::set_needs_indexing(const ItemId& id, bool needs_indexing) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    const char* sql = "UPDATE items SET needs_indexing = ? WHERE id = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return false;
    sqlite3_bind_int(g.stmt, 1, needs_indexing ? 1 : 0);
    sqlite3_bind_text(g.stmt, 2, id.c_str(), -1, SQLITE_STATIC);
    sqlite3_step(g.stmt);
    return sqlite3_changes(db_) > 0;
}

bool SqliteItemStore::update_cluster_assignment(const ItemId& id,
                                                const std::optional<ClusterId>& cluster) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    const char* sql = "UPDATE items SET cluster_id = ? WHERE id = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return false;
    if (cluster) sqlite3_bind_text(g.stmt, 1, cluster->c_str(), -1, SQLITE_STATIC);
    else sqlite3_bind_null(g.stmt, 1);
    sqlite3_bind_text(g.stmt, 2, id.c_str(), -1, SQLITE_STATIC);
    sqlite3_step(g.stmt);
    return sqlite3_changes(db_) > 0;
}

void SqliteItemStore::save_clusters(const std::vector<Cluster>& clusters) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_exec(db_, "BEGIN TRANSACTION;", nullptr, nullptr, nullptr);

    bool ok = sqlite3_exec(db_, "DELETE FROM clusters;", nullptr, nullptr, nullptr) == SQLITE_OK &&
              sqlite3_exec(db_, "UPDATE items SET cluster_id = NULL;", nullptr, nullptr, nullptr) == SQLITE_OK;

    StmtGuard insert;
    StmtGuard assign;
    ok = ok &&
        sqlite3_prepare_v2(db_,
            "INSERT INTO clusters (id, label, custom_label, centroid, confidence, updated_at)"
            " VALUES (?, ?, ?, ?, ?, ?);", -1, &insert.stmt, nullptr) == SQLITE_OK &&
        sqlite3_prepare_v2(db_, "UPDATE items SET cluster_id = ? WHERE id = ?;",
                           -1, &assign.stmt, nullptr) == SQLITE_OK;

    for (size_t i = 0; ok && i < clusters.size(); i++) {
        const auto& c = clusters[i];
        std::string blob = serialize_vector(c.centroid);
        sqlite3_reset(insert.stmt);
        sqlite3_bind_text(insert.stmt, 1, c.id.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(insert.stmt, 2, c.label.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int(insert.stmt, 3, c.custom_label ? 1 : 0);
        if (blob.empty()) sqlite3_bind_null(insert.stmt, 4);
        else sqlite3_bind_blob(insert.stmt, 4, blob.data(), static_cast<int>(blob.size()), SQLITE_STATIC);
        sqlite3_bind_double(insert.stmt, 5, c.confidence_score);
        sqlite3_bind_int64(insert.stmt, 6, static_cast<int64_t>(c.updated_at));
        ok = sqlite3_step(insert.stmt) == SQLITE_DONE;

        for (size_t m = 0; ok && m < c.member_ids.size(); m++) {
            sqlite3_reset(assign.stmt);
            sqlite3_bind_text(assign.stmt, 1, c.id.c_str(), -1, SQLITE_STATIC);
            sqlite3_bind_text(assign.stmt, 2, c.member_ids[m].c_str(), -1, SQLITE_STATIC);
            ok = sqlite3_step(assign.stmt) == SQLITE_DONE;
        }
    }

    if (ok) {
        sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr);
    } else {
        std::cerr << "[store] Failed to save clusters: " << sqlite3_errmsg(db_) << "\n";
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
}

std::vector<Cluster> SqliteItemStore::load_clusters() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Cluster> clusters;
    std::unordered_map<ClusterId, size_t> by_id;
    {
        StmtGuard g;
        const char* sql = "SELECT id, label, custom_label, centroid, confidence, updated_at"
                          " FROM clusters ORDER BY id;";
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return {};
        while (sqlite3_step(g.stmt) == SQLITE_ROW) {
            Cluster c;
            c.id = column_string(g.stmt, 0);
            c.label = column_string(g.stmt, 1);
            c.custom_label = sqlite3_column_int(g.stmt, 2) != 0;
            c.centroid = deserialize_vector(column_blob(g.stmt, 3));
            c.confidence_score = sqlite3_column_double(g.stmt, 4);
            c.updated_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 5));
            by_id[c.id] = clusters.size();
            clusters.push_back(std::move(c));
        }
    }
    {
        StmtGuard g;
        const char* sql = "SELECT id, cluster_id FROM items WHERE cluster_id IS NOT NULL ORDER BY id;";
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return clusters;
        while (sqlite3_step(g.stmt) == SQLITE_ROW) {
            auto it = by_id.find(column_string(g.stmt, 1));
            if (it != by_id.end()) clusters[it->second].member_ids.push_back(column_string(g.stmt, 0));
        }
    }
    for (auto& c : clusters) c.item_count = static_cast<uint32_t>(c.member_ids.size());
    return clusters;
}

} // namespace clipmind
