#pragma once
#include "../item_store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace clipmind {

// Items and clusters in one SQLite file. Embeddings are raw float BLOBs.
class SqliteItemStore : public ItemStore {
public:
    // Throws std::runtime_error if the database cannot be opened.
    explicit SqliteItemStore(const std::string& path);
    ~SqliteItemStore() override;

    // Non-copyable
    SqliteItemStore(const SqliteItemStore&) = delete;
    SqliteItemStore& operator=(const SqliteItemStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    std::vector<Item> all_items() override;
    std::vector<Item> all_items_with_embeddings() override;
    std::optional<Item> get_item(const ItemId& id) override;
    uint32_t count() override;

    void put_item(const Item& item) override;
    bool remove_item(const ItemId& id) override;
    bool update_embedding(const ItemId& id, const Embedding& embedding) override;
    bool set_needs_indexing(const ItemId& id, bool needs_indexing) override;
    bool update_cluster_assignment(const ItemId& id,
                                   const std::optional<ClusterId>& cluster) override;

    void save_clusters(const std::vector<Cluster>& clusters) override;
    std::vector<Cluster> load_clusters() override;

private:
    void init_schema();
    std::vector<Item> select_items(const char* where_clause);

    sqlite3* db_ = nullptr;
    std::string path_;
    std::mutex mutex_;
};

} // namespace clipmind
