#include <catch2/catch.hpp>
#include "config.hpp"
#include "event_bus.hpp"
#include "item_json.hpp"
#include "item_store.hpp"
#include "stores/memory_item_store.hpp"
#include "stores/sqlite_item_store.hpp"
#include <filesystem>
#include <unistd.h>

using namespace clipmind;

static std::string store_test_path() {
    return "/tmp/clipmind_test_store_" + std::to_string(getpid()) + ".db";
}

struct SqliteStoreFixture {
    std::string path = store_test_path();
    SqliteItemStore store{path};

    ~SqliteStoreFixture() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

static Item make_item(const std::string& id, const std::string& title) {
    Item item;
    item.id = id;
    item.title = title;
    item.channel = "Channel " + id;
    item.description = "About " + title;
    item.tags = {"alpha", "beta"};
    item.text_content = title;
    item.duration_seconds = 90.5;
    item.published_at = 1700000000;
    item.added_at = 1700000100;
    return item;
}

static Cluster make_cluster(const std::string& id, std::vector<ItemId> members) {
    Cluster c;
    c.id = id;
    c.label = "Label " + id;
    c.centroid = {0.6f, 0.8f};
    c.confidence_score = 0.75;
    c.member_ids = std::move(members);
    c.item_count = static_cast<uint32_t>(c.member_ids.size());
    c.updated_at = 42;
    return c;
}

struct EventLog {
    std::vector<std::string> added;
    std::vector<std::string> updated;
    std::vector<std::string> removed;

    void attach(EventBus& bus) {
        subscribe<ItemAddedEvent>(bus, [this](const ItemAddedEvent& e) { added.push_back(e.item_id); });
        subscribe<ItemUpdatedEvent>(bus, [this](const ItemUpdatedEvent& e) { updated.push_back(e.item_id); });
        subscribe<ItemRemovedEvent>(bus, [this](const ItemRemovedEvent& e) { removed.push_back(e.item_id); });
    }
};

// Behaviour shared by every backend.

static void check_put_and_events(ItemStore& store) {
    EventBus bus;
    EventLog log;
    log.attach(bus);
    store.set_event_bus(&bus);

    store.put_item(make_item("a", "First"));
    store.put_item(make_item("b", "Second"));
    store.put_item(make_item("a", "First again"));

    REQUIRE(store.count() == 2);
    REQUIRE(log.added == std::vector<std::string>{"a", "b"});
    REQUIRE(log.updated == std::vector<std::string>{"a"});

    auto a = store.get_item("a");
    REQUIRE(a.has_value());
    REQUIRE(a->title == "First again");
    REQUIRE_FALSE(store.get_item("zzz").has_value());

    REQUIRE(store.remove_item("b"));
    REQUIRE_FALSE(store.remove_item("b"));
    REQUIRE(log.removed == std::vector<std::string>{"b"});
    REQUIRE(store.count() == 1);

    store.set_event_bus(nullptr);
}

static void check_embedding_flags(ItemStore& store) {
    auto item = make_item("e1", "Embeddable");
    item.needs_indexing = false;
    store.put_item(item);
    store.put_item(make_item("e2", "Plain"));

    REQUIRE(store.all_items_with_embeddings().empty());

    REQUIRE(store.update_embedding("e1", {0.25f, -0.5f, 1.0f}));
    REQUIRE_FALSE(store.update_embedding("missing", {1.0f}));

    auto got = store.get_item("e1");
    REQUIRE(got.has_value());
    REQUIRE(got->has_embedding());
    REQUIRE(*got->embedding == Embedding{0.25f, -0.5f, 1.0f});
    REQUIRE(got->needs_indexing);

    REQUIRE(store.set_needs_indexing("e1", false));
    REQUIRE_FALSE(store.get_item("e1")->needs_indexing);
    REQUIRE_FALSE(store.set_needs_indexing("missing", true));

    auto embedded = store.all_items_with_embeddings();
    REQUIRE(embedded.size() == 1);
    REQUIRE(embedded[0].id == "e1");
}

static void check_clusters(ItemStore& store) {
    for (const char* id : {"i1", "i2", "i3", "i4"}) store.put_item(make_item(id, id));

    store.save_clusters({make_cluster("c1", {"i1", "i3"}), make_cluster("c2", {"i2"})});

    REQUIRE(store.get_item("i1")->cluster_id == std::optional<ClusterId>("c1"));
    REQUIRE(store.get_item("i2")->cluster_id == std::optional<ClusterId>("c2"));
    REQUIRE_FALSE(store.get_item("i4")->cluster_id.has_value());

    auto loaded = store.load_clusters();
    REQUIRE(loaded.size() == 2);
    REQUIRE(loaded[0].id == "c1");
    REQUIRE(loaded[0].label == "Label c1");
    REQUIRE(loaded[0].member_ids == std::vector<ItemId>{"i1", "i3"});
    REQUIRE(loaded[0].item_count == 2);
    REQUIRE(loaded[0].centroid == Embedding{0.6f, 0.8f});
    REQUIRE(loaded[1].member_ids == std::vector<ItemId>{"i2"});

    // Membership follows item assignments
    REQUIRE(store.update_cluster_assignment("i4", ClusterId("c2")));
    REQUIRE(store.update_cluster_assignment("i3", std::nullopt));
    REQUIRE_FALSE(store.update_cluster_assignment("missing", ClusterId("c1")));
    store.remove_item("i2");

    loaded = store.load_clusters();
    REQUIRE(loaded[0].member_ids == std::vector<ItemId>{"i1"});
    REQUIRE(loaded[1].member_ids == std::vector<ItemId>{"i4"});
    REQUIRE(loaded[1].item_count == 1);

    // Replacing the table clears stale assignments
    store.save_clusters({make_cluster("c3", {"i3"})});
    REQUIRE_FALSE(store.get_item("i1")->cluster_id.has_value());
    REQUIRE_FALSE(store.get_item("i4")->cluster_id.has_value());
    loaded = store.load_clusters();
    REQUIRE(loaded.size() == 1);
    REQUIRE(loaded[0].id == "c3");
    REQUIRE(loaded[0].member_ids == std::vector<ItemId>{"i3"});
}

// ── MemoryItemStore ──────────────────────────────────────────

TEST_CASE("MemoryItemStore: put, get, remove and events", "[item_store]") {
    MemoryItemStore store;
    REQUIRE(store.backend_name() == "memory");
    check_put_and_events(store);
}

TEST_CASE("MemoryItemStore: embeddings and indexing flag", "[item_store]") {
    MemoryItemStore store;
    check_embedding_flags(store);
}

TEST_CASE("MemoryItemStore: clusters rebuilt from assignments", "[item_store]") {
    MemoryItemStore store;
    check_clusters(store);
}

TEST_CASE("MemoryItemStore: all_items ordered by id", "[item_store]") {
    MemoryItemStore store;
    store.put_item(make_item("b", "B"));
    store.put_item(make_item("c", "C"));
    store.put_item(make_item("a", "A"));
    auto all = store.all_items();
    REQUIRE(all.size() == 3);
    REQUIRE(all[0].id == "a");
    REQUIRE(all[1].id == "b");
    REQUIRE(all[2].id == "c");
}

TEST_CASE("ItemStore: no bus means no events", "[item_store]") {
    MemoryItemStore store;
    store.put_item(make_item("a", "A"));
    REQUIRE(store.remove_item("a"));
    REQUIRE(store.count() == 0);
}

// ── SqliteItemStore ──────────────────────────────────────────

TEST_CASE("SqliteItemStore: put, get, remove and events", "[item_store][sqlite]") {
    SqliteStoreFixture f;
    REQUIRE(f.store.backend_name() == "sqlite");
    check_put_and_events(f.store);
}

TEST_CASE("SqliteItemStore: embeddings and indexing flag", "[item_store][sqlite]") {
    SqliteStoreFixture f;
    check_embedding_flags(f.store);
}

TEST_CASE("SqliteItemStore: clusters rebuilt from assignments", "[item_store][sqlite]") {
    SqliteStoreFixture f;
    check_clusters(f.store);
}

TEST_CASE("SqliteItemStore: fields round-trip", "[item_store][sqlite]") {
    SqliteStoreFixture f;
    auto item = make_item("yt:1", "Round trip");
    item.ocr_text = "SLIDE TEXT";
    item.source = ItemSource::Local;
    item.embedding = Embedding{1.0f, 0.0f};
    item.cluster_id = "c9";
    item.needs_indexing = false;
    f.store.put_item(item);

    auto got = f.store.get_item("yt:1");
    REQUIRE(got.has_value());
    REQUIRE(got->title == "Round trip");
    REQUIRE(got->channel == "Channel yt:1");
    REQUIRE(got->description == "About Round trip");
    REQUIRE(got->tags == std::vector<std::string>{"alpha", "beta"});
    REQUIRE(got->ocr_text == "SLIDE TEXT");
    REQUIRE(got->text_content == "Round trip");
    REQUIRE(got->source == ItemSource::Local);
    REQUIRE(got->duration_seconds == 90.5);
    REQUIRE(got->published_at == 1700000000);
    REQUIRE(got->added_at == 1700000100);
    REQUIRE(got->embedding == std::optional<Embedding>(Embedding{1.0f, 0.0f}));
    REQUIRE(got->cluster_id == std::optional<ClusterId>("c9"));
    REQUIRE_FALSE(got->needs_indexing);
}

TEST_CASE("SqliteItemStore: data survives reopen", "[item_store][sqlite]") {
    std::string path = store_test_path();
    {
        SqliteItemStore store(path);
        store.put_item(make_item("keep", "Kept"));
        store.update_embedding("keep", {0.0f, 1.0f});
        store.save_clusters({make_cluster("c1", {"keep"})});
    }
    {
        SqliteItemStore store(path);
        REQUIRE(store.count() == 1);
        auto got = store.get_item("keep");
        REQUIRE(got.has_value());
        REQUIRE(got->has_embedding());
        auto clusters = store.load_clusters();
        REQUIRE(clusters.size() == 1);
        REQUIRE(clusters[0].member_ids == std::vector<ItemId>{"keep"});
    }
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
}

TEST_CASE("SqliteItemStore: unopenable path throws", "[item_store][sqlite]") {
    REQUIRE_THROWS_AS(SqliteItemStore("/proc/clipmind_nope/library.db"), std::runtime_error);
}

// ── Factory ──────────────────────────────────────────────────

TEST_CASE("create_item_store: selects backend", "[item_store]") {
    Config cfg;
    cfg.store.backend = "memory";
    REQUIRE(create_item_store(cfg)->backend_name() == "memory");

    cfg.store.backend = "carrier-pigeon";
    REQUIRE(create_item_store(cfg)->backend_name() == "memory");

    SqliteStoreFixture cleanup;
    cfg.store.backend = "sqlite";
    cfg.store.path = cleanup.path;
    REQUIRE(create_item_store(cfg)->backend_name() == "sqlite");
}

// ── JSON mapping ─────────────────────────────────────────────

TEST_CASE("item_from_json: reads fields and builds text", "[item_store]") {
    auto j = nlohmann::json::parse(R"({
        "id": "yt:abc",
        "title": "Knife Skills",
        "channel": "Kitchen Lab",
        "tags": ["cooking", 7, "knives"],
        "source": "local",
        "duration_seconds": 300.5,
        "published_at": 1690000000,
        "embedding": [0.5, "x"]
    })");
    Item item = item_from_json(j);
    REQUIRE(item.id == "yt:abc");
    REQUIRE(item.tags == std::vector<std::string>{"cooking", "knives"});
    REQUIRE(item.source == ItemSource::Local);
    REQUIRE(item.duration_seconds == 300.5);
    REQUIRE(item.published_at == 1690000000);
    REQUIRE(item.added_at > 0);
    REQUIRE_FALSE(item.embedding.has_value());
    REQUIRE(item.text_content.find("Knife Skills") != std::string::npos);

    auto out = item_to_json(item);
    REQUIRE(out["id"] == "yt:abc");
    REQUIRE(out["source"] == "local");
    REQUIRE_FALSE(out.contains("cluster_id"));
}

TEST_CASE("cluster_to_json: members and label", "[item_store]") {
    auto j = cluster_to_json(make_cluster("c4", {"a", "b"}));
    REQUIRE(j["id"] == "c4");
    REQUIRE(j["label"] == "Label c4");
    REQUIRE(j["item_count"] == 2);
    REQUIRE(j["members"].size() == 2);
}
