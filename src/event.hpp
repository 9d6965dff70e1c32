#pragma once
#include "item.hpp"
#include <string>
#include <cstdint>

namespace clipmind {

// Tag-based event dispatch: handlers cast on the tag, no RTTI.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* ItemAdded       = "ItemAdded";
    constexpr const char* ItemUpdated     = "ItemUpdated";
    constexpr const char* ItemRemoved     = "ItemRemoved";
    constexpr const char* ItemEmbedded    = "ItemEmbedded";
    constexpr const char* IndexRebuilt    = "IndexRebuilt";
    constexpr const char* ClustersUpdated = "ClustersUpdated";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

// Published by whoever imports into the store; the engine embeds and indexes.
struct ItemAddedEvent : Event {
    static constexpr const char* TAG = event_tags::ItemAdded;
    ItemId item_id;

    ItemAddedEvent() { type_tag = TAG; }
};

// Metadata changed; the embedding is stale.
struct ItemUpdatedEvent : Event {
    static constexpr const char* TAG = event_tags::ItemUpdated;
    ItemId item_id;

    ItemUpdatedEvent() { type_tag = TAG; }
};

struct ItemRemovedEvent : Event {
    static constexpr const char* TAG = event_tags::ItemRemoved;
    ItemId item_id;

    ItemRemovedEvent() { type_tag = TAG; }
};

struct ItemEmbeddedEvent : Event {
    static constexpr const char* TAG = event_tags::ItemEmbedded;
    ItemId item_id;
    bool success = false;
    std::string error;

    ItemEmbeddedEvent() { type_tag = TAG; }
};

struct IndexRebuiltEvent : Event {
    static constexpr const char* TAG = event_tags::IndexRebuilt;
    size_t item_count = 0;

    IndexRebuiltEvent() { type_tag = TAG; }
};

struct ClustersUpdatedEvent : Event {
    static constexpr const char* TAG = event_tags::ClustersUpdated;
    size_t cluster_count = 0;
    size_t item_count = 0;
    double modularity = 0.0;

    ClustersUpdatedEvent() { type_tag = TAG; }
};

} // namespace clipmind
