#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace clipmind {

using ItemId = std::string;
using ClusterId = std::string;
using Embedding = std::vector<float>;

enum class ItemSource { YouTube, Local };

// One library entry. Holds a cluster id reference, never a pointer.
struct Item {
    ItemId id;

    // Raw metadata as imported
    std::string title;
    std::string channel;
    std::string description;
    std::vector<std::string> tags;
    std::string ocr_text;

    // Cleaned concatenation of the metadata above (see build_item_text)
    std::string text_content;

    std::optional<Embedding> embedding;
    std::optional<ClusterId> cluster_id;

    ItemSource source = ItemSource::YouTube;
    double duration_seconds = 0.0;
    uint64_t published_at = 0;   // epoch seconds, 0 = unknown
    uint64_t added_at = 0;       // epoch seconds
    bool needs_indexing = true;

    bool has_embedding() const { return embedding.has_value() && !embedding->empty(); }

    // published_at when known, otherwise added_at
    uint64_t recency() const { return published_at ? published_at : added_at; }
};

// A detected topic group. Members are id back-references.
struct Cluster {
    ClusterId id;
    std::string label;
    bool custom_label = false;   // user override, survives re-clustering
    Embedding centroid;
    uint32_t item_count = 0;
    double confidence_score = 0.0;
    std::vector<ItemId> member_ids;
    uint64_t updated_at = 0;
};

std::string source_to_string(ItemSource source);
ItemSource source_from_string(const std::string& s);

// Fill text_content from the item's raw metadata.
void refresh_text_content(Item& item);

} // namespace clipmind
