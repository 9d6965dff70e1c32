#pragma once
#include "item.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>

namespace clipmind {

// JSON mapping for the CLI: import documents and --json output.

inline Item item_from_json(const nlohmann::json& j) {
    Item item;
    item.id = j.value("id", "");
    item.title = j.value("title", "");
    item.channel = j.value("channel", "");
    item.description = j.value("description", "");
    item.ocr_text = j.value("ocr_text", "");
    if (j.contains("tags") && j["tags"].is_array()) {
        for (const auto& t : j["tags"]) {
            if (t.is_string()) item.tags.push_back(t.get<std::string>());
        }
    }
    item.source = source_from_string(j.value("source", "youtube"));
    item.duration_seconds = j.value("duration_seconds", 0.0);
    item.published_at = j.value("published_at", uint64_t{0});
    item.added_at = j.value("added_at", uint64_t{0});
    if (item.added_at == 0) item.added_at = epoch_seconds();
    if (j.contains("embedding") && j["embedding"].is_array() && !j["embedding"].empty()) {
        Embedding emb;
        emb.reserve(j["embedding"].size());
        for (const auto& v : j["embedding"]) {
            if (v.is_number()) emb.push_back(v.get<float>());
        }
        if (emb.size() == j["embedding"].size()) item.embedding = std::move(emb);
    }
    if (j.contains("cluster_id") && j["cluster_id"].is_string()) {
        item.cluster_id = j["cluster_id"].get<std::string>();
    }
    refresh_text_content(item);
    return item;
}

inline nlohmann::json item_to_json(const Item& item) {
    nlohmann::json j = {
        {"id", item.id},
        {"title", item.title},
        {"channel", item.channel},
        {"description", item.description},
        {"tags", item.tags},
        {"source", source_to_string(item.source)},
        {"duration_seconds", item.duration_seconds},
        {"published_at", item.published_at},
        {"added_at", item.added_at}
    };
    if (!item.ocr_text.empty()) j["ocr_text"] = item.ocr_text;
    if (item.cluster_id) j["cluster_id"] = *item.cluster_id;
    return j;
}

inline nlohmann::json cluster_to_json(const Cluster& cluster) {
    return {
        {"id", cluster.id},
        {"label", cluster.label},
        {"custom_label", cluster.custom_label},
        {"item_count", cluster.item_count},
        {"confidence", cluster.confidence_score},
        {"members", cluster.member_ids},
        {"updated_at", cluster.updated_at}
    };
}

} // namespace clipmind
