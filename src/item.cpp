#include "item.hpp"
#include "metadata_text.hpp"

namespace clipmind {

std::string source_to_string(ItemSource source) {
    switch (source) {
        case ItemSource::YouTube: return "youtube";
        case ItemSource::Local:   return "local";
    }
    return "youtube";
}

ItemSource source_from_string(const std::string& s) {
    if (s == "local") return ItemSource::Local;
    return ItemSource::YouTube;
}

void refresh_text_content(Item& item) {
    item.text_content = build_item_text(item.title, item.channel, item.tags,
                                        item.description, item.ocr_text);
}

} // namespace clipmind
