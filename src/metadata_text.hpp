#pragma once
#include <string>
#include <vector>

namespace clipmind {

// Character budget for an item's text_content and for model input.
constexpr size_t kMaxTextChars = 1000;
constexpr size_t kMaxTagsForEmbedding = 10;
// Description / OCR are only appended when at least this much budget is left.
constexpr size_t kMinDescriptionSpace = 50;
constexpr size_t kMinOcrSpace = 20;

// Build an item's text_content. Priority order: title, "by <channel>",
// processed tags, description, OCR text. Components are newline-joined and
// the result never exceeds kMaxTextChars.
std::string build_item_text(const std::string& title,
                            const std::string& channel,
                            const std::vector<std::string>& tags,
                            const std::string& description,
                            const std::string& ocr_text);

// Whitespace normalisation for titles, channel names and OCR text.
std::string clean_text(const std::string& text);

// Aggressive cleaning for descriptions: URLs, punctuation runs and
// "subscribe for more"-style phrases are removed.
std::string clean_description(const std::string& text);

// Lowercase, dedupe, drop generic and single-character tags, cap the count.
std::vector<std::string> process_tags(const std::vector<std::string>& tags);

// Remove http(s):// and www. tokens.
std::string strip_urls(const std::string& text);

// Remove <tags> and decode the common entities.
std::string strip_html(const std::string& text);

// Model-input normalisation: lowercase, no URLs or HTML, single spaces,
// truncated to max_chars at a word boundary.
std::string normalize_for_embedding(const std::string& text, size_t max_chars = kMaxTextChars);

} // namespace clipmind
