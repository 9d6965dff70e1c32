#include "metadata_text.hpp"
#include "util.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <unordered_set>

namespace clipmind {

namespace {

const std::unordered_set<std::string>& generic_tags() {
    static const std::unordered_set<std::string> tags = {
        "shorts", "short", "viral", "trending", "fyp", "foryou", "foryoupage",
        "video", "videos", "youtube", "youtuber", "subscribe", "like",
        "new", "best", "funny", "vlog", "explore", "reels", "tiktok"
    };
    return tags;
}

constexpr std::array<const char*, 5> kSpamVerbs = {
    "follow", "subscribe", "like", "share", "comment"
};
constexpr std::array<const char*, 9> kSpamObjects = {
    "me", "us", "for", "to", "and", "if", "the", "my", "our"
};

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

// Match `word` at lower[pos] followed by a non-word character (or end).
// Returns the length matched, or 0.
size_t match_word(const std::string& lower, size_t pos, const char* word) {
    size_t len = std::strlen(word);
    if (lower.compare(pos, len, word) != 0) return 0;
    if (pos + len < lower.size() && is_word_char(lower[pos + len])) return 0;
    return len;
}

// Length of a spam phrase starting at pos (through its sentence terminator),
// or 0 when none starts here.
size_t spam_phrase_length(const std::string& lower, size_t pos) {
    size_t verb_len = 0;
    for (const char* verb : kSpamVerbs) {
        verb_len = match_word(lower, pos, verb);
        if (verb_len) break;
    }
    if (!verb_len) return 0;

    size_t p = pos + verb_len;
    size_t ws = p;
    while (p < lower.size() && std::isspace(static_cast<unsigned char>(lower[p]))) ++p;
    if (p == ws) return 0;

    size_t obj_len = 0;
    for (const char* obj : kSpamObjects) {
        obj_len = match_word(lower, p, obj);
        if (obj_len) break;
    }
    if (!obj_len) return 0;

    p += obj_len;
    while (p < lower.size() && lower[p] != '.' && lower[p] != '!' && lower[p] != '?') ++p;
    if (p < lower.size()) ++p; // include terminator
    return p - pos;
}

std::string remove_spam_phrases(const std::string& text) {
    std::string lower = to_lower(text);
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        bool at_boundary = (i == 0) || !is_word_char(text[i - 1]);
        if (at_boundary) {
            size_t skip = spam_phrase_length(lower, i);
            if (skip) {
                i += skip;
                continue;
            }
        }
        out += text[i++];
    }
    return out;
}

// "!!!" / "???" / "...." -> single character
std::string squash_punctuation_runs(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c == '!' || c == '?' || c == '.') {
            size_t j = i;
            while (j < text.size() && text[j] == c) ++j;
            if (j - i >= 3) {
                out += c;
            } else {
                out.append(text, i, j - i);
            }
            i = j;
        } else {
            out += c;
            ++i;
        }
    }
    return out;
}

} // namespace

std::string clean_text(const std::string& text) {
    return collapse_whitespace(text);
}

std::string strip_urls(const std::string& text) {
    std::string lower = to_lower(text);
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        bool at_boundary = (i == 0) || std::isspace(static_cast<unsigned char>(text[i - 1]));
        if (at_boundary &&
            (lower.compare(i, 7, "http://") == 0 ||
             lower.compare(i, 8, "https://") == 0 ||
             lower.compare(i, 4, "www.") == 0)) {
            while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
            continue;
        }
        out += text[i++];
    }
    return out;
}

std::string strip_html(const std::string& text) {
    static const std::array<std::pair<const char*, const char*>, 6> entities = {{
        {"&amp;", "&"}, {"&lt;", "<"}, {"&gt;", ">"},
        {"&quot;", "\""}, {"&#39;", "'"}, {"&nbsp;", " "}
    }};

    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c == '<') {
            size_t close = text.find('>', i);
            if (close != std::string::npos) {
                out += ' ';
                i = close + 1;
                continue;
            }
        } else if (c == '&') {
            bool decoded = false;
            for (const auto& [entity, replacement] : entities) {
                size_t len = std::strlen(entity);
                if (text.compare(i, len, entity) == 0) {
                    out += replacement;
                    i += len;
                    decoded = true;
                    break;
                }
            }
            if (decoded) continue;
        }
        out += c;
        ++i;
    }
    return out;
}

std::string clean_description(const std::string& text) {
    std::string cleaned = strip_urls(strip_html(text));
    cleaned = squash_punctuation_runs(cleaned);
    cleaned = remove_spam_phrases(cleaned);
    return clean_text(cleaned);
}

std::vector<std::string> process_tags(const std::vector<std::string>& tags) {
    std::unordered_set<std::string> seen;
    std::vector<std::string> result;

    for (const auto& tag : tags) {
        std::string cleaned = to_lower(trim(tag));
        if (cleaned.size() <= 1 || seen.count(cleaned)) continue;
        if (generic_tags().count(cleaned)) continue;

        seen.insert(cleaned);
        result.push_back(std::move(cleaned));
        if (result.size() >= kMaxTagsForEmbedding) break;
    }
    return result;
}

std::string build_item_text(const std::string& title,
                            const std::string& channel,
                            const std::vector<std::string>& tags,
                            const std::string& description,
                            const std::string& ocr_text) {
    std::vector<std::string> components;

    std::string cleaned_title = clean_text(title);
    if (!cleaned_title.empty()) components.push_back(std::move(cleaned_title));

    std::string cleaned_channel = clean_text(channel);
    if (!cleaned_channel.empty()) components.push_back("by " + cleaned_channel);

    auto processed = process_tags(tags);
    if (!processed.empty()) {
        std::string joined;
        for (const auto& t : processed) {
            if (!joined.empty()) joined += ' ';
            joined += t;
        }
        components.push_back(std::move(joined));
    }

    auto joined_length = [&components]() {
        size_t len = 0;
        for (const auto& c : components) len += c.size();
        if (!components.empty()) len += components.size() - 1;
        return len;
    };

    // +1 for the newline that will join the next component
    size_t used = joined_length() + 1;
    size_t remaining = kMaxTextChars > used ? kMaxTextChars - used : 0;
    if (!description.empty() && remaining > kMinDescriptionSpace) {
        std::string desc = truncate_at_word(clean_description(description), remaining);
        if (!desc.empty()) components.push_back(std::move(desc));
    }

    used = joined_length() + 1;
    remaining = kMaxTextChars > used ? kMaxTextChars - used : 0;
    if (!ocr_text.empty() && remaining > kMinOcrSpace) {
        std::string ocr = truncate_at_word(clean_text(ocr_text), remaining);
        if (!ocr.empty()) components.push_back(std::move(ocr));
    }

    std::string result;
    for (const auto& c : components) {
        if (!result.empty()) result += '\n';
        result += c;
    }
    if (result.size() > kMaxTextChars) {
        result = truncate_at_word(result, kMaxTextChars);
    }
    return result;
}

std::string normalize_for_embedding(const std::string& text, size_t max_chars) {
    std::string cleaned = to_lower(text);
    cleaned = strip_html(cleaned);
    cleaned = strip_urls(cleaned);
    cleaned = collapse_whitespace(cleaned);
    return truncate_at_word(cleaned, max_chars);
}

} // namespace clipmind
