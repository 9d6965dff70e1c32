#include "keywords.hpp"
#include "../util.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <unordered_set>

namespace clipmind {

namespace {

const std::unordered_set<std::string>& stopwords() {
    static const std::unordered_set<std::string> words = {
        "a", "about", "above", "after", "again", "against", "all", "am", "an",
        "and", "any", "are", "as", "at", "be", "because", "been", "before",
        "being", "below", "between", "both", "but", "by", "can", "could",
        "did", "do", "does", "doing", "down", "during", "each", "few", "for",
        "from", "further", "get", "got", "had", "has", "have", "having", "he",
        "her", "here", "hers", "him", "his", "how", "i", "if", "in", "into",
        "is", "it", "its", "itself", "just", "me", "more", "most", "my", "no",
        "nor", "not", "now", "of", "off", "on", "once", "only", "or", "other",
        "our", "ours", "out", "over", "own", "same", "she", "should", "so",
        "some", "such", "than", "that", "the", "their", "theirs", "them",
        "then", "there", "these", "they", "this", "those", "through", "to",
        "too", "under", "until", "up", "very", "was", "we", "were", "what",
        "when", "where", "which", "while", "who", "whom", "why", "will",
        "with", "would", "you", "your", "yours",
        // metadata filler
        "video", "videos", "official", "episode", "part", "full", "new",
        "channel", "watch", "vs", "ft", "feat", "amp", "www", "http", "https",
        "com"
    };
    return words;
}

bool is_token_char(char c) {
    auto u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isalnum(u) != 0;
}

bool is_number(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

} // namespace

bool is_stopword(const std::string& token) {
    return stopwords().count(token) > 0;
}

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : text) {
        if (is_token_char(c)) {
            current += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(std::move(current));
    return tokens;
}

std::vector<std::string> query_terms(const std::string& query) {
    std::vector<std::string> terms;
    for (auto& raw : split_whitespace(to_lower(query))) {
        // Terms are matched as typed; only the stopword test ignores punctuation
        size_t start = 0;
        size_t end = raw.size();
        while (start < end && !is_token_char(raw[start])) start++;
        while (end > start && !is_token_char(raw[end - 1])) end--;
        if (start == end) continue;
        if (is_stopword(raw.substr(start, end - start))) continue;
        terms.push_back(std::move(raw));
    }
    return terms;
}

std::vector<std::string> top_terms(const std::vector<const std::string*>& texts, size_t count) {
    // std::map keeps alphabetical order for the tie-break below
    std::map<std::string, size_t> freq;
    for (const std::string* text : texts) {
        if (!text) continue;
        for (auto& token : tokenize(*text)) {
            if (token.size() < 3 || is_number(token) || is_stopword(token)) continue;
            freq[token]++;
        }
    }

    std::vector<std::pair<std::string, size_t>> ranked(freq.begin(), freq.end());
    std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });

    std::vector<std::string> out;
    for (size_t i = 0; i < ranked.size() && i < count; i++) {
        out.push_back(ranked[i].first);
    }
    return out;
}

std::string title_case(const std::string& word) {
    std::string out = word;
    if (!out.empty()) {
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    }
    return out;
}

std::string make_label(const std::vector<std::string>& terms) {
    if (terms.empty()) return "Untitled";
    std::string label;
    for (size_t i = 0; i < terms.size(); i++) {
        if (i > 0) label += ", ";
        label += title_case(terms[i]);
    }
    return label;
}

} // namespace clipmind
