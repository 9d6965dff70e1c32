#pragma once
#include <string>
#include <vector>

namespace clipmind {

// English stopwords plus the filler words common in video metadata.
// Expects a lowercase token.
bool is_stopword(const std::string& token);

// Lowercase word tokens. Non-ASCII bytes count as word characters so UTF-8
// words stay whole.
std::vector<std::string> tokenize(const std::string& text);

// Query terms for keyword search: lowercase, whitespace split, surrounding
// punctuation trimmed, stopwords removed.
std::vector<std::string> query_terms(const std::string& query);

// Most frequent non-stopword terms across `texts`, ties alphabetical.
// Numbers and tokens shorter than three bytes are skipped.
std::vector<std::string> top_terms(const std::vector<const std::string*>& texts, size_t count);

// "machine" -> "Machine". ASCII only; other bytes pass through.
std::string title_case(const std::string& word);

// "Cooking, Pasta, Recipe", or "Untitled" for no terms.
std::string make_label(const std::vector<std::string>& terms);

} // namespace clipmind
