#include <catch2/catch.hpp>
#include "cluster/keywords.hpp"

using namespace clipmind;

TEST_CASE("tokenize: lowercase words split on punctuation", "[keywords]") {
    REQUIRE(tokenize("Hello, World! C++ rocks") ==
            std::vector<std::string>{"hello", "world", "c", "rocks"});
}

TEST_CASE("tokenize: UTF-8 words stay whole", "[keywords]") {
    REQUIRE(tokenize("caf\xc3\xa9 au lait") ==
            std::vector<std::string>{"caf\xc3\xa9", "au", "lait"});
}

TEST_CASE("is_stopword: common and filler words", "[keywords]") {
    REQUIRE(is_stopword("the"));
    REQUIRE(is_stopword("video"));
    REQUIRE_FALSE(is_stopword("pasta"));
}

TEST_CASE("query_terms: lowercases and drops stopwords", "[keywords]") {
    REQUIRE(query_terms("  How to make Fresh PASTA ") ==
            std::vector<std::string>{"make", "fresh", "pasta"});
}

TEST_CASE("query_terms: keeps punctuation inside terms", "[keywords]") {
    REQUIRE(query_terms("C++ node.js") == std::vector<std::string>{"c++", "node.js"});
    REQUIRE(query_terms("pasta?!") == std::vector<std::string>{"pasta?!"});
}

TEST_CASE("query_terms: punctuated stopwords and bare punctuation are dropped", "[keywords]") {
    REQUIRE(query_terms("(the) C# -- \"and\"") == std::vector<std::string>{"c#"});
}

TEST_CASE("query_terms: stopword-only query is empty", "[keywords]") {
    REQUIRE(query_terms("the and of").empty());
    REQUIRE(query_terms("   ").empty());
}

TEST_CASE("top_terms: by frequency, ties alphabetical", "[keywords]") {
    std::string a = "pasta recipe with tomato";
    std::string b = "fresh pasta recipe";
    std::string c = "pasta carbonara";
    auto terms = top_terms({&a, &b, &c}, 3);
    REQUIRE(terms == std::vector<std::string>{"pasta", "recipe", "carbonara"});
}

TEST_CASE("top_terms: skips short tokens, numbers and stopwords", "[keywords]") {
    std::string a = "the 2024 ai go season finale finale";
    auto terms = top_terms({&a}, 5);
    REQUIRE(terms == std::vector<std::string>{"finale", "season"});
}

TEST_CASE("top_terms: null texts and zero count", "[keywords]") {
    std::string a = "guitar lesson";
    REQUIRE(top_terms({nullptr, &a}, 1) == std::vector<std::string>{"guitar"});
    REQUIRE(top_terms({&a}, 0).empty());
}

TEST_CASE("make_label: title-cased and comma separated", "[keywords]") {
    REQUIRE(make_label({"cooking", "pasta", "recipe"}) == "Cooking, Pasta, Recipe");
    REQUIRE(make_label({}) == "Untitled");
    REQUIRE(title_case("") == "");
}
