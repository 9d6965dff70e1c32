#include <catch2/catch.hpp>
#include "metadata_text.hpp"
#include "item.hpp"

using namespace clipmind;

// ── Cleaning ─────────────────────────────────────────────────────

TEST_CASE("clean_text: collapses whitespace", "[metadata]") {
    REQUIRE(clean_text("  Learn\n\nSwift   fast ") == "Learn Swift fast");
}

TEST_CASE("strip_urls: removes http, https and www tokens", "[metadata]") {
    std::string out = clean_text(strip_urls("see https://a.io/x and www.b.com or http://c.d now"));
    REQUIRE(out == "see and or now");
}

TEST_CASE("strip_urls: leaves embedded text alone", "[metadata]") {
    REQUIRE(strip_urls("nohttp://here") == "nohttp://here");
}

TEST_CASE("strip_html: drops tags and decodes entities", "[metadata]") {
    REQUIRE(clean_text(strip_html("<b>Tom &amp; Jerry</b> &lt;3")) == "Tom & Jerry <3");
}

TEST_CASE("clean_description: removes urls, spam phrases and punctuation runs", "[metadata]") {
    std::string out = clean_description(
        "Great tutorial!!!! Subscribe for more! Check https://x.com now");
    REQUIRE(out == "Great tutorial! Check now");
}

TEST_CASE("clean_description: short punctuation runs kept", "[metadata]") {
    REQUIRE(clean_description("Really?! Yes..") == "Really?! Yes..");
}

// ── Tags ─────────────────────────────────────────────────────────

TEST_CASE("process_tags: lowercases, dedupes and drops generic tags", "[metadata]") {
    auto tags = process_tags({"Swift", "swift", "shorts", "x", " iOS ", "Viral"});
    REQUIRE(tags == std::vector<std::string>{"swift", "ios"});
}

TEST_CASE("process_tags: caps the number of tags", "[metadata]") {
    std::vector<std::string> many;
    for (int i = 0; i < 25; i++) many.push_back("tag" + std::to_string(i));
    REQUIRE(process_tags(many).size() == kMaxTagsForEmbedding);
}

// ── build_item_text ──────────────────────────────────────────────

TEST_CASE("build_item_text: components in priority order", "[metadata]") {
    std::string text = build_item_text(
        "SwiftUI Layout Basics", "Code Academy", {"SwiftUI", "iOS"},
        "In this lesson we build a layout from scratch using stacks and grids.",
        "");
    REQUIRE(text ==
            "SwiftUI Layout Basics\n"
            "by Code Academy\n"
            "swiftui ios\n"
            "In this lesson we build a layout from scratch using stacks and grids.");
}

TEST_CASE("build_item_text: empty components are skipped", "[metadata]") {
    REQUIRE(build_item_text("Only title", "", {}, "", "") == "Only title");
    REQUIRE(build_item_text("", "", {}, "", "").empty());
}

TEST_CASE("build_item_text: never exceeds the character budget", "[metadata]") {
    std::string long_desc;
    for (int i = 0; i < 400; i++) long_desc += "word ";
    std::string long_ocr;
    for (int i = 0; i < 400; i++) long_ocr += "frame ";

    std::string text = build_item_text("Title", "Channel", {"tag"}, long_desc, long_ocr);
    REQUIRE(text.size() <= kMaxTextChars);
    REQUIRE(text.rfind("Title\nby Channel\ntag\n", 0) == 0);
}

TEST_CASE("build_item_text: OCR appended when budget remains", "[metadata]") {
    std::string text = build_item_text("Title", "", {}, "", "  on screen   text ");
    REQUIRE(text == "Title\non screen text");
}

TEST_CASE("refresh_text_content: fills text_content from metadata", "[metadata]") {
    Item item;
    item.title = "Sourdough at home";
    item.channel = "Bake Lab";
    refresh_text_content(item);
    REQUIRE(item.text_content == "Sourdough at home\nby Bake Lab");
}

// ── normalize_for_embedding ──────────────────────────────────────

TEST_CASE("normalize_for_embedding: lowercases and strips noise", "[metadata]") {
    REQUIRE(normalize_for_embedding("Hello <i>World</i>\n https://x.y  Again") ==
            "hello world again");
}

TEST_CASE("normalize_for_embedding: truncates at a word boundary", "[metadata]") {
    REQUIRE(normalize_for_embedding("alpha beta gamma", 12) == "alpha beta");
}

// ── Item helpers ─────────────────────────────────────────────────

TEST_CASE("Item: recency prefers published_at", "[metadata]") {
    Item item;
    item.added_at = 200;
    REQUIRE(item.recency() == 200);
    item.published_at = 100;
    REQUIRE(item.recency() == 100);
}

TEST_CASE("source_from_string: unknown falls back to youtube", "[metadata]") {
    REQUIRE(source_from_string("local") == ItemSource::Local);
    REQUIRE(source_from_string("vimeo") == ItemSource::YouTube);
    REQUIRE(source_to_string(ItemSource::Local) == "local");
}
