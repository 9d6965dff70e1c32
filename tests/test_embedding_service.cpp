#include <catch2/catch.hpp>
#include "embedding_service.hpp"
#include "vector_math.hpp"
#include <atomic>
#include <chrono>
#include <cmath>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace clipmind;

namespace {

// Deterministic encoder: vector built from character codes of the input.
class FakeEncoder : public TextEncoder {
public:
    explicit FakeEncoder(uint32_t dims = 4) : dims_(dims) {}

    Embedding encode(const std::string& text) override {
        {
            std::lock_guard<std::mutex> lock(mutex);
            inputs.push_back(text);
        }
        int now = ++in_flight;
        int prev = max_in_flight.load();
        while (now > prev && !max_in_flight.compare_exchange_weak(prev, now)) {}
        if (delay_ms) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        --in_flight;

        if (text.find("boom") != std::string::npos) throw std::runtime_error("model crashed");
        if (text.find("nothing") != std::string::npos) return {};

        Embedding v(wrong_dims ? dims_ + 1 : dims_, 0.0f);
        for (size_t i = 0; i < text.size(); i++) {
            v[i % v.size()] += static_cast<float>(static_cast<unsigned char>(text[i]));
        }
        return v;
    }
    uint32_t dimensions() const override { return dims_; }
    std::string name() const override { return "fake"; }
    bool available() const override { return loaded; }

    bool loaded = true;
    bool wrong_dims = false;
    int delay_ms = 0;
    std::mutex mutex;
    std::vector<std::string> inputs;
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};

private:
    uint32_t dims_;
};

} // namespace

TEST_CASE("EmbeddingService: embeds and normalizes", "[embedding]") {
    FakeEncoder enc;
    EmbeddingService svc(&enc);
    auto r = svc.embed("Learn SwiftUI");
    REQUIRE(r.ok());
    REQUIRE(r.vector.size() == 4);
    REQUIRE(std::abs(l2_norm(r.vector) - 1.0) < 1e-5);
}

TEST_CASE("EmbeddingService: text is prepared before encoding", "[embedding]") {
    FakeEncoder enc;
    EmbeddingService svc(&enc);
    REQUIRE(svc.embed("  Hello <b>World</b>  https://x.io ").ok());
    REQUIRE(enc.inputs.size() == 1);
    REQUIRE(enc.inputs[0] == "hello world");
    REQUIRE(svc.prepare("  Hello <b>World</b>  https://x.io ") == "hello world");
}

TEST_CASE("EmbeddingService: same text gives same vector", "[embedding]") {
    FakeEncoder enc;
    EmbeddingService svc(&enc);
    REQUIRE(svc.embed("cooking pasta").vector == svc.embed("Cooking   PASTA").vector);
}

TEST_CASE("EmbeddingService: normalization can be disabled", "[embedding]") {
    FakeEncoder enc;
    EmbeddingConfig cfg;
    cfg.normalize = false;
    EmbeddingService svc(&enc, cfg);
    auto r = svc.embed("a");
    REQUIRE(r.ok());
    REQUIRE(r.vector[0] == 97.0f);
}

TEST_CASE("EmbeddingService: empty input never reaches the model", "[embedding]") {
    FakeEncoder enc;
    EmbeddingService svc(&enc);
    auto r = svc.embed("   \n https://only.a/url ");
    REQUIRE(r.error == EmbeddingError::EmptyInput);
    REQUIRE(enc.inputs.empty());
}

TEST_CASE("EmbeddingService: null or unloaded encoder reports unavailable", "[embedding]") {
    EmbeddingService none(nullptr);
    REQUIRE_FALSE(none.available());
    REQUIRE(none.dimensions() == 0);
    REQUIRE(none.embed("hello").error == EmbeddingError::ModelUnavailable);

    FakeEncoder enc;
    enc.loaded = false;
    EmbeddingService svc(&enc);
    REQUIRE(svc.embed("hello").error == EmbeddingError::ModelUnavailable);
    REQUIRE(enc.inputs.empty());
}

TEST_CASE("EmbeddingService: encoder exception becomes InferenceFailed", "[embedding]") {
    FakeEncoder enc;
    EmbeddingService svc(&enc);
    auto r = svc.embed("boom");
    REQUIRE(r.error == EmbeddingError::InferenceFailed);
    REQUIRE(r.cause == "model crashed");
    REQUIRE(r.vector.empty());
}

TEST_CASE("EmbeddingService: empty or wrong-sized vector is a failure", "[embedding]") {
    FakeEncoder enc;
    EmbeddingService svc(&enc);
    REQUIRE(svc.embed("nothing here").error == EmbeddingError::InferenceFailed);

    enc.wrong_dims = true;
    auto r = svc.embed("hello");
    REQUIRE(r.error == EmbeddingError::InferenceFailed);
    REQUIRE(r.cause.find("dimensions") != std::string::npos);
}

TEST_CASE("EmbeddingService: input truncated to max_input_chars", "[embedding]") {
    FakeEncoder enc;
    EmbeddingConfig cfg;
    cfg.max_input_chars = 10;
    EmbeddingService svc(&enc, cfg);
    REQUIRE(svc.embed("alpha beta gamma delta").ok());
    REQUIRE(enc.inputs[0] == "alpha beta");
}

TEST_CASE("EmbeddingService: batch keeps order and isolates failures", "[embedding]") {
    FakeEncoder enc;
    EmbeddingService svc(&enc);
    auto results = svc.embed_batch({"first", "boom", "", "fourth"});
    REQUIRE(results.size() == 4);
    REQUIRE(results[0].ok());
    REQUIRE(results[1].error == EmbeddingError::InferenceFailed);
    REQUIRE(results[2].error == EmbeddingError::EmptyInput);
    REQUIRE(results[3].ok());
    REQUIRE(results[0].vector == svc.embed("first").vector);
    REQUIRE(results[3].vector == svc.embed("fourth").vector);
}

TEST_CASE("EmbeddingService: batch concurrency is bounded", "[embedding]") {
    FakeEncoder enc;
    enc.delay_ms = 5;
    EmbeddingConfig cfg;
    cfg.batch_concurrency = 3;
    EmbeddingService svc(&enc, cfg);

    std::vector<std::string> texts;
    for (int i = 0; i < 20; i++) texts.push_back("item " + std::to_string(i));
    auto results = svc.embed_batch(texts);

    REQUIRE(results.size() == 20);
    for (const auto& r : results) REQUIRE(r.ok());
    REQUIRE(enc.max_in_flight.load() <= 3);
    REQUIRE(enc.inputs.size() == 20);
}

TEST_CASE("EmbeddingService: empty batch", "[embedding]") {
    FakeEncoder enc;
    EmbeddingService svc(&enc);
    REQUIRE(svc.embed_batch({}).empty());
}

TEST_CASE("embedding_error_to_string: names", "[embedding]") {
    REQUIRE(embedding_error_to_string(EmbeddingError::EmptyInput) == "empty input");
    REQUIRE(embedding_error_to_string(EmbeddingError::ModelUnavailable) == "model unavailable");
}
