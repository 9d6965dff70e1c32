#include "embedding_service.hpp"
#include "metadata_text.hpp"
#include "vector_math.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>

namespace clipmind {

std::string embedding_error_to_string(EmbeddingError error) {
    switch (error) {
        case EmbeddingError::None:             return "none";
        case EmbeddingError::EmptyInput:       return "empty input";
        case EmbeddingError::ModelUnavailable: return "model unavailable";
        case EmbeddingError::InferenceFailed:  return "inference failed";
    }
    return "unknown";
}

EmbeddingService::EmbeddingService(TextEncoder* encoder, EmbeddingConfig config)
    : encoder_(encoder), config_(config) {
    if (config_.batch_concurrency == 0) config_.batch_concurrency = 1;
}

std::string EmbeddingService::prepare(const std::string& text) const {
    return normalize_for_embedding(text, config_.max_input_chars);
}

EmbedResult EmbeddingService::encode_prepared(const std::string& prepared) const {
    if (prepared.empty()) {
        return EmbedResult::failure(EmbeddingError::EmptyInput);
    }
    if (!encoder_ || !encoder_->available()) {
        return EmbedResult::failure(EmbeddingError::ModelUnavailable);
    }

    Embedding raw;
    try {
        raw = encoder_->encode(prepared);
    } catch (const std::exception& e) {
        return EmbedResult::failure(EmbeddingError::InferenceFailed, e.what());
    }

    if (raw.empty()) {
        // Encoders flag a lost runtime by going unavailable during the call
        if (!encoder_->available()) {
            return EmbedResult::failure(EmbeddingError::ModelUnavailable);
        }
        return EmbedResult::failure(EmbeddingError::InferenceFailed, "encoder returned no vector");
    }

    uint32_t expected = encoder_->dimensions();
    if (expected != 0 && raw.size() != expected) {
        return EmbedResult::failure(EmbeddingError::InferenceFailed,
            "expected " + std::to_string(expected) + " dimensions, got " +
            std::to_string(raw.size()));
    }

    if (config_.normalize) raw = l2_normalize(raw);
    return EmbedResult::success(std::move(raw));
}

EmbedResult EmbeddingService::embed(const std::string& text) const {
    return encode_prepared(prepare(text));
}

std::vector<EmbedResult> EmbeddingService::embed_batch(const std::vector<std::string>& texts) const {
    std::vector<EmbedResult> results(texts.size());
    if (texts.empty()) return results;

    size_t workers = std::min<size_t>(config_.batch_concurrency, texts.size());
    if (workers <= 1) {
        for (size_t i = 0; i < texts.size(); i++) {
            results[i] = embed(texts[i]);
        }
        return results;
    }

    // Fixed number of workers pull from a shared cursor; excess items wait
    // their turn instead of each getting a thread.
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t i = next.fetch_add(1); i < texts.size(); i = next.fetch_add(1)) {
            results[i] = embed(texts[i]);
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t w = 0; w < workers; w++) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) t.join();

    return results;
}

} // namespace clipmind
