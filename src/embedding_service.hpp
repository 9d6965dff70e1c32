#pragma once
#include "config.hpp"
#include "encoder.hpp"
#include "item.hpp"
#include <string>
#include <vector>

namespace clipmind {

enum class EmbeddingError {
    None,
    EmptyInput,        // nothing left after cleaning; the model was not called
    ModelUnavailable,  // no encoder, or the encoder reports it is not loaded
    InferenceFailed    // encoder threw / returned nothing / wrong dimension
};

std::string embedding_error_to_string(EmbeddingError error);

struct EmbedResult {
    Embedding vector;
    EmbeddingError error = EmbeddingError::None;
    std::string cause;

    bool ok() const { return error == EmbeddingError::None; }

    static EmbedResult success(Embedding v) {
        EmbedResult r;
        r.vector = std::move(v);
        return r;
    }
    static EmbedResult failure(EmbeddingError e, std::string cause = {}) {
        EmbedResult r;
        r.error = e;
        r.cause = std::move(cause);
        return r;
    }
};

// Text preparation, batching and error translation around a TextEncoder.
// Contains no model logic. The encoder pointer is not owned and must outlive
// the service; nullptr means every call reports ModelUnavailable.
class EmbeddingService {
public:
    explicit EmbeddingService(TextEncoder* encoder, EmbeddingConfig config = {});

    EmbedResult embed(const std::string& text) const;

    // One result per input, same order. Runs at most batch_concurrency
    // encoder calls at a time; a failing item never aborts the batch.
    std::vector<EmbedResult> embed_batch(const std::vector<std::string>& texts) const;

    // The exact string handed to the encoder for `text`.
    std::string prepare(const std::string& text) const;

    bool available() const { return encoder_ && encoder_->available(); }
    uint32_t dimensions() const { return encoder_ ? encoder_->dimensions() : 0; }

private:
    EmbedResult encode_prepared(const std::string& prepared) const;

    TextEncoder* encoder_;
    EmbeddingConfig config_;
};

} // namespace clipmind
