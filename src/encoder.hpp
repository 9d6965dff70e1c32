#pragma once
#include "item.hpp"
#include <string>
#include <memory>
#include <cstdint>

namespace clipmind {

class HttpClient; // forward declare
struct Config;    // forward declare

// Black-box text encoder provided by the host application's AI runtime.
// Passed into EmbeddingService at construction; never a global.
class TextEncoder {
public:
    virtual ~TextEncoder() = default;

    // Compute the raw embedding for already-prepared text.
    // Returns an empty vector (or throws) on inference failure.
    virtual Embedding encode(const std::string& text) = 0;

    // Dimensionality of the embedding vectors (0 = not known yet)
    virtual uint32_t dimensions() const = 0;

    // Human-readable name (e.g. "ollama", "openai")
    virtual std::string name() const = 0;

    // False when the model is not loaded / reachable
    virtual bool available() const { return true; }
};

// Create an encoder from config. Returns nullptr if the encoder is disabled
// or the configured provider is not recognized.
std::unique_ptr<TextEncoder> create_text_encoder(const Config& config, HttpClient& http);

} // namespace clipmind
