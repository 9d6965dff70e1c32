#include "encoder.hpp"
#include "encoders/http_encoder.hpp"
#include "config.hpp"
#include "http.hpp"
#include <iostream>

namespace clipmind {

std::unique_ptr<TextEncoder> create_text_encoder(const Config& config, HttpClient& http) {
    const auto& enc = config.encoder;

    if (enc.provider.empty() || enc.provider == "none") return nullptr;

    if (enc.provider == "ollama") {
        return create_ollama_encoder(http, enc.base_url, enc.model, enc.dimensions);
    }

    if (enc.provider == "openai") {
        // OpenAI-compatible local servers (llama.cpp, LM Studio, ...)
        return create_openai_encoder(enc.api_key, http, enc.base_url, enc.model, enc.dimensions);
    }

    std::cerr << "[encoder] Unknown encoder provider: " << enc.provider << "\n";
    return nullptr;
}

} // namespace clipmind
