#pragma once
#include "../encoder.hpp"
#include "../http.hpp"
#include <atomic>
#include <string>

namespace clipmind {

// HTTP-based encoder for a model runtime on the same machine. Supports
// OpenAI-compatible and Ollama APIs by parameterizing the endpoint, auth,
// and response JSON path.
class HttpEncoder : public TextEncoder {
public:
    struct Config {
        std::string name;           // e.g. "openai", "ollama"
        std::string api_key;        // empty = no Authorization header
        std::string base_url;       // e.g. "http://localhost:11434"
        std::string model;          // e.g. "all-minilm"
        std::string endpoint;       // URL path, e.g. "/api/embed"
        std::string response_path;  // JSON pointer to float array, e.g. "/embeddings/0"
        uint32_t default_dims;      // fallback until first response
        long timeout_seconds = 30;
    };

    HttpEncoder(Config config, HttpClient& http);

    Embedding encode(const std::string& text) override;
    uint32_t dimensions() const override { return dimensions_.load(); }
    std::string name() const override { return config_.name; }
    bool available() const override { return reachable_.load(); }

private:
    Config config_;
    HttpClient& http_;
    std::atomic<uint32_t> dimensions_;
    std::atomic<bool> reachable_{true};
};

std::unique_ptr<TextEncoder> create_openai_encoder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model, uint32_t dims);

std::unique_ptr<TextEncoder> create_ollama_encoder(
    HttpClient& http, const std::string& base_url, const std::string& model, uint32_t dims);

} // namespace clipmind
