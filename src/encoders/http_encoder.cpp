#include "http_encoder.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>

namespace clipmind {

HttpEncoder::HttpEncoder(Config config, HttpClient& http)
    : config_(std::move(config))
    , http_(http)
    , dimensions_(config_.default_dims)
{}

Embedding HttpEncoder::encode(const std::string& text) {
    nlohmann::json body = {
        {"model", config_.model},
        {"input", text}
    };

    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };
    if (!config_.api_key.empty()) {
        headers.push_back({"Authorization", "Bearer " + config_.api_key});
    }

    auto response = http_.post(
        config_.base_url + config_.endpoint, body.dump(), headers, config_.timeout_seconds);

    // Status 0 means the transport never got an answer
    if (response.status_code == 0) {
        if (reachable_.exchange(false)) {
            std::cerr << "[encoder] " << config_.name << " runtime unreachable at "
                      << config_.base_url << "\n";
        }
        return {};
    }
    reachable_.store(true);

    if (response.status_code != 200) {
        throw std::runtime_error(config_.name + " returned HTTP " +
                                 std::to_string(response.status_code));
    }

    try {
        auto j = nlohmann::json::parse(response.body);
        auto& arr = j.at(nlohmann::json::json_pointer(config_.response_path));
        Embedding result;
        result.reserve(arr.size());
        for (const auto& val : arr) {
            result.push_back(val.get<float>());
        }
        if (!result.empty()) {
            dimensions_.store(static_cast<uint32_t>(result.size()));
        }
        return result;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(config_.name + " response malformed: " + e.what());
    }
}

std::unique_ptr<TextEncoder> create_openai_encoder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model, uint32_t dims) {
    HttpEncoder::Config cfg;
    cfg.name = "openai";
    cfg.api_key = api_key;
    cfg.base_url = base_url.empty() ? "http://localhost:8080/v1" : base_url;
    cfg.model = model.empty() ? "all-MiniLM-L6-v2" : model;
    cfg.endpoint = "/embeddings";
    cfg.response_path = "/data/0/embedding";
    cfg.default_dims = dims ? dims : 384;
    return std::make_unique<HttpEncoder>(std::move(cfg), http);
}

std::unique_ptr<TextEncoder> create_ollama_encoder(
    HttpClient& http, const std::string& base_url, const std::string& model, uint32_t dims) {
    HttpEncoder::Config cfg;
    cfg.name = "ollama";
    cfg.base_url = base_url.empty() ? "http://localhost:11434" : base_url;
    cfg.model = model.empty() ? "all-minilm" : model;
    cfg.endpoint = "/api/embed";
    cfg.response_path = "/embeddings/0";
    cfg.default_dims = dims ? dims : 384;
    return std::make_unique<HttpEncoder>(std::move(cfg), http);
}

} // namespace clipmind
