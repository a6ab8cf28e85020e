#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace privguard {

// LLM use case types
enum class LlmUseCase : uint8_t {
    ENTITY_EXTRACTION,
    KIND_CLASSIFICATION,
    RESIDUAL_PII_CHECK
};

[[nodiscard]] inline const char* llm_use_case_to_string(LlmUseCase uc) {
    switch (uc) {
        case LlmUseCase::ENTITY_EXTRACTION:   return "entity_extraction";
        case LlmUseCase::KIND_CLASSIFICATION: return "kind_classification";
        case LlmUseCase::RESIDUAL_PII_CHECK:  return "residual_pii_check";
        default:                              return "unknown";
    }
}

struct LlmRequest {
    LlmUseCase use_case = LlmUseCase::ENTITY_EXTRACTION;
    std::string prompt;
    std::string model;          // empty = Config::default_model
    double temperature = 0.0;
    int max_tokens = 2048;
};

struct LlmResponse {
    bool success = false;
    std::string content;
    std::string error;
    std::string model_used;
    std::chrono::milliseconds latency{0};
};

/**
 * @brief Chat-completions client behind the contextual collaborators
 *
 * Speaks the OpenAI-compatible chat-completions protocol (OpenAI, Groq,
 * local gateways) over httplib::Client. Every use case has a fixed system
 * prompt and expects a JSON reply. A disabled client answers every request
 * with success = false, which the collaborators report as unavailable.
 *
 * Requests are limited to max_requests_per_minute over a rolling window.
 * Connection errors, HTTP 429 and 5xx are retried with exponential backoff.
 * Nothing is cached: prompts carry document text.
 */
class LlmClient {
public:
    struct Config {
        bool enabled = false;
        std::string endpoint = "https://api.openai.com";
        std::string api_path = "/v1/chat/completions";
        std::string api_key;
        std::string default_model = "gpt-4o-mini";
        bool json_mode = true;                  // response_format = json_object
        uint32_t timeout_ms = 30000;
        uint32_t max_retries = 2;
        uint32_t max_requests_per_minute = 60;
    };

    struct Stats {
        uint64_t total_requests = 0;
        uint64_t api_calls = 0;
        uint64_t api_errors = 0;
        uint64_t rate_limited = 0;
    };

    LlmClient();
    explicit LlmClient(Config config);

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }
    [[nodiscard]] const Config& config() const { return config_; }

    [[nodiscard]] LlmResponse complete(const LlmRequest& request);

    [[nodiscard]] static std::string get_system_prompt(LlmUseCase use_case);

    /// JSON body posted for a request
    [[nodiscard]] std::string request_body(const LlmRequest& request) const;

    /// choices[0].message.content of a chat-completions body
    [[nodiscard]] static std::optional<std::string> extract_content(const std::string& body);

    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] bool acquire_slot();
    [[nodiscard]] LlmResponse post(const std::string& body, const std::string& model);

    Config config_;

    std::mutex window_mutex_;
    std::deque<std::chrono::steady_clock::time_point> window_;   // Accepted requests, oldest first

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> api_calls_{0};
    std::atomic<uint64_t> api_errors_{0};
    std::atomic<uint64_t> rate_limited_{0};
};

} // namespace privguard
