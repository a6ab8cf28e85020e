#include "llm/llm_client.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <thread>

namespace privguard {

namespace {

constexpr auto kRateWindow = std::chrono::seconds(60);
constexpr auto kBaseBackoff = std::chrono::milliseconds(250);

LlmResponse failure(std::string error, std::string model = {},
                    std::chrono::milliseconds latency = std::chrono::milliseconds{0}) {
    return {false, "", std::move(error), std::move(model), latency};
}

bool is_retryable(const httplib::Result& res) {
    return !res || res->status == httplib::StatusCode::TooManyRequests_429 || res->status >= 500;
}

} // anonymous namespace

LlmClient::LlmClient() = default;

LlmClient::LlmClient(Config config)
    : config_(std::move(config)) {}

// ============================================================================
// System Prompts
// ============================================================================

std::string LlmClient::get_system_prompt(LlmUseCase use_case) {
    switch (use_case) {
        case LlmUseCase::ENTITY_EXTRACTION:
            return "You are a privacy analyst. Find personal data in the given text that "
                   "regular expressions cannot catch: person, patient and physician names, "
                   "organizations, addresses, job titles, medical diagnoses, medications. "
                   "Copy each value exactly as it appears in the text. Respond with a JSON "
                   "object only, no markdown: {\"entities\": [{\"value\": \"...\", \"type\": "
                   "\"person_name|patient_name|physician_name|organization|address|job_title|"
                   "medical_diagnosis|medication\"}]}. Use an empty list when nothing is found.";

        case LlmUseCase::KIND_CLASSIFICATION:
            return "You are an expert in data privacy regulations (GDPR, HIPAA, PCI DSS). "
                   "Classify the given personal-data category. CRITICAL: card numbers, CVV, "
                   "medical record numbers. HIGH: names, national IDs, phone numbers. MEDIUM: "
                   "dates, organizations, postal codes. LOW: coarse locations, job titles. "
                   "Respond with JSON only: {\"sensitivity_level\": \"low|medium|high|critical\", "
                   "\"applicable_regulations\": [\"GDPR\", \"HIPAA\", \"PCI DSS\"]}";

        case LlmUseCase::RESIDUAL_PII_CHECK:
            return "You review anonymized text for remaining sensitive data: personal names, "
                   "emails, phone numbers, card numbers, identifying medical details. Placeholders "
                   "such as <KIND_0>, [LOCATION], masked values and Subject-001 style pseudonyms "
                   "are already anonymized and must not be reported. Never quote the data you "
                   "find; report its category only. Respond with JSON only: "
                   "{\"contains_pii\": true|false, \"issues\": [\"category\", ...]}";

        default:
            return "Respond with JSON only.";
    }
}

// ============================================================================
// Request / Response
// ============================================================================

std::string LlmClient::request_body(const LlmRequest& request) const {
    const auto& model = request.model.empty() ? config_.default_model : request.model;

    std::string body = std::format(
        R"({{"model":"{}","temperature":{},"max_tokens":{},"messages":[)"
        R"({{"role":"system","content":"{}"}},{{"role":"user","content":"{}"}}])",
        utils::escape_json(model), request.temperature, request.max_tokens,
        utils::escape_json(get_system_prompt(request.use_case)),
        utils::escape_json(request.prompt));
    if (config_.json_mode) {
        body += R"(,"response_format":{"type":"json_object"})";
    }
    body += '}';
    return body;
}

std::optional<std::string> LlmClient::extract_content(const std::string& body) {
    try {
        const auto content = JsonValue::parse(body)["choices"][size_t{0}]["message"]["content"];
        if (!content.is_string()) return std::nullopt;
        return content.get<std::string>();
    } catch (const JsonValue::parse_error&) {
        return std::nullopt;
    }
}

// ============================================================================
// Core API
// ============================================================================

bool LlmClient::acquire_slot() {
    std::lock_guard lock(window_mutex_);
    const auto now = std::chrono::steady_clock::now();
    while (!window_.empty() && now - window_.front() >= kRateWindow) {
        window_.pop_front();
    }
    if (window_.size() >= config_.max_requests_per_minute) {
        return false;
    }
    window_.push_back(now);
    return true;
}

LlmResponse LlmClient::complete(const LlmRequest& request) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    if (!config_.enabled) {
        return failure("LLM client is disabled");
    }
    if (!acquire_slot()) {
        rate_limited_.fetch_add(1, std::memory_order_relaxed);
        return failure("Rate limited: too many LLM API requests");
    }

    const auto model = request.model.empty() ? config_.default_model : request.model;
    if (config_.api_key.empty()) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        return failure("No API key configured", model);
    }
    return post(request_body(request), model);
}

LlmResponse LlmClient::post(const std::string& body, const std::string& model) {
    api_calls_.fetch_add(1, std::memory_order_relaxed);
    const auto start = std::chrono::steady_clock::now();
    const auto latency = [&start] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
    };

    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));
    const httplib::Headers headers = {{"Authorization", "Bearer " + config_.api_key}};

    for (uint32_t attempt = 0;; ++attempt) {
        const auto res = cli.Post(config_.api_path, headers, body, "application/json");
        if (is_retryable(res) && attempt < config_.max_retries) {
            std::this_thread::sleep_for(kBaseBackoff * (1u << attempt));
            continue;
        }

        if (!res) {
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            return failure(std::format("HTTP request failed: {}", httplib::to_string(res.error())),
                           model, latency());
        }
        if (res->status != httplib::StatusCode::OK_200) {
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            // Error bodies may echo the prompt; only the status is reported
            return failure(std::format("API error: HTTP {}", res->status), model, latency());
        }

        auto content = extract_content(res->body);
        if (!content) {
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            return failure("API response has no message content", model, latency());
        }
        return {true, std::move(*content), "", model, latency()};
    }
}

LlmClient::Stats LlmClient::get_stats() const {
    return {
        total_requests_.load(std::memory_order_relaxed),
        api_calls_.load(std::memory_order_relaxed),
        api_errors_.load(std::memory_order_relaxed),
        rate_limited_.load(std::memory_order_relaxed)
    };
}

} // namespace privguard
