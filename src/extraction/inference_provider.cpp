#include "cogmem/extraction/inference_provider.hpp"
#include "cogmem/core/errors.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

namespace cogmem {

// ============================================================================
// Helper Functions for HTTP Requests
// ============================================================================

namespace {

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// Make HTTP POST request with CURL
std::string http_post(
    const std::string& url,
    const std::string& json_payload,
    const std::vector<std::string>& headers,
    int timeout_seconds
) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    std::string response;
    struct curl_slist* header_list = nullptr;

    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_payload.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw std::runtime_error("CURL request failed: " + error);
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (http_code < 200 || http_code >= 300) {
        throw std::runtime_error(
            "HTTP request failed with code " + std::to_string(http_code) +
            ": " + response
        );
    }

    return response;
}

// Strip markdown fences and anything before the first JSON token
std::string clean_model_output(const std::string& raw) {
    std::string clean = raw;

    size_t first = clean.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    clean = clean.substr(first);

    if (clean.compare(0, 7, "```json") == 0) {
        clean = clean.substr(7);
    } else if (clean.compare(0, 3, "```") == 0) {
        clean = clean.substr(3);
    }

    size_t last_backticks = clean.rfind("```");
    if (last_backticks != std::string::npos) {
        clean = clean.substr(0, last_backticks);
    }

    size_t start = clean.find_first_of("{[");
    if (start == std::string::npos) return "";
    size_t end = clean.find_last_of("}]");
    if (end == std::string::npos || end < start) return "";
    return clean.substr(start, end - start + 1);
}

CandidateEvent candidate_from_json(const json& item) {
    CandidateEvent candidate;
    candidate.action = item.value("action", "");
    candidate.target = item.value("target", "");

    if (item.contains("quantity") && item["quantity"].is_number()) {
        candidate.quantity = item["quantity"].get<double>();
    } else if (item.contains("quantity") && item["quantity"].is_string()) {
        try {
            candidate.quantity = std::stod(item["quantity"].get<std::string>());
        } catch (const std::exception&) {
            candidate.quantity.reset();
        }
    }
    if (item.contains("unit") && item["unit"].is_string() &&
        !item["unit"].get<std::string>().empty()) {
        candidate.unit = item["unit"].get<std::string>();
    }
    if (item.contains("confidence") && item["confidence"].is_number()) {
        candidate.confidence = item["confidence"].get<double>();
    }
    candidate.timestamp_hint = item.value("timestamp_hint", item.value("time", ""));
    return candidate;
}

} // anonymous namespace

// ============================================================================
// InferenceProvider Base Class
// ============================================================================

InferenceResult InferenceProvider::extract_candidate_events(const std::string& text,
                                                            const std::string& context) {
    InferenceResult result;
    result.response = complete(
        PromptTemplates::event_extraction_system_prompt(),
        PromptTemplates::event_extraction_user_prompt(text, context)
    );

    if (!result.response.success) {
        result.success = false;
        result.error_message = result.response.error_message;
        return result;
    }

    try {
        result.candidates = parse_candidate_events_json(result.response.content);
        for (auto& candidate : result.candidates) {
            candidate.extractor = "llm:" + get_provider_name();
        }
        result.success = true;
    } catch (const ExtractionFailure& e) {
        result.success = false;
        result.error_message = e.what();
    }

    return result;
}

template<typename Func>
InferenceResponse InferenceProvider::retry_call(Func&& func, const std::string& operation_name) {
    int attempts = 0;
    int max_attempts = std::max(1, config_.max_retries);
    while (true) {
        try {
            return func();
        } catch (const std::exception& e) {
            attempts++;
            if (attempts >= max_attempts) {
                InferenceResponse error_response;
                error_response.success = false;
                error_response.error_message = std::string("Failed after ") +
                    std::to_string(attempts) + " attempts: " + e.what();
                return error_response;
            }

            if (config_.verbose) {
                std::cerr << "Attempt " << attempts << " failed for " << operation_name
                          << ": " << e.what() << ". Retrying..." << std::endl;
            }

            // Exponential backoff
            std::this_thread::sleep_for(
                std::chrono::milliseconds(config_.retry_base_delay_ms * (1 << (attempts - 1)))
            );
        }
    }
}

// ============================================================================
// Ollama Provider
// ============================================================================

OllamaProvider::OllamaProvider(const std::string& base_url, const std::string& model) {
    config_.provider = "ollama";
    config_.api_base_url = base_url;
    config_.model = model;
}

std::string OllamaProvider::build_generate_payload(const std::string& system_prompt,
                                                   const std::string& prompt) const {
    json j;
    j["model"] = config_.model;
    j["system"] = system_prompt;
    j["prompt"] = prompt;
    j["stream"] = false;
    j["format"] = "json";
    j["options"] = {
        {"temperature", config_.temperature},
        {"num_predict", config_.max_tokens}
    };
    return j.dump();
}

InferenceResponse OllamaProvider::parse_response(const std::string& response_json) const {
    InferenceResponse response;

    try {
        json j = json::parse(response_json);

        if (j.contains("error")) {
            response.success = false;
            response.error_message = j["error"].get<std::string>();
            return response;
        }

        response.content = j.value("response", "");
        response.model = j.value("model", config_.model);
        response.prompt_tokens = j.value("prompt_eval_count", 0);
        response.completion_tokens = j.value("eval_count", 0);
        response.success = true;

    } catch (const std::exception& e) {
        response.success = false;
        response.error_message = std::string("Failed to parse response: ") + e.what();
    }

    return response;
}

InferenceResponse OllamaProvider::complete(const std::string& system_prompt,
                                           const std::string& prompt) {
    auto start_time = std::chrono::steady_clock::now();

    auto call_api = [&]() -> InferenceResponse {
        if (config_.verbose) {
            std::cout << "Ollama request to " << config_.model << std::endl;
        }

        std::string response_str = http_post(
            config_.api_base_url + "/api/generate",
            build_generate_payload(system_prompt, prompt),
            {"Content-Type: application/json"},
            config_.timeout_seconds
        );
        InferenceResponse response = parse_response(response_str);

        auto end_time = std::chrono::steady_clock::now();
        response.latency_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
        return response;
    };

    return retry_call(call_api, "Ollama generate");
}

// ============================================================================
// OpenAI Provider
// ============================================================================

OpenAIProvider::OpenAIProvider(const std::string& api_key, const std::string& model) {
    config_.provider = "openai";
    config_.api_key = api_key;
    config_.model = model;
    config_.api_base_url = "https://api.openai.com/v1";
}

std::string OpenAIProvider::build_chat_payload(const std::string& system_prompt,
                                               const std::string& prompt) const {
    json j;
    j["model"] = config_.model;
    j["temperature"] = config_.temperature;
    j["max_tokens"] = config_.max_tokens;
    j["response_format"] = {{"type", "json_object"}};
    j["messages"] = json::array({
        {{"role", "system"}, {"content", system_prompt}},
        {{"role", "user"}, {"content", prompt}}
    });
    return j.dump();
}

InferenceResponse OpenAIProvider::parse_response(const std::string& response_json) const {
    InferenceResponse response;

    try {
        json j = json::parse(response_json);

        if (j.contains("error")) {
            response.success = false;
            response.error_message = j["error"].value("message", "unknown error");
            return response;
        }

        response.content = j["choices"][0]["message"]["content"].get<std::string>();
        response.model = j.value("model", config_.model);

        if (j.contains("usage")) {
            response.prompt_tokens = j["usage"].value("prompt_tokens", 0);
            response.completion_tokens = j["usage"].value("completion_tokens", 0);
        }

        response.success = true;

    } catch (const std::exception& e) {
        response.success = false;
        response.error_message = std::string("Failed to parse response: ") + e.what();
    }

    return response;
}

InferenceResponse OpenAIProvider::complete(const std::string& system_prompt,
                                           const std::string& prompt) {
    auto start_time = std::chrono::steady_clock::now();

    auto call_api = [&]() -> InferenceResponse {
        if (config_.verbose) {
            std::cout << "OpenAI API Request to " << config_.model << std::endl;
        }

        std::string response_str = http_post(
            config_.api_base_url + "/chat/completions",
            build_chat_payload(system_prompt, prompt),
            {"Content-Type: application/json", "Authorization: Bearer " + config_.api_key},
            config_.timeout_seconds
        );
        InferenceResponse response = parse_response(response_str);

        auto end_time = std::chrono::steady_clock::now();
        response.latency_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
        return response;
    };

    return retry_call(call_api, "OpenAI chat completion");
}

// ============================================================================
// Inference Provider Factory
// ============================================================================

std::unique_ptr<InferenceProvider> InferenceProviderFactory::create(
    ProviderType type,
    const InferenceConfig& config
) {
    std::unique_ptr<InferenceProvider> provider;
    switch (type) {
        case ProviderType::Ollama:
            provider = std::make_unique<OllamaProvider>(config.api_base_url, config.model);
            break;
        case ProviderType::OpenAI:
            provider = std::make_unique<OpenAIProvider>(config.api_key, config.model);
            break;
        default:
            throw std::invalid_argument("Unknown provider type");
    }

    InferenceConfig effective = config;
    if (type == ProviderType::OpenAI && effective.api_base_url.find("11434") != std::string::npos) {
        effective.api_base_url = "https://api.openai.com/v1";
    }
    provider->set_config(effective);
    return provider;
}

std::unique_ptr<InferenceProvider> InferenceProviderFactory::create(
    const std::string& provider_name,
    const InferenceConfig& config
) {
    std::string name_lower = provider_name;
    std::transform(name_lower.begin(), name_lower.end(), name_lower.begin(), ::tolower);

    if (name_lower == "ollama") {
        return create(ProviderType::Ollama, config);
    } else if (name_lower == "openai") {
        return create(ProviderType::OpenAI, config);
    } else if (name_lower == "none" || name_lower.empty()) {
        return nullptr;
    } else {
        throw std::invalid_argument("Unknown provider name: " + provider_name);
    }
}

std::unique_ptr<InferenceProvider> InferenceProviderFactory::create_from_env() {
    InferenceConfig config;

    std::string provider = get_env_var("COGMEM_INFERENCE_PROVIDER");
    if (!provider.empty()) config.provider = provider;

    if (config.provider == "openai") {
        config.api_key = get_env_var("COGMEM_OPENAI_API_KEY");
        if (config.api_key.empty()) {
            config.api_key = get_env_var("OPENAI_API_KEY");
        }
        config.model = "gpt-4o-mini";
        config.api_base_url = "https://api.openai.com/v1";
        if (config.api_key.empty()) {
            return nullptr;
        }
    }

    std::string model = get_env_var("COGMEM_INFERENCE_MODEL");
    if (!model.empty()) config.model = model;

    std::string host = get_env_var("COGMEM_INFERENCE_HOST");
    if (!host.empty()) config.api_base_url = host;

    return create(config.provider, config);
}

std::unique_ptr<InferenceProvider> InferenceProviderFactory::create_from_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open inference config: " + path);
    }

    InferenceConfig config;
    try {
        json j;
        file >> j;
        config.provider = j.value("provider", config.provider);
        config.model = j.value("model", config.model);
        config.api_key = j.value("api_key", config.api_key);
        config.api_base_url = j.value("host", config.api_base_url);
        config.temperature = j.value("temperature", config.temperature);
        config.max_tokens = j.value("max_tokens", config.max_tokens);
        config.timeout_seconds = j.value("timeout_seconds", config.timeout_seconds);
        config.max_retries = j.value("max_retries", config.max_retries);
        config.verbose = j.value("verbose", config.verbose);
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid inference config " + path + ": " + e.what());
    }

    return create(config.provider, config);
}

// ============================================================================
// Prompt Templates
// ============================================================================

std::string PromptTemplates::event_extraction_system_prompt() {
    return R"(You extract structured life events from a user's personal statements.

Each event is one thing the user did: an action verb and the thing it was done to.

Output JSON format:
{
  "events": [
    {
      "action": "吃",
      "target": "苹果",
      "quantity": 3,
      "unit": "个",
      "confidence": 0.9,
      "timestamp_hint": "今天早上"
    }
  ]
}

Guidelines:
- Keep the action as the bare verb in the user's language (吃, 喝, 购买, 跑步)
- Keep the target as a short noun phrase without quantity words
- Use quantity and unit only when the statement gives a number
- Copy any time expression verbatim into timestamp_hint, otherwise ""
- Set confidence by how explicit the statement is
- Return {"events": []} when the statement describes no event
)";
}

std::string PromptTemplates::event_extraction_user_prompt(const std::string& text,
                                                          const std::string& context) {
    std::string prompt = "Statement: " + text + "\n";
    if (!context.empty()) {
        prompt += "Context: " + context + "\n";
    }
    prompt += R"(
IMPORTANT:
- Respond ONLY with valid JSON (no markdown, no explanation)
- Ensure JSON is complete and properly closed with all brackets)";
    return prompt;
}

// ============================================================================
// Utility Functions
// ============================================================================

std::vector<CandidateEvent> parse_candidate_events_json(const std::string& json_str) {
    std::string clean = clean_model_output(json_str);
    if (clean.empty()) {
        throw ExtractionFailure("model output contains no JSON");
    }

    json j;
    try {
        j = json::parse(clean);
    } catch (const json::parse_error& e) {
        throw ExtractionFailure(std::string("unparseable model output: ") + e.what());
    }

    json items;
    if (j.is_object() && j.contains("events") && j["events"].is_array()) {
        items = j["events"];
    } else if (j.is_array()) {
        items = j;
    } else if (j.is_object() && j.contains("action")) {
        items = json::array({j});
    } else {
        throw ExtractionFailure("model output has no 'events' array");
    }

    std::vector<CandidateEvent> candidates;
    for (const auto& item : items) {
        if (!item.is_object()) continue;
        candidates.push_back(candidate_from_json(item));
    }
    return candidates;
}

std::string get_env_var(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : std::string();
}

} // namespace cogmem
