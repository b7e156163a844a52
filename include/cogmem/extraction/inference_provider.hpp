#pragma once

#include "cogmem/core/time_utils.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cogmem {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief Configuration for an inference back end
 */
struct InferenceConfig {
    std::string provider = "ollama";        ///< "ollama", "openai" or "none"
    std::string api_key;                    ///< API key (unused by Ollama)
    std::string model = "phi4-mini";        ///< Model name/ID
    std::string api_base_url = "http://127.0.0.1:11434";  ///< Base URL for API
    double temperature = 0.0;               ///< Sampling temperature (0.0-1.0)
    int max_tokens = 512;                   ///< Maximum tokens in response
    int timeout_seconds = 30;               ///< Request timeout
    int max_retries = 2;                    ///< Max attempts per request
    int retry_base_delay_ms = 500;          ///< First backoff delay
    bool verbose = false;                   ///< Enable verbose logging
};

/**
 * @brief Response from an inference back end
 */
struct InferenceResponse {
    std::string content;                    ///< Generated text
    std::string model;                      ///< Model that generated response
    int prompt_tokens = 0;                  ///< Tokens in prompt
    int completion_tokens = 0;              ///< Tokens in completion
    double latency_ms = 0.0;                ///< Response latency
    bool success = false;                   ///< Whether request succeeded
    std::string error_message;              ///< Error message if failed
};

/**
 * @brief Event proposed by an extractor, not yet validated
 */
struct CandidateEvent {
    std::string action;
    std::string target;
    std::optional<double> quantity;
    std::optional<std::string> unit;
    double confidence = 0.0;
    std::string timestamp_hint;             ///< Free-form ("今天早上") or ISO-8601
    std::string extractor;                  ///< "rule" or "llm:<provider>"
};

/**
 * @brief Result of one extraction call
 */
struct InferenceResult {
    std::vector<CandidateEvent> candidates; ///< Extracted candidates (may be empty)
    InferenceResponse response;             ///< Raw back-end response
    bool success = false;                   ///< Whether extraction succeeded
    std::string error_message;              ///< Error message if failed
};

// ============================================================================
// Inference Provider Interface
// ============================================================================

/**
 * @brief Abstract base class for inference back ends
 *
 * The engine treats every provider as an unreliable oracle: results are
 * validated, clamped and discounted downstream, never trusted as is.
 */
class InferenceProvider {
public:
    virtual ~InferenceProvider() = default;

    /**
     * @brief Complete a prompt with an optional system instruction
     */
    virtual InferenceResponse complete(const std::string& system_prompt,
                                       const std::string& prompt) = 0;

    /**
     * @brief Extract candidate events from a user statement
     *
     * @param text The statement
     * @param context Optional surrounding conversation
     * @return Result with success=false when the back end is unavailable or
     *         its output cannot be parsed
     */
    virtual InferenceResult extract_candidate_events(const std::string& text,
                                                     const std::string& context = "");

    virtual std::string get_provider_name() const = 0;
    virtual std::string get_model() const { return config_.model; }
    virtual bool is_configured() const = 0;
    void set_config(const InferenceConfig& config) { config_ = config; }
    InferenceConfig get_config() const { return config_; }

protected:
    InferenceConfig config_;

    /**
     * @brief Retry logic for API calls
     */
    template<typename Func>
    InferenceResponse retry_call(Func&& func, const std::string& operation_name);
};

// ============================================================================
// Ollama Provider
// ============================================================================

/**
 * @brief Local Ollama server (/api/generate with JSON output mode)
 */
class OllamaProvider : public InferenceProvider {
public:
    explicit OllamaProvider(
        const std::string& base_url = "http://127.0.0.1:11434",
        const std::string& model = "phi4-mini"
    );

    InferenceResponse complete(const std::string& system_prompt,
                               const std::string& prompt) override;

    std::string get_provider_name() const override { return "ollama"; }
    bool is_configured() const override { return !config_.api_base_url.empty(); }

private:
    std::string build_generate_payload(const std::string& system_prompt,
                                       const std::string& prompt) const;
    InferenceResponse parse_response(const std::string& response_json) const;
};

// ============================================================================
// OpenAI Provider
// ============================================================================

/**
 * @brief OpenAI-compatible chat completions endpoint
 */
class OpenAIProvider : public InferenceProvider {
public:
    explicit OpenAIProvider(
        const std::string& api_key,
        const std::string& model = "gpt-4o-mini"
    );

    InferenceResponse complete(const std::string& system_prompt,
                               const std::string& prompt) override;

    std::string get_provider_name() const override { return "openai"; }
    bool is_configured() const override { return !config_.api_key.empty(); }

private:
    std::string build_chat_payload(const std::string& system_prompt,
                                   const std::string& prompt) const;
    InferenceResponse parse_response(const std::string& response_json) const;
};

// ============================================================================
// Inference Provider Factory
// ============================================================================

/**
 * @brief Factory for creating inference providers
 */
class InferenceProviderFactory {
public:
    enum class ProviderType {
        Ollama,
        OpenAI
    };

    static std::unique_ptr<InferenceProvider> create(ProviderType type,
                                                     const InferenceConfig& config);

    /**
     * @brief Create from a provider name ("ollama", "openai")
     *
     * @return nullptr for "none"
     * @throws std::invalid_argument for unknown names
     */
    static std::unique_ptr<InferenceProvider> create(const std::string& provider_name,
                                                     const InferenceConfig& config);

    /**
     * @brief Create from COGMEM_INFERENCE_* environment variables
     */
    static std::unique_ptr<InferenceProvider> create_from_env();

    /**
     * @brief Create from a JSON file with provider, model, api_key and host keys
     *
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static std::unique_ptr<InferenceProvider> create_from_config_file(const std::string& path);
};

// ============================================================================
// Prompt Templates
// ============================================================================

/**
 * @brief Prompts for event extraction
 */
class PromptTemplates {
public:
    static std::string event_extraction_system_prompt();
    static std::string event_extraction_user_prompt(const std::string& text,
                                                    const std::string& context);
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Parse {"events": [...]} from model output
 *
 * Tolerates markdown fences and leading prose. A bare array or a single
 * event object is accepted as well.
 *
 * @throws ExtractionFailure when no JSON can be recovered
 */
std::vector<CandidateEvent> parse_candidate_events_json(const std::string& json_str);

/**
 * @brief Read an environment variable (empty when unset)
 */
std::string get_env_var(const std::string& name);

} // namespace cogmem
