#pragma once

#include <string>
#include <vector>
#include "core/capabilities.hpp"
#include "core/error_recovery.hpp"

/**
 * @brief Locations and model names of the external model and vector services
 */
struct ServiceEndpoints
{
    std::string embedding_url = "http://localhost:11434";
    std::string embedding_model = "all-minilm";
    std::string generation_url = "http://localhost:11434";
    std::string generation_model = "llama3";
    std::string vector_url = "http://localhost:6333";
    std::string vector_collection = "lecture_chunks";
    int vector_dimensions = 384;
};

/**
 * @brief EmbeddingFunction served by an Ollama-compatible /api/embeddings endpoint
 */
class OllamaEmbeddingClient : public EmbeddingFunction
{
public:
    OllamaEmbeddingClient(std::string base_url, std::string model, int timeout_seconds = 30);

    std::vector<float> embed(const std::string &text) override;
    std::string modelId() const override { return model_; }

    const ErrorRecovery::CircuitBreaker &circuitBreaker() const { return breaker_; }

private:
    std::vector<float> requestEmbedding(const std::string &text);

    std::string base_url_;
    std::string model_;
    int timeout_seconds_;
    ErrorRecovery::CircuitBreaker breaker_;
};

/**
 * @brief GenerationFunction served by an Ollama-compatible /api/chat endpoint
 *
 * The prompt and the grounding context travel together in one user message.
 */
class OllamaGenerationClient : public GenerationFunction
{
public:
    OllamaGenerationClient(std::string base_url, std::string model, int timeout_seconds = 120);

    std::string generate(const std::string &prompt, const std::string &context) override;
    std::string modelId() const override { return model_; }

    const ErrorRecovery::CircuitBreaker &circuitBreaker() const { return breaker_; }

private:
    std::string requestCompletion(const std::string &prompt, const std::string &context);

    std::string base_url_;
    std::string model_;
    int timeout_seconds_;
    ErrorRecovery::CircuitBreaker breaker_;
};
