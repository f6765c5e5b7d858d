#include "core/ollama_clients.hpp"
#include "core/errors.hpp"
#include "logging/logger.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{
    // POST a JSON body and return the reply body; transport errors and 5xx are transient
    std::string postJson(const std::string &base_url, const std::string &path, const json &body, int timeout_seconds)
    {
        httplib::Client client(base_url);
        client.set_connection_timeout(timeout_seconds, 0);
        client.set_read_timeout(timeout_seconds, 0);
        client.set_write_timeout(timeout_seconds, 0);

        auto res = client.Post(path, body.dump(), "application/json");
        if (!res)
        {
            throw TransientServiceError("Request to " + base_url + path + " failed: " + httplib::to_string(res.error()));
        }
        if (res->status >= 500)
        {
            throw TransientServiceError(base_url + path + " returned HTTP " + std::to_string(res->status));
        }
        if (res->status >= 400)
        {
            throw LecternError(base_url + path + " rejected the request with HTTP " + std::to_string(res->status) +
                               ": " + res->body);
        }
        return res->body;
    }
}

OllamaEmbeddingClient::OllamaEmbeddingClient(std::string base_url, std::string model, int timeout_seconds)
    : base_url_(std::move(base_url)), model_(std::move(model)), timeout_seconds_(timeout_seconds),
      breaker_("embedding:" + model_)
{
}

std::vector<float> OllamaEmbeddingClient::embed(const std::string &text)
{
    return breaker_.call([this, &text]()
                         { return requestEmbedding(text); });
}

std::vector<float> OllamaEmbeddingClient::requestEmbedding(const std::string &text)
{
    json body = {{"model", model_}, {"prompt", text}};
    std::string reply;
    try
    {
        reply = postJson(base_url_, "/api/embeddings", body, timeout_seconds_);
    }
    catch (const TransientServiceError &)
    {
        throw;
    }
    catch (const LecternError &e)
    {
        throw EmbeddingFailure(e.what());
    }

    json parsed = json::parse(reply, nullptr, false);
    if (parsed.is_discarded() || !parsed.contains("embedding") || !parsed["embedding"].is_array())
    {
        throw EmbeddingFailure("Embedding service returned an unexpected body for model " + model_);
    }
    std::vector<float> values = parsed["embedding"].get<std::vector<float>>();
    if (values.empty())
    {
        throw EmbeddingFailure("Embedding service returned an empty vector for model " + model_);
    }
    return values;
}

OllamaGenerationClient::OllamaGenerationClient(std::string base_url, std::string model, int timeout_seconds)
    : base_url_(std::move(base_url)), model_(std::move(model)), timeout_seconds_(timeout_seconds),
      breaker_("generation:" + model_)
{
}

std::string OllamaGenerationClient::generate(const std::string &prompt, const std::string &context)
{
    try
    {
        return breaker_.call([this, &prompt, &context]()
                             { return requestCompletion(prompt, context); });
    }
    catch (const TransientServiceError &e)
    {
        throw GenerationFailure(e.what());
    }
}

std::string OllamaGenerationClient::requestCompletion(const std::string &prompt, const std::string &context)
{
    json messages = json::array();
    messages.push_back({{"role", "user"}, {"content", prompt + "\n\nRelevant content:\n" + context}});
    json body = {{"model", model_}, {"messages", messages}, {"stream", false}};

    std::string reply;
    try
    {
        reply = postJson(base_url_, "/api/chat", body, timeout_seconds_);
    }
    catch (const TransientServiceError &)
    {
        throw;
    }
    catch (const LecternError &e)
    {
        throw GenerationFailure(e.what());
    }

    json parsed = json::parse(reply, nullptr, false);
    if (parsed.is_discarded())
    {
        throw GenerationFailure("Generation service returned a body that is not JSON");
    }
    std::string content;
    if (parsed.contains("message") && parsed["message"].contains("content"))
        content = parsed["message"]["content"].get<std::string>();
    else if (parsed.contains("response"))
        content = parsed["response"].get<std::string>();
    else
        throw GenerationFailure("Unexpected response format from generation service");

    Logger::debug("Generation model " + model_ + " returned " + std::to_string(content.size()) + " characters");
    return content;
}
