#include "core/vector_index.hpp"
#include "core/errors.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <mutex>

using json = nlohmann::json;

double InMemoryVectorIndex::cosineSimilarity(const std::vector<float> &a, const std::vector<float> &b)
{
    if (a.size() != b.size() || a.empty())
        return 0.0;
    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i)
    {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }
    if (norm_a == 0.0 || norm_b == 0.0)
        return 0.0;
    return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

std::vector<VectorCandidate> InMemoryVectorIndex::search(const std::vector<float> &query_vector, int k)
{
    std::vector<VectorCandidate> candidates;
    if (k <= 0 || query_vector.empty())
        return candidates;

    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        candidates.reserve(vectors_.size());
        for (const auto &entry : vectors_)
        {
            if (entry.second.values.size() != query_vector.size())
                continue;
            double score = std::min(1.0, std::max(0.0, cosineSimilarity(query_vector, entry.second.values)));
            candidates.push_back({entry.first, score});
        }
    }

    auto by_score = [](const VectorCandidate &a, const VectorCandidate &b)
    {
        if (a.score != b.score)
            return a.score > b.score;
        return a.chunk_id < b.chunk_id;
    };
    if (candidates.size() > static_cast<size_t>(k))
    {
        std::partial_sort(candidates.begin(), candidates.begin() + k, candidates.end(), by_score);
        candidates.resize(static_cast<size_t>(k));
    }
    else
    {
        std::sort(candidates.begin(), candidates.end(), by_score);
    }
    return candidates;
}

void InMemoryVectorIndex::upsert(const EmbeddingVector &vector)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    vectors_[vector.chunk_id] = vector;
}

void InMemoryVectorIndex::remove(const std::string &chunk_id)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    vectors_.erase(chunk_id);
}

size_t InMemoryVectorIndex::size() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return vectors_.size();
}

bool InMemoryVectorIndex::contains(const std::string &chunk_id) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return vectors_.count(chunk_id) > 0;
}

std::optional<std::string> InMemoryVectorIndex::modelFor(const std::string &chunk_id) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = vectors_.find(chunk_id);
    if (it == vectors_.end())
        return std::nullopt;
    return it->second.model_id;
}

QdrantVectorIndex::QdrantVectorIndex(std::string base_url, std::string collection, int dimensions, int timeout_seconds)
    : base_url_(std::move(base_url)), collection_(std::move(collection)), dimensions_(dimensions),
      timeout_seconds_(timeout_seconds)
{
}

uint64_t QdrantVectorIndex::pointIdFor(const std::string &chunk_id)
{
    // First 16 hex digits of the SHA-256, top bit cleared to stay within int64 range
    std::string hex = FileUtils::sha256Hex(chunk_id).substr(0, 16);
    uint64_t id = std::stoull(hex, nullptr, 16);
    return id & 0x7FFFFFFFFFFFFFFFULL;
}

std::string QdrantVectorIndex::request(const std::string &path, const std::string &body, const std::string &method)
{
    httplib::Client client(base_url_);
    client.set_connection_timeout(timeout_seconds_, 0);
    client.set_read_timeout(timeout_seconds_, 0);
    client.set_write_timeout(timeout_seconds_, 0);

    httplib::Result res = method == "PUT" ? client.Put(path, body, "application/json")
                                          : client.Post(path, body, "application/json");
    if (!res)
    {
        throw TransientServiceError("Vector service request " + method + " " + path + " failed: " +
                                    httplib::to_string(res.error()));
    }
    if (res->status >= 500)
    {
        throw TransientServiceError("Vector service returned HTTP " + std::to_string(res->status) + " for " + path);
    }
    if (res->status >= 400)
    {
        throw LecternError("Vector service rejected " + method + " " + path + " with HTTP " +
                           std::to_string(res->status) + ": " + res->body);
    }
    return res->body;
}

void QdrantVectorIndex::ensureCollection()
{
    httplib::Client client(base_url_);
    client.set_connection_timeout(timeout_seconds_, 0);
    client.set_read_timeout(timeout_seconds_, 0);
    auto existing = client.Get("/collections/" + collection_);
    if (existing && existing->status == 200)
    {
        Logger::debug("Vector collection already exists: " + collection_);
        return;
    }

    json body = {{"vectors", {{"size", dimensions_}, {"distance", "Cosine"}}}};
    request("/collections/" + collection_, body.dump(), "PUT");
    Logger::info("Created vector collection " + collection_ + " with " + std::to_string(dimensions_) + " dimensions");
}

std::vector<VectorCandidate> QdrantVectorIndex::search(const std::vector<float> &query_vector, int k)
{
    std::vector<VectorCandidate> candidates;
    if (k <= 0 || query_vector.empty())
        return candidates;

    json body = {{"vector", query_vector}, {"limit", k}, {"with_payload", true}};
    std::string response = request("/collections/" + collection_ + "/points/search", body.dump(), "POST");

    json parsed;
    try
    {
        parsed = json::parse(response);
    }
    catch (const json::parse_error &e)
    {
        throw TransientServiceError("Malformed vector search response: " + std::string(e.what()));
    }
    if (!parsed.contains("result") || !parsed["result"].is_array())
    {
        throw TransientServiceError("Vector search response has no result array");
    }

    for (const auto &hit : parsed["result"])
    {
        if (!hit.contains("payload") || !hit["payload"].contains("chunk_id"))
        {
            Logger::warn("Skipping vector hit without chunk_id payload");
            continue;
        }
        VectorCandidate candidate;
        candidate.chunk_id = hit["payload"]["chunk_id"].get<std::string>();
        candidate.score = std::min(1.0, std::max(0.0, hit.value("score", 0.0)));
        candidates.push_back(candidate);
    }
    return candidates;
}

void QdrantVectorIndex::upsert(const EmbeddingVector &vector)
{
    json point = {{"id", pointIdFor(vector.chunk_id)},
                  {"vector", vector.values},
                  {"payload", {{"chunk_id", vector.chunk_id}, {"model_id", vector.model_id}}}};
    json body = {{"points", json::array({point})}};
    request("/collections/" + collection_ + "/points?wait=true", body.dump(), "PUT");
}

void QdrantVectorIndex::remove(const std::string &chunk_id)
{
    json body = {{"points", json::array({pointIdFor(chunk_id)})}};
    request("/collections/" + collection_ + "/points/delete?wait=true", body.dump(), "POST");
}
