#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/capabilities.hpp"

/**
 * @brief Process-wide LRU cache of text embeddings keyed by (model id, SHA-256 of text)
 *
 * Lookups only take a shared lock; recency is tracked with an atomic tick per entry so
 * readers never contend with each other. Entries are published whole under the
 * exclusive lock, so a reader never observes a partially written vector.
 */
class EmbeddingCache
{
public:
    explicit EmbeddingCache(size_t capacity = 4096);

    std::optional<std::vector<float>> get(const std::string &model_id, const std::string &text) const;
    void put(const std::string &model_id, const std::string &text, std::vector<float> values);

    /**
     * @brief Drop every entry produced by the given model
     * @return Number of entries removed
     */
    size_t invalidateModel(const std::string &model_id);
    void clear();

    size_t size() const;
    size_t capacity() const { return capacity_; }
    uint64_t hits() const { return hits_.load(); }
    uint64_t misses() const { return misses_.load(); }

    static std::string makeKey(const std::string &model_id, const std::string &text);

private:
    struct Entry
    {
        Entry(std::string model, std::shared_ptr<const std::vector<float>> vec, uint64_t tick)
            : model_id(std::move(model)), values(std::move(vec)), last_used(tick) {}

        std::string model_id;
        std::shared_ptr<const std::vector<float>> values;
        mutable std::atomic<uint64_t> last_used;
    };

    void evictLeastRecentlyUsed();

    size_t capacity_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    mutable std::atomic<uint64_t> clock_{0};
    mutable std::atomic<uint64_t> hits_{0};
    mutable std::atomic<uint64_t> misses_{0};
};

/**
 * @brief EmbeddingFunction decorator that consults an EmbeddingCache first
 */
class CachedEmbeddingFunction : public EmbeddingFunction
{
public:
    CachedEmbeddingFunction(std::shared_ptr<EmbeddingFunction> inner, std::shared_ptr<EmbeddingCache> cache);

    std::vector<float> embed(const std::string &text) override;
    std::string modelId() const override;

private:
    std::shared_ptr<EmbeddingFunction> inner_;
    std::shared_ptr<EmbeddingCache> cache_;
};
