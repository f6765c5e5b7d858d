#include "core/cache/embedding_cache.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <limits>
#include <mutex>

EmbeddingCache::EmbeddingCache(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity)
{
    Logger::info("Embedding cache initialized with capacity " + std::to_string(capacity_));
}

std::string EmbeddingCache::makeKey(const std::string &model_id, const std::string &text)
{
    return model_id + ":" + FileUtils::sha256Hex(text);
}

std::optional<std::vector<float>> EmbeddingCache::get(const std::string &model_id, const std::string &text) const
{
    const std::string key = makeKey(model_id, text);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end())
    {
        misses_.fetch_add(1);
        return std::nullopt;
    }
    it->second.last_used.store(clock_.fetch_add(1) + 1);
    hits_.fetch_add(1);
    return *it->second.values;
}

void EmbeddingCache::put(const std::string &model_id, const std::string &text, std::vector<float> values)
{
    const std::string key = makeKey(model_id, text);
    auto shared_values = std::make_shared<const std::vector<float>>(std::move(values));

    std::unique_lock<std::shared_mutex> lock(mutex_);
    uint64_t tick = clock_.fetch_add(1) + 1;
    auto it = entries_.find(key);
    if (it != entries_.end())
    {
        it->second.values = shared_values;
        it->second.last_used.store(tick);
        return;
    }
    if (entries_.size() >= capacity_)
    {
        evictLeastRecentlyUsed();
    }
    entries_.emplace(std::piecewise_construct,
                     std::forward_as_tuple(key),
                     std::forward_as_tuple(model_id, shared_values, tick));
}

void EmbeddingCache::evictLeastRecentlyUsed()
{
    auto oldest = entries_.end();
    uint64_t oldest_tick = std::numeric_limits<uint64_t>::max();
    for (auto it = entries_.begin(); it != entries_.end(); ++it)
    {
        uint64_t tick = it->second.last_used.load();
        if (tick < oldest_tick)
        {
            oldest_tick = tick;
            oldest = it;
        }
    }
    if (oldest != entries_.end())
    {
        entries_.erase(oldest);
    }
}

size_t EmbeddingCache::invalidateModel(const std::string &model_id)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();)
    {
        if (it->second.model_id == model_id)
        {
            it = entries_.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    Logger::info("Invalidated " + std::to_string(removed) + " cached embeddings for model " + model_id);
    return removed;
}

void EmbeddingCache::clear()
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
}

size_t EmbeddingCache::size() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

CachedEmbeddingFunction::CachedEmbeddingFunction(std::shared_ptr<EmbeddingFunction> inner,
                                                 std::shared_ptr<EmbeddingCache> cache)
    : inner_(std::move(inner)), cache_(std::move(cache))
{
}

std::vector<float> CachedEmbeddingFunction::embed(const std::string &text)
{
    const std::string model = inner_->modelId();
    if (auto cached = cache_->get(model, text))
    {
        return *cached;
    }
    std::vector<float> values = inner_->embed(text);
    if (!values.empty())
    {
        cache_->put(model, text, values);
    }
    return values;
}

std::string CachedEmbeddingFunction::modelId() const
{
    return inner_->modelId();
}
