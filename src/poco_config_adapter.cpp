#include "core/poco_config_adapter.hpp"
#include "core/config_observer.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <functional>

PocoConfigAdapter::PocoConfigAdapter()
    : poco_cfg_(PocoConfigManager::getInstance())
{
}

// Configuration getters - delegate to PocoConfigManager
nlohmann::json PocoConfigAdapter::getAll() const
{
    return poco_cfg_.getAll();
}

std::string PocoConfigAdapter::getLogLevel() const
{
    return poco_cfg_.getString("log_level", "INFO");
}

std::string PocoConfigAdapter::getDatabasePath() const
{
    return poco_cfg_.getString("database_path", "lectern.db");
}

std::string PocoConfigAdapter::getSubtitlesDir() const
{
    return poco_cfg_.getString("subtitles_dir", "subtitles");
}

double PocoConfigAdapter::getFrameSampleIntervalSeconds() const
{
    return poco_cfg_.getDouble("frames.sample_interval_seconds", 5.0);
}

std::string PocoConfigAdapter::getFramesOutputDir() const
{
    return poco_cfg_.getString("frames.output_dir", "frames");
}

size_t PocoConfigAdapter::getEmbeddingCacheCapacity() const
{
    int capacity = poco_cfg_.getInt("embedding_cache.capacity", 4096);
    return capacity > 0 ? static_cast<size_t>(capacity) : 1;
}

int PocoConfigAdapter::getVectorDimensions() const
{
    return poco_cfg_.getInt("services.vector_dimensions", 384);
}

SegmenterConfig PocoConfigAdapter::getSegmenterConfig() const
{
    SegmenterConfig config;
    config.max_chunk_duration_seconds = poco_cfg_.getDouble("segmenter.max_chunk_duration_seconds", 30.0);
    config.silence_gap_seconds = poco_cfg_.getDouble("segmenter.silence_gap_seconds", 2.0);
    return config;
}

IndexerConfig PocoConfigAdapter::getIndexerConfig() const
{
    IndexerConfig config;
    config.max_retries = poco_cfg_.getInt("indexer.max_retries", 3);
    config.backoff_base_ms = poco_cfg_.getInt("indexer.backoff_base_ms", 100);
    config.threads = poco_cfg_.getInt("indexer.threads", 4);
    return config;
}

RetrieverConfig PocoConfigAdapter::getRetrieverConfig() const
{
    RetrieverConfig config;
    config.overfetch_factor = poco_cfg_.getInt("retrieval.overfetch_factor", 3);
    config.merge_gap_seconds = poco_cfg_.getDouble("retrieval.merge_gap_seconds", 1.0);
    return config;
}

ClipCacheConfig PocoConfigAdapter::getClipCacheConfig() const
{
    ClipCacheConfig config;
    config.cache_dir = poco_cfg_.getString("clip.cache_dir", "clips");
    int size_mb = poco_cfg_.getInt("clip.max_cache_size_mb", 1024);
    config.max_size_bytes = static_cast<std::uintmax_t>(std::max(size_mb, 0)) * 1024 * 1024;
    config.max_age_seconds = poco_cfg_.getInt("clip.max_age_seconds", 86400);
    config.container = poco_cfg_.getString("clip.container", "mp4");
    return config;
}

ClipSynthesizerConfig PocoConfigAdapter::getClipSynthesizerConfig() const
{
    ClipSynthesizerConfig config;
    config.granularity_seconds = poco_cfg_.getDouble("clip.granularity_seconds", 0.5);
    return config;
}

ComposerConfig PocoConfigAdapter::getComposerConfig() const
{
    ComposerConfig config;
    int max_chars = poco_cfg_.getInt("composer.max_context_chars", 6000);
    config.max_context_chars = max_chars > 0 ? static_cast<size_t>(max_chars) : 0;
    return config;
}

OrchestratorConfig PocoConfigAdapter::getOrchestratorConfig() const
{
    OrchestratorConfig config;
    config.embedding_timeout_ms = poco_cfg_.getInt("timeouts.embedding_ms", 5000);
    config.search_timeout_ms = poco_cfg_.getInt("timeouts.search_ms", 3000);
    config.generation_timeout_ms = poco_cfg_.getInt("timeouts.generation_ms", 30000);
    config.extraction_timeout_ms = poco_cfg_.getInt("timeouts.extraction_ms", 20000);
    return config;
}

ServiceEndpoints PocoConfigAdapter::getServiceEndpoints() const
{
    ServiceEndpoints endpoints;
    endpoints.embedding_url = poco_cfg_.getString("services.embedding_url", endpoints.embedding_url);
    endpoints.embedding_model = poco_cfg_.getString("services.embedding_model", endpoints.embedding_model);
    endpoints.generation_url = poco_cfg_.getString("services.generation_url", endpoints.generation_url);
    endpoints.generation_model = poco_cfg_.getString("services.generation_model", endpoints.generation_model);
    endpoints.vector_url = poco_cfg_.getString("services.vector_url", endpoints.vector_url);
    endpoints.vector_collection = poco_cfg_.getString("services.vector_collection", endpoints.vector_collection);
    endpoints.vector_dimensions = getVectorDimensions();
    return endpoints;
}

void PocoConfigAdapter::setLogLevel(const std::string &level)
{
    poco_cfg_.update({{"log_level", level}});
    publishEvent({"log_level"}, "api");
}

void PocoConfigAdapter::updateConfig(const std::string &json_config, const std::string &source)
{
    nlohmann::json patch;
    try
    {
        patch = nlohmann::json::parse(json_config);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        Logger::error("Failed to update config: " + std::string(e.what()));
        return;
    }
    if (!patch.is_object())
    {
        Logger::error("Failed to update config: expected a JSON object");
        return;
    }

    std::vector<std::string> changed_keys;
    std::function<void(const std::string &, const nlohmann::json &)> collect;
    collect = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
                collect(prefix.empty() ? it.key() : prefix + "." + it.key(), it.value());
        }
        else if (!node.is_null())
        {
            changed_keys.push_back(prefix);
        }
    };
    collect("", patch);

    poco_cfg_.update(patch);

    // Save to file
    if (!config_path_.empty() && !poco_cfg_.save(config_path_))
    {
        Logger::warn("Failed to persist configuration to " + config_path_);
    }

    publishEvent(changed_keys, source);
}

bool PocoConfigAdapter::loadConfig(const std::string &file_path)
{
    if (!poco_cfg_.load(file_path))
        return false;
    config_path_ = file_path;
    Logger::info("Loaded configuration from " + file_path);

    for (const auto &error : validationErrors())
        Logger::warn("Configuration problem: " + error);

    std::vector<std::string> keys = poco_cfg_.getKeys();
    publishEvent(keys, "file");
    return true;
}

bool PocoConfigAdapter::saveConfig(const std::string &file_path) const
{
    // If no file path specified, default to the loaded file or config.json
    std::string target_path = file_path.empty() ? (config_path_.empty() ? "config.json" : config_path_) : file_path;
    return poco_cfg_.save(target_path);
}

void PocoConfigAdapter::loadStartupConfig()
{
    const char *env_path = std::getenv("LECTERN_CONFIG");
    if (env_path && *env_path)
    {
        if (loadConfig(env_path))
            return;
        Logger::warn(std::string("Could not load configuration from $LECTERN_CONFIG=") + env_path +
                     ", falling back to config.json");
    }

    // Try to load existing config.json first (primary source)
    if (loadConfig("config.json"))
        return;

    Logger::info("No existing configuration file found, using defaults");
    // Save the default configuration as JSON
    if (poco_cfg_.save("config.json"))
    {
        config_path_ = "config.json";
        Logger::info("Created new config.json with default values");
    }
}

void PocoConfigAdapter::resetToDefaults()
{
    poco_cfg_.resetToDefaults();
    config_path_.clear();
    publishEvent(poco_cfg_.getKeys(), "defaults");
}

// Configuration validation
std::vector<std::string> PocoConfigAdapter::validationErrors() const
{
    std::vector<std::string> errors;

    if (!Logger::isValidLevel(getLogLevel()))
        errors.push_back("log_level '" + getLogLevel() + "' is not a known level");

    SegmenterConfig segmenter = getSegmenterConfig();
    if (!(segmenter.max_chunk_duration_seconds > 0.0))
        errors.push_back("segmenter.max_chunk_duration_seconds must be positive");
    if (segmenter.silence_gap_seconds < 0.0)
        errors.push_back("segmenter.silence_gap_seconds must not be negative");

    if (!(getFrameSampleIntervalSeconds() > 0.0))
        errors.push_back("frames.sample_interval_seconds must be positive");

    IndexerConfig indexer = getIndexerConfig();
    if (indexer.max_retries < 1)
        errors.push_back("indexer.max_retries must be at least 1");
    if (indexer.backoff_base_ms < 0)
        errors.push_back("indexer.backoff_base_ms must not be negative");
    if (indexer.threads < 1)
        errors.push_back("indexer.threads must be at least 1");

    RetrieverConfig retriever = getRetrieverConfig();
    if (retriever.overfetch_factor < 1)
        errors.push_back("retrieval.overfetch_factor must be at least 1");
    if (retriever.merge_gap_seconds < 0.0)
        errors.push_back("retrieval.merge_gap_seconds must not be negative");

    if (!(getClipSynthesizerConfig().granularity_seconds > 0.0))
        errors.push_back("clip.granularity_seconds must be positive");
    if (poco_cfg_.getInt("clip.max_cache_size_mb", 1024) <= 0)
        errors.push_back("clip.max_cache_size_mb must be positive");
    if (getClipCacheConfig().max_age_seconds < 0)
        errors.push_back("clip.max_age_seconds must not be negative");

    if (poco_cfg_.getInt("composer.max_context_chars", 6000) <= 0)
        errors.push_back("composer.max_context_chars must be positive");

    OrchestratorConfig timeouts = getOrchestratorConfig();
    if (timeouts.embedding_timeout_ms <= 0 || timeouts.search_timeout_ms <= 0 ||
        timeouts.generation_timeout_ms <= 0 || timeouts.extraction_timeout_ms <= 0)
        errors.push_back("timeouts.* must be positive");

    if (getVectorDimensions() <= 0)
        errors.push_back("services.vector_dimensions must be positive");

    return errors;
}

bool PocoConfigAdapter::validateConfig() const
{
    return validationErrors().empty();
}

// Observer management
void PocoConfigAdapter::subscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.push_back(observer);
    Logger::info("Configuration observer subscribed");
}

void PocoConfigAdapter::unsubscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(
        std::remove(observers_.begin(), observers_.end(), observer),
        observers_.end());
    Logger::info("Configuration observer unsubscribed");
}

// Internal methods
void PocoConfigAdapter::publishEvent(const std::vector<std::string> &changed_keys, const std::string &source)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);

    ConfigUpdateEvent event;
    event.changed_keys = changed_keys;
    event.source = source;
    event.update_id = source + "-" + std::to_string(++update_counter_);

    Logger::info("Publishing config update " + event.update_id + " with " +
                 std::to_string(changed_keys.size()) + " changed keys");
    for (auto observer : observers_)
    {
        try
        {
            observer->onConfigUpdate(event);
        }
        catch (const std::exception &e)
        {
            Logger::error("Error in config observer: " + std::string(e.what()));
        }
    }
}
