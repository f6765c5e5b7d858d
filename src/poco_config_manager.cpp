#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.good())
        return false;
    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        cfg_ = tmp;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to parse configuration file " + path + ": " + e.displayText());
        return false;
    }
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_unsigned())
                cfg_->setUInt(prefix, static_cast<unsigned>(node.get<unsigned long long>()));
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

// Basic configuration getters
std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

double PocoConfigManager::getDouble(const std::string &key, double def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getDouble(key, def);
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

void PocoConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);

    cfg_->setString("log_level", "INFO");
    cfg_->setString("database_path", "lectern.db");
    cfg_->setString("subtitles_dir", "subtitles");

    // Segmenter defaults
    cfg_->setDouble("segmenter.max_chunk_duration_seconds", 30.0);
    cfg_->setDouble("segmenter.silence_gap_seconds", 2.0);

    // Frame sampling defaults
    cfg_->setDouble("frames.sample_interval_seconds", 5.0);
    cfg_->setString("frames.output_dir", "frames");

    // Indexer defaults
    cfg_->setInt("indexer.max_retries", 3);
    cfg_->setInt("indexer.backoff_base_ms", 100);
    cfg_->setInt("indexer.threads", 4);

    // Retrieval defaults
    cfg_->setInt("retrieval.overfetch_factor", 3);
    cfg_->setDouble("retrieval.merge_gap_seconds", 1.0);

    // Clip cache defaults
    cfg_->setDouble("clip.granularity_seconds", 0.5);
    cfg_->setString("clip.cache_dir", "clips");
    cfg_->setInt("clip.max_cache_size_mb", 1024);
    cfg_->setInt("clip.max_age_seconds", 86400);
    cfg_->setString("clip.container", "mp4");

    // Answer composition defaults
    cfg_->setInt("composer.max_context_chars", 6000);

    // Per-step timeouts
    cfg_->setInt("timeouts.embedding_ms", 5000);
    cfg_->setInt("timeouts.search_ms", 3000);
    cfg_->setInt("timeouts.generation_ms", 30000);
    cfg_->setInt("timeouts.extraction_ms", 20000);

    // External services
    cfg_->setString("services.embedding_url", "http://localhost:11434");
    cfg_->setString("services.embedding_model", "all-minilm");
    cfg_->setString("services.generation_url", "http://localhost:11434");
    cfg_->setString("services.generation_model", "llama3");
    cfg_->setString("services.vector_url", "http://localhost:6333");
    cfg_->setString("services.vector_collection", "lecture_chunks");
    cfg_->setInt("services.vector_dimensions", 384);

    cfg_->setInt("embedding_cache.capacity", 4096);
}

void PocoConfigManager::resetToDefaults()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cfg_ = new JSONConfiguration();
    }
    initializeDefaultConfig();
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->has(key);
}

std::vector<std::string> PocoConfigManager::getKeys(const std::string &prefix) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    collectKeys(prefix, keys);
    return keys;
}

void PocoConfigManager::collectKeys(const std::string &prefix, std::vector<std::string> &out) const
{
    Poco::Util::AbstractConfiguration::Keys children;
    cfg_->keys(prefix, children);
    if (children.empty())
    {
        if (!prefix.empty())
            out.push_back(prefix);
        return;
    }
    for (const auto &child : children)
    {
        collectKeys(prefix.empty() ? child : prefix + "." + child, out);
    }
}
