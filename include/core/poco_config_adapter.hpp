#pragma once

#include "core/poco_config_manager.hpp"
#include "core/segmenter.hpp"
#include "core/indexer.hpp"
#include "core/retriever.hpp"
#include "core/cache/clip_cache.hpp"
#include "core/clip_synthesizer.hpp"
#include "core/answer_composer.hpp"
#include "core/query_orchestrator.hpp"
#include "core/ollama_clients.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class ConfigObserver;

/**
 * @brief Typed access to the Lectern configuration.
 *
 * Delegates storage to PocoConfigManager and turns flat keys into the config structs
 * that components are constructed with. Components never read this singleton
 * themselves; main() wires them.
 */
class PocoConfigAdapter
{
public:
    static PocoConfigAdapter &getInstance()
    {
        static PocoConfigAdapter instance;
        return instance;
    }

    ~PocoConfigAdapter() = default;

    nlohmann::json getAll() const;
    std::string getLogLevel() const;
    std::string getDatabasePath() const;
    std::string getSubtitlesDir() const;

    // Frame sampling
    double getFrameSampleIntervalSeconds() const;
    std::string getFramesOutputDir() const;

    size_t getEmbeddingCacheCapacity() const;
    int getVectorDimensions() const;

    // Component configuration
    SegmenterConfig getSegmenterConfig() const;
    IndexerConfig getIndexerConfig() const;
    RetrieverConfig getRetrieverConfig() const;
    ClipCacheConfig getClipCacheConfig() const;
    ClipSynthesizerConfig getClipSynthesizerConfig() const;
    ComposerConfig getComposerConfig() const;
    OrchestratorConfig getOrchestratorConfig() const;
    ServiceEndpoints getServiceEndpoints() const;

    // Configuration setters with event publishing
    void setLogLevel(const std::string &level);
    void updateConfig(const std::string &json_config, const std::string &source = "api");

    // Configuration file operations
    bool saveConfig(const std::string &file_path = "") const;
    bool loadConfig(const std::string &file_path);

    /**
     * @brief Load $LECTERN_CONFIG, else config.json, else keep defaults and write them out
     */
    void loadStartupConfig();

    /**
     * @brief Drop every loaded value and return to the built-in defaults
     */
    void resetToDefaults();

    // Configuration validation
    bool validateConfig() const;
    std::vector<std::string> validationErrors() const;

    // Observer management
    void subscribe(ConfigObserver *observer);
    void unsubscribe(ConfigObserver *observer);

private:
    PocoConfigAdapter();
    PocoConfigAdapter(const PocoConfigAdapter &) = delete;
    PocoConfigAdapter &operator=(const PocoConfigAdapter &) = delete;

    void publishEvent(const std::vector<std::string> &changed_keys, const std::string &source);

    PocoConfigManager &poco_cfg_;

    // File updates are persisted to; empty until a config file has been loaded or created
    std::string config_path_;

    mutable std::mutex observers_mutex_;
    std::vector<ConfigObserver *> observers_;
    unsigned long update_counter_ = 0;
};
