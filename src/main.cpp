#include "core/answer_composer.hpp"
#include "core/cache/clip_cache.hpp"
#include "core/cache/embedding_cache.hpp"
#include "core/clip_synthesizer.hpp"
#include "core/errors.hpp"
#include "core/ffmpeg_media_store.hpp"
#include "core/frame_sampler.hpp"
#include "core/indexer.hpp"
#include "core/ingestion_pipeline.hpp"
#include "core/logger_observer.hpp"
#include "core/ollama_clients.hpp"
#include "core/poco_config_adapter.hpp"
#include "core/query_orchestrator.hpp"
#include "core/retriever.hpp"
#include "core/shutdown_manager.hpp"
#include "core/thread_pool_manager.hpp"
#include "core/vector_index.hpp"
#include "database/chunk_store.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "Lectern - lecture video question answering" << std::endl;
        std::cout << "Usage: " << program << " <command> [options]" << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  ingest <video> <subtitles> [--id <video_id>]   Index one video" << std::endl;
        std::cout << "  ingest-dir <directory>                        Index every video with a matching .vtt/.srt" << std::endl;
        std::cout << "  ask \"<question>\" [--top-k N] [--min-score X] [--no-clip]" << std::endl;
        std::cout << "                                                Answer a question, printing JSON" << std::endl;
        std::cout << "  cache-evict                                   Apply the clip cache size and age bounds" << std::endl;
        std::cout << "  --help, -h                                    Show this help message" << std::endl;
        std::cout << "Configuration is read from $LECTERN_CONFIG or ./config.json" << std::endl;
    }

    int parseInt(const std::string &option, const std::string &value)
    {
        try
        {
            size_t used = 0;
            int parsed = std::stoi(value, &used);
            if (used == value.size())
                return parsed;
        }
        catch (const std::exception &)
        {
        }
        throw InvalidQueryError(option + " expects an integer, got '" + value + "'");
    }

    double parseDouble(const std::string &option, const std::string &value)
    {
        try
        {
            size_t used = 0;
            double parsed = std::stod(value, &used);
            if (used == value.size())
                return parsed;
        }
        catch (const std::exception &)
        {
        }
        throw InvalidQueryError(option + " expects a number, got '" + value + "'");
    }

    // Shared service wiring for every command
    struct Services
    {
        std::shared_ptr<ChunkStore> store;
        std::shared_ptr<EmbeddingCache> embedding_cache;
        std::shared_ptr<EmbeddingFunction> embedder;
        std::shared_ptr<QdrantVectorIndex> vector_index;
    };

    Services connectServices(PocoConfigAdapter &config)
    {
        Services services;
        services.store = std::make_shared<ChunkStore>(config.getDatabasePath());
        if (!services.store->isOpen())
        {
            throw LecternError("Could not open database " + config.getDatabasePath());
        }

        ServiceEndpoints endpoints = config.getServiceEndpoints();
        services.embedding_cache = std::make_shared<EmbeddingCache>(config.getEmbeddingCacheCapacity());
        auto client = std::make_shared<OllamaEmbeddingClient>(endpoints.embedding_url, endpoints.embedding_model);
        services.embedder = std::make_shared<CachedEmbeddingFunction>(client, services.embedding_cache);
        services.vector_index = std::make_shared<QdrantVectorIndex>(endpoints.vector_url, endpoints.vector_collection,
                                                                    endpoints.vector_dimensions);
        return services;
    }

    std::shared_ptr<IngestionPipeline> makePipeline(PocoConfigAdapter &config, const Services &services)
    {
        services.vector_index->ensureCollection();
        auto indexer = std::make_shared<Indexer>(services.embedder, services.vector_index, services.store,
                                                 config.getIndexerConfig());
        auto analyzer = std::make_shared<FFmpegMediaAnalyzer>(config.getFramesOutputDir());
        IngestionConfig ingestion;
        ingestion.frame_sample_interval_seconds = config.getFrameSampleIntervalSeconds();
        return std::make_shared<IngestionPipeline>(analyzer, services.store, indexer, config.getSegmenterConfig(),
                                                   ingestion);
    }

    int printReport(const IngestionReport &report)
    {
        nlohmann::json failures = nlohmann::json::array();
        for (const auto &failure : report.failures)
            failures.push_back({{"chunk_id", failure.chunk_id}, {"reason", failure.reason}});
        nlohmann::json out = {{"video_id", report.video_id},
                              {"success", report.success},
                              {"cues", report.cues},
                              {"frames", report.frames},
                              {"chunks", report.chunks},
                              {"vectors_written", report.vectors_written},
                              {"superseded", report.superseded},
                              {"failures", failures}};
        if (!report.success)
            out["error"] = report.error_message;
        std::cout << out.dump(2) << std::endl;
        return report.success ? 0 : 1;
    }

    int runIngest(PocoConfigAdapter &config, const std::vector<std::string> &args)
    {
        std::string video_id;
        std::vector<std::string> positional;
        for (size_t i = 0; i < args.size(); ++i)
        {
            if (args[i] == "--id" && i + 1 < args.size())
                video_id = args[++i];
            else
                positional.push_back(args[i]);
        }
        if (positional.size() != 2)
        {
            std::cerr << "ingest expects <video> <subtitles>" << std::endl;
            return 2;
        }
        if (video_id.empty())
            video_id = std::filesystem::path(positional[0]).stem().string();

        Services services = connectServices(config);
        auto pipeline = makePipeline(config, services);
        return printReport(pipeline->ingest(video_id, positional[0], positional[1]));
    }

    int runIngestDirectory(PocoConfigAdapter &config, const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            std::cerr << "ingest-dir expects <directory>" << std::endl;
            return 2;
        }
        Services services = connectServices(config);
        auto pipeline = makePipeline(config, services);

        int status = 0;
        for (const auto &report : pipeline->ingestDirectory(args[0]))
        {
            if (printReport(report) != 0)
                status = 1;
        }
        return status;
    }

    int runAsk(PocoConfigAdapter &config, const std::vector<std::string> &args)
    {
        QueryOptions options;
        std::string question;
        for (size_t i = 0; i < args.size(); ++i)
        {
            const std::string &arg = args[i];
            if (arg == "--top-k" || arg == "--min-score")
            {
                if (i + 1 >= args.size())
                    throw InvalidQueryError(arg + " requires a value");
                if (arg == "--top-k")
                    options.top_k = parseInt(arg, args[++i]);
                else
                    options.min_score = parseDouble(arg, args[++i]);
            }
            else if (arg == "--no-clip")
            {
                options.include_clip = false;
            }
            else if (question.empty())
            {
                question = arg;
            }
            else
            {
                throw InvalidQueryError("Unexpected argument '" + arg + "'");
            }
        }

        Services services = connectServices(config);
        ServiceEndpoints endpoints = config.getServiceEndpoints();

        auto retriever = std::make_shared<Retriever>(services.vector_index, services.store,
                                                     config.getRetrieverConfig());
        ClipCacheConfig cache_config = config.getClipCacheConfig();
        auto clip_cache = std::make_shared<ClipCache>(cache_config);
        clip_cache->restore();
        // Expired clips go before answering so a printed clip path stays valid
        clip_cache->evict();
        auto media_store = std::make_shared<FFmpegMediaStore>(services.store, cache_config.container);
        auto synthesizer = std::make_shared<ClipSynthesizer>(media_store, clip_cache,
                                                             config.getClipSynthesizerConfig());
        auto generator = std::make_shared<OllamaGenerationClient>(endpoints.generation_url,
                                                                  endpoints.generation_model);
        auto composer = std::make_shared<AnswerComposer>(generator, config.getComposerConfig());
        QueryOrchestrator orchestrator(services.embedder, retriever, synthesizer, composer,
                                       config.getOrchestratorConfig());

        QueryResult result = orchestrator.answer(question, options,
                                                 &ShutdownManager::getInstance().cancellationToken());
        std::cout << queryResultToJson(result).dump(2) << std::endl;
        return 0;
    }

    int runCacheEvict(PocoConfigAdapter &config)
    {
        ClipCache cache(config.getClipCacheConfig());
        cache.restore();
        size_t evicted = cache.evict();
        ClipCacheStats stats = cache.stats();
        nlohmann::json out = {{"evicted", evicted}, {"entries", stats.entries}, {"bytes", stats.bytes}};
        std::cout << out.dump(2) << std::endl;
        return 0;
    }
}

int main(int argc, char *argv[])
{
    if (argc < 2)
    {
        printUsage(argv[0]);
        return 2;
    }
    const std::string command = argv[1];
    if (command == "--help" || command == "-h")
    {
        printUsage(argv[0]);
        return 0;
    }
    std::vector<std::string> args(argv + 2, argv + argc);

    ShutdownManager::getInstance().installSignalHandlers();

    // Initialize configuration manager
    auto &config_manager = PocoConfigAdapter::getInstance();
    config_manager.loadStartupConfig();

    // Initialize logger with configured log level
    Logger::init(config_manager.getLogLevel());
    for (const auto &error : config_manager.validationErrors())
    {
        Logger::warn("Configuration problem: " + error);
    }

    // Create and register configuration observers
    auto logger_observer = std::make_unique<LoggerObserver>(config_manager);
    auto thread_pool_observer = std::make_unique<ThreadPoolManager>(config_manager);
    config_manager.subscribe(logger_observer.get());
    config_manager.subscribe(thread_pool_observer.get());

    ThreadPoolManager::initialize(static_cast<size_t>(std::max(1, config_manager.getIndexerConfig().threads)));

    int status = 0;
    try
    {
        if (command == "ingest")
            status = runIngest(config_manager, args);
        else if (command == "ingest-dir")
            status = runIngestDirectory(config_manager, args);
        else if (command == "ask")
            status = runAsk(config_manager, args);
        else if (command == "cache-evict")
            status = runCacheEvict(config_manager);
        else
        {
            std::cerr << "Unknown command: " << command << std::endl;
            printUsage(argv[0]);
            status = 2;
        }
    }
    catch (const InvalidQueryError &e)
    {
        std::cerr << "Invalid query: " << e.what() << std::endl;
        status = 2;
    }
    catch (const QueryCancelled &e)
    {
        std::cerr << "Cancelled: " << e.what() << std::endl;
        status = 130;
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Fatal error: ") + e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        status = 1;
    }

    config_manager.unsubscribe(thread_pool_observer.get());
    config_manager.unsubscribe(logger_observer.get());
    ThreadPoolManager::shutdown();
    return status;
}
