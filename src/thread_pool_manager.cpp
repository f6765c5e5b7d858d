#include "core/thread_pool_manager.hpp"
#include "core/poco_config_adapter.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <thread>

// Static member initialization
std::unique_ptr<tbb::global_control> ThreadPoolManager::global_control_;
std::atomic<bool> ThreadPoolManager::initialized_{false};
std::atomic<size_t> ThreadPoolManager::current_thread_count_{0};
std::mutex ThreadPoolManager::resize_mutex_;

void ThreadPoolManager::initialize(size_t num_threads)
{
    std::lock_guard<std::mutex> lock(resize_mutex_);
    if (initialized_.load())
        return;

    if (!validateThreadCount(num_threads))
    {
        Logger::error("Invalid thread count: " + std::to_string(num_threads) + ". Using default: 4");
        num_threads = 4;
    }
    global_control_ = std::make_unique<tbb::global_control>(
        tbb::global_control::max_allowed_parallelism, num_threads);
    current_thread_count_.store(num_threads);
    initialized_.store(true);
    Logger::info("Thread pool manager initialized with " + std::to_string(num_threads) + " threads");
}

void ThreadPoolManager::shutdown()
{
    std::lock_guard<std::mutex> lock(resize_mutex_);
    if (!initialized_.load())
        return;

    global_control_.reset();
    current_thread_count_.store(0);
    initialized_.store(false);
    Logger::info("Thread pool manager shutdown");
}

bool ThreadPoolManager::resizeThreadPool(size_t new_num_threads)
{
    if (!initialized_.load())
    {
        Logger::error("Cannot resize thread pool - not initialized");
        return false;
    }

    if (!validateThreadCount(new_num_threads))
    {
        Logger::error("Invalid thread count for resize: " + std::to_string(new_num_threads));
        return false;
    }

    std::lock_guard<std::mutex> lock(resize_mutex_);
    if (new_num_threads == current_thread_count_.load())
    {
        Logger::debug("Thread pool already at requested size: " + std::to_string(new_num_threads));
        return true;
    }

    size_t old_count = current_thread_count_.load();
    // global_control limits are stacked; release the old one before installing the new one
    global_control_.reset();
    global_control_ = std::make_unique<tbb::global_control>(
        tbb::global_control::max_allowed_parallelism, new_num_threads);
    current_thread_count_.store(new_num_threads);

    Logger::info("Thread pool resized from " + std::to_string(old_count) + " to " +
                 std::to_string(new_num_threads) + " threads");
    return true;
}

size_t ThreadPoolManager::getCurrentThreadCount()
{
    return current_thread_count_.load();
}

void ThreadPoolManager::onConfigUpdate(const ConfigUpdateEvent &event)
{
    if (std::find(event.changed_keys.begin(), event.changed_keys.end(), "indexer.threads") ==
        event.changed_keys.end())
        return;

    int threads = config_.getIndexerConfig().threads;
    Logger::info("Configuration change detected - indexer.threads: " + std::to_string(threads));
    if (threads < 1 || !resizeThreadPool(static_cast<size_t>(threads)))
    {
        Logger::warn("Failed to resize thread pool due to configuration change");
    }
}

bool ThreadPoolManager::validateThreadCount(size_t thread_count)
{
    // Minimum: 1 thread, maximum: 64 threads
    if (thread_count < 1 || thread_count > 64)
    {
        Logger::warn("Thread count " + std::to_string(thread_count) + " is outside valid range [1-64]");
        return false;
    }

    size_t max_hardware_threads = std::thread::hardware_concurrency();
    if (max_hardware_threads > 0 && thread_count > max_hardware_threads * 2)
    {
        Logger::warn("Thread count " + std::to_string(thread_count) +
                     " exceeds 2x hardware concurrency (" + std::to_string(max_hardware_threads) +
                     "). This may cause performance degradation.");
    }
    return true;
}
