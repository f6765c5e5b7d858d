#pragma once

#include <tbb/global_control.h>
#include <atomic>
#include <memory>
#include <mutex>
#include "core/config_observer.hpp"

class PocoConfigAdapter;

/**
 * @brief Owns the process-wide TBB parallelism limit used by indexing
 *
 * The limit follows indexer.threads and is resized when that key changes.
 */
class ThreadPoolManager : public ConfigObserver
{
public:
    /**
     * @brief Initialize the TBB parallelism limit
     * @param num_threads Number of worker threads, clamped to the valid range
     */
    static void initialize(size_t num_threads);

    static void shutdown();

    /**
     * @brief Replace the parallelism limit
     * @return false if not initialized or the count is out of range
     */
    static bool resizeThreadPool(size_t new_num_threads);

    static size_t getCurrentThreadCount();
    static bool isInitialized() { return initialized_.load(); }

    explicit ThreadPoolManager(PocoConfigAdapter &config) : config_(config) {}

    void onConfigUpdate(const ConfigUpdateEvent &event) override;

private:
    static bool validateThreadCount(size_t thread_count);

    PocoConfigAdapter &config_;

    static std::unique_ptr<tbb::global_control> global_control_;
    static std::atomic<bool> initialized_;
    static std::atomic<size_t> current_thread_count_;
    static std::mutex resize_mutex_;
};
