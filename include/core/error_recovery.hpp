#pragma once
#include <functional>
#include <chrono>
#include <thread>
#include <atomic>
#include <mutex>
#include <string>
#include <future>
#include <memory>
#include "core/errors.hpp"
#include "core/cancellation_token.hpp"
#include "logging/logger.hpp"

class ErrorRecovery
{
public:
    // Retry mechanism with exponential backoff. Only TransientServiceError is retried,
    // every other exception propagates on the first attempt.
    template <typename Func, typename... Args>
    static auto retryWithBackoff(Func func, int max_retries, int base_delay_ms, const std::string &operation_name, Args &&...args)
        -> decltype(func(std::forward<Args>(args)...))
    {
        if (max_retries < 1)
        {
            max_retries = 1;
        }

        for (int attempt = 0; attempt < max_retries; ++attempt)
        {
            try
            {
                return func(std::forward<Args>(args)...);
            }
            catch (const TransientServiceError &e)
            {
                if (attempt == max_retries - 1)
                {
                    Logger::error("External call failed after " + std::to_string(max_retries) +
                                  " attempts for operation: " + operation_name + " - " + e.what());
                    throw; // Re-throw on final attempt
                }

                int delay_ms = (1 << attempt) * base_delay_ms; // 100ms, 200ms, 400ms... with the default base
                Logger::warn("External call failed for operation '" + operation_name +
                             "', retrying in " + std::to_string(delay_ms) + "ms (attempt " +
                             std::to_string(attempt + 1) + "/" + std::to_string(max_retries) +
                             "): " + e.what());

                std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            }
        }
        throw TransientServiceError("All retry attempts failed for operation: " + operation_name);
    }

    // Circuit breaker pattern for external service calls
    class CircuitBreaker
    {
    private:
        std::atomic<bool> is_open_{false};
        std::atomic<int> failure_count_{0};
        mutable std::mutex time_mutex_;
        std::chrono::steady_clock::time_point last_failure_time_;
        const int failure_threshold_;
        const std::chrono::seconds timeout_;
        std::string operation_name_;

    public:
        CircuitBreaker(const std::string &operation_name, int threshold = 5, int timeout_seconds = 60)
            : failure_threshold_(threshold), timeout_(timeout_seconds), operation_name_(operation_name) {}

        template <typename Func, typename... Args>
        auto call(Func func, Args &&...args) -> decltype(func(std::forward<Args>(args)...))
        {
            if (is_open_.load())
            {
                std::chrono::steady_clock::time_point opened_at;
                {
                    std::lock_guard<std::mutex> lock(time_mutex_);
                    opened_at = last_failure_time_;
                }
                if (std::chrono::steady_clock::now() - opened_at > timeout_)
                {
                    is_open_.store(false);
                    failure_count_.store(0);
                    Logger::info("Circuit breaker closed for operation '" + operation_name_ +
                                 "', retrying external service calls");
                }
                else
                {
                    throw TransientServiceError("Circuit breaker is open for operation '" + operation_name_ +
                                                "' - external service calls are blocked");
                }
            }

            try
            {
                auto result = func(std::forward<Args>(args)...);
                failure_count_.store(0);
                return result;
            }
            catch (const TransientServiceError &)
            {
                if (failure_count_.fetch_add(1) + 1 >= failure_threshold_)
                {
                    is_open_.store(true);
                    {
                        std::lock_guard<std::mutex> lock(time_mutex_);
                        last_failure_time_ = std::chrono::steady_clock::now();
                    }
                    Logger::error("Circuit breaker opened for operation '" + operation_name_ +
                                  "' due to repeated failures");
                }
                throw;
            }
        }

        bool isOpen() const
        {
            return is_open_.load();
        }
        int getFailureCount() const
        {
            return failure_count_.load();
        }
        std::string getOperationName() const
        {
            return operation_name_;
        }
    };

    // Timeout wrapper for external calls. The call runs on a detached worker so that a
    // caller who gives up never blocks on it; func must therefore own everything it touches.
    template <typename Func>
    static auto callWithTimeout(Func func, int timeout_ms, const std::string &operation_name,
                                const CancellationToken *cancel = nullptr) -> decltype(func())
    {
        using Result = decltype(func());

        auto promise = std::make_shared<std::promise<Result>>();
        std::future<Result> future = promise->get_future();

        std::thread([promise, func]() mutable
                    {
            try {
                promise->set_value(func());
            } catch (...) {
                promise->set_exception(std::current_exception());
            } })
            .detach();

        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (future.wait_for(std::chrono::milliseconds(10)) != std::future_status::ready)
        {
            if (cancel && cancel->isCancelled())
            {
                Logger::warn("Operation '" + operation_name + "' abandoned by cancellation");
                throw QueryCancelled("Operation '" + operation_name + "' cancelled");
            }
            if (std::chrono::steady_clock::now() >= deadline)
            {
                Logger::error("Operation '" + operation_name + "' timed out after " +
                              std::to_string(timeout_ms) + "ms");
                throw StepTimeout(operation_name, timeout_ms);
            }
        }

        return future.get();
    }
};
