#pragma once

#include <atomic>
#include <memory>

/**
 * @brief Cooperative cancellation flag shared between a caller and a running query.
 *
 * Copies share the same flag. A default-constructed token can be cancelled like any other.
 */
class CancellationToken
{
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool isCancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};
