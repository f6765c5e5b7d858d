#pragma once

#include "core/config_observer.hpp"

class PocoConfigAdapter;

/**
 * @brief Applies log_level changes to the process logger
 */
class LoggerObserver : public ConfigObserver
{
public:
    explicit LoggerObserver(PocoConfigAdapter &config);
    ~LoggerObserver() override = default;

    void onConfigUpdate(const ConfigUpdateEvent &event) override;

    /**
     * @brief Level most recently applied, empty until the first log_level change
     */
    const std::string &appliedLevel() const { return applied_level_; }

private:
    bool hasLogLevelChange(const ConfigUpdateEvent &event) const;

    PocoConfigAdapter &config_;
    std::string applied_level_;
};
