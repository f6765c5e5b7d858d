#include "core/logger_observer.hpp"
#include "core/poco_config_adapter.hpp"
#include "logging/logger.hpp"
#include <algorithm>

LoggerObserver::LoggerObserver(PocoConfigAdapter &config)
    : config_(config)
{
}

void LoggerObserver::onConfigUpdate(const ConfigUpdateEvent &event)
{
    if (!hasLogLevelChange(event))
        return;

    std::string new_log_level = config_.getLogLevel();
    if (new_log_level == applied_level_)
        return;

    Logger::info("LoggerObserver: log level change from " + event.source + " (" + event.update_id + ") to " +
                 new_log_level);
    Logger::setLevel(new_log_level);
    applied_level_ = new_log_level;
}

bool LoggerObserver::hasLogLevelChange(const ConfigUpdateEvent &event) const
{
    return std::find(event.changed_keys.begin(), event.changed_keys.end(), "log_level") != event.changed_keys.end();
}
