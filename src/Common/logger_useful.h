#pragma once

/// Macros for convenient usage of Poco logger.

#include <string>
#include <fmt/format.h>
#include <Poco/Logger.h>
#include <Poco/Message.h>


/// Logs a message to a specified logger with that level.
/// The message is formatted with fmt::format only if the level is enabled.

#define LOG_IMPL(logger, PRIORITY, ...) do                                        \
{                                                                                 \
    Poco::Logger * _logger = (logger);                                            \
    if (_logger->is((PRIORITY)))                                                  \
    {                                                                             \
        std::string formatted_message = fmt::format(__VA_ARGS__);                 \
        if (auto _channel = _logger->getChannel())                                \
        {                                                                         \
            Poco::Message poco_message(_logger->name(), formatted_message,        \
                                 (PRIORITY), __FILE__, __LINE__);                 \
            _channel->log(poco_message);                                          \
        }                                                                         \
    }                                                                             \
} while (false)


#define LOG_TRACE(logger, ...)   LOG_IMPL(logger, Poco::Message::PRIO_TRACE, __VA_ARGS__)
#define LOG_DEBUG(logger, ...)   LOG_IMPL(logger, Poco::Message::PRIO_DEBUG, __VA_ARGS__)
#define LOG_INFO(logger, ...)    LOG_IMPL(logger, Poco::Message::PRIO_INFORMATION, __VA_ARGS__)
#define LOG_WARNING(logger, ...) LOG_IMPL(logger, Poco::Message::PRIO_WARNING, __VA_ARGS__)
#define LOG_ERROR(logger, ...)   LOG_IMPL(logger, Poco::Message::PRIO_ERROR, __VA_ARGS__)
#define LOG_FATAL(logger, ...)   LOG_IMPL(logger, Poco::Message::PRIO_FATAL, __VA_ARGS__)
