#ifndef AGENTLINK_INTERNAL_LOGGING_HPP
#define AGENTLINK_INTERNAL_LOGGING_HPP

#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>

namespace agentlink
{
namespace log
{

// Name of the library logger in the spdlog registry
constexpr const char* LOGGER_NAME = "agentlink";

// Environment variable consulted when the logger is first created
constexpr const char* LOG_LEVEL_ENV = "AGENTLINK_LOG_LEVEL";

// Library logger. Writes to stderr only: stdout may be the transport.
// Created on first use with the level from AGENTLINK_LOG_LEVEL (default: warn).
std::shared_ptr<spdlog::logger> logger();

// Parse "trace", "debug", "info", "warn", "error" or "off"
std::optional<spdlog::level::level_enum> parse_level(const std::string& name);

// Apply a level by name. Returns false (and leaves the level unchanged) for unknown names.
bool set_level(const std::string& name);

} // namespace log
} // namespace agentlink

#endif // AGENTLINK_INTERNAL_LOGGING_HPP
