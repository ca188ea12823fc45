#include "logging.hpp"

#include <cstdlib>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace agentlink
{
namespace log
{

std::optional<spdlog::level::level_enum> parse_level(const std::string& name)
{
    if (name == "trace")
        return spdlog::level::trace;
    if (name == "debug")
        return spdlog::level::debug;
    if (name == "info")
        return spdlog::level::info;
    if (name == "warn" || name == "warning")
        return spdlog::level::warn;
    if (name == "error")
        return spdlog::level::err;
    if (name == "off")
        return spdlog::level::off;
    return std::nullopt;
}

std::shared_ptr<spdlog::logger> logger()
{
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;

    std::call_once(once,
                   []
                   {
                       // Another component may already have registered the name
                       instance = spdlog::get(LOGGER_NAME);
                       if (!instance)
                           instance = spdlog::stderr_color_mt(LOGGER_NAME);

                       auto level = spdlog::level::warn;
                       if (const char* env = std::getenv(LOG_LEVEL_ENV))
                       {
                           if (auto parsed = parse_level(env))
                               level = *parsed;
                       }
                       instance->set_level(level);
                   });

    return instance;
}

bool set_level(const std::string& name)
{
    auto level = parse_level(name);
    if (!level)
        return false;
    logger()->set_level(*level);
    return true;
}

} // namespace log
} // namespace agentlink
