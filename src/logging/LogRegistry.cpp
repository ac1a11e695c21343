#include "leasekeeper/logging/LogRegistry.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace leasekeeper::logging
{
namespace
{

constexpr const char* g_kLoggerPrefix{ "leasekeeper." };
constexpr const char* g_kPattern{ "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v" };

struct RegistryState final
{
    std::mutex mutex;
    spdlog::sink_ptr sink;
    spdlog::level::level_enum level{ spdlog::level::info };
    std::vector<std::shared_ptr<spdlog::logger>> loggers;
};

RegistryState& state()
{
    static RegistryState s{};
    return s;
}

// Caller holds state().mutex.
spdlog::sink_ptr sinkLocked(RegistryState& s)
{
    if (!s.sink)
    {
        auto console{ std::make_shared<spdlog::sinks::stdout_color_sink_mt>() };
        console->set_pattern(g_kPattern);
        s.sink = console;
    }
    return s.sink;
}

} // namespace

void LogRegistry::init(spdlog::level::level_enum level)
{
    auto& s{ state() };
    std::lock_guard<std::mutex> lock(s.mutex);
    sinkLocked(s)->set_pattern(g_kPattern);
    s.level = level;
    for (const auto& logger : s.loggers)
    {
        logger->set_level(level);
    }
}

void LogRegistry::setSink(spdlog::sink_ptr sink)
{
    auto& s{ state() };
    std::lock_guard<std::mutex> lock(s.mutex);
    s.sink = std::move(sink);
    for (const auto& logger : s.loggers)
    {
        logger->sinks().clear();
        if (s.sink)
        {
            logger->sinks().push_back(s.sink);
        }
    }
}

void LogRegistry::setLevel(spdlog::level::level_enum level)
{
    auto& s{ state() };
    std::lock_guard<std::mutex> lock(s.mutex);
    s.level = level;
    for (const auto& logger : s.loggers)
    {
        logger->set_level(level);
    }
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name)
{
    const std::string qualified{ g_kLoggerPrefix + name };

    auto& s{ state() };
    std::lock_guard<std::mutex> lock(s.mutex);
    if (auto existing{ spdlog::get(qualified) })
    {
        return existing;
    }

    auto logger{ std::make_shared<spdlog::logger>(qualified, sinkLocked(s)) };
    logger->set_level(s.level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    s.loggers.push_back(logger);
    return logger;
}

} // namespace leasekeeper::logging
