#ifndef INCLUDE_LEASEKEEPER_LOGGING_LOGREGISTRY_HPP
#define INCLUDE_LEASEKEEPER_LOGGING_LOGREGISTRY_HPP

#include <memory>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <string>

namespace leasekeeper::logging
{

// Named spdlog loggers shared by the library. Loggers are created on first use with a colored stdout sink,
// so embedding applications that never call init() still get output at `info`.
class LogRegistry final
{
public:
    LogRegistry() = delete;

    static void init(spdlog::level::level_enum level);

    // Routes every leasekeeper logger (existing and future ones) to `sink`.
    // Not synchronized with in-flight log calls; swap sinks before stores are shared between threads.
    static void setSink(spdlog::sink_ptr sink);
    static void setLevel(spdlog::level::level_enum level);

    [[nodiscard]] static std::shared_ptr<spdlog::logger> get(const std::string& name);

    [[nodiscard]] static std::shared_ptr<spdlog::logger> store()
    {
        return get("store");
    }
    [[nodiscard]] static std::shared_ptr<spdlog::logger> persistence()
    {
        return get("persistence");
    }
    [[nodiscard]] static std::shared_ptr<spdlog::logger> config()
    {
        return get("config");
    }
};

} // namespace leasekeeper::logging

#endif // INCLUDE_LEASEKEEPER_LOGGING_LOGREGISTRY_HPP
