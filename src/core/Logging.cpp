#include "core/Logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace
{
    const char *const kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v";
}

namespace broker
{
    std::shared_ptr<spdlog::logger> make_logger(const std::string &name, spdlog::level::level_enum level)
    {
        auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>(name, sink);
        logger->set_pattern(kLogPattern);
        logger->set_level(level);
        // Flush every record.
        logger->flush_on(spdlog::level::trace);
        return logger;
    }
}
