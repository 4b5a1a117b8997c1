#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace broker
{
    // Creates a logger writing to stdout in colour. Not registered globally;
    // callers pass it down to the components that log.
    std::shared_ptr<spdlog::logger> make_logger(const std::string &name, spdlog::level::level_enum level);
}
