#include "logging.hpp"
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

void init_logging()
{
    auto logger = spdlog::get("bridge");
    if (!logger)
        logger = spdlog::stderr_color_mt("bridge");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(std::getenv("DEBUG") ? spdlog::level::debug : spdlog::level::info);
}
