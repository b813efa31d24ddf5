#include "log.hh"

#include <spdlog/sinks/stdout_color_sinks.h>

void setup_logging(const std::string& level) {
    auto logger = spdlog::get("sbar");
    if (!logger) {
        logger = spdlog::stderr_color_mt("sbar");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        spdlog::warn("[config] unknown log level '{}', using info", level);
        lvl = spdlog::level::info;
    }
    spdlog::set_level(lvl);
}
