#pragma once

#include <functional>
#include <string>

#include "../async_bridge.hh"
#include "../config.hh"
#include "../registry.hh"

struct module_sources_t {
    // focused window title, supplied by the host
    std::function<std::string()> window_title;
    // blocking weather fetch; defaults to running weather.command
    std::function<std::string()> weather;
};

// registers every built-in module plus the [[modules]] entries
void add_modules(module_registry_t& registry, const config_t& config, async_bridge_t& bridge, module_sources_t sources);
