#include "factory.hh"

#include <memory>

#include "../exec.hh"
#include "../log.hh"
#include "active_app.hh"
#include "app_menu.hh"
#include "battery.hh"
#include "clock.hh"
#include "command.hh"
#include "disk.hh"
#include "gpu.hh"
#include "keyboard_layout.hh"
#include "media.hh"
#include "network.hh"
#include "system_info.hh"
#include "uptime.hh"
#include "volume.hh"
#include "weather.hh"

void add_modules(module_registry_t& registry, const config_t& config, async_bridge_t& bridge, module_sources_t sources) {
    if (!sources.weather) {
        sources.weather = [cmd = config.weather.command]() {
            return exec(cmd);
        };
    }
    registry.add(std::make_unique<app_menu_module_t>(config.app_menu));
    registry.add(std::make_unique<active_app_module_t>(std::move(sources.window_title)));
    registry.add(std::make_unique<clock_module_t>());
    registry.add(std::make_unique<battery_module_t>(bridge));
    registry.add(std::make_unique<system_info_module_t>(bridge));
    registry.add(std::make_unique<disk_module_t>(bridge));
    registry.add(std::make_unique<network_module_t>(bridge));
    registry.add(std::make_unique<volume_module_t>(bridge));
    registry.add(std::make_unique<weather_module_t>(bridge, std::move(sources.weather)));
    registry.add(std::make_unique<media_module_t>(bridge));
    registry.add(std::make_unique<keyboard_layout_module_t>(bridge));
    registry.add(std::make_unique<gpu_module_t>(bridge));
    registry.add(std::make_unique<uptime_module_t>());
    for (const auto& command: config.commands) {
        if (command.id.empty()) {
            spdlog::warn("[config] [[modules]] entry without an id, skipped");
            continue;
        }
        registry.add(std::make_unique<command_module_t>(bridge, command));
    }
    spdlog::debug("[registry] {} modules", registry.size());
}
