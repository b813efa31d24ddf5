#include "config.hh"

#include <algorithm>
#include <cstdlib>
#include <set>

#include <fmt/core.h>

#include "log.hh"

const char* section_name(section_t s) {
    switch (s) {
        case section_t::left:
            return "left";
        case section_t::center:
            return "center";
        case section_t::right:
            return "right";
    }
    return "unknown";
}

std::optional<section_t> config_t::section_of(const std::string& id) const {
    for (auto s: {section_t::left, section_t::center, section_t::right}) {
        const auto& ids = section_order(s);
        if (std::find(ids.begin(), ids.end(), id) != ids.end()) {
            return s;
        }
    }
    return std::nullopt;
}

std::optional<int> config_t::width_hint(const std::string& id) const {
    auto it = widths.find(id);
    if (it == widths.end() || it->second <= 0) {
        return std::nullopt;
    }
    return it->second;
}

static const toml::value* lookup(const toml::value& v, const std::string& key) {
    if (!v.is_table()) {
        return nullptr;
    }
    const auto& table = v.as_table();
    auto it = table.find(key);
    if (it == table.end()) {
        return nullptr;
    }
    return &it->second;
}

static const toml::value& table_or_empty(const toml::value& v, const std::string& key) {
    static const toml::value empty = toml::table{};
    const toml::value* found = lookup(v, key);
    if (!found) {
        return empty;
    }
    if (!found->is_table()) {
        throw config_error_t(fmt::format("'{}' must be a table", key));
    }
    return *found;
}

// accepts both integer and floating point values
static double number_or(const toml::value& v, const std::string& key, double fallback) {
    const toml::value* found = lookup(v, key);
    if (!found) {
        return fallback;
    }
    if (found->is_integer()) {
        return static_cast<double>(found->as_integer());
    }
    if (found->is_floating()) {
        return found->as_floating();
    }
    throw config_error_t(fmt::format("'{}' must be a number", key));
}

static int int_or(const toml::value& v, const std::string& key, int fallback) {
    return static_cast<int>(number_or(v, key, fallback));
}

static std::vector<std::string> ids_or(const toml::value& v, const std::string& key, std::vector<std::string> fallback) {
    const toml::value* found = lookup(v, key);
    if (!found) {
        return fallback;
    }
    try {
        return toml::get<std::vector<std::string>>(*found);
    } catch (const toml::type_error&) {
        throw config_error_t(fmt::format("layout.{} must be an array of module ids", key));
    }
}

// an id may appear in at most one section; the first occurrence wins
static void dedupe_sections(config_t& config) {
    std::set<std::string> seen;
    for (auto s: {section_t::left, section_t::center, section_t::right}) {
        auto& ids = config.order[static_cast<size_t>(s)];
        std::vector<std::string> kept;
        for (const auto& id: ids) {
            if (seen.insert(id).second) {
                kept.push_back(id);
            } else {
                spdlog::warn("[config] '{}' listed more than once, dropped from {}", id, section_name(s));
            }
        }
        ids = std::move(kept);
    }
}

static void center_clock(config_t& config) {
    auto& center = config.order[static_cast<size_t>(section_t::center)];
    if (std::find(center.begin(), center.end(), "clock") != center.end()) {
        return;
    }
    for (auto s: {section_t::left, section_t::right}) {
        auto& ids = config.order[static_cast<size_t>(s)];
        ids.erase(std::remove(ids.begin(), ids.end(), "clock"), ids.end());
    }
    center.push_back("clock");
}

config_t config_from_toml(const toml::value& data) {
    config_t config;
    try {
        config.font = toml::find_or<std::string>(data, "font", config.font);
        config.font_size = number_or(data, "font_size", config.font_size);
        config.foreground = toml::find_or(data, "foreground", config.foreground);
        config.background = toml::find_or(data, "background", config.background);
        config.hover = toml::find_or(data, "hover", config.hover);
        config.border = toml::find_or(data, "border", config.border);
        config.accent = toml::find_or(data, "accent", config.accent);
        config.height = int_or(data, "height", config.height);
        config.margin = int_or(data, "margin", config.margin);
        config.padding = int_or(data, "padding", config.padding);
        config.spacing = int_or(data, "spacing", config.spacing);
        config.drag_threshold = int_or(data, "drag_threshold", config.drag_threshold);
        config.log_level = toml::find_or<std::string>(data, "log_level", config.log_level);

        const auto position = toml::find_or<std::string>(data, "position", "top");
        if (position == "top") {
            config.position = config_t::position_t::top;
        } else if (position == "bottom") {
            config.position = config_t::position_t::bottom;
        } else {
            throw config_error_t(fmt::format("position must be 'top' or 'bottom', not '{}'", position));
        }

        const auto& layout = table_or_empty(data, "layout");
        config.order[0] = ids_or(layout, "left", config.order[0]);
        config.order[1] = ids_or(layout, "center", config.order[1]);
        config.order[2] = ids_or(layout, "right", config.order[2]);

        const auto& widths = table_or_empty(data, "widths");
        for (const auto& entry: widths.as_table()) {
            config.widths[entry.first] = int_or(widths, entry.first, 0);
        }

        for (const auto& entry: table_or_empty(data, "icons").as_table()) {
            config.icons[entry.first] = toml::get<std::string>(entry.second);
        }

        const auto& clock = table_or_empty(data, "clock");
        config.clock.format_24h = toml::find_or<bool>(clock, "format_24h", config.clock.format_24h);
        config.clock.show_seconds = toml::find_or<bool>(clock, "show_seconds", config.clock.show_seconds);
        config.clock.show_date = toml::find_or<bool>(clock, "show_date", config.clock.show_date);
        config.clock.show_day = toml::find_or<bool>(clock, "show_day", config.clock.show_day);
        config.clock.center = toml::find_or<bool>(clock, "center", config.clock.center);

        const auto& battery = table_or_empty(data, "battery");
        config.battery.show_percentage = toml::find_or<bool>(battery, "show_percentage", config.battery.show_percentage);
        config.battery.show_time_remaining = toml::find_or<bool>(battery, "show_time_remaining", config.battery.show_time_remaining);
        config.battery.low_threshold = int_or(battery, "low_threshold", config.battery.low_threshold);
        config.battery.path = toml::find_or<std::string>(battery, "path", config.battery.path);
        config.battery.click = toml::find_or<std::string>(battery, "click", config.battery.click);

        const auto& system_info = table_or_empty(data, "system_info");
        config.system_info.show_cpu = toml::find_or<bool>(system_info, "show_cpu", config.system_info.show_cpu);
        config.system_info.show_memory = toml::find_or<bool>(system_info, "show_memory", config.system_info.show_memory);
        config.system_info.show_graph = toml::find_or<bool>(system_info, "show_graph", config.system_info.show_graph);
        config.system_info.interval_ms = int_or(system_info, "interval_ms", config.system_info.interval_ms);
        config.system_info.click = toml::find_or<std::string>(system_info, "click", config.system_info.click);

        const auto& disk = table_or_empty(data, "disk");
        config.disk.path = toml::find_or<std::string>(disk, "path", config.disk.path);
        config.disk.show_percentage = toml::find_or<bool>(disk, "show_percentage", config.disk.show_percentage);
        config.disk.interval_s = int_or(disk, "interval_s", config.disk.interval_s);
        config.disk.click = toml::find_or<std::string>(disk, "click", config.disk.click);

        const auto& network = table_or_empty(data, "network");
        config.network.interface = toml::find_or<std::string>(network, "interface", config.network.interface);
        config.network.show_name = toml::find_or<bool>(network, "show_name", config.network.show_name);
        config.network.show_speed = toml::find_or<bool>(network, "show_speed", config.network.show_speed);
        config.network.path = toml::find_or<std::string>(network, "path", config.network.path);
        config.network.click = toml::find_or<std::string>(network, "click", config.network.click);

        const auto& volume = table_or_empty(data, "volume");
        config.volume.get = toml::find_or<std::string>(volume, "get", config.volume.get);
        config.volume.get_mute = toml::find_or<std::string>(volume, "get_mute", config.volume.get_mute);
        config.volume.up = toml::find_or<std::string>(volume, "up", config.volume.up);
        config.volume.down = toml::find_or<std::string>(volume, "down", config.volume.down);
        config.volume.mute = toml::find_or<std::string>(volume, "mute", config.volume.mute);
        config.volume.scroll_step = int_or(volume, "scroll_step", config.volume.scroll_step);
        config.volume.show_percentage = toml::find_or<bool>(volume, "show_percentage", config.volume.show_percentage);
        config.volume.interval_s = int_or(volume, "interval_s", config.volume.interval_s);

        const auto& weather = table_or_empty(data, "weather");
        config.weather.enabled = toml::find_or<bool>(weather, "enabled", config.weather.enabled);
        config.weather.command = toml::find_or<std::string>(weather, "command", config.weather.command);
        config.weather.interval_min = int_or(weather, "interval_min", config.weather.interval_min);
        config.weather.click = toml::find_or<std::string>(weather, "click", config.weather.click);

        const auto& media = table_or_empty(data, "media");
        config.media.query = toml::find_or<std::string>(media, "query", config.media.query);
        config.media.toggle = toml::find_or<std::string>(media, "toggle", config.media.toggle);
        config.media.next = toml::find_or<std::string>(media, "next", config.media.next);
        config.media.previous = toml::find_or<std::string>(media, "previous", config.media.previous);
        config.media.show_now_playing = toml::find_or<bool>(media, "show_now_playing", config.media.show_now_playing);
        config.media.max_title_length = static_cast<size_t>(int_or(media, "max_title_length", static_cast<int>(config.media.max_title_length)));
        config.media.interval_s = int_or(media, "interval_s", config.media.interval_s);

        const auto& keyboard_layout = table_or_empty(data, "keyboard_layout");
        config.keyboard_layout.enabled = toml::find_or<bool>(keyboard_layout, "enabled", config.keyboard_layout.enabled);
        config.keyboard_layout.query = toml::find_or<std::string>(keyboard_layout, "query", config.keyboard_layout.query);
        config.keyboard_layout.set = toml::find_or<std::string>(keyboard_layout, "set", config.keyboard_layout.set);
        config.keyboard_layout.show_full_name = toml::find_or<bool>(keyboard_layout, "show_full_name", config.keyboard_layout.show_full_name);
        config.keyboard_layout.interval_ms = int_or(keyboard_layout, "interval_ms", config.keyboard_layout.interval_ms);

        const auto& gpu = table_or_empty(data, "gpu");
        config.gpu.enabled = toml::find_or<bool>(gpu, "enabled", config.gpu.enabled);
        config.gpu.show_usage = toml::find_or<bool>(gpu, "show_usage", config.gpu.show_usage);
        config.gpu.show_graph = toml::find_or<bool>(gpu, "show_graph", config.gpu.show_graph);
        config.gpu.interval_ms = int_or(gpu, "interval_ms", config.gpu.interval_ms);
        config.gpu.path = toml::find_or<std::string>(gpu, "path", config.gpu.path);
        config.gpu.nvidia_smi = toml::find_or<std::string>(gpu, "nvidia_smi", config.gpu.nvidia_smi);
        config.gpu.click = toml::find_or<std::string>(gpu, "click", config.gpu.click);

        const auto& uptime = table_or_empty(data, "uptime");
        config.uptime.show_days = toml::find_or<bool>(uptime, "show_days", config.uptime.show_days);
        config.uptime.compact = toml::find_or<bool>(uptime, "compact", config.uptime.compact);

        const auto& app_menu = table_or_empty(data, "app_menu");
        config.app_menu.text = toml::find_or<std::string>(app_menu, "text", config.app_menu.text);
        config.app_menu.icon = toml::find_or<std::string>(app_menu, "icon", config.app_menu.icon);
        if (!config.app_menu.icon.empty()) {
            config.icons["app_menu"] = config.app_menu.icon;
        }
        config.app_menu.command = toml::find_or<std::string>(app_menu, "command", config.app_menu.command);
        config.app_menu.right_command = toml::find_or<std::string>(app_menu, "right_command", config.app_menu.right_command);

        const auto& active_app = table_or_empty(data, "active_app");
        config.active_app.fallback = toml::find_or<std::string>(active_app, "fallback", config.active_app.fallback);
        config.active_app.max_length = static_cast<size_t>(int_or(active_app, "max_length", static_cast<int>(config.active_app.max_length)));

        if (const toml::value* modules = lookup(data, "modules")) {
            if (!modules->is_array()) {
                throw config_error_t("'modules' must be an array of tables");
            }
            for (const auto& module_config: modules->as_array()) {
                command_config_t command;
                command.id = toml::find<std::string>(module_config, "id");
                command.exec = toml::find_or<std::string>(module_config, "exec", "");
                command.text = toml::find_or<std::string>(module_config, "text", "");
                command.interval = int_or(module_config, "interval", command.interval);
                command.left_click = toml::find_or<std::string>(module_config, "left_click", "");
                command.right_click = toml::find_or<std::string>(module_config, "right_click", "");
                command.wheel_up = toml::find_or<std::string>(module_config, "wheel_up", "");
                command.wheel_down = toml::find_or<std::string>(module_config, "wheel_down", "");
                command.width = int_or(module_config, "width", 0);
                if (command.width > 0) {
                    config.widths.emplace(command.id, command.width);
                }
                config.commands.push_back(std::move(command));
            }
        }
    } catch (const toml::exception& e) {
        throw config_error_t(e.what());
    } catch (const std::out_of_range& e) {
        throw config_error_t(e.what());
    }

    if (config.clock.center) {
        center_clock(config);
    }
    dedupe_sections(config);
    return config;
}

config_t parse_config(std::istream& in, const std::string& name) {
    try {
        return config_from_toml(toml::parse(in, name));
    } catch (const toml::syntax_error& e) {
        throw config_error_t(e.what());
    }
}

std::string default_config_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return fmt::format("{}/sbar/config.toml", xdg);
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fmt::format("{}/.config/sbar/config.toml", home);
    }
    return "config.toml";
}
