#include "battery.hh"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <fmt/core.h>

#include "../area.hh"
#include "../exec.hh"

static std::optional<std::string> read_line(const std::filesystem::path& p) {
    std::ifstream in(p);
    std::string line;
    if (!in.good() || !std::getline(in, line)) {
        return std::nullopt;
    }
    return line;
}

static std::optional<uint64_t> read_number(const std::filesystem::path& p) {
    auto line = read_line(p);
    if (!line) {
        return std::nullopt;
    }
    try {
        return std::stoull(*line);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

battery_state_t read_battery(const std::string& path) {
    battery_state_t state;
    std::error_code ec;
    std::filesystem::directory_iterator it(path, ec);
    if (ec) {
        return state;
    }
    for (const auto& entry: it) {
        const auto type = read_line(entry.path() / "type");
        if (!type) {
            continue;
        }
        if (*type == "Mains") {
            state.plugged = state.plugged || read_number(entry.path() / "online").value_or(0) == 1;
            continue;
        }
        if (*type != "Battery" || state.present) {
            continue;
        }
        auto capacity = read_number(entry.path() / "capacity");
        if (!capacity) {
            continue;
        }
        state.present = true;
        state.percent = static_cast<int>(std::min<uint64_t>(*capacity, 100));
        const auto status = read_line(entry.path() / "status").value_or("Unknown");
        state.charging = status == "Charging";
        if (status == "Charging" || status == "Full") {
            state.plugged = true;
        }

        auto energy = read_number(entry.path() / "energy_now");
        auto power = read_number(entry.path() / "power_now");
        if (!energy) {
            energy = read_number(entry.path() / "charge_now");
            power = read_number(entry.path() / "current_now");
        }
        if (status == "Discharging" && energy && power && *power > 0) {
            state.seconds_remaining = *energy * 3600 / *power;
        }
    }
    return state;
}

std::string battery_text(const battery_state_t& state, const battery_config_t& config) {
    if (!state.present) {
        return "";
    }
    std::string icon;
    if (state.plugged && !state.charging) {
        icon = "🔌";
    } else if (state.charging) {
        icon = "⚡";
    } else if (state.percent >= 30 && state.percent > config.low_threshold) {
        icon = "🔋";
    } else {
        icon = "🪫";
    }
    std::string text = icon;
    if (config.show_percentage) {
        text += fmt::format(" {}%", state.percent);
    }
    if (config.show_time_remaining && state.seconds_remaining) {
        text += " " + format_duration(*state.seconds_remaining);
    }
    return text;
}

battery_module_t::battery_module_t(async_bridge_t& _bridge):
    polling_module_t("battery", "Battery", _bridge)
{}

std::string battery_module_t::display_text(const config_t& config) const {
    return battery_text(state, config.battery);
}

void battery_module_t::update(const config_t& config) {
    collect();
    click = config.battery.click;
    poll(std::chrono::seconds(30), [path = config.battery.path]() {
        return read_battery(path);
    });
}

void battery_module_t::on_click() {
    exec_nocapture(click);
}

std::optional<std::string> battery_module_t::tooltip() const {
    if (!state.present) {
        return std::string("No battery detected");
    }
    const char* status = state.charging ? "Charging" : state.plugged ? "Plugged in" : "On battery";
    std::string text = fmt::format("Battery: {}%\nStatus: {}", state.percent, status);
    if (state.seconds_remaining && !state.charging) {
        text += fmt::format("\nTime remaining: {}", format_duration(*state.seconds_remaining));
    }
    return text;
}

bool battery_module_t::is_visible() const {
    return state.present;
}
