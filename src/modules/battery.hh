#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "../config.hh"
#include "polling.hh"

struct battery_state_t {
    bool present = false;
    int percent = 0;
    bool charging = false;
    bool plugged = false;
    std::optional<uint64_t> seconds_remaining;
};

// first power supply of type Battery under path, plus whether any mains supply is online
battery_state_t read_battery(const std::string& path);
std::string battery_text(const battery_state_t& state, const battery_config_t& config);

struct battery_module_t: polling_module_t<battery_state_t> {
    explicit battery_module_t(async_bridge_t& _bridge);

    std::string display_text(const config_t& config) const override;
    void update(const config_t& config) override;
    void on_click() override;
    std::optional<std::string> tooltip() const override;
    bool is_visible() const override;

private:
    std::string click;
};
