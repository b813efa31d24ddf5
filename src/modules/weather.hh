#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "../config.hh"
#include "polling.hh"

struct weather_report_t {
    std::string text;
    std::chrono::system_clock::time_point fetched;
};

// Current conditions from a network fetch. Hidden until the first fetch succeeds.
struct weather_module_t: polling_module_t<weather_report_t> {
    // blocking; returns the text to show or throws
    using fetch_t = std::function<std::string()>;

    weather_module_t(async_bridge_t& _bridge, fetch_t _fetch);

    std::string display_text(const config_t& config) const override;
    void update(const config_t& config) override;
    void on_click() override;
    std::optional<std::string> tooltip() const override;
    bool is_visible() const override;

private:
    fetch_t fetch;
    bool enabled = true;
    std::string click;
};
