#include "weather.hh"

#include <ctime>
#include <stdexcept>

#include <fmt/chrono.h>
#include <fmt/core.h>

#include "../exec.hh"

weather_module_t::weather_module_t(async_bridge_t& _bridge, fetch_t _fetch):
    polling_module_t("weather", "Weather", _bridge),
    fetch(std::move(_fetch))
{}

std::string weather_module_t::display_text(const config_t&) const {
    if (!enabled) {
        return "";
    }
    return state.text;
}

void weather_module_t::update(const config_t& config) {
    enabled = config.weather.enabled;
    click = config.weather.click;
    collect();
    if (!enabled || !fetch) {
        return;
    }
    poll(std::chrono::minutes(config.weather.interval_min), [f = fetch]() {
        weather_report_t report;
        report.text = f();
        if (report.text.empty()) {
            throw std::runtime_error("empty weather response");
        }
        report.fetched = std::chrono::system_clock::now();
        return report;
    });
}

void weather_module_t::on_click() {
    exec_nocapture(click);
}

std::optional<std::string> weather_module_t::tooltip() const {
    if (!has_result()) {
        return std::string("Weather data not available");
    }
    std::time_t t = std::chrono::system_clock::to_time_t(state.fetched);
    std::tm tm {};
    localtime_r(&t, &tm);
    return fmt::format("{}\nUpdated {:%H:%M}", state.text, tm);
}

bool weather_module_t::is_visible() const {
    return enabled && has_result();
}
