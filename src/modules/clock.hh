#pragma once

#include <ctime>
#include <functional>
#include <string>

#include "../config.hh"
#include "../module.hh"

std::string format_clock(const clock_config_t& clock, const std::tm& t);
// rendering with every digit zeroed for the given options
std::string clock_sample_text(const clock_config_t& clock);
// clock_sample_text once per day and month abbreviation and AM/PM, one per line;
// proportional fonts make the widest one font dependent
std::string clock_width_sample(const clock_config_t& clock);

struct clock_module_t: module_t {
    using time_source_t = std::function<std::time_t()>;

    explicit clock_module_t(time_source_t _now = nullptr);

    std::string display_text(const config_t& config) const override;
    void update(const config_t& config) override;
    std::optional<std::string> tooltip() const override;
    std::optional<std::string> width_sample(const config_t& config) const override;

private:
    time_source_t now;
    std::tm current {};
    std::string text;
};
