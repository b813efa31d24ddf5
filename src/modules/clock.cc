#include "clock.hh"

#include <vector>

#include <fmt/chrono.h>
#include <fmt/core.h>

std::string format_clock(const clock_config_t& clock, const std::tm& t) {
    std::string out;
    if (clock.show_day) {
        out += fmt::format("{:%a} ", t);
    }
    if (clock.show_date) {
        out += fmt::format("{:%b %d}  ", t);
    }
    if (clock.format_24h) {
        out += clock.show_seconds ? fmt::format("{:%H:%M:%S}", t) : fmt::format("{:%H:%M}", t);
    } else {
        out += clock.show_seconds ? fmt::format("{:%I:%M:%S %p}", t) : fmt::format("{:%I:%M %p}", t);
    }
    return out;
}

std::string clock_sample_text(const clock_config_t& clock) {
    std::string out;
    if (clock.show_day) {
        out += "Wed ";
    }
    if (clock.show_date) {
        out += "Sep 00  ";
    }
    out += clock.show_seconds ? "00:00:00" : "00:00";
    if (!clock.format_24h) {
        out += " PM";
    }
    return out;
}

std::string clock_width_sample(const clock_config_t& clock) {
    const int days = clock.show_day ? 7 : 1;
    const int months = clock.show_date ? 12 : 1;
    const std::string time = clock.show_seconds ? "00:00:00" : "00:00";
    std::vector<std::string> suffixes {""};
    if (!clock.format_24h) {
        suffixes = {" AM", " PM"};
    }

    std::string out;
    std::tm t {};
    for (int d = 0; d < days; d++) {
        for (int m = 0; m < months; m++) {
            t.tm_wday = d;
            t.tm_mon = m;
            for (const auto& suffix: suffixes) {
                if (!out.empty()) {
                    out += '\n';
                }
                if (clock.show_day) {
                    out += fmt::format("{:%a} ", t);
                }
                if (clock.show_date) {
                    out += fmt::format("{:%b} 00  ", t);
                }
                out += time + suffix;
            }
        }
    }
    return out;
}

clock_module_t::clock_module_t(time_source_t _now):
    module_t("clock", "Clock"),
    now(std::move(_now))
{
    if (!now) {
        now = []() {
            return std::time(nullptr);
        };
    }
}

std::string clock_module_t::display_text(const config_t&) const {
    return text;
}

void clock_module_t::update(const config_t& config) {
    std::time_t t = now();
    localtime_r(&t, &current);
    text = format_clock(config.clock, current);
}

std::optional<std::string> clock_module_t::tooltip() const {
    return fmt::format("{:%A, %B %d, %Y}\n{:%I:%M:%S %p}", current, current);
}

std::optional<std::string> clock_module_t::width_sample(const config_t& config) const {
    return clock_width_sample(config.clock);
}
