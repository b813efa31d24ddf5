#include "uptime.hh"

#include <fstream>

#include <fmt/core.h>

static const char* plural(uint64_t n, const char* one, const char* many) {
    return n == 1 ? one : many;
}

std::string format_uptime(uint64_t seconds, const uptime_config_t& config) {
    const uint64_t days = seconds / 86400;
    const uint64_t hours = (seconds % 86400) / 3600;
    const uint64_t minutes = (seconds % 3600) / 60;
    if (config.compact) {
        if (days > 0 && config.show_days) {
            return fmt::format("⏱ {}d {}h", days, hours);
        } else if (days > 0 || hours > 0) {
            return fmt::format("⏱ {}h {}m", days * 24 + hours, minutes);
        }
        return fmt::format("⏱ {}m", minutes);
    }
    if (days > 0 && config.show_days) {
        return fmt::format("⏱ {} {}, {} {}", days, plural(days, "day", "days"), hours, plural(hours, "hour", "hours"));
    } else if (days > 0 || hours > 0) {
        const uint64_t h = days * 24 + hours;
        return fmt::format("⏱ {} {}, {} {}", h, plural(h, "hour", "hours"), minutes, plural(minutes, "minute", "minutes"));
    }
    return fmt::format("⏱ {} {}", minutes, plural(minutes, "minute", "minutes"));
}

std::string format_uptime_full(uint64_t seconds) {
    const uint64_t days = seconds / 86400;
    const uint64_t hours = (seconds % 86400) / 3600;
    const uint64_t minutes = (seconds % 3600) / 60;
    const uint64_t secs = seconds % 60;
    if (days > 0) {
        return fmt::format("{} days, {} hours, {} minutes, {} seconds", days, hours, minutes, secs);
    } else if (hours > 0) {
        return fmt::format("{} hours, {} minutes, {} seconds", hours, minutes, secs);
    } else if (minutes > 0) {
        return fmt::format("{} minutes, {} seconds", minutes, secs);
    }
    return fmt::format("{} seconds", secs);
}

std::optional<uint64_t> read_uptime(const std::string& path) {
    std::ifstream in(path);
    double value = 0;
    if (!(in >> value) || value < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value);
}

uptime_module_t::uptime_module_t(source_t _source):
    module_t("uptime", "System Uptime"),
    source(std::move(_source))
{
    if (!source) {
        source = []() {
            return read_uptime();
        };
    }
}

std::string uptime_module_t::display_text(const config_t& config) const {
    if (!seconds) {
        return "";
    }
    return format_uptime(*seconds, config.uptime);
}

// procfs reads do not block
void uptime_module_t::update(const config_t&) {
    seconds = source();
}

// two digit fields cover up to 99 days or hours
std::optional<std::string> uptime_module_t::width_sample(const config_t& config) const {
    if (config.uptime.compact) {
        return std::string(config.uptime.show_days ? "⏱ 00d 00h" : "⏱ 000h 00m");
    }
    return std::string(config.uptime.show_days ? "⏱ 00 days, 00 hours" : "⏱ 000 hours, 00 minutes");
}

int uptime_module_t::min_width(const config_t&) const {
    return 72;
}

std::optional<std::string> uptime_module_t::tooltip() const {
    if (!seconds) {
        return std::nullopt;
    }
    return "System Uptime\n" + format_uptime_full(*seconds);
}
