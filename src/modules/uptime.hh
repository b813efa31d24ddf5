#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "../config.hh"
#include "../module.hh"

std::string format_uptime(uint64_t seconds, const uptime_config_t& config);
std::string format_uptime_full(uint64_t seconds);
// seconds since boot from /proc/uptime, nothing when unreadable
std::optional<uint64_t> read_uptime(const std::string& path = "/proc/uptime");

struct uptime_module_t: module_t {
    using source_t = std::function<std::optional<uint64_t>()>;

    explicit uptime_module_t(source_t _source = nullptr);

    std::string display_text(const config_t& config) const override;
    void update(const config_t& config) override;
    std::optional<std::string> tooltip() const override;
    std::optional<std::string> width_sample(const config_t& config) const override;
    int min_width(const config_t& config) const override;

private:
    source_t source;
    std::optional<uint64_t> seconds;
};
