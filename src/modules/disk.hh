#pragma once

#include <cstdint>
#include <string>

#include "../config.hh"
#include "polling.hh"

struct disk_usage_t {
    bool valid = false;
    std::string path;
    uint64_t total = 0;
    uint64_t used = 0;
    uint64_t available = 0;
};

// statvfs of path; valid is false when the call fails
disk_usage_t read_disk_usage(const std::string& path);
std::string disk_text(const disk_usage_t& usage, const disk_config_t& config);

struct disk_module_t: polling_module_t<disk_usage_t> {
    explicit disk_module_t(async_bridge_t& _bridge);

    std::string display_text(const config_t& config) const override;
    void update(const config_t& config) override;
    void on_click() override;
    std::optional<std::string> tooltip() const override;

private:
    std::string click;
};
