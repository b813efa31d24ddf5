#pragma once

#include <cstdint>
#include <deque>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../config.hh"
#include "polling.hh"

struct cpu_times_t {
    uint64_t idle = 0;
    uint64_t total = 0;
};

struct memory_info_t {
    uint64_t total = 0;
    uint64_t available = 0;
};

// aggregate "cpu" line of /proc/stat
std::optional<cpu_times_t> parse_cpu_times(std::istream& in);
// MemTotal/MemAvailable of /proc/meminfo, in bytes
std::optional<memory_info_t> parse_meminfo(std::istream& in);
float cpu_usage(const cpu_times_t& before, const cpu_times_t& after);

struct system_sample_t {
    bool valid = false;
    float cpu = 0.0f;
    float memory = 0.0f;
    uint64_t memory_used = 0;
    uint64_t memory_total = 0;
};

struct system_info_module_t: polling_module_t<system_sample_t> {
    static constexpr size_t history_length = 60;

    system_info_module_t(async_bridge_t& _bridge, std::string _stat = "/proc/stat", std::string _meminfo = "/proc/meminfo");

    std::string display_text(const config_t& config) const override;
    void update(const config_t& config) override;
    void on_click() override;
    std::optional<std::string> tooltip() const override;
    std::optional<std::vector<float>> graph_values() const override;
    std::optional<std::string> width_sample(const config_t& config) const override;
    int min_width(const config_t& config) const override;

    const std::deque<float>& cpu_history() const {
        return cpu;
    }
    const std::deque<float>& memory_history() const {
        return memory;
    }

private:
    std::string stat_path;
    std::string meminfo_path;
    // previous /proc/stat reading; only the single scheduled probe touches it
    std::shared_ptr<std::optional<cpu_times_t>> previous;
    std::deque<float> cpu;
    std::deque<float> memory;
    bool show_graph = false;
    std::string click;
};
