#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "../config.hh"
#include "polling.hh"

struct gpu_info_t {
    bool valid = false;
    std::string name;
    float usage = 0.0f;
    uint64_t memory_used = 0;
    uint64_t memory_total = 0;
    std::optional<float> temperature;
};

// first card under a drm class directory that reports gpu_busy_percent (amdgpu)
std::optional<gpu_info_t> read_gpu_sysfs(const std::string& path);
// one csv line of nvidia-smi: usage, used MiB, total MiB, temperature, name
std::optional<gpu_info_t> parse_nvidia_smi(const std::string& output);
// sysfs first, then nvidia-smi when configured
gpu_info_t query_gpu(const gpu_config_t& config);
std::string gpu_text(const gpu_info_t& info, const gpu_config_t& config);

struct gpu_module_t: polling_module_t<gpu_info_t> {
    static constexpr size_t history_length = 60;

    explicit gpu_module_t(async_bridge_t& _bridge);

    std::string display_text(const config_t& config) const override;
    void update(const config_t& config) override;
    void on_click() override;
    std::optional<std::string> tooltip() const override;
    bool is_visible() const override;
    std::optional<std::string> width_sample(const config_t& config) const override;
    int min_width(const config_t& config) const override;
    std::optional<std::vector<float>> graph_values() const override;

private:
    std::deque<float> usage;
    bool enabled = true;
    bool show_graph = false;
    std::string click;
};
