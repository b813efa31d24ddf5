#pragma once

#include <optional>
#include <string>

#include "../config.hh"
#include "polling.hh"

struct volume_state_t {
    bool valid = false;
    int percent = 0;
    bool muted = false;
};

// first "NN%" token of a volume query's output
std::optional<int> parse_volume_percent(const std::string& output);
// "Mute: yes" style output
bool parse_mute(const std::string& output);
// replaces every {step} in cmd
std::string expand_step(std::string cmd, int step);

// runs the configured query commands; throws exec_error_t when the volume query fails
volume_state_t query_volume(const volume_config_t& config);
std::string volume_text(const volume_state_t& state, const volume_config_t& config);

struct volume_module_t: polling_module_t<volume_state_t> {
    explicit volume_module_t(async_bridge_t& _bridge);

    std::string display_text(const config_t& config) const override;
    void update(const config_t& config) override;
    void on_click() override;
    void on_scroll(int delta) override;
    std::optional<std::string> tooltip() const override;
    bool is_visible() const override;
    std::optional<std::string> width_sample(const config_t& config) const override;

private:
    void run_then_query(const std::string& cmd);

    volume_config_t config;
};
