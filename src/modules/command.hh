#pragma once

#include <string>

#include "../config.hh"
#include "polling.hh"

// A [[modules]] entry: shows the output of a shell command, or fixed text when
// there is none, and runs shell commands on clicks.
struct command_module_t: polling_module_t<std::string> {
    command_module_t(async_bridge_t& _bridge, command_config_t _config);

    std::string display_text(const config_t& config) const override;
    void update(const config_t& config) override;
    void on_click() override;
    void on_right_click() override;
    void on_scroll(int delta) override;

private:
    void run(const std::string& cmd);

    command_config_t config;
};
