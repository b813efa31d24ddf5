#pragma once

#include "../config.hh"
#include "../module.hh"

// Launcher button: a fixed glyph (or icon) that runs a command on click.
struct app_menu_module_t: module_t {
    explicit app_menu_module_t(const app_menu_config_t& _config);

    std::string display_text(const config_t& config) const override;
    void update(const config_t& config) override;
    void on_click() override;
    void on_right_click() override;
    std::optional<std::string> tooltip() const override;

private:
    app_menu_config_t config;
};
