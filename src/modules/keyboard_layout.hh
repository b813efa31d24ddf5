#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../config.hh"
#include "polling.hh"

// configured xkb layouts, the active group first
struct keyboard_state_t {
    std::vector<std::string> layouts;
};

// the "layout:" field of setxkbmap -query output
std::vector<std::string> parse_xkb_layouts(const std::string& output);
// "us" -> "English (US)"; the code itself when unknown
std::string layout_name(const std::string& layout);
std::string keyboard_text(const keyboard_state_t& state, const keyboard_layout_config_t& config);
// the list with its first entry moved to the back, joined for setxkbmap
std::string rotate_layouts(const std::vector<std::string>& layouts);

// Active keyboard layout. Click switches to the next configured layout.
struct keyboard_layout_module_t: polling_module_t<keyboard_state_t> {
    explicit keyboard_layout_module_t(async_bridge_t& _bridge);

    std::string display_text(const config_t& config) const override;
    void update(const config_t& config) override;
    void on_click() override;
    std::optional<std::string> tooltip() const override;
    bool is_visible() const override;

private:
    keyboard_layout_config_t config;
};
