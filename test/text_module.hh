#pragma once

#include <optional>
#include <string>
#include <stdexcept>

#include "config.hh"
#include "module.hh"

// Module with fixed text, for layout and interaction tests.
struct text_module_t: module_t {
    text_module_t(std::string _id, std::string _text):
        module_t(_id, _id), text(std::move(_text)) {}

    std::string text;
    bool visible = true;
    bool throw_on_render = false;
    bool throw_on_update = false;
    bool throw_on_click = false;
    std::optional<int> width;
    std::optional<std::string> tip;
    int clicks = 0;
    int right_clicks = 0;
    int scrolled = 0;
    int updates = 0;

    std::string display_text(const config_t&) const override {
        if (throw_on_render) {
            throw std::runtime_error("render failed");
        }
        return text;
    }
    void update(const config_t&) override {
        updates++;
        if (throw_on_update) {
            throw std::runtime_error("update failed");
        }
    }
    void on_click() override {
        clicks++;
        if (throw_on_click) {
            throw std::runtime_error("click failed");
        }
    }
    void on_right_click() override {
        right_clicks++;
    }
    void on_scroll(int delta) override {
        scrolled += delta;
    }
    std::optional<std::string> tooltip() const override {
        return tip;
    }
    bool is_visible() const override {
        return visible;
    }
    std::optional<int> preferred_width() const override {
        return width;
    }
};
