#pragma once

#include <optional>
#include <string>

#include "cairo_canvas.hh"
#include "config.hh"
#include "x11.hh"

// Override-redirect popup next to the bar showing a module's tooltip.
struct tooltip_t {
    connection_t& connection;
    screen_t& screen;
    window_t window;
    cairo_canvas_t canvas;

    tooltip_t(connection_t& _connection, screen_t& _screen, const config_t& config, int dpi);

    // anchor is in screen coordinates; the popup opens below a top bar and above a bottom one
    void show(const std::string& text, const rect_t& anchor, const config_t& config);
    // redraws the current text, e.g. after an expose
    void paint(const config_t& config);
    void hide();

    bool visible() const {
        return shown.has_value();
    }

private:
    int padding;
    std::optional<std::string> shown;
};
