#include "tooltip.hh"

#include <algorithm>

#include "log.hh"

tooltip_t::tooltip_t(connection_t& _connection, screen_t& _screen, const config_t& config, int dpi):
    connection(_connection),
    screen(_screen),
    window(connection, screen, rect_t(0, 0, 1, 1), true),
    canvas(connection, screen, window, config.font, config.font_size, dpi),
    padding(scale(6, dpi))
{}

void tooltip_t::show(const std::string& text, const rect_t& anchor, const config_t& config) {
    if (shown && *shown == text) {
        return;
    }
    const text_extents_t extents = canvas.measure_text(text);
    const int w = extents.width + padding * 2;
    const int h = extents.height + padding * 2;
    int x = std::clamp(anchor.center_x() - w / 2, 0, std::max(screen.area.width - w, 0));
    int y = config.position == config_t::position_t::top ? anchor.bottom() + 2 : anchor.y - h - 2;
    window.move_resize(rect_t(x, y, w, h));
    window.map();
    shown = text;
    paint(config);
}

void tooltip_t::paint(const config_t& config) {
    if (!shown) {
        return;
    }
    const int w = window.area.width;
    const int h = window.area.height;
    if (!canvas.begin(w, h)) {
        spdlog::debug("[tooltip] no buffer for {}x{}", w, h);
        return;
    }
    canvas.set_color(config.background);
    canvas.fill_rect(rect_t(0, 0, w, h));
    canvas.set_color(config.border);
    canvas.fill_rect(rect_t(0, 0, w, 1));
    canvas.fill_rect(rect_t(0, h - 1, w, 1));
    canvas.fill_rect(rect_t(0, 0, 1, h));
    canvas.fill_rect(rect_t(w - 1, 0, 1, h));
    canvas.set_color(config.foreground);
    canvas.draw_text(padding, padding, *shown);
    canvas.present();
}

void tooltip_t::hide() {
    if (!shown) {
        return;
    }
    window.unmap();
    xcb_flush(connection.connection);
    shown.reset();
}
