#pragma once

#include <map>
#include <string>

#include <cairomm/cairomm.h>
#include <pangomm.h>

#include "canvas.hh"
#include "x11.hh"

// canvas_t over cairomm and pangomm. Frames are drawn into an image surface
// that present() copies onto the window's xcb surface.
struct cairo_canvas_t: canvas_t {
    cairo_canvas_t(connection_t& _connection, screen_t& screen, window_t& _window, const std::string& font, double font_size, int _dpi);

    void set_font(const std::string& font, double font_size);

    bool begin(int width, int height) override;
    void present() override;

    text_extents_t measure_text(const std::string& s) override;

    void set_color(const color_t& c, float alpha = 1.0f) override;
    void fill_rect(const rect_t& r) override;
    void draw_text(int x, int y, const std::string& s) override;
    void draw_line(point_t from, point_t to, float width) override;
    bool draw_icon(const std::string& path, const rect_t& r) override;

    void push_clip(const rect_t& r) override;
    void pop_clip() override;

private:
    void make_layout();

    connection_t& connection;
    window_t& window;
    int dpi;
    Pango::FontDescription font_description;

    Cairo::RefPtr<Cairo::Surface> target;
    Cairo::RefPtr<Cairo::Context> target_cr;
    Cairo::RefPtr<Cairo::ImageSurface> back;
    Cairo::RefPtr<Cairo::Context> cr;
    Glib::RefPtr<Pango::Layout> layout;
    // null entries remember icons that failed to load
    std::map<std::string, Cairo::RefPtr<Cairo::ImageSurface>> icons;
    int width = 0;
    int height = 0;
};
