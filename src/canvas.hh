#pragma once

#include <string>

#include "area.hh"

struct text_extents_t {
    int width = 0;
    int height = 0;
};

// The rasterizer the layout engine draws through. Drawing happens into an
// off-screen buffer between begin() and present().
struct canvas_t {
    virtual ~canvas_t() = default;

    // (re)creates the off-screen buffer on size change; false skips the frame
    virtual bool begin(int width, int height) = 0;
    // copies the off-screen buffer to the visible surface in one go
    virtual void present() = 0;

    virtual text_extents_t measure_text(const std::string& s) = 0;

    virtual void set_color(const color_t& c, float alpha = 1.0f) = 0;
    virtual void fill_rect(const rect_t& r) = 0;
    virtual void draw_text(int x, int y, const std::string& s) = 0;
    virtual void draw_line(point_t from, point_t to, float width) = 0;
    // false when the icon could not be loaded
    virtual bool draw_icon(const std::string& path, const rect_t& r) = 0;

    virtual void push_clip(const rect_t& r) = 0;
    virtual void pop_clip() = 0;
};

struct clip_t {
    clip_t(canvas_t& _canvas, const rect_t& r):
        canvas(_canvas)
    {
        canvas.push_clip(r);
    }
    ~clip_t() {
        canvas.pop_clip();
    }
    canvas_t& canvas;
};
