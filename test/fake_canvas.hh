#pragma once

#include <string>
#include <vector>

#include "canvas.hh"

// Monospaced stand-in for the cairo canvas: every code point is char_width
// pixels wide and text is always text_height tall. Records what was drawn.
struct fake_canvas_t: canvas_t {
    int char_width = 7;
    int text_height = 14;
    bool fail_begin = false;

    int frames = 0;
    int presented = 0;
    int clip_depth = 0;
    std::vector<std::string> texts;
    std::vector<rect_t> fills;
    std::vector<std::string> icons;

    bool begin(int, int) override {
        if (fail_begin) {
            return false;
        }
        frames++;
        texts.clear();
        fills.clear();
        return true;
    }
    void present() override {
        presented++;
    }

    text_extents_t measure_text(const std::string& s) override {
        int chars = 0;
        for (unsigned char c: s) {
            if ((c & 0xC0) != 0x80) {
                chars++;
            }
        }
        return text_extents_t{chars * char_width, text_height};
    }

    void set_color(const color_t&, float) override {}
    void fill_rect(const rect_t& r) override {
        fills.push_back(r);
    }
    void draw_text(int, int, const std::string& s) override {
        texts.push_back(s);
    }
    void draw_line(point_t, point_t, float) override {}
    bool draw_icon(const std::string& path, const rect_t&) override {
        icons.push_back(path);
        return false;
    }

    void push_clip(const rect_t&) override {
        clip_depth++;
    }
    void pop_clip() override {
        clip_depth--;
    }
};
