#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "canvas.hh"
#include "config.hh"
#include "frame.hh"
#include "registry.hh"

// spacing in device pixels
struct metrics_t {
    int margin;
    int padding;
    int spacing;
    int icon_size;
    int icon_spacing;
    int graph_width;
};

// interaction state the renderer needs to see
struct overlay_t {
    std::optional<std::string> hover;
    std::optional<std::string> dragging;
    int drag_x = 0;
    std::optional<int> caret_x;
};

struct layout_engine_t {
    explicit layout_engine_t(int _dpi = 96):
        dpi(_dpi) {}

    int dpi;

    metrics_t metrics(const config_t& config) const;

    // updates every module, measures and packs the three sections into a new frame
    frame_t layout(module_registry_t& registry, const config_t& config, canvas_t& canvas, int bar_width, int bar_height);

    // background, modules, hover highlight and drag preview
    void draw(const frame_t& frame, const config_t& config, canvas_t& canvas, const overlay_t& overlay);

private:
    struct measured_t {
        placed_t item;
        int width;
        int height;
    };

    std::vector<measured_t> measure_section(module_registry_t& registry, const config_t& config, canvas_t& canvas,
                                            section_t s, const std::set<std::string>& failed, int bar_height);
    std::optional<int> fixed_width(const module_t& module, const config_t& config, canvas_t& canvas, const metrics_t& m);
    int sample_width(const std::string& sample, const config_t& config, canvas_t& canvas);
    void draw_item(const placed_t& item, const config_t& config, canvas_t& canvas, const metrics_t& m, int bar_height);

    uint64_t serial = 0;
    std::set<std::string> unknown_ids;
    // measured width samples, valid for sample_font only
    std::map<std::string, int> sample_widths;
    std::string sample_font;
};
