#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "area.hh"
#include "canvas.hh"
#include "module.hh"

using bounds_map_t = std::map<std::string, rect_t>;

struct placed_t {
    std::string id;
    section_t section;
    rect_t rect;
    std::string text;
    text_extents_t extents;
    // width came from a fixed-width hint; text is centered
    bool fixed = false;
    std::string icon;
    std::vector<float> graph;
};

// Result of one layout pass. Replaced wholesale by the next pass.
struct frame_t {
    uint64_t serial = 0;
    rect_t bar;
    bounds_map_t bounds;
    std::vector<placed_t> items;

    const placed_t* find(const std::string& id) const {
        for (const auto& item: items) {
            if (item.id == id) {
                return &item;
            }
        }
        return nullptr;
    }
    // placed items of one section, left to right
    std::vector<const placed_t*> section(section_t s) const;
};
