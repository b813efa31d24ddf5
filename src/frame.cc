#include "frame.hh"

#include <algorithm>

std::vector<const placed_t*> frame_t::section(section_t s) const {
    std::vector<const placed_t*> out;
    for (const auto& item: items) {
        if (item.section == s) {
            out.push_back(&item);
        }
    }
    std::sort(out.begin(), out.end(), [](const placed_t* a, const placed_t* b) {
        return a->rect.x < b->rect.x;
    });
    return out;
}
