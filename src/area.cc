#include "area.hh"

#include <algorithm>
#include <numeric>

#include <fmt/core.h>

rect_t rect_t::chop_off(direction d, int amount) const {
    rect_t r = *this;
    amount = std::clamp(amount, 0, d == direction::left || d == direction::right ? width : height);
    switch (d) {
        case direction::left:
            r.x += amount;
            r.width -= amount;
            break;
        case direction::right:
            r.width -= amount;
            break;
        case direction::top:
            r.y += amount;
            r.height -= amount;
            break;
        case direction::bottom:
            r.height -= amount;
            break;
    }
    return r;
}

rect_t rect_t::chop_to(direction d, int amount) const {
    rect_t r = *this;
    amount = std::clamp(amount, 0, d == direction::left || d == direction::right ? width : height);
    switch (d) {
        case direction::left:
            r.width = amount;
            break;
        case direction::right:
            r.x = right() - amount;
            r.width = amount;
            break;
        case direction::top:
            r.height = amount;
            break;
        case direction::bottom:
            r.y = bottom() - amount;
            r.height = amount;
            break;
    }
    return r;
}

int scale(int value, int dpi) {
    return static_cast<int>(static_cast<float>(value) * static_cast<float>(dpi) / 96.0f);
}

std::vector<float> downsample(const std::vector<float>& values, size_t max_points) {
    if (values.size() <= max_points || max_points == 0) {
        return values;
    }
    std::vector<float> out;
    out.reserve(max_points);
    size_t chunk = values.size() / max_points;
    size_t idx = 0;
    for (size_t i = 0; i < max_points; i++) {
        size_t end = std::min(idx + chunk, values.size());
        float sum = std::accumulate(values.begin() + idx, values.begin() + end, 0.0f);
        out.push_back(end > idx ? sum / static_cast<float>(end - idx) : 0.0f);
        idx = end;
    }
    // fold the remainder into the last point
    if (idx < values.size()) {
        float rem = std::accumulate(values.begin() + idx, values.end(), 0.0f) / static_cast<float>(values.size() - idx);
        out.back() = (out.back() + rem) / 2.0f;
    }
    return out;
}

std::string format_bytes(uint64_t bytes) {
    const uint64_t kb = 1024;
    const uint64_t mb = kb * 1024;
    const uint64_t gb = mb * 1024;
    const uint64_t tb = gb * 1024;
    if (bytes >= tb) {
        return fmt::format("{:.1f} TB", static_cast<double>(bytes) / tb);
    } else if (bytes >= gb) {
        return fmt::format("{:.1f} GB", static_cast<double>(bytes) / gb);
    } else if (bytes >= mb) {
        return fmt::format("{:.1f} MB", static_cast<double>(bytes) / mb);
    } else if (bytes >= kb) {
        return fmt::format("{:.1f} KB", static_cast<double>(bytes) / kb);
    }
    return fmt::format("{} B", bytes);
}

std::string format_duration(uint64_t seconds) {
    uint64_t hours = seconds / 3600;
    uint64_t minutes = (seconds % 3600) / 60;
    if (hours > 0) {
        return fmt::format("{}:{:02}", hours, minutes);
    }
    return fmt::format("{} min", minutes);
}
