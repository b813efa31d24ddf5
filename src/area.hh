#pragma once

#include <array>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

using color_t = std::array<float, 3>;

struct point_t {
    int x, y;
};

struct rect_t {
    int x, y, width, height;

    rect_t():
        x(0), y(0), width(0), height(0) {}
    rect_t(int _x, int _y, int _width, int _height):
        x(_x), y(_y), width(_width), height(_height) {}

    int right() const {
        return x + width;
    }
    int bottom() const {
        return y + height;
    }
    int center_x() const {
        return x + width / 2;
    }
    bool empty() const {
        return width <= 0 || height <= 0;
    }

    // left/top inclusive, right/bottom exclusive
    bool contains(point_t p) const {
        return p.x >= x && p.x < right() && p.y >= y && p.y < bottom();
    }
    bool contains(const rect_t& r) const {
        return r.x >= x && r.right() <= right() && r.y >= y && r.bottom() <= bottom();
    }
    bool intersects(const rect_t& r) const {
        return x < r.right() && right() > r.x && y < r.bottom() && bottom() > r.y;
    }

    enum class direction {
        left, right, top, bottom,
    };
    rect_t chop_off(direction d, int amount) const;
    rect_t chop_to(direction d, int amount) const;

    bool operator==(const rect_t& r) const {
        return x == r.x && y == r.y && width == r.width && height == r.height;
    }
    bool operator!=(const rect_t& r) const {
        return !(*this == r);
    }

    friend std::ostream& operator<<(std::ostream& out, const rect_t& r) {
        out << r.x << ", ";
        out << r.y << ", ";
        out << r.width << ", ";
        out << r.height;
        return out;
    }
};

int scale(int value, int dpi);

std::vector<float> downsample(const std::vector<float>& values, size_t max_points);

std::string format_bytes(uint64_t bytes);
std::string format_duration(uint64_t seconds);
