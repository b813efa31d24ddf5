#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct config_t;

enum class section_t: uint8_t {
    left = 0,
    center = 1,
    right = 2,
};

const char* section_name(section_t s);

// values match the X11 button detail codes
enum class button_t: uint8_t {
    left = 1,
    middle = 2,
    right = 3,
    wheel_up = 4,
    wheel_down = 5,
};

// A unit of displayed information. display_text/tooltip/is_visible only read
// cached state; update() refreshes that cache and must return quickly, handing
// any blocking work to a worker.
struct module_t {
    module_t(std::string _id, std::string _name):
        id(std::move(_id)), name(std::move(_name)) {}
    virtual ~module_t() = default;

    module_t(const module_t&) = delete;
    module_t& operator=(const module_t&) = delete;

    const std::string id;
    const std::string name;

    virtual std::string display_text(const config_t& config) const = 0;
    virtual void update(const config_t& config) = 0;

    virtual void on_click() {}
    virtual void on_right_click() {}
    virtual void on_scroll(int delta) {
        (void)delta;
    }

    virtual std::optional<std::string> tooltip() const {
        return std::nullopt;
    }
    virtual bool is_visible() const {
        return true;
    }
    // fixed width in device pixels
    virtual std::optional<int> preferred_width() const {
        return std::nullopt;
    }
    // widest plausible rendering, measured by the layout engine to reserve a fixed
    // width; several candidates go one per line and the widest one counts
    virtual std::optional<std::string> width_sample(const config_t& config) const {
        (void)config;
        return std::nullopt;
    }
    // lower bound for the reserved width in logical pixels, 0 for none
    virtual int min_width(const config_t& config) const {
        (void)config;
        return 0;
    }
    // 0-100 samples, oldest first
    virtual std::optional<std::vector<float>> graph_values() const {
        return std::nullopt;
    }
};
