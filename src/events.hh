#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "area.hh"
#include "async_bridge.hh"
#include "module.hh"

enum class timer_id_t: uint8_t {
    slow = 1,
    fast = 3,
};

struct pointer_down_t {
    point_t pos;
    button_t button;
};
struct pointer_move_t {
    point_t pos;
};
struct pointer_up_t {
    point_t pos;
    button_t button;
};
struct scroll_t {
    point_t pos;
    int delta;
};
struct pointer_leave_t {};
// the host lost the pointer grab (window deactivated, grab broken)
struct capture_lost_t {};
struct paint_request_t {};
struct timer_tick_t {
    timer_id_t id;
};

using event_t = std::variant<
    pointer_down_t,
    pointer_move_t,
    pointer_up_t,
    scroll_t,
    pointer_leave_t,
    capture_lost_t,
    paint_request_t,
    timer_tick_t,
    refresh_t
>;

// emitted when a drag moved a module to a new position in its section;
// indices are positions in the section's id list
struct reorder_event_t {
    section_t section;
    std::string id;
    size_t old_index;
    size_t new_index;
    std::vector<std::string> order;
};
