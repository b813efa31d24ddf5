#pragma once

#include <optional>
#include <string>
#include <vector>

#include "area.hh"
#include "config.hh"
#include "events.hh"
#include "frame.hh"

enum class gesture_t {
    idle,
    armed,
    dragging,
};

struct drag_state_t {
    std::string clicked_id;
    point_t clicked_pos;
    button_t button;
    bool dragging = false;
    // moved past the threshold on a module that cannot be reordered
    bool disarmed = false;
    int drag_start_x = 0;
    int drag_current_x = 0;
    std::optional<section_t> origin_section;
    std::optional<size_t> origin_index;
};

struct click_t {
    std::string id;
    button_t button;
};

struct release_t {
    std::optional<click_t> click;
    std::optional<reorder_event_t> reorder;
    bool redraw = false;
};

// position in order where a module dropped at x lands: the list index of the
// first placed module whose midpoint lies strictly right of x, or one past the
// last placed module when there is none
size_t insertion_index(const frame_t& frame, const std::vector<std::string>& order, int x);

// moves id to insert_at (an index into the list before removal); nothing when
// that leaves the order unchanged
std::optional<reorder_event_t> reorder(const std::vector<std::string>& order, section_t s, const std::string& id, size_t insert_at);

// Idle -> Armed -> {click | Dragging -> commit} -> Idle
struct interaction_controller_t {
    explicit interaction_controller_t(int _threshold = 6):
        threshold(_threshold) {}

    int threshold;

    gesture_t state() const;
    const std::optional<drag_state_t>& drag() const {
        return current;
    }

    // hit is the module under p, if any; returns true when a gesture was armed
    bool pointer_down(point_t p, button_t button, const std::optional<std::string>& hit, const config_t& config);
    // returns true when something visible changed
    bool pointer_move(point_t p);
    release_t pointer_up(point_t p, button_t button, const frame_t& frame, const config_t& config);
    // drops any gesture without touching the order; returns true if a drag was live
    bool cancel();

    // x of the insertion caret for the live drag
    std::optional<int> caret_x(const frame_t& frame, int spacing) const;

private:
    std::optional<drag_state_t> current;
};
