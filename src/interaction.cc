#include "interaction.hh"

#include <algorithm>
#include <cstdlib>

#include "log.hh"

static std::optional<size_t> index_of(const std::vector<std::string>& order, const std::string& id) {
    auto it = std::find(order.begin(), order.end(), id);
    if (it == order.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - order.begin());
}

size_t insertion_index(const frame_t& frame, const std::vector<std::string>& order, int x) {
    std::optional<size_t> after_last;
    for (size_t i = 0; i < order.size(); i++) {
        auto it = frame.bounds.find(order[i]);
        if (it == frame.bounds.end()) {
            continue;
        }
        if (it->second.center_x() > x) {
            return i;
        }
        after_last = i + 1;
    }
    return after_last.value_or(order.size());
}

std::optional<reorder_event_t> reorder(const std::vector<std::string>& order, section_t s, const std::string& id, size_t insert_at) {
    auto pos = index_of(order, id);
    if (!pos) {
        return std::nullopt;
    }
    size_t index = std::min(insert_at, order.size());
    if (index > *pos) {
        index--;
    }
    if (index == *pos) {
        return std::nullopt;
    }

    reorder_event_t event;
    event.section = s;
    event.id = id;
    event.old_index = *pos;
    event.new_index = index;
    event.order = order;
    event.order.erase(event.order.begin() + static_cast<std::ptrdiff_t>(*pos));
    event.order.insert(event.order.begin() + static_cast<std::ptrdiff_t>(index), id);
    return event;
}

gesture_t interaction_controller_t::state() const {
    if (!current) {
        return gesture_t::idle;
    }
    return current->dragging ? gesture_t::dragging : gesture_t::armed;
}

bool interaction_controller_t::pointer_down(point_t p, button_t button, const std::optional<std::string>& hit, const config_t& config) {
    if (current) {
        spdlog::debug("[input] press during a gesture on '{}', ignored", current->clicked_id);
        return false;
    }
    if (!hit || (button != button_t::left && button != button_t::right)) {
        return false;
    }

    drag_state_t drag;
    drag.clicked_id = *hit;
    drag.clicked_pos = p;
    drag.button = button;
    drag.drag_start_x = p.x;
    drag.drag_current_x = p.x;
    // only the primary button reorders, and only within the left and right sections
    if (button == button_t::left) {
        auto s = config.section_of(*hit);
        if (s && *s != section_t::center) {
            drag.origin_section = s;
            drag.origin_index = index_of(config.section_order(*s), *hit);
        }
    }
    current = std::move(drag);
    return true;
}

bool interaction_controller_t::pointer_move(point_t p) {
    if (!current) {
        return false;
    }
    current->drag_current_x = p.x;
    if (current->dragging) {
        return true;
    }
    if (current->disarmed || std::abs(p.x - current->clicked_pos.x) <= threshold) {
        return false;
    }
    if (!current->origin_section) {
        current->disarmed = true;
        spdlog::debug("[input] '{}' cannot be dragged", current->clicked_id);
        return false;
    }
    current->dragging = true;
    current->drag_start_x = current->clicked_pos.x;
    spdlog::debug("[input] dragging '{}'", current->clicked_id);
    return true;
}

release_t interaction_controller_t::pointer_up(point_t p, button_t button, const frame_t& frame, const config_t& config) {
    release_t out;
    if (!current || button != current->button) {
        return out;
    }
    drag_state_t drag = std::move(*current);
    current.reset();
    drag.drag_current_x = p.x;

    if (drag.dragging) {
        out.redraw = true;
        const section_t s = *drag.origin_section;
        const auto& order = config.section_order(s);
        const size_t at = insertion_index(frame, order, drag.drag_current_x);
        out.reorder = reorder(order, s, drag.clicked_id, at);
        if (out.reorder) {
            spdlog::info("[input] moved '{}' in {} section from {} to {}", drag.clicked_id, section_name(s), out.reorder->old_index,
                         out.reorder->new_index);
        }
        return out;
    }
    if (drag.disarmed) {
        return out;
    }
    out.click = click_t{drag.clicked_id, drag.button};
    return out;
}

bool interaction_controller_t::cancel() {
    if (!current) {
        return false;
    }
    const bool was_dragging = current->dragging;
    if (was_dragging) {
        spdlog::debug("[input] drag of '{}' cancelled", current->clicked_id);
    }
    current.reset();
    return was_dragging;
}

std::optional<int> interaction_controller_t::caret_x(const frame_t& frame, int spacing) const {
    if (!current || !current->dragging) {
        return std::nullopt;
    }
    const auto items = frame.section(*current->origin_section);
    if (items.empty()) {
        return std::nullopt;
    }
    for (const placed_t* item: items) {
        if (item->rect.center_x() > current->drag_current_x) {
            return item->rect.x - spacing / 2;
        }
    }
    return items.back()->rect.right() + spacing / 2;
}
