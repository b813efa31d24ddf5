#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "async_bridge.hh"
#include "canvas.hh"
#include "config.hh"
#include "events.hh"
#include "frame.hh"
#include "interaction.hh"
#include "layout.hh"
#include "registry.hh"

struct tooltip_request_t {
    std::string id;
    std::string text;
    rect_t anchor;
};

// Everything the serial loop owns: the current config snapshot, the last
// frame, hover and gesture state. Events go in through handle(), frames come
// out of paint(). Nothing here is touched from worker threads.
struct bar_t {
    using clock = std::chrono::steady_clock;

    bar_t(std::shared_ptr<const config_t> _config, module_registry_t& _registry, async_bridge_t& _bridge, int dpi = 96);

    std::shared_ptr<const config_t> config;
    module_registry_t& registry;
    async_bridge_t& bridge;
    layout_engine_t engine;
    interaction_controller_t interaction;

    // reorder commits go out through these
    std::vector<std::function<void(const reorder_event_t&)>> reorder_listeners;
    // asked to grab (true) or release (false) the pointer for a gesture
    std::function<void(bool)> capture;

    std::chrono::milliseconds tooltip_delay {600};

    void set_config(std::shared_ptr<const config_t> _config);
    void resize(int _width, int _height);

    void handle(const event_t& event);
    // posts every queued worker refresh through handle()
    size_t drain_refreshes();

    // lays out and draws when dirty; returns whether a frame was presented
    bool paint(canvas_t& canvas);

    bool is_dirty() const {
        return dirty;
    }
    void invalidate() {
        dirty = true;
    }
    const frame_t& current_frame() const {
        return frame;
    }
    const bounds_map_t& bounds() const {
        return frame.bounds;
    }
    std::optional<std::string> hit(point_t p) const;
    const std::optional<std::string>& hovered() const {
        return hover;
    }

    // the hovered module's tooltip once the pointer rested on it long enough
    std::optional<tooltip_request_t> pending_tooltip(clock::time_point now) const;

private:
    void on(const pointer_down_t& e);
    void on(const pointer_move_t& e);
    void on(const pointer_up_t& e);
    void on(const scroll_t& e);
    void on(const pointer_leave_t& e);
    void on(const capture_lost_t& e);
    void on(const paint_request_t& e);
    void on(const timer_tick_t& e);
    void on(const refresh_t& e);

    void set_hover(std::optional<std::string> id);
    void dispatch(const click_t& click);
    void release_capture();

    frame_t frame;
    std::optional<std::string> hover;
    clock::time_point hover_since;
    bool captured = false;
    bool dirty = true;
    int width = 0;
    int height = 0;
};
