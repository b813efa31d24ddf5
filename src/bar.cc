#include "bar.hh"

#include <exception>

#include "hit_test.hh"
#include "log.hh"

bar_t::bar_t(std::shared_ptr<const config_t> _config, module_registry_t& _registry, async_bridge_t& _bridge, int dpi):
    config(std::move(_config)),
    registry(_registry),
    bridge(_bridge),
    engine(dpi),
    interaction(scale(config->drag_threshold, dpi))
{}

void bar_t::set_config(std::shared_ptr<const config_t> _config) {
    config = std::move(_config);
    interaction.threshold = scale(config->drag_threshold, engine.dpi);
    dirty = true;
}

void bar_t::resize(int _width, int _height) {
    if (_width == width && _height == height) {
        return;
    }
    width = _width;
    height = _height;
    dirty = true;
}

void bar_t::handle(const event_t& event) {
    std::visit([this](const auto& e) {
        on(e);
    }, event);
}

size_t bar_t::drain_refreshes() {
    auto refreshes = bridge.drain();
    for (const auto& refresh: refreshes) {
        handle(refresh);
    }
    return refreshes.size();
}

std::optional<std::string> bar_t::hit(point_t p) const {
    return hit_test(frame.bounds, p);
}

void bar_t::on(const pointer_down_t& e) {
    auto id = hit(e.pos);
    if (interaction.pointer_down(e.pos, e.button, id, *config)) {
        hover_since = clock::now();
        if (capture && !captured) {
            capture(true);
            captured = true;
        }
        dirty = true;
    }
}

void bar_t::on(const pointer_move_t& e) {
    if (interaction.state() != gesture_t::idle) {
        if (interaction.pointer_move(e.pos)) {
            dirty = true;
        }
        return;
    }
    set_hover(hit(e.pos));
}

void bar_t::on(const pointer_up_t& e) {
    if (interaction.state() == gesture_t::idle) {
        return;
    }
    release_t released = interaction.pointer_up(e.pos, e.button, frame, *config);
    if (interaction.state() == gesture_t::idle) {
        release_capture();
    }
    if (released.redraw) {
        dirty = true;
        set_hover(hit(e.pos));
    }
    if (released.click) {
        dispatch(*released.click);
    }
    if (released.reorder) {
        for (const auto& listener: reorder_listeners) {
            try {
                listener(*released.reorder);
            } catch (const std::exception& ex) {
                spdlog::warn("[interaction] reorder listener failed: {}", ex.what());
            }
        }
        dirty = true;
    }
}

void bar_t::on(const scroll_t& e) {
    auto id = hit(e.pos);
    if (!id) {
        return;
    }
    module_t* module = registry.get(*id);
    if (!module) {
        return;
    }
    try {
        module->on_scroll(e.delta);
    } catch (const std::exception& ex) {
        spdlog::warn("[interaction] '{}' scroll handler failed: {}", *id, ex.what());
    }
    dirty = true;
}

void bar_t::on(const pointer_leave_t&) {
    set_hover(std::nullopt);
}

void bar_t::on(const capture_lost_t&) {
    if (interaction.cancel()) {
        spdlog::warn("[interaction] pointer capture lost during a drag, order unchanged");
        dirty = true;
    }
    release_capture();
    set_hover(std::nullopt);
}

void bar_t::on(const paint_request_t&) {
    dirty = true;
}

void bar_t::on(const timer_tick_t&) {
    dirty = true;
}

void bar_t::on(const refresh_t& e) {
    spdlog::trace("[interaction] refresh from '{}'", e.module_id);
    dirty = true;
}

void bar_t::set_hover(std::optional<std::string> id) {
    if (id == hover) {
        return;
    }
    hover = std::move(id);
    hover_since = clock::now();
    dirty = true;
}

void bar_t::dispatch(const click_t& click) {
    module_t* module = registry.get(click.id);
    if (!module) {
        return;
    }
    try {
        if (click.button == button_t::right) {
            module->on_right_click();
        } else {
            module->on_click();
        }
    } catch (const std::exception& ex) {
        spdlog::warn("[interaction] '{}' click handler failed: {}", click.id, ex.what());
    }
    dirty = true;
}

void bar_t::release_capture() {
    if (capture && captured) {
        capture(false);
    }
    captured = false;
}

bool bar_t::paint(canvas_t& canvas) {
    if (!dirty || width <= 0 || height <= 0) {
        return false;
    }
    if (!canvas.begin(width, height)) {
        spdlog::warn("[layout] no drawing buffer for {}x{}, retrying next frame", width, height);
        return false;
    }

    frame = engine.layout(registry, *config, canvas, width, height);

    overlay_t overlay;
    if (hover && frame.bounds.count(*hover)) {
        overlay.hover = hover;
    }
    const auto& drag = interaction.drag();
    if (drag && drag->dragging) {
        overlay.dragging = drag->clicked_id;
        overlay.drag_x = drag->drag_current_x;
        overlay.caret_x = interaction.caret_x(frame, engine.metrics(*config).spacing);
    }
    engine.draw(frame, *config, canvas, overlay);
    canvas.present();
    dirty = false;
    return true;
}

std::optional<tooltip_request_t> bar_t::pending_tooltip(clock::time_point now) const {
    if (!hover || interaction.state() != gesture_t::idle || now - hover_since < tooltip_delay) {
        return std::nullopt;
    }
    auto bounds = frame.bounds.find(*hover);
    if (bounds == frame.bounds.end()) {
        return std::nullopt;
    }
    const module_t* module = registry.get(*hover);
    if (!module) {
        return std::nullopt;
    }
    std::optional<std::string> text;
    try {
        text = module->tooltip();
    } catch (const std::exception& ex) {
        spdlog::debug("[interaction] '{}' tooltip failed: {}", *hover, ex.what());
    }
    if (!text || text->empty()) {
        return std::nullopt;
    }
    return tooltip_request_t{*hover, *text, bounds->second};
}
