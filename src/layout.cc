#include "layout.hh"

#include <algorithm>
#include <exception>

#include <fmt/core.h>

#include "log.hh"

metrics_t layout_engine_t::metrics(const config_t& config) const {
    return metrics_t{
        scale(config.margin, dpi),
        scale(config.padding, dpi),
        scale(config.spacing, dpi),
        scale(16, dpi),
        scale(6, dpi),
        scale(60, dpi),
    };
}

std::optional<int> layout_engine_t::fixed_width(const module_t& module, const config_t& config, canvas_t& canvas, const metrics_t& m) {
    if (auto w = module.preferred_width()) {
        return *w;
    }
    if (auto w = config.width_hint(module.id)) {
        return scale(*w, dpi);
    }
    std::optional<int> width;
    if (auto sample = module.width_sample(config)) {
        width = sample_width(*sample, config, canvas) + m.padding * 2;
    }
    if (int floor = module.min_width(config); floor > 0) {
        width = std::max(width.value_or(0), scale(floor, dpi));
    }
    return width;
}

// widest line of the sample
int layout_engine_t::sample_width(const std::string& sample, const config_t& config, canvas_t& canvas) {
    const std::string font = fmt::format("{} {}", config.font, config.font_size);
    if (font != sample_font) {
        sample_widths.clear();
        sample_font = font;
    }
    auto it = sample_widths.find(sample);
    if (it != sample_widths.end()) {
        return it->second;
    }

    int widest = 0;
    size_t start = 0;
    while (start <= sample.size()) {
        size_t end = sample.find('\n', start);
        if (end == std::string::npos) {
            end = sample.size();
        }
        widest = std::max(widest, canvas.measure_text(sample.substr(start, end - start)).width);
        start = end + 1;
    }
    sample_widths.emplace(sample, widest);
    return widest;
}

std::vector<layout_engine_t::measured_t> layout_engine_t::measure_section(module_registry_t& registry, const config_t& config, canvas_t& canvas,
                                                                          section_t s, const std::set<std::string>& failed, int bar_height) {
    const metrics_t m = metrics(config);
    std::vector<measured_t> out;
    for (const auto& id: config.section_order(s)) {
        module_t* module = registry.get(id);
        if (!module) {
            if (unknown_ids.insert(id).second) {
                spdlog::warn("[layout] unknown module '{}' in {} section, skipped", id, section_name(s));
            }
            continue;
        }

        placed_t item;
        item.id = id;
        item.section = s;
        try {
            if (!module->is_visible()) {
                continue;
            }
            if (!failed.count(id)) {
                item.text = module->display_text(config);
            }
        } catch (const std::exception& e) {
            spdlog::warn("[layout] '{}' failed to render: {}", id, e.what());
            item.text.clear();
        }
        if (item.text.empty()) {
            continue;
        }

        try {
            item.extents = canvas.measure_text(item.text);
            auto icon = config.icons.find(id);
            if (icon != config.icons.end()) {
                item.icon = icon->second;
            }
            if (auto values = module->graph_values()) {
                item.graph = std::move(*values);
            }

            int width = item.extents.width + m.padding * 2;
            if (!item.icon.empty()) {
                width += m.icon_size + m.icon_spacing;
            }
            if (!item.graph.empty()) {
                width = std::max(width, m.graph_width + m.padding * 2);
            }
            if (auto hint = fixed_width(*module, config, canvas, m)) {
                width = *hint;
                item.fixed = true;
            }
            int height = std::min(item.extents.height + m.padding + 2, bar_height);
            out.push_back(measured_t{std::move(item), std::max(width, 1), std::max(height, 1)});
        } catch (const std::exception& e) {
            spdlog::warn("[layout] measuring '{}' failed: {}", id, e.what());
        }
    }
    return out;
}

frame_t layout_engine_t::layout(module_registry_t& registry, const config_t& config, canvas_t& canvas, int bar_width, int bar_height) {
    const std::set<std::string> failed = registry.update_all(config);
    const metrics_t m = metrics(config);

    frame_t frame;
    frame.serial = ++serial;
    frame.bar = rect_t(0, 0, bar_width, bar_height);

    auto place = [&](measured_t& entry, int x) {
        entry.item.rect = rect_t(x, (bar_height - entry.height) / 2, entry.width, entry.height);
        frame.bounds[entry.item.id] = entry.item.rect;
        frame.items.push_back(std::move(entry.item));
    };

    // left: list order from the left margin
    auto left = measure_section(registry, config, canvas, section_t::left, failed, bar_height);
    int x = m.margin;
    int left_end = -1;
    for (auto& entry: left) {
        if (x + entry.width > bar_width - m.margin) {
            spdlog::debug("[layout] left section overflows at '{}'", entry.item.id);
            break;
        }
        left_end = x + entry.width;
        place(entry, x);
        x += entry.width + m.spacing;
    }

    // right: reverse list order from the right margin, never into the left section
    auto right = measure_section(registry, config, canvas, section_t::right, failed, bar_height);
    const int right_floor = left_end >= 0 ? left_end + m.spacing : m.margin;
    x = bar_width - m.margin;
    int right_start = -1;
    for (auto it = right.rbegin(); it != right.rend(); ++it) {
        if (x - it->width < right_floor) {
            spdlog::debug("[layout] right section overflows at '{}'", it->item.id);
            break;
        }
        x -= it->width;
        right_start = x;
        place(*it, x);
        x -= m.spacing;
    }

    // center: measure everything first, then center the whole run between the other two
    auto center = measure_section(registry, config, canvas, section_t::center, failed, bar_height);
    if (!center.empty()) {
        int total = 0;
        for (const auto& entry: center) {
            total += entry.width + m.spacing;
        }
        total -= m.spacing;
        const int lo = left_end >= 0 ? left_end + m.spacing : m.margin;
        const int hi = right_start >= 0 ? right_start - m.spacing : bar_width - m.margin;
        int cx = std::max((bar_width - total) / 2, lo);
        for (auto& entry: center) {
            if (cx + entry.width > hi) {
                spdlog::debug("[layout] center section overflows at '{}'", entry.item.id);
                break;
            }
            place(entry, cx);
            cx += entry.width + m.spacing;
        }
    }

    return frame;
}

void layout_engine_t::draw_item(const placed_t& item, const config_t& config, canvas_t& canvas, const metrics_t& m, int bar_height) {
    const rect_t& r = item.rect;
    clip_t clip(canvas, r);

    int text_x = r.x + m.padding;
    if (!item.icon.empty()) {
        rect_t icon_rect(r.x + m.padding, (bar_height - m.icon_size) / 2, m.icon_size, m.icon_size);
        if (!canvas.draw_icon(item.icon, icon_rect)) {
            spdlog::debug("[layout] icon {} for '{}' unavailable", item.icon, item.id);
        }
        text_x += m.icon_size + m.icon_spacing;
    } else if (item.fixed) {
        text_x = r.x + (r.width - item.extents.width) / 2;
    }

    if (!item.graph.empty()) {
        const int inner_w = r.width - m.padding * 2;
        const int inner_h = r.height - 4;
        const auto values = downsample(item.graph, static_cast<size_t>(std::max(inner_w, 1)));
        const float step = values.size() > 1 ? static_cast<float>(inner_w) / static_cast<float>(values.size() - 1) : 0.0f;
        canvas.set_color(config.accent);
        point_t prev {};
        for (size_t i = 0; i < values.size(); i++) {
            float v = std::clamp(values[i], 0.0f, 100.0f) / 100.0f;
            point_t p {
                r.x + m.padding + static_cast<int>(static_cast<float>(i) * step),
                r.y + 2 + static_cast<int>((1.0f - v) * static_cast<float>(inner_h)),
            };
            if (i > 0) {
                canvas.draw_line(prev, p, 1.0f);
            }
            prev = p;
        }
    }

    canvas.set_color(config.foreground);
    canvas.draw_text(text_x, (bar_height - item.extents.height) / 2, item.text);
}

void layout_engine_t::draw(const frame_t& frame, const config_t& config, canvas_t& canvas, const overlay_t& overlay) {
    const metrics_t m = metrics(config);
    const rect_t& bar = frame.bar;

    canvas.set_color(config.background);
    canvas.fill_rect(bar);
    canvas.set_color(config.border);
    if (config.position == config_t::position_t::top) {
        canvas.fill_rect(rect_t(0, bar.height - 1, bar.width, 1));
    } else {
        canvas.fill_rect(rect_t(0, 0, bar.width, 1));
    }

    for (const auto& item: frame.items) {
        try {
            if (overlay.hover && *overlay.hover == item.id && !overlay.dragging) {
                const rect_t& r = item.rect;
                canvas.set_color(config.hover);
                canvas.fill_rect(rect_t(r.x + 2, r.y + 1, r.width - 4, r.height - 2));
            }
            if (overlay.dragging && *overlay.dragging == item.id) {
                // the origin slot stays reserved while the preview floats
                canvas.set_color(config.hover, 0.5f);
                canvas.fill_rect(item.rect);
                continue;
            }
            draw_item(item, config, canvas, m, bar.height);
        } catch (const std::exception& e) {
            spdlog::warn("[layout] drawing '{}' failed: {}", item.id, e.what());
        }
    }

    if (!overlay.dragging) {
        return;
    }
    const placed_t* dragged = frame.find(*overlay.dragging);
    if (!dragged) {
        return;
    }
    try {
        placed_t preview = *dragged;
        const int w = preview.rect.width;
        preview.rect.x = std::clamp(overlay.drag_x - w / 2, 0, std::max(bar.width - w, 0));
        canvas.set_color(config.hover, 0.9f);
        canvas.fill_rect(preview.rect);
        draw_item(preview, config, canvas, m, bar.height);
        if (overlay.caret_x) {
            canvas.set_color(config.accent);
            canvas.draw_line(point_t{*overlay.caret_x, preview.rect.y + 2}, point_t{*overlay.caret_x, preview.rect.bottom() - 2}, 2.0f);
        }
    } catch (const std::exception& e) {
        spdlog::warn("[layout] drawing drag preview failed: {}", e.what());
    }
}
