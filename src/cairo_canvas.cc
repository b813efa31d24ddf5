#include "cairo_canvas.hh"

#include <exception>
#include <memory>

#include <cairo/cairo-xcb.h>
#include <fmt/core.h>
#include <pango/pangocairo.h>

#include "log.hh"

cairo_canvas_t::cairo_canvas_t(connection_t& _connection, screen_t& screen, window_t& _window, const std::string& font, double font_size, int _dpi):
    connection(_connection),
    window(_window),
    dpi(_dpi)
{
    Pango::init();
    target = std::make_shared<Cairo::Surface>(
        cairo_xcb_surface_create(connection.connection, window.window, screen.visual_type, window.area.width, window.area.height), true);
    target_cr = Cairo::Context::create(target);
    // a 1x1 buffer so text can be measured before the first frame
    back = Cairo::ImageSurface::create(Cairo::Surface::Format::ARGB32, 1, 1);
    cr = Cairo::Context::create(back);
    set_font(font, font_size);
}

void cairo_canvas_t::set_font(const std::string& font, double font_size) {
    font_description = Pango::FontDescription(fmt::format("{} {}", font, font_size));
    make_layout();
}

void cairo_canvas_t::make_layout() {
    layout = Pango::Layout::create(cr);
    pango_cairo_context_set_resolution(layout->get_context()->gobj(), dpi);
    layout->context_changed();
    layout->set_font_description(font_description);
}

bool cairo_canvas_t::begin(int _width, int _height) {
    if (_width <= 0 || _height <= 0) {
        return false;
    }
    if (_width != width || _height != height) {
        try {
            back = Cairo::ImageSurface::create(Cairo::Surface::Format::ARGB32, _width, _height);
            cr = Cairo::Context::create(back);
        } catch (const std::exception& e) {
            spdlog::warn("[cairo] cannot allocate a {}x{} buffer: {}", _width, _height, e.what());
            width = 0;
            height = 0;
            return false;
        }
        cairo_xcb_surface_set_size(target->cobj(), _width, _height);
        target_cr = Cairo::Context::create(target);
        width = _width;
        height = _height;
        make_layout();
    }
    return true;
}

void cairo_canvas_t::present() {
    back->flush();
    target_cr->set_operator(Cairo::Context::Operator::SOURCE);
    target_cr->set_source(back, 0, 0);
    target_cr->paint();
    target->flush();
    xcb_flush(connection.connection);
}

text_extents_t cairo_canvas_t::measure_text(const std::string& s) {
    layout->set_text(s);
    text_extents_t extents;
    layout->get_pixel_size(extents.width, extents.height);
    return extents;
}

void cairo_canvas_t::set_color(const color_t& c, float alpha) {
    cr->set_source_rgba(c[0], c[1], c[2], alpha);
}

void cairo_canvas_t::fill_rect(const rect_t& r) {
    cr->rectangle(r.x, r.y, r.width, r.height);
    cr->fill();
}

void cairo_canvas_t::draw_text(int x, int y, const std::string& s) {
    cr->move_to(x, y);
    layout->set_text(s);
    layout->show_in_cairo_context(cr);
}

void cairo_canvas_t::draw_line(point_t from, point_t to, float line_width) {
    cr->set_line_width(line_width);
    cr->move_to(from.x + 0.5, from.y + 0.5);
    cr->line_to(to.x + 0.5, to.y + 0.5);
    cr->stroke();
}

bool cairo_canvas_t::draw_icon(const std::string& path, const rect_t& r) {
    auto it = icons.find(path);
    if (it == icons.end()) {
        Cairo::RefPtr<Cairo::ImageSurface> icon;
        try {
            icon = Cairo::ImageSurface::create_from_png(path);
        } catch (const std::exception& e) {
            spdlog::warn("[cairo] cannot load icon {}: {}", path, e.what());
        }
        it = icons.emplace(path, icon).first;
    }
    const auto& icon = it->second;
    if (!icon || icon->get_width() <= 0 || icon->get_height() <= 0) {
        return false;
    }
    cr->save();
    cr->translate(r.x, r.y);
    cr->scale(static_cast<double>(r.width) / icon->get_width(), static_cast<double>(r.height) / icon->get_height());
    cr->set_source(icon, 0, 0);
    cr->paint();
    cr->restore();
    return true;
}

void cairo_canvas_t::push_clip(const rect_t& r) {
    cr->save();
    cr->rectangle(r.x, r.y, r.width, r.height);
    cr->clip();
}

void cairo_canvas_t::pop_clip() {
    cr->restore();
}
