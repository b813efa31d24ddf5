#include "x11.hh"

#include <cmath>
#include <cstdlib>
#include <vector>
#include <unistd.h>

#include <fmt/core.h>

#include "log.hh"

connection_t::connection_t() {
    connection = xcb_connect(nullptr, nullptr);
    if (int err = xcb_connection_has_error(connection)) {
        xcb_disconnect(connection);
        throw x11_error_t(fmt::format("cannot connect to the X server (error {})", err));
    }
    xcb_intern_atom_cookie_t *cookie = xcb_ewmh_init_atoms(connection, &ewmh);
    if (!xcb_ewmh_init_atoms_replies(&ewmh, cookie, nullptr)) {
        xcb_disconnect(connection);
        throw x11_error_t("cannot intern EWMH atoms");
    }
}

connection_t::~connection_t() {
    xcb_ewmh_connection_wipe(&ewmh);
    xcb_disconnect(connection);
}

int connection_t::fd() const {
    return xcb_get_file_descriptor(connection);
}

void connection_t::check() const {
    if (int err = xcb_connection_has_error(connection)) {
        throw x11_error_t(fmt::format("X connection broke (error {})", err));
    }
}

screen_t::screen_t(connection_t& connection) {
    xcb_screen_iterator_t iter = xcb_setup_roots_iterator(xcb_get_setup(connection.connection));
    screen = iter.data;
    if (!screen) {
        throw x11_error_t("no X screen");
    }
    area = rect_t(0, 0, screen->width_in_pixels, screen->height_in_pixels);

    dpi_x = 96.0;
    dpi_y = 96.0;
    if (screen->width_in_millimeters > 0 && screen->height_in_millimeters > 0) {
        dpi_x = (static_cast<double>(screen->width_in_pixels) * 25.4 / static_cast<double>(screen->width_in_millimeters));
        dpi_y = (static_cast<double>(screen->height_in_pixels) * 25.4 / static_cast<double>(screen->height_in_millimeters));
    }

    visual_type = nullptr;
    xcb_depth_iterator_t depth_iter = xcb_screen_allowed_depths_iterator(screen);
    for (; depth_iter.rem; xcb_depth_next(&depth_iter)) {
        xcb_visualtype_iterator_t visual_iter = xcb_depth_visuals_iterator(depth_iter.data);
        for (; visual_iter.rem; xcb_visualtype_next(&visual_iter)) {
            if (screen->root_visual == visual_iter.data->visual_id) {
                visual_type = visual_iter.data;
                return;
            }
        }
    }
    throw x11_error_t("root visual not found");
}

int screen_t::dpi() const {
    if (!std::isfinite(dpi_y) || dpi_y < 48.0 || dpi_y > 480.0) {
        return 96;
    }
    return static_cast<int>(std::lround(dpi_y));
}

window_t::window_t(connection_t& _connection, screen_t& screen, rect_t _area, bool override_redirect):
    connection(_connection),
    area(_area)
{
    window = xcb_generate_id(connection.connection);
    uint32_t mask = XCB_CW_BACK_PIXEL | XCB_CW_OVERRIDE_REDIRECT | XCB_CW_EVENT_MASK;
    uint32_t values[] = {
        screen.screen->black_pixel,
        override_redirect ? 1u : 0u,
        XCB_EVENT_MASK_EXPOSURE |
        XCB_EVENT_MASK_BUTTON_PRESS |
        XCB_EVENT_MASK_BUTTON_RELEASE |
        XCB_EVENT_MASK_POINTER_MOTION |
        XCB_EVENT_MASK_LEAVE_WINDOW |
        XCB_EVENT_MASK_FOCUS_CHANGE |
        XCB_EVENT_MASK_STRUCTURE_NOTIFY,
    };
    xcb_void_cookie_t cookie = xcb_create_window_checked(
        connection.connection, XCB_COPY_FROM_PARENT,
        window, screen.screen->root,
        area.x, area.y,
        area.width, area.height,
        0,
        XCB_WINDOW_CLASS_INPUT_OUTPUT,
        screen.screen->root_visual,
        mask, values
    );
    if (xcb_generic_error_t *error = xcb_request_check(connection.connection, cookie)) {
        int code = error->error_code;
        free(error);
        throw x11_error_t(fmt::format("cannot create window (error {})", code));
    }
}

window_t::~window_t() {
    xcb_destroy_window(connection.connection, window);
    xcb_flush(connection.connection);
}

void window_t::move_resize(const rect_t& r) {
    area = r;
    uint16_t mask = XCB_CONFIG_WINDOW_X | XCB_CONFIG_WINDOW_Y | XCB_CONFIG_WINDOW_WIDTH | XCB_CONFIG_WINDOW_HEIGHT;
    std::vector<uint32_t> values = {
        static_cast<uint32_t>(r.x), static_cast<uint32_t>(r.y),
        static_cast<uint32_t>(r.width), static_cast<uint32_t>(r.height),
    };
    xcb_configure_window(connection.connection, window, mask, values.data());
}

void window_t::map() {
    xcb_map_window(connection.connection, window);
    uint32_t above = XCB_STACK_MODE_ABOVE;
    xcb_configure_window(connection.connection, window, XCB_CONFIG_WINDOW_STACK_MODE, &above);
}

void window_t::unmap() {
    xcb_unmap_window(connection.connection, window);
}

void setup_dock(connection_t& connection, screen_t& screen, window_t& window, config_t::position_t position) {
    auto& ewmh = connection.ewmh;
    const auto& c = connection.connection;
    const auto& w = window.window;

    std::string wmname = "sbar";
    xcb_icccm_set_wm_name(c, w, XCB_ATOM_STRING, 8, wmname.length(), wmname.c_str());
    std::string wmclass("sbar\0sbar\0", 10);
    xcb_icccm_set_wm_class(c, w, wmclass.length(), wmclass.c_str());

    std::vector<xcb_atom_t> types = {ewmh._NET_WM_WINDOW_TYPE_DOCK};
    xcb_ewmh_set_wm_window_type(&ewmh, w, types.size(), types.data());
    std::vector<xcb_atom_t> states = {ewmh._NET_WM_STATE_STICKY, ewmh._NET_WM_STATE_ABOVE, ewmh._NET_WM_STATE_SKIP_TASKBAR};
    xcb_ewmh_set_wm_state(&ewmh, w, states.size(), states.data());

    const rect_t& r = window.area;
    xcb_ewmh_wm_strut_partial_t strut {};
    if (position == config_t::position_t::top) {
        strut.top = r.bottom();
        strut.top_start_x = r.x;
        strut.top_end_x = r.right() - 1;
        xcb_ewmh_set_wm_strut(&ewmh, w, 0, 0, strut.top, 0);
    } else {
        strut.bottom = screen.area.bottom() - r.y;
        strut.bottom_start_x = r.x;
        strut.bottom_end_x = r.right() - 1;
        xcb_ewmh_set_wm_strut(&ewmh, w, 0, 0, 0, strut.bottom);
    }
    xcb_ewmh_set_wm_strut_partial(&ewmh, w, strut);

    xcb_ewmh_set_wm_desktop(&ewmh, w, 0xFFFFFFFF);
    xcb_ewmh_set_wm_pid(&ewmh, w, getpid());

    window.map();
    xcb_flush(c);
}

bool grab_pointer(connection_t& connection, window_t& window) {
    const uint16_t mask = XCB_EVENT_MASK_BUTTON_PRESS | XCB_EVENT_MASK_BUTTON_RELEASE | XCB_EVENT_MASK_POINTER_MOTION;
    xcb_grab_pointer_reply_t *reply = xcb_grab_pointer_reply(connection.connection,
        xcb_grab_pointer(connection.connection, 1, window.window, mask, XCB_GRAB_MODE_ASYNC, XCB_GRAB_MODE_ASYNC, XCB_NONE, XCB_NONE, XCB_CURRENT_TIME),
        nullptr);
    bool ok = reply && reply->status == XCB_GRAB_STATUS_SUCCESS;
    free(reply);
    if (!ok) {
        spdlog::debug("[x11] pointer grab refused");
    }
    return ok;
}

void ungrab_pointer(connection_t& connection) {
    xcb_ungrab_pointer(connection.connection, XCB_CURRENT_TIME);
    xcb_flush(connection.connection);
}

std::optional<event_t> translate(const xcb_generic_event_t* event, xcb_window_t window, bool gesture_active) {
    switch (event->response_type & ~0x80) {
        case XCB_EXPOSE: {
            const auto& expose = *reinterpret_cast<const xcb_expose_event_t*>(event);
            if (expose.window == window && expose.count == 0) {
                return paint_request_t{};
            }
            break;
        }
        case XCB_BUTTON_PRESS: {
            const auto& press = *reinterpret_cast<const xcb_button_press_event_t*>(event);
            if (press.event != window) {
                break;
            }
            point_t p {press.event_x, press.event_y};
            switch (press.detail) {
                case 1:
                case 2:
                case 3:
                    return pointer_down_t{p, static_cast<button_t>(press.detail)};
                case 4:
                    return scroll_t{p, 1};
                case 5:
                    return scroll_t{p, -1};
                default:
                    break;
            }
            break;
        }
        case XCB_BUTTON_RELEASE: {
            const auto& release = *reinterpret_cast<const xcb_button_release_event_t*>(event);
            if (release.event == window && release.detail >= 1 && release.detail <= 3) {
                return pointer_up_t{point_t{release.event_x, release.event_y}, static_cast<button_t>(release.detail)};
            }
            break;
        }
        case XCB_MOTION_NOTIFY: {
            const auto& motion = *reinterpret_cast<const xcb_motion_notify_event_t*>(event);
            if (motion.event != window) {
                break;
            }
            return pointer_move_t{point_t{motion.event_x, motion.event_y}};
        }
        case XCB_LEAVE_NOTIFY: {
            const auto& leave = *reinterpret_cast<const xcb_leave_notify_event_t*>(event);
            if (leave.event != window) {
                break;
            }
            if (gesture_active && (leave.mode == XCB_NOTIFY_MODE_UNGRAB || leave.mode == XCB_NOTIFY_MODE_GRAB)) {
                return capture_lost_t{};
            }
            return pointer_leave_t{};
        }
        case XCB_FOCUS_OUT: {
            const auto& focus = *reinterpret_cast<const xcb_focus_out_event_t*>(event);
            if (focus.event == window && gesture_active) {
                return capture_lost_t{};
            }
            break;
        }
        default:
            break;
    }
    return std::nullopt;
}

std::string active_window_title(connection_t& connection) {
    auto& ewmh = connection.ewmh;
    xcb_window_t active = XCB_NONE;
    if (!xcb_ewmh_get_active_window_reply(&ewmh, xcb_ewmh_get_active_window(&ewmh, 0), &active, nullptr) || active == XCB_NONE) {
        return "";
    }

    xcb_ewmh_get_utf8_strings_reply_t name;
    if (xcb_ewmh_get_wm_name_reply(&ewmh, xcb_ewmh_get_wm_name(&ewmh, active), &name, nullptr)) {
        std::string title(name.strings, name.strings_len);
        xcb_ewmh_get_utf8_strings_reply_wipe(&name);
        return title;
    }

    xcb_icccm_get_text_property_reply_t prop;
    if (xcb_icccm_get_wm_name_reply(connection.connection, xcb_icccm_get_wm_name(connection.connection, active), &prop, nullptr)) {
        std::string title(prop.name, prop.name_len);
        xcb_icccm_get_text_property_reply_wipe(&prop);
        return title;
    }
    return "";
}
