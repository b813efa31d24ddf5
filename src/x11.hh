#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <xcb/xcb.h>
#include <xcb/xcb_ewmh.h>
#include <xcb/xcb_icccm.h>

#include "area.hh"
#include "config.hh"
#include "events.hh"

struct x11_error_t: std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct connection_t {
    xcb_connection_t *connection;
    xcb_ewmh_connection_t ewmh;
    connection_t();
    ~connection_t();

    connection_t(const connection_t&) = delete;
    connection_t& operator=(const connection_t&) = delete;

    int fd() const;
    // throws x11_error_t once the connection broke
    void check() const;
};

struct screen_t {
    rect_t area;
    xcb_screen_t *screen;
    xcb_visualtype_t *visual_type;
    double dpi_x, dpi_y;
    screen_t(connection_t& connection);

    int dpi() const;
};

struct window_t {
    connection_t& connection;
    xcb_window_t window;
    rect_t area;

    window_t(connection_t& _connection, screen_t& screen, rect_t _area, bool override_redirect = false);
    ~window_t();

    window_t(const window_t&) = delete;
    window_t& operator=(const window_t&) = delete;

    void move_resize(const rect_t& r);
    void map();
    void unmap();
};

// dock type, sticky/above/skip-taskbar state and a strut reserving the bar's edge
void setup_dock(connection_t& connection, screen_t& screen, window_t& window, config_t::position_t position);

bool grab_pointer(connection_t& connection, window_t& window);
void ungrab_pointer(connection_t& connection);

// serial event for an xcb event delivered to window, if it maps to one
std::optional<event_t> translate(const xcb_generic_event_t* event, xcb_window_t window, bool gesture_active);

// _NET_WM_NAME (or WM_NAME) of _NET_ACTIVE_WINDOW, empty when there is none
std::string active_window_title(connection_t& connection);
