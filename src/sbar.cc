#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <system_error>

#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include "area.hh"
#include "async_bridge.hh"
#include "bar.hh"
#include "cairo_canvas.hh"
#include "config.hh"
#include "config_store.hh"
#include "log.hh"
#include "modules/factory.hh"
#include "modules/network.hh"
#include "registry.hh"
#include "tooltip.hh"
#include "x11.hh"

using namespace std::literals::chrono_literals;

static int wake_fd = -1;
static volatile std::sig_atomic_t stopping = 0;

static void wake() {
    uint64_t one = 1;
    ssize_t n = write(wake_fd, &one, sizeof(one));
    (void)n;
}

static void on_signal(int) {
    stopping = 1;
    wake();
}

static void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);
}

static int bar_height(const config_t& config, cairo_canvas_t& canvas, int dpi) {
    if (config.height > 0) {
        return scale(config.height, dpi);
    }
    const text_extents_t extents = canvas.measure_text("Ay");
    return extents.height + scale(config.padding, dpi) * 2;
}

static rect_t bar_rect(const config_t& config, const screen_t& screen, int height) {
    auto edge = config.position == config_t::position_t::top ? rect_t::direction::top : rect_t::direction::bottom;
    return screen.area.chop_to(edge, height);
}

static int run(const std::string& path) {
    config_store_t store = config_store_t::open(path);
    std::shared_ptr<const config_t> config = store.snapshot();
    setup_logging(config->log_level);

    connection_t connection;
    screen_t screen{connection};
    const int dpi = screen.dpi();
    spdlog::info("[x11] screen {}x{} at {} dpi", screen.area.width, screen.area.height, dpi);

    window_t window{connection, screen, bar_rect(*config, screen, 1)};
    cairo_canvas_t canvas{connection, screen, window, config->font, config->font_size, dpi};
    window.move_resize(bar_rect(*config, screen, bar_height(*config, canvas, dpi)));
    setup_dock(connection, screen, window, config->position);

    module_registry_t registry;
    async_bridge_t bridge;
    bridge.set_waker(wake);
    add_modules(registry, *config, bridge, module_sources_t{
        [&connection]() {
            return active_window_title(connection);
        },
        nullptr,
    });

    bar_t bar{config, registry, bridge, dpi};
    bar.resize(window.area.width, window.area.height);
    bar.reorder_listeners.push_back([&](const reorder_event_t& event) {
        bar.set_config(store.apply(event));
    });
    bar.capture = [&](bool grab) {
        if (grab) {
            grab_pointer(connection, window);
        } else {
            ungrab_pointer(connection);
        }
    };

    tooltip_t tooltip{connection, screen, *config, dpi};
    device_probe_t probe{bridge, config->network.path};

    const auto fast_interval = 100ms;
    const auto slow_interval = 1s;
    auto next_fast = bar_t::clock::now() + fast_interval;
    auto next_slow = bar_t::clock::now() + slow_interval;

    std::array<pollfd, 2> fds {{
        {connection.fd(), POLLIN, 0},
        {wake_fd, POLLIN, 0},
    }};

    while (!stopping) {
        bar.paint(canvas);

        auto now = bar_t::clock::now();
        int timeout = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(std::min(next_fast, next_slow) - now).count());
        if (poll(fds.data(), fds.size(), std::max(timeout, 0)) < 0 && errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "poll");
        }
        if (stopping) {
            break;
        }

        while (xcb_generic_event_t *event = xcb_poll_for_event(connection.connection)) {
            std::unique_ptr<xcb_generic_event_t, decltype(&free)> owned(event, &free);
            const uint8_t type = event->response_type & ~0x80;
            if (type == XCB_EXPOSE && reinterpret_cast<xcb_expose_event_t*>(event)->window == tooltip.window.window) {
                tooltip.paint(*bar.config);
                continue;
            }
            if (type == XCB_CONFIGURE_NOTIFY) {
                const auto& configure = *reinterpret_cast<xcb_configure_notify_event_t*>(event);
                if (configure.window == window.window) {
                    bar.resize(configure.width, configure.height);
                }
                continue;
            }
            if (auto translated = translate(event, window.window, bar.interaction.state() != gesture_t::idle)) {
                bar.handle(*translated);
            }
        }
        connection.check();

        if (fds[1].revents & POLLIN) {
            uint64_t count = 0;
            ssize_t n = read(wake_fd, &count, sizeof(count));
            (void)n;
        }
        bar.drain_refreshes();

        now = bar_t::clock::now();
        if (now >= next_fast) {
            bar.handle(timer_tick_t{timer_id_t::fast});
            next_fast = now + fast_interval;
        }
        if (now >= next_slow) {
            bar.handle(timer_tick_t{timer_id_t::slow});
            next_slow = now + slow_interval;
            if (probe.poll()) {
                if (auto* network = registry.get_as<network_module_t>("network")) {
                    network->refresh();
                }
            }
        }

        if (auto request = bar.pending_tooltip(now)) {
            rect_t anchor = request->anchor;
            anchor.x += window.area.x;
            anchor.y += window.area.y;
            tooltip.show(request->text, anchor, *bar.config);
        } else {
            tooltip.hide();
        }
    }

    spdlog::info("[sbar] stopping, waiting for {} workers", bridge.in_flight());
    bridge.set_waker(nullptr);
    tooltip.hide();
    return 0;
}

int main(int argc, char** argv) {
    setup_logging("info");
    try {
        wake_fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wake_fd < 0) {
            throw std::system_error(errno, std::generic_category(), "eventfd");
        }
        install_signal_handlers();
        int status = run(argc > 1 ? argv[1] : default_config_path());
        close(wake_fd);
        return status;
    } catch (const std::exception& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }
}
