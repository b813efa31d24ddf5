#include <memory>
#include <stdexcept>

#include <catch2/catch.hpp>

#include "bar.hh"
#include "fake_canvas.hh"
#include "text_module.hh"

using ids_t = std::vector<std::string>;

static point_t center_of(const rect_t& r) {
    return point_t{r.center_x(), r.y + r.height / 2};
}

// volume on the left, network and battery on the right of a 440x30 bar
struct fixture_t {
    module_registry_t registry;
    async_bridge_t bridge;
    fake_canvas_t canvas;
    text_module_t* volume;
    text_module_t* network;
    text_module_t* battery;
    std::unique_ptr<bar_t> bar;
    std::vector<reorder_event_t> reorders;
    std::vector<bool> captures;

    fixture_t() {
        volume = add("volume", "vol");
        network = add("network", "net");
        battery = add("battery", "bat");
        auto config = std::make_shared<config_t>();
        config->order = {{{"volume"}, {}, {"network", "battery"}}};
        bar = std::make_unique<bar_t>(config, registry, bridge);
        bar->resize(440, 30);
        bar->reorder_listeners.push_back([this](const reorder_event_t& e) {
            reorders.push_back(e);
            auto next = std::make_shared<config_t>(*bar->config);
            next->order[static_cast<size_t>(e.section)] = e.order;
            bar->set_config(next);
        });
        bar->capture = [this](bool grab) {
            captures.push_back(grab);
        };
        REQUIRE(bar->paint(canvas));
    }

    text_module_t* add(const std::string& id, const std::string& text) {
        auto module = std::make_unique<text_module_t>(id, text);
        auto* ptr = module.get();
        registry.add(std::move(module));
        return ptr;
    }

    point_t at(const std::string& id) const {
        return center_of(bar->bounds().at(id));
    }
};

TEST_CASE("a press and release with a small move clicks once", "[bar]") {
    fixture_t f;
    point_t p = f.at("volume");
    f.bar->handle(pointer_down_t{p, button_t::left});
    f.bar->handle(pointer_move_t{point_t{p.x + 3, p.y}});
    f.bar->handle(pointer_up_t{point_t{p.x + 3, p.y}, button_t::left});

    CHECK(f.volume->clicks == 1);
    CHECK(f.reorders.empty());
    CHECK(f.bar->config->section_order(section_t::right) == ids_t{"network", "battery"});
    CHECK(f.captures == std::vector<bool>{true, false});
}

TEST_CASE("dragging battery before network commits once", "[bar]") {
    fixture_t f;
    const rect_t network = f.bar->bounds().at("network");
    point_t p = f.at("battery");
    f.bar->handle(pointer_down_t{p, button_t::left});
    f.bar->handle(pointer_move_t{point_t{p.x - 20, p.y}});
    CHECK(f.bar->interaction.state() == gesture_t::dragging);

    // the frame keeps the dragged module in place while the preview floats
    REQUIRE(f.bar->paint(f.canvas));
    CHECK(f.bar->bounds().count("battery"));

    f.bar->handle(pointer_move_t{point_t{network.center_x() - 5, p.y}});
    f.bar->handle(pointer_up_t{point_t{network.center_x() - 5, p.y}, button_t::left});

    REQUIRE(f.reorders.size() == 1);
    CHECK(f.reorders[0].order == ids_t{"battery", "network"});
    CHECK(f.battery->clicks == 0);
    CHECK(f.bar->config->section_order(section_t::right) == ids_t{"battery", "network"});

    REQUIRE(f.bar->paint(f.canvas));
    CHECK(f.bar->bounds().at("battery").x < f.bar->bounds().at("network").x);
}

TEST_CASE("releasing a drag where it started changes nothing", "[bar]") {
    fixture_t f;
    point_t p = f.at("network");
    f.bar->handle(pointer_down_t{p, button_t::left});
    f.bar->handle(pointer_move_t{point_t{p.x + 10, p.y}});
    f.bar->handle(pointer_move_t{p});
    f.bar->handle(pointer_up_t{p, button_t::left});
    CHECK(f.reorders.empty());
    CHECK(f.network->clicks == 0);
}

TEST_CASE("losing the pointer grab cancels a drag", "[bar]") {
    fixture_t f;
    const point_t target = f.at("network");
    point_t p = f.at("battery");
    f.bar->handle(pointer_down_t{p, button_t::left});
    f.bar->handle(pointer_move_t{point_t{target.x - 5, p.y}});
    f.bar->handle(capture_lost_t{});
    CHECK(f.bar->interaction.state() == gesture_t::idle);

    CHECK(f.captures == std::vector<bool>{true, false});

    f.bar->handle(pointer_up_t{point_t{target.x - 5, p.y}, button_t::left});
    CHECK(f.reorders.empty());
    CHECK(f.battery->clicks == 0);
    CHECK(f.bar->config->section_order(section_t::right) == ids_t{"network", "battery"});

    // a press on empty bar space afterwards neither grabs nor leaves a grab behind
    f.bar->handle(pointer_down_t{point_t{2, 2}, button_t::left});
    f.bar->handle(pointer_up_t{point_t{2, 2}, button_t::left});
    CHECK(f.captures == std::vector<bool>{true, false});
}

TEST_CASE("right click and scroll reach the module under the pointer", "[bar]") {
    fixture_t f;
    point_t p = f.at("battery");
    f.bar->handle(pointer_down_t{p, button_t::right});
    f.bar->handle(pointer_up_t{p, button_t::right});
    CHECK(f.battery->right_clicks == 1);
    CHECK(f.battery->clicks == 0);

    f.bar->handle(scroll_t{f.at("volume"), 1});
    f.bar->handle(scroll_t{f.at("volume"), -1});
    f.bar->handle(scroll_t{f.at("volume"), -1});
    CHECK(f.volume->scrolled == -1);
    f.bar->handle(scroll_t{point_t{200, 15}, 1});
}

TEST_CASE("failing handlers and listeners are contained", "[bar]") {
    fixture_t f;
    f.volume->throw_on_click = true;
    point_t p = f.at("volume");
    f.bar->handle(pointer_down_t{p, button_t::left});
    f.bar->handle(pointer_up_t{p, button_t::left});
    CHECK(f.volume->clicks == 1);

    int later = 0;
    f.bar->reorder_listeners.insert(f.bar->reorder_listeners.begin(), [](const reorder_event_t&) {
        throw std::runtime_error("disk full");
    });
    f.bar->reorder_listeners.push_back([&later](const reorder_event_t&) {
        later++;
    });
    const point_t target = f.at("network");
    p = f.at("battery");
    f.bar->handle(pointer_down_t{p, button_t::left});
    f.bar->handle(pointer_move_t{point_t{target.x - 5, p.y}});
    f.bar->handle(pointer_up_t{point_t{target.x - 5, p.y}, button_t::left});
    CHECK(f.reorders.size() == 1);
    CHECK(later == 1);
}

TEST_CASE("frames are only drawn when something changed", "[bar]") {
    fixture_t f;
    CHECK_FALSE(f.bar->is_dirty());
    CHECK_FALSE(f.bar->paint(f.canvas));

    f.bridge.post(refresh_t{"network"});
    CHECK(f.bar->drain_refreshes() == 1);
    CHECK(f.bar->is_dirty());
    CHECK(f.bar->paint(f.canvas));

    f.bar->handle(timer_tick_t{timer_id_t::slow});
    f.canvas.fail_begin = true;
    CHECK_FALSE(f.bar->paint(f.canvas));
    CHECK(f.bar->is_dirty());
    f.canvas.fail_begin = false;
    CHECK(f.bar->paint(f.canvas));

    f.bar->resize(0, 30);
    CHECK_FALSE(f.bar->paint(f.canvas));
}

TEST_CASE("hover tooltips wait for the pointer to rest", "[bar]") {
    fixture_t f;
    f.network->tip = "eth0 (wired)";
    point_t p = f.at("network");
    f.bar->handle(pointer_move_t{p});
    CHECK(f.bar->hovered() == std::string("network"));

    const auto now = bar_t::clock::now();
    CHECK_FALSE(f.bar->pending_tooltip(now));
    auto request = f.bar->pending_tooltip(now + std::chrono::seconds(1));
    REQUIRE(request);
    CHECK(request->id == "network");
    CHECK(request->text == "eth0 (wired)");
    CHECK(request->anchor == f.bar->bounds().at("network"));

    // modules without a tooltip never ask for one
    f.bar->handle(pointer_move_t{f.at("battery")});
    CHECK_FALSE(f.bar->pending_tooltip(now + std::chrono::seconds(5)));

    f.bar->handle(pointer_leave_t{});
    CHECK_FALSE(f.bar->hovered());
}
