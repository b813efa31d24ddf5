#include <catch2/catch.hpp>

#include "interaction.hh"

using ids_t = std::vector<std::string>;

static void place(frame_t& frame, const std::string& id, section_t s, int x, int width) {
    placed_t item;
    item.id = id;
    item.section = s;
    item.rect = rect_t(x, 3, width, 24);
    frame.bounds[id] = item.rect;
    frame.items.push_back(item);
}

// network [300, 360) midpoint 330, battery [364, 424) midpoint 394
static frame_t right_frame(config_t& config) {
    config.order = {{{"app_menu"}, {"clock"}, {"network", "battery"}}};
    frame_t frame;
    frame.bar = rect_t(0, 0, 440, 30);
    place(frame, "app_menu", section_t::left, 8, 40);
    place(frame, "clock", section_t::center, 200, 60);
    place(frame, "network", section_t::right, 300, 60);
    place(frame, "battery", section_t::right, 364, 60);
    return frame;
}

TEST_CASE("a small move is still a click", "[interaction]") {
    config_t config;
    config.order = {{{}, {}, {"volume"}}};
    frame_t frame;
    place(frame, "volume", section_t::right, 100, 50);

    interaction_controller_t input(6);
    REQUIRE(input.pointer_down(point_t{120, 10}, button_t::left, std::string("volume"), config));
    CHECK(input.state() == gesture_t::armed);
    CHECK_FALSE(input.pointer_move(point_t{123, 10}));
    CHECK(input.state() == gesture_t::armed);

    release_t released = input.pointer_up(point_t{123, 10}, button_t::left, frame, config);
    REQUIRE(released.click);
    CHECK(released.click->id == "volume");
    CHECK(released.click->button == button_t::left);
    CHECK_FALSE(released.reorder);
    CHECK(input.state() == gesture_t::idle);
}

TEST_CASE("dragging past a neighbour's midpoint reorders", "[interaction]") {
    config_t config;
    frame_t frame = right_frame(config);

    interaction_controller_t input(6);
    REQUIRE(input.pointer_down(point_t{394, 10}, button_t::left, std::string("battery"), config));
    CHECK(input.pointer_move(point_t{380, 10}));
    CHECK(input.state() == gesture_t::dragging);
    CHECK(input.drag()->origin_section == section_t::right);
    CHECK(input.drag()->origin_index == size_t(1));
    input.pointer_move(point_t{320, 10});
    CHECK(input.caret_x(frame, 4) == 298);

    release_t released = input.pointer_up(point_t{320, 10}, button_t::left, frame, config);
    CHECK_FALSE(released.click);
    REQUIRE(released.reorder);
    CHECK(released.reorder->section == section_t::right);
    CHECK(released.reorder->id == "battery");
    CHECK(released.reorder->old_index == 1);
    CHECK(released.reorder->new_index == 0);
    CHECK(released.reorder->order == ids_t{"battery", "network"});
    CHECK(input.state() == gesture_t::idle);
}

TEST_CASE("the drag threshold is exclusive and horizontal", "[interaction]") {
    config_t config;
    frame_t frame = right_frame(config);
    interaction_controller_t input(6);

    input.pointer_down(point_t{394, 10}, button_t::left, std::string("battery"), config);
    input.pointer_move(point_t{400, 29});
    CHECK(input.state() == gesture_t::armed);
    input.pointer_move(point_t{388, 0});
    CHECK(input.state() == gesture_t::armed);
    input.pointer_move(point_t{387, 10});
    CHECK(input.state() == gesture_t::dragging);
    // moving back inside the threshold does not turn it back into a click
    input.pointer_move(point_t{394, 10});
    CHECK(input.state() == gesture_t::dragging);
    CHECK_FALSE(input.pointer_up(point_t{394, 10}, button_t::left, frame, config).click);
}

TEST_CASE("dropping a module where it already is emits nothing", "[interaction]") {
    config_t config;
    frame_t frame = right_frame(config);
    interaction_controller_t input(6);

    for (int x: {380, 410, 430, 439}) {
        input.pointer_down(point_t{394, 10}, button_t::left, std::string("battery"), config);
        input.pointer_move(point_t{x, 10});
        release_t released = input.pointer_up(point_t{x, 10}, button_t::left, frame, config);
        CHECK(released.redraw);
        CHECK_FALSE(released.reorder);
        CHECK_FALSE(released.click);
    }
}

TEST_CASE("center modules click but never drag", "[interaction]") {
    config_t config;
    frame_t frame = right_frame(config);
    interaction_controller_t input(6);

    input.pointer_down(point_t{230, 10}, button_t::left, std::string("clock"), config);
    CHECK_FALSE(input.drag()->origin_section);
    CHECK_FALSE(input.pointer_move(point_t{260, 10}));
    CHECK(input.state() == gesture_t::armed);
    CHECK(input.drag()->disarmed);
    release_t released = input.pointer_up(point_t{260, 10}, button_t::left, frame, config);
    CHECK_FALSE(released.click);
    CHECK_FALSE(released.reorder);

    input.pointer_down(point_t{230, 10}, button_t::left, std::string("clock"), config);
    released = input.pointer_up(point_t{231, 10}, button_t::left, frame, config);
    REQUIRE(released.click);
    CHECK(released.click->id == "clock");
}

TEST_CASE("right button clicks but never drags", "[interaction]") {
    config_t config;
    frame_t frame = right_frame(config);
    interaction_controller_t input(6);

    input.pointer_down(point_t{330, 10}, button_t::right, std::string("network"), config);
    release_t released = input.pointer_up(point_t{330, 10}, button_t::right, frame, config);
    REQUIRE(released.click);
    CHECK(released.click->button == button_t::right);

    input.pointer_down(point_t{330, 10}, button_t::right, std::string("network"), config);
    input.pointer_move(point_t{400, 10});
    CHECK(input.state() == gesture_t::armed);
    released = input.pointer_up(point_t{400, 10}, button_t::right, frame, config);
    CHECK_FALSE(released.click);
    CHECK_FALSE(released.reorder);
}

TEST_CASE("presses that cannot arm a gesture", "[interaction]") {
    config_t config;
    frame_t frame = right_frame(config);
    interaction_controller_t input(6);

    CHECK_FALSE(input.pointer_down(point_t{150, 10}, button_t::left, std::nullopt, config));
    CHECK_FALSE(input.pointer_down(point_t{330, 10}, button_t::middle, std::string("network"), config));
    CHECK(input.state() == gesture_t::idle);

    REQUIRE(input.pointer_down(point_t{330, 10}, button_t::left, std::string("network"), config));
    CHECK_FALSE(input.pointer_down(point_t{394, 10}, button_t::right, std::string("battery"), config));
    CHECK(input.drag()->clicked_id == "network");

    // releasing another button leaves the gesture alone
    CHECK_FALSE(input.pointer_up(point_t{330, 10}, button_t::right, frame, config).click);
    CHECK(input.state() == gesture_t::armed);
    CHECK(input.pointer_up(point_t{330, 10}, button_t::left, frame, config).click);
}

TEST_CASE("cancel drops a live drag without reordering", "[interaction]") {
    config_t config;
    frame_t frame = right_frame(config);
    interaction_controller_t input(6);

    CHECK_FALSE(input.cancel());
    input.pointer_down(point_t{394, 10}, button_t::left, std::string("battery"), config);
    input.pointer_move(point_t{320, 10});
    CHECK(input.cancel());
    CHECK(input.state() == gesture_t::idle);
    CHECK_FALSE(input.caret_x(frame, 4));
    release_t released = input.pointer_up(point_t{320, 10}, button_t::left, frame, config);
    CHECK_FALSE(released.click);
    CHECK_FALSE(released.reorder);
}

TEST_CASE("insertion index skips modules that were not placed", "[interaction]") {
    frame_t frame;
    place(frame, "a", section_t::left, 10, 20);
    place(frame, "c", section_t::left, 40, 20);
    const ids_t order {"a", "hidden", "c", "also_hidden"};

    CHECK(insertion_index(frame, order, 0) == 0);
    CHECK(insertion_index(frame, order, 19) == 0);
    // x equal to a midpoint lands after that module
    CHECK(insertion_index(frame, order, 20) == 2);
    CHECK(insertion_index(frame, order, 45) == 2);
    CHECK(insertion_index(frame, order, 55) == 3);
    CHECK(insertion_index(frame_t{}, order, 55) == 4);
}

TEST_CASE("reorder moves an id within its list", "[interaction]") {
    const ids_t order {"a", "b", "c", "d"};
    auto moved = reorder(order, section_t::left, "a", 3);
    REQUIRE(moved);
    CHECK(moved->order == ids_t{"b", "c", "a", "d"});
    CHECK(moved->new_index == 2);

    moved = reorder(order, section_t::left, "d", 0);
    REQUIRE(moved);
    CHECK(moved->order == ids_t{"d", "a", "b", "c"});

    moved = reorder(order, section_t::left, "b", 4);
    REQUIRE(moved);
    CHECK(moved->order == ids_t{"a", "c", "d", "b"});

    CHECK_FALSE(reorder(order, section_t::left, "b", 1));
    CHECK_FALSE(reorder(order, section_t::left, "b", 2));
    CHECK_FALSE(reorder(order, section_t::left, "zzz", 0));
}
