#include <catch2/catch.hpp>

#include "area.hh"

TEST_CASE("rect contains is half-open", "[area]") {
    rect_t r(10, 0, 20, 30);
    CHECK(r.contains(point_t{10, 0}));
    CHECK(r.contains(point_t{29, 29}));
    CHECK_FALSE(r.contains(point_t{30, 5}));
    CHECK_FALSE(r.contains(point_t{9, 5}));
    CHECK_FALSE(r.contains(point_t{15, 30}));
}

TEST_CASE("rect chop to an edge", "[area]") {
    rect_t screen(0, 0, 1920, 1080);
    CHECK(screen.chop_to(rect_t::direction::top, 30) == rect_t(0, 0, 1920, 30));
    CHECK(screen.chop_to(rect_t::direction::bottom, 30) == rect_t(0, 1050, 1920, 30));
    CHECK(screen.chop_off(rect_t::direction::left, 100) == rect_t(100, 0, 1820, 1080));
    CHECK(screen.chop_to(rect_t::direction::right, 5000) == screen);
}

TEST_CASE("scale follows dpi", "[area]") {
    CHECK(scale(8, 96) == 8);
    CHECK(scale(8, 192) == 16);
    CHECK(scale(6, 144) == 9);
}

TEST_CASE("downsample averages chunks", "[area]") {
    std::vector<float> values {0, 10, 20, 30};
    CHECK(downsample(values, 10) == values);
    auto out = downsample(values, 2);
    REQUIRE(out.size() == 2);
    CHECK(out[0] == Approx(5.0f));
    CHECK(out[1] == Approx(25.0f));
}

TEST_CASE("byte and duration formatting", "[area]") {
    CHECK(format_bytes(512) == "512 B");
    CHECK(format_bytes(1536) == "1.5 KB");
    CHECK(format_bytes(uint64_t(3) << 30) == "3.0 GB");
    CHECK(format_duration(45 * 60) == "45 min");
    CHECK(format_duration(2 * 3600 + 5 * 60) == "2:05");
}
