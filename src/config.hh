#pragma once

#include <array>
#include <istream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <toml.hpp>

#include "area.hh"
#include "module.hh"

struct config_error_t: std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct clock_config_t {
    bool format_24h = false;
    bool show_seconds = false;
    bool show_date = true;
    bool show_day = true;
    bool center = false;
};

struct battery_config_t {
    bool show_percentage = true;
    bool show_time_remaining = false;
    int low_threshold = 20;
    std::string path = "/sys/class/power_supply";
    std::string click;
};

struct system_info_config_t {
    bool show_cpu = true;
    bool show_memory = true;
    bool show_graph = false;
    int interval_ms = 1500;
    std::string click;
};

struct disk_config_t {
    std::string path = "/";
    bool show_percentage = false;
    int interval_s = 30;
    std::string click;
};

struct network_config_t {
    std::string interface;
    bool show_name = true;
    bool show_speed = false;
    std::string path = "/sys/class/net";
    std::string click;
};

struct volume_config_t {
    std::string get = "pactl get-sink-volume @DEFAULT_SINK@";
    std::string get_mute = "pactl get-sink-mute @DEFAULT_SINK@";
    std::string up = "pactl set-sink-volume @DEFAULT_SINK@ +{step}%";
    std::string down = "pactl set-sink-volume @DEFAULT_SINK@ -{step}%";
    std::string mute = "pactl set-sink-mute @DEFAULT_SINK@ toggle";
    int scroll_step = 5;
    bool show_percentage = true;
    int interval_s = 2;
};

struct weather_config_t {
    bool enabled = true;
    std::string command = "curl -sf 'https://wttr.in/?format=%c%t'";
    int interval_min = 30;
    std::string click = "xdg-open https://wttr.in";
};

// playerctl commands; the {{ }} fields are expanded by playerctl
struct media_config_t {
    std::string query = "playerctl metadata --format '{{status}}\t{{title}}\t{{artist}}\t{{album}}'";
    std::string toggle = "playerctl play-pause";
    std::string next = "playerctl next";
    std::string previous = "playerctl previous";
    bool show_now_playing = true;
    size_t max_title_length = 35;
    int interval_s = 2;
};

struct keyboard_layout_config_t {
    bool enabled = true;
    std::string query = "setxkbmap -query";
    // run with the rotated layout list appended, e.g. "setxkbmap -layout de,us"
    std::string set = "setxkbmap -layout";
    bool show_full_name = false;
    int interval_ms = 1000;
};

struct gpu_config_t {
    bool enabled = true;
    bool show_usage = true;
    bool show_graph = false;
    int interval_ms = 1500;
    std::string path = "/sys/class/drm";
    // used when no card under path reports its load; empty disables it
    std::string nvidia_smi = "nvidia-smi --query-gpu=utilization.gpu,memory.used,memory.total,temperature.gpu,name --format=csv,noheader,nounits";
    std::string click;
};

struct uptime_config_t {
    bool show_days = true;
    bool compact = true;
};

struct app_menu_config_t {
    std::string text = "≡";
    std::string icon;
    std::string command;
    std::string right_command;
};

struct active_app_config_t {
    std::string fallback = "sbar";
    size_t max_length = 60;
};

// a [[modules]] entry: a module backed by shell commands
struct command_config_t {
    std::string id;
    std::string exec;
    std::string text;
    int interval = 1;
    std::string left_click;
    std::string right_click;
    std::string wheel_up;
    std::string wheel_down;
    int width = 0;
};

// Immutable snapshot; shared between frames as std::shared_ptr<const config_t>.
struct config_t {
    std::string path;

    std::string font = "Sans";
    double font_size = 10.0;
    color_t foreground {0.90f, 0.90f, 0.92f};
    color_t background {0.11f, 0.11f, 0.13f};
    color_t hover {0.22f, 0.22f, 0.25f};
    color_t border {0.30f, 0.30f, 0.34f};
    color_t accent {0.35f, 0.60f, 0.95f};
    enum class position_t {
        top, bottom,
    } position = position_t::top;
    int height = 0;
    int margin = 8;
    int padding = 8;
    int spacing = 4;
    int drag_threshold = 6;
    std::string log_level = "info";

    std::array<std::vector<std::string>, 3> order {{
        {"app_menu", "active_app"},
        {},
        {"weather", "media", "keyboard_layout", "gpu", "system_info", "disk", "network", "volume", "battery", "uptime", "clock"},
    }};
    // fixed-width hints in logical pixels
    std::map<std::string, int> widths;
    // PNG icons drawn before a module's text
    std::map<std::string, std::string> icons;

    clock_config_t clock;
    battery_config_t battery;
    system_info_config_t system_info;
    disk_config_t disk;
    network_config_t network;
    volume_config_t volume;
    weather_config_t weather;
    media_config_t media;
    keyboard_layout_config_t keyboard_layout;
    gpu_config_t gpu;
    uptime_config_t uptime;
    app_menu_config_t app_menu;
    active_app_config_t active_app;
    std::vector<command_config_t> commands;

    const std::vector<std::string>& section_order(section_t s) const {
        return order[static_cast<size_t>(s)];
    }
    std::optional<section_t> section_of(const std::string& id) const;
    std::optional<int> width_hint(const std::string& id) const;
};

config_t config_from_toml(const toml::value& data);
config_t parse_config(std::istream& in, const std::string& name);

std::string default_config_path();
