#include <filesystem>
#include <fstream>

#include <catch2/catch.hpp>

#include "async_bridge.hh"
#include "config.hh"
#include "layout.hh"
#include "modules/battery.hh"
#include "modules/command.hh"
#include "modules/factory.hh"
#include "modules/gpu.hh"
#include "modules/keyboard_layout.hh"
#include "modules/media.hh"
#include "modules/network.hh"
#include "modules/system_info.hh"

#include "fake_canvas.hh"

namespace fs = std::filesystem;

// scratch directory removed again when the test ends
struct scratch_t {
    fs::path root;

    explicit scratch_t(const std::string& name):
        root(fs::temp_directory_path() / ("sbar-probe-" + name))
    {
        fs::remove_all(root);
        fs::create_directories(root);
    }
    ~scratch_t() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void write(const fs::path& relative, const std::string& contents) const {
        fs::create_directories((root / relative).parent_path());
        std::ofstream(root / relative) << contents << "\n";
    }
};

TEST_CASE("battery from a power supply tree", "[battery]") {
    scratch_t sys("battery");
    sys.write("AC/type", "Mains");
    sys.write("AC/online", "0");
    sys.write("BAT0/type", "Battery");
    sys.write("BAT0/capacity", "57");
    sys.write("BAT0/status", "Discharging");
    sys.write("BAT0/energy_now", "20000000");
    sys.write("BAT0/power_now", "10000000");

    battery_state_t state = read_battery(sys.root.string());
    CHECK(state.present);
    CHECK(state.percent == 57);
    CHECK_FALSE(state.charging);
    CHECK_FALSE(state.plugged);
    CHECK(state.seconds_remaining == uint64_t(7200));

    sys.write("AC/online", "1");
    sys.write("BAT0/status", "Charging");
    state = read_battery(sys.root.string());
    CHECK(state.charging);
    CHECK(state.plugged);
    CHECK_FALSE(state.seconds_remaining);
}

TEST_CASE("no battery in the tree", "[battery]") {
    scratch_t sys("no-battery");
    sys.write("AC/type", "Mains");
    sys.write("AC/online", "1");
    CHECK_FALSE(read_battery(sys.root.string()).present);
    CHECK_FALSE(read_battery((sys.root / "missing").string()).present);
}

TEST_CASE("battery module hides until a battery is found", "[battery]") {
    scratch_t sys("battery-module");
    sys.write("BAT1/type", "Battery");
    sys.write("BAT1/capacity", "90");
    sys.write("BAT1/status", "Full");

    async_bridge_t bridge;
    battery_module_t module(bridge);
    config_t config;
    config.battery.path = sys.root.string();

    module.update(config);
    CHECK_FALSE(module.is_visible());
    bridge.wait_idle();
    module.update(config);
    CHECK(module.is_visible());
    CHECK(module.display_text(config) == "🔌 90%");
    CHECK(module.tooltip() == std::string("Battery: 90%\nStatus: Plugged in"));
}

TEST_CASE("network state from a net class tree", "[network]") {
    scratch_t sys("net");
    sys.write("lo/operstate", "unknown");
    sys.write("eth0/operstate", "down");
    sys.write("wlan0/operstate", "up");
    sys.write("wlan0/statistics/rx_bytes", "1000");
    sys.write("wlan0/statistics/tx_bytes", "2000");
    fs::create_directories(sys.root / "wlan0" / "wireless");

    CHECK(list_interfaces(sys.root.string()) == std::set<std::string>{"eth0", "wlan0"});

    network_state_t any = read_network(sys.root.string(), "");
    CHECK(any.connected);
    CHECK(any.interface == "wlan0");
    CHECK(any.wireless);
    CHECK(any.rx_bytes == 1000);
    CHECK(any.tx_bytes == 2000);

    CHECK_FALSE(read_network(sys.root.string(), "eth0").connected);
    CHECK_FALSE(read_network((sys.root / "missing").string(), "").connected);
}

TEST_CASE("network module text", "[network]") {
    scratch_t sys("net-module");
    sys.write("enp3s0/operstate", "up");

    async_bridge_t bridge;
    network_module_t module(bridge);
    config_t config;
    config.network.path = sys.root.string();

    module.update(config);
    CHECK(module.display_text(config).empty());
    bridge.wait_idle();
    module.update(config);
    CHECK(module.display_text(config) == "🖧 enp3s0");

    sys.write("enp3s0/operstate", "down");
    module.refresh();
    module.update(config);
    bridge.wait_idle();
    module.update(config);
    CHECK(module.display_text(config) == "⚠ offline");
    CHECK(module.tooltip() == std::string("No network connection"));
}

TEST_CASE("device probe reports a changed interface set", "[network]") {
    scratch_t sys("probe");
    sys.write("eth0/operstate", "up");

    async_bridge_t bridge;
    device_probe_t probe(bridge, sys.root.string(), std::chrono::milliseconds(0));

    CHECK_FALSE(probe.poll());
    bridge.wait_idle();
    // the first listing is the baseline
    CHECK_FALSE(probe.poll());
    bridge.wait_idle();

    sys.write("wlan0/operstate", "up");
    CHECK_FALSE(probe.poll());
    bridge.wait_idle();
    CHECK(probe.poll());
    bridge.wait_idle();

    auto refreshes = bridge.drain();
    REQUIRE(refreshes.size() == 1);
    CHECK(refreshes[0].module_id == "network");
}

TEST_CASE("system info samples procfs files", "[system_info]") {
    scratch_t proc("system-info");
    proc.write("stat", "cpu  100 0 50 800 50 0 0 0 0 0");
    proc.write("meminfo", "MemTotal: 16000 kB\nMemAvailable: 4000 kB");

    async_bridge_t bridge;
    system_info_module_t module(bridge, (proc.root / "stat").string(), (proc.root / "meminfo").string());
    config_t config;
    config.system_info.show_graph = true;

    module.update(config);
    CHECK(module.display_text(config).empty());
    bridge.wait_idle();
    module.update(config);
    CHECK(module.display_text(config) == "CPU 0%  MEM 75%");
    REQUIRE(module.graph_values());
    CHECK(module.graph_values()->size() == 1);
    CHECK(module.memory_history().back() == Approx(75.0f));

    config.system_info.show_cpu = false;
    CHECK(module.display_text(config) == "MEM 75%");
    config.system_info.show_graph = false;
    module.update(config);
    CHECK_FALSE(module.graph_values());
}

TEST_CASE("system info keeps its width while the readings change", "[system_info][layout]") {
    scratch_t proc("system-info-width");
    proc.write("stat", "cpu  100 0 50 800 50 0 0 0 0 0");
    proc.write("meminfo", "MemTotal: 16000 kB\nMemAvailable: 4000 kB");

    async_bridge_t bridge;
    module_registry_t registry;
    auto owned = std::make_unique<system_info_module_t>(bridge, (proc.root / "stat").string(), (proc.root / "meminfo").string());
    auto* module = owned.get();
    registry.add(std::move(owned));

    config_t config;
    config.order = {{{}, {}, {"system_info"}}};
    config.system_info.interval_ms = 0;
    fake_canvas_t canvas;
    layout_engine_t engine;

    module->update(config);
    bridge.wait_idle();
    frame_t idle = engine.layout(registry, config, canvas, 600, 30);
    REQUIRE(module->display_text(config) == "CPU 0%  MEM 75%");
    bridge.wait_idle();

    // every tick since the last sample was busy
    proc.write("stat", "cpu  300 0 150 800 50 0 0 0 0 0");
    engine.layout(registry, config, canvas, 600, 30);
    bridge.wait_idle();
    frame_t busy = engine.layout(registry, config, canvas, 600, 30);
    REQUIRE(module->display_text(config) == "CPU 100%  MEM 75%");

    // "CPU 100%  MEM 100%" plus padding
    CHECK(idle.bounds.at("system_info").width == 18 * 7 + 16);
    CHECK(busy.bounds.at("system_info") == idle.bounds.at("system_info"));

    config.system_info.show_memory = false;
    frame_t cpu_only = engine.layout(registry, config, canvas, 600, 30);
    CHECK(cpu_only.bounds.at("system_info").width == 8 * 7 + 16);
}

TEST_CASE("gpu load from a drm class tree", "[gpu]") {
    scratch_t sys("drm");
    sys.write("card0-DP-1/status", "connected");
    sys.write("card0/device/vendor", "0x1002");
    sys.write("card0/device/gpu_busy_percent", "42");
    sys.write("card0/device/mem_info_vram_used", "2147483648");
    sys.write("card0/device/mem_info_vram_total", "8589934592");
    sys.write("card0/device/hwmon/hwmon3/temp1_input", "51000");
    sys.write("card1/device/vendor", "0x8086");

    auto info = read_gpu_sysfs(sys.root.string());
    REQUIRE(info);
    CHECK(info->usage == Approx(42.0f));
    CHECK(info->memory_total == uint64_t(8) << 30);
    REQUIRE(info->temperature);
    CHECK(*info->temperature == Approx(51.0f));
    CHECK(info->name == "AMD card0");

    CHECK_FALSE(read_gpu_sysfs((sys.root / "missing").string()));
}

TEST_CASE("gpu module falls back to nvidia-smi", "[gpu]") {
    scratch_t sys("drm-empty");
    sys.write("card0/device/vendor", "0x10de");

    async_bridge_t bridge;
    gpu_module_t module(bridge);
    config_t config;
    config.gpu.path = sys.root.string();
    config.gpu.nvidia_smi = "echo '10, 256, 1024, 61, Test GPU'";
    config.gpu.show_graph = true;

    module.update(config);
    CHECK_FALSE(module.is_visible());
    bridge.wait_idle();
    module.update(config);
    CHECK(module.display_text(config) == "GPU 10%  VRAM 25%  61°C");
    CHECK(module.width_sample(config) == std::string("GPU 100%  VRAM 100%  100°C"));
    REQUIRE(module.graph_values());
    CHECK(module.graph_values()->back() == Approx(10.0f));
    CHECK(module.tooltip()->find("Device: Test GPU") != std::string::npos);

    config.gpu.enabled = false;
    module.update(config);
    CHECK_FALSE(module.is_visible());
    CHECK(module.display_text(config).empty());
}

TEST_CASE("media module follows the player", "[media]") {
    scratch_t tmp("media");
    tmp.write("status", "Playing");
    const std::string status = (tmp.root / "status").string();

    async_bridge_t bridge;
    media_module_t module(bridge);
    config_t config;
    config.media.query = "printf '%s\\tIntro\\tThe xx\\t' \"$(cat '" + status + "')\"";
    config.media.toggle = "echo Paused > '" + status + "'";

    module.update(config);
    CHECK_FALSE(module.is_visible());
    bridge.wait_idle();
    module.update(config);
    CHECK(module.is_playing());
    CHECK(module.display_text(config) == "▶ Intro - The xx");
    CHECK(module.tooltip() == std::string("Intro\nThe xx\nStatus: Playing"));

    // shown as paused right away, then confirmed by the player
    module.on_click();
    CHECK(module.display_text(config) == "⏸ Intro - The xx");
    bridge.wait_idle();
    module.update(config);
    CHECK_FALSE(module.is_playing());
    CHECK(module.display_text(config) == "⏸ Intro - The xx");
}

TEST_CASE("keyboard layout module switches to the next layout", "[keyboard_layout]") {
    scratch_t tmp("xkb");
    tmp.write("layouts", "us,de");
    const std::string layouts = (tmp.root / "layouts").string();

    async_bridge_t bridge;
    keyboard_layout_module_t module(bridge);
    config_t config;
    config.keyboard_layout.query = "printf 'layout: '; cat '" + layouts + "'";
    config.keyboard_layout.set = "printf '%s' > '" + layouts + "'";

    module.update(config);
    bridge.wait_idle();
    module.update(config);
    CHECK(module.display_text(config) == "⌨ US");

    module.on_click();
    CHECK(module.display_text(config) == "⌨ DE");
    bridge.wait_idle();
    module.update(config);
    CHECK(module.display_text(config) == "⌨ DE");
    CHECK(module.tooltip() == std::string("Keyboard Layout: German\nClick to switch"));

    config.keyboard_layout.enabled = false;
    module.update(config);
    CHECK_FALSE(module.is_visible());
}

TEST_CASE("command module shows fixed text or command output", "[command]") {
    async_bridge_t bridge;
    config_t config;

    command_config_t label;
    label.id = "label";
    label.text = "hello";
    command_module_t fixed(bridge, label);
    fixed.update(config);
    CHECK(fixed.display_text(config) == "hello");
    CHECK(bridge.in_flight() == 0);

    command_config_t echo;
    echo.id = "echo";
    echo.exec = "printf 'a\\nb\\n'";
    command_module_t output(bridge, echo);
    output.update(config);
    bridge.wait_idle();
    output.update(config);
    CHECK(output.display_text(config) == "a b");
    CHECK(output.id == "echo");
}

TEST_CASE("add_modules registers the built-ins and command entries", "[factory]") {
    async_bridge_t bridge;
    module_registry_t registry;
    config_t config;
    command_config_t mail;
    mail.id = "mail";
    mail.text = "✉";
    config.commands.push_back(mail);
    config.commands.push_back(command_config_t{});

    add_modules(registry, config, bridge, module_sources_t{
        []() {
            return std::string("Terminal");
        },
        []() {
            return std::string("sunny");
        },
    });

    for (const char* id: {"app_menu", "active_app", "clock", "battery", "system_info", "disk", "network", "volume", "weather",
                          "media", "keyboard_layout", "gpu", "uptime", "mail"}) {
        CHECK(registry.get(id));
    }
    CHECK(registry.size() == 14);
    CHECK(registry.get_as<network_module_t>("network"));
    CHECK_FALSE(registry.get_as<network_module_t>("clock"));
}
