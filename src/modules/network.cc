#include "network.hh"

#include <filesystem>
#include <fstream>
#include <system_error>

#include <fmt/format.h>

#include "../area.hh"
#include "../exec.hh"
#include "../log.hh"

static std::string read_word(const std::filesystem::path& p) {
    std::ifstream in(p);
    std::string word;
    in >> word;
    return word;
}

static uint64_t read_counter(const std::filesystem::path& p) {
    std::ifstream in(p);
    uint64_t value = 0;
    if (!(in >> value)) {
        return 0;
    }
    return value;
}

std::set<std::string> list_interfaces(const std::string& path) {
    std::set<std::string> out;
    std::error_code ec;
    std::filesystem::directory_iterator it(path, ec);
    if (ec) {
        return out;
    }
    for (const auto& entry: it) {
        const auto name = entry.path().filename().string();
        if (name != "lo") {
            out.insert(name);
        }
    }
    return out;
}

network_state_t read_network(const std::string& path, const std::string& interface) {
    network_state_t state;
    state.sampled = std::chrono::steady_clock::now();
    std::set<std::string> candidates;
    if (!interface.empty()) {
        candidates.insert(interface);
    } else {
        candidates = list_interfaces(path);
    }
    for (const auto& name: candidates) {
        const std::filesystem::path dir = std::filesystem::path(path) / name;
        if (read_word(dir / "operstate") != "up") {
            continue;
        }
        state.connected = true;
        state.interface = name;
        std::error_code ec;
        state.wireless = std::filesystem::exists(dir / "wireless", ec);
        state.rx_bytes = read_counter(dir / "statistics" / "rx_bytes");
        state.tx_bytes = read_counter(dir / "statistics" / "tx_bytes");
        break;
    }
    return state;
}

network_module_t::network_module_t(async_bridge_t& _bridge):
    polling_module_t("network", "Network", _bridge)
{}

std::string network_module_t::display_text(const config_t& config) const {
    if (!has_result()) {
        return "";
    }
    if (!state.connected) {
        return "⚠ offline";
    }
    std::string text = state.wireless ? "📶" : "🖧";
    if (config.network.show_name) {
        text += " " + state.interface;
    }
    if (config.network.show_speed) {
        text += fmt::format(" ↓{}/s ↑{}/s", format_bytes(rx_per_s), format_bytes(tx_per_s));
    }
    return text;
}

void network_module_t::update(const config_t& config) {
    click = config.network.click;
    if (collect()) {
        rx_per_s = 0;
        tx_per_s = 0;
        if (state.connected && previous.connected && previous.interface == state.interface) {
            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(state.sampled - previous.sampled).count();
            if (ms > 0) {
                if (state.rx_bytes >= previous.rx_bytes) {
                    rx_per_s = (state.rx_bytes - previous.rx_bytes) * 1000 / static_cast<uint64_t>(ms);
                }
                if (state.tx_bytes >= previous.tx_bytes) {
                    tx_per_s = (state.tx_bytes - previous.tx_bytes) * 1000 / static_cast<uint64_t>(ms);
                }
            }
        }
        previous = state;
    }
    poll(std::chrono::seconds(2), [path = config.network.path, interface = config.network.interface]() {
        return read_network(path, interface);
    });
}

void network_module_t::on_click() {
    exec_nocapture(click);
}

std::optional<std::string> network_module_t::tooltip() const {
    if (!has_result()) {
        return std::nullopt;
    }
    if (!state.connected) {
        return std::string("No network connection");
    }
    return fmt::format("{} ({})\nReceived: {}\nSent: {}", state.interface, state.wireless ? "wireless" : "wired",
                       format_bytes(state.rx_bytes), format_bytes(state.tx_bytes));
}

device_probe_t::device_probe_t(async_bridge_t& _bridge, std::string _path, std::chrono::milliseconds _interval):
    bridge(_bridge),
    path(std::move(_path)),
    interval(_interval),
    published(std::make_shared<published_t<std::set<std::string>>>()),
    busy(std::make_shared<std::atomic<bool>>(false))
{}

bool device_probe_t::poll() {
    bool changed = false;
    std::set<std::string> latest;
    if (published->fetch_if_newer(seen, latest)) {
        // the first listing only establishes the baseline
        changed = baseline && latest != known;
        baseline = true;
        if (changed) {
            spdlog::info("[network] interfaces changed: {}", fmt::join(latest, ", "));
        }
        known = std::move(latest);
    }

    const auto now = std::chrono::steady_clock::now();
    if ((!started || now - last_start >= interval) && !busy->exchange(true)) {
        started = true;
        last_start = now;
        auto out = published;
        auto flag = busy;
        auto& b = bridge;
        try {
            bridge.spawn("device probe", [out, flag, &b, p = path]() {
                struct release_t {
                    std::shared_ptr<std::atomic<bool>> flag;
                    ~release_t() {
                        *flag = false;
                    }
                } release {flag};
                auto next = list_interfaces(p);
                const bool differs = out->version() > 0 && out->get() != next;
                out->publish(std::move(next));
                if (differs) {
                    b.post(refresh_t{"network"});
                }
            });
        } catch (const std::system_error& e) {
            *busy = false;
            spdlog::warn("[network] cannot start device probe: {}", e.what());
        }
    }
    return changed;
}
