#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <cstdint>
#include <set>
#include <string>

#include "../config.hh"
#include "polling.hh"

struct network_state_t {
    bool connected = false;
    std::string interface;
    bool wireless = false;
    uint64_t rx_bytes = 0;
    uint64_t tx_bytes = 0;
    std::chrono::steady_clock::time_point sampled;
};

// the configured interface, or the first non-loopback one that is up
network_state_t read_network(const std::string& path, const std::string& interface);
std::set<std::string> list_interfaces(const std::string& path);

struct network_module_t: polling_module_t<network_state_t> {
    explicit network_module_t(async_bridge_t& _bridge);

    std::string display_text(const config_t& config) const override;
    void update(const config_t& config) override;
    void on_click() override;
    std::optional<std::string> tooltip() const override;

    // bytes per second since the previous sample
    uint64_t rx_rate() const {
        return rx_per_s;
    }
    uint64_t tx_rate() const {
        return tx_per_s;
    }

private:
    network_state_t previous;
    uint64_t rx_per_s = 0;
    uint64_t tx_per_s = 0;
    std::string click;
};

// Periodically lists the network interfaces on a worker and reports when the
// set changed, so the network module can re-probe right away.
struct device_probe_t {
    device_probe_t(async_bridge_t& _bridge, std::string _path, std::chrono::milliseconds _interval = std::chrono::seconds(5));

    // starts a listing when due; true when the last finished listing differs from the one before
    bool poll();

private:
    async_bridge_t& bridge;
    std::string path;
    std::chrono::milliseconds interval;
    std::shared_ptr<published_t<std::set<std::string>>> published;
    std::shared_ptr<std::atomic<bool>> busy;
    std::set<std::string> known;
    uint64_t seen = 0;
    bool baseline = false;
    bool started = false;
    std::chrono::steady_clock::time_point last_start;
};
