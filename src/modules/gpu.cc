#include "gpu.hh"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fmt/core.h>

#include "../area.hh"
#include "../exec.hh"
#include "../log.hh"

namespace fs = std::filesystem;

template <typename T>
static std::optional<T> read_value(const fs::path& p) {
    std::ifstream in(p);
    T value {};
    if (!(in >> value)) {
        return std::nullopt;
    }
    return value;
}

static std::string vendor_name(const std::string& vendor) {
    if (vendor == "0x1002") {
        return "AMD";
    } else if (vendor == "0x10de") {
        return "NVIDIA";
    } else if (vendor == "0x8086") {
        return "Intel";
    }
    return "GPU";
}

// card0, card1, ... but not connectors like card0-DP-1
static bool is_card(const std::string& name) {
    if (name.rfind("card", 0) != 0 || name.size() == 4) {
        return false;
    }
    return name.find_first_not_of("0123456789", 4) == std::string::npos;
}

std::optional<gpu_info_t> read_gpu_sysfs(const std::string& path) {
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        return std::nullopt;
    }
    std::vector<fs::path> cards;
    for (const auto& entry: it) {
        if (is_card(entry.path().filename().string())) {
            cards.push_back(entry.path());
        }
    }
    std::sort(cards.begin(), cards.end());

    for (const auto& card: cards) {
        const fs::path device = card / "device";
        auto busy = read_value<float>(device / "gpu_busy_percent");
        if (!busy) {
            continue;
        }
        gpu_info_t info;
        info.valid = true;
        info.usage = *busy;
        info.memory_used = read_value<uint64_t>(device / "mem_info_vram_used").value_or(0);
        info.memory_total = read_value<uint64_t>(device / "mem_info_vram_total").value_or(0);
        info.name = fmt::format("{} {}", vendor_name(read_value<std::string>(device / "vendor").value_or("")), card.filename().string());

        fs::directory_iterator hwmon(device / "hwmon", ec);
        if (!ec) {
            for (const auto& entry: hwmon) {
                if (auto milli = read_value<float>(entry.path() / "temp1_input")) {
                    info.temperature = *milli / 1000.0f;
                    break;
                }
            }
        }
        return info;
    }
    return std::nullopt;
}

std::optional<gpu_info_t> parse_nvidia_smi(const std::string& output) {
    std::istringstream in(output);
    std::vector<std::string> fields;
    std::string field;
    while (std::getline(in, field, ',')) {
        const size_t start = field.find_first_not_of(' ');
        const size_t end = field.find_last_not_of(' ');
        fields.push_back(start == std::string::npos ? "" : field.substr(start, end - start + 1));
    }
    if (fields.size() < 3) {
        return std::nullopt;
    }
    try {
        gpu_info_t info;
        info.usage = std::stof(fields[0]);
        info.memory_used = std::stoull(fields[1]) * 1024 * 1024;
        info.memory_total = std::stoull(fields[2]) * 1024 * 1024;
        if (fields.size() > 3 && !fields[3].empty() && fields[3] != "[N/A]") {
            info.temperature = std::stof(fields[3]);
        }
        if (fields.size() > 4) {
            info.name = fields[4];
        }
        info.valid = true;
        return info;
    } catch (const std::logic_error& e) {
        spdlog::debug("[gpu] unexpected nvidia-smi output '{}': {}", output, e.what());
    }
    return std::nullopt;
}

gpu_info_t query_gpu(const gpu_config_t& config) {
    if (auto info = read_gpu_sysfs(config.path)) {
        return *info;
    }
    if (!config.nvidia_smi.empty()) {
        try {
            if (auto info = parse_nvidia_smi(exec(config.nvidia_smi))) {
                return *info;
            }
        } catch (const exec_error_t& e) {
            spdlog::debug("[gpu] {}", e.what());
        }
    }
    return gpu_info_t{};
}

std::string gpu_text(const gpu_info_t& info, const gpu_config_t& config) {
    if (!info.valid) {
        return "";
    }
    std::string text;
    auto append = [&text](const std::string& part) {
        if (!text.empty()) {
            text += "  ";
        }
        text += part;
    };
    if (config.show_usage) {
        append(fmt::format("GPU {:.0f}%", info.usage));
    }
    if (info.memory_total > 0) {
        append(fmt::format("VRAM {}%", info.memory_used * 100 / info.memory_total));
    }
    if (info.temperature) {
        append(fmt::format("{:.0f}°C", *info.temperature));
    }
    return text;
}

gpu_module_t::gpu_module_t(async_bridge_t& _bridge):
    polling_module_t("gpu", "GPU", _bridge)
{}

std::string gpu_module_t::display_text(const config_t& config) const {
    if (!config.gpu.enabled) {
        return "";
    }
    return gpu_text(state, config.gpu);
}

void gpu_module_t::update(const config_t& config) {
    enabled = config.gpu.enabled;
    show_graph = config.gpu.show_graph;
    click = config.gpu.click;
    if (collect() && state.valid) {
        usage.push_back(state.usage);
        while (usage.size() > history_length) {
            usage.pop_front();
        }
    }
    if (!enabled) {
        return;
    }
    poll(std::chrono::milliseconds(config.gpu.interval_ms), [c = config.gpu]() {
        return query_gpu(c);
    });
}

void gpu_module_t::on_click() {
    exec_nocapture(click);
}

std::optional<std::string> gpu_module_t::tooltip() const {
    if (!state.valid) {
        return std::nullopt;
    }
    std::string text = fmt::format("GPU Usage: {:.1f}%", state.usage);
    if (state.memory_total > 0) {
        text += fmt::format("\nVRAM: {} / {}", format_bytes(state.memory_used), format_bytes(state.memory_total));
    }
    if (state.temperature) {
        text += fmt::format("\nTemperature: {:.0f}°C", *state.temperature);
    }
    if (!state.name.empty()) {
        text += "\nDevice: " + state.name;
    }
    return text;
}

bool gpu_module_t::is_visible() const {
    return enabled && state.valid;
}

// the fields a card reports do not change, only their values
std::optional<std::string> gpu_module_t::width_sample(const config_t& config) const {
    gpu_info_t widest;
    widest.valid = true;
    widest.usage = 100.0f;
    widest.memory_used = state.memory_total > 0 ? 1 : 0;
    widest.memory_total = widest.memory_used;
    if (state.temperature) {
        widest.temperature = 100.0f;
    }
    return gpu_text(widest, config.gpu);
}

int gpu_module_t::min_width(const config_t&) const {
    return 92;
}

std::optional<std::vector<float>> gpu_module_t::graph_values() const {
    if (!show_graph || usage.empty()) {
        return std::nullopt;
    }
    return std::vector<float>(usage.begin(), usage.end());
}
