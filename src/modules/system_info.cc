#include "system_info.hh"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <fmt/core.h>

#include "../area.hh"
#include "../exec.hh"

std::optional<cpu_times_t> parse_cpu_times(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string label;
        fields >> label;
        if (label != "cpu") {
            continue;
        }
        cpu_times_t times;
        uint64_t value = 0;
        size_t column = 0;
        while (fields >> value) {
            // idle and iowait
            if (column == 3 || column == 4) {
                times.idle += value;
            }
            // guest time is already counted in user/nice
            if (column < 8) {
                times.total += value;
            }
            column++;
        }
        if (column < 4) {
            return std::nullopt;
        }
        return times;
    }
    return std::nullopt;
}

std::optional<memory_info_t> parse_meminfo(std::istream& in) {
    memory_info_t info;
    bool total = false;
    bool available = false;
    std::string key;
    uint64_t value = 0;
    std::string unit;
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        if (!(fields >> key >> value)) {
            continue;
        }
        fields >> unit;
        const uint64_t bytes = unit == "kB" ? value * 1024 : value;
        if (key == "MemTotal:") {
            info.total = bytes;
            total = true;
        } else if (key == "MemAvailable:") {
            info.available = bytes;
            available = true;
        }
        unit.clear();
    }
    if (!total || !available) {
        return std::nullopt;
    }
    return info;
}

float cpu_usage(const cpu_times_t& before, const cpu_times_t& after) {
    if (after.total <= before.total) {
        return 0.0f;
    }
    const uint64_t total = after.total - before.total;
    const uint64_t idle = after.idle >= before.idle ? after.idle - before.idle : 0;
    const float busy = static_cast<float>(total - std::min(idle, total));
    return busy * 100.0f / static_cast<float>(total);
}

system_info_module_t::system_info_module_t(async_bridge_t& _bridge, std::string _stat, std::string _meminfo):
    polling_module_t("system_info", "System Info", _bridge),
    stat_path(std::move(_stat)),
    meminfo_path(std::move(_meminfo)),
    previous(std::make_shared<std::optional<cpu_times_t>>())
{}

std::string system_info_module_t::display_text(const config_t& config) const {
    if (!state.valid) {
        return "";
    }
    std::string text;
    if (config.system_info.show_cpu) {
        text += fmt::format("CPU {:.0f}%", state.cpu);
    }
    if (config.system_info.show_memory) {
        if (!text.empty()) {
            text += "  ";
        }
        text += fmt::format("MEM {:.0f}%", state.memory);
    }
    return text;
}

std::optional<std::string> system_info_module_t::width_sample(const config_t& config) const {
    const auto& c = config.system_info;
    if (c.show_cpu && c.show_memory) {
        return std::string("CPU 100%  MEM 100%");
    } else if (c.show_cpu) {
        return std::string("CPU 100%");
    } else if (c.show_memory) {
        return std::string("MEM 100%");
    }
    return std::nullopt;
}

int system_info_module_t::min_width(const config_t&) const {
    return 64;
}

void system_info_module_t::update(const config_t& config) {
    show_graph = config.system_info.show_graph;
    click = config.system_info.click;
    if (collect() && state.valid) {
        cpu.push_back(state.cpu);
        memory.push_back(state.memory);
        while (cpu.size() > history_length) {
            cpu.pop_front();
        }
        while (memory.size() > history_length) {
            memory.pop_front();
        }
    }
    poll(std::chrono::milliseconds(config.system_info.interval_ms), [stat = stat_path, meminfo = meminfo_path, prev = previous]() {
        system_sample_t sample;
        std::ifstream stat_in(stat);
        auto times = parse_cpu_times(stat_in);
        std::ifstream meminfo_in(meminfo);
        auto mem = parse_meminfo(meminfo_in);
        if (!times || !mem) {
            return sample;
        }
        sample.valid = true;
        if (*prev) {
            sample.cpu = cpu_usage(**prev, *times);
        }
        *prev = times;
        sample.memory_total = mem->total;
        sample.memory_used = mem->total - std::min(mem->available, mem->total);
        if (mem->total > 0) {
            sample.memory = static_cast<float>(static_cast<double>(sample.memory_used) * 100.0 / static_cast<double>(mem->total));
        }
        return sample;
    });
}

void system_info_module_t::on_click() {
    exec_nocapture(click);
}

std::optional<std::string> system_info_module_t::tooltip() const {
    if (!state.valid) {
        return std::nullopt;
    }
    return fmt::format("CPU Usage: {:.1f}%\nMemory: {} / {} ({:.1f}%)", state.cpu, format_bytes(state.memory_used),
                       format_bytes(state.memory_total), state.memory);
}

std::optional<std::vector<float>> system_info_module_t::graph_values() const {
    if (!show_graph || cpu.empty()) {
        return std::nullopt;
    }
    return std::vector<float>(cpu.begin(), cpu.end());
}
