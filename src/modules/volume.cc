#include "volume.hh"

#include <algorithm>
#include <cctype>

#include <fmt/core.h>

#include "../exec.hh"
#include "../log.hh"

std::optional<int> parse_volume_percent(const std::string& output) {
    for (size_t i = 0; i < output.size(); i++) {
        if (output[i] != '%' || i == 0 || !std::isdigit(static_cast<unsigned char>(output[i - 1]))) {
            continue;
        }
        size_t start = i;
        while (start > 0 && std::isdigit(static_cast<unsigned char>(output[start - 1]))) {
            start--;
        }
        return std::stoi(output.substr(start, i - start));
    }
    return std::nullopt;
}

bool parse_mute(const std::string& output) {
    return output.find("yes") != std::string::npos;
}

std::string expand_step(std::string cmd, int step) {
    const std::string key = "{step}";
    const std::string value = std::to_string(step);
    size_t pos = 0;
    while ((pos = cmd.find(key, pos)) != std::string::npos) {
        cmd.replace(pos, key.size(), value);
        pos += value.size();
    }
    return cmd;
}

volume_state_t query_volume(const volume_config_t& config) {
    volume_state_t state;
    const std::string output = exec(config.get);
    auto percent = parse_volume_percent(output);
    if (!percent) {
        spdlog::debug("[volume] no percentage in '{}'", output);
        return state;
    }
    state.valid = true;
    state.percent = *percent;
    if (!config.get_mute.empty()) {
        try {
            state.muted = parse_mute(exec(config.get_mute));
        } catch (const exec_error_t& e) {
            spdlog::debug("[volume] mute query failed: {}", e.what());
        }
    }
    return state;
}

std::string volume_text(const volume_state_t& state, const volume_config_t& config) {
    if (!state.valid) {
        return "";
    }
    const char* icon;
    if (state.muted || state.percent == 0) {
        icon = "🔇";
    } else if (state.percent < 33) {
        icon = "🔈";
    } else if (state.percent < 66) {
        icon = "🔉";
    } else {
        icon = "🔊";
    }
    if (config.show_percentage) {
        return fmt::format("{} {}%", icon, state.percent);
    }
    return icon;
}

volume_module_t::volume_module_t(async_bridge_t& _bridge):
    polling_module_t("volume", "Volume", _bridge)
{}

std::string volume_module_t::display_text(const config_t& _config) const {
    return volume_text(state, _config.volume);
}

void volume_module_t::update(const config_t& _config) {
    config = _config.volume;
    collect();
    poll(std::chrono::seconds(config.interval_s), [c = config]() {
        return query_volume(c);
    });
}

void volume_module_t::run_then_query(const std::string& cmd) {
    if (cmd.empty()) {
        return;
    }
    kick([cmd, c = config]() {
        exec(cmd);
        return query_volume(c);
    });
}

void volume_module_t::on_click() {
    if (state.valid) {
        state.muted = !state.muted;
    }
    run_then_query(config.mute);
}

void volume_module_t::on_scroll(int delta) {
    if (delta == 0) {
        return;
    }
    const int step = std::max(config.scroll_step, 1);
    if (state.valid) {
        state.percent = std::clamp(state.percent + (delta > 0 ? step : -step), 0, 100);
    }
    run_then_query(expand_step(delta > 0 ? config.up : config.down, step));
}

std::optional<std::string> volume_module_t::tooltip() const {
    if (!state.valid) {
        return std::nullopt;
    }
    if (state.muted) {
        return fmt::format("Volume: {}% (Muted)", state.percent);
    }
    return fmt::format("Volume: {}%", state.percent);
}

bool volume_module_t::is_visible() const {
    return state.valid;
}

std::optional<std::string> volume_module_t::width_sample(const config_t& config) const {
    if (!config.volume.show_percentage) {
        return std::nullopt;
    }
    return std::string("🔊 100%");
}
