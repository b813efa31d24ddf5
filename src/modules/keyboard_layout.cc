#include "keyboard_layout.hh"

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>

#include <fmt/core.h>

#include "../exec.hh"
#include "../log.hh"

std::vector<std::string> parse_xkb_layouts(const std::string& output) {
    std::istringstream in(output);
    std::string word;
    std::vector<std::string> layouts;
    while (in >> word) {
        if (word != "layout:") {
            continue;
        }
        std::string list;
        if (!(in >> list)) {
            break;
        }
        std::istringstream fields(list);
        std::string layout;
        while (std::getline(fields, layout, ',')) {
            if (!layout.empty()) {
                layouts.push_back(layout);
            }
        }
        break;
    }
    return layouts;
}

std::string layout_name(const std::string& layout) {
    static const std::map<std::string, std::string> names {
        {"us", "English (US)"},
        {"gb", "English (UK)"},
        {"es", "Spanish"},
        {"fr", "French"},
        {"de", "German"},
        {"it", "Italian"},
        {"pt", "Portuguese"},
        {"br", "Portuguese (Brazil)"},
        {"ru", "Russian"},
        {"cn", "Chinese"},
        {"jp", "Japanese"},
        {"kr", "Korean"},
        {"ara", "Arabic"},
        {"il", "Hebrew"},
        {"pl", "Polish"},
        {"nl", "Dutch"},
        {"tr", "Turkish"},
        {"vn", "Vietnamese"},
        {"th", "Thai"},
        {"in", "Hindi"},
        {"ua", "Ukrainian"},
        {"cz", "Czech"},
        {"gr", "Greek"},
        {"se", "Swedish"},
        {"no", "Norwegian"},
        {"dk", "Danish"},
        {"fi", "Finnish"},
    };
    auto it = names.find(layout);
    if (it == names.end()) {
        return layout;
    }
    return it->second;
}

std::string keyboard_text(const keyboard_state_t& state, const keyboard_layout_config_t& config) {
    if (state.layouts.empty()) {
        return "";
    }
    const std::string& active = state.layouts.front();
    if (config.show_full_name) {
        return "⌨ " + layout_name(active);
    }
    std::string code = active;
    std::transform(code.begin(), code.end(), code.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return "⌨ " + code;
}

std::string rotate_layouts(const std::vector<std::string>& layouts) {
    std::string out;
    for (size_t i = 1; i <= layouts.size(); i++) {
        if (!out.empty()) {
            out += ",";
        }
        out += layouts[i % layouts.size()];
    }
    return out;
}

keyboard_layout_module_t::keyboard_layout_module_t(async_bridge_t& _bridge):
    polling_module_t("keyboard_layout", "Keyboard Layout", _bridge)
{}

std::string keyboard_layout_module_t::display_text(const config_t& _config) const {
    if (!_config.keyboard_layout.enabled) {
        return "";
    }
    return keyboard_text(state, _config.keyboard_layout);
}

void keyboard_layout_module_t::update(const config_t& _config) {
    config = _config.keyboard_layout;
    collect();
    if (!config.enabled) {
        return;
    }
    poll(std::chrono::milliseconds(config.interval_ms), [cmd = config.query]() {
        return keyboard_state_t{parse_xkb_layouts(exec(cmd))};
    });
}

void keyboard_layout_module_t::on_click() {
    if (state.layouts.size() < 2 || config.set.empty()) {
        spdlog::debug("[keyboard_layout] nothing to switch to");
        return;
    }
    const std::string cmd = fmt::format("{} {}", config.set, rotate_layouts(state.layouts));
    std::rotate(state.layouts.begin(), state.layouts.begin() + 1, state.layouts.end());
    kick([cmd, query = config.query]() {
        exec(cmd);
        return keyboard_state_t{parse_xkb_layouts(exec(query))};
    });
}

std::optional<std::string> keyboard_layout_module_t::tooltip() const {
    if (state.layouts.empty()) {
        return std::nullopt;
    }
    std::string text = "Keyboard Layout: " + layout_name(state.layouts.front());
    if (state.layouts.size() > 1) {
        text += "\nClick to switch";
    }
    return text;
}

bool keyboard_layout_module_t::is_visible() const {
    return config.enabled && !state.layouts.empty();
}
