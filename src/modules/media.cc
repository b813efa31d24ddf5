#include "media.hh"

#include <vector>

#include <fmt/core.h>

#include "../exec.hh"
#include "../log.hh"
#include "active_app.hh"

media_state_t parse_media(const std::string& output) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (start <= output.size()) {
        size_t end = output.find('\t', start);
        if (end == std::string::npos) {
            end = output.size();
        }
        fields.push_back(output.substr(start, end - start));
        start = end + 1;
    }
    fields.resize(4);

    media_state_t state;
    if (fields[0] == "Playing") {
        state.playback = playback_t::playing;
    } else if (fields[0] == "Paused") {
        state.playback = playback_t::paused;
    } else {
        return state;
    }
    state.title = fields[1];
    state.artist = fields[2];
    state.album = fields[3];
    return state;
}

media_state_t query_media(const media_config_t& config) {
    try {
        return parse_media(exec(config.query));
    } catch (const exec_error_t& e) {
        spdlog::debug("[media] no player: {}", e.what());
    }
    return media_state_t{};
}

std::string media_text(const media_state_t& state, const media_config_t& config) {
    if (state.playback == playback_t::stopped) {
        return "";
    }
    std::string text = state.playback == playback_t::playing ? "▶" : "⏸";
    if (config.show_now_playing && !state.title.empty()) {
        text += " " + truncate_utf8(state.title, config.max_title_length);
        if (!state.artist.empty()) {
            text += " - " + truncate_utf8(state.artist, 20);
        }
    }
    return text;
}

media_module_t::media_module_t(async_bridge_t& _bridge):
    polling_module_t("media", "Media Controls", _bridge)
{}

std::string media_module_t::display_text(const config_t& _config) const {
    return media_text(state, _config.media);
}

void media_module_t::update(const config_t& _config) {
    config = _config.media;
    collect();
    poll(std::chrono::seconds(config.interval_s), [c = config]() {
        return query_media(c);
    });
}

void media_module_t::run_then_query(const std::string& cmd) {
    if (cmd.empty()) {
        return;
    }
    kick([cmd, c = config]() {
        exec(cmd);
        return query_media(c);
    });
}

void media_module_t::on_click() {
    if (state.playback == playback_t::playing) {
        state.playback = playback_t::paused;
    } else if (state.playback == playback_t::paused) {
        state.playback = playback_t::playing;
    }
    run_then_query(config.toggle);
}

void media_module_t::on_scroll(int delta) {
    if (delta == 0) {
        return;
    }
    run_then_query(delta > 0 ? config.next : config.previous);
}

std::optional<std::string> media_module_t::tooltip() const {
    if (state.playback == playback_t::stopped) {
        return std::string("No media playing");
    }
    std::string text;
    for (const auto* line: {&state.title, &state.artist, &state.album}) {
        if (!line->empty()) {
            text += *line + "\n";
        }
    }
    return text + fmt::format("Status: {}", state.playback == playback_t::playing ? "Playing" : "Paused");
}

bool media_module_t::is_visible() const {
    return state.playback != playback_t::stopped;
}
