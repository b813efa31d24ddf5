#pragma once

#include <optional>
#include <string>

#include "../config.hh"
#include "polling.hh"

enum class playback_t {
    stopped,
    playing,
    paused,
};

struct media_state_t {
    playback_t playback = playback_t::stopped;
    std::string title;
    std::string artist;
    std::string album;
};

// tab separated "status title artist album" as printed by media_config_t::query
media_state_t parse_media(const std::string& output);
// no player counts as stopped
media_state_t query_media(const media_config_t& config);
std::string media_text(const media_state_t& state, const media_config_t& config);

// Now playing from an MPRIS player. Click toggles play/pause, scrolling skips tracks.
struct media_module_t: polling_module_t<media_state_t> {
    explicit media_module_t(async_bridge_t& _bridge);

    std::string display_text(const config_t& config) const override;
    void update(const config_t& config) override;
    void on_click() override;
    void on_scroll(int delta) override;
    std::optional<std::string> tooltip() const override;
    bool is_visible() const override;

    bool is_playing() const {
        return state.playback == playback_t::playing;
    }

private:
    void run_then_query(const std::string& cmd);

    media_config_t config;
};
