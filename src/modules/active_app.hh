#pragma once

#include <functional>
#include <string>

#include "../config.hh"
#include "../module.hh"

// cuts s to at most max_chars code points, appending an ellipsis when cut
std::string truncate_utf8(const std::string& s, size_t max_chars);

// Title of the focused window. The title source is a quick round trip to the
// window system supplied by the host.
struct active_app_module_t: module_t {
    using title_source_t = std::function<std::string()>;

    explicit active_app_module_t(title_source_t _source);

    std::string display_text(const config_t& config) const override;
    void update(const config_t& config) override;
    std::optional<std::string> tooltip() const override;

private:
    title_source_t source;
    std::string title;
};
