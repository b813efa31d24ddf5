#include "active_app.hh"

std::string truncate_utf8(const std::string& s, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < s.size(); i++) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) {
            continue;
        }
        if (chars == max_chars) {
            return s.substr(0, i) + "…";
        }
        chars++;
    }
    return s;
}

active_app_module_t::active_app_module_t(title_source_t _source):
    module_t("active_app", "Active App"),
    source(std::move(_source))
{}

std::string active_app_module_t::display_text(const config_t& config) const {
    if (title.empty()) {
        return config.active_app.fallback;
    }
    return truncate_utf8(title, config.active_app.max_length);
}

void active_app_module_t::update(const config_t&) {
    if (source) {
        title = source();
    }
}

std::optional<std::string> active_app_module_t::tooltip() const {
    if (title.empty()) {
        return std::nullopt;
    }
    return title;
}
