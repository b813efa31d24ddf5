#include "app_menu.hh"

#include "../exec.hh"
#include "../log.hh"

app_menu_module_t::app_menu_module_t(const app_menu_config_t& _config):
    module_t("app_menu", "App Menu"),
    config(_config)
{}

std::string app_menu_module_t::display_text(const config_t&) const {
    return config.text;
}

void app_menu_module_t::update(const config_t& _config) {
    config = _config.app_menu;
}

void app_menu_module_t::on_click() {
    if (config.command.empty()) {
        spdlog::debug("[app_menu] no command configured");
        return;
    }
    exec_nocapture(config.command);
}

void app_menu_module_t::on_right_click() {
    exec_nocapture(config.right_command);
}

std::optional<std::string> app_menu_module_t::tooltip() const {
    return std::string("Applications");
}
