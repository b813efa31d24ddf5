#include "command.hh"

#include <algorithm>

#include "../exec.hh"

command_module_t::command_module_t(async_bridge_t& _bridge, command_config_t _config):
    polling_module_t(_config.id, _config.id, _bridge),
    config(std::move(_config))
{}

std::string command_module_t::display_text(const config_t&) const {
    if (config.exec.empty()) {
        return config.text;
    }
    return state;
}

void command_module_t::update(const config_t&) {
    collect();
    if (config.exec.empty()) {
        return;
    }
    poll(std::chrono::seconds(std::max(config.interval, 1)), [cmd = config.exec]() {
        return exec(cmd);
    });
}

void command_module_t::run(const std::string& cmd) {
    if (cmd.empty()) {
        return;
    }
    exec_nocapture(cmd);
    refresh();
}

void command_module_t::on_click() {
    run(config.left_click);
}

void command_module_t::on_right_click() {
    run(config.right_click);
}

void command_module_t::on_scroll(int delta) {
    run(delta > 0 ? config.wheel_up : config.wheel_down);
}
