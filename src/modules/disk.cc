#include "disk.hh"

#include <sys/statvfs.h>

#include <fmt/core.h>

#include "../area.hh"
#include "../exec.hh"
#include "../log.hh"

disk_usage_t read_disk_usage(const std::string& path) {
    disk_usage_t usage;
    usage.path = path;
    struct statvfs st {};
    if (statvfs(path.c_str(), &st) != 0) {
        spdlog::debug("[disk] statvfs({}) failed", path);
        return usage;
    }
    usage.valid = true;
    usage.total = static_cast<uint64_t>(st.f_blocks) * st.f_frsize;
    usage.available = static_cast<uint64_t>(st.f_bavail) * st.f_frsize;
    const uint64_t free = static_cast<uint64_t>(st.f_bfree) * st.f_frsize;
    usage.used = usage.total >= free ? usage.total - free : 0;
    return usage;
}

std::string disk_text(const disk_usage_t& usage, const disk_config_t& config) {
    if (!usage.valid) {
        return "💾 --";
    }
    if (config.show_percentage) {
        const uint64_t pct = usage.total > 0 ? usage.used * 100 / usage.total : 0;
        return fmt::format("💾 {}%", pct);
    }
    return fmt::format("💾 {}/{}", format_bytes(usage.used), format_bytes(usage.total));
}

disk_module_t::disk_module_t(async_bridge_t& _bridge):
    polling_module_t("disk", "Disk Usage", _bridge)
{}

std::string disk_module_t::display_text(const config_t& config) const {
    if (!has_result()) {
        return "";
    }
    return disk_text(state, config.disk);
}

void disk_module_t::update(const config_t& config) {
    collect();
    click = config.disk.click;
    poll(std::chrono::seconds(config.disk.interval_s), [path = config.disk.path]() {
        return read_disk_usage(path);
    });
}

void disk_module_t::on_click() {
    exec_nocapture(click);
}

std::optional<std::string> disk_module_t::tooltip() const {
    if (!state.valid) {
        return std::nullopt;
    }
    return fmt::format("Disk Usage:\n{} {} / {} ({} free)", state.path, format_bytes(state.used), format_bytes(state.total),
                       format_bytes(state.available));
}
