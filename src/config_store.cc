#include "config_store.hh"

#include <cstdio>
#include <filesystem>
#include <fstream>

#include "log.hh"

config_store_t::config_store_t(std::string _path, toml::value _document):
    path(std::move(_path)),
    doc(std::move(_document))
{
    if (!doc.is_table()) {
        throw config_error_t("configuration root must be a table");
    }
    config_t config = config_from_toml(doc);
    config.path = path;
    current = std::make_shared<const config_t>(std::move(config));
}

config_store_t config_store_t::open(const std::string& path) {
    std::ifstream in(path, std::ios_base::binary);
    if (!in.good()) {
        spdlog::info("[config] {} not found, using defaults", path);
        return config_store_t(path, toml::table{});
    }
    spdlog::info("[config] loading {}", path);
    try {
        return config_store_t(path, toml::parse(in, path));
    } catch (const toml::syntax_error& e) {
        throw config_error_t(e.what());
    }
}

std::shared_ptr<const config_t> config_store_t::apply(const reorder_event_t& event) {
    auto next = std::make_shared<config_t>(*current);
    next->order[static_cast<size_t>(event.section)] = event.order;
    current = next;

    toml::array ids;
    for (const auto& id: event.order) {
        ids.push_back(toml::value(id));
    }
    auto& root = doc.as_table();
    auto layout = root.find("layout");
    if (layout == root.end() || !layout->second.is_table()) {
        root["layout"] = toml::table{};
    }
    root["layout"].as_table()[section_name(event.section)] = toml::value(std::move(ids));

    if (!save()) {
        spdlog::warn("[config] new {} order kept in memory only", section_name(event.section));
    }
    return current;
}

bool config_store_t::save() const {
    if (path.empty()) {
        return true;
    }
    std::error_code ec;
    const auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
    }
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios_base::binary | std::ios_base::trunc);
        if (!out.good()) {
            spdlog::warn("[config] cannot write {}", tmp);
            return false;
        }
        out << doc;
        out.flush();
        if (!out.good()) {
            spdlog::warn("[config] writing {} failed", tmp);
            std::remove(tmp.c_str());
            return false;
        }
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        spdlog::warn("[config] cannot replace {}", path);
        std::remove(tmp.c_str());
        return false;
    }
    spdlog::debug("[config] saved {}", path);
    return true;
}
