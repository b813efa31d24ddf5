#include "registry.hh"

#include <exception>

#include "config.hh"
#include "log.hh"

void module_registry_t::add(std::unique_ptr<module_t> module) {
    if (!module) {
        return;
    }
    std::string id = module->id;
    auto it = modules.find(id);
    if (it != modules.end()) {
        spdlog::info("[registry] replacing module '{}'", id);
        it->second = std::move(module);
    } else {
        modules.emplace(id, std::move(module));
    }
}

bool module_registry_t::remove(const std::string& id) {
    return modules.erase(id) > 0;
}

module_t* module_registry_t::get(const std::string& id) {
    auto it = modules.find(id);
    return it == modules.end() ? nullptr : it->second.get();
}

const module_t* module_registry_t::get(const std::string& id) const {
    auto it = modules.find(id);
    return it == modules.end() ? nullptr : it->second.get();
}

std::vector<module_t*> module_registry_t::section(const config_t& config, section_t s) {
    std::vector<module_t*> out;
    for (const auto& id: config.section_order(s)) {
        if (module_t* m = get(id)) {
            out.push_back(m);
        }
    }
    return out;
}

std::set<std::string> module_registry_t::update_all(const config_t& config) {
    std::set<std::string> failed;
    for (auto& [id, module]: modules) {
        try {
            module->update(config);
        } catch (const std::exception& e) {
            spdlog::warn("[registry] update of '{}' failed: {}", id, e.what());
            failed.insert(id);
        }
    }
    return failed;
}

std::vector<std::string> module_registry_t::ids() const {
    std::vector<std::string> out;
    out.reserve(modules.size());
    for (const auto& entry: modules) {
        out.push_back(entry.first);
    }
    return out;
}
