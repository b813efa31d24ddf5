#pragma once

#include <map>
#include <set>
#include <memory>
#include <string>
#include <vector>

#include "module.hh"

struct config_t;

// Owns every module, keyed by id. Section order lists live in the config
// snapshot; section() resolves them against the registry.
struct module_registry_t {
    // last writer wins on id collision
    void add(std::unique_ptr<module_t> module);
    bool remove(const std::string& id);

    module_t* get(const std::string& id);
    const module_t* get(const std::string& id) const;

    // module-specific escape hatch, not for the layout or hit-test path
    template <typename T>
    T* get_as(const std::string& id) {
        return dynamic_cast<T*>(get(id));
    }

    // ids in the section's configured order that exist in the registry
    std::vector<module_t*> section(const config_t& config, section_t s);

    // calls every module's update hook and returns the ids whose update threw
    std::set<std::string> update_all(const config_t& config);

    size_t size() const {
        return modules.size();
    }
    std::vector<std::string> ids() const;

private:
    std::map<std::string, std::unique_ptr<module_t>> modules;
};
