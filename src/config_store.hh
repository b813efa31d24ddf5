#pragma once

#include <memory>
#include <string>

#include <toml.hpp>

#include "config.hh"
#include "events.hh"

// Owns the parsed configuration document and the current snapshot. Reorder
// commits produce a new snapshot and are written back to the file; every other
// key of the document is kept as parsed.
struct config_store_t {
    // an empty path keeps everything in memory
    config_store_t(std::string _path, toml::value _document);

    // a missing file starts from an empty document, a broken one throws config_error_t
    static config_store_t open(const std::string& path);

    std::shared_ptr<const config_t> snapshot() const {
        return current;
    }
    const toml::value& document() const {
        return doc;
    }
    const std::string& file() const {
        return path;
    }

    // returns the new snapshot; the in-memory order changes even if saving fails
    std::shared_ptr<const config_t> apply(const reorder_event_t& event);

    bool save() const;

private:
    std::string path;
    toml::value doc;
    std::shared_ptr<const config_t> current;
};
