#pragma once

#include <optional>
#include <string>

#include "area.hh"
#include "frame.hh"

// First rectangle of the most recent layout pass containing p. Sections never
// overlap, so the scan order does not matter.
std::optional<std::string> hit_test(const bounds_map_t& bounds, point_t p);
