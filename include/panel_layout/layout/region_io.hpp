#pragma once

#include "panel_layout/core/types.hpp"

#include <nlohmann/json.hpp>
#include <vector>

namespace panel_layout::layout {

// Accepts a JSON array (or {"regions": [...]}) whose entries are
// [x, y, w, h], {"x", "y", "w", "h"} or {"contour": [[x, y], ...]}.
// Throws ValidationError on any malformed entry.
std::vector<Region> regions_from_json(const nlohmann::json& doc);

// [{"order", "index", "x", "y", "w", "h"}, ...] with order starting at 1
nlohmann::json reading_order_to_json(const std::vector<Region>& regions,
                                     const std::vector<size_t>& order);

} // namespace panel_layout::layout
