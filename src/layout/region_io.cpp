#include "panel_layout/layout/region_io.hpp"
#include "panel_layout/core/errors.hpp"
#include "panel_layout/layout/panel_sorter.hpp"

#include <string>

namespace panel_layout::layout {

using json = nlohmann::json;

namespace {

int as_int(const json& value, const std::string& what) {
    if (!value.is_number()) {
        throw ValidationError(what + " must be a number, got " + value.dump());
    }
    return value.get<int>();
}

int require_int(const json& item, const char* key) {
    if (!item.contains(key)) {
        throw ValidationError(std::string("region entry is missing field '") + key + "': " +
                              item.dump());
    }
    return as_int(item[key], std::string("field '") + key + "'");
}

Region region_from_tuple(const json& item) {
    if (item.size() != 4) {
        throw ValidationError("region tuple must be [x, y, w, h]: " + item.dump());
    }
    return Region{as_int(item[0], "x"), as_int(item[1], "y"),
                  as_int(item[2], "w"), as_int(item[3], "h")};
}

Region region_from_points(const json& points) {
    if (!points.is_array()) {
        throw ValidationError("contour must be an array of [x, y] points");
    }
    Contour contour;
    for (const auto& pt : points) {
        if (!pt.is_array() || pt.size() != 2) {
            throw ValidationError("contour points must be [x, y]: " + pt.dump());
        }
        contour.emplace_back(as_int(pt[0], "contour x"), as_int(pt[1], "contour y"));
    }
    return region_from_contour(contour);
}

} // namespace

std::vector<Region> regions_from_json(const json& doc) {
    const json& items = doc.is_object() && doc.contains("regions") ? doc["regions"] : doc;
    if (!items.is_array()) {
        throw ValidationError("regions must be a JSON array");
    }

    std::vector<Region> regions;
    regions.reserve(items.size());
    for (const auto& item : items) {
        if (item.is_array()) {
            regions.push_back(region_from_tuple(item));
        } else if (item.is_object() && item.contains("contour")) {
            regions.push_back(region_from_points(item["contour"]));
        } else if (item.is_object()) {
            regions.push_back(Region{require_int(item, "x"), require_int(item, "y"),
                                     require_int(item, "w"), require_int(item, "h")});
        } else {
            throw ValidationError("unsupported region entry: " + item.dump());
        }
    }
    return regions;
}

json reading_order_to_json(const std::vector<Region>& regions, const std::vector<size_t>& order) {
    json result = json::array();
    for (size_t k = 0; k < order.size(); ++k) {
        const Region& r = regions.at(order[k]);
        result.push_back({{"order", k + 1}, {"index", order[k]},
                          {"x", r.x}, {"y", r.y}, {"w", r.width}, {"h", r.height}});
    }
    return result;
}

} // namespace panel_layout::layout
