#include "panel_layout/layout/panel_sorter.hpp"
#include "panel_layout/config/configuration.hpp"
#include "panel_layout/core/errors.hpp"
#include "panel_layout/core/utils.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <limits>
#include <tuple>

namespace panel_layout::layout {

namespace {

// Top-to-bottom order with the left edge as tie-break. Width and height
// only matter for coincident corners and keep the order independent of
// input order.
bool top_then_left(const Region& a, const Region& b) {
    return std::tie(a.y, a.x, a.width, a.height) < std::tie(b.y, b.x, b.width, b.height);
}

bool center_then_top(const Region& a, const Region& b) {
    const float ca = a.center_y();
    const float cb = b.center_y();
    if (ca != cb) return ca < cb;
    return top_then_left(a, b);
}

int vertical_overlap(const Region& a, const Region& b) {
    return std::min(a.bottom(), b.bottom()) - std::max(a.y, b.y);
}

// True when one region lies entirely to the left or right of the other
bool side_by_side(const Region& a, const Region& b) {
    return b.right() <= a.x || b.x >= a.right();
}

} // namespace

SortOptions sort_options_from_config(const config::SorterConfig& cfg) {
    SortOptions opts;
    opts.spanning_page_ratio = cfg.spanning_page_ratio;
    opts.spanning_width_factor = cfg.spanning_width_factor;
    opts.column_gap_ratio = cfg.column_gap_ratio;
    opts.row_overlap_ratio = cfg.row_overlap_ratio;
    return opts;
}

void validate_regions(const std::vector<Region>& regions) {
    for (size_t i = 0; i < regions.size(); ++i) {
        const Region& r = regions[i];
        if (r.width <= 0 || r.height <= 0) {
            throw InvalidRegionError("region " + std::to_string(i) + " " + region_to_string(r) +
                                     " has non-positive width or height");
        }
    }
}

ColumnPartition partition_columns(const std::vector<Region>& regions, const SortOptions& options) {
    ColumnPartition out;
    if (regions.empty()) return out;
    validate_regions(regions);

    int page_left = std::numeric_limits<int>::max();
    int page_right = std::numeric_limits<int>::min();
    std::vector<float> widths;
    widths.reserve(regions.size());
    for (const auto& r : regions) {
        page_left = std::min(page_left, r.x);
        page_right = std::max(page_right, r.right());
        widths.push_back(static_cast<float>(r.width));
    }
    const float page_width = static_cast<float>(page_right - page_left);
    out.typical_width = core::compute_median(widths);

    std::vector<bool> wide(regions.size(), false);
    for (size_t i = 0; i < regions.size(); ++i) {
        const float w = static_cast<float>(regions[i].width);
        wide[i] = w >= options.spanning_page_ratio * page_width &&
                  w >= options.spanning_width_factor * out.typical_width;
    }

    // A wide panel with narrower panels beside it still belongs to a column
    std::vector<size_t> remaining;
    for (size_t i = 0; i < regions.size(); ++i) {
        bool spanning = wide[i];
        for (size_t j = 0; spanning && j < regions.size(); ++j) {
            if (wide[j]) continue;
            if (vertical_overlap(regions[i], regions[j]) > 0 && side_by_side(regions[i], regions[j])) {
                spanning = false;
            }
        }
        if (spanning) {
            out.spanning.push_back(i);
        } else {
            remaining.push_back(i);
        }
    }
    if (remaining.empty()) return out;

    std::stable_sort(remaining.begin(), remaining.end(), [&](size_t a, size_t b) {
        return regions[a].center_x() < regions[b].center_x();
    });

    std::vector<float> remaining_widths;
    remaining_widths.reserve(remaining.size());
    for (size_t idx : remaining) {
        remaining_widths.push_back(static_cast<float>(regions[idx].width));
    }
    out.gap_tolerance = options.column_gap_ratio * core::compute_median(remaining_widths);

    Column current;
    float prev_cx = regions[remaining.front()].center_x();
    for (size_t idx : remaining) {
        const float cx = regions[idx].center_x();
        if (!current.members.empty() && cx - prev_cx > out.gap_tolerance) {
            out.columns.push_back(std::move(current));
            current = Column{};
        }
        current.members.push_back(idx);
        prev_cx = cx;
    }
    out.columns.push_back(std::move(current));

    for (auto& col : out.columns) {
        float sum = 0.0f;
        for (size_t idx : col.members) sum += regions[idx].center_x();
        col.center_x = sum / static_cast<float>(col.members.size());

        std::stable_sort(col.members.begin(), col.members.end(), [&](size_t a, size_t b) {
            return top_then_left(regions[a], regions[b]);
        });
    }

    return out;
}

std::vector<size_t> merge_columns(const std::vector<Region>& regions,
                                  const ColumnPartition& partition,
                                  bool rtl_order,
                                  const SortOptions& options) {
    const auto& columns = partition.columns;
    if (columns.empty()) return {};
    if (columns.size() == 1) return columns.front().members;

    // Reading rank of each column: left to right, or right to left
    const size_t n_cols = columns.size();
    std::vector<size_t> rank_of(regions.size(), 0);
    std::vector<size_t> pending;
    for (size_t c = 0; c < n_cols; ++c) {
        const size_t rank = rtl_order ? (n_cols - 1 - c) : c;
        for (size_t idx : columns[c].members) {
            rank_of[idx] = rank;
            pending.push_back(idx);
        }
    }

    std::stable_sort(pending.begin(), pending.end(), [&](size_t a, size_t b) {
        return top_then_left(regions[a], regions[b]);
    });

    // Row bands: a panel joins the open band when it overlaps the band's
    // vertical extent by at least row_overlap_ratio of the shorter extent.
    std::vector<std::vector<size_t>> bands;
    int band_top = 0;
    int band_bottom = 0;
    for (size_t idx : pending) {
        const Region& r = regions[idx];
        bool joins = false;
        if (!bands.empty()) {
            const int overlap = std::min(r.bottom(), band_bottom) - std::max(r.y, band_top);
            const int shorter = std::min(r.height, band_bottom - band_top);
            joins = overlap > 0 &&
                    static_cast<float>(overlap) >= options.row_overlap_ratio * static_cast<float>(shorter);
        }

        if (joins) {
            bands.back().push_back(idx);
            band_top = std::min(band_top, r.y);
            band_bottom = std::max(band_bottom, r.bottom());
        } else {
            bands.push_back({idx});
            band_top = r.y;
            band_bottom = r.bottom();
        }
    }

    std::vector<size_t> merged;
    merged.reserve(pending.size());
    for (auto& band : bands) {
        std::stable_sort(band.begin(), band.end(), [&](size_t a, size_t b) {
            return rank_of[a] < rank_of[b];
        });
        merged.insert(merged.end(), band.begin(), band.end());
    }
    return merged;
}

std::vector<size_t> insert_spanning(const std::vector<Region>& regions,
                                    const std::vector<size_t>& merged,
                                    const std::vector<size_t>& spanning) {
    if (spanning.empty()) return merged;

    std::vector<size_t> sorted_spanning = spanning;
    std::stable_sort(sorted_spanning.begin(), sorted_spanning.end(), [&](size_t a, size_t b) {
        return center_then_top(regions[a], regions[b]);
    });

    // Slot k means "before merged[k]"; slot merged.size() is the end.
    std::vector<size_t> slots;
    slots.reserve(sorted_spanning.size());
    for (size_t s : sorted_spanning) {
        const float cy = regions[s].center_y();
        size_t slot = 0;
        for (size_t i = 0; i < merged.size(); ++i) {
            if (regions[merged[i]].center_y() < cy) slot = i + 1;
        }
        slots.push_back(slot);
    }

    std::vector<size_t> out;
    out.reserve(merged.size() + sorted_spanning.size());
    size_t k = 0;
    for (size_t i = 0; i <= merged.size(); ++i) {
        while (k < sorted_spanning.size() && slots[k] == i) {
            out.push_back(sorted_spanning[k]);
            ++k;
        }
        if (i < merged.size()) out.push_back(merged[i]);
    }
    return out;
}

std::vector<size_t> reading_order(const std::vector<Region>& regions,
                                  bool rtl_order,
                                  const SortOptions& options) {
    if (regions.empty()) return {};

    ColumnPartition partition = partition_columns(regions, options);
    std::vector<size_t> merged = merge_columns(regions, partition, rtl_order, options);
    return insert_spanning(regions, merged, partition.spanning);
}

std::vector<Region> sort_panels_by_column_then_row(const std::vector<Region>& regions,
                                                   bool rtl_order,
                                                   const SortOptions& options) {
    std::vector<Region> out;
    out.reserve(regions.size());
    for (size_t idx : reading_order(regions, rtl_order, options)) {
        out.push_back(regions[idx]);
    }
    return out;
}

Region region_from_contour(const Contour& contour) {
    if (contour.empty()) return Region{0, 0, 0, 0};
    cv::Rect r = cv::boundingRect(contour);
    return Region{r.x, r.y, r.width, r.height};
}

std::vector<Contour> sort_panels_by_column_then_row(const std::vector<Contour>& contours,
                                                    bool rtl_order,
                                                    const SortOptions& options) {
    std::vector<Region> regions;
    regions.reserve(contours.size());
    for (const auto& c : contours) {
        regions.push_back(region_from_contour(c));
    }

    std::vector<Contour> out;
    out.reserve(contours.size());
    for (size_t idx : reading_order(regions, rtl_order, options)) {
        out.push_back(contours[idx]);
    }
    return out;
}

} // namespace panel_layout::layout
