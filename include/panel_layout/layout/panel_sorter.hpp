#pragma once

#include "panel_layout/core/types.hpp"
#include "panel_layout/vision/vision_backend.hpp"

#include <cstddef>
#include <vector>

namespace panel_layout::config {
struct SorterConfig;
}

namespace panel_layout::layout {

using vision::Contour;

struct SortOptions {
    float spanning_page_ratio = 0.6f;
    float spanning_width_factor = 1.5f;
    float column_gap_ratio = 0.5f;
    float row_overlap_ratio = 0.5f;
};

SortOptions sort_options_from_config(const config::SorterConfig& cfg);

// Regions sharing one horizontal band, ordered top to bottom
struct Column {
    std::vector<size_t> members; // indices into the input regions
    float center_x = 0.0f;       // mean horizontal center
};

struct ColumnPartition {
    std::vector<Column> columns;   // left to right
    std::vector<size_t> spanning;  // set aside for late insertion
    float typical_width = 0.0f;    // median width of all regions
    float gap_tolerance = 0.0f;    // horizontal center gap that splits columns
};

// Throws InvalidRegionError for a region with non-positive width or height.
void validate_regions(const std::vector<Region>& regions);

// Pass 1: set aside spanning panels, split the rest into columns by
// horizontal center gaps and order each column top to bottom.
ColumnPartition partition_columns(const std::vector<Region>& regions,
                                  const SortOptions& options = {});

// Pass 2: interleave the columns row band by row band. Spanning panels
// are not part of the result.
std::vector<size_t> merge_columns(const std::vector<Region>& regions,
                                  const ColumnPartition& partition,
                                  bool rtl_order,
                                  const SortOptions& options = {});

// Places each spanning panel after the last merged panel whose vertical
// center lies above its own.
std::vector<size_t> insert_spanning(const std::vector<Region>& regions,
                                    const std::vector<size_t>& merged,
                                    const std::vector<size_t>& spanning);

// Reading order as a permutation of input indices.
std::vector<size_t> reading_order(const std::vector<Region>& regions,
                                  bool rtl_order = false,
                                  const SortOptions& options = {});

std::vector<Region> sort_panels_by_column_then_row(const std::vector<Region>& regions,
                                                   bool rtl_order = false,
                                                   const SortOptions& options = {});

std::vector<Contour> sort_panels_by_column_then_row(const std::vector<Contour>& contours,
                                                    bool rtl_order = false,
                                                    const SortOptions& options = {});

Region region_from_contour(const Contour& contour);

} // namespace panel_layout::layout
