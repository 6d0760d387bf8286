#include "panel_layout/layout/panel_sorter.hpp"
#include "panel_layout/config/configuration.hpp"
#include "panel_layout/core/types.hpp"

#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using panel_layout::Region;
using panel_layout::layout::Column;
using panel_layout::layout::ColumnPartition;
using panel_layout::layout::SortOptions;
using panel_layout::layout::insert_spanning;
using panel_layout::layout::merge_columns;
using panel_layout::layout::partition_columns;

namespace {

std::vector<Region> scaled(const std::vector<Region>& regions, int factor) {
    std::vector<Region> out;
    for (const auto& r : regions) {
        out.push_back({r.x * factor, r.y * factor, r.width * factor, r.height * factor});
    }
    return out;
}

} // namespace

TEST_CASE("partition_sets_aside_full_width_panel") {
    std::vector<Region> regions{{0, 0, 100, 100}, {110, 0, 100, 100}, {0, 110, 210, 100}};

    ColumnPartition p = partition_columns(regions);

    REQUIRE(p.spanning == std::vector<size_t>{2});
    REQUIRE(p.columns.size() == 2);
    REQUIRE(p.columns[0].members == std::vector<size_t>{0});
    REQUIRE(p.columns[1].members == std::vector<size_t>{1});
    REQUIRE(p.columns[0].center_x == Catch::Approx(50.0f));
    REQUIRE(p.columns[1].center_x == Catch::Approx(160.0f));
    REQUIRE(p.typical_width == Catch::Approx(100.0f));
    REQUIRE(p.gap_tolerance == Catch::Approx(50.0f));
}

TEST_CASE("wide_panel_with_neighbours_stays_in_a_column") {
    std::vector<Region> regions{
        {0, 0, 280, 330},
        {290, 0, 120, 100}, {290, 110, 120, 100}, {290, 220, 120, 110},
        {0, 340, 410, 90}, // nothing beside it
    };

    ColumnPartition p = partition_columns(regions);

    REQUIRE(p.spanning == std::vector<size_t>{4});
    REQUIRE(p.columns.size() == 2);
    REQUIRE(p.columns[0].members == std::vector<size_t>{0});
    REQUIRE(p.columns[1].members == std::vector<size_t>{1, 2, 3});
}

TEST_CASE("partition_orders_column_members_top_to_bottom") {
    std::vector<Region> regions{
        {0, 220, 100, 100}, {110, 110, 100, 100}, {0, 0, 100, 100},
        {110, 0, 100, 100}, {0, 110, 100, 100},
    };

    ColumnPartition p = partition_columns(regions);

    REQUIRE(p.spanning.empty());
    REQUIRE(p.columns.size() == 2);
    REQUIRE(p.columns[0].members == std::vector<size_t>{2, 4, 0});
    REQUIRE(p.columns[1].members == std::vector<size_t>{3, 1});
}

TEST_CASE("gap_tolerance_scales_with_panel_size") {
    std::vector<Region> page{
        {0, 0, 100, 100}, {110, 0, 100, 100},
        {0, 110, 100, 100}, {110, 110, 100, 100},
    };

    ColumnPartition small = partition_columns(page);
    ColumnPartition large = partition_columns(scaled(page, 4));

    REQUIRE(large.gap_tolerance == Catch::Approx(4.0f * small.gap_tolerance));
    REQUIRE(small.columns.size() == 2);
    REQUIRE(large.columns.size() == 2);
    REQUIRE(large.columns[0].members == small.columns[0].members);
    REQUIRE(large.columns[1].members == small.columns[1].members);
}

TEST_CASE("close_centers_share_one_column") {
    std::vector<Region> regions{{0, 0, 120, 80}, {30, 90, 120, 80}, {10, 180, 120, 80}};

    ColumnPartition p = partition_columns(regions);

    // Center spread of 30 px stays under half the median width
    REQUIRE(p.columns.size() == 1);
    REQUIRE(p.columns[0].members == std::vector<size_t>{0, 1, 2});
}

TEST_CASE("narrow_gap_ratio_splits_more_columns") {
    std::vector<Region> regions{{0, 0, 120, 80}, {30, 90, 120, 80}, {10, 180, 120, 80}};
    SortOptions opts;
    opts.column_gap_ratio = 0.1f;

    ColumnPartition p = partition_columns(regions, opts);

    REQUIRE(p.gap_tolerance == Catch::Approx(12.0f));
    REQUIRE(p.columns.size() == 2);
    REQUIRE(p.columns[0].members == std::vector<size_t>{0, 2});
    REQUIRE(p.columns[1].members == std::vector<size_t>{1});
}

TEST_CASE("merge_interleaves_columns_by_row_band") {
    std::vector<Region> regions{
        {0, 0, 100, 100}, {0, 110, 100, 100},
        {110, 5, 100, 100}, {110, 115, 100, 100},
    };
    ColumnPartition p;
    p.columns.push_back(Column{{0, 1}, 50.0f});
    p.columns.push_back(Column{{2, 3}, 160.0f});

    REQUIRE(merge_columns(regions, p, false) == std::vector<size_t>{0, 2, 1, 3});
    REQUIRE(merge_columns(regions, p, true) == std::vector<size_t>{2, 0, 3, 1});
}

TEST_CASE("merge_of_single_column_keeps_column_order") {
    std::vector<Region> regions{{0, 0, 100, 100}, {0, 110, 100, 100}};
    ColumnPartition p;
    p.columns.push_back(Column{{1, 0}, 50.0f});

    REQUIRE(merge_columns(regions, p, false) == std::vector<size_t>{1, 0});
    REQUIRE(merge_columns(regions, p, true) == std::vector<size_t>{1, 0});
}

TEST_CASE("merge_row_overlap_ratio_controls_band_membership") {
    // Right panel overlaps the left one by 40 of 100 px
    std::vector<Region> regions{{0, 0, 100, 100}, {110, 60, 100, 100}};
    ColumnPartition p;
    p.columns.push_back(Column{{0}, 50.0f});
    p.columns.push_back(Column{{1}, 160.0f});

    SortOptions strict;
    strict.row_overlap_ratio = 0.5f;
    SortOptions loose;
    loose.row_overlap_ratio = 0.3f;

    // Separate bands: read top to bottom whatever the direction
    REQUIRE(merge_columns(regions, p, true, strict) == std::vector<size_t>{0, 1});
    // Same band: direction decides
    REQUIRE(merge_columns(regions, p, true, loose) == std::vector<size_t>{1, 0});
}

TEST_CASE("merge_of_empty_partition_is_empty") {
    std::vector<Region> regions;
    ColumnPartition p;

    REQUIRE(merge_columns(regions, p, false).empty());
}

TEST_CASE("insert_spanning_places_panels_by_vertical_center") {
    std::vector<Region> regions{
        {0, 0, 210, 50},      // 0: above everything
        {0, 60, 100, 100},    // 1
        {110, 60, 100, 100},  // 2
        {0, 170, 210, 60},    // 3: between rows
        {0, 240, 100, 100},   // 4
        {110, 240, 100, 100}, // 5
        {0, 350, 210, 40},    // 6: below everything
    };
    std::vector<size_t> merged{1, 2, 4, 5};

    auto out = insert_spanning(regions, merged, {6, 3, 0});

    REQUIRE(out == std::vector<size_t>{0, 1, 2, 3, 4, 5, 6});
}

TEST_CASE("insert_spanning_without_spanning_returns_merged") {
    std::vector<Region> regions{{0, 0, 10, 10}, {0, 20, 10, 10}};
    std::vector<size_t> merged{1, 0};

    REQUIRE(insert_spanning(regions, merged, {}) == merged);
}

TEST_CASE("insert_spanning_into_empty_merge_sorts_by_center") {
    std::vector<Region> regions{{0, 0, 200, 300}, {0, 10, 200, 50}};

    REQUIRE(insert_spanning(regions, {}, {0, 1}) == std::vector<size_t>{1, 0});
}

TEST_CASE("sort_options_follow_sorter_config") {
    panel_layout::config::SorterConfig cfg;
    cfg.spanning_page_ratio = 0.7f;
    cfg.spanning_width_factor = 2.0f;
    cfg.column_gap_ratio = 0.25f;
    cfg.row_overlap_ratio = 0.4f;

    SortOptions opts = panel_layout::layout::sort_options_from_config(cfg);

    REQUIRE(opts.spanning_page_ratio == Catch::Approx(0.7f));
    REQUIRE(opts.spanning_width_factor == Catch::Approx(2.0f));
    REQUIRE(opts.column_gap_ratio == Catch::Approx(0.25f));
    REQUIRE(opts.row_overlap_ratio == Catch::Approx(0.4f));
}
