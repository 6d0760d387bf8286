#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace panel_layout::config {

namespace fs = std::filesystem;

struct SorterConfig {
  bool rtl_order = false;
  float spanning_page_ratio = 0.6f;   // fraction of page content width
  float spanning_width_factor = 1.5f; // multiple of the median panel width
  float column_gap_ratio = 0.5f;      // gap tolerance = ratio * median width
  float row_overlap_ratio = 0.5f;     // overlap needed to share a row band
};

struct BorderConfig {
  float search_zone_ratio = 0.25f;
  int internal_padding = 5;
  int safety_margin = 15;
  int binary_threshold = 240;
  int ring_erosion_iterations = 5;
  int min_input_size = 30;
  int min_output_size = 10;
  bool crop = true; // false: keep size, paint the border band white
};

struct OutputConfig {
  bool events = true;
  int json_indent = 2;
};

struct Config {
  SorterConfig sorter;
  BorderConfig border;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace panel_layout::config
