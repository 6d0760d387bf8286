#include "panel_layout/config/configuration.hpp"
#include "panel_layout/core/errors.hpp"

#include <fstream>

namespace panel_layout::config {

static bool in_unit_interval(float v) {
    return v > 0.0f && v <= 1.0f;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }

    try {
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid value in " + path.string() + ": " + e.what());
    }
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["sorter"]) {
        auto s = node["sorter"];
        if (s["rtl_order"]) cfg.sorter.rtl_order = s["rtl_order"].as<bool>();
        if (s["spanning_page_ratio"]) cfg.sorter.spanning_page_ratio = s["spanning_page_ratio"].as<float>();
        if (s["spanning_width_factor"]) cfg.sorter.spanning_width_factor = s["spanning_width_factor"].as<float>();
        if (s["column_gap_ratio"]) cfg.sorter.column_gap_ratio = s["column_gap_ratio"].as<float>();
        if (s["row_overlap_ratio"]) cfg.sorter.row_overlap_ratio = s["row_overlap_ratio"].as<float>();
    }

    if (node["border"]) {
        auto b = node["border"];
        if (b["search_zone_ratio"]) cfg.border.search_zone_ratio = b["search_zone_ratio"].as<float>();
        if (b["internal_padding"]) cfg.border.internal_padding = b["internal_padding"].as<int>();
        if (b["safety_margin"]) cfg.border.safety_margin = b["safety_margin"].as<int>();
        if (b["binary_threshold"]) cfg.border.binary_threshold = b["binary_threshold"].as<int>();
        if (b["ring_erosion_iterations"]) {
            cfg.border.ring_erosion_iterations = b["ring_erosion_iterations"].as<int>();
        }
        if (b["min_input_size"]) cfg.border.min_input_size = b["min_input_size"].as<int>();
        if (b["min_output_size"]) cfg.border.min_output_size = b["min_output_size"].as<int>();
        if (b["crop"]) cfg.border.crop = b["crop"].as<bool>();
    }

    if (node["output"]) {
        auto o = node["output"];
        if (o["events"]) cfg.output.events = o["events"].as<bool>();
        if (o["json_indent"]) cfg.output.json_indent = o["json_indent"].as<int>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["sorter"]["rtl_order"] = sorter.rtl_order;
    node["sorter"]["spanning_page_ratio"] = sorter.spanning_page_ratio;
    node["sorter"]["spanning_width_factor"] = sorter.spanning_width_factor;
    node["sorter"]["column_gap_ratio"] = sorter.column_gap_ratio;
    node["sorter"]["row_overlap_ratio"] = sorter.row_overlap_ratio;

    node["border"]["search_zone_ratio"] = border.search_zone_ratio;
    node["border"]["internal_padding"] = border.internal_padding;
    node["border"]["safety_margin"] = border.safety_margin;
    node["border"]["binary_threshold"] = border.binary_threshold;
    node["border"]["ring_erosion_iterations"] = border.ring_erosion_iterations;
    node["border"]["min_input_size"] = border.min_input_size;
    node["border"]["min_output_size"] = border.min_output_size;
    node["border"]["crop"] = border.crop;

    node["output"]["events"] = output.events;
    node["output"]["json_indent"] = output.json_indent;

    return node;
}

void Config::validate() const {
    if (!in_unit_interval(sorter.spanning_page_ratio)) {
        throw ValidationError("sorter.spanning_page_ratio must be in (0,1]");
    }
    if (sorter.spanning_width_factor < 1.0f) {
        throw ValidationError("sorter.spanning_width_factor must be >= 1");
    }
    if (!in_unit_interval(sorter.column_gap_ratio)) {
        throw ValidationError("sorter.column_gap_ratio must be in (0,1]");
    }
    if (!in_unit_interval(sorter.row_overlap_ratio)) {
        throw ValidationError("sorter.row_overlap_ratio must be in (0,1]");
    }

    if (border.search_zone_ratio <= 0.0f || border.search_zone_ratio > 0.5f) {
        throw ValidationError("border.search_zone_ratio must be in (0,0.5]");
    }
    if (border.internal_padding < 0) {
        throw ValidationError("border.internal_padding must be >= 0");
    }
    if (border.safety_margin < 0) {
        throw ValidationError("border.safety_margin must be >= 0");
    }
    if (border.binary_threshold < 0 || border.binary_threshold > 255) {
        throw ValidationError("border.binary_threshold must be in [0,255]");
    }
    if (border.ring_erosion_iterations < 1) {
        throw ValidationError("border.ring_erosion_iterations must be >= 1");
    }
    if (border.min_input_size < 1 || border.min_output_size < 1) {
        throw ValidationError("border.min_input_size and border.min_output_size must be >= 1");
    }

    if (output.json_indent < -1 || output.json_indent > 8) {
        throw ValidationError("output.json_indent must be in [-1,8]");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "sorter": {
      "type": "object",
      "properties": {
        "rtl_order": {"type": "boolean"},
        "spanning_page_ratio": {"type": "number", "exclusiveMinimum": 0, "maximum": 1},
        "spanning_width_factor": {"type": "number", "minimum": 1},
        "column_gap_ratio": {"type": "number", "exclusiveMinimum": 0, "maximum": 1},
        "row_overlap_ratio": {"type": "number", "exclusiveMinimum": 0, "maximum": 1}
      }
    },
    "border": {
      "type": "object",
      "properties": {
        "search_zone_ratio": {"type": "number", "exclusiveMinimum": 0, "maximum": 0.5},
        "internal_padding": {"type": "integer", "minimum": 0},
        "safety_margin": {"type": "integer", "minimum": 0},
        "binary_threshold": {"type": "integer", "minimum": 0, "maximum": 255},
        "ring_erosion_iterations": {"type": "integer", "minimum": 1},
        "min_input_size": {"type": "integer", "minimum": 1},
        "min_output_size": {"type": "integer", "minimum": 1},
        "crop": {"type": "boolean"}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "events": {"type": "boolean"},
        "json_indent": {"type": "integer", "minimum": -1, "maximum": 8}
      }
    }
  }
})";
}

} // namespace panel_layout::config
