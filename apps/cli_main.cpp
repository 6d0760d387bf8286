#include "panel_layout/border/border_cleaner.hpp"
#include "panel_layout/config/configuration.hpp"
#include "panel_layout/core/errors.hpp"
#include "panel_layout/core/events.hpp"
#include "panel_layout/core/utils.hpp"
#include "panel_layout/layout/panel_sorter.hpp"
#include "panel_layout/layout/region_io.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

using namespace panel_layout;

// Throws ConfigError or ValidationError
static config::Config load_config_or_default(const std::string& path) {
    config::Config cfg = path.empty() ? config::Config{} : config::Config::load(path);
    cfg.validate();
    return cfg;
}

static int cmd_sort(const std::string& regions_path, const std::string& config_path,
                    const std::string& output_path, std::optional<bool> rtl_override) {
    const std::string run_id = core::get_run_id();
    config::Config cfg;
    try {
        cfg = load_config_or_default(config_path);
    } catch (const PanelLayoutError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    core::EventEmitter emitter(cfg.output.events);
    const bool rtl_order = rtl_override.value_or(cfg.sorter.rtl_order);

    try {
        emitter.run_start(run_id, Command::SORT,
                          {{"input", regions_path},
                           {"input_sha256", core::sha256_file(regions_path)}},
                          std::cerr);

        json doc;
        try {
            doc = json::parse(core::read_text(regions_path));
        } catch (const json::parse_error& e) {
            throw ValidationError("cannot parse " + regions_path + ": " + e.what());
        }
        const std::vector<Region> regions = layout::regions_from_json(doc);

        const layout::SortOptions opts = layout::sort_options_from_config(cfg.sorter);
        const layout::ColumnPartition partition = layout::partition_columns(regions, opts);
        const std::vector<size_t> order = layout::reading_order(regions, rtl_order, opts);

        emitter.panels_sorted(run_id, static_cast<int>(regions.size()),
                              static_cast<int>(partition.columns.size()),
                              static_cast<int>(partition.spanning.size()),
                              partition.gap_tolerance, rtl_order, std::cerr);

        const std::string text =
            layout::reading_order_to_json(regions, order).dump(cfg.output.json_indent);
        if (output_path.empty()) {
            std::cout << text << std::endl;
        } else {
            core::write_text(output_path, text + "\n");
        }

        emitter.run_end(run_id, true, "ok", std::cerr);
        return 0;
    } catch (const std::exception& e) {
        emitter.error(run_id, e.what(), std::cerr);
        emitter.run_end(run_id, false, "error", std::cerr);
        return 1;
    }
}

static int cmd_clean_border(const std::string& input_path, const std::string& output_path,
                            const std::string& config_path,
                            std::optional<float> search_zone,
                            std::optional<int> padding, bool erase) {
    const std::string run_id = core::get_run_id();
    config::Config cfg;
    try {
        cfg = load_config_or_default(config_path);
    } catch (const PanelLayoutError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    core::EventEmitter emitter(cfg.output.events);
    border::BorderOptions opts = border::border_options_from_config(cfg.border);
    if (search_zone) opts.search_zone_ratio = *search_zone;
    if (padding) opts.internal_padding = *padding;
    if (erase) opts.crop = false;

    try {
        emitter.run_start(run_id, Command::CLEAN_BORDER,
                          {{"input", input_path},
                           {"input_sha256", core::sha256_file(input_path)},
                           {"output", output_path}},
                          std::cerr);

        cv::Mat image = cv::imread(input_path, cv::IMREAD_UNCHANGED);
        if (image.empty()) {
            throw ImageIOError("cannot decode " + input_path);
        }

        const std::optional<cv::Rect> inner = border::locate_border(image, opts);
        if (inner) {
            emitter.border_located(run_id, inner->x, inner->y, inner->width, inner->height,
                                   std::cerr);
        } else {
            emitter.warning(run_id, "no closed border found, image copied unchanged", std::cerr);
        }

        const cv::Mat cleaned = inner ? border::remove_border_at(image, *inner, opts.crop)
                                      : image;
        if (!cv::imwrite(output_path, cleaned)) {
            throw ImageIOError("cannot encode " + output_path);
        }

        if (cfg.output.events) {
            core::emit_event("image_written", run_id,
                             {{"path", output_path},
                              {"width", cleaned.cols},
                              {"height", cleaned.rows},
                              {"changed", inner.has_value()}},
                             std::cerr);
        }
        emitter.run_end(run_id, true, "ok", std::cerr);
        return 0;
    } catch (const std::exception& e) {
        emitter.error(run_id, e.what(), std::cerr);
        emitter.run_end(run_id, false, "error", std::cerr);
        return 1;
    }
}

static int cmd_default_config(const std::string& output_path) {
    config::Config cfg;
    try {
        if (output_path.empty()) {
            std::cout << cfg.to_yaml() << std::endl;
        } else {
            cfg.save(output_path);
        }
    } catch (const PanelLayoutError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    CLI::App app{"Panel layout tools: reading order and border removal"};
    app.require_subcommand(1);

    std::string regions_path, config_path, output_path;
    std::string input_path;
    bool rtl_flag = false;
    bool ltr_flag = false;
    bool erase = false;
    float search_zone = 0.25f;
    int padding = 5;

    auto sort_cmd = app.add_subcommand("sort", "Order panel regions for reading");
    sort_cmd->add_option("--regions", regions_path, "JSON file with panel regions")
        ->required()
        ->check(CLI::ExistingFile);
    auto rtl_opt = sort_cmd->add_flag("--rtl", rtl_flag, "Read columns right to left");
    sort_cmd->add_flag("--ltr", ltr_flag, "Read columns left to right, overriding the config")
        ->excludes(rtl_opt);
    sort_cmd->add_option("--config", config_path, "Path to config.yaml")
        ->check(CLI::ExistingFile);
    sort_cmd->add_option("--output", output_path, "Write the ordering here instead of stdout");

    auto clean_cmd = app.add_subcommand("clean-border", "Remove the drawn border from a panel image");
    clean_cmd->add_option("--input", input_path, "Panel image")
        ->required()
        ->check(CLI::ExistingFile);
    clean_cmd->add_option("--output", output_path, "Output image")->required();
    clean_cmd->add_option("--config", config_path, "Path to config.yaml")
        ->check(CLI::ExistingFile);
    auto zone_opt = clean_cmd->add_option("--search-zone", search_zone,
                          "Fraction of the panel scanned for the border (default from config)")
        ->check(CLI::Range(0.001f, 0.5f));
    auto padding_opt = clean_cmd->add_option("--padding", padding,
                          "Pixels cleared inside the border (default from config)")
        ->check(CLI::NonNegativeNumber);
    clean_cmd->add_flag("--erase", erase, "Keep the image size and paint the border white");

    auto schema_cmd = app.add_subcommand("get-schema", "Print the config JSON schema");

    auto default_cmd = app.add_subcommand("default-config", "Print or write the default config");
    default_cmd->add_option("--output", output_path, "Write the YAML here instead of stdout");

    CLI11_PARSE(app, argc, argv);

    if (sort_cmd->parsed()) {
        std::optional<bool> rtl_override;
        if (rtl_flag) rtl_override = true;
        if (ltr_flag) rtl_override = false;
        return cmd_sort(regions_path, config_path, output_path, rtl_override);
    }
    if (clean_cmd->parsed()) {
        std::optional<float> zone_override;
        std::optional<int> padding_override;
        if (zone_opt->count() > 0) zone_override = search_zone;
        if (padding_opt->count() > 0) padding_override = padding;
        return cmd_clean_border(input_path, output_path, config_path, zone_override,
                                padding_override, erase);
    }
    if (schema_cmd->parsed()) {
        std::cout << config::get_schema_json() << std::endl;
        return 0;
    }
    if (default_cmd->parsed()) {
        return cmd_default_config(output_path);
    }

    std::cerr << app.help() << std::endl;
    return 1;
}
