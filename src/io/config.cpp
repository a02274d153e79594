#include "gvpreview/config/configuration.hpp"
#include "gvpreview/core/errors.hpp"
#include "gvpreview/io/image_io.hpp"
#include "gvpreview/layout/grid_mapper.hpp"

#include <fstream>

namespace gvpreview::config {

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
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["input"]) {
            auto i = node["input"];
            if (i["path"]) cfg.input.path = i["path"].as<std::string>();
            if (i["format"]) cfg.input.format = i["format"].as<std::string>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["path"]) cfg.output.path = o["path"].as<std::string>();
        }

        if (node["layout"]) {
            auto l = node["layout"];
            if (l["dims"]) cfg.layout.dims = l["dims"].as<std::string>();
            if (l["resize"]) cfg.layout.resize = l["resize"].as<std::string>();
            if (l["order"]) cfg.layout.order = l["order"].as<std::string>();
            if (l["strict_order"]) cfg.layout.strict_order = l["strict_order"].as<bool>();
        }

        if (node["logging"]) {
            auto g = node["logging"];
            if (g["verbose"]) cfg.logging.verbose = g["verbose"].as<bool>();
            if (g["events_file"]) cfg.logging.events_file = g["events_file"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["input"]["path"] = input.path;
    node["input"]["format"] = input.format;

    node["output"]["path"] = output.path;

    node["layout"]["dims"] = layout.dims;
    node["layout"]["resize"] = layout.resize;
    node["layout"]["order"] = layout.order;
    node["layout"]["strict_order"] = layout.strict_order;

    node["logging"]["verbose"] = logging.verbose;
    node["logging"]["events_file"] = logging.events_file;

    return node;
}

void Config::save(const fs::path& path) const {
    std::ofstream out(path);
    if (!out) {
        throw IOError("Cannot create file: " + path.string());
    }
    YAML::Emitter emitter;
    emitter << to_yaml();
    out << emitter.c_str() << "\n";
}

void Config::validate() const {
    if (input.path.empty()) {
        throw ValidationError("input.path must be set");
    }
    if (output.path.empty()) {
        throw ValidationError("output.path must be set");
    }
    if (!io::has_image_writer(output.path)) {
        throw ValidationError("output.path '" + output.path +
                              "' has no extension with a known image encoder");
    }

    if (layout.dims.empty()) {
        throw ValidationError("layout.dims must be set (ROWSxCOLS)");
    }
    const GridDims grid = grid_dims();
    if (grid.rows < 1 || grid.cols < 1) {
        throw ValidationError("layout.dims must be at least 1x1");
    }
    const CellSize cell = cell_size();
    if (cell.height < 1 || cell.width < 1) {
        throw ValidationError("layout.resize must be at least 1x1");
    }

    const FillOrder order = fill_order();
    if (layout.strict_order && (order == FillOrder::ROWS_DOWN || order == FillOrder::ROWS_UP)) {
        throw ValidationError("layout.order '" + layout.order + "' is not implemented");
    }

    if (!string_to_image_format(input.format)) {
        throw ValidationError("input.format '" + input.format +
                              "' must be one of jpg, jpeg, tif, tiff");
    }
}

GridDims Config::grid_dims() const {
    return gvpreview::layout::parse_grid_dims(layout.dims);
}

CellSize Config::cell_size() const {
    return gvpreview::layout::parse_cell_size(layout.resize);
}

FillOrder Config::fill_order() const {
    return gvpreview::layout::parse_fill_order(layout.order);
}

ImageFormat Config::input_format() const {
    auto format = string_to_image_format(input.format);
    if (!format) {
        throw ConfigError("input.format '" + input.format +
                          "' must be one of jpg, jpeg, tif, tiff");
    }
    return *format;
}

} // namespace gvpreview::config
