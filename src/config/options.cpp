#include "config/options.hpp"

#include "cli/cli_parser.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <limits>

namespace gifdraw {

namespace {

void require_at_least(const char* name, int v, int lo) {
    if (v < lo) {
        throw ConfigError(std::string("options: ") + name + " must be >= " + std::to_string(lo) +
                          " (got " + std::to_string(v) + ")");
    }
}

std::optional<int> max_frames_from(int v) {
    if (v < 0) throw ConfigError("options: max_frames must be >= 0 (got " + std::to_string(v) + ")");
    if (v == 0) return std::nullopt; // 0 = all frames
    return v;
}

int checked_int(const std::string& path, const char* key, int64_t v) {
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw ConfigError("config: " + path + ": '" + key + "' is out of range (" + std::to_string(v) + ")");
    }
    return static_cast<int>(v);
}

} // namespace

void validate(const ConversionOptions& opts) {
    require_at_least("width", opts.canvas_width, 1);
    require_at_least("height", opts.canvas_height, 1);
    require_at_least("brush_thickness", opts.brush_thickness, 1);
    require_at_least("quality_factor", opts.quality_factor, 1);
    if (opts.transparency_threshold < 0 || opts.transparency_threshold > 255) {
        throw ConfigError("options: transparency_threshold must be in 0..255 (got " +
                          std::to_string(opts.transparency_threshold) + ")");
    }
    if (opts.max_frames) require_at_least("max_frames", *opts.max_frames, 1);
}

ConversionOptions load_options_file(const std::string& path, ConversionOptions base) {
    std::ifstream ifs(path);
    if (!ifs.good()) throw ConfigError("config: cannot open file: " + path);

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(ifs);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("config: " + path + ": " + e.what());
    }
    if (!j.is_object()) throw ConfigError("config: " + path + ": top level must be an object");

    auto read_int = [&](const char* key, int& dst) {
        auto it = j.find(key);
        if (it == j.end()) return;
        if (!it->is_number_integer()) {
            throw ConfigError("config: " + path + ": '" + key + "' must be an integer");
        }
        dst = checked_int(path, key, it->get<int64_t>());
    };

    read_int("width", base.canvas_width);
    read_int("height", base.canvas_height);
    read_int("brush_thickness", base.brush_thickness);
    read_int("quality_factor", base.quality_factor);
    read_int("transparency_threshold", base.transparency_threshold);

    auto mf = j.find("max_frames");
    if (mf != j.end()) {
        if (mf->is_null()) {
            base.max_frames.reset();
        } else if (mf->is_number_integer()) {
            base.max_frames = max_frames_from(checked_int(path, "max_frames", mf->get<int64_t>()));
        } else {
            throw ConfigError("config: " + path + ": 'max_frames' must be an integer or null");
        }
    }
    return base;
}

void apply_cli_overrides(const CliParser& cli, ConversionOptions& opts) {
    if (auto v = cli.get_int("width")) opts.canvas_width = *v;
    if (auto v = cli.get_int("height")) opts.canvas_height = *v;
    if (auto v = cli.get_int("brush")) opts.brush_thickness = *v;
    if (auto v = cli.get_int("quality")) opts.quality_factor = *v;
    if (auto v = cli.get_int("threshold")) opts.transparency_threshold = *v;
    if (auto v = cli.get_int("max_frames")) opts.max_frames = max_frames_from(*v);
}

ProcessingOptions processing_options(const ConversionOptions& opts) {
    ProcessingOptions p;
    p.brush_thickness = opts.brush_thickness;
    p.quality_factor = opts.quality_factor;
    p.transparency_threshold = opts.transparency_threshold;
    p.max_frames = opts.max_frames;
    return p;
}

} // namespace gifdraw
