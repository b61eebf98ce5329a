#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "format/draw_format.hpp"

namespace gifdraw {

class CliParser;

// Invalid caller-supplied parameter (bad range, non-numeric, unreadable config).
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ConversionOptions {
    int canvas_width = 100;
    int canvas_height = 100;
    int brush_thickness = 2;
    int quality_factor = 1;          // sampling stride
    int transparency_threshold = 10; // 0..255
    std::optional<int> max_frames;   // unset = all frames
};

// Throws ConfigError naming the first offending field.
void validate(const ConversionOptions& opts);

// Read a JSON object with any of: width, height, brush_thickness,
// quality_factor, transparency_threshold, max_frames (0 or null = all).
// Fields not present keep their value from base.
ConversionOptions load_options_file(const std::string& path, ConversionOptions base = {});

// --width --height --brush --quality --threshold --max_frames (0 = all).
void apply_cli_overrides(const CliParser& cli, ConversionOptions& opts);

ProcessingOptions processing_options(const ConversionOptions& opts);

} // namespace gifdraw
