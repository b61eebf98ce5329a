#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gifdraw {

// Point in drawing space: fractions of canvas width / height.
struct NormPoint {
    double x = 0.0;
    double y = 0.0;
};

// One horizontal line: start.y == end.y, start.x <= end.x.
struct DrawCommand {
    NormPoint start;
    NormPoint end;
    std::string color;   // "#RRGGBB"
    int thickness = 1;
};

using FrameCommands = std::vector<DrawCommand>;

// Parameters recorded in the output exactly as used.
struct ProcessingOptions {
    int brush_thickness = 2;
    int quality_factor = 1;          // sampling stride
    int transparency_threshold = 10;
    std::optional<int> max_frames;   // unset = all frames
};

struct ConversionMetadata {
    int width = 0;
    int height = 0;
    double original_fps = 10.0;
    int frame_count = 0;
    uint64_t total_commands = 0;
    ProcessingOptions options;
};

struct ConversionResult {
    std::vector<FrameCommands> frames; // animation order
    ConversionMetadata metadata;
};

} // namespace gifdraw
