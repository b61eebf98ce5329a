#pragma once

#include <vector>

#include "format/draw_format.hpp"
#include "io/image_types.hpp"

namespace gifdraw {

struct EncoderParams {
    int stride = 1;                  // visit rows/columns at multiples of this
    int transparency_threshold = 10; // opaque enough iff alpha > threshold
    int brush_thickness = 2;
};

// Run-length pass over one row y; appends one command per run of
// same-color opaque samples among the visited columns.
void encode_row(const RgbaImage& canvas,
                int y,
                const EncoderParams& params,
                std::vector<DrawCommand>& out);

// All visited rows, top to bottom.
void encode_canvas(const RgbaImage& canvas,
                   const EncoderParams& params,
                   std::vector<DrawCommand>& out);

std::vector<DrawCommand> encode_canvas(const RgbaImage& canvas, const EncoderParams& params);

} // namespace gifdraw
