#pragma once

#include "io/image_types.hpp"

namespace gifdraw {

// Output-sized working grid for one frame. The scaled frame sits at
// (offset_x, offset_y) with size content_width x content_height; the
// rest is fully transparent.
struct Canvas {
    RgbaImage image;
    int offset_x = 0;
    int offset_y = 0;
    int content_width = 0;
    int content_height = 0;
};

struct FitSize {
    int width = 0;
    int height = 0;
};

// Largest size with the source aspect ratio that fits in dst_w x dst_h.
// Never larger than the source (no upscaling), never smaller than 1x1.
FitSize fit_within(int src_w, int src_h, int dst_w, int dst_h);

// Area-averaging resample over premultiplied alpha.
RgbaImage resample_area(const RgbaImage& src, int out_w, int out_h);

// Fit the frame into target_w x target_h and center it on a transparent canvas.
Canvas normalize_frame(const RgbaImage& frame, int target_w, int target_h);

} // namespace gifdraw
