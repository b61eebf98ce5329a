#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace gifdraw {

// One RGBA sample, 8 bits per channel (straight alpha).
struct Rgba {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 0;
};

inline bool operator==(const Rgba& l, const Rgba& r) {
    return l.r == r.r && l.g == r.g && l.b == r.b && l.a == r.a;
}
inline bool operator!=(const Rgba& l, const Rgba& r) { return !(l == r); }

struct RgbaImage {
    int width = 0;
    int height = 0;
    std::vector<Rgba> pixels; // row-major, width * height

    RgbaImage() = default;
    RgbaImage(int w, int h, Rgba fill = Rgba{})
        : width(w), height(h), pixels(static_cast<size_t>(w) * static_cast<size_t>(h), fill) {}

    size_t size() const { return pixels.size(); }
    bool empty() const { return pixels.empty(); }

    Rgba& at(int x, int y) { return pixels[static_cast<size_t>(y) * width + x]; }
    const Rgba& at(int x, int y) const { return pixels[static_cast<size_t>(y) * width + x]; }
};

} // namespace gifdraw
