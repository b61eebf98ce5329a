#include "preprocess/normalizer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace gifdraw {

namespace {

// Input range [first, first + weights.size()) contributing to one output cell.
struct Span {
    int first = 0;
    std::vector<float> weights;
};

// Box filter: each output cell averages the input interval it covers,
// partial pixels weighted by their covered fraction.
std::vector<Span> area_spans(int in_size, int out_size) {
    std::vector<Span> spans(static_cast<size_t>(out_size));
    const double scale = static_cast<double>(in_size) / static_cast<double>(out_size);
    for (int o = 0; o < out_size; ++o) {
        const double lo = o * scale;
        const double hi = std::min(static_cast<double>(in_size), lo + scale);
        const int first = std::max(0, static_cast<int>(std::floor(lo)));
        const int last = std::min(in_size, static_cast<int>(std::ceil(hi)));

        Span& s = spans[static_cast<size_t>(o)];
        s.first = first;
        double total = 0.0;
        for (int i = first; i < last; ++i) {
            double cover = std::min<double>(i + 1, hi) - std::max<double>(i, lo);
            if (cover < 0.0) cover = 0.0;
            s.weights.push_back(static_cast<float>(cover));
            total += cover;
        }
        if (s.weights.empty()) {
            s.first = std::min(first, in_size - 1);
            s.weights.push_back(1.0f);
            total = 1.0;
        }
        for (auto& w : s.weights) w = static_cast<float>(w / total);
    }
    return spans;
}

inline uint8_t to_u8(float v) {
    const long r = std::lround(v);
    if (r < 0) return 0;
    if (r > 255) return 255;
    return static_cast<uint8_t>(r);
}

} // namespace

FitSize fit_within(int src_w, int src_h, int dst_w, int dst_h) {
    if (src_w <= 0 || src_h <= 0) throw std::runtime_error("fit_within: invalid source size");
    if (dst_w <= 0 || dst_h <= 0) throw std::runtime_error("fit_within: invalid target size");

    if (src_w <= dst_w && src_h <= dst_h) return FitSize{src_w, src_h};

    // scale = min(dst_w / src_w, dst_h / src_h), compared without division
    const int64_t by_width = static_cast<int64_t>(dst_w) * src_h;
    const int64_t by_height = static_cast<int64_t>(dst_h) * src_w;
    FitSize fs;
    if (by_width <= by_height) {
        fs.width = dst_w;
        fs.height = static_cast<int>(static_cast<int64_t>(src_h) * dst_w / src_w);
    } else {
        fs.height = dst_h;
        fs.width = static_cast<int>(static_cast<int64_t>(src_w) * dst_h / src_h);
    }
    fs.width = std::clamp(fs.width, 1, dst_w);
    fs.height = std::clamp(fs.height, 1, dst_h);
    return fs;
}

RgbaImage resample_area(const RgbaImage& src, int out_w, int out_h) {
    if (src.width <= 0 || src.height <= 0) throw std::runtime_error("resample_area: invalid source size");
    if (static_cast<int64_t>(src.pixels.size()) != static_cast<int64_t>(src.width) * src.height) {
        throw std::runtime_error("resample_area: pixel buffer mismatch");
    }
    if (out_w <= 0 || out_h <= 0) throw std::runtime_error("resample_area: invalid output size");

    if (out_w == src.width && out_h == src.height) return src;

    const std::vector<Span> xs = area_spans(src.width, out_w);
    const std::vector<Span> ys = area_spans(src.height, out_h);

    // premultiplied RGBA, float
    std::vector<float> pm(src.pixels.size() * 4);
    for (size_t i = 0; i < src.pixels.size(); ++i) {
        const Rgba& p = src.pixels[i];
        const float a = static_cast<float>(p.a) / 255.0f;
        pm[i * 4 + 0] = p.r * a;
        pm[i * 4 + 1] = p.g * a;
        pm[i * 4 + 2] = p.b * a;
        pm[i * 4 + 3] = p.a;
    }

    // horizontal: src.height rows x out_w
    std::vector<float> tmp(static_cast<size_t>(out_w) * src.height * 4, 0.0f);
    for (int y = 0; y < src.height; ++y) {
        const float* row = &pm[static_cast<size_t>(y) * src.width * 4];
        float* dst = &tmp[static_cast<size_t>(y) * out_w * 4];
        for (int x = 0; x < out_w; ++x) {
            const Span& s = xs[static_cast<size_t>(x)];
            float acc[4] = {0.0f, 0.0f, 0.0f, 0.0f};
            for (size_t k = 0; k < s.weights.size(); ++k) {
                const float* p = row + (static_cast<size_t>(s.first) + k) * 4;
                const float w = s.weights[k];
                for (int c = 0; c < 4; ++c) acc[c] += p[c] * w;
            }
            for (int c = 0; c < 4; ++c) dst[x * 4 + c] = acc[c];
        }
    }

    // vertical: out_h x out_w, then back to straight alpha
    RgbaImage out(out_w, out_h);
    for (int y = 0; y < out_h; ++y) {
        const Span& s = ys[static_cast<size_t>(y)];
        for (int x = 0; x < out_w; ++x) {
            float acc[4] = {0.0f, 0.0f, 0.0f, 0.0f};
            for (size_t k = 0; k < s.weights.size(); ++k) {
                const float* p = &tmp[((static_cast<size_t>(s.first) + k) * out_w + x) * 4];
                const float w = s.weights[k];
                for (int c = 0; c < 4; ++c) acc[c] += p[c] * w;
            }
            Rgba& o = out.at(x, y);
            o.a = to_u8(acc[3]);
            if (o.a == 0) continue; // stays (0,0,0,0)
            const float unpremul = 255.0f / acc[3];
            o.r = to_u8(acc[0] * unpremul);
            o.g = to_u8(acc[1] * unpremul);
            o.b = to_u8(acc[2] * unpremul);
        }
    }
    return out;
}

Canvas normalize_frame(const RgbaImage& frame, int target_w, int target_h) {
    if (target_w <= 0 || target_h <= 0) throw std::runtime_error("normalize_frame: invalid target size");
    if (frame.width <= 0 || frame.height <= 0) throw std::runtime_error("normalize_frame: invalid frame size");

    const FitSize fs = fit_within(frame.width, frame.height, target_w, target_h);
    const RgbaImage scaled = resample_area(frame, fs.width, fs.height);

    Canvas cv;
    cv.image = RgbaImage(target_w, target_h); // alpha 0 everywhere
    cv.content_width = fs.width;
    cv.content_height = fs.height;
    cv.offset_x = (target_w - fs.width) / 2;
    cv.offset_y = (target_h - fs.height) / 2;

    for (int y = 0; y < fs.height; ++y) {
        for (int x = 0; x < fs.width; ++x) {
            cv.image.at(cv.offset_x + x, cv.offset_y + y) = scaled.at(x, y);
        }
    }
    return cv;
}

#ifndef NDEBUG
namespace {
// Uniform opaque color must survive downscaling unchanged.
struct NormalizerSelfTest {
    NormalizerSelfTest() {
        RgbaImage src(7, 5, Rgba{10, 200, 30, 255});
        RgbaImage out = resample_area(src, 3, 2);
        for (const auto& p : out.pixels) {
            if (p != Rgba{10, 200, 30, 255}) throw std::runtime_error("normalizer self-test: uniform color changed");
        }
        FitSize fs = fit_within(200, 100, 100, 100);
        if (fs.width != 100 || fs.height != 50) throw std::runtime_error("normalizer self-test: fit size");
    }
};
static NormalizerSelfTest _normalizer_self_test{};
} // namespace
#endif

} // namespace gifdraw
