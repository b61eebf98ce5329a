#include "codec/scanline_encoder.hpp"

#include "color/hex_color.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace gifdraw {

namespace {

// Run state for one row: NoRun, or OpenRun(start_x, color).
enum class RunState : uint8_t { NoRun, OpenRun };

struct RowScanner {
    const RgbaImage& canvas;
    const EncoderParams& params;
    std::vector<DrawCommand>& out;
    double norm_y = 0.0;

    RunState state = RunState::NoRun;
    int start_x = 0;
    std::string color;

    void open(int x, std::string c) {
        state = RunState::OpenRun;
        start_x = x;
        color = std::move(c);
    }

    // end_x is the last visited column that belongs to the run.
    void close(int end_x) {
        const double w = static_cast<double>(canvas.width);
        DrawCommand cmd;
        cmd.start = NormPoint{start_x / w, norm_y};
        cmd.end = NormPoint{end_x / w, norm_y};
        cmd.color = std::move(color);
        cmd.thickness = params.brush_thickness;
        out.push_back(std::move(cmd));
        state = RunState::NoRun;
        color.clear();
    }
};

} // namespace

void encode_row(const RgbaImage& canvas,
                int y,
                const EncoderParams& params,
                std::vector<DrawCommand>& out) {
    const int stride = params.stride;
    if (stride < 1) throw std::runtime_error("encode_row: stride must be >= 1");
    RowScanner run{canvas, params, out};
    run.norm_y = static_cast<double>(y) / static_cast<double>(canvas.height);

    int last_x = 0;
    for (int x = 0; x < canvas.width; x += stride) {
        last_x = x;
        const Rgba& px = canvas.at(x, y);
        if (px.a > params.transparency_threshold) {
            std::string c = to_hex(px);
            if (run.state == RunState::NoRun) {
                run.open(x, std::move(c));
            } else if (c != run.color) {
                run.close(x - stride);
                run.open(x, std::move(c));
            }
        } else if (run.state == RunState::OpenRun) {
            run.close(x - stride);
        }
    }
    if (run.state == RunState::OpenRun) run.close(last_x);
}

void encode_canvas(const RgbaImage& canvas,
                   const EncoderParams& params,
                   std::vector<DrawCommand>& out) {
    if (canvas.width <= 0 || canvas.height <= 0) throw std::runtime_error("encode_canvas: invalid canvas size");
    if (params.stride < 1) throw std::runtime_error("encode_canvas: stride must be >= 1");

    for (int y = 0; y < canvas.height; y += params.stride) {
        encode_row(canvas, y, params, out);
    }
}

std::vector<DrawCommand> encode_canvas(const RgbaImage& canvas, const EncoderParams& params) {
    std::vector<DrawCommand> out;
    encode_canvas(canvas, params, out);
    return out;
}

#ifndef NDEBUG
namespace {
// [red, red, blue, blue] -> two runs closing at the last visited column.
struct EncoderSelfTest {
    EncoderSelfTest() {
        RgbaImage row(4, 1);
        row.at(0, 0) = Rgba{255, 0, 0, 255};
        row.at(1, 0) = Rgba{255, 0, 0, 255};
        row.at(2, 0) = Rgba{0, 0, 255, 255};
        row.at(3, 0) = Rgba{0, 0, 255, 255};
        EncoderParams p;
        auto cmds = encode_canvas(row, p);
        if (cmds.size() != 2) throw std::runtime_error("encoder self-test: expected 2 runs");
        if (cmds[0].end.x != 0.25 || cmds[1].start.x != 0.5 || cmds[1].end.x != 0.75) {
            throw std::runtime_error("encoder self-test: run bounds");
        }
    }
};
static EncoderSelfTest _encoder_self_test{};
} // namespace
#endif

} // namespace gifdraw
