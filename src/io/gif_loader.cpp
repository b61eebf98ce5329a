#include "io/gif_loader.hpp"

#include <gif_lib.h>

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace gifdraw {
namespace {

std::string gif_error_text(int code) {
    const char* s = GifErrorString(code);
    return s ? std::string(s) : ("giflib error " + std::to_string(code));
}

GraphicsControlBlock control_block(GifFileType* gif, int index) {
    GraphicsControlBlock gcb;
    gcb.DisposalMode = DISPOSAL_UNSPECIFIED;
    gcb.UserInputFlag = false;
    gcb.DelayTime = 0;
    gcb.TransparentColor = NO_TRANSPARENT_COLOR;

    // No GCE (GIF87a, or a GIF89a frame without one): defaults apply.
    const SavedImage& si = gif->SavedImages[index];
    for (int i = 0; i < si.ExtensionBlockCount; ++i) {
        const ExtensionBlock& ep = si.ExtensionBlocks[i];
        if (ep.Function != GRAPHICS_EXT_FUNC_CODE) continue;
        if (DGifExtensionToGCB(ep.ByteCount, ep.Bytes, &gcb) != GIF_OK) {
            throw std::runtime_error("gif: bad graphics control block for frame " + std::to_string(index));
        }
        break;
    }
    return gcb;
}

void clear_rect(RgbaImage& img, int left, int top, int w, int h) {
    const int x0 = std::max(0, left), y0 = std::max(0, top);
    const int x1 = std::min(img.width, left + w), y1 = std::min(img.height, top + h);
    for (int y = y0; y < y1; ++y) {
        for (int x = x0; x < x1; ++x) img.at(x, y) = Rgba{};
    }
}

} // namespace

void GifFrameSource::GifCloser::operator()(GifFileType* gif) const {
    int err = 0;
    if (DGifCloseFile(gif, &err) != GIF_OK) {
        std::cerr << "[WARN] gif: close failed: " << gif_error_text(err) << "\n";
    }
}

GifFrameSource::GifFrameSource(const std::string& path) : path_(path) {
    int err = 0;
    GifFileType* raw = DGifOpenFileName(path.c_str(), &err);
    if (!raw) throw std::runtime_error("gif: cannot open '" + path + "': " + gif_error_text(err));
    gif_.reset(raw);

    if (DGifSlurp(raw) != GIF_OK) {
        throw std::runtime_error("gif: cannot decode '" + path + "': " + gif_error_text(raw->Error));
    }
    if (raw->ImageCount <= 0) throw std::runtime_error("gif: no frames in '" + path + "'");
    if (raw->SWidth <= 0 || raw->SHeight <= 0) throw std::runtime_error("gif: invalid screen size in '" + path + "'");

    screen_ = RgbaImage(raw->SWidth, raw->SHeight);

    // GIF delays are in 1/100 s; 0 means "not declared".
    const GraphicsControlBlock first = control_block(raw, 0);
    if (first.DelayTime > 0) delay_ms_ = first.DelayTime * 10;
}

GifFrameSource::~GifFrameSource() = default;

int GifFrameSource::frame_count() const {
    return gif_ ? gif_->ImageCount : 0;
}

bool GifFrameSource::next(RgbaImage& frame) {
    GifFileType* gif = gif_.get();
    if (index_ >= gif->ImageCount) return false;

    // dispose the previous frame
    if (index_ > 0) {
        if (prev_disposal_ == DISPOSE_BACKGROUND) {
            clear_rect(screen_, prev_left_, prev_top_, prev_w_, prev_h_);
        } else if (prev_disposal_ == DISPOSE_PREVIOUS && !saved_.empty()) {
            screen_ = saved_;
        }
    }

    const SavedImage& si = gif->SavedImages[index_];
    const GifImageDesc& d = si.ImageDesc;
    const GraphicsControlBlock gcb = control_block(gif, index_);
    const ColorMapObject* cmap = d.ColorMap ? d.ColorMap : gif->SColorMap;
    if (!cmap) throw std::runtime_error("gif: frame " + std::to_string(index_) + " has no color map");
    if (!si.RasterBits) throw std::runtime_error("gif: frame " + std::to_string(index_) + " has no raster data");

    if (gcb.DisposalMode == DISPOSE_PREVIOUS) saved_ = screen_;

    for (int row = 0; row < d.Height; ++row) {
        const int y = d.Top + row;
        if (y < 0 || y >= screen_.height) continue;
        for (int col = 0; col < d.Width; ++col) {
            const int x = d.Left + col;
            if (x < 0 || x >= screen_.width) continue;
            const int idx = si.RasterBits[static_cast<size_t>(row) * d.Width + col];
            if (idx == gcb.TransparentColor) continue;
            if (idx >= cmap->ColorCount) continue; // out-of-palette index: leave pixel as is
            const GifColorType& c = cmap->Colors[idx];
            screen_.at(x, y) = Rgba{c.Red, c.Green, c.Blue, 255};
        }
    }

    prev_disposal_ = gcb.DisposalMode;
    prev_left_ = d.Left;
    prev_top_ = d.Top;
    prev_w_ = d.Width;
    prev_h_ = d.Height;
    ++index_;

    frame = screen_;
    return true;
}

} // namespace gifdraw
