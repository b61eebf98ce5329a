#pragma once

#include <memory>
#include <optional>
#include <string>

#include "codec/frame_source.hpp"
#include "io/image_types.hpp"

struct GifFileType;

namespace gifdraw {

// giflib-backed frame source:
// - whole file is read up front (DGifSlurp); open/parse errors throw
// - next() composites frames onto the logical screen, honoring frame
//   position, transparent index, local/global color maps and disposal
// - transparent areas come out as alpha 0
class GifFrameSource : public FrameSource {
public:
    explicit GifFrameSource(const std::string& path);
    ~GifFrameSource() override;

    GifFrameSource(const GifFrameSource&) = delete;
    GifFrameSource& operator=(const GifFrameSource&) = delete;

    bool next(RgbaImage& frame) override;
    std::optional<int> frame_delay_ms() const override { return delay_ms_; }

    int frame_count() const;
    int width() const { return screen_.width; }
    int height() const { return screen_.height; }

private:
    struct GifCloser {
        void operator()(GifFileType* gif) const;
    };

    std::unique_ptr<GifFileType, GifCloser> gif_;
    std::string path_;
    RgbaImage screen_;
    RgbaImage saved_;          // snapshot for DISPOSE_PREVIOUS
    int index_ = 0;
    int prev_disposal_ = 0;
    int prev_left_ = 0, prev_top_ = 0, prev_w_ = 0, prev_h_ = 0;
    std::optional<int> delay_ms_;
};

} // namespace gifdraw
