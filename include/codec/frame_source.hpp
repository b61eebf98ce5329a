#pragma once

#include <optional>
#include <utility>
#include <vector>

#include "io/image_types.hpp"

namespace gifdraw {

// Ordered, finite sequence of decoded RGBA frames.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Fill frame with the next composited frame; false at end of sequence.
    virtual bool next(RgbaImage& frame) = 0;

    // Declared inter-frame delay, if the source has one.
    virtual std::optional<int> frame_delay_ms() const = 0;
};

// Frames already in memory.
class MemoryFrameSource : public FrameSource {
public:
    explicit MemoryFrameSource(std::vector<RgbaImage> frames,
                               std::optional<int> delay_ms = std::nullopt)
        : frames_(std::move(frames)), delay_ms_(delay_ms) {}

    bool next(RgbaImage& frame) override {
        if (pos_ >= frames_.size()) return false;
        frame = frames_[pos_++];
        return true;
    }
    std::optional<int> frame_delay_ms() const override { return delay_ms_; }

    size_t consumed() const { return pos_; }

private:
    std::vector<RgbaImage> frames_;
    std::optional<int> delay_ms_;
    size_t pos_ = 0;
};

} // namespace gifdraw
