#pragma once

#include <atomic>
#include <optional>

#include "codec/frame_source.hpp"
#include "config/options.hpp"
#include "format/draw_format.hpp"
#include "log/progress.hpp"

namespace gifdraw {

inline constexpr double kDefaultFps = 10.0;

// 1000 / delay_ms, or kDefaultFps when the delay is missing or not positive.
double nominal_fps(std::optional<int> delay_ms);

// Normalize + encode every frame of source, in order.
// - options are validated first (ConfigError)
// - stops once max_frames frames are done, or when *abort_flag is set
//   (checked once per frame); the partial result is returned
// - progress goes to sink after each frame; sink failures never abort
ConversionResult convert(FrameSource& source,
                         const ConversionOptions& options,
                         ProgressSink* sink = nullptr,
                         const std::atomic<bool>* abort_flag = nullptr);

} // namespace gifdraw
