#include "codec/converter.hpp"

#include "codec/scanline_encoder.hpp"
#include "preprocess/normalizer.hpp"

#include <cstdio>
#include <string>
#include <utility>

namespace gifdraw {

double nominal_fps(std::optional<int> delay_ms) {
    if (!delay_ms || *delay_ms <= 0) return kDefaultFps;
    return 1000.0 / static_cast<double>(*delay_ms);
}

ConversionResult convert(FrameSource& source,
                         const ConversionOptions& options,
                         ProgressSink* sink,
                         const std::atomic<bool>* abort_flag) {
    validate(options);

    ConversionResult result;
    ConversionMetadata& meta = result.metadata;
    meta.width = options.canvas_width;
    meta.height = options.canvas_height;
    meta.options = processing_options(options);

    const std::optional<int> delay = source.frame_delay_ms();
    meta.original_fps = nominal_fps(delay);
    if (delay && *delay > 0) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "Original frame rate: %.2f fps", meta.original_fps);
        report(sink, Severity::Info, buf);
    } else {
        report(sink, Severity::Info, "Could not determine the original frame rate, using 10 fps.");
    }

    EncoderParams params;
    params.stride = options.quality_factor;
    params.transparency_threshold = options.transparency_threshold;
    params.brush_thickness = options.brush_thickness;

    RgbaImage frame;
    while (true) {
        if (abort_flag && abort_flag->load()) {
            report(sink, Severity::Info,
                   "Conversion aborted after " + std::to_string(meta.frame_count) + " frame(s).");
            break;
        }
        if (!source.next(frame)) break;
        if (options.max_frames && meta.frame_count >= *options.max_frames) {
            report(sink, Severity::Info,
                   "Frame limit (" + std::to_string(*options.max_frames) + ") reached. Stopping.");
            break;
        }

        const int n = meta.frame_count + 1;
        report(sink, Severity::Info, "Processing frame " + std::to_string(n) + "...");

        const Canvas canvas = normalize_frame(frame, options.canvas_width, options.canvas_height);
        FrameCommands cmds;
        encode_canvas(canvas.image, params, cmds);

        meta.total_commands += cmds.size();
        meta.frame_count = n;
        report(sink, Severity::Info,
               "  - Commands generated for frame " + std::to_string(n) + ": " + std::to_string(cmds.size()));
        result.frames.push_back(std::move(cmds));
    }
    return result;
}

} // namespace gifdraw
