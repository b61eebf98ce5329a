#include "io/json_saver.hpp"

#include <fstream>
#include <stdexcept>

namespace gifdraw {

using nlohmann::ordered_json;

namespace {

ordered_json command_json(const DrawCommand& c) {
    ordered_json j;
    j["start_norm"] = ordered_json::array({c.start.x, c.start.y});
    j["end_norm"] = ordered_json::array({c.end.x, c.end.y});
    j["color"] = c.color;
    j["thickness"] = c.thickness;
    return j;
}

} // namespace

ordered_json to_json(const ConversionResult& result) {
    ordered_json frames = ordered_json::array();
    for (const auto& f : result.frames) {
        ordered_json cmds = ordered_json::array();
        for (const auto& c : f) cmds.push_back(command_json(c));
        frames.push_back(std::move(cmds));
    }

    const ConversionMetadata& m = result.metadata;
    ordered_json opts;
    opts["brush_thickness"] = m.options.brush_thickness;
    opts["quality_factor"] = m.options.quality_factor;
    opts["transparency_threshold"] = m.options.transparency_threshold;
    if (m.options.max_frames) {
        opts["max_frames_processed"] = *m.options.max_frames;
    } else {
        opts["max_frames_processed"] = nullptr;
    }

    ordered_json meta;
    meta["width"] = m.width;
    meta["height"] = m.height;
    meta["original_fps"] = m.original_fps;
    meta["frame_count"] = m.frame_count;
    meta["total_commands_generated"] = m.total_commands;
    meta["processing_options"] = std::move(opts);

    ordered_json root;
    root["frames"] = std::move(frames);
    root["metadata"] = std::move(meta);
    return root;
}

void save_json(const std::string& path, const ConversionResult& result) {
    const std::string text = to_json(result).dump(2);
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.good()) throw std::runtime_error("Cannot write file: " + path);
    ofs << text << "\n";
    ofs.flush();
    if (!ofs.good()) throw std::runtime_error("Write failed: " + path);
}

} // namespace gifdraw
