#include "cli/cli_parser.hpp"
#include "codec/converter.hpp"
#include "config/options.hpp"
#include "io/gif_loader.hpp"
#include "io/json_saver.hpp"
#include "log/progress.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

std::atomic<bool> g_abort{false};

const char* kUsage =
    "Usage: gifdraw --in <anim.gif> [--out <file.json>] [--config <options.json>]\n"
    "               [--width N] [--height N] [--brush N] [--quality N]\n"
    "               [--threshold 0..255] [--max_frames N (0 = all)]\n";

std::string default_output_path(const std::string& in) {
    return std::filesystem::path(in).stem().string() + "_drawaria_animation.json";
}

} // namespace

extern "C" void gifdraw_on_sigint(int) {
    g_abort.store(true);
}

int main(int argc, char** argv) {
    gifdraw::ConsoleSink sink;
    gifdraw::ConversionOptions opts;
    std::string in;
    std::string out;

    try {
        gifdraw::CliParser cli;
        cli.parse(argc, argv);
        if (cli.has("help")) {
            std::cout << kUsage;
            return 0;
        }
        in = cli.get("in");
        if (in.empty() && !cli.positional().empty()) in = cli.positional().front();
        if (in.empty()) {
            std::cerr << kUsage;
            return 1;
        }
        out = cli.get("out", default_output_path(in));

        if (cli.has("config")) opts = gifdraw::load_options_file(cli.get("config"), opts);
        gifdraw::apply_cli_overrides(cli, opts);
        gifdraw::validate(opts);
    } catch (const gifdraw::ConfigError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n" << kUsage;
        return 1;
    }

    if (!std::filesystem::exists(in)) {
        sink.notify(gifdraw::Severity::Error, "Input file does not exist: " + in);
        return 2;
    }

    gifdraw::ConversionResult result;
    try {
        sink.notify(gifdraw::Severity::Info, "Loading GIF from " + in + "...");
        gifdraw::GifFrameSource source(in);
        std::signal(SIGINT, gifdraw_on_sigint);
        result = gifdraw::convert(source, opts, &sink, &g_abort);
        std::signal(SIGINT, SIG_DFL);
    } catch (const std::exception& e) {
        sink.notify(gifdraw::Severity::Error, std::string("Conversion failed: ") + e.what());
        return 2;
    }

    try {
        gifdraw::save_json(out, result);
    } catch (const std::exception& e) {
        sink.notify(gifdraw::Severity::Error, std::string("Error saving JSON file: ") + e.what());
        return 2;
    }

    sink.notify(gifdraw::Severity::Success,
                "Done! File '" + out + "' created with " + std::to_string(result.metadata.frame_count) +
                " frames and " + std::to_string(result.metadata.total_commands) + " total commands.");
    return 0;
}
