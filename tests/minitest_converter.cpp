#include "codec/converter.hpp"

#include "minitest.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace gifdraw;

namespace {

struct RecordingSink : ProgressSink {
    std::vector<std::pair<Severity,std::string>> lines;
    void notify(Severity s, const std::string& m) override { lines.emplace_back(s, m); }
};

struct ThrowingSink : ProgressSink {
    int calls = 0;
    void notify(Severity, const std::string&) override { ++calls; throw std::runtime_error("sink is broken"); }
};

struct NonStdThrowingSink : ProgressSink {
    int calls = 0;
    void notify(Severity, const std::string&) override { ++calls; throw 42; }
};

// Sets the abort flag once it has seen `after` frame completions.
struct AbortingSink : ProgressSink {
    std::atomic<bool>* flag = nullptr;
    int after = 0;
    int done = 0;
    void notify(Severity, const std::string& m) override {
        if (m.find("Commands generated") != std::string::npos && ++done >= after) flag->store(true);
    }
};

} // namespace

static std::vector<RgbaImage> frames(int n){
    std::vector<RgbaImage> v;
    for(int i=0;i<n;++i){
        RgbaImage f(4,2);
        // frame i has i+1 opaque pixels on row 0, alternating colors
        for(int x=0;x<=i && x<4;++x) f.at(x,0) = (x%2) ? Rgba{0,0,255,255} : Rgba{255,0,0,255};
        v.push_back(f);
    }
    return v;
}

static ConversionOptions small_opts(){
    ConversionOptions o;
    o.canvas_width = 4;
    o.canvas_height = 2;
    o.brush_thickness = 5;
    o.quality_factor = 1;
    o.transparency_threshold = 10;
    return o;
}

static bool test_nominal_fps(){
    T_ASSERT(near(nominal_fps(std::nullopt), 10.0));
    T_ASSERT(near(nominal_fps(0), 10.0));
    T_ASSERT(near(nominal_fps(-5), 10.0));
    T_ASSERT(near(nominal_fps(100), 10.0));
    T_ASSERT(near(nominal_fps(40), 25.0));
    return true;
}

static bool test_all_frames_and_totals(){
    MemoryFrameSource src(frames(4), 50);
    ConversionResult r = convert(src, small_opts());
    T_ASSERT(r.frames.size()==4);
    T_ASSERT(r.metadata.frame_count==4);
    // frame i: i+1 alternating pixels -> i+1 commands (capped at 4)
    T_ASSERT(r.frames[0].size()==1 && r.frames[1].size()==2 && r.frames[2].size()==3 && r.frames[3].size()==4);
    T_ASSERT(r.metadata.total_commands==10);
    T_ASSERT(near(r.metadata.original_fps, 20.0));
    T_ASSERT(r.metadata.width==4 && r.metadata.height==2);
    T_ASSERT(r.metadata.options.brush_thickness==5);
    T_ASSERT(r.metadata.options.quality_factor==1);
    T_ASSERT(r.metadata.options.transparency_threshold==10);
    T_ASSERT(!r.metadata.options.max_frames);
    for(const auto& f: r.frames) for(const auto& c: f) T_ASSERT(c.thickness==5);
    return true;
}

static bool test_max_frames_cap(){
    MemoryFrameSource src(frames(5));
    ConversionOptions o = small_opts();
    o.max_frames = 2;
    RecordingSink sink;
    ConversionResult r = convert(src, o, &sink);
    T_ASSERT(r.frames.size()==2);
    T_ASSERT(r.metadata.frame_count==2);
    T_ASSERT(r.metadata.total_commands==3);
    T_ASSERT(r.metadata.options.max_frames && *r.metadata.options.max_frames==2);
    bool saw_limit=false;
    for(const auto& l: sink.lines) if(l.second.find("Frame limit (2)")!=std::string::npos) saw_limit=true;
    T_ASSERT(saw_limit);
    return true;
}

static bool test_cap_larger_than_source(){
    MemoryFrameSource src(frames(3));
    ConversionOptions o = small_opts();
    o.max_frames = 10;
    ConversionResult r = convert(src, o);
    T_ASSERT(r.metadata.frame_count==3);
    return true;
}

static bool test_default_fps_when_undeclared(){
    MemoryFrameSource src(frames(1));
    RecordingSink sink;
    ConversionResult r = convert(src, small_opts(), &sink);
    T_ASSERT(near(r.metadata.original_fps, 10.0));
    T_ASSERT(!sink.lines.empty());
    T_ASSERT(sink.lines.front().second.find("10 fps")!=std::string::npos);
    return true;
}

static bool test_progress_per_frame(){
    MemoryFrameSource src(frames(3), 100);
    RecordingSink sink;
    convert(src, small_opts(), &sink);
    int processing=0, generated=0;
    for(const auto& l: sink.lines){
        T_ASSERT(l.first==Severity::Info);
        if(l.second.rfind("Processing frame ",0)==0) ++processing;
        if(l.second.find("Commands generated for frame ")!=std::string::npos) ++generated;
    }
    T_ASSERT(processing==3 && generated==3);
    return true;
}

static bool test_throwing_sink_does_not_abort(){
    MemoryFrameSource src(frames(3));
    ThrowingSink sink;
    ConversionResult r = convert(src, small_opts(), &sink);
    T_ASSERT(r.metadata.frame_count==3);
    T_ASSERT(sink.calls > 3);
    return true;
}

static bool test_non_std_throw_from_sink_is_contained(){
    MemoryFrameSource src(frames(2));
    NonStdThrowingSink sink;
    ConversionResult r = convert(src, small_opts(), &sink);
    T_ASSERT(r.metadata.frame_count==2);
    T_ASSERT(r.metadata.total_commands==3);
    T_ASSERT(sink.calls > 2);
    return true;
}

static bool test_null_sink_drops_messages(){
    MemoryFrameSource src(frames(3), 100);
    NullSink sink;
    ConversionResult r = convert(src, small_opts(), &sink);
    T_ASSERT(r.metadata.frame_count==3);
    T_ASSERT(r.metadata.total_commands==6);
    T_ASSERT(near(r.metadata.original_fps, 10.0));
    report(&sink, Severity::Error, "dropped");
    return true;
}

static bool test_abort_flag(){
    std::atomic<bool> abort_now{true};
    MemoryFrameSource src(frames(3));
    ConversionResult r = convert(src, small_opts(), nullptr, &abort_now);
    T_ASSERT(r.frames.empty() && r.metadata.frame_count==0);

    std::atomic<bool> later{false};
    AbortingSink sink; sink.flag=&later; sink.after=2;
    MemoryFrameSource src2(frames(5));
    r = convert(src2, small_opts(), &sink, &later);
    T_ASSERT(r.metadata.frame_count==2);
    T_ASSERT(src2.consumed()==2);
    return true;
}

static bool test_invalid_options_rejected_before_frames(){
    MemoryFrameSource src(frames(2));
    ConversionOptions o = small_opts();
    o.canvas_width = 0;
    bool threw=false;
    try{ convert(src, o); }catch(const ConfigError&){ threw=true; }
    T_ASSERT(threw);
    T_ASSERT(src.consumed()==0);
    return true;
}

static bool test_frames_are_scaled_into_canvas(){
    // 8x4 opaque frame into 4x4 canvas: 4x2 content at offset (0,1)
    std::vector<RgbaImage> v{RgbaImage(8,4, Rgba{0,255,0,255})};
    MemoryFrameSource src(v);
    ConversionOptions o = small_opts();
    o.canvas_width = 4; o.canvas_height = 4;
    ConversionResult r = convert(src, o);
    T_ASSERT(r.frames.size()==1);
    T_ASSERT(r.frames[0].size()==2);
    T_ASSERT(near(r.frames[0][0].start.y, 0.25) && near(r.frames[0][1].start.y, 0.5));
    T_ASSERT(near(r.frames[0][0].start.x, 0.0) && near(r.frames[0][0].end.x, 0.75));
    T_ASSERT(r.frames[0][0].color=="#00FF00");
    return true;
}

int main(){
    int failures = 0;
    T_RUN(test_nominal_fps);
    T_RUN(test_all_frames_and_totals);
    T_RUN(test_max_frames_cap);
    T_RUN(test_cap_larger_than_source);
    T_RUN(test_default_fps_when_undeclared);
    T_RUN(test_progress_per_frame);
    T_RUN(test_throwing_sink_does_not_abort);
    T_RUN(test_non_std_throw_from_sink_is_contained);
    T_RUN(test_null_sink_drops_messages);
    T_RUN(test_abort_flag);
    T_RUN(test_invalid_options_rejected_before_frames);
    T_RUN(test_frames_are_scaled_into_canvas);
    return failures ? 1 : 0;
}
