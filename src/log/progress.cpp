#include "log/progress.hpp"

#include <exception>
#include <iostream>

namespace gifdraw {

const char* severity_name(Severity s) {
    switch (s) {
        case Severity::Info: return "info";
        case Severity::Success: return "success";
        case Severity::Error: return "error";
    }
    return "info";
}

void ConsoleSink::notify(Severity severity, const std::string& message) {
    switch (severity) {
        case Severity::Info:
            std::cout << message << "\n";
            break;
        case Severity::Success:
            std::cout << "[OK] " << message << "\n";
            break;
        case Severity::Error:
            std::cerr << "[ERROR] " << message << "\n";
            break;
    }
}

void report(ProgressSink* sink, Severity severity, const std::string& message) {
    if (!sink) return;
    try {
        sink->notify(severity, message);
    } catch (const std::exception& e) {
        std::cerr << "[WARN] progress sink failed (" << severity_name(severity) << "): " << e.what() << "\n";
    } catch (...) {
        std::cerr << "[WARN] progress sink failed (" << severity_name(severity) << "): unknown exception\n";
    }
}

} // namespace gifdraw
