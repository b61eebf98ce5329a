#pragma once

#include <cstdint>
#include <string>

namespace gifdraw {

enum class Severity : uint8_t {
    Info,
    Success,
    Error,
};

const char* severity_name(Severity s);

// Receives human-readable status lines. Purely observational.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void notify(Severity severity, const std::string& message) = 0;
};

// Info/Success to stdout, Error to stderr.
class ConsoleSink : public ProgressSink {
public:
    void notify(Severity severity, const std::string& message) override;
};

// Drops everything.
class NullSink : public ProgressSink {
public:
    void notify(Severity, const std::string&) override {}
};

// Forward to sink if any. A throwing sink is reported on stderr and ignored.
void report(ProgressSink* sink, Severity severity, const std::string& message);

} // namespace gifdraw
