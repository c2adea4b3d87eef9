#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace html2org::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

// One thing that happened while converting a document. `module` names the
// part of the pipeline that raised it ("convert", "html", "render", "input").
struct DiagnosticEvent {
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t call_id = 0;
};

// "[warning] render/form (call 3): Dropped input field ..."
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticSink = std::function<void(const DiagnosticEvent&)>;

// Event log shared by every call a converter makes. Each call opens a new
// call id; events below the threshold are neither kept nor passed to sinks.
class DiagnosticLog {
public:
    std::uint64_t begin_call();
    std::uint64_t current_call() const { return current_call_; }

    void report(Severity severity, const std::string& module, const std::string& stage,
                const std::string& message);

    void set_threshold(Severity threshold) { threshold_ = threshold; }
    void add_sink(DiagnosticSink sink);

    const std::vector<DiagnosticEvent>& events() const { return events_; }
    std::vector<DiagnosticEvent> call_events(std::uint64_t call_id) const;
    std::size_t count(Severity severity, std::uint64_t call_id) const;

private:
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticSink> sinks_;
    std::uint64_t current_call_ = 0;
    Severity threshold_ = Severity::Info;
};

// A conversion call that failed: its error, the events the call logged
// before failing and a few facts about the input.
struct ConversionFailure {
    std::uint64_t call_id = 0;
    std::string module;
    std::string stage;
    std::string message;
    std::vector<DiagnosticEvent> events;
    std::vector<std::pair<std::string, std::string>> facts;

    std::string describe() const;
};

ConversionFailure capture_failure(const DiagnosticLog& log, const std::string& module,
                                  const std::string& stage, const std::string& message);

}  // namespace html2org::core
