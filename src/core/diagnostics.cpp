#include "html2org/core/diagnostics.h"

#include <algorithm>
#include <iterator>

namespace html2org::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::string line = std::string("[") + severity_name(event.severity) + "] " + event.module;
    if (!event.stage.empty()) {
        line += "/" + event.stage;
    }
    if (event.call_id != 0) {
        line += " (call " + std::to_string(event.call_id) + ")";
    }
    return line + ": " + event.message;
}

std::uint64_t DiagnosticLog::begin_call() {
    return ++current_call_;
}

void DiagnosticLog::report(Severity severity, const std::string& module,
                           const std::string& stage, const std::string& message) {
    if (severity < threshold_) {
        return;
    }
    events_.push_back(DiagnosticEvent{severity, module, stage, message, current_call_});
    for (const auto& sink : sinks_) {
        sink(events_.back());
    }
}

void DiagnosticLog::add_sink(DiagnosticSink sink) {
    sinks_.push_back(std::move(sink));
}

std::vector<DiagnosticEvent> DiagnosticLog::call_events(std::uint64_t call_id) const {
    std::vector<DiagnosticEvent> selected;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(selected),
                 [call_id](const DiagnosticEvent& event) { return event.call_id == call_id; });
    return selected;
}

std::size_t DiagnosticLog::count(Severity severity, std::uint64_t call_id) const {
    return static_cast<std::size_t>(
        std::count_if(events_.begin(), events_.end(), [&](const DiagnosticEvent& event) {
            return event.severity == severity && event.call_id == call_id;
        }));
}

std::string ConversionFailure::describe() const {
    std::string text = "conversion failed in " + module;
    if (!stage.empty()) {
        text += "/" + stage;
    }
    text += ": " + message + "\n";
    for (const auto& fact : facts) {
        text += "  " + fact.first + ": " + fact.second + "\n";
    }
    for (const auto& event : events) {
        if (event.severity == Severity::Warning) {
            text += "  after: " + format_diagnostic(event) + "\n";
        }
    }
    return text;
}

ConversionFailure capture_failure(const DiagnosticLog& log, const std::string& module,
                                  const std::string& stage, const std::string& message) {
    ConversionFailure failure;
    failure.call_id = log.current_call();
    failure.module = module;
    failure.stage = stage;
    failure.message = message;
    failure.events = log.call_events(failure.call_id);
    return failure;
}

}  // namespace html2org::core
