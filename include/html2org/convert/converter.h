#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

#include "html2org/convert/options.h"
#include "html2org/core/diagnostics.h"
#include "html2org/core/lifecycle.h"
#include "html2org/html/dom.h"

namespace html2org::convert {

struct ConvertResult {
    bool ok = false;
    std::string text;
    std::string message;
};

ConvertResult convert_node(const html::Node& root, const Options& options = {});
ConvertResult convert_string(const std::string& html, const Options& options = {});
ConvertResult convert_stream(std::istream& input, const Options& options = {});

// Runs conversions with one set of options and keeps a record of what each
// call did: stage transitions, parser recoveries, dropped fields and, for
// failed calls, a failure trace.
class Converter {
public:
    explicit Converter(Options options = {});

    ConvertResult convert(const std::string& html);
    ConvertResult convert(std::istream& input);
    ConvertResult convert_node(const html::Node& root);

    const Options& options() const { return options_; }

    core::DiagnosticLog& diagnostics() { return diagnostics_; }
    const core::DiagnosticLog& diagnostics() const { return diagnostics_; }
    const core::LifecycleTrace& trace() const { return trace_; }
    core::LifecycleStage current_stage() const { return stage_; }
    const std::vector<core::ConversionFailure>& failures() const { return failures_; }
    // Failure of the most recent call, or nullptr when it succeeded.
    const core::ConversionFailure* last_failure() const;

private:
    void begin_call();
    void transition_to(core::LifecycleStage stage, const std::string& detail = {});
    ConvertResult render(const html::Node& root);
    ConvertResult fail(const std::string& module, const std::string& message);

    Options options_;
    core::DiagnosticLog diagnostics_;
    core::LifecycleTrace trace_;
    std::vector<core::ConversionFailure> failures_;
    core::LifecycleStage stage_ = core::LifecycleStage::Idle;
    std::size_t input_bytes_ = 0;
};

}  // namespace html2org::convert
