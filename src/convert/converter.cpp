#include "html2org/convert/converter.h"

#include <sstream>
#include <utility>

#include "html2org/convert/anchors.h"
#include "html2org/convert/render_context.h"
#include "html2org/convert/text_normalizer.h"
#include "html2org/html/html_parser.h"

namespace html2org::convert {

namespace {

bool read_stream(std::istream& input, std::string& out, std::string& err) {
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        err = "Failed to read input stream";
        return false;
    }
    out = buffer.str();
    return true;
}

}  // namespace

ConvertResult convert_node(const html::Node& root, const Options& options) {
    ConvertResult result;
    int form_counter = 0;
    result.ok = render_document(root, options, form_counter, nullptr, result.text,
                                result.message);
    if (!result.ok) {
        result.text.clear();
    }
    return result;
}

ConvertResult convert_string(const std::string& html, const Options& options) {
    const auto document = html::parse_html(html);
    return convert_node(*document, options);
}

ConvertResult convert_stream(std::istream& input, const Options& options) {
    std::string html;
    ConvertResult result;
    if (!read_stream(input, html, result.message)) {
        return result;
    }
    return convert_string(html, options);
}

Converter::Converter(Options options) : options_(std::move(options)) {}

void Converter::begin_call() {
    diagnostics_.begin_call();
    trace_ = {};
    input_bytes_ = 0;
    transition_to(core::LifecycleStage::Idle);
}

void Converter::transition_to(core::LifecycleStage stage, const std::string& detail) {
    stage_ = stage;
    trace_.record(stage);
    std::string message = std::string("Stage transition: ") + core::lifecycle_stage_name(stage);
    if (!detail.empty()) {
        message += " (" + detail + ")";
    }
    diagnostics_.report(core::Severity::Info, "convert", core::lifecycle_stage_name(stage), message);
}

const core::ConversionFailure* Converter::last_failure() const {
    if (failures_.empty() || failures_.back().call_id != diagnostics_.current_call()) {
        return nullptr;
    }
    return &failures_.back();
}

ConvertResult Converter::fail(const std::string& module, const std::string& message) {
    const std::string stage = core::lifecycle_stage_name(stage_);
    diagnostics_.report(core::Severity::Error, module, stage, message);
    core::ConversionFailure failure = core::capture_failure(diagnostics_, module, stage, message);
    failure.facts.emplace_back("input bytes", std::to_string(input_bytes_));
    if (!options_.base_url.empty()) {
        failure.facts.emplace_back("base URL", options_.base_url);
    }
    failures_.push_back(std::move(failure));
    transition_to(core::LifecycleStage::Error, message);

    ConvertResult result;
    result.message = message;
    return result;
}

ConvertResult Converter::convert(const std::string& html) {
    begin_call();
    input_bytes_ = html.size();

    transition_to(core::LifecycleStage::Parsing);
    html::ParseResult parsed = html::parse_html_with_diagnostics(html);
    for (const auto& warning : parsed.warnings) {
        std::string message = warning.message;
        if (!warning.recovery_action.empty()) {
            message += " (" + warning.recovery_action + ")";
        }
        diagnostics_.report(core::Severity::Warning, "html", "parsing", message);
    }
    return render(*parsed.document);
}

ConvertResult Converter::convert(std::istream& input) {
    std::string html;
    std::string err;
    if (!read_stream(input, html, err)) {
        begin_call();
        return fail("input", err);
    }
    return convert(html);
}

ConvertResult Converter::convert_node(const html::Node& root) {
    begin_call();
    return render(root);
}

ConvertResult Converter::render(const html::Node& root) {
    transition_to(core::LifecycleStage::Collecting);
    const FragmentSet fragments = collect_fragment_names(root);
    diagnostics_.report(core::Severity::Info, "convert", "collecting",
                        "In-page link targets: " + std::to_string(fragments.size()));

    transition_to(core::LifecycleStage::Rendering);
    int form_counter = 0;
    RenderContext context(RenderShared{options_, fragments, form_counter, &diagnostics_});
    std::string err;
    if (!context.render(root, err)) {
        return fail("render", err);
    }

    transition_to(core::LifecycleStage::Normalizing);
    ConvertResult result;
    result.text = normalize_output(context.take_output());
    result.ok = true;
    transition_to(core::LifecycleStage::Complete);
    return result;
}

}  // namespace html2org::convert
