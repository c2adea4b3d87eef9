#include "html2org/core/lifecycle.h"

namespace html2org::core {

const char* lifecycle_stage_name(LifecycleStage stage) {
    switch (stage) {
        case LifecycleStage::Idle:        return "idle";
        case LifecycleStage::Parsing:     return "parsing";
        case LifecycleStage::Collecting:  return "collecting";
        case LifecycleStage::Rendering:   return "rendering";
        case LifecycleStage::Normalizing: return "normalizing";
        case LifecycleStage::Complete:    return "complete";
        case LifecycleStage::Error:       return "error";
    }
    return "unknown";
}

void LifecycleTrace::record(LifecycleStage stage) {
    StageTimingEntry entry;
    entry.stage = stage;
    entry.entered_at = std::chrono::steady_clock::now();
    entry.elapsed_since_prev_ms = 0.0;

    if (!entries.empty()) {
        const auto delta = entry.entered_at - entries.back().entered_at;
        entry.elapsed_since_prev_ms =
            std::chrono::duration<double, std::milli>(delta).count();
    }

    entries.push_back(entry);
}

std::vector<LifecycleStage> LifecycleTrace::stages() const {
    std::vector<LifecycleStage> result;
    result.reserve(entries.size());
    for (const auto& entry : entries) {
        result.push_back(entry.stage);
    }
    return result;
}

double LifecycleTrace::total_elapsed_ms() const {
    double total = 0.0;
    for (const auto& entry : entries) {
        total += entry.elapsed_since_prev_ms;
    }
    return total;
}

}  // namespace html2org::core
