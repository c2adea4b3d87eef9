#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace html2org::core {

enum class LifecycleStage {
    Idle,
    Parsing,
    Collecting,
    Rendering,
    Normalizing,
    Complete,
    Error,
};

const char* lifecycle_stage_name(LifecycleStage stage);

struct StageTimingEntry {
    LifecycleStage stage;
    std::chrono::steady_clock::time_point entered_at;
    double elapsed_since_prev_ms = 0.0;
};

struct LifecycleTrace {
    std::vector<StageTimingEntry> entries;

    void record(LifecycleStage stage);
    std::vector<LifecycleStage> stages() const;
    double total_elapsed_ms() const;
};

}  // namespace html2org::core
