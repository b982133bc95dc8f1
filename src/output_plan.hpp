#pragma once

#include "config.hpp"
#include "fragment_reader.hpp"
#include "pipeline.hpp"

#include <filesystem>
#include <string>

enum class BatchOutcome {
    Ordered,      // computed reading order written
    UploadOrder,  // sequencing failed, upload order written with ordered="false"
    Failed,       // sequencing failed, nothing written
    Empty         // no fragments, nothing to render
};

struct OutputPlan {
    BatchOutcome outcome = BatchOutcome::Failed;
    std::filesystem::path stem;
    bool computed_order = false;
};

const char* batch_outcome_name(BatchOutcome outcome);

// Output stem for a batch: its path relative to a directory input with the
// extension dropped, the file stem of a single manifest, or the batch name.
std::filesystem::path output_stem_for(
    const std::filesystem::path& input_root,
    bool root_is_dir,
    const FragmentBatch& batch
);

OutputPlan plan_batch_output(
    const AppConfig& config,
    bool input_is_dir,
    const FragmentBatch& batch,
    const BatchResult& result
);

// Writes <output_dir>/<stem>.order.xml and/or .order.md as the plan says.
// Failed and Empty plans write nothing and succeed.
bool write_planned_outputs(
    const AppConfig& config,
    const FragmentBatch& batch,
    const BatchResult& result,
    const OutputPlan& plan,
    std::string& error
);
