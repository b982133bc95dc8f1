#include "output_plan.hpp"

#include "writer_md.hpp"
#include "writer_xml.hpp"

#include <system_error>

const char* batch_outcome_name(BatchOutcome outcome) {
    switch (outcome) {
    case BatchOutcome::Ordered:
        return "ordered";
    case BatchOutcome::UploadOrder:
        return "upload-order";
    case BatchOutcome::Failed:
        return "failed";
    case BatchOutcome::Empty:
        return "empty";
    }
    return "unknown";
}

std::filesystem::path output_stem_for(
    const std::filesystem::path& input_root,
    bool root_is_dir,
    const FragmentBatch& batch
) {
    std::error_code ec;
    const bool source_is_file = std::filesystem::is_regular_file(batch.source_path, ec);
    if (root_is_dir && source_is_file) {
        auto rel = std::filesystem::relative(batch.source_path, input_root, ec);
        if (!ec && !rel.empty()) {
            rel.replace_extension();
            return rel;
        }
    }
    if (source_is_file) {
        return batch.source_path.stem();
    }
    return batch.name;
}

OutputPlan plan_batch_output(
    const AppConfig& config,
    bool input_is_dir,
    const FragmentBatch& batch,
    const BatchResult& result
) {
    OutputPlan plan;
    plan.stem = output_stem_for(config.input_path, input_is_dir, batch);

    if (result.ok) {
        plan.outcome = BatchOutcome::Ordered;
        plan.computed_order = true;
    } else if (result.failure.kind == SequenceErrorKind::EmptyInput) {
        plan.outcome = BatchOutcome::Empty;
    } else if (config.fallback_upload_order) {
        plan.outcome = BatchOutcome::UploadOrder;
    } else {
        plan.outcome = BatchOutcome::Failed;
    }
    return plan;
}

bool write_planned_outputs(
    const AppConfig& config,
    const FragmentBatch& batch,
    const BatchResult& result,
    const OutputPlan& plan,
    std::string& error
) {
    if (plan.outcome != BatchOutcome::Ordered && plan.outcome != BatchOutcome::UploadOrder) {
        return true;
    }
    const auto& fragments = plan.computed_order ? result.ordered : batch.segments;

    const auto base = config.output_dir / plan.stem;
    if (base.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(base.parent_path(), ec);
        if (ec) {
            error = "Failed to create output directory " + base.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    if (config.emit_xml) {
        auto xml_path = base;
        xml_path += ".order.xml";
        if (!write_ordered_manifest(xml_path, batch, fragments, plan.computed_order, error)) {
            return false;
        }
    }

    if (config.emit_markdown) {
        auto md_path = base;
        md_path += ".order.md";
        if (!write_markdown_ordering(md_path, batch, fragments, plan.computed_order, error)) {
            return false;
        }
    }

    return true;
}
