#include <gtest/gtest.h>

#include "output_plan.hpp"
#include "test_support.hpp"

#include <pugixml.hpp>

namespace {

FragmentBatch batch_from(const std::filesystem::path& source, const std::string& name) {
    FragmentBatch batch;
    batch.source_path = source;
    batch.name = name;
    batch.segments = {
        Segment{0, "a.png", "FIRST"},
        Segment{1, "b.png", "SECOND"},
        Segment{2, "c.png", "THIRD"},
    };
    return batch;
}

BatchResult failed_result(SequenceErrorKind kind) {
    BatchResult result;
    result.ok = false;
    result.failure.kind = kind;
    result.failure.step = 1;
    result.failure.message = "no comparable distance";
    return result;
}

AppConfig config_for(const std::filesystem::path& input, const std::filesystem::path& output) {
    AppConfig config;
    config.input_path = input;
    config.output_dir = output;
    return config;
}

}  // namespace

TEST(OutputPlanTest, NestedManifestKeepsRelativePath) {
    TempDir dir("plan-nested");
    const auto manifest = dir.write("in/week1/mon.xml", "<fragments/>");

    const auto stem = output_stem_for(dir.path() / "in", true, batch_from(manifest, "Monday"));

    EXPECT_EQ(stem.generic_string(), "week1/mon");
}

TEST(OutputPlanTest, SingleManifestUsesFileStem) {
    TempDir dir("plan-single");
    const auto manifest = dir.write("strip.xml", "<fragments/>");

    const auto stem = output_stem_for(manifest, false, batch_from(manifest, "Sunday strip"));

    EXPECT_EQ(stem.string(), "strip");
}

TEST(OutputPlanTest, TextDirectoryUsesBatchName) {
    TempDir dir("plan-textdir");
    dir.write("panels/p1.txt", "HI");
    const auto panels = dir.path() / "panels";

    const auto stem = output_stem_for(panels, true, batch_from(panels, "panels"));

    EXPECT_EQ(stem.string(), "panels");
}

TEST(OutputPlanTest, SuccessfulBatchWritesComputedOrder) {
    TempDir dir("plan-ok");
    const auto manifest = dir.write("in/strip.xml", "<fragments/>");
    auto config = config_for(dir.path() / "in", dir.path() / "out");
    config.emit_markdown = true;
    const auto batch = batch_from(manifest, "strip");

    BatchResult result;
    result.ok = true;
    result.ordered = {batch.segments[2], batch.segments[0], batch.segments[1]};

    const auto plan = plan_batch_output(config, true, batch, result);
    EXPECT_EQ(plan.outcome, BatchOutcome::Ordered);
    EXPECT_TRUE(plan.computed_order);

    std::string error;
    ASSERT_TRUE(write_planned_outputs(config, batch, result, plan, error)) << error;

    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_file((dir.path() / "out" / "strip.order.xml").c_str()));
    const auto root = doc.child("fragments");
    EXPECT_TRUE(root.attribute("ordered").as_bool());
    EXPECT_STREQ(root.child("fragment").attribute("name").as_string(), "c.png");
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "out" / "strip.order.md"));
}

TEST(OutputPlanTest, FailedBatchWithoutFallbackWritesNothing) {
    TempDir dir("plan-failed");
    const auto manifest = dir.write("in/week1/mon.xml", "<fragments/>");
    const auto config = config_for(dir.path() / "in", dir.path() / "out");
    const auto batch = batch_from(manifest, "mon");
    const auto result = failed_result(SequenceErrorKind::NoSelectableCandidate);

    const auto plan = plan_batch_output(config, true, batch, result);
    EXPECT_EQ(plan.outcome, BatchOutcome::Failed);
    EXPECT_STREQ(batch_outcome_name(plan.outcome), "failed");

    std::string error;
    ASSERT_TRUE(write_planned_outputs(config, batch, result, plan, error)) << error;
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "out" / "week1" / "mon.order.xml"));
}

TEST(OutputPlanTest, FailedBatchWithFallbackWritesUploadOrder) {
    TempDir dir("plan-fallback");
    const auto manifest = dir.write("in/week1/mon.xml", "<fragments/>");
    auto config = config_for(dir.path() / "in", dir.path() / "out");
    config.fallback_upload_order = true;
    const auto batch = batch_from(manifest, "mon");
    const auto result = failed_result(SequenceErrorKind::OracleFailure);

    const auto plan = plan_batch_output(config, true, batch, result);
    EXPECT_EQ(plan.outcome, BatchOutcome::UploadOrder);
    EXPECT_FALSE(plan.computed_order);
    EXPECT_EQ(plan.stem.generic_string(), "week1/mon");

    std::string error;
    ASSERT_TRUE(write_planned_outputs(config, batch, result, plan, error)) << error;

    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_file((dir.path() / "out" / "week1" / "mon.order.xml").c_str()));
    const auto root = doc.child("fragments");
    EXPECT_FALSE(root.attribute("ordered").as_bool(true));

    std::vector<std::string> names;
    for (const auto& fragment : root.children("fragment")) {
        names.emplace_back(fragment.attribute("name").as_string());
    }
    EXPECT_EQ(names, (std::vector<std::string>{"a.png", "b.png", "c.png"}));
}

TEST(OutputPlanTest, EmptyBatchIsSkippedEvenWithFallback) {
    TempDir dir("plan-empty");
    const auto manifest = dir.write("in/blank.xml", "<fragments/>");
    auto config = config_for(dir.path() / "in", dir.path() / "out");
    config.fallback_upload_order = true;
    FragmentBatch batch;
    batch.source_path = manifest;
    batch.name = "blank";
    const auto result = failed_result(SequenceErrorKind::EmptyInput);

    const auto plan = plan_batch_output(config, true, batch, result);
    EXPECT_EQ(plan.outcome, BatchOutcome::Empty);

    std::string error;
    ASSERT_TRUE(write_planned_outputs(config, batch, result, plan, error)) << error;
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "out" / "blank.order.xml"));
}
