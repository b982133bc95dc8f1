#include <gtest/gtest.h>

#include "fragment_reader.hpp"
#include "test_support.hpp"

TEST(FragmentReaderTest, NormalizesExtractedLines) {
    EXPECT_EQ(normalize_extracted_text("  Hello there \r\n\n   general  \n"), "Hello there\ngeneral");
    EXPECT_EQ(normalize_extracted_text(" \n\t\n"), "");
    EXPECT_EQ(normalize_extracted_text("single"), "single");
}

TEST(FragmentReaderTest, ReadsManifestInDocumentOrder) {
    TempDir dir("manifest");
    const auto path = dir.write("strip.xml",
        "<?xml version=\"1.0\"?>\n"
        "<fragments name=\"sunday strip\">\n"
        "  <fragment name=\"p3.png\">\n"
        "    WAIT FOR ME!\n"
        "    I'M COMING\n"
        "  </fragment>\n"
        "  <note>ignored</note>\n"
        "  <fragment name=\"p1.png\"><line>HELLO</line><line>  THERE </line></fragment>\n"
        "  <fragment/>\n"
        "</fragments>\n");

    FragmentBatch batch;
    std::string error;
    ASSERT_TRUE(read_fragment_manifest(path, batch, error)) << error;

    EXPECT_EQ(batch.name, "sunday strip");
    EXPECT_EQ(batch.source_path.string(), path.string());
    ASSERT_EQ(batch.segments.size(), 3u);

    EXPECT_EQ(batch.segments[0].index, 0u);
    EXPECT_EQ(batch.segments[0].id, "p3.png");
    EXPECT_EQ(batch.segments[0].text, "WAIT FOR ME!\nI'M COMING");

    EXPECT_EQ(batch.segments[1].id, "p1.png");
    EXPECT_EQ(batch.segments[1].text, "HELLO\nTHERE");

    EXPECT_EQ(batch.segments[2].index, 2u);
    EXPECT_EQ(batch.segments[2].id, "fragment-2");
    EXPECT_EQ(batch.segments[2].text, "");
}

TEST(FragmentReaderTest, ManifestNameDefaultsToFileStem) {
    TempDir dir("manifest-stem");
    const auto path = dir.write("monday.xml", "<fragments/>");

    FragmentBatch batch;
    std::string error;
    ASSERT_TRUE(read_fragment_manifest(path, batch, error)) << error;
    EXPECT_EQ(batch.name, "monday");
    EXPECT_TRUE(batch.segments.empty());
}

TEST(FragmentReaderTest, RejectsBrokenManifests) {
    TempDir dir("manifest-bad");
    FragmentBatch batch;
    std::string error;

    EXPECT_FALSE(read_fragment_manifest(dir.write("broken.xml", "<fragments><fragment>"), batch, error));
    EXPECT_NE(error.find("Failed to parse XML"), std::string::npos);

    error.clear();
    EXPECT_FALSE(read_fragment_manifest(dir.write("other.xml", "<TEI><body/></TEI>"), batch, error));
    EXPECT_NE(error.find("<fragments>"), std::string::npos);
}

TEST(FragmentReaderTest, ReadsTextDirectoryInFileNameOrder) {
    TempDir dir("textdir");
    dir.write("b.txt", "SECOND\n");
    dir.write("a.txt", "  FIRST  line\n\n");
    dir.write("c.md", "not a fragment");
    dir.write("d.TXT", "");

    FragmentBatch batch;
    std::string error;
    ASSERT_TRUE(read_text_directory(dir.path(), batch, error)) << error;

    ASSERT_EQ(batch.segments.size(), 3u);
    EXPECT_EQ(batch.segments[0].id, "a.txt");
    EXPECT_EQ(batch.segments[0].text, "FIRST  line");
    EXPECT_EQ(batch.segments[1].id, "b.txt");
    EXPECT_EQ(batch.segments[2].id, "d.TXT");
    EXPECT_EQ(batch.segments[2].text, "");
    EXPECT_EQ(batch.name, dir.path().filename().string());
}

TEST(FragmentReaderTest, CollectsSingleManifest) {
    TempDir dir("collect-one");
    const auto path = dir.write("strip.xml", "<fragments><fragment name=\"a\">x</fragment></fragments>");

    std::vector<FragmentBatch> batches;
    std::string error;
    ASSERT_TRUE(collect_fragment_batches(path, dir.path() / "out", batches, error)) << error;
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0].segments.size(), 1u);
}

TEST(FragmentReaderTest, CollectsOneBatchPerManifestAndSkipsOutput) {
    TempDir dir("collect-many");
    dir.write("week1/mon.xml", "<fragments><fragment>a</fragment></fragments>");
    dir.write("week1/tue.xml", "<fragments><fragment>b</fragment><fragment>c</fragment></fragments>");
    dir.write("week2/wed.xml", "<fragments/>");
    dir.write("out/mon.order.xml", "<fragments ordered=\"true\"/>");
    dir.write("week2/notes.txt", "text files are ignored when manifests exist");

    std::vector<FragmentBatch> batches;
    std::string error;
    ASSERT_TRUE(collect_fragment_batches(dir.path(), dir.path() / "out", batches, error)) << error;

    ASSERT_EQ(batches.size(), 3u);
    EXPECT_EQ(batches[0].name, "mon");
    EXPECT_EQ(batches[1].name, "tue");
    EXPECT_EQ(batches[1].segments.size(), 2u);
    EXPECT_EQ(batches[2].name, "wed");
}

TEST(FragmentReaderTest, KeepsSiblingsThatShareTheOutputPrefix) {
    TempDir dir("collect-prefix");
    dir.write("outtakes/strip.xml", "<fragments><fragment>a</fragment></fragments>");
    dir.write("out-of-order.xml", "<fragments><fragment>b</fragment></fragments>");
    dir.write("out/strip.order.xml", "<fragments ordered=\"true\"/>");

    std::vector<FragmentBatch> batches;
    std::string error;
    ASSERT_TRUE(collect_fragment_batches(dir.path(), dir.path() / "out", batches, error)) << error;

    ASSERT_EQ(batches.size(), 2u);
    EXPECT_EQ(batches[0].name, "out-of-order");
    EXPECT_EQ(batches[1].name, "strip");
    EXPECT_EQ(batches[1].source_path.filename().string(), "strip.xml");
}

TEST(FragmentReaderTest, SkipsOutputGivenWithTrailingSeparator) {
    TempDir dir("collect-slash");
    dir.write("mon.xml", "<fragments><fragment>a</fragment></fragments>");
    dir.write("out/mon.order.xml", "<fragments ordered=\"true\"/>");

    std::vector<FragmentBatch> batches;
    std::string error;
    ASSERT_TRUE(collect_fragment_batches(dir.path(), dir.path() / "out" / "", batches, error)) << error;

    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0].name, "mon");
}

TEST(FragmentReaderTest, UnreadableSubdirectoryIsReportedNotThrown) {
    TempDir dir("collect-locked");
    dir.write("mon.xml", "<fragments><fragment>a</fragment></fragments>");
    dir.write("locked/tue.xml", "<fragments><fragment>b</fragment></fragments>");
    const auto locked = dir.path() / "locked";
    std::filesystem::permissions(locked, std::filesystem::perms::none);

    std::vector<FragmentBatch> batches;
    std::string error;
    bool ok = false;
    EXPECT_NO_THROW(ok = collect_fragment_batches(dir.path(), {}, batches, error));

    std::filesystem::permissions(locked, std::filesystem::perms::owner_all);

    // Privileged users can still read the directory.
    if (ok) {
        EXPECT_EQ(batches.size(), 2u);
    } else {
        EXPECT_NE(error.find("Failed to scan directory"), std::string::npos) << error;
        EXPECT_TRUE(batches.empty());
    }
}

TEST(FragmentReaderTest, FallsBackToTextFiles) {
    TempDir dir("collect-text");
    dir.write("panel2.txt", "two");
    dir.write("panel1.txt", "one");

    std::vector<FragmentBatch> batches;
    std::string error;
    ASSERT_TRUE(collect_fragment_batches(dir.path(), {}, batches, error)) << error;
    ASSERT_EQ(batches.size(), 1u);
    ASSERT_EQ(batches[0].segments.size(), 2u);
    EXPECT_EQ(batches[0].segments[0].text, "one");
}

TEST(FragmentReaderTest, ReportsUnusableInputs) {
    TempDir dir("collect-bad");
    std::vector<FragmentBatch> batches;
    std::string error;

    EXPECT_FALSE(collect_fragment_batches(dir.path() / "nope", {}, batches, error));
    EXPECT_NE(error.find("does not exist"), std::string::npos);

    EXPECT_FALSE(collect_fragment_batches(dir.path(), {}, batches, error));
    EXPECT_NE(error.find("No fragment manifests"), std::string::npos);

    EXPECT_FALSE(collect_fragment_batches(dir.write("panel.txt", "x"), {}, batches, error));
    EXPECT_NE(error.find("not an XML manifest"), std::string::npos);
}
