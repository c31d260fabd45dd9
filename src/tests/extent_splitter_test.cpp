#include <gtest/gtest.h>
#include <filesystem>
#include <sstream>
#include <vector>
#include "transfer/extent_splitter.hpp"
#include "transfer/transfer_error.hpp"
#include "test_utils.hpp"

using namespace distore::transfer;

class ExtentSplitterTest : public ::testing::Test {
protected:
  TempDir dir{"extent_splitter_test"};

  void SetUp() override {
    init_test_logging();
  }

  std::filesystem::path make_source(const std::string& name, const std::string& data) {
    std::filesystem::path path = dir.path() / name;
    write_test_file(path, data);
    return path;
  }
};

TEST_F(ExtentSplitterTest, SplitsIntoFixedSizeExtentsWithShortLast) {
  auto source = make_source("data.bin", pattern_data(25));
  ExtentSplitter splitter(10);

  auto extents = splitter.split(source, dir.path() / "parts");

  ASSERT_EQ(extents.size(), 3u);
  EXPECT_EQ(extents[0].size, 10u);
  EXPECT_EQ(extents[1].size, 10u);
  EXPECT_EQ(extents[2].size, 5u);
  for (std::uint32_t i = 0; i < extents.size(); ++i) {
    EXPECT_EQ(extents[i].index, i);
    EXPECT_EQ(extents[i].path.filename().string(), "data.bin.part" + std::to_string(i));
    EXPECT_TRUE(std::filesystem::exists(extents[i].path));
  }
  EXPECT_EQ(read_test_file(extents[2].path), pattern_data(25).substr(20));
}

TEST_F(ExtentSplitterTest, ExactMultipleHasNoEmptyExtent) {
  auto source = make_source("even.bin", pattern_data(30));
  ExtentSplitter splitter(10);

  auto extents = splitter.split(source, dir.path() / "parts");

  ASSERT_EQ(extents.size(), 3u);
  EXPECT_EQ(extents.back().size, 10u);
}

TEST_F(ExtentSplitterTest, EmptyFileGivesNoExtents) {
  auto source = make_source("empty.bin", "");
  ExtentSplitter splitter(10);
  std::vector<double> fractions;

  auto extents = splitter.split(source, dir.path() / "parts",
                                [&fractions](double f) { fractions.push_back(f); });

  EXPECT_TRUE(extents.empty());
  ASSERT_FALSE(fractions.empty());
  EXPECT_DOUBLE_EQ(fractions.back(), 1.0);
}

TEST_F(ExtentSplitterTest, ProgressIsMonotonicAndEndsAtOne) {
  auto source = make_source("progress.bin", pattern_data(95));
  ExtentSplitter splitter(10);
  std::vector<double> fractions;

  splitter.split(source, dir.path() / "parts", [&fractions](double f) { fractions.push_back(f); });

  ASSERT_EQ(fractions.size(), 10u);
  for (std::size_t i = 1; i < fractions.size(); ++i) {
    EXPECT_GE(fractions[i], fractions[i - 1]);
  }
  EXPECT_DOUBLE_EQ(fractions.back(), 1.0);
}

TEST_F(ExtentSplitterTest, StreamOfUnknownLengthReportsCompletedSteps) {
  std::istringstream stream(pattern_data(23));
  ExtentSplitter splitter(10);
  std::vector<double> fractions;

  auto extents = splitter.split(stream, "stream.bin", std::nullopt, dir.path() / "parts",
                                [&fractions](double f) { fractions.push_back(f); });

  ASSERT_EQ(extents.size(), 3u);
  EXPECT_EQ(extents[2].size, 3u);
  for (double fraction : fractions) {
    EXPECT_DOUBLE_EQ(fraction, 1.0);
  }
}

TEST_F(ExtentSplitterTest, FindsExtentsInNumericOrder) {
  auto source = make_source("many.bin", pattern_data(125));
  ExtentSplitter splitter(10);
  splitter.split(source, dir.path() / "parts");

  // Unrelated and padded names are ignored
  write_test_file(dir.path() / "parts" / "many.bin.part01", "x");
  write_test_file(dir.path() / "parts" / "many.bin.partx", "x");
  write_test_file(dir.path() / "parts" / "other.bin.part0", "x");

  auto extents = ExtentSplitter::find_extents("many.bin", dir.path() / "parts");

  ASSERT_EQ(extents.size(), 13u);
  for (std::uint32_t i = 0; i < extents.size(); ++i) {
    EXPECT_EQ(extents[i].index, i);
  }
  EXPECT_EQ(extents[10].path.filename().string(), "many.bin.part10");
}

TEST_F(ExtentSplitterTest, AssemblesSourceBytes) {
  const std::string data = pattern_data(125);
  auto source = make_source("joined.bin", data);
  ExtentSplitter splitter(10);
  splitter.split(source, dir.path() / "parts");

  std::vector<double> fractions;
  auto written = splitter.assemble("joined.bin", dir.path() / "parts", dir.path() / "out.bin",
                                   [&fractions](double f) { fractions.push_back(f); });

  EXPECT_EQ(written, data.size());
  EXPECT_EQ(read_test_file(dir.path() / "out.bin"), data);
  ASSERT_EQ(fractions.size(), 13u);
  EXPECT_DOUBLE_EQ(fractions.back(), 1.0);
}

TEST_F(ExtentSplitterTest, AssembleFailsOnGap) {
  auto source = make_source("gap.bin", pattern_data(30));
  ExtentSplitter splitter(10);
  auto extents = splitter.split(source, dir.path() / "parts");
  std::filesystem::remove(extents[1].path);

  EXPECT_THROW(splitter.assemble("gap.bin", dir.path() / "parts", dir.path() / "out.bin"), IoError);
}

TEST_F(ExtentSplitterTest, EmptyFileRoundTrip) {
  auto source = make_source("empty.bin", "");
  ExtentSplitter splitter(10);
  ASSERT_TRUE(splitter.split(source, dir.path() / "parts").empty());

  std::vector<double> fractions;
  auto written = splitter.assemble("empty.bin", dir.path() / "parts", dir.path() / "out.bin",
                                   [&fractions](double f) { fractions.push_back(f); });

  EXPECT_EQ(written, 0u);
  ASSERT_TRUE(std::filesystem::exists(dir.path() / "out.bin"));
  EXPECT_EQ(std::filesystem::file_size(dir.path() / "out.bin"), 0u);
  ASSERT_FALSE(fractions.empty());
  EXPECT_DOUBLE_EQ(fractions.back(), 1.0);
}

TEST_F(ExtentSplitterTest, AssembleFailsOnMissingDirectory) {
  ExtentSplitter splitter(10);
  EXPECT_THROW(splitter.assemble("missing.bin", dir.path() / "absent", dir.path() / "out.bin"), IoError);
}

TEST_F(ExtentSplitterTest, MissingSourceIsIoError) {
  ExtentSplitter splitter(10);
  EXPECT_THROW(splitter.split(dir.path() / "nope.bin", dir.path() / "parts"), IoError);
}

TEST_F(ExtentSplitterTest, ParsesExtentIndices) {
  EXPECT_EQ(ExtentSplitter::parse_extent_index("a.txt", "a.txt.part0"), 0u);
  EXPECT_EQ(ExtentSplitter::parse_extent_index("a.txt", "a.txt.part12"), 12u);
  EXPECT_FALSE(ExtentSplitter::parse_extent_index("a.txt", "a.txt.part").has_value());
  EXPECT_FALSE(ExtentSplitter::parse_extent_index("a.txt", "a.txt.part007").has_value());
  EXPECT_FALSE(ExtentSplitter::parse_extent_index("a.txt", "b.txt.part1").has_value());
  EXPECT_FALSE(ExtentSplitter::parse_extent_index("a.txt", "a.txt.part99999999999").has_value());
}

TEST_F(ExtentSplitterTest, ZeroExtentSizeIsRejected) {
  EXPECT_THROW(ExtentSplitter splitter(0), std::invalid_argument);
}
