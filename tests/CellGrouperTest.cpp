#include <gtest/gtest.h>
#include <fstream>
#include <set>
#include <sstream>
#include "CellGrouper.h"
#include "CompositeBuilder.h"
#include "ProvenanceWriter.h"
#include "TestImages.h"

namespace fs = std::filesystem;

namespace {

std::vector<std::string> splitCsv(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) fields.push_back(field);
    return fields;
}

// Four dim 10x10 cells, one dim 20x15 cell and five bright 10x10 cells.
fs::path makeTwoLevelDirectory(const fs::path& root) {
    const fs::path dir = root / "Cond_A" / "R_1";
    fs::create_directories(dir);
    for (int i = 1; i <= 4; ++i) testutil::writeCell(dir, "CELL" + std::to_string(i) + ".tif", testutil::constant16(10, 10, 1));
    testutil::writeCell(dir, "CELL5.tif", testutil::constant16(20, 15, 1));
    for (int i = 6; i <= 10; ++i) testutil::writeCell(dir, "CELL" + std::to_string(i) + ".tif", testutil::constant16(10, 10, 1000));
    return dir;
}

GroupingOptions kmeansOptions(int bins) {
    GroupingOptions o;
    o.bins = bins;
    o.method = ClusterMethod::KMeans;
    o.logTransform = false;
    return o;
}

} // namespace

TEST(CellGrouper, GroupsDirectoryAndWritesOutputs) {
    testutil::TempDir tmp;
    const fs::path cells = makeTwoLevelDirectory(tmp.path() / "cells");
    const fs::path outRoot = tmp / "out";

    const DirectoryReport report = CellGrouper::groupAndSumCells(cells.string(), outRoot.string(), kmeansOptions(2));
    ASSERT_TRUE(report.ok) << report.error;
    EXPECT_EQ(report.inputCount, 10);
    EXPECT_EQ(report.actualBins, 2);
    EXPECT_EQ(report.compositesWritten, 2);
    ASSERT_EQ(report.groups.size(), 2u);
    EXPECT_EQ(report.groups[0].cellCount, 5);
    EXPECT_EQ(report.groups[1].cellCount, 5);
    EXPECT_LT(report.groups[0].meanFeature, report.groups[1].meanFeature);

    const fs::path outDir = outRoot / "Cond_A" / "R_1";
    EXPECT_EQ(report.outputDirectory, outDir.string());

    const cv::Mat bin1 = cv::imread((outDir / "R_1_bin_1.tif").string(), cv::IMREAD_UNCHANGED);
    const cv::Mat bin2 = cv::imread((outDir / "R_1_bin_2.tif").string(), cv::IMREAD_UNCHANGED);
    ASSERT_FALSE(bin1.empty());
    ASSERT_FALSE(bin2.empty());
    EXPECT_EQ(bin1.type(), CV_16UC1);
    EXPECT_EQ(bin1.size(), cv::Size(15, 20));
    EXPECT_EQ(bin2.size(), cv::Size(10, 10));

    const auto lines = testutil::readLines(outDir / ProvenanceWriter::csvFileName("R_1"));
    ASSERT_EQ(lines.size(), 11u);
    std::set<std::string> seen;
    for (size_t i = 1; i < lines.size(); ++i) {
        const auto fields = splitCsv(lines[i]);
        ASSERT_EQ(fields.size(), 6u) << lines[i];
        seen.insert(fields[1]);
        const int id = std::stoi(fields[1]);
        EXPECT_EQ(fields[2], id <= 5 ? "1" : "2") << lines[i];
    }
    EXPECT_EQ(seen.size(), 10u);
    EXPECT_TRUE(fs::exists(outDir / ProvenanceWriter::infoFileName("R_1")));
    EXPECT_TRUE(report.error.empty()) << report.error;
}

TEST(CellGrouper, RerunWithFewerBinsRemovesStaleComposites) {
    testutil::TempDir tmp;
    const fs::path cells = makeTwoLevelDirectory(tmp.path() / "cells");
    const fs::path outRoot = tmp / "out";
    const fs::path outDir = outRoot / "Cond_A" / "R_1";

    ASSERT_TRUE(CellGrouper::groupAndSumCells(cells.string(), outRoot.string(), kmeansOptions(2)).ok);
    ASSERT_TRUE(fs::exists(outDir / "R_1_bin_2.tif"));

    const DirectoryReport again = CellGrouper::groupAndSumCells(cells.string(), outRoot.string(), kmeansOptions(1));
    ASSERT_TRUE(again.ok) << again.error;
    EXPECT_EQ(again.actualBins, 1);
    EXPECT_TRUE(fs::exists(outDir / "R_1_bin_1.tif"));
    EXPECT_FALSE(fs::exists(outDir / "R_1_bin_2.tif"));
    EXPECT_EQ(testutil::readLines(outDir / ProvenanceWriter::csvFileName("R_1")).size(), 11u);
}

TEST(CellGrouper, ReportsProvenanceWriteFailure) {
    testutil::TempDir tmp;
    const fs::path cells = makeTwoLevelDirectory(tmp.path() / "cells");
    const fs::path outDir = tmp / "out" / "Cond_A" / "R_1";
    // A directory squatting on the CSV name makes the CSV unwritable.
    fs::create_directories(outDir / ProvenanceWriter::csvFileName("R_1"));

    const DirectoryReport report =
        CellGrouper::groupAndSumCells(cells.string(), (tmp / "out").string(), kmeansOptions(2));
    EXPECT_TRUE(report.ok);
    EXPECT_EQ(report.compositesWritten, 2);
    EXPECT_NE(report.error.find(ProvenanceWriter::csvFileName("R_1")), std::string::npos) << report.error;
    EXPECT_EQ(report.error.find(ProvenanceWriter::infoFileName("R_1")), std::string::npos) << report.error;
}

TEST(CellGrouper, ZeroIntensityCellsStillProduceBins) {
    testutil::TempDir tmp;
    const fs::path dir = tmp / "cells" / "Cond_B" / "R_2";
    fs::create_directories(dir);
    for (int i = 1; i <= 3; ++i) testutil::writeCell(dir, "CELL" + std::to_string(i) + ".tif", testutil::constant16(8, 8, 0));

    GroupingOptions o;
    o.bins = 5;
    const DirectoryReport report = CellGrouper::groupAndSumCells(dir.string(), (tmp / "out").string(), o);
    ASSERT_TRUE(report.ok) << report.error;
    EXPECT_EQ(report.requestedBins, 5);
    EXPECT_EQ(report.actualBins, 3);
    EXPECT_EQ(report.method, "forced_quantile");
    for (const auto& g : report.groups) EXPECT_EQ(g.cellCount, 1);

    const cv::Mat bin = cv::imread((tmp / "out" / "Cond_B" / "R_2" / "R_2_bin_3.tif").string(), cv::IMREAD_UNCHANGED);
    ASSERT_FALSE(bin.empty());
    EXPECT_EQ(cv::countNonZero(bin), 0);
}

TEST(CellGrouper, EmptyDirectoryFails) {
    testutil::TempDir tmp;
    fs::create_directories(tmp / "cells" / "Cond_A" / "R_9");
    const DirectoryReport report =
        CellGrouper::groupAndSumCells((tmp / "cells" / "Cond_A" / "R_9").string(), (tmp / "out").string(), GroupingOptions{});
    EXPECT_FALSE(report.ok);
    EXPECT_FALSE(report.error.empty());
    EXPECT_EQ(report.compositesWritten, 0);
    EXPECT_FALSE(fs::exists(tmp / "out" / "Cond_A" / "R_9"));
}

TEST(CellGrouper, AutoBinsPicksAtLeastTwoForSeparatedLevels) {
    testutil::TempDir tmp;
    const fs::path cells = makeTwoLevelDirectory(tmp.path() / "cells");
    GroupingOptions o = kmeansOptions(1);
    o.autoBins = true;
    o.maxBins = 3;
    const DirectoryReport report = CellGrouper::groupAndSumCells(cells.string(), (tmp / "out").string(), o);
    ASSERT_TRUE(report.ok) << report.error;
    EXPECT_GE(report.requestedBins, 2);
    EXPECT_EQ(report.actualBins, report.requestedBins);
}

TEST(CellGrouper, FindsCellDirectoriesRecursively) {
    testutil::TempDir tmp;
    const fs::path root = tmp / "cells";
    fs::create_directories(root / "Cond_A" / "R_1_ch00");
    fs::create_directories(root / "Cond_A" / "R_2_ch01");
    fs::create_directories(root / "Cond_B" / "empty");
    testutil::writeCell(root / "Cond_A" / "R_1_ch00", "CELL1.tif", testutil::constant16(4, 4, 3));
    testutil::writeCell(root / "Cond_A" / "R_2_ch01", "CELL1.tif", testutil::constant16(4, 4, 3));
    std::ofstream(root / "Cond_B" / "empty" / "notes.txt") << "x";

    const auto dirs = CellGrouper::findCellDirectories(root.string(), GroupingOptions{});
    ASSERT_EQ(dirs.size(), 2u);
    EXPECT_EQ(fs::path(dirs[0]).filename().string(), "R_1_ch00");
    EXPECT_EQ(fs::path(dirs[1]).filename().string(), "R_2_ch01");

    EXPECT_TRUE(CellGrouper::matchesChannels(dirs[0], {}));
    EXPECT_TRUE(CellGrouper::matchesChannels(dirs[0], {"ch00"}));
    EXPECT_FALSE(CellGrouper::matchesChannels(dirs[1], {"ch00", "ch02"}));

    EXPECT_TRUE(CellGrouper::findCellDirectories((tmp / "missing").string(), GroupingOptions{}).empty());
}
