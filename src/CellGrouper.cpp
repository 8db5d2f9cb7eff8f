#include "CellGrouper.h"
#include "ClusterAssigner.h"
#include "CompositeBuilder.h"
#include "FeatureExtractor.h"
#include "GroupRemapper.h"
#include "ProvenanceWriter.h"

#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

static DirectoryReport runPipeline(const fs::path& cellDir, const fs::path& outputRoot, const GroupingOptions& options) {
    DirectoryReport report;
    report.cellDirectory = cellDir.string();

    const std::string dirName = cellDir.filename().string();
    const fs::path outDir = outputRoot / cellDir.parent_path().filename() / dirName;
    report.outputDirectory = outDir.string();

    ExtractionResult extraction =
        FeatureExtractor::extract(cellDir.string(), options.metric, options.cellPrefix, options.cellExtension);
    report.inputCount = static_cast<int>(extraction.samples.size()) + extraction.skippedCount;
    report.skippedCount = extraction.skippedCount;

    if (report.inputCount == 0) {
        report.error = "no cell images found";
        CV_LOG_WARNING(NULL, "No cell images found in " << cellDir.string());
        return report;
    }
    if (extraction.samples.empty()) {
        report.error = "no readable cell images";
        CV_LOG_WARNING(NULL, "No valid images to process in " << cellDir.string());
        return report;
    }
    if (extraction.zeroCount == static_cast<int>(extraction.samples.size())) {
        CV_LOG_ERROR(NULL, "All images in " << cellDir.string()
                           << " have zero intensity. Check image format or file corruption.");
    }

    std::vector<double> features;
    features.reserve(extraction.samples.size());
    for (const auto& s : extraction.samples) features.push_back(s.feature);

    int requestedBins = options.bins;
    if (options.autoBins) {
        requestedBins = ClusterAssigner::selectBinCount(features, options.maxBins, options);
        CV_LOG_INFO(NULL, "Selected " << requestedBins << " bins by BIC (max " << options.maxBins << ")");
    }
    report.requestedBins = requestedBins;

    const ClusterResult clusters = ClusterAssigner::assign(features, requestedBins, options);
    const LabelMapping mapping = GroupRemapper::remap(clusters);
    GroupRemapper::applyToSamples(clusters, mapping, extraction.samples);
    report.actualBins = clusters.actualBins;
    report.method = toString(clusters.methodUsed);
    report.converged = clusters.converged;

    std::error_code ec;
    fs::create_directories(outDir, ec);
    if (ec) {
        report.error = "cannot create output directory: " + ec.message();
        CV_LOG_ERROR(NULL, "Cannot create " << outDir.string() << ": " << ec.message());
        return report;
    }

    const std::vector<CompositeWriteResult> composites = CompositeBuilder::buildAndWrite(
        extraction.samples, mapping, outDir.string(), dirName, extraction.referenceResolution);

    std::vector<GroupSummary> groups = ProvenanceWriter::summarizeGroups(extraction.samples, mapping);
    for (const auto& c : composites) {
        if (!c.written) continue;
        report.compositesWritten++;
        groups[static_cast<size_t>(c.groupId - 1)].compositeFile = fs::path(c.path).filename().string();
    }

    GroupingInfo info;
    info.cellDirectory = cellDir.string();
    info.metric = options.metric;
    info.forceRedistribute = options.forceRedistribute;
    info.zeroCount = extraction.zeroCount;
    info.nonZeroCount = extraction.nonZeroCount;

    const fs::path csvPath = outDir / ProvenanceWriter::csvFileName(dirName);
    const fs::path infoPath = outDir / ProvenanceWriter::infoFileName(dirName);
    std::vector<std::string> failed;
    if (!ProvenanceWriter::writeGroupingInfo(infoPath.string(), info, clusters, extraction.samples, groups)) {
        failed.push_back(infoPath.filename().string());
    }
    CV_LOG_INFO(NULL, "Saving cell group mapping to " << csvPath.string());
    if (!ProvenanceWriter::writeCellGroupsCsv(csvPath.string(), extraction.samples, groups, options.metric)) {
        failed.push_back(csvPath.filename().string());
    }

    report.groups = std::move(groups);
    report.ok = report.compositesWritten > 0;
    if (!report.ok) {
        report.error = "no composite image written";
    } else if (!failed.empty()) {
        // Composites exist, so the directory still counts; the missing records are reported.
        report.error = "failed to write";
        for (const auto& f : failed) report.error += " " + f;
    }
    return report;
}

} // namespace

DirectoryReport CellGrouper::groupAndSumCells(const std::string& cellDir, const std::string& outputRoot,
                                              const GroupingOptions& options) {
    try {
        return runPipeline(fs::path(cellDir), fs::path(outputRoot), options);
    } catch (const std::exception& e) {
        CV_LOG_ERROR(NULL, "Grouping failed for " << cellDir << ": " << e.what());
        DirectoryReport report;
        report.cellDirectory = cellDir;
        report.error = e.what();
        return report;
    }
}

bool CellGrouper::matchesChannels(const std::string& cellDir, const std::vector<std::string>& channels) {
    if (channels.empty()) return true;
    return std::any_of(channels.begin(), channels.end(),
                       [&](const std::string& ch) { return cellDir.find(ch) != std::string::npos; });
}

std::vector<std::string> CellGrouper::findCellDirectories(const std::string& cellsRoot, const GroupingOptions& options) {
    std::vector<std::string> dirs;
    std::error_code ec;
    if (!fs::is_directory(cellsRoot, ec)) return dirs;

    auto hasCells = [&](const fs::path& dir) {
        return !FeatureExtractor::listCellImages(dir.string(), options.cellPrefix, options.cellExtension).empty();
    };

    if (hasCells(cellsRoot)) dirs.push_back(fs::path(cellsRoot).string());
    for (auto it = fs::recursive_directory_iterator(cellsRoot, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        std::error_code entryEc;
        if (!it->is_directory(entryEc)) continue;
        if (hasCells(it->path())) dirs.push_back(it->path().string());
    }
    std::sort(dirs.begin(), dirs.end());
    return dirs;
}
