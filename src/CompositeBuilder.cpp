#include "CompositeBuilder.h"
#include "CellImage.h"

#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

// "<dirName>_bin_<digits>.tif" -> digits as int, otherwise -1.
static int parseBinIndex(const std::string& fileName, const std::string& dirName) {
    const std::string prefix = dirName + "_bin_";
    const std::string suffix = ".tif";
    if (fileName.size() <= prefix.size() + suffix.size()) return -1;
    if (fileName.compare(0, prefix.size(), prefix) != 0) return -1;
    if (fileName.compare(fileName.size() - suffix.size(), suffix.size(), suffix) != 0) return -1;

    const std::string digits = fileName.substr(prefix.size(), fileName.size() - prefix.size() - suffix.size());
    if (digits.empty() || digits.size() > 9) return -1;
    for (const char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return -1;
    }
    return std::stoi(digits);
}

} // namespace

std::string CompositeBuilder::compositeFileName(const std::string& dirName, int groupId) {
    return dirName + "_bin_" + std::to_string(groupId) + ".tif";
}

std::vector<Group> CompositeBuilder::collectGroups(const std::vector<CellSample>& samples, const LabelMapping& mapping) {
    std::vector<Group> groups(mapping.size());
    for (size_t g = 0; g < groups.size(); ++g) groups[g].groupId = static_cast<int>(g) + 1;

    for (size_t i = 0; i < samples.size(); ++i) {
        if (!samples[i].groupId) continue;
        const int g = *samples[i].groupId - 1;
        if (g < 0 || g >= static_cast<int>(groups.size())) continue;
        groups[static_cast<size_t>(g)].members.push_back(i);
    }
    return groups;
}

void CompositeBuilder::accumulate(Group& group, const std::vector<CellSample>& samples) {
    group.canvasHeight = 0;
    group.canvasWidth = 0;
    for (const size_t i : group.members) {
        group.canvasHeight = std::max(group.canvasHeight, samples[i].image.rows);
        group.canvasWidth = std::max(group.canvasWidth, samples[i].image.cols);
    }
    if (group.canvasHeight <= 0 || group.canvasWidth <= 0) {
        group.accumulator.release();
        return;
    }

    group.accumulator = cv::Mat::zeros(group.canvasHeight, group.canvasWidth, CV_64FC1);
    for (const size_t i : group.members) {
        const cv::Mat fitted = CellImage::fitToCanvas(samples[i].image, group.canvasHeight, group.canvasWidth);
        cv::Mat fitted64;
        fitted.convertTo(fitted64, CV_64F);
        group.accumulator += fitted64;
    }
}

cv::Mat CompositeBuilder::normalizeTo16U(const cv::Mat& accumulator) {
    if (accumulator.empty()) return cv::Mat();
    double minVal = 0.0, maxVal = 0.0;
    cv::minMaxLoc(accumulator, &minVal, &maxVal);
    if (maxVal <= minVal) {
        return cv::Mat::zeros(accumulator.rows, accumulator.cols, CV_16UC1);
    }
    cv::Mat out;
    cv::normalize(accumulator, out, 0.0, 65535.0, cv::NORM_MINMAX, CV_16U);
    return out;
}

int CompositeBuilder::removeStaleComposites(const std::string& outputDir, const std::string& dirName, int keepBins) {
    std::error_code ec;
    if (!fs::is_directory(outputDir, ec)) return 0;

    std::vector<fs::path> stale;
    for (const auto& entry : fs::directory_iterator(outputDir, ec)) {
        if (!entry.is_regular_file()) continue;
        const int index = parseBinIndex(entry.path().filename().string(), dirName);
        if (index > keepBins) stale.push_back(entry.path());
    }

    int removed = 0;
    for (const auto& p : stale) {
        std::error_code rmEc;
        if (fs::remove(p, rmEc)) {
            removed++;
            CV_LOG_INFO(NULL, "Removed stale composite " << p.string());
        } else if (rmEc) {
            CV_LOG_WARNING(NULL, "Failed to remove stale composite " << p.string() << ": " << rmEc.message());
        }
    }
    return removed;
}

bool CompositeBuilder::writeComposite(const std::string& path, const cv::Mat& image16,
                                      const std::optional<TiffResolution>& resolution) {
    try {
        if (!cv::imwrite(path, image16)) return false;
    } catch (const cv::Exception& e) {
        CV_LOG_ERROR(NULL, "Failed to save " << path << ": " << e.what());
        return false;
    }
    // The pixels are on disk either way; a failed metadata update leaves a plain TIFF.
    if (resolution && !CellImage::writeTiffResolution(path, *resolution)) {
        CV_LOG_WARNING(NULL, "Saved " << path << " without resolution metadata");
    }
    return true;
}

std::vector<CompositeWriteResult> CompositeBuilder::buildAndWrite(const std::vector<CellSample>& samples,
                                                                  const LabelMapping& mapping,
                                                                  const std::string& outputDir,
                                                                  const std::string& dirName,
                                                                  const std::optional<TiffResolution>& resolution) {
    std::vector<CompositeWriteResult> results;
    removeStaleComposites(outputDir, dirName, static_cast<int>(mapping.size()));

    std::vector<Group> groups = collectGroups(samples, mapping);
    results.reserve(groups.size());
    for (auto& group : groups) {
        CompositeWriteResult r;
        r.groupId = group.groupId;
        r.cellCount = static_cast<int>(group.members.size());
        r.path = (fs::path(outputDir) / compositeFileName(dirName, group.groupId)).string();

        if (group.members.empty()) {
            CV_LOG_WARNING(NULL, "No images in group " << group.groupId);
            // A file left from an earlier run would no longer match this group.
            std::error_code ec;
            fs::remove(r.path, ec);
            results.push_back(r);
            continue;
        }

        accumulate(group, samples);
        if (group.accumulator.empty()) {
            CV_LOG_WARNING(NULL, "Zero dimensions for group " << group.groupId << ", skipping");
            results.push_back(r);
            continue;
        }

        const cv::Mat image16 = normalizeTo16U(group.accumulator);
        r.written = writeComposite(r.path, image16, resolution);
        if (r.written) {
            CV_LOG_INFO(NULL, "Saved summed image for group " << group.groupId << " with " << r.cellCount
                              << " cells: " << r.path);
        } else {
            CV_LOG_ERROR(NULL, "Could not write composite for group " << group.groupId << ": " << r.path);
        }
        results.push_back(r);
    }
    return results;
}
