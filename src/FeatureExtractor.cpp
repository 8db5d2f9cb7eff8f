#include "FeatureExtractor.h"
#include "CellImage.h"

#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::vector<double> pixelValues(const cv::Mat& image) {
    cv::Mat flat;
    image.convertTo(flat, CV_64F);
    flat = flat.reshape(1, 1);
    return std::vector<double>(flat.begin<double>(), flat.end<double>());
}

// numpy-style "linear" percentile on an already sorted vector.
static double sortedPercentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) return 0.0;
    const double pos = std::clamp(p, 0.0, 100.0) / 100.0 * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = static_cast<size_t>(std::ceil(pos));
    const double frac = pos - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

} // namespace

std::vector<std::string> FeatureExtractor::listCellImages(const std::string& cellDir,
                                                          const std::string& cellPrefix,
                                                          const std::string& cellExtension) {
    std::vector<std::string> files;
    std::error_code ec;
    if (!fs::is_directory(cellDir, ec)) return files;

    const std::string wantedExt = toLower(cellExtension);
    for (const auto& entry : fs::directory_iterator(cellDir, ec)) {
        if (!entry.is_regular_file()) continue;
        const std::string name = entry.path().filename().string();
        if (name.rfind(cellPrefix, 0) != 0) continue;
        if (toLower(entry.path().extension().string()) != wantedExt) continue;
        files.push_back(entry.path().string());
    }
    std::sort(files.begin(), files.end());
    return files;
}

double FeatureExtractor::percentile(const cv::Mat& image, double p) {
    std::vector<double> values = pixelValues(image);
    std::sort(values.begin(), values.end());
    return sortedPercentile(values, p);
}

double FeatureExtractor::signalToGroundRatio(const cv::Mat& image) {
    std::vector<double> values = pixelValues(image);
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    const double p95 = sortedPercentile(values, 95.0);
    const double p50 = sortedPercentile(values, 50.0);

    double signal = 0.0;
    double ground = 0.0;
    for (const double v : values) {
        if (v >= p95) signal += v;
        if (v <= p50) ground += v;
    }
    if (ground <= 0.0) return signal;
    return signal / ground;
}

double FeatureExtractor::computeFeature(const cv::Mat& image, FeatureMetric metric) {
    if (image.empty()) return 0.0;
    switch (metric) {
        case FeatureMetric::Auc:
            return cv::sum(image)[0];
        case FeatureMetric::Max: {
            double minVal = 0.0, maxVal = 0.0;
            cv::minMaxLoc(image, &minVal, &maxVal);
            return maxVal;
        }
        case FeatureMetric::Sg:
            return signalToGroundRatio(image);
    }
    return 0.0;
}

std::string FeatureExtractor::cellIdFromFilename(const std::string& path) {
    const std::string stem = fs::path(path).stem().string();
    if (stem.find("CELL") == std::string::npos) return stem;
    std::string digits;
    for (const char c : stem) {
        if (std::isdigit(static_cast<unsigned char>(c))) digits.push_back(c);
    }
    return digits.empty() ? stem : digits;
}

ExtractionResult FeatureExtractor::extract(const std::string& cellDir, FeatureMetric metric,
                                           const std::string& cellPrefix, const std::string& cellExtension) {
    ExtractionResult out{};
    const std::vector<std::string> files = listCellImages(cellDir, cellPrefix, cellExtension);
    out.samples.reserve(files.size());

    for (const auto& file : files) {
        cv::Mat image = CellImage::loadGrayscale(file);
        if (image.empty()) {
            CV_LOG_WARNING(NULL, "Skipping unreadable cell image " << file);
            out.skippedCount++;
            continue;
        }

        if (!out.referenceResolution) {
            out.referenceResolution = CellImage::readTiffResolution(file);
        }

        CellSample sample;
        sample.path = file;
        sample.id = cellIdFromFilename(file);
        sample.feature = computeFeature(image, metric);
        sample.image = std::move(image);

        if (sample.feature == 0.0) {
            out.zeroCount++;
        } else {
            out.nonZeroCount++;
        }
        out.samples.push_back(std::move(sample));
    }

    CV_LOG_INFO(NULL, "Extracted " << toString(metric) << " for " << out.samples.size() << " cells in " << cellDir
                      << " (" << out.zeroCount << " zero, " << out.nonZeroCount << " non-zero, "
                      << out.skippedCount << " skipped)");
    return out;
}
