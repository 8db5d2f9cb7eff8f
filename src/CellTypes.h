#pragma once

#include <opencv2/opencv.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Scalar reduction of one cell image used for clustering.
enum class FeatureMetric {
    Auc, // sum of all pixels (integrated intensity, not ROC-AUC)
    Max, // peak intensity
    Sg   // signal-to-ground: sum(px >= p95) / sum(px <= p50)
};

enum class ClusterMethod {
    Gmm,
    KMeans,
    ForcedQuantile
};

const char* toString(FeatureMetric metric);
const char* toString(ClusterMethod method);
std::optional<FeatureMetric> parseFeatureMetric(const std::string& text);
// Accepts "gmm", "kmeans", "quantile" and "forced_quantile".
std::optional<ClusterMethod> parseClusterMethod(const std::string& text);

struct CellSample {
    std::string path;
    // File stem; reduced to its digits for CELL<n> style names.
    std::string id;
    double feature = 0.0;
    cv::Mat image;
    std::optional<int> rawLabel;
    // 1-based, set by the remapper.
    std::optional<int> groupId;
};

struct ClusterResult {
    int requestedBins = 0;
    int actualBins = 0;
    // labels[i] is the raw label of sample i.
    std::vector<int> labels;
    // Every raw label 0..actualBins-1 is present; members may be empty.
    std::map<int, std::vector<size_t>> members;
    // Mean of the un-transformed feature, only for labels with members.
    std::map<int, double> meanFeature;
    ClusterMethod methodUsed = ClusterMethod::Gmm;
    bool converged = false;
    bool degenerate = false;
};

struct LabelMapping {
    // raw label -> 0-based group index
    std::map<int, int> rawToGroup;
    // orderedRawLabels[g] is the raw label that became group g.
    std::vector<int> orderedRawLabels;

    size_t size() const { return orderedRawLabels.size(); }
    int groupIndex(int rawLabel) const;
    int groupId(int rawLabel) const { return groupIndex(rawLabel) + 1; }
};

struct Group {
    int groupId = 0; // 1-based
    std::vector<size_t> members;
    int canvasHeight = 0;
    int canvasWidth = 0;
    cv::Mat accumulator; // CV_64FC1, canvasHeight x canvasWidth
};

struct GroupSummary {
    int groupId = 0;
    int cellCount = 0;
    // Undefined (and serialized as null) when cellCount == 0.
    double meanFeature = 0.0;
    std::string compositeFile;

    bool hasMean() const { return cellCount > 0; }
};

void to_json(nlohmann::json& j, const GroupSummary& g);
void from_json(const nlohmann::json& j, GroupSummary& g);

struct DirectoryReport {
    std::string cellDirectory;
    std::string outputDirectory;
    int inputCount = 0;
    int skippedCount = 0;
    int requestedBins = 0;
    int actualBins = 0;
    std::string method;
    bool converged = false;
    int compositesWritten = 0;
    std::vector<GroupSummary> groups;
    // At least one composite image was written.
    bool ok = false;
    std::string error;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(DirectoryReport, cellDirectory, outputDirectory, inputCount, skippedCount,
                                   requestedBins, actualBins, method, converged, compositesWritten, groups, ok, error)
};
