#include "CellTypes.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

static std::string lowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

const char* toString(FeatureMetric metric) {
    switch (metric) {
        case FeatureMetric::Auc: return "auc";
        case FeatureMetric::Max: return "max";
        case FeatureMetric::Sg: return "sg";
    }
    return "auc";
}

const char* toString(ClusterMethod method) {
    switch (method) {
        case ClusterMethod::Gmm: return "gmm";
        case ClusterMethod::KMeans: return "kmeans";
        case ClusterMethod::ForcedQuantile: return "forced_quantile";
    }
    return "gmm";
}

std::optional<FeatureMetric> parseFeatureMetric(const std::string& text) {
    const std::string t = lowerCopy(text);
    if (t == "auc" || t == "sum") return FeatureMetric::Auc;
    if (t == "max" || t == "peak") return FeatureMetric::Max;
    if (t == "sg" || t == "sg_ratio") return FeatureMetric::Sg;
    return std::nullopt;
}

std::optional<ClusterMethod> parseClusterMethod(const std::string& text) {
    const std::string t = lowerCopy(text);
    if (t == "gmm") return ClusterMethod::Gmm;
    if (t == "kmeans" || t == "k-means") return ClusterMethod::KMeans;
    if (t == "quantile" || t == "forced_quantile") return ClusterMethod::ForcedQuantile;
    return std::nullopt;
}

int LabelMapping::groupIndex(int rawLabel) const {
    const auto it = rawToGroup.find(rawLabel);
    if (it == rawToGroup.end()) {
        throw std::out_of_range("raw label " + std::to_string(rawLabel) + " has no group");
    }
    return it->second;
}

void to_json(nlohmann::json& j, const GroupSummary& g) {
    j = nlohmann::json{
        {"groupId", g.groupId},
        {"cellCount", g.cellCount},
        {"meanFeature", g.hasMean() ? nlohmann::json(g.meanFeature) : nlohmann::json(nullptr)},
        {"compositeFile", g.compositeFile}
    };
}

void from_json(const nlohmann::json& j, GroupSummary& g) {
    j.at("groupId").get_to(g.groupId);
    j.at("cellCount").get_to(g.cellCount);
    const auto& mean = j.at("meanFeature");
    g.meanFeature = mean.is_null() ? 0.0 : mean.get<double>();
    j.at("compositeFile").get_to(g.compositeFile);
}
