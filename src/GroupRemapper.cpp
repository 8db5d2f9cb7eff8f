#include "GroupRemapper.h"

#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <tuple>

LabelMapping GroupRemapper::remap(const ClusterResult& result) {
    LabelMapping mapping;

    std::vector<int> rawLabels;
    rawLabels.reserve(result.members.size());
    for (const auto& entry : result.members) rawLabels.push_back(entry.first);

    auto key = [&](int label) {
        const auto it = result.meanFeature.find(label);
        const bool empty = (it == result.meanFeature.end());
        return std::make_tuple(empty, empty ? 0.0 : it->second, label);
    };
    std::sort(rawLabels.begin(), rawLabels.end(), [&](int a, int b) { return key(a) < key(b); });

    mapping.orderedRawLabels = rawLabels;
    for (size_t g = 0; g < rawLabels.size(); ++g) {
        mapping.rawToGroup[rawLabels[g]] = static_cast<int>(g);
        const auto it = result.meanFeature.find(rawLabels[g]);
        if (it != result.meanFeature.end()) {
            CV_LOG_INFO(NULL, "Cluster " << rawLabels[g] << " (mean: " << it->second << ") -> Group " << (g + 1));
        } else {
            CV_LOG_INFO(NULL, "Cluster " << rawLabels[g] << " (empty) -> Group " << (g + 1));
        }
    }
    return mapping;
}

void GroupRemapper::applyToSamples(const ClusterResult& result, const LabelMapping& mapping, std::vector<CellSample>& samples) {
    const size_t n = std::min(samples.size(), result.labels.size());
    for (size_t i = 0; i < n; ++i) {
        const int raw = result.labels[i];
        samples[i].rawLabel = raw;
        samples[i].groupId = mapping.groupId(raw);
    }
}
