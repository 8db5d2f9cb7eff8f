#pragma once

#include <string>
#include <vector>
#include "CellTypes.h"

// Run-level facts printed in the text summary.
struct GroupingInfo {
    std::string cellDirectory;
    FeatureMetric metric = FeatureMetric::Auc;
    bool forceRedistribute = false;
    int zeroCount = 0;
    int nonZeroCount = 0;
};

class ProvenanceWriter {
public:
    // Per-group member count and mean feature (groups 1..mapping.size(); empty groups have no mean).
    static std::vector<GroupSummary> summarizeGroups(const std::vector<CellSample>& samples, const LabelMapping& mapping);

    /// 逐细胞 CSV：cell_filename, cell_id, group_id, group_name, group_mean_<metric>, cell_<metric>。
    /// metric=auc 时列名为 group_mean_auc / cell_auc。
    static bool writeCellGroupsCsv(const std::string& path, const std::vector<CellSample>& samples,
                                   const std::vector<GroupSummary>& groups, FeatureMetric metric);

    // Human-readable summary: counts, method, convergence, range, per-group counts and means.
    static bool writeGroupingInfo(const std::string& path, const GroupingInfo& info, const ClusterResult& result,
                                  const std::vector<CellSample>& samples, const std::vector<GroupSummary>& groups);

    static std::string csvFileName(const std::string& dirName) { return dirName + "_cell_groups.csv"; }
    static std::string infoFileName(const std::string& dirName) { return dirName + "_grouping_info.txt"; }

    // Quotes a CSV field when it contains a separator, quote or line break.
    static std::string csvField(const std::string& value);
};
