#include "ProvenanceWriter.h"

#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace {

static std::string formatFeature(double v) {
    std::ostringstream os;
    os << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
    return os.str();
}

} // namespace

std::string ProvenanceWriter::csvField(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) return value;
    std::string out = "\"";
    for (const char c : value) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::vector<GroupSummary> ProvenanceWriter::summarizeGroups(const std::vector<CellSample>& samples, const LabelMapping& mapping) {
    std::vector<GroupSummary> groups(mapping.size());
    std::vector<double> sums(mapping.size(), 0.0);
    for (size_t g = 0; g < groups.size(); ++g) groups[g].groupId = static_cast<int>(g) + 1;

    for (const auto& s : samples) {
        if (!s.groupId) continue;
        const int g = *s.groupId - 1;
        if (g < 0 || g >= static_cast<int>(groups.size())) continue;
        groups[static_cast<size_t>(g)].cellCount++;
        sums[static_cast<size_t>(g)] += s.feature;
    }
    for (size_t g = 0; g < groups.size(); ++g) {
        if (groups[g].cellCount > 0) {
            groups[g].meanFeature = sums[g] / static_cast<double>(groups[g].cellCount);
        } else {
            CV_LOG_WARNING(NULL, "Group " << groups[g].groupId << " has no cells assigned to it");
        }
    }
    return groups;
}

bool ProvenanceWriter::writeCellGroupsCsv(const std::string& path, const std::vector<CellSample>& samples,
                                          const std::vector<GroupSummary>& groups, FeatureMetric metric) {
    std::ofstream o(path);
    if (!o) {
        CV_LOG_ERROR(NULL, "Cannot open " << path << " for writing");
        return false;
    }

    const std::string m = toString(metric);
    o << "cell_filename,cell_id,group_id,group_name,group_mean_" << m << ",cell_" << m << "\n";
    for (const auto& s : samples) {
        if (!s.groupId) continue;
        const int gid = *s.groupId;
        // A row's own group always has members, so its mean is defined.
        const bool known = gid >= 1 && gid <= static_cast<int>(groups.size()) &&
                           groups[static_cast<size_t>(gid - 1)].hasMean();
        o << csvField(s.path) << ',' << csvField(s.id) << ',' << gid << ",Group_" << gid << ','
          << (known ? formatFeature(groups[static_cast<size_t>(gid - 1)].meanFeature) : std::string())
          << ',' << formatFeature(s.feature) << "\n";
    }
    o.flush();
    if (!o) {
        CV_LOG_ERROR(NULL, "Failed writing " << path);
        return false;
    }
    return true;
}

bool ProvenanceWriter::writeGroupingInfo(const std::string& path, const GroupingInfo& info, const ClusterResult& result,
                                         const std::vector<CellSample>& samples, const std::vector<GroupSummary>& groups) {
    std::ofstream o(path);
    if (!o) {
        CV_LOG_ERROR(NULL, "Cannot open " << path << " for writing");
        return false;
    }

    double range = 0.0;
    if (!samples.empty()) {
        const auto [mn, mx] = std::minmax_element(samples.begin(), samples.end(),
                                                  [](const CellSample& a, const CellSample& b) { return a.feature < b.feature; });
        range = mx->feature - mn->feature;
    }

    o << std::fixed << std::setprecision(2);
    o << "Cell directory: " << info.cellDirectory << "\n";
    o << "Number of cells: " << samples.size() << "\n";
    o << "Feature metric: " << toString(info.metric) << "\n";
    o << "Clustering method: " << toString(result.methodUsed) << "\n";
    o << "Converged: " << (result.converged ? "true" : "false") << "\n";
    o << "Force clusters: " << (info.forceRedistribute ? "true" : "false") << "\n";
    o << "Requested groups: " << result.requestedBins << "\n";
    o << "Number of groups: " << result.actualBins << "\n";
    o << "Images with zero intensity: " << info.zeroCount << "\n";
    o << "Images with non-zero intensity: " << info.nonZeroCount << "\n";
    o << "Intensity range: " << range << "\n\n";

    for (const auto& g : groups) {
        o << "Group " << g.groupId << ":\n";
        o << "  Cells: " << g.cellCount << "\n";
        if (g.hasMean()) o << "  Mean intensity: " << g.meanFeature << "\n";
        o << "\n";
    }
    o.flush();
    if (!o) {
        CV_LOG_ERROR(NULL, "Failed writing " << path);
        return false;
    }
    return true;
}
