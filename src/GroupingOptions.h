#pragma once

#include "CellTypes.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct GroupingOptions {
    // Requested number of bins (>= 1). Ignored when autoBins is set.
    int bins = 5;
    // Pick the bin count by GMM BIC among 1..maxBins.
    bool autoBins = false;
    int maxBins = 10;

    ClusterMethod method = ClusterMethod::Gmm;
    FeatureMetric metric = FeatureMetric::Auc;
    // Redistribute into equal-size quantile runs when clustering yields fewer bins than requested.
    bool forceRedistribute = false;
    // log1p-transform positive features before clustering.
    bool logTransform = true;

    unsigned int seed = 0;
    int initializations = 10;
    int maxIterations = 300;
    double covarianceRegularization = 1e-4;

    // Cell images: regular files named <cellPrefix>*<cellExtension>.
    std::string cellPrefix = "CELL";
    std::string cellExtension = ".tif";
    // Directory filter applied by the driver (substring match on the path).
    std::vector<std::string> channels;
};

// Missing keys keep their defaults; invalid enum strings throw std::invalid_argument.
void from_json(const nlohmann::json& j, GroupingOptions& o);
void to_json(nlohmann::json& j, const GroupingOptions& o);

// Loads options from a JSON file. Throws std::runtime_error when the file cannot be
// opened and nlohmann::json::exception on malformed JSON.
GroupingOptions loadGroupingOptions(const std::string& path);
