#include "GroupingOptions.h"

#include <fstream>
#include <stdexcept>

void from_json(const nlohmann::json& j, GroupingOptions& o) {
    o.bins = j.value("bins", o.bins);
    o.autoBins = j.value("autoBins", o.autoBins);
    o.maxBins = j.value("maxBins", o.maxBins);
    o.forceRedistribute = j.value("forceRedistribute", o.forceRedistribute);
    o.logTransform = j.value("logTransform", o.logTransform);
    o.seed = j.value("seed", o.seed);
    o.initializations = j.value("initializations", o.initializations);
    o.maxIterations = j.value("maxIterations", o.maxIterations);
    o.covarianceRegularization = j.value("covarianceRegularization", o.covarianceRegularization);
    o.cellPrefix = j.value("cellPrefix", o.cellPrefix);
    o.cellExtension = j.value("cellExtension", o.cellExtension);
    o.channels = j.value("channels", o.channels);

    if (j.contains("method")) {
        const std::string text = j.at("method").get<std::string>();
        const auto method = parseClusterMethod(text);
        if (!method) throw std::invalid_argument("unknown clustering method: " + text);
        o.method = *method;
    }
    if (j.contains("metric")) {
        const std::string text = j.at("metric").get<std::string>();
        const auto metric = parseFeatureMetric(text);
        if (!metric) throw std::invalid_argument("unknown feature metric: " + text);
        o.metric = *metric;
    }

    if (o.bins < 1) throw std::invalid_argument("bins must be >= 1");
    if (o.maxBins < 1) throw std::invalid_argument("maxBins must be >= 1");
    if (o.initializations < 1) throw std::invalid_argument("initializations must be >= 1");
    if (o.maxIterations < 1) throw std::invalid_argument("maxIterations must be >= 1");
    if (o.covarianceRegularization < 0.0) throw std::invalid_argument("covarianceRegularization must be >= 0");
}

void to_json(nlohmann::json& j, const GroupingOptions& o) {
    j = nlohmann::json{
        {"bins", o.bins},
        {"autoBins", o.autoBins},
        {"maxBins", o.maxBins},
        {"method", toString(o.method)},
        {"metric", toString(o.metric)},
        {"forceRedistribute", o.forceRedistribute},
        {"logTransform", o.logTransform},
        {"seed", o.seed},
        {"initializations", o.initializations},
        {"maxIterations", o.maxIterations},
        {"covarianceRegularization", o.covarianceRegularization},
        {"cellPrefix", o.cellPrefix},
        {"cellExtension", o.cellExtension},
        {"channels", o.channels}
    };
}

GroupingOptions loadGroupingOptions(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("cannot open config file: " + path);
    const nlohmann::json j = nlohmann::json::parse(in);
    return j.get<GroupingOptions>();
}
