#include <gtest/gtest.h>
#include <fstream>
#include <stdexcept>
#include "GroupingOptions.h"
#include "TestImages.h"

using json = nlohmann::json;

TEST(GroupingOptions, EmptyObjectKeepsDefaults) {
    const GroupingOptions o = json::object().get<GroupingOptions>();
    EXPECT_EQ(o.bins, 5);
    EXPECT_EQ(o.method, ClusterMethod::Gmm);
    EXPECT_EQ(o.metric, FeatureMetric::Auc);
    EXPECT_FALSE(o.forceRedistribute);
    EXPECT_TRUE(o.logTransform);
    EXPECT_EQ(o.seed, 0u);
    EXPECT_EQ(o.cellPrefix, "CELL");
    EXPECT_EQ(o.cellExtension, ".tif");
    EXPECT_TRUE(o.channels.empty());
}

TEST(GroupingOptions, ParsesValues) {
    const json j = json::parse(R"({"bins": 3, "method": "quantile", "metric": "sg", "forceRedistribute": true,
                                   "seed": 11, "channels": ["ch00", "ch01"]})");
    const GroupingOptions o = j.get<GroupingOptions>();
    EXPECT_EQ(o.bins, 3);
    EXPECT_EQ(o.method, ClusterMethod::ForcedQuantile);
    EXPECT_EQ(o.metric, FeatureMetric::Sg);
    EXPECT_TRUE(o.forceRedistribute);
    EXPECT_EQ(o.seed, 11u);
    EXPECT_EQ(o.channels, (std::vector<std::string>{"ch00", "ch01"}));
}

TEST(GroupingOptions, RejectsInvalidValues) {
    EXPECT_THROW(json::parse(R"({"method": "dbscan"})").get<GroupingOptions>(), std::invalid_argument);
    EXPECT_THROW(json::parse(R"({"metric": "mean"})").get<GroupingOptions>(), std::invalid_argument);
    EXPECT_THROW(json::parse(R"({"bins": 0})").get<GroupingOptions>(), std::invalid_argument);
}

TEST(GroupingOptions, SerializesEnumsAsText) {
    GroupingOptions o;
    o.method = ClusterMethod::KMeans;
    o.metric = FeatureMetric::Max;
    const json j = o;
    EXPECT_EQ(j.at("method"), "kmeans");
    EXPECT_EQ(j.at("metric"), "max");
    EXPECT_EQ(j.get<GroupingOptions>().method, ClusterMethod::KMeans);
}

TEST(GroupingOptions, LoadsFromFile) {
    testutil::TempDir dir;
    std::ofstream(dir / "opts.json") << R"({"bins": 4, "autoBins": true, "maxBins": 6})";
    const GroupingOptions o = loadGroupingOptions((dir / "opts.json").string());
    EXPECT_EQ(o.bins, 4);
    EXPECT_TRUE(o.autoBins);
    EXPECT_EQ(o.maxBins, 6);

    EXPECT_THROW(loadGroupingOptions((dir / "missing.json").string()), std::runtime_error);
}

TEST(CellTypes, ParsesNames) {
    EXPECT_EQ(parseClusterMethod("KMeans"), ClusterMethod::KMeans);
    EXPECT_EQ(parseClusterMethod("forced_quantile"), ClusterMethod::ForcedQuantile);
    EXPECT_FALSE(parseClusterMethod("spectral").has_value());
    EXPECT_EQ(parseFeatureMetric("AUC"), FeatureMetric::Auc);
    EXPECT_STREQ(toString(ClusterMethod::ForcedQuantile), "forced_quantile");
    EXPECT_STREQ(toString(FeatureMetric::Sg), "sg");
}
