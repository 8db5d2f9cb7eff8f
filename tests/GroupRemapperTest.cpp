#include <gtest/gtest.h>
#include <stdexcept>
#include "GroupRemapper.h"
#include "TestImages.h"

TEST(GroupRemapper, OrdersByMeanWithEmptyLast) {
    ClusterResult r;
    r.actualBins = 3;
    r.labels = {0, 0, 1};
    r.members = {{0, {0, 1}}, {1, {2}}, {2, {}}};
    r.meanFeature = {{0, 50.0}, {1, 10.0}};

    const LabelMapping m = GroupRemapper::remap(r);
    EXPECT_EQ(m.size(), 3u);
    EXPECT_EQ(m.orderedRawLabels, (std::vector<int>{1, 0, 2}));
    EXPECT_EQ(m.groupId(1), 1);
    EXPECT_EQ(m.groupId(0), 2);
    EXPECT_EQ(m.groupId(2), 3);
    EXPECT_THROW(m.groupIndex(7), std::out_of_range);
}

TEST(GroupRemapper, EqualMeansKeepRawLabelOrder) {
    ClusterResult r;
    r.actualBins = 2;
    r.labels = {1, 0};
    r.members = {{0, {1}}, {1, {0}}};
    r.meanFeature = {{0, 5.0}, {1, 5.0}};

    const LabelMapping m = GroupRemapper::remap(r);
    EXPECT_EQ(m.orderedRawLabels, (std::vector<int>{0, 1}));
}

TEST(GroupRemapper, AppliesOneBasedGroups) {
    ClusterResult r;
    r.actualBins = 2;
    r.labels = {1, 0, 1};
    r.members = {{0, {1}}, {1, {0, 2}}};
    r.meanFeature = {{0, 900.0}, {1, 20.0}};

    std::vector<CellSample> samples = testutil::samplesFromFeatures({20.0, 900.0, 20.0});
    GroupRemapper::applyToSamples(r, GroupRemapper::remap(r), samples);
    ASSERT_TRUE(samples[0].groupId.has_value());
    EXPECT_EQ(*samples[0].groupId, 1);
    EXPECT_EQ(*samples[1].groupId, 2);
    EXPECT_EQ(*samples[2].groupId, 1);
    EXPECT_EQ(*samples[1].rawLabel, 0);
}
