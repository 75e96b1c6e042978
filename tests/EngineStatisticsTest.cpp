#include "EngineStatistics.h"

#include "KeyprintExceptions.h"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

TEST(EngineStatisticsTest, EmptySnapshotIsZero) {
    const EngineStatistics stats;
    const StatisticsSnapshot s = stats.snapshot();
    EXPECT_EQ(s.totalPredictions, 0u);
    EXPECT_DOUBLE_EQ(s.avgConfidence, 0.0);
    EXPECT_DOUBLE_EQ(s.avgInferenceTimeMs, 0.0);
}

TEST(EngineStatisticsTest, AveragesRecordedConfidences) {
    EngineStatistics stats;
    stats.record(80, 1.0);
    stats.record(90, 2.0);
    stats.record(70, 3.0);

    const StatisticsSnapshot s = stats.snapshot();
    EXPECT_EQ(s.totalPredictions, 3u);
    EXPECT_DOUBLE_EQ(s.avgConfidence, 80.0);
    EXPECT_DOUBLE_EQ(s.avgInferenceTimeMs, 2.0);
    EXPECT_EQ(s.retainedScores, 3u);
}

TEST(EngineStatisticsTest, AveragesAreRoundedToTwoDecimals) {
    EngineStatistics stats;
    stats.record(1, 0.1);
    stats.record(1, 0.1);
    stats.record(2, 0.2);

    const StatisticsSnapshot s = stats.snapshot();
    EXPECT_DOUBLE_EQ(s.avgConfidence, 1.33);
    EXPECT_DOUBLE_EQ(s.avgInferenceTimeMs, 0.13);
}

TEST(EngineStatisticsTest, ConfidenceWindowKeepsMostRecentScores) {
    EngineStatistics stats(2);
    stats.record(10, 1.0);
    stats.record(20, 1.0);
    stats.record(30, 1.0);

    const StatisticsSnapshot s = stats.snapshot();
    EXPECT_EQ(s.totalPredictions, 3u);
    EXPECT_EQ(s.retainedScores, 2u);
    EXPECT_DOUBLE_EQ(s.avgConfidence, 25.0);
}

TEST(EngineStatisticsTest, ResetClearsEverything) {
    EngineStatistics stats;
    stats.record(50, 4.0);
    stats.reset();
    EXPECT_EQ(stats.snapshot().totalPredictions, 0u);
    EXPECT_EQ(stats.snapshot().retainedScores, 0u);
}

TEST(EngineStatisticsTest, RejectsZeroWindow) {
    EXPECT_THROW(EngineStatistics(0), Keyprint::ConfigurationException);
}

TEST(EngineStatisticsTest, ConcurrentRecordsAreAllCounted) {
    EngineStatistics stats(100);
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&stats] {
            for (int i = 0; i < 1000; ++i) stats.record(60, 0.5);
        });
    }
    for (auto& w : workers) w.join();

    const StatisticsSnapshot s = stats.snapshot();
    EXPECT_EQ(s.totalPredictions, 8000u);
    EXPECT_EQ(s.retainedScores, 100u);
    EXPECT_DOUBLE_EQ(s.avgConfidence, 60.0);
    EXPECT_DOUBLE_EQ(s.avgInferenceTimeMs, 0.5);
}
