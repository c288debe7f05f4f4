#include <atomic>
#include <thread>

#include <gtest/gtest.h>

#include "metrics_store.h"

TEST(MetricsStore, EmptyStore)
{
    MetricsStore store;

    EXPECT_TRUE(store.Snapshot().empty());
}

TEST(MetricsStore, ReadingIsReplaced)
{
    MetricsStore store;

    store.RecordReading("28-aaa", 20.0f, 100);
    store.RecordReading("28-aaa", 21.5f, 115);

    MetricsSnapshot s = store.Snapshot();

    ASSERT_EQ(s.size(), 1u);
    EXPECT_TRUE(s["28-aaa"].hasReading);
    EXPECT_FLOAT_EQ(s["28-aaa"].reading.value, 21.5f);
    EXPECT_EQ(s["28-aaa"].reading.timestamp, 115);
    EXPECT_TRUE(s["28-aaa"].errors.empty());
}

TEST(MetricsStore, UnknownSensorHasNoReading)
{
    MetricsStore store;

    store.RecordReading("28-aaa", 20.0f, 100);

    MetricsSnapshot s = store.Snapshot();

    EXPECT_EQ(s.count("28-bbb"), 0u);
}

TEST(MetricsStore, ErrorKeepsLastReading)
{
    MetricsStore store;

    store.RecordReading("28-aaa", 20.0f, 100);
    store.RecordError("28-aaa", ErrorKind::IoFailure);

    MetricsSnapshot s = store.Snapshot();
    const SensorMetrics& m = s["28-aaa"];

    EXPECT_TRUE(m.hasReading);
    EXPECT_FLOAT_EQ(m.reading.value, 20.0f);
    EXPECT_EQ(m.reading.timestamp, 100);
    EXPECT_TRUE(m.failing);
    ASSERT_EQ(m.errors.size(), 1u);
    EXPECT_EQ(m.errors.at(ErrorKind::IoFailure), 1u);
}

TEST(MetricsStore, ErrorCounting)
{
    MetricsStore store;

    store.RecordError("28-aaa", ErrorKind::CrcFailure);
    store.RecordError("28-aaa", ErrorKind::ParseFailure);
    store.RecordError("28-bbb", ErrorKind::OutOfRange);
    store.RecordError("28-bbb", ErrorKind::OutOfRange);

    MetricsSnapshot s = store.Snapshot();

    ASSERT_EQ(s["28-aaa"].errors.size(), 2u);
    EXPECT_EQ(s["28-aaa"].errors[ErrorKind::CrcFailure], 1u);
    EXPECT_EQ(s["28-aaa"].errors[ErrorKind::ParseFailure], 1u);
    ASSERT_EQ(s["28-bbb"].errors.size(), 1u);
    EXPECT_EQ(s["28-bbb"].errors[ErrorKind::OutOfRange], 2u);
    EXPECT_FALSE(s["28-aaa"].hasReading);
    EXPECT_FALSE(s["28-bbb"].hasReading);
}

TEST(MetricsStore, SuccessClearsFailingFlag)
{
    MetricsStore store;

    store.RecordError("28-aaa", ErrorKind::IoFailure);
    store.RecordReading("28-aaa", 19.0f, 200);

    MetricsSnapshot s = store.Snapshot();

    EXPECT_FALSE(s["28-aaa"].failing);
    EXPECT_EQ(s["28-aaa"].errors[ErrorKind::IoFailure], 1u);
}

TEST(MetricsStore, Labels)
{
    MetricsStore store(LabelMap{ { "28-aaa", "tank1" } });

    store.RecordReading("28-aaa", 20.0f, 100);
    store.RecordError("28-bbb", ErrorKind::IoFailure);

    MetricsSnapshot s = store.Snapshot();

    EXPECT_EQ(s["28-aaa"].label, "tank1");
    EXPECT_EQ(s["28-bbb"].label, "28-bbb");
    EXPECT_EQ(store.GetLabel("28-ccc"), "28-ccc");
}

TEST(MetricsStore, SnapshotIsACopy)
{
    MetricsStore store;

    store.RecordReading("28-aaa", 20.0f, 100);
    MetricsSnapshot s = store.Snapshot();
    store.RecordReading("28-aaa", 30.0f, 200);

    EXPECT_FLOAT_EQ(s["28-aaa"].reading.value, 20.0f);
}

TEST(MetricsStore, NoTornReads)
{
    MetricsStore store;
    std::atomic<bool> done(false);
    unsigned long torn = 0;

    // Value and timestamp always move together
    std::thread writer([&store, &done] {
        for (int i = 1; i <= 20000; i++) {
            store.RecordReading("28-aaa", (float)i, i);
            if (i % 3 == 0)
                store.RecordError("28-aaa", ErrorKind::CrcFailure);
        }
        done = true;
    });

    while (!done) {
        MetricsSnapshot s = store.Snapshot();
        auto it = s.find("28-aaa");

        if (it != s.end() && it->second.hasReading &&
            (time_t)it->second.reading.value != it->second.reading.timestamp)
        {
            torn++;
        }
    }

    writer.join();

    EXPECT_EQ(torn, 0u);

    MetricsSnapshot s = store.Snapshot();
    EXPECT_EQ(s["28-aaa"].reading.timestamp, 20000);
    EXPECT_EQ(s["28-aaa"].errors[ErrorKind::CrcFailure], 6666u);
}
