#include <chrono>
#include <stdexcept>
#include <thread>

#include <gtest/gtest.h>

#include "poller.h"
#include "w1_tree.h"

namespace {

class ThrowingThermometer : public Thermometer
{
public:
    ThrowingThermometer(const std::string& id) : Thermometer(id, 0)
    {}

protected:
    virtual ProbeResult Measure() override
    {
        throw std::runtime_error("bus exploded");
    }
};

std::vector<std::unique_ptr<Thermometer>> makeProbes(const W1Tree& tree,
                                                     const std::vector<std::string>& ids)
{
    std::vector<std::unique_ptr<Thermometer>> probes;

    for (const auto& id : ids)
        probes.emplace_back(new W1Thermometer(tree.Path(), id));

    return probes;
}

bool waitForCycles(const Poller& p, unsigned long n)
{
    for (int i = 0; i < 500; i++) {
        if (p.GetCycles() >= n)
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    return false;
}

}

TEST(Poller, OneCycleScenario)
{
    W1Tree tree;
    MetricsStore store(LabelMap{ { "28-aaa", "tank1" } });

    tree.WriteSlave("28-aaa", W1Tree::Payload(21500));
    tree.AddDevice("28-bbb"); // No w1_slave: disconnected

    Poller poller(makeProbes(tree, { "28-aaa", "28-bbb" }), store, std::chrono::seconds(15));

    EXPECT_EQ(poller.GetState(), Poller::Idle);
    poller.PollOnce();
    EXPECT_EQ(poller.GetCycles(), 1u);

    MetricsSnapshot s = store.Snapshot();
    unsigned int readings = 0;
    unsigned int tallies = 0;

    for (const auto& it : s) {
        if (it.second.hasReading)
            readings++;
        tallies += it.second.errors.size();
    }

    EXPECT_EQ(readings, 1u);
    EXPECT_EQ(tallies, 1u);
    EXPECT_EQ(s["28-aaa"].label, "tank1");
    EXPECT_FLOAT_EQ(s["28-aaa"].reading.value, 21.5f);
    EXPECT_FALSE(s["28-bbb"].hasReading);
    EXPECT_EQ(s["28-bbb"].label, "28-bbb");
    EXPECT_EQ(s["28-bbb"].errors[ErrorKind::IoFailure], 1u);
}

TEST(Poller, FailureAfterSuccessKeepsReading)
{
    W1Tree tree;
    MetricsStore store;

    tree.WriteSlave("28-aaa", W1Tree::Payload(17875));
    Poller poller(makeProbes(tree, { "28-aaa" }), store, std::chrono::seconds(1));

    poller.PollOnce();
    tree.WriteSlave("28-aaa", W1Tree::Payload(30000, false));
    poller.PollOnce();

    MetricsSnapshot s = store.Snapshot();

    EXPECT_FLOAT_EQ(s["28-aaa"].reading.value, 17.875f);
    ASSERT_EQ(s["28-aaa"].errors.size(), 1u);
    EXPECT_EQ(s["28-aaa"].errors[ErrorKind::CrcFailure], 1u);
    EXPECT_TRUE(s["28-aaa"].failing);
}

TEST(Poller, ExceptionDoesNotAbortCycle)
{
    W1Tree tree;
    MetricsStore store;
    std::vector<std::unique_ptr<Thermometer>> probes;

    tree.WriteSlave("28-bbb", W1Tree::Payload(5000));
    probes.emplace_back(new ThrowingThermometer("28-aaa"));
    probes.emplace_back(new W1Thermometer(tree.Path(), "28-bbb"));

    Poller poller(std::move(probes), store, std::chrono::seconds(1));

    poller.PollOnce();

    MetricsSnapshot s = store.Snapshot();

    EXPECT_EQ(s["28-aaa"].errors[ErrorKind::IoFailure], 1u);
    EXPECT_FLOAT_EQ(s["28-bbb"].reading.value, 5.0f);
}

TEST(Poller, EmptyCycleRunsUntilStopped)
{
    MetricsStore store;
    Poller poller({}, store, std::chrono::milliseconds(5));

    std::thread t(&Poller::Run, &poller);

    EXPECT_TRUE(waitForCycles(poller, 3));
    poller.Stop();
    t.join();

    EXPECT_EQ(poller.GetState(), Poller::Stopped);
    EXPECT_EQ(poller.GetProbeCount(), 0u);
    EXPECT_TRUE(store.Snapshot().empty());
}

TEST(Poller, StopInterruptsSleep)
{
    W1Tree tree;
    MetricsStore store;

    tree.WriteSlave("28-aaa", W1Tree::Payload(21000));
    Poller poller(makeProbes(tree, { "28-aaa" }), store, std::chrono::hours(1));

    auto start = std::chrono::steady_clock::now();
    std::thread t(&Poller::Run, &poller);

    ASSERT_TRUE(waitForCycles(poller, 1));
    poller.Stop();
    t.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(30));
    EXPECT_EQ(poller.GetCycles(), 1u);
    EXPECT_FLOAT_EQ(store.Snapshot()["28-aaa"].reading.value, 21.0f);
}

TEST(Poller, StopBeforeRun)
{
    MetricsStore store;
    Poller poller({}, store, std::chrono::seconds(1));

    poller.Stop();
    poller.Run();

    EXPECT_EQ(poller.GetCycles(), 0u);
    EXPECT_EQ(poller.GetState(), Poller::Stopped);
}

TEST(Poller, ErrorsAccumulateAcrossCycles)
{
    W1Tree tree;
    MetricsStore store;

    tree.WriteSlave("28-aaa", "garbage");
    Poller poller(makeProbes(tree, { "28-aaa" }), store, std::chrono::milliseconds(1));

    std::thread t(&Poller::Run, &poller);

    ASSERT_TRUE(waitForCycles(poller, 5));
    poller.Stop();
    t.join();

    MetricsSnapshot s = store.Snapshot();

    EXPECT_EQ(s["28-aaa"].errors[ErrorKind::ParseFailure], poller.GetCycles());
    EXPECT_FALSE(s["28-aaa"].hasReading);
}
