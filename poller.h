#ifndef POLLER_H
#define POLLER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

#include "metrics_store.h"
#include "probe.h"

/*
 * Reads every thermometer in turn, records the outcome in the store,
 * then sleeps until the next cycle is due. The set of probes is fixed
 * at construction; a failing probe never stops the others from being read.
 */
class Poller
{
public:
    typedef enum
    {
        Idle,
        Polling,
        Sleeping,
        Stopped
    } state_t;

    Poller(std::vector<std::unique_ptr<Thermometer>> probes, MetricsStore& store,
           std::chrono::milliseconds interval);

    // One full pass over all probes
    void PollOnce();

    // Poll until Stop() is called. Meant to be the body of a dedicated thread.
    void Run();

    // Safe to call from any thread. Interrupts the sleep between cycles;
    // a cycle in progress is completed first.
    void Stop();

    state_t GetState() const
    {
        return m_State;
    }

    unsigned long GetCycles() const
    {
        return m_Cycles;
    }

    size_t GetProbeCount() const
    {
        return m_Probes.size();
    }

private:
    void pollProbe(Thermometer& probe);

    std::vector<std::unique_ptr<Thermometer>> m_Probes;
    MetricsStore&             m_Store;
    std::chrono::milliseconds m_Interval;

    std::atomic<state_t>       m_State;
    std::atomic<unsigned long> m_Cycles;

    std::mutex              m_Lock;
    std::condition_variable m_Wakeup;
    bool                    m_StopRequested;
};

#endif
