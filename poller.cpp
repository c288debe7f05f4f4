#include <time.h>

#include <exception>

#include "logging.h"
#include "poller.h"

Poller::Poller(std::vector<std::unique_ptr<Thermometer>> probes, MetricsStore& store,
               std::chrono::milliseconds interval)
    : m_Probes(std::move(probes)), m_Store(store), m_Interval(interval),
      m_State(Idle), m_Cycles(0), m_StopRequested(false)
{

}

void Poller::pollProbe(Thermometer& probe)
{
    ProbeResult r;

    try {
        r = probe.Read();
    } catch (const std::exception& e) {
        Log(Log::ERR) << "Probe " << probe.GetId() << " read aborted: " << e.what();
        r = ProbeResult::Error(ErrorKind::IoFailure);
    }

    if (r.ok) {
        m_Store.RecordReading(probe.GetId(), r.value, time(nullptr));
        Log(Log::DEBUG) << "Probe " << m_Store.GetLabel(probe.GetId()) << ": " << r.value << "C";
    } else {
        m_Store.RecordError(probe.GetId(), r.error);
        Log(Log::WARN) << "Probe " << m_Store.GetLabel(probe.GetId()) << " read failed: " << r.error;
    }
}

void Poller::PollOnce()
{
    m_State = Polling;

    for (auto& probe : m_Probes) {
        pollProbe(*probe);
    }

    m_Cycles++;
}

void Poller::Run()
{
    std::unique_lock<std::mutex> lock(m_Lock);

    Log(Log::INFO) << "Polling " << m_Probes.size() << " probe(s) every "
                   << m_Interval.count() << " ms";

    while (!m_StopRequested) {
        auto start = std::chrono::steady_clock::now();

        // Stop() must not wait for a cycle to finish
        lock.unlock();
        PollOnce();
        lock.lock();

        auto next = start + m_Interval;

        if (std::chrono::steady_clock::now() > next) {
            Log(Log::WARN) << "Poll cycle took longer than the polling interval";
        }

        m_State = Sleeping;
        m_Wakeup.wait_until(lock, next, [this] { return m_StopRequested; });
    }

    m_State = Stopped;
    Log(Log::INFO) << "Polling stopped after " << m_Cycles.load() << " cycle(s)";
}

void Poller::Stop()
{
    {
        std::lock_guard<std::mutex> lock(m_Lock);
        m_StopRequested = true;
    }

    m_Wakeup.notify_all();
}
