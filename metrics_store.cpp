#include <mutex>

#include "metrics_store.h"

std::string MetricsStore::GetLabel(const std::string& id) const
{
    auto it = m_Labels.find(id);

    return it == m_Labels.end() ? id : it->second;
}

// Must be called with the lock held exclusively
SensorMetrics& MetricsStore::getEntry(const std::string& id)
{
    auto it = m_Sensors.find(id);

    if (it == m_Sensors.end()) {
        it = m_Sensors.emplace(id, SensorMetrics()).first;
        it->second.label = GetLabel(id);
    }

    return it->second;
}

void MetricsStore::RecordReading(const std::string& id, float value, time_t timestamp)
{
    std::unique_lock writeLock(m_Mutex);
    SensorMetrics& m = getEntry(id);

    m.hasReading        = true;
    m.reading.value     = value;
    m.reading.timestamp = timestamp;
    m.failing           = false;
}

void MetricsStore::RecordError(const std::string& id, ErrorKind kind)
{
    std::unique_lock writeLock(m_Mutex);
    SensorMetrics& m = getEntry(id);

    // The last good reading stays in place
    m.errors[kind]++;
    m.failing = true;
}

MetricsSnapshot MetricsStore::Snapshot() const
{
    std::shared_lock readLock(m_Mutex);

    return m_Sensors;
}
