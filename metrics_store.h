#ifndef METRICS_STORE_H
#define METRICS_STORE_H

#include <time.h>

#include <map>
#include <shared_mutex>
#include <string>

#include "config.h"
#include "errors.h"

struct Reading
{
    float  value     = 0;
    time_t timestamp = 0;
};

// Everything known about one sensor
struct SensorMetrics
{
    std::string label;
    bool        hasReading = false;
    Reading     reading;
    bool        failing    = false; // Most recent poll did not produce a value
    std::map<ErrorKind, unsigned long> errors;
};

// Keyed by sensor id
typedef std::map<std::string, SensorMetrics> MetricsSnapshot;

/*
 * Latest reading and cumulative error counts per sensor.
 * Written only by the poller thread; any number of HTTP threads may take
 * snapshots concurrently. Locks are held for a single update or a single
 * copy, never across a poll cycle.
 */
class MetricsStore
{
public:
    explicit MetricsStore(const LabelMap& labels = LabelMap())
        : m_Labels(labels)
    {}

    void RecordReading(const std::string& id, float value, time_t timestamp);
    void RecordError(const std::string& id, ErrorKind kind);

    MetricsSnapshot Snapshot() const;

    // Configured label, or the id itself
    std::string GetLabel(const std::string& id) const;

private:
    SensorMetrics& getEntry(const std::string& id);

    const LabelMap m_Labels;

    MetricsSnapshot m_Sensors;
    mutable std::shared_mutex m_Mutex;
};

#endif
