#ifndef EXPOSITION_H
#define EXPOSITION_H

#include <time.h>

#include <ostream>
#include <string>

#include "metrics_store.h"

// Metric family names
static const char* const TemperatureMetric = "tempmon_temperature_celsius";
static const char* const TimestampMetric   = "tempmon_reading_timestamp_seconds";
static const char* const ErrorsMetric      = "tempmon_read_errors_total";

// Content type of the text exposition format produced by FormatMetrics()
static const char* const MetricsContentType = "text/plain; version=0.0.4";

// Escape a label value for the text exposition format
std::string EscapeLabelValue(const std::string& s);

// Prometheus text exposition of a snapshot. Sensors are identified by label.
void FormatMetrics(std::ostream& output, const MetricsSnapshot& snapshot);

// Human readable status page
void FormatStatusPage(std::ostream& output, const MetricsSnapshot& snapshot, time_t now);

#endif
