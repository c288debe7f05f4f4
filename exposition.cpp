#include <algorithm>
#include <iomanip>
#include <vector>

#include "exposition.h"

std::string EscapeLabelValue(const std::string& s)
{
    std::string ret;

    for (char c : s) {
        switch (c)
        {
        case '\\':
            ret += "\\\\";
            break;
        case '"':
            ret += "\\\"";
            break;
        case '\n':
            ret += "\\n";
            break;
        default:
            ret += c;
            break;
        }
    }

    return ret;
}

static void formatHeader(std::ostream& output, const char* name, const char* type, const char* help)
{
    output << "# HELP " << name << ' ' << help << '\n';
    output << "# TYPE " << name << ' ' << type << '\n';
}

// Enough significant digits for 1/16 degree steps across the whole sensor range
static const int ValuePrecision = 7;

void FormatMetrics(std::ostream& output, const MetricsSnapshot& snapshot)
{
    std::streamsize oldPrecision = output.precision(ValuePrecision);

    formatHeader(output, TemperatureMetric, "gauge", "Latest temperature reading of the probe");
    for (const auto& it : snapshot) {
        if (it.second.hasReading) {
            output << TemperatureMetric << "{probe=\"" << EscapeLabelValue(it.second.label)
                   << "\"} " << it.second.reading.value << '\n';
        }
    }

    formatHeader(output, TimestampMetric, "gauge", "Time the latest reading was taken");
    for (const auto& it : snapshot) {
        if (it.second.hasReading) {
            output << TimestampMetric << "{probe=\"" << EscapeLabelValue(it.second.label)
                   << "\"} " << it.second.reading.timestamp << '\n';
        }
    }

    formatHeader(output, ErrorsMetric, "counter", "Total number of failed temperature reads");
    for (const auto& it : snapshot) {
        std::string label = EscapeLabelValue(it.second.label);

        for (const auto& err : it.second.errors) {
            output << ErrorsMetric << "{probe=\"" << label << "\",error_type=\""
                   << ErrorKindName(err.first) << "\"} " << err.second << '\n';
        }
    }

    output.precision(oldPrecision);
}

static std::string escapeHtml(const std::string& s)
{
    std::string ret;

    for (char c : s) {
        switch (c)
        {
        case '<':
            ret += "&lt;";
            break;
        case '>':
            ret += "&gt;";
            break;
        case '&':
            ret += "&amp;";
            break;
        case '"':
            ret += "&quot;";
            break;
        default:
            ret += c;
            break;
        }
    }

    return ret;
}

static const char* valueColor(float t)
{
    if (t < 22.0)
        return "#88c0d0";
    else if (t < 38.0)
        return "#a3be8c";
    else if (t < 42.0)
        return "#ebcb8b";
    else
        return "#bf616a";
}

void FormatStatusPage(std::ostream& output, const MetricsSnapshot& snapshot, time_t now)
{
    std::vector<const SensorMetrics*> rows;
    struct tm pt;
    char ts[64];

    for (const auto& it : snapshot)
        rows.push_back(&it.second);

    std::sort(rows.begin(), rows.end(), [](const SensorMetrics* a, const SensorMetrics* b) {
        return a->label < b->label;
    });

    std::streamsize oldPrecision = output.precision();

    gmtime_r(&now, &pt);
    strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &pt);

    output << "<!DOCTYPE html>\n<html>\n<head>\n"
              "<meta charset=\"utf-8\">\n"
              "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">\n"
              "<meta http-equiv=\"refresh\" content=\"15\">\n"
              "<title>Temperature Monitor</title>\n"
              "<style>\n"
              "body{font-family:sans-serif;max-width:800px;margin:40px auto;padding:20px;"
              "background:#3b4252;color:#eceff4}\n"
              "table{width:100%;border-collapse:collapse}\n"
              "th{text-align:left;padding:15px;background:#434c5e}\n"
              "td{padding:15px;border-bottom:1px solid #4c566a}\n"
              ".value{font-size:2em;font-weight:bold}\n"
              ".error{color:#d08770;font-style:italic}\n"
              "a{color:#88c0d0}\n"
              "</style>\n</head>\n<body>\n"
              "<h1>Temperature Monitor</h1>\n"
              "<table>\n<tr><th>Probe</th><th style=\"text-align:right\">Temperature</th></tr>\n";

    for (const SensorMetrics* m : rows) {
        output << "<tr><td>" << escapeHtml(m->label) << "</td><td style=\"text-align:right\">";

        if (m->hasReading) {
            output << "<span class=\"value\" style=\"color:" << valueColor(m->reading.value) << "\">"
                   << std::fixed << std::setprecision(2) << m->reading.value
                   << std::defaultfloat << "&deg;C</span>";
            if (m->failing)
                output << " <span class=\"error\">(stale)</span>";
        } else {
            output << "<span class=\"error\">Error</span>";
        }

        output << "</td></tr>\n";
    }

    output << "</table>\n"
              "<p>Last updated: " << ts << " UTC<br>\n"
              "<a href=\"/metrics\">Prometheus metrics</a> | <a href=\"/health\">Health check</a></p>\n"
              "</body>\n</html>\n";

    output.precision(oldPrecision);
}
