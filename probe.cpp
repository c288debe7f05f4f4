#include <ctype.h>
#include <stdlib.h>

#include <fstream>
#include <sstream>
#include <string>

#include "logging.h"
#include "probe.h"

static bool onlySpaces(const char* p)
{
    while (*p) {
        if (!isspace((unsigned char)*p))
            return false;
        p++;
    }

    return true;
}

static ProbeResult checkCrc(const std::string& line)
{
    size_t pos = line.find("crc=");

    if (pos == std::string::npos)
        return ProbeResult::Error(ErrorKind::ParseFailure);

    // Skip the CRC byte itself, the verdict follows it
    std::istringstream s(line.substr(pos + 4));
    std::string crc, verdict, junk;

    s >> crc >> verdict;

    if (crc.empty() || (s >> junk))
        return ProbeResult::Error(ErrorKind::ParseFailure);
    if (verdict == "NO")
        return ProbeResult::Error(ErrorKind::CrcFailure);
    if (verdict != "YES")
        return ProbeResult::Error(ErrorKind::ParseFailure);

    return ProbeResult::Value(0);
}

ProbeResult ParseW1Payload(const std::string& data)
{
    size_t eol = data.find('\n');

    if (eol == std::string::npos)
        return ProbeResult::Error(ErrorKind::ParseFailure);

    ProbeResult crc = checkCrc(data.substr(0, eol));

    if (!crc.ok)
        return crc;

    std::string line = data.substr(eol + 1, data.find('\n', eol + 1) - eol - 1);
    size_t pos = line.find("t=");

    if (pos == std::string::npos)
        return ProbeResult::Error(ErrorKind::ParseFailure);

    const char* str = line.c_str() + pos + 2;
    char *p;
    long raw = strtol(str, &p, 10);

    if (p == str || !onlySpaces(p))
        return ProbeResult::Error(ErrorKind::ParseFailure);

    if (raw < MinMilliCelsius || raw > MaxMilliCelsius)
        return ProbeResult::Error(ErrorKind::OutOfRange);

    return ProbeResult::Value(raw / 1000.0f);
}

ProbeResult Thermometer::Read()
{
    ProbeResult r = Measure();

    if (r.ok)
        r.value += m_Offset;

    return r;
}

W1Thermometer::W1Thermometer(const std::string& devicesPath, const std::string& id, float offset)
    : Thermometer(id, offset), m_Path(devicesPath + '/' + id + "/w1_slave")
{

}

ProbeResult W1Thermometer::Measure()
{
    std::ifstream f(m_Path);
    std::stringstream data;

    if (!f.is_open()) {
        Log(Log::DEBUG) << "Can't open " << m_Path;
        return ProbeResult::Error(ErrorKind::IoFailure);
    }

    // This blocks for the duration of the conversion, up to 750 ms at 12 bits
    data << f.rdbuf();

    if (f.bad()) {
        return ProbeResult::Error(ErrorKind::IoFailure);
    }

    return ParseW1Payload(data.str());
}
