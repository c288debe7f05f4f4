#ifndef PROBE_H
#define PROBE_H

#include <string>

#include "errors.h"

// DS18B20 measurement range, millidegrees Celsius
static const long MinMilliCelsius = -55000;
static const long MaxMilliCelsius = 125000;

// Outcome of a single probe read: either a temperature or the reason
// there is none
struct ProbeResult
{
    static ProbeResult Value(float celsius)
    {
        ProbeResult r;

        r.ok    = true;
        r.value = celsius;
        return r;
    }

    static ProbeResult Error(ErrorKind kind)
    {
        ProbeResult r;

        r.error = kind;
        return r;
    }

    bool      ok    = false;
    float     value = 0;
    ErrorKind error = ErrorKind::IoFailure;
};

/*
 * Parse the contents of a w1_therm "w1_slave" file:
 *
 * 6d 01 55 05 7f a5 a5 66 3e : crc=3e YES
 * 6d 01 55 05 7f a5 a5 66 3e t=22812
 *
 * The first line carries the driver's CRC verdict, the second one the
 * temperature in millidegrees.
 */
ProbeResult ParseW1Payload(const std::string& data);

class Thermometer
{
public:
    Thermometer(const std::string& id, float offset) : m_Id(id), m_Offset(offset)
    {}
    virtual ~Thermometer() {}

    // Take one measurement. Calibration offset is applied to good values.
    ProbeResult Read();

    const std::string& GetId() const
    {
        return m_Id;
    }

protected:
    virtual ProbeResult Measure() = 0;

private:
    std::string m_Id;
    float       m_Offset;
};

class W1Thermometer : public Thermometer
{
public:
    W1Thermometer(const std::string& devicesPath, const std::string& id, float offset = 0);

protected:
    virtual ProbeResult Measure() override;

private:
    std::string m_Path;
};

#endif
