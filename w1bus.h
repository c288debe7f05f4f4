#ifndef W1BUS_H
#define W1BUS_H

#include <string>
#include <vector>

#include "errors.h"

// DS18B20 family code, as it appears in front of the slave address
static const char* const ThermometerFamily = "28";

// True for slave names of the form "28-<hex address>"
bool IsThermometerId(const std::string& name);

// Enumerate thermometers under the w1 devices directory, sorted by id.
// Throws DiscoveryError if the directory can't be listed.
std::vector<std::string> ScanDevices(const std::string& devicesPath);

// Write the conversion resolution (9 to 12 bits) into every sensor's
// "resolution" attribute. A bad resolution throws ConfigurationError
// before anything is written; per-sensor write failures are only logged.
// Returns the number of sensors configured.
unsigned int ApplyResolution(const std::string& devicesPath,
                             const std::vector<std::string>& ids, int bits);

#endif
