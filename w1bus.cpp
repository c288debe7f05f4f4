#include <ctype.h>
#include <string.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>

#include "logging.h"
#include "w1bus.h"

bool IsThermometerId(const std::string& name)
{
    size_t l = strlen(ThermometerFamily);

    if (name.length() <= l + 1 || name.compare(0, l, ThermometerFamily) || name[l] != '-')
        return false;

    for (size_t i = l + 1; i < name.length(); i++) {
        if (!isxdigit((unsigned char)name[i]))
            return false;
    }

    return true;
}

std::vector<std::string> ScanDevices(const std::string& devicesPath)
{
    std::vector<std::string> ids;
    std::error_code ec;
    std::filesystem::directory_iterator it(devicesPath, ec);

    if (ec) {
        throw DiscoveryError("Can't list " + devicesPath + ": " + ec.message() +
                             " (is w1-gpio enabled?)");
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        std::string name = it->path().filename().string();

        if (IsThermometerId(name)) {
            ids.push_back(name);
        } else {
            Log(Log::DEBUG) << "Skipping w1 entry " << name;
        }
    }

    if (ec) {
        throw DiscoveryError("Error while listing " + devicesPath + ": " + ec.message());
    }

    std::sort(ids.begin(), ids.end());
    return ids;
}

unsigned int ApplyResolution(const std::string& devicesPath,
                             const std::vector<std::string>& ids, int bits)
{
    unsigned int done = 0;

    if (bits < 9 || bits > 12) {
        throw ConfigurationError("Probe resolution must be 9 to 12 bits, got " +
                                 std::to_string(bits));
    }

    for (const std::string& id : ids) {
        std::string path = devicesPath + '/' + id + "/resolution";
        std::ofstream f(path);

        if (f.is_open()) {
            f << bits << std::endl;
            f.close();
        }

        if (f.fail()) {
            // The probe will still be read at whatever resolution it has
            Log(Log::WARN) << "Failed to set " << bits << "-bit resolution for " << id;
        } else {
            Log(Log::DEBUG) << id << " resolution set to " << bits << " bits";
            done++;
        }
    }

    return done;
}
