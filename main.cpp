#include <pthread.h>
#include <signal.h>
#include <string.h>

#include <memory>
#include <thread>
#include <vector>

#include "config.h"
#include "httpd.h"
#include "logging.h"
#include "metrics_store.h"
#include "poller.h"
#include "probe.h"
#include "w1bus.h"

// Block termination signals in every thread; the main thread picks them up with sigwait()
static void blockSignals(sigset_t& set)
{
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);

    int err = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (err) {
        fatal("pthread_sigmask() failed: %s", strerror(err));
    }
}

int main(int argc, char** argv)
{
    const char* configPath = argc > 1 ? argv[1] : DefaultConfigPath;
    std::unique_ptr<Config> theConfig;
    std::vector<std::string> ids;
    sigset_t signals;

    try {
        theConfig.reset(new Config(configPath));
        theConfig->InstallLoggers();
    } catch (const ConfigurationError& e) {
        fatal("Error loading config: %s", e.what());
    }

    const Settings& settings = theConfig->GetSettings();

    Log(Log::INFO) << "Discovering DS18B20 probes in " << settings.devicesPath;

    try {
        ids = ScanDevices(settings.devicesPath);
        Log(Log::INFO) << "Found " << ids.size() << " probe(s)";

        unsigned int n = ApplyResolution(settings.devicesPath, ids, settings.probeResolution);
        if (n != ids.size()) {
            Log(Log::WARN) << ids.size() - n << " probe(s) keep their default resolution";
        }
    } catch (const DiscoveryError& e) {
        fatal("Error discovering probes: %s", e.what());
    } catch (const ConfigurationError& e) {
        fatal("Error configuring probes: %s", e.what());
    }

    MetricsStore theStore(theConfig->GetLabels());
    std::vector<std::unique_ptr<Thermometer>> probes;

    for (const std::string& id : ids) {
        Log(Log::INFO) << "Probe " << id << " is \"" << theStore.GetLabel(id) << '"';
        probes.emplace_back(new W1Thermometer(settings.devicesPath, id, theConfig->GetOffset(id)));
    }

    // Worker threads inherit the mask, so create them after this
    blockSignals(signals);

    HTTPServer theServer(settings.metricsPort, settings.httpThreads, theStore);
    Poller thePoller(std::move(probes), theStore, std::chrono::seconds(settings.probeInterval));

    std::thread pollThread(&Poller::Run, &thePoller);

    Log(Log::INFO) << "System started";

    int sig;
    int err = sigwait(&signals, &sig);

    if (err) {
        Log(Log::ERR) << "sigwait() failed: " << strerror(err);
    } else {
        Log(Log::INFO) << "Caught signal " << sig << ", shutting down";
    }

    thePoller.Stop();
    pollThread.join();

    return 0;
}
