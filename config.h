#ifndef CONFIG_H
#define CONFIG_H

#include <libxml/tree.h>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "errors.h"
#include "logging.h"

// Where the w1_therm driver exposes its slaves
static const char* const DefaultDevicesPath = "/sys/bus/w1/devices";
static const char* const DefaultConfigPath  = "/etc/tempmon/config.xml";

// Attribute accessors. The ones without a default throw ConfigurationError
// if the attribute is missing or malformed.
bool GetStrProp(xmlNode *node, const char *name, std::string& value);
std::string GetStrProp(xmlNode *node, const char *name);
long GetIntProp(xmlNode *node, const char *name);
long GetIntProp(xmlNode *node, const char *name, long defVal);
float GetFloatProp(xmlNode *node, const char *name, float defVal);

struct Settings
{
    unsigned int metricsPort     = 0;
    unsigned int probeInterval   = 0; // Seconds
    int          probeResolution = 0; // Validated by ApplyResolution()
    unsigned int httpThreads     = 2;
    std::string  devicesPath     = DefaultDevicesPath;
};

typedef std::map<std::string, std::string> LabelMap;
typedef std::map<std::string, float> OffsetMap;

/*
 * Daemon configuration, loaded once from an XML file and never modified
 * afterwards:
 *
 * <tempmon>
 *   <settings metrics_port="9184" probe_interval="15" probe_resolution="12"/>
 *   <probe id="28-0316a2796cff" label="tank1" offset="-0.25"/>
 *   <logger type="console" level="INFO"/>
 * </tempmon>
 */
class Config
{
public:
    explicit Config(const std::string& path);
    ~Config();

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    const Settings& GetSettings() const
    {
        return m_Settings;
    }

    const LabelMap& GetLabels() const
    {
        return m_Labels;
    }

    float GetOffset(const std::string& id) const
    {
        auto it = m_Offsets.find(id);
        return it == m_Offsets.end() ? 0.0f : it->second;
    }

    // Register configured loggers with the logging core. A console logger
    // is used if the file declares none.
    void InstallLoggers();

private:
    void readNodes(xmlNode *startNode, const char *name, void(Config::*parserFunc)(xmlNode *));
    void createSettings(xmlNode *node);
    void createProbe(xmlNode *node);
    void createLogger(xmlNode *node);

    Settings  m_Settings;
    LabelMap  m_Labels;
    OffsetMap m_Offsets;
    std::set<std::string> m_ProbeIds;
    bool      m_HaveSettings;

    std::vector<std::unique_ptr<LogListener>> m_Loggers;
    bool m_LoggersInstalled;
};

class LoggerType
{
public:
    LoggerType(const char* type);
    virtual LogListener* CreateLogger(xmlNode *) = 0;

    const char *m_Type;
    LoggerType* m_Next;
};

/*
 * This macro defines a metaclass, which allows the XML deserializer to look up
 * the logger class by the "type" attribute and instantiate it.
 * Class-specific deserialization is performed by CreateLogger() method, which
 * you define when using this macro. See logging.cpp for examples.
 */
#define REGISTER_LOGGER_TYPE(name)					\
class name ## _Factory : public LoggerType				\
{									\
public:									\
    name ## _Factory() : LoggerType( #name ) {}				\
    virtual LogListener *CreateLogger(xmlNode *) override;		\
};									\
static name ## _Factory name ## _type;					\
LogListener * name ## _Factory::CreateLogger

#endif
