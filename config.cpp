#include <libxml/parser.h>
#include <stdlib.h>
#include <string.h>

#include "config.h"
#include "logging.h"

/*
 * LoggerType instances are static and their constructors are run during early
 * program startup phase. Due to that we can't use any complex C++ constructs
 * like std::map for building our logger type database because they might need
 * construction themselves. And we don't want to worry about constructors
 * ordering which might me system-specific.
 * Use something primitive, not requiring actual construction, like
 * single-linked list.
 */
static LoggerType *g_LoggerTypes = nullptr;

LoggerType::LoggerType(const char *type)
    : m_Type(type)
{
    m_Next = g_LoggerTypes;
    g_LoggerTypes = this;
}

static std::string where(xmlNode *node)
{
    return std::string(" at line ") + std::to_string(node->line);
}

bool GetStrProp(xmlNode *node, const char *name, std::string& value)
{
    xmlChar *str = xmlGetProp(node, (const xmlChar *)name);

    if (!str) {
        return false;
    }

    value = (const char *)str;
    xmlFree(str);
    return true;
}

std::string GetStrProp(xmlNode *node, const char *name)
{
    std::string value;

    if (!GetStrProp(node, name, value)) {
        throw ConfigurationError(std::string("Missing mandatory \"") + name + "\" attribute" +
                                 where(node));
    }

    return value;
}

long GetIntProp(xmlNode *node, const char *name)
{
    std::string str = GetStrProp(node, name);
    char *p;
    long ret = strtol(str.c_str(), &p, 0);

    if (str.empty() || *p != 0) {
        throw ConfigurationError(std::string("Invalid value for \"") + name + "\" attribute" +
                                 where(node));
    }

    return ret;
}

long GetIntProp(xmlNode *node, const char *name, long defVal)
{
    std::string str;

    if (!GetStrProp(node, name, str)) {
        return defVal;
    }

    return GetIntProp(node, name);
}

float GetFloatProp(xmlNode *node, const char *name, float defVal)
{
    std::string str;

    if (!GetStrProp(node, name, str)) {
        return defVal;
    }

    char *p;
    float ret = strtof(str.c_str(), &p);

    if (str.empty() || *p != 0) {
        throw ConfigurationError(std::string("Invalid value for \"") + name + "\" attribute" +
                                 where(node));
    }

    return ret;
}

void Config::readNodes(xmlNode *startNode, const char *name, void(Config::*parserFunc)(xmlNode *))
{
    xmlNode *cur_node;

    for (cur_node = startNode; cur_node; cur_node = cur_node->next) {
        if ((cur_node->type == XML_ELEMENT_NODE) &&
            !strcmp((const char *)cur_node->name, name))
        {
            (this->*parserFunc)(cur_node);
        }
    }
}

void Config::createSettings(xmlNode *node)
{
    if (m_HaveSettings) {
        throw ConfigurationError("Duplicate <settings> element" + where(node));
    }

    long port     = GetIntProp(node, "metrics_port");
    long interval = GetIntProp(node, "probe_interval");
    long threads  = GetIntProp(node, "http_threads", m_Settings.httpThreads);

    if (port <= 0 || port > 65535) {
        throw ConfigurationError("metrics_port " + std::to_string(port) + " is out of range");
    }
    if (interval <= 0) {
        throw ConfigurationError("probe_interval must be a positive number of seconds");
    }
    if (threads <= 0) {
        throw ConfigurationError("http_threads must be positive");
    }

    m_Settings.metricsPort     = port;
    m_Settings.probeInterval   = interval;
    m_Settings.probeResolution = GetIntProp(node, "probe_resolution");
    m_Settings.httpThreads     = threads;
    GetStrProp(node, "devices", m_Settings.devicesPath);

    m_HaveSettings = true;
}

void Config::createProbe(xmlNode *node)
{
    std::string id = GetStrProp(node, "id");
    std::string label;

    if (!m_ProbeIds.insert(id).second) {
        throw ConfigurationError("Probe " + id + " is declared more than once");
    }

    if (GetStrProp(node, "label", label)) {
        // Each label names exactly one series in the exported metrics
        for (const auto& it : m_Labels) {
            if (it.second == label) {
                throw ConfigurationError("Probes " + it.first + " and " + id +
                                         " share the label \"" + label + '"' + where(node));
            }
        }
        m_Labels[id] = label;
    }

    float offset = GetFloatProp(node, "offset", 0.0f);

    if (offset != 0.0f) {
        m_Offsets[id] = offset;
    }
}

void Config::createLogger(xmlNode *node)
{
    std::string type = GetStrProp(node, "type");
    LoggerType *lt;

    for (lt = g_LoggerTypes; lt; lt = lt->m_Next) {
        if (type == lt->m_Type)
            break;
    }

    if (!lt) {
        throw ConfigurationError("Unknown logger type " + type + where(node));
    }

    m_Loggers.emplace_back(lt->CreateLogger(node));
}

Config::Config(const std::string& path)
    : m_HaveSettings(false), m_LoggersInstalled(false)
{
    LIBXML_TEST_VERSION
    std::unique_ptr<xmlDoc, void(*)(xmlDoc*)> doc(xmlReadFile(path.c_str(), NULL, 0), xmlFreeDoc);

    if (!doc) {
        throw ConfigurationError("Could not parse configuration file " + path);
    }

    xmlNode *root = xmlDocGetRootElement(doc.get());

    if (!root || strcmp((const char *)root->name, "tempmon")) {
        throw ConfigurationError(path + ": root element must be <tempmon>");
    }

    readNodes(root->children, "settings", &Config::createSettings);
    readNodes(root->children, "probe", &Config::createProbe);
    readNodes(root->children, "logger", &Config::createLogger);

    if (!m_HaveSettings) {
        throw ConfigurationError(path + ": <settings> element is missing");
    }

    // An unlabelled probe is exported under its id, which must not clash either
    for (const auto& it : m_Labels) {
        if (it.second != it.first && m_ProbeIds.count(it.second)) {
            throw ConfigurationError("Label \"" + it.second + "\" of probe " + it.first +
                                     " is the id of another probe");
        }
    }
}

Config::~Config()
{
    if (m_LoggersInstalled) {
        for (auto& l : m_Loggers)
            RemoveLogListener(l.get());
    }
}

void Config::InstallLoggers()
{
    if (m_LoggersInstalled)
        return;

    if (m_Loggers.empty()) {
        m_Loggers.emplace_back(new ConsoleLog(Log::INFO));
    }

    for (auto& l : m_Loggers)
        AddLogListener(l.get());

    m_LoggersInstalled = true;
}
