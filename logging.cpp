#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include "config.h"
#include "logging.h"

static std::vector<LogListener *> g_Listeners;
static std::mutex g_Lock;

void AddLogListener(LogListener *l)
{
    std::lock_guard<std::mutex> lock(g_Lock);

    g_Listeners.push_back(l);
}

void RemoveLogListener(LogListener *l)
{
    std::lock_guard<std::mutex> lock(g_Lock);

    for (auto it = g_Listeners.begin(); it != g_Listeners.end(); it++) {
        if (*it == l) {
            g_Listeners.erase(it);
            break;
        }
    }
}

static const char* logTags[] =
{
    "ERROR",
    "WARNING",
    "INFO",
    "DEBUG",
    NULL
};

Log::~Log()
{
    time_t t = time(nullptr);
    struct tm pt;
    char ts[128];

    localtime_r(&t, &pt);
    strftime(ts, sizeof(ts), "%d.%m.%Y %H:%M:%S", &pt);

    std::string text = std::string("[") + logTags[m_Level] + "] " + ts + ' ' + m_Stream.str();

    std::lock_guard<std::mutex> lock(g_Lock);

    for (LogListener* l : g_Listeners) {
        l->Write(m_Level, text);
    }
}

bool Log::ParseLevel(const char* name, Level& level)
{
    for (int i = 0; logTags[i]; i++) {
        if (!strcmp(name, logTags[i])) {
            level = (Level)i;
            return true;
        }
    }

    return false;
}

void fatal(const char *fmt, ...)
{
    va_list ap;

    va_start(ap, fmt);
    vfprintf(stderr, fmt, ap);
    fprintf(stderr, "\n");
    va_end(ap);
    exit(255);
}

static std::string where(xmlNode* node)
{
    return " at line " + std::to_string(node->line);
}

static Log::Level getLogLevel(xmlNode* node)
{
    std::string level;
    Log::Level ret = Log::Level::INFO;

    if (GetStrProp(node, "level", level) && !Log::ParseLevel(level.c_str(), ret)) {
        throw ConfigurationError("Invalid log level " + level + where(node));
    }

    return ret;
}

REGISTER_LOGGER_TYPE(console)(xmlNode* node)
{
    return new ConsoleLog(getLogLevel(node));
}

REGISTER_LOGGER_TYPE(file)(xmlNode* node)
{
    std::string path = GetStrProp(node, "path");
    FileLog* log = new FileLog(getLogLevel(node), path);

    if (!log->IsOpen()) {
        delete log;
        throw ConfigurationError("Can't open log file " + path + where(node));
    }

    return log;
}

void FileLog::Output(Log::Level, const std::string& line)
{
    // Flush every line so nothing is lost if we are killed
    m_File << line << std::endl;
}
