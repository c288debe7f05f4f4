#ifndef LOGGING_H
#define LOGGING_H

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

class Log
{
public:
    typedef enum
    {
        ERR,
        WARN,
        INFO,
        DEBUG
    } Level;

    Log(Level kind) : m_Level(kind)
    {}
    ~Log();

    template <typename T>
    std::stringstream& operator<<(T val)
    {
        m_Stream << val;
        return m_Stream;
    }

    // Look up a level by its tag ("ERROR", "WARNING", "INFO", "DEBUG").
    // Returns false if the name is unknown.
    static bool ParseLevel(const char* name, Level& level);

private:
    Level m_Level;
    std::stringstream m_Stream;
};

void fatal(const char *fmt, ...);

// Receives every formatted log line at or above its threshold.
// Calls are serialized by the logging core.
class LogListener
{
public:
    virtual ~LogListener()
    {}

    void Write(Log::Level level, const std::string& line)
    {
        if (level <= m_Level) {
            Output(level, line);
        }
    }

protected:
    LogListener(Log::Level level = Log::Level::INFO) : m_Level(level) {}

private:
    virtual void Output(Log::Level level, const std::string& line) = 0;

    Log::Level m_Level;
};

void AddLogListener(LogListener *);
void RemoveLogListener(LogListener *);

// Appends to a file that stays open for the lifetime of the listener
class FileLog : public LogListener
{
public:
    FileLog(Log::Level level, const std::string& path)
        : LogListener(level), m_File(path, std::ofstream::out | std::ofstream::app)
    {}

    bool IsOpen() const
    {
        return m_File.is_open();
    }

private:
    virtual void Output(Log::Level level, const std::string& line) override;

    std::ofstream m_File;
};

// Errors and warnings go to stderr, the rest to stdout
class ConsoleLog : public LogListener
{
public:
    ConsoleLog(Log::Level level) : LogListener(level) {}

private:
    virtual void Output(Log::Level level, const std::string& line) override
    {
        std::ostream& os = level <= Log::WARN ? std::cerr : std::cout;

        os << line << std::endl;
    }
};

#endif
