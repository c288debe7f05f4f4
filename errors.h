#ifndef ERRORS_H
#define ERRORS_H

#include <ostream>
#include <stdexcept>
#include <string>

// The w1 bus directory could not be listed. Nothing can ever be read, fatal at startup.
class DiscoveryError : public std::runtime_error
{
public:
    explicit DiscoveryError(const std::string& what) : std::runtime_error(what)
    {}
};

// Invalid or unreadable configuration, fatal at startup.
class ConfigurationError : public std::runtime_error
{
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what)
    {}
};

// Poll-time failure classes. These are counted, never thrown.
enum class ErrorKind
{
    IoFailure,
    CrcFailure,
    ParseFailure,
    OutOfRange
};

static const int NumErrorKinds = 4;

// Name used for the "error_type" metric label
const char* ErrorKindName(ErrorKind kind);

std::ostream& operator<<(std::ostream& os, ErrorKind kind);

#endif
