#include "errors.h"

static const char* const errorKindNames[NumErrorKinds] =
{
    "io_failure",
    "crc_failure",
    "parse_failure",
    "out_of_range"
};

const char* ErrorKindName(ErrorKind kind)
{
    return errorKindNames[static_cast<int>(kind)];
}

std::ostream& operator<<(std::ostream& os, ErrorKind kind)
{
    return os << ErrorKindName(kind);
}
