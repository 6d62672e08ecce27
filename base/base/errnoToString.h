#pragma once

#include <cerrno>
#include <string>

/// Formats errno as "errno: N, strerror: TEXT".
std::string errnoToString(int the_errno = errno);
