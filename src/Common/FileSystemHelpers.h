#pragma once

#include <string>

#include <Poco/Timestamp.h>

namespace FS
{
/// Creates an empty file, an existing one is truncated. A dangling symlink gets its target created.
void createEmptyFile(const std::string & path);

/// Creates the file if it is absent, then sets its access and modification times to now.
void touchFile(const std::string & path);

Poco::Timestamp getModificationTimestamp(const std::string & path);
Poco::Timestamp getAccessTimestamp(const std::string & path);
void setFileTimes(const std::string & path, const Poco::Timestamp & access_time, const Poco::Timestamp & modification_time);
}
