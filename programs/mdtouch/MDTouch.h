#pragma once

#include <base/types.h>

#include <ostream>

#include <Poco/AutoPtr.h>
#include <Poco/Util/AbstractConfiguration.h>
#include <Poco/Util/MapConfiguration.h>


namespace MDTouch
{

/// Printed when the program is started without arguments.
String getBannerMessage();

String getHelpMessage();

/// True if any argument is exactly "-h" or "-?".
bool isHelpRequested(const Strings & args);

/** Runs the whole tool over already split arguments (without the program name).
  * Returns the process exit code: 0 on success, 1 if some file could not be touched.
  * Files are touched in order and processing stops at the first failure.
  */
int runTouch(const Strings & args, std::ostream & out, std::ostream & err);

/// Reads MDTOUCH_* environment variables into "log-level" and "log-file" keys.
Poco::AutoPtr<Poco::Util::MapConfiguration> loadConfiguration();

/// Logging is off unless "log-level" is set. Logs go to stderr, or to "log-file" if it is set.
void setupLogging(const Poco::Util::AbstractConfiguration & config);

}
