#include <MDTouch.h>

#include <Common/ErrorCodes.h>
#include <Common/Exception.h>
#include <Common/FileSystemHelpers.h>
#include <Common/config_version.h>
#include <Common/logger_useful.h>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <utility>

#include <boost/program_options.hpp>

#include <Poco/ConsoleChannel.h>
#include <Poco/Environment.h>
#include <Poco/FileChannel.h>
#include <Poco/FormattingChannel.h>
#include <Poco/PatternFormatter.h>

#include <fmt/format.h>


namespace MDTouch
{

namespace ErrorCodes
{
    extern const int BAD_ARGUMENTS;
}

namespace
{

/// Environment variable -> configuration key.
const std::pair<const char *, const char *> environment_settings[] =
{
    {"MDTOUCH_LOG_LEVEL", "log-level"},
    {"MDTOUCH_LOG_FILE", "log-file"},
};

}

String getBannerMessage()
{
    return fmt::format(
        "mdtouch  {}\n"
        "A tool to update file timestamps or create empty files, mimicking the Unix touch command.\n",
        MDTOUCH_BUILD_DATETIME);
}

String getHelpMessage()
{
    namespace po = boost::program_options;

    /// Only short names, so the options are printed exactly as they are recognized.
    po::options_description desc("Options");
    desc.add_options()
        (",h", "Display this help message and exit.")
        (",?", "Same as -h.")
    ;

    std::stringstream message;
    message << "Usage: mdtouch [OPTIONS] <file> [file...]\n\n"
            << "A command line tool to mimic the behaviour of the Unix touch command.\n"
            << "If the file does not exist, it will be created. Otherwise, its access and modification\n"
            << "times will be updated to the current time.\n\n"
            << desc;
    return message.str();
}

bool isHelpRequested(const Strings & args)
{
    return std::ranges::any_of(args, [](const String & arg) { return arg == "-h" || arg == "-?"; });
}

int runTouch(const Strings & args, std::ostream & out, std::ostream & err)
{
    Poco::Logger * log = &Poco::Logger::get("MDTouch");

    if (args.empty())
    {
        out << getBannerMessage();
        return EXIT_SUCCESS;
    }

    /// Help wins over the files, nothing is touched in that case.
    if (isHelpRequested(args))
    {
        out << getHelpMessage() << std::endl;
        return EXIT_SUCCESS;
    }

    for (size_t i = 0; i < args.size(); ++i)
    {
        const String & path = args[i];
        try
        {
            FS::touchFile(path);
        }
        catch (...)
        {
            LOG_DEBUG(log, "Stopped at argument {} of {}: {}", i + 1, args.size(), getCurrentExceptionMessage(true));
            err << fmt::format("Error touching {}: {}", path, getCurrentExceptionMessage(false)) << std::endl;
            return EXIT_FAILURE;
        }
    }

    LOG_DEBUG(log, "Touched {} files", args.size());
    return EXIT_SUCCESS;
}

Poco::AutoPtr<Poco::Util::MapConfiguration> loadConfiguration()
{
    Poco::AutoPtr<Poco::Util::MapConfiguration> config(new Poco::Util::MapConfiguration);
    for (const auto & [variable, key] : environment_settings)
    {
        if (Poco::Environment::has(variable))
            config->setString(key, Poco::Environment::get(variable));
    }
    return config;
}

void setupLogging(const Poco::Util::AbstractConfiguration & config)
{
    String log_level = config.getString("log-level", "none");

    int level = 0;
    try
    {
        level = Poco::Logger::parseLevel(log_level);
    }
    catch (const Poco::InvalidArgumentException &)
    {
        throw Exception(ErrorCodes::BAD_ARGUMENTS, "Unknown log level '{}'", log_level);
    }

    Poco::AutoPtr<Poco::Channel> channel;
    if (config.has("log-file"))
    {
        Poco::AutoPtr<Poco::FileChannel> file_channel(new Poco::FileChannel);
        file_channel->setProperty(Poco::FileChannel::PROP_PATH, config.getString("log-file"));
        file_channel->setProperty(Poco::FileChannel::PROP_FLUSH, "true");
        channel = file_channel;
    }
    else
    {
        channel = new Poco::ConsoleChannel;
    }

    Poco::AutoPtr<Poco::PatternFormatter> formatter(new Poco::PatternFormatter);
    formatter->setProperty("pattern", "%Y-%m-%d %H:%M:%S.%i <%p> %s: %t");
    Poco::AutoPtr<Poco::FormattingChannel> formatting_channel(new Poco::FormattingChannel(formatter, channel));

    Poco::Logger::root().setChannel(formatting_channel);
    Poco::Logger::root().setLevel(level);

    /// Loggers that already exist do not follow the root logger.
    Poco::Logger::setChannel("", formatting_channel);
    Poco::Logger::setLevel("", level);
}

}


int mainEntryMDTouch(int argc, char ** argv)
{
    using namespace MDTouch;

    try
    {
        auto config = loadConfiguration();
        setupLogging(*config);
    }
    catch (...)
    {
        std::cerr << getCurrentExceptionMessage(true) << std::endl;
        return EXIT_FAILURE;
    }

    Strings args;
    if (argc > 1)
        args.assign(argv + 1, argv + argc);
    return runTouch(args, std::cout, std::cerr);
}
