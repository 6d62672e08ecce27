#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <Common/ErrorCodes.h>
#include <Common/Exception.h>
#include <Common/FileSystemHelpers.h>
#include <Common/logger_useful.h>

namespace MDTouch
{
namespace ErrorCodes
{
extern const int CANNOT_STAT;
extern const int CANNOT_CREATE_FILE;
extern const int CANNOT_CLOSE_FILE;
extern const int CANNOT_SET_FILE_TIMES;
}
}

namespace FS
{

namespace
{

struct stat getStatInfo(const std::string & path)
{
    struct stat st;
    if (stat(path.c_str(), &st) != 0)
        MDTouch::throwFromErrnoWithPath("Cannot stat file " + path, path, MDTouch::ErrorCodes::CANNOT_STAT);
    return st;
}

Poco::Timestamp timespecToTimestamp(const timespec & spec)
{
    return Poco::Timestamp(static_cast<Poco::Timestamp::TimeVal>(spec.tv_sec) * Poco::Timestamp::resolution() + spec.tv_nsec / 1000);
}

timespec timestampToTimespec(const Poco::Timestamp & timestamp)
{
    Poco::Timestamp::TimeVal microseconds = timestamp.epochMicroseconds();
    Poco::Timestamp::TimeVal seconds = microseconds / Poco::Timestamp::resolution();
    Poco::Timestamp::TimeVal remainder = microseconds % Poco::Timestamp::resolution();
    if (remainder < 0)
    {
        remainder += Poco::Timestamp::resolution();
        --seconds;
    }

    timespec spec{};
    spec.tv_sec = static_cast<time_t>(seconds);
    spec.tv_nsec = static_cast<long>(remainder * 1000);
    return spec;
}

}

void createEmptyFile(const std::string & path)
{
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH);
    if (fd == -1)
        MDTouch::throwFromErrnoWithPath("Cannot create file " + path, path, MDTouch::ErrorCodes::CANNOT_CREATE_FILE);

    if (close(fd) != 0)
        MDTouch::throwFromErrnoWithPath("Cannot close file " + path, path, MDTouch::ErrorCodes::CANNOT_CLOSE_FILE);
}

void touchFile(const std::string & path)
{
    Poco::Logger * log = &Poco::Logger::get("FileSystemHelpers");

    struct stat st;
    if (stat(path.c_str(), &st) != 0)
    {
        if (errno != ENOENT)
            MDTouch::throwFromErrnoWithPath("Cannot stat file " + path, path, MDTouch::ErrorCodes::CANNOT_STAT);

        /// If somebody creates the file between stat and open, it is truncated.
        createEmptyFile(path);
        LOG_DEBUG(log, "Created empty file {}", path);
    }

    /// Null times means both access and modification time are set to the current time.
    if (utimensat(AT_FDCWD, path.c_str(), nullptr, 0) != 0)
        MDTouch::throwFromErrnoWithPath("Cannot set access and modification time of file " + path, path, MDTouch::ErrorCodes::CANNOT_SET_FILE_TIMES);

    LOG_TRACE(log, "Updated access and modification time of {}", path);
}

Poco::Timestamp getModificationTimestamp(const std::string & path)
{
    struct stat st = getStatInfo(path);
#if defined(OS_DARWIN)
    return timespecToTimestamp(st.st_mtimespec);
#else
    return timespecToTimestamp(st.st_mtim);
#endif
}

Poco::Timestamp getAccessTimestamp(const std::string & path)
{
    struct stat st = getStatInfo(path);
#if defined(OS_DARWIN)
    return timespecToTimestamp(st.st_atimespec);
#else
    return timespecToTimestamp(st.st_atim);
#endif
}

void setFileTimes(const std::string & path, const Poco::Timestamp & access_time, const Poco::Timestamp & modification_time)
{
    timespec times[2] = {timestampToTimespec(access_time), timestampToTimespec(modification_time)};
    if (utimensat(AT_FDCWD, path.c_str(), times, 0) != 0)
        MDTouch::throwFromErrnoWithPath("Cannot set access and modification time of file " + path, path, MDTouch::ErrorCodes::CANNOT_SET_FILE_TIMES);
}

}
