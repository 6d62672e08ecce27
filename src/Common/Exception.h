#pragma once

#include <cerrno>
#include <exception>
#include <optional>
#include <string>
#include <utility>

#include <Poco/Exception.h>

#include <fmt/format.h>


namespace MDTouch
{

class Exception : public Poco::Exception
{
public:
    Exception() = default;
    Exception(const std::string & msg, int code);

    Exception(int code, const std::string & message)
        : Exception(message, code)
    {}

    // Format message with fmt::format, like the logging functions.
    template <typename ...Args>
    Exception(int code, const std::string & fmt, Args&&... args)
        : Exception(fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...), code)
    {}

    Exception * clone() const override { return new Exception(*this); }
    void rethrow() const override { throw *this; }
    const char * name() const noexcept override { return "MDTouch::Exception"; }
    const char * what() const noexcept override { return message().data(); }

    /// Add something to the existing message.
    template <typename ...Args>
    void addMessage(const std::string& format, Args&&... args)
    {
        extendedMessage(fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
    }

    void addMessage(const std::string& message)
    {
        extendedMessage(message);
    }

private:
    const char * className() const noexcept override { return "MDTouch::Exception"; }
};


/// Contains an additional member `saved_errno`. See the throwFromErrno function.
class ErrnoException : public Exception
{
public:
    ErrnoException(const std::string & msg, int code, int saved_errno_, const std::optional<std::string> & path_ = {})
        : Exception(msg, code), saved_errno(saved_errno_), path(path_) {}

    ErrnoException * clone() const override { return new ErrnoException(*this); }
    void rethrow() const override { throw *this; }

    int getErrno() const { return saved_errno; }
    std::optional<std::string> getPath() const { return path; }

private:
    int saved_errno;
    std::optional<std::string> path;

    const char * name() const noexcept override { return "MDTouch::ErrnoException"; }
    const char * className() const noexcept override { return "MDTouch::ErrnoException"; }
};


[[noreturn]] void throwFromErrno(const std::string & s, int code, int the_errno = errno);
/// The path is kept in the exception, so the caller can tell which file failed.
[[noreturn]] void throwFromErrnoWithPath(const std::string & s, const std::string & path, int code,
                                         int the_errno = errno);


/** Prints current exception in canonical format.
  * with_code - "Code: N. MDTouch::Exception: text. (NAME)" instead of the bare text.
  * Must be called from a catch block.
  */
std::string getCurrentExceptionMessage(bool with_code);

/// Returns error code from ErrorCodes
int getCurrentExceptionCode();

std::string getExceptionMessage(const Exception & e, bool with_code);

}
