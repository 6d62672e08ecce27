#include <Common/ErrorCodes.h>
#include <Common/Exception.h>

#include <base/errnoToString.h>

#include <cstdlib>
#include <memory>
#include <sstream>
#include <typeinfo>
#include <cxxabi.h>


namespace MDTouch
{

namespace ErrorCodes
{
    extern const int POCO_EXCEPTION;
    extern const int STD_EXCEPTION;
    extern const int UNKNOWN_EXCEPTION;
}

namespace
{

struct FreeingDeleter
{
    void operator() (char * ptr) const { std::free(ptr); }
};

/// When demangling fails, returns the original name.
std::string demangle(const char * name)
{
    int status = 0;
    std::unique_ptr<char, FreeingDeleter> result(abi::__cxa_demangle(name, nullptr, nullptr, &status));
    if (result)
        return std::string(result.get());
    return name;
}

}

Exception::Exception(const std::string & msg, int code)
    : Poco::Exception(msg, code)
{
}


void throwFromErrno(const std::string & s, int code, int the_errno)
{
    throw ErrnoException(s + ", " + errnoToString(the_errno), code, the_errno);
}

void throwFromErrnoWithPath(const std::string & s, const std::string & path, int code, int the_errno)
{
    throw ErrnoException(s + ", " + errnoToString(the_errno), code, the_errno, path);
}


std::string getExceptionMessage(const Exception & e, bool with_code)
{
    if (!with_code)
        return e.message();

    std::stringstream stream;
    std::string text = e.displayText();

    stream << "Code: " << e.code() << ". " << text;

    if (!text.empty() && text.back() != '.')
        stream << '.';

    stream << " (" << ErrorCodes::getName(e.code()) << ")";
    return stream.str();
}


std::string getCurrentExceptionMessage(bool with_code)
{
    std::stringstream stream;

    try
    {
        throw;
    }
    catch (const Exception & e)
    {
        stream << getExceptionMessage(e, with_code);
    }
    catch (const Poco::Exception & e)
    {
        if (with_code)
            stream << "Poco::Exception. Code: " << ErrorCodes::POCO_EXCEPTION << ", e.code() = " << e.code() << ", ";
        stream << e.displayText();
    }
    catch (const std::exception & e)
    {
        if (with_code)
            stream << "std::exception. Code: " << ErrorCodes::STD_EXCEPTION << ", type: " << demangle(typeid(e).name()) << ", e.what() = ";
        stream << e.what();
    }
    catch (...)
    {
        stream << "Unknown exception";
        if (with_code)
            stream << ". Code: " << ErrorCodes::UNKNOWN_EXCEPTION << ", type: " << demangle(abi::__cxa_current_exception_type()->name());
    }

    return stream.str();
}


int getCurrentExceptionCode()
{
    try
    {
        throw;
    }
    catch (const Exception & e)
    {
        return e.code();
    }
    catch (const Poco::Exception &)
    {
        return ErrorCodes::POCO_EXCEPTION;
    }
    catch (const std::exception &)
    {
        return ErrorCodes::STD_EXCEPTION;
    }
    catch (...)
    {
        return ErrorCodes::UNKNOWN_EXCEPTION;
    }
}

}
