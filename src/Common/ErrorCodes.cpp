#include <Common/ErrorCodes.h>

/** Previous error codes must not be changed or reused,
  * the exit status of scripts may depend on them.
  *
  * Codes 1000 and above are reserved for exceptions that did not come from MDTouch::Exception.
  */

#define APPLY_FOR_BUILTIN_ERROR_CODES(M) \
    M(0, OK) \
    M(2, BAD_ARGUMENTS) \
    M(3, CANNOT_STAT) \
    M(4, CANNOT_CREATE_FILE) \
    M(5, CANNOT_SET_FILE_TIMES) \
    M(6, CANNOT_CLOSE_FILE) \
\
    M(1000, POCO_EXCEPTION) \
    M(1001, STD_EXCEPTION) \
    M(1002, UNKNOWN_EXCEPTION) \

/* See END */

#define APPLY_FOR_ERROR_CODES(M) APPLY_FOR_BUILTIN_ERROR_CODES(M)

namespace MDTouch
{
namespace ErrorCodes
{
#define M(VALUE, NAME) extern const ErrorCode NAME = VALUE;
    APPLY_FOR_ERROR_CODES(M)
#undef M

    constexpr ErrorCode END = 1002;

    constexpr struct ErrorCodesNames
    {
        std::string_view names[END + 1];
        constexpr ErrorCodesNames()
        {
#define M(VALUE, NAME) names[VALUE] = std::string_view(#NAME);
            APPLY_FOR_ERROR_CODES(M)
#undef M
        }
    } error_codes_names;

    std::string_view getName(ErrorCode error_code)
    {
        if (error_code < 0 || error_code >= END + 1)
            return std::string_view();
        return error_codes_names.names[error_code];
    }

    ErrorCode getErrorCodeByName(std::string_view error_name)
    {
        if (error_name.empty())
            return -1;
        for (ErrorCode i = 0; i <= END; ++i)
        {
            if (error_codes_names.names[i] == error_name)
                return i;
        }
        return -1;
    }

    ErrorCode end() { return END + 1; }
}

}
