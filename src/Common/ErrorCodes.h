#pragma once

#include <cstddef>
#include <string_view>

/** Error codes carried by MDTouch::Exception.
  * The list itself lives in ErrorCodes.cpp, declare the ones you need with
  *  namespace ErrorCodes { extern const int NAME; }
  */

namespace MDTouch
{

namespace ErrorCodes
{
    /// ErrorCode identifier (index in array).
    using ErrorCode = int;

    /// Get name of error_code by identifier.
    /// Returns statically allocated string.
    std::string_view getName(ErrorCode error_code);
    /// Get error code value by name.
    ///
    /// It has O(N) complexity, but it is used only in tests.
    ErrorCode getErrorCodeByName(std::string_view error_name);

    /// Get index just after last error_code identifier.
    ErrorCode end();
}

}
