#include <string_view>

#include "sigil/util/assert.hpp"

#include "sigil/compile_error.hpp"
#include "sigil/diagnostic.hpp"

namespace sigil {

#define SIGIL_COMPILE_ERROR_CODE_NAME_CASE(id, diagnostic_id)                                      \
    case Compile_Error_Code::id: return u8## #id;

#define SIGIL_COMPILE_ERROR_CODE_ID_CASE(id, diagnostic_id)                                        \
    case Compile_Error_Code::id: return diagnostic::diagnostic_id;

std::u8string_view compile_error_code_name(Compile_Error_Code code) noexcept
{
    switch (code) {
        SIGIL_COMPILE_ERROR_CODE_ENUM_DATA(SIGIL_COMPILE_ERROR_CODE_NAME_CASE)
    }
    SIGIL_ASSERT_UNREACHABLE(u8"Invalid compile error code.");
}

std::u8string_view compile_error_diagnostic_id(Compile_Error_Code code) noexcept
{
    switch (code) {
        SIGIL_COMPILE_ERROR_CODE_ENUM_DATA(SIGIL_COMPILE_ERROR_CODE_ID_CASE)
    }
    SIGIL_ASSERT_UNREACHABLE(u8"Invalid compile error code.");
}

} // namespace sigil
