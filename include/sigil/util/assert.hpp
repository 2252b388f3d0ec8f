#ifndef SIGIL_ASSERT_HPP
#define SIGIL_ASSERT_HPP

#include "ulight/impl/assert.hpp"

namespace sigil {

using ulight::Assertion_Error;
using ulight::Assertion_Error_Type;

#define SIGIL_ASSERT(...) ULIGHT_ASSERT(__VA_ARGS__)
#define SIGIL_DEBUG_ASSERT(...) ULIGHT_DEBUG_ASSERT(__VA_ARGS__)

#define SIGIL_ASSERT_UNREACHABLE(...) ULIGHT_ASSERT_UNREACHABLE(__VA_ARGS__)
#define SIGIL_DEBUG_ASSERT_UNREACHABLE(...) ULIGHT_DEBUG_ASSERT_UNREACHABLE(__VA_ARGS__)

} // namespace sigil

#endif
