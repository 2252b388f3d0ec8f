#ifndef SIGIL_FWD_HPP
#define SIGIL_FWD_HPP

#include "sigil/settings.hpp"

SIGIL_IF_DEBUG() // silence unused warning for settings.hpp

namespace sigil {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define SIGIL_ENUM_STRING_CASE8(...)                                                               \
    case __VA_ARGS__: return u8## #__VA_ARGS__

struct Alias_Declaration;
struct Binding;
struct Compile_Error;
enum struct Compile_Error_Code : Default_Underlying;
struct Compile_Options;
struct Declaration;
enum struct Declaration_Kind : Default_Underlying;
struct Diagnostic;
struct Ignorant_Logger;
enum struct IO_Error_Code : Default_Underlying;
struct Line;
enum struct Line_Kind : Default_Underlying;
struct Logger;
struct Modifier;
struct Modifier_Set;
struct Module;
struct Module_Entry;
struct Path_Match;
enum struct Severity : Default_Underlying;
struct Symbol;
struct Variant;

template <typename, typename>
struct Result;

} // namespace sigil

#endif
