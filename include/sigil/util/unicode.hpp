#ifndef SIGIL_UNICODE_HPP
#define SIGIL_UNICODE_HPP

#include "ulight/impl/unicode.hpp"

namespace sigil::utf8 {

using ulight::utf8::encode8_unchecked;
using ulight::utf8::is_valid;

} // namespace sigil::utf8

#endif
