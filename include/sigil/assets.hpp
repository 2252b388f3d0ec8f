#ifndef SIGIL_ASSETS_HPP
#define SIGIL_ASSETS_HPP

#include <string_view>

namespace sigil::assets {

/// @brief Generated from `data/sym.txt`.
extern const std::u8string_view sym_txt;
/// @brief Generated from `data/emoji.txt`.
extern const std::u8string_view emoji_txt;

} // namespace sigil::assets

#endif
