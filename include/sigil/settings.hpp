#ifndef SIGIL_SETTINGS_HPP
#define SIGIL_SETTINGS_HPP

#include <string_view>

#ifndef NDEBUG // debug builds
#define SIGIL_DEBUG 1
#define SIGIL_IF_DEBUG(...) __VA_ARGS__
#else // release builds
#define SIGIL_IF_DEBUG(...)
#endif

namespace sigil {

/// @brief The name under which the general symbol corpus is bound in the root module.
inline constexpr std::u8string_view sym_corpus_name = u8"sym";
/// @brief The name under which the emoji corpus is bound in the root module.
inline constexpr std::u8string_view emoji_corpus_name = u8"emoji";

} // namespace sigil

#endif
