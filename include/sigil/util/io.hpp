#ifndef SIGIL_IO_HPP
#define SIGIL_IO_HPP

#include <memory_resource>
#include <string_view>
#include <vector>

#include "sigil/util/result.hpp"

#include "sigil/fwd.hpp"

namespace sigil {

enum struct IO_Error_Code : Default_Underlying {
    /// @brief The file couldn't be opened.
    /// This may be due to a bad path, missing permissions, or disk errors.
    cannot_open,
    /// @brief An error occurred while reading the file.
    read_error,
    /// @brief The file is not valid UTF-8.
    corrupted,
};

[[nodiscard]]
constexpr std::u8string_view io_error_code_message(IO_Error_Code code)
{
    switch (code) {
    case IO_Error_Code::cannot_open: return u8"The file could not be opened.";
    case IO_Error_Code::read_error: return u8"An I/O error occurred while reading the file.";
    case IO_Error_Code::corrupted: return u8"The file is not properly UTF-8 encoded.";
    }
    return u8"An unknown I/O error occurred.";
}

/// @brief Reads a whole UTF-8 encoded file into a vector allocated from `memory`.
/// Fails with `IO_Error_Code::corrupted` if the file contents are not valid UTF-8.
[[nodiscard]]
Result<std::pmr::vector<char8_t>, IO_Error_Code>
load_utf8_file(std::u8string_view path, std::pmr::memory_resource* memory);

} // namespace sigil

#endif
