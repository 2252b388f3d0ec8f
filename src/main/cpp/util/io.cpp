#include <cstddef>
#include <cstdio>
#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sigil/util/io.hpp"
#include "sigil/util/result.hpp"
#include "sigil/util/unicode.hpp"

#include "sigil/fwd.hpp"

namespace sigil {
namespace {

struct [[nodiscard]] Unique_File {
private:
    std::FILE* m_file;

public:
    explicit Unique_File(std::FILE* f) noexcept
        : m_file { f }
    {
    }

    Unique_File(const Unique_File&) = delete;
    Unique_File& operator=(const Unique_File&) = delete;

    [[nodiscard]]
    std::FILE* get() const noexcept
    {
        return m_file;
    }

    [[nodiscard]]
    explicit operator bool() const noexcept
    {
        return m_file != nullptr;
    }

    ~Unique_File()
    {
        if (m_file) {
            std::fclose(std::exchange(m_file, nullptr));
        }
    }
};

} // namespace

Result<std::pmr::vector<char8_t>, IO_Error_Code>
load_utf8_file(std::u8string_view path, std::pmr::memory_resource* memory)
{
    const std::string c_path(reinterpret_cast<const char*>(path.data()), path.size());
    const Unique_File stream { std::fopen(c_path.c_str(), "rb") };
    if (!stream) {
        return IO_Error_Code::cannot_open;
    }

    std::pmr::vector<char8_t> result { memory };
    constexpr std::size_t block_size = BUFSIZ;
    std::size_t read_size;
    do {
        const std::size_t old_size = result.size();
        result.resize(old_size + block_size);
        read_size = std::fread(result.data() + old_size, 1, block_size, stream.get());
        result.resize(old_size + read_size);
        if (std::ferror(stream.get())) {
            return IO_Error_Code::read_error;
        }
    } while (read_size == block_size);

    const std::u8string_view contents { result.data(), result.size() };
    if (!utf8::is_valid(contents)) {
        return IO_Error_Code::corrupted;
    }
    return result;
}

} // namespace sigil
