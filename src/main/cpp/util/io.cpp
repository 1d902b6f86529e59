#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <memory_resource>
#include <string_view>
#include <system_error>
#include <vector>

#include "lantern/util/io.hpp"
#include "lantern/util/result.hpp"
#include "lantern/util/unicode.hpp"

#include "lantern/fwd.hpp"

namespace lantern {

Result<void, IO_Error_Code>
load_utf8_file(std::pmr::vector<char8_t>& out, const std::filesystem::path& path)
{
    const Unique_File stream = fopen_unique(path, "rb");
    if (!stream) {
        return IO_Error_Code::cannot_open;
    }

    const std::size_t initial_size = out.size();
    constexpr std::size_t block_size = BUFSIZ;
    std::size_t read_size;
    do {
        const std::size_t old_size = out.size();
        out.resize(old_size + block_size);
        read_size = std::fread(out.data() + old_size, 1, block_size, stream.get());
        out.resize(old_size + read_size);
        if (std::ferror(stream.get())) {
            return IO_Error_Code::read_error;
        }
    } while (read_size == block_size);

    const std::u8string_view str { out.data() + initial_size, out.size() - initial_size };
    if (!utf8::is_valid(str)) {
        return IO_Error_Code::corrupted;
    }
    return {};
}

Result<std::pmr::vector<char8_t>, IO_Error_Code>
load_utf8_file(const std::filesystem::path& path, std::pmr::memory_resource* memory)
{
    std::pmr::vector<char8_t> result { memory };
    if (auto r = load_utf8_file(result, path); !r) {
        return r.error();
    }
    return result;
}

Result<void, IO_Error_Code>
bytes_to_file(std::u8string_view data, const std::filesystem::path& path)
{
    Unique_File file = fopen_unique(path, "wb");
    if (!file) {
        return IO_Error_Code::cannot_open;
    }
    const std::size_t bytes_written = std::fwrite(data.data(), 1, data.size(), file.get());
    if (bytes_written != data.size()) {
        return IO_Error_Code::write_error;
    }
    if (std::fflush(file.get()) != 0) {
        return IO_Error_Code::write_error;
    }
    return {};
}

Result<void, IO_Error_Code> create_directories(const std::filesystem::path& path)
{
    std::error_code error;
    std::filesystem::create_directories(path, error);
    if (error) {
        return IO_Error_Code::directory_error;
    }
    return {};
}

} // namespace lantern
