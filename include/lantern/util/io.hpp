#ifndef LANTERN_IO_HPP
#define LANTERN_IO_HPP

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <memory_resource>
#include <string_view>
#include <utility>
#include <vector>

#include "lantern/util/result.hpp"

#include "lantern/fwd.hpp"

namespace lantern {

enum struct IO_Error_Code : Default_Underlying {
    /// @brief The file couldn't be opened.
    /// This may be due to disk errors, security issues, bad file paths, or other issues.
    cannot_open,
    /// @brief An error occurred while reading a file.
    read_error,
    /// @brief An error occurred while writing a file.
    write_error,
    /// @brief The file is not properly encoded.
    /// For example, if an attempt is made to read a text file as UTF-8 that is not encoded as such.
    corrupted,
    /// @brief A directory could not be created or listed.
    directory_error,
};

[[nodiscard]]
constexpr std::u8string_view io_error_code_message(IO_Error_Code code)
{
    switch (code) {
    case IO_Error_Code::cannot_open: return u8"The file could not be opened.";
    case IO_Error_Code::read_error: return u8"An I/O error occurred while reading the file.";
    case IO_Error_Code::write_error: return u8"An I/O error occurred while writing the file.";
    case IO_Error_Code::corrupted: return u8"The file does not contain valid UTF-8 text.";
    case IO_Error_Code::directory_error: return u8"The directory could not be accessed.";
    }
    return u8"Unknown I/O error.";
}

struct [[nodiscard]] Unique_File {
private:
    std::FILE* m_file = nullptr;

public:
    constexpr Unique_File() = default;

    constexpr Unique_File(std::FILE* f)
        : m_file { f }
    {
    }

    constexpr Unique_File(Unique_File&& other) noexcept
        : m_file { std::exchange(other.m_file, nullptr) }
    {
    }

    Unique_File(const Unique_File&) = delete;
    Unique_File& operator=(const Unique_File&) = delete;

    constexpr Unique_File& operator=(Unique_File&& other) noexcept
    {
        swap(*this, other);
        other.close();
        return *this;
    }

    constexpr friend void swap(Unique_File& x, Unique_File& y) noexcept
    {
        std::swap(x.m_file, y.m_file);
    }

    void close() noexcept
    {
        if (m_file) {
            std::fclose(std::exchange(m_file, nullptr));
        }
    }

    [[nodiscard]]
    constexpr std::FILE* get() const noexcept
    {
        return m_file;
    }

    [[nodiscard]]
    constexpr operator bool() const noexcept
    {
        return m_file != nullptr;
    }

    ~Unique_File()
    {
        close();
    }
};

/// @brief Forwards the arguments to `std::fopen` and wraps the result in `Unique_File`.
[[nodiscard]]
inline Unique_File fopen_unique(const std::filesystem::path& path, const char* mode) noexcept
{
    return std::fopen(path.c_str(), mode);
}

/// @brief Reads all bytes from a file and appends them to `out`,
/// verifying that the appended bytes are valid UTF-8.
[[nodiscard]]
Result<void, IO_Error_Code>
load_utf8_file(std::pmr::vector<char8_t>& out, const std::filesystem::path& path);

[[nodiscard]]
Result<std::pmr::vector<char8_t>, IO_Error_Code>
load_utf8_file(const std::filesystem::path& path, std::pmr::memory_resource* memory);

/// @brief Writes `data` to the file at `path`, replacing any previous contents.
[[nodiscard]]
Result<void, IO_Error_Code>
bytes_to_file(std::u8string_view data, const std::filesystem::path& path);

/// @brief Like `std::filesystem::create_directories`, but reports failure as an error code
/// instead of throwing.
/// Succeeds if the directory already exists.
[[nodiscard]]
Result<void, IO_Error_Code> create_directories(const std::filesystem::path& path);

} // namespace lantern

#endif
