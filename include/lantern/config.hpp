#ifndef LANTERN_CONFIG_HPP
#define LANTERN_CONFIG_HPP

#include <filesystem>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lantern/util/result.hpp"

#include "lantern/fwd.hpp"
#include "lantern/glob.hpp"

namespace lantern {

/// @brief The name of the configuration file within the input directory.
inline constexpr std::u8string_view config_file_name = u8"lantern.json";

inline constexpr std::u8string_view default_external_url = u8"https://en.cppreference.com/w/cpp";

enum struct Config_Error_Code : Default_Underlying {
    /// @brief The configuration file or a file it refers to could not be read.
    io_error,
    /// @brief The configuration file is not valid JSON.
    malformed,
    /// @brief A required key is missing.
    missing_key,
    /// @brief A key has a value of the wrong type.
    wrong_type,
    /// @brief A glob pattern could not be compiled.
    bad_glob,
};

struct Config_Error {
    Config_Error_Code code;
    std::u8string message;
};

struct Project_Config {
    std::u8string name;
    std::u8string version;
    std::u8string repository;
    /// @brief A URL template for viewing source files, like
    /// `https://github.com/user/repo/tree/main/{path}`.
    std::u8string tree;
    std::u8string icon;
};

struct Source_Config {
    std::u8string name;
    /// @brief The absolute, normalized directory of the source files.
    std::filesystem::path dir;
    std::vector<Glob> include;
    std::vector<Glob> exclude;
    std::u8string strip_include_prefix;

    /// @brief Returns `true` if the file at `relative_path` (relative to `dir`) is documented,
    /// i.e. it matches one of the `include` globs and none of the `exclude` globs.
    [[nodiscard]]
    bool is_included(std::u8string_view relative_path) const;
};

struct Tutorials_Config {
    std::filesystem::path dir;
    /// @brief Files or directories which are copied into the output as they are.
    std::vector<std::filesystem::path> assets;
};

struct Template_Override {
    std::u8string id;
    std::filesystem::path file;
};

struct Config {
    /// @brief The directory that contains the configuration file.
    std::filesystem::path input_dir;
    Project_Config project;
    std::vector<Source_Config> sources;
    std::optional<Tutorials_Config> tutorials;
    /// @brief The URL path at which the site is hosted, or empty for the site root.
    std::u8string output_url;
    std::vector<std::u8string> external_namespaces;
    std::u8string external_url;
    std::vector<Template_Override> templates;
};

/// @brief Parses the contents of a configuration file.
/// Relative paths in the configuration are resolved against `input_dir`.
/// Unrecognized keys are logged as soft warnings.
[[nodiscard]]
Result<Config, Config_Error> parse_config(
    std::u8string_view source,
    const std::filesystem::path& input_dir,
    Logger& logger,
    std::pmr::memory_resource* memory
);

/// @brief Loads and parses `lantern.json` in `input_dir`.
[[nodiscard]]
Result<Config, Config_Error>
load_config(const std::filesystem::path& input_dir, Logger& logger, std::pmr::memory_resource* memory);

/// @brief Derives the options of the `Linker` from the configuration.
[[nodiscard]]
Linker_Options make_linker_options(const Config& config);

} // namespace lantern

#endif
