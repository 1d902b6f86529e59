#include <algorithm>
#include <filesystem>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "lantern/util/io.hpp"
#include "lantern/util/result.hpp"
#include "lantern/util/strings.hpp"

#include "lantern/config.hpp"
#include "lantern/diagnostic.hpp"
#include "lantern/glob.hpp"
#include "lantern/json.hpp"
#include "lantern/linker.hpp"
#include "lantern/services.hpp"
#include "lantern/url_path.hpp"

namespace lantern {
namespace {

constexpr std::u8string_view root_keys[] {
    u8"project", u8"sources", u8"tutorials", u8"output-url", u8"external", u8"templates",
};
constexpr std::u8string_view project_keys[] {
    u8"name", u8"version", u8"repository", u8"tree", u8"icon",
};
constexpr std::u8string_view source_keys[] {
    u8"name", u8"dir", u8"include", u8"exclude", u8"strip-include-prefix",
};
constexpr std::u8string_view tutorials_keys[] { u8"dir", u8"assets" };
constexpr std::u8string_view external_keys[] { u8"namespaces", u8"url" };
constexpr std::u8string_view template_ids[] { u8"page", u8"head", u8"nav" };

[[nodiscard]]
Config_Error make_error(Config_Error_Code code, std::u8string_view context, std::u8string_view detail)
{
    std::u8string message { context };
    message += u8": ";
    message += detail;
    return Config_Error { code, std::move(message) };
}

struct Config_Reader {
    Logger& logger;
    const std::filesystem::path& input_dir;
    std::pmr::memory_resource* memory;

    void warn_unknown_keys(
        const json::Object& object,
        std::span<const std::u8string_view> known,
        std::u8string_view context
    )
    {
        for (const json::Member& member : object) {
            if (std::ranges::contains(known, std::u8string_view { member.key })
                || !logger.can_log(Severity::soft_warning)) {
                continue;
            }
            std::pmr::u8string message { u8"Unknown key \"", memory };
            message += member.key;
            message += u8"\" in ";
            message += context;
            message += u8" is ignored.";
            logger.log(Severity::soft_warning, diagnostic::config_key_unknown, message);
        }
    }

    [[nodiscard]]
    Result<std::optional<std::u8string>, Config_Error>
    optional_string(const json::Object& object, std::u8string_view key, std::u8string_view context)
    {
        const json::Value* const value = object.find_value(key);
        if (!value) {
            return std::optional<std::u8string> {};
        }
        const json::String* const string = value->as_string();
        if (!string) {
            return wrong_type(key, u8"a string", context);
        }
        return std::optional<std::u8string> { std::u8string { *string } };
    }

    [[nodiscard]]
    Result<std::u8string, Config_Error>
    required_string(const json::Object& object, std::u8string_view key, std::u8string_view context)
    {
        auto result = optional_string(object, key, context);
        if (!result) {
            return result.error();
        }
        if (!*result) {
            std::u8string detail = u8"the required key \"";
            detail += key;
            detail += u8"\" is missing";
            return make_error(Config_Error_Code::missing_key, context, detail);
        }
        return std::move(**result);
    }

    [[nodiscard]]
    Result<std::vector<std::u8string>, Config_Error> string_array(
        const json::Object& object,
        std::u8string_view key,
        std::u8string_view context,
        std::span<const std::u8string_view> fallback
    )
    {
        const json::Value* const value = object.find_value(key);
        std::vector<std::u8string> result;
        if (!value) {
            result.assign(fallback.begin(), fallback.end());
            return result;
        }
        const json::Array* const array = value->as_array();
        if (!array) {
            return wrong_type(key, u8"an array of strings", context);
        }
        for (const json::Value& element : *array) {
            const json::String* const string = element.as_string();
            if (!string) {
                return wrong_type(key, u8"an array of strings", context);
            }
            result.emplace_back(*string);
        }
        return result;
    }

    [[nodiscard]]
    Result<std::vector<Glob>, Config_Error> glob_array(
        const json::Object& object,
        std::u8string_view key,
        std::u8string_view context,
        std::span<const std::u8string_view> fallback
    )
    {
        auto patterns = string_array(object, key, context, fallback);
        if (!patterns) {
            return patterns.error();
        }
        std::vector<Glob> result;
        for (const std::u8string& pattern : *patterns) {
            Result<Glob, Glob_Error_Code> glob = Glob::make(pattern);
            if (!glob) {
                std::u8string detail = u8"the glob pattern \"";
                detail += pattern;
                detail += u8"\" is invalid";
                return make_error(Config_Error_Code::bad_glob, context, detail);
            }
            result.push_back(std::move(*glob));
        }
        return result;
    }

    [[nodiscard]]
    std::filesystem::path resolve_path(std::u8string_view relative) const
    {
        return (input_dir / std::filesystem::path { relative }).lexically_normal();
    }

    [[nodiscard]]
    Config_Error
    wrong_type(std::u8string_view key, std::u8string_view expected, std::u8string_view context) const
    {
        std::u8string detail = u8"the value of \"";
        detail += key;
        detail += u8"\" must be ";
        detail += expected;
        return make_error(Config_Error_Code::wrong_type, context, detail);
    }

    [[nodiscard]]
    Result<void, Config_Error> read_project(Config& out, const json::Object& root)
    {
        constexpr std::u8string_view context = u8"\"project\"";
        const json::Object* const project = root.find_object(u8"project");
        if (!project) {
            return make_error(
                Config_Error_Code::missing_key, u8"lantern.json",
                u8"the required object \"project\" is missing"
            );
        }
        warn_unknown_keys(*project, project_keys, context);

        auto name = required_string(*project, u8"name", context);
        if (!name) {
            return name.error();
        }
        auto version = required_string(*project, u8"version", context);
        if (!version) {
            return version.error();
        }
        out.project.name = std::move(*name);
        out.project.version = std::move(*version);

        const std::pair<std::u8string_view, std::u8string*> optional_keys[] {
            { u8"repository", &out.project.repository },
            { u8"tree", &out.project.tree },
            { u8"icon", &out.project.icon },
        };
        for (const auto& [key, target] : optional_keys) {
            auto value = optional_string(*project, key, context);
            if (!value) {
                return value.error();
            }
            *target = value->value_or(std::u8string {});
        }
        return {};
    }

    [[nodiscard]]
    Result<void, Config_Error> read_sources(Config& out, const json::Object& root)
    {
        const json::Value* const sources_value = root.find_value(u8"sources");
        if (!sources_value) {
            return make_error(
                Config_Error_Code::missing_key, u8"lantern.json",
                u8"the required array \"sources\" is missing"
            );
        }
        const json::Array* const sources = sources_value->as_array();
        if (!sources) {
            return wrong_type(u8"sources", u8"an array of objects", u8"lantern.json");
        }

        constexpr std::u8string_view default_include[] { u8"**" };
        for (const json::Value& element : *sources) {
            const json::Object* const source = element.as_object();
            if (!source) {
                return wrong_type(u8"sources", u8"an array of objects", u8"lantern.json");
            }
            constexpr std::u8string_view context = u8"a source in \"sources\"";
            warn_unknown_keys(*source, source_keys, context);

            auto name = required_string(*source, u8"name", context);
            if (!name) {
                return name.error();
            }
            auto dir = required_string(*source, u8"dir", context);
            if (!dir) {
                return dir.error();
            }
            auto include = glob_array(*source, u8"include", context, default_include);
            if (!include) {
                return include.error();
            }
            auto exclude = glob_array(*source, u8"exclude", context, {});
            if (!exclude) {
                return exclude.error();
            }
            auto strip = optional_string(*source, u8"strip-include-prefix", context);
            if (!strip) {
                return strip.error();
            }
            out.sources.push_back(Source_Config {
                .name = std::move(*name),
                .dir = resolve_path(*dir),
                .include = std::move(*include),
                .exclude = std::move(*exclude),
                .strip_include_prefix = strip->value_or(std::u8string {}),
            });
        }
        return {};
    }

    [[nodiscard]]
    Result<void, Config_Error> read_tutorials(Config& out, const json::Object& root)
    {
        const json::Value* const value = root.find_value(u8"tutorials");
        if (!value) {
            return {};
        }
        const json::Object* const tutorials = value->as_object();
        if (!tutorials) {
            return wrong_type(u8"tutorials", u8"an object", u8"lantern.json");
        }
        constexpr std::u8string_view context = u8"\"tutorials\"";
        warn_unknown_keys(*tutorials, tutorials_keys, context);

        auto dir = required_string(*tutorials, u8"dir", context);
        if (!dir) {
            return dir.error();
        }
        auto assets = string_array(*tutorials, u8"assets", context, {});
        if (!assets) {
            return assets.error();
        }
        Tutorials_Config result { .dir = resolve_path(*dir), .assets = {} };
        for (const std::u8string& asset : *assets) {
            result.assets.push_back(resolve_path(asset));
        }
        out.tutorials = std::move(result);
        return {};
    }

    [[nodiscard]]
    Result<void, Config_Error> read_external(Config& out, const json::Object& root)
    {
        constexpr std::u8string_view default_namespaces[] { u8"std" };
        const json::Object empty { memory };
        const json::Object* external = &empty;
        if (const json::Value* const value = root.find_value(u8"external")) {
            external = value->as_object();
            if (!external) {
                return wrong_type(u8"external", u8"an object", u8"lantern.json");
            }
        }
        constexpr std::u8string_view context = u8"\"external\"";
        warn_unknown_keys(*external, external_keys, context);

        auto namespaces = string_array(*external, u8"namespaces", context, default_namespaces);
        if (!namespaces) {
            return namespaces.error();
        }
        auto url = optional_string(*external, u8"url", context);
        if (!url) {
            return url.error();
        }
        out.external_namespaces = std::move(*namespaces);
        out.external_url = url->value_or(std::u8string { default_external_url });
        return {};
    }

    [[nodiscard]]
    Result<void, Config_Error> read_templates(Config& out, const json::Object& root)
    {
        const json::Value* const value = root.find_value(u8"templates");
        if (!value) {
            return {};
        }
        const json::Object* const templates = value->as_object();
        if (!templates) {
            return wrong_type(u8"templates", u8"an object", u8"lantern.json");
        }
        constexpr std::u8string_view context = u8"\"templates\"";
        warn_unknown_keys(*templates, template_ids, context);
        for (const std::u8string_view id : template_ids) {
            auto file = optional_string(*templates, id, context);
            if (!file) {
                return file.error();
            }
            if (*file) {
                out.templates.push_back({ .id = std::u8string { id }, .file = resolve_path(**file) });
            }
        }
        return {};
    }
};

} // namespace

bool Source_Config::is_included(std::u8string_view relative_path) const
{
    const auto matches = [&](const Glob& glob) { return glob.matches(relative_path); };
    return std::ranges::any_of(include, matches) && std::ranges::none_of(exclude, matches);
}

Result<Config, Config_Error> parse_config(
    std::u8string_view source,
    const std::filesystem::path& input_dir,
    Logger& logger,
    std::pmr::memory_resource* memory
)
{
    const std::optional<json::Value> root_value = json::load(source, memory);
    if (!root_value) {
        return make_error(Config_Error_Code::malformed, u8"lantern.json", u8"the file is not valid JSON");
    }
    const json::Object* const root = root_value->as_object();
    if (!root) {
        return make_error(Config_Error_Code::malformed, u8"lantern.json", u8"the top level must be an object");
    }

    Config_Reader reader { .logger = logger, .input_dir = input_dir, .memory = memory };
    reader.warn_unknown_keys(*root, root_keys, u8"lantern.json");

    Config result;
    result.input_dir = input_dir;
    for (const auto read : { &Config_Reader::read_project, &Config_Reader::read_sources,
                             &Config_Reader::read_tutorials, &Config_Reader::read_external,
                             &Config_Reader::read_templates }) {
        if (auto r = (reader.*read)(result, *root); !r) {
            return r.error();
        }
    }

    auto output_url = reader.optional_string(*root, u8"output-url", u8"lantern.json");
    if (!output_url) {
        return output_url.error();
    }
    result.output_url = output_url->value_or(std::u8string {});
    return result;
}

Result<Config, Config_Error>
load_config(const std::filesystem::path& input_dir, Logger& logger, std::pmr::memory_resource* memory)
{
    std::error_code error;
    const std::filesystem::path absolute_dir = std::filesystem::absolute(input_dir, error).lexically_normal();
    if (error) {
        return make_error(Config_Error_Code::io_error, input_dir.generic_u8string(), u8"the directory cannot be resolved");
    }
    const std::filesystem::path file = absolute_dir / std::filesystem::path { config_file_name };

    Result<std::pmr::vector<char8_t>, IO_Error_Code> source = load_utf8_file(file, memory);
    if (!source) {
        return make_error(Config_Error_Code::io_error, file.generic_u8string(), io_error_code_message(source.error()));
    }
    return parse_config(as_u8string_view(*source), absolute_dir, logger, memory);
}

Linker_Options make_linker_options(const Config& config)
{
    Linker_Options result {
        .output_url = Url_Path::parse(config.output_url),
        .roots = {},
        .external_namespaces = config.external_namespaces,
        .external_url = config.external_url,
        .tree_url = config.project.tree,
        .project_dir = Url_Path::parse(config.input_dir.generic_u8string()),
    };
    for (const Source_Config& source : config.sources) {
        result.roots.push_back(Source_Root {
            .name = source.name,
            .dir = Url_Path::parse(source.dir.generic_u8string()),
            .strip_include_prefix = Url_Path::parse(source.strip_include_prefix),
        });
    }
    return result;
}

} // namespace lantern
