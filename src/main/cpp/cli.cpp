#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

#define ARGS_NOEXCEPT
#include "args.hxx"

#include "lantern/util/ansi.hpp"
#include "lantern/util/result.hpp"
#include "lantern/util/severity.hpp"
#include "lantern/util/strings.hpp"

#include "lantern/ast.hpp"
#include "lantern/build_context.hpp"
#include "lantern/builder.hpp"
#include "lantern/config.hpp"
#include "lantern/diagnostic.hpp"
#include "lantern/file_tree.hpp"
#include "lantern/linker.hpp"
#include "lantern/renderer.hpp"
#include "lantern/services.hpp"
#include "lantern/symbol_graph.hpp"
#include "lantern/tutorial_tree.hpp"
#include "lantern/ulight_highlighter.hpp"

namespace lantern {
namespace {

[[nodiscard]]
std::u8string_view severity_highlight(Severity severity)
{
    return severity <= Severity::trace    ? ansi::black
        : severity <= Severity::debug     ? ansi::h_black
        : severity <= Severity::info      ? ansi::blue
        : severity <= Severity::soft_warning ? ansi::green
        : severity <= Severity::warning   ? ansi::h_yellow
        : severity <= Severity::error     ? ansi::h_red
        : severity <= Severity::fatal     ? ansi::red
                                          : ansi::magenta;
}

void print_u8(std::ostream& out, std::u8string_view text)
{
    out << as_string_view(text);
}

struct Stderr_Logger final : Logger {
    bool any_errors = false;

    [[nodiscard]]
    explicit Stderr_Logger(Severity min_severity)
        : Logger { min_severity }
    {
    }

    void operator()(Diagnostic diagnostic) final
    {
        any_errors |= diagnostic.severity >= Severity::error;

        std::u8string out;
        out += severity_highlight(diagnostic.severity);
        out += severity_tag(diagnostic.severity);
        out += ansi::reset;
        out += u8": ";
        if (!diagnostic.location.file.empty()) {
            out += diagnostic.location.file;
            if (diagnostic.location.length != 0) {
                out += u8'@';
                const std::string offset = std::to_string(diagnostic.location.begin);
                out.append(offset.begin(), offset.end());
            }
            out += u8": ";
        }
        out += diagnostic.message;
        out += ansi::h_black;
        out += u8" [";
        out += diagnostic.id;
        out += u8']';
        out += ansi::reset;
        out += u8'\n';
        print_u8(std::cerr, out);
    }
};

void print_error(std::u8string_view message)
{
    std::u8string out;
    out += severity_highlight(Severity::error);
    out += severity_tag(Severity::error);
    out += ansi::reset;
    out += u8": ";
    out += message;
    out += u8'\n';
    print_u8(std::cerr, out);
}

void print_config_error(const Config_Error& error)
{
    std::u8string message { u8"Invalid configuration: " };
    message += error.message;
    print_error(message);
}

int main(int argc, const char* const* const argv)
{
    static const std::unordered_map<std::string, Severity> severity_arg_map {
        { "min", Severity::min },
        { "trace", Severity::trace },
        { "debug", Severity::debug },
        { "info", Severity::info },
        { "soft_warning", Severity::soft_warning },
        { "warning", Severity::warning },
        { "error", Severity::error },
        { "fatal", Severity::fatal },
        { "none", Severity::none },
    };

    args::ArgumentParser parser { "Generates a documentation site for a C++ project." };
    parser.helpParams.width = 100;
    parser.helpParams.addChoices = true;
    args::ValueFlag<std::string> input_arg {
        parser,
        "input",
        "Project directory, which contains lantern.json",
        { 'i', "input" },
        args::Options::Required,
    };
    args::ValueFlag<std::string> output_arg {
        parser,
        "output",
        "Directory that the site is generated in",
        { 'o', "output" },
        args::Options::Required,
    };
    args::ValueFlagList<std::string> ast_arg {
        parser,
        "ast",
        "JSON AST dump of a translation unit, as produced by clang -Xclang -ast-dump=json",
        { 'a', "ast" },
    };
    args::Flag overwrite_arg {
        parser,
        "overwrite",
        "Replace the output directory if it already exists",
        { "overwrite" },
    };
    args::MapFlag<std::string, Severity> severity_arg {
        parser,
        "severity",
        "Minimum (>=) severity for log messages",
        { 'l', "severity" },
        severity_arg_map,
        Severity::info,
    };
    args::ValueFlag<unsigned> threads_arg {
        parser,
        "threads",
        "Number of worker threads, or 0 for one per hardware thread",
        { 'j', "threads" },
        0,
    };
    args::HelpFlag help_arg {
        parser, "help", "Display this help menu", { 'h', "help" }, args::Options::Global
    };

    if (argc <= 1) {
        parser.Help(std::cout);
        return EXIT_FAILURE;
    }
    if (!parser.ParseCLI(argc, argv) || parser.GetError() != args::Error::None) {
        std::cerr << parser.GetErrorMsg() << '\n';
        return EXIT_FAILURE;
    }
    if (help_arg.Matched()) {
        parser.Help(std::cout);
        return EXIT_SUCCESS;
    }

    const std::filesystem::path input_dir
        = std::filesystem::absolute(std::filesystem::path { input_arg.Get() }).lexically_normal();
    const std::filesystem::path output_dir
        = std::filesystem::absolute(std::filesystem::path { output_arg.Get() }).lexically_normal();

    Stderr_Logger logger { severity_arg.Get() };
    std::pmr::unsynchronized_pool_resource memory;

    Result<Config, Config_Error> config = load_config(input_dir, logger, &memory);
    if (!config) {
        print_config_error(config.error());
        return EXIT_FAILURE;
    }

    std::vector<ast::Entity> translation_units;
    for (const std::string& ast_path : ast_arg.Get()) {
        Result<ast::Entity, ast::AST_Load_Error> unit
            = ast::load_ast_file(std::filesystem::path { ast_path }, &memory);
        if (!unit) {
            std::u8string message { u8"Unable to load AST \"" };
            message += unit.error().file;
            message += u8"\": ";
            message += unit.error().message;
            print_error(message);
            return EXIT_FAILURE;
        }
        translation_units.push_back(std::move(*unit));
    }
    Symbol_Graph graph = Symbol_Graph::build(translation_units);
    translation_units.clear();

    Result<std::vector<File_Root>, Config_Error> files = scan_sources(config->sources);
    if (!files) {
        print_config_error(files.error());
        return EXIT_FAILURE;
    }

    std::optional<Tutorial_Folder> tutorials;
    if (config->tutorials) {
        Result<Tutorial_Folder, Config_Error> loaded = load_tutorials(*config->tutorials);
        if (!loaded) {
            print_config_error(loaded.error());
            return EXIT_FAILURE;
        }
        tutorials = std::move(*loaded);
    }

    const Result<Template_Renderer, Config_Error> renderer = Template_Renderer::load(*config);
    if (!renderer) {
        print_config_error(renderer.error());
        return EXIT_FAILURE;
    }

    std::error_code error;
    if (std::filesystem::exists(output_dir, error)) {
        if (!overwrite_arg.Matched()) {
            std::u8string message { u8"Output directory \"" };
            message += output_dir.generic_u8string();
            message += u8"\" already exists and --overwrite was not specified.";
            print_error(message);
            return EXIT_FAILURE;
        }
        std::filesystem::remove_all(output_dir, error);
        if (error) {
            std::u8string message { u8"Unable to remove output directory \"" };
            message += output_dir.generic_u8string();
            message += u8"\": ";
            message += as_u8string_view(error.message());
            print_error(message);
            return EXIT_FAILURE;
        }
    }

    Synchronized_Logger task_logger { logger };
    Linker linker { make_linker_options(*config) };
    Builder builder {
        Build_Context {
            .config = std::move(*config),
            .graph = std::move(graph),
            .linker = std::move(linker),
            .files = std::move(*files),
            .tutorials = std::move(tutorials),
            .renderer = *renderer,
            .highlighter = ulight_syntax_highlighter,
            .logger = task_logger,
            .output_dir = output_dir,
        },
        threads_arg.Get(),
    };

    const auto print_progress = [&](std::u8string_view message) {
        task_logger.log(Severity::info, diagnostic::build_progress, message);
    };
    const Result<std::size_t, Build_Error> result = builder.build(print_progress);
    if (!result) {
        std::u8string message { u8"Failed to build " };
        message += result.error().url.empty() ? u8"the site" : result.error().url;
        message += u8": ";
        message += result.error().cause;
        logger.log(Severity::error, diagnostic::build_page_failed, message);
        return EXIT_FAILURE;
    }

    std::cout << "Generated " << *result << " pages in " << output_dir.string() << '\n';
    return logger.any_errors ? EXIT_FAILURE : EXIT_SUCCESS;
}

} // namespace
} // namespace lantern

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, const char* const* argv)
{
    return lantern::main(argc, argv);
}
