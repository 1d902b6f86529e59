#include <cstddef>
#include <exception>
#include <filesystem>
#include <iterator>
#include <memory>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "llvm/Support/Threading.h"

#include "lantern/util/html.hpp"
#include "lantern/util/html_writer.hpp"
#include "lantern/util/io.hpp"
#include "lantern/util/strings.hpp"

#include "lantern/assets.hpp"
#include "lantern/builder.hpp"
#include "lantern/diagnostic.hpp"
#include "lantern/entry.hpp"
#include "lantern/json.hpp"
#include "lantern/nav.hpp"
#include "lantern/renderer.hpp"
#include "lantern/services.hpp"

namespace lantern {
namespace {

[[nodiscard]]
std::u8string to_u8string(std::string_view str)
{
    return std::u8string { str.begin(), str.end() };
}

[[nodiscard]]
std::pmr::u8string escape_html(std::u8string_view text, std::pmr::memory_resource* memory)
{
    std::pmr::u8string result { memory };
    String_Consumer out { result };
    append_html_escaped_of(out, text, u8"&<>\"'");
    return result;
}

[[nodiscard]]
Build_Error io_failure(std::u8string_view what, const std::filesystem::path& path, std::u8string_view cause)
{
    std::u8string message { what };
    message += u8" \"";
    message += path.generic_u8string();
    message += u8"\": ";
    message += cause;
    return Build_Error { .url = {}, .cause = std::move(message) };
}

[[nodiscard]]
Result<void, Build_Error> copy_file(const std::filesystem::path& from, const std::filesystem::path& to)
{
    if (to.has_parent_path()) {
        if (const Result<void, IO_Error_Code> r = create_directories(to.parent_path()); !r) {
            return io_failure(u8"Unable to create directory", to.parent_path(), io_error_code_message(r.error()));
        }
    }
    std::error_code error;
    std::filesystem::copy(
        from, to,
        std::filesystem::copy_options::overwrite_existing | std::filesystem::copy_options::recursive,
        error
    );
    if (error) {
        return io_failure(u8"Unable to copy", from, to_u8string(error.message()));
    }
    return {};
}

/// @brief Returns where the tutorial asset at `asset` is copied to, relative to the output directory.
/// Assets within the tutorials directory keep their path relative to it,
/// so that tutorials can refer to `assets/image.png` rather than `docs/assets/image.png`.
[[nodiscard]]
std::filesystem::path asset_destination(const std::filesystem::path& asset, const Config& config)
{
    const std::filesystem::path& tutorials_dir = config.tutorials->dir;
    const std::filesystem::path in_tutorials = asset.lexically_relative(tutorials_dir);
    if (!in_tutorials.empty() && *in_tutorials.begin() != "..") {
        return in_tutorials;
    }
    const std::filesystem::path in_input = asset.lexically_relative(config.input_dir);
    if (!in_input.empty() && *in_input.begin() != "..") {
        return in_input;
    }
    return asset.filename();
}

/// @brief The template variables which have the same value on every page.
struct Site_Variables {
    std::pmr::u8string project_name;
    std::pmr::u8string project_version;
    std::pmr::u8string project_repository;
    std::pmr::u8string project_icon;
    std::pmr::u8string output_url;

    [[nodiscard]]
    Site_Variables(const Build_Context& context, std::pmr::memory_resource* memory)
        : project_name { escape_html(context.config.project.name, memory) }
        , project_version { escape_html(context.config.project.version, memory) }
        , project_repository { escape_html(context.config.project.repository, memory) }
        , project_icon { memory }
        , output_url { memory }
    {
        // Templates append paths like `/main.css`, so the root is the empty string.
        std::u8string base = context.linker.options().output_url.to_encoded_string();
        if (base.ends_with(u8'/')) {
            base.pop_back();
        }
        output_url = escape_html(base, memory);
        if (!context.config.project.icon.empty()) {
            project_icon = output_url;
            project_icon += u8"/icon.png";
        }
    }

    [[nodiscard]]
    std::vector<Template_Variable> to_variables() const
    {
        return {
            { u8"project_name", project_name },
            { u8"project_version", project_version },
            { u8"project_repository", project_repository },
            { u8"project_icon", project_icon },
            { u8"output_url", output_url },
        };
    }
};

[[nodiscard]]
Build_Error page_failure(const Url_Path& url, std::u8string_view cause)
{
    std::u8string display { u8"/" };
    display += url.to_raw_string();
    return Build_Error { .url = std::move(display), .cause = std::u8string { cause } };
}

[[nodiscard]]
std::u8string nav_html_of(const Nav_Item& item)
{
    std::pmr::u8string result;
    HTML_Writer writer { result };
    write_nav_html(writer, item);
    return std::u8string { result };
}

} // namespace

Builder::Builder(Build_Context&& context, unsigned thread_count)
    : m_setup_context { std::make_shared<Build_Context>(std::move(context)) }
    , m_pool { llvm::hardware_concurrency(thread_count) }
{
}

Builder::~Builder()
{
    m_pool.wait();
}

Result<void, Build_Error> Builder::setup()
{
    LANTERN_ASSERT(m_setup_context);
    Build_Context& context = *m_setup_context;

    if (const Result<void, IO_Error_Code> r = create_directories(context.output_dir); !r) {
        return io_failure(
            u8"Unable to create output directory", context.output_dir,
            io_error_code_message(r.error())
        );
    }

    const std::filesystem::path css_path = context.output_dir / "main.css";
    if (const Result<void, IO_Error_Code> r = bytes_to_file(assets::main_css, css_path); !r) {
        return io_failure(u8"Unable to write", css_path, io_error_code_message(r.error()));
    }

    if (!context.config.project.icon.empty()) {
        const std::filesystem::path icon
            = context.config.input_dir / std::filesystem::path { context.config.project.icon };
        if (Result<void, Build_Error> r = copy_file(icon, context.output_dir / "icon.png"); !r) {
            return std::move(r).error();
        }
    }

    if (context.config.tutorials) {
        for (const std::filesystem::path& asset : context.config.tutorials->assets) {
            const std::filesystem::path destination
                = context.output_dir / asset_destination(asset, context.config);
            if (Result<void, Build_Error> r = copy_file(asset, destination); !r) {
                return std::move(r).error();
            }
        }
    }

    Result<std::u8string, Build_Error> nav = render_nav(context);
    if (!nav) {
        return std::move(nav).error();
    }
    context.nav_html = std::move(*nav);

    m_context = std::move(m_setup_context);
    return {};
}

Page_Task Builder::spawn(const Entry& entry)
{
    LANTERN_ASSERT(is_set_up());
    return m_pool.async([context = m_context, entry]() -> Page_Result {
        try {
            return write_page(*context, entry);
        } catch (const std::exception& e) {
            return page_failure(entry.url(*context), to_u8string(e.what()));
        }
    });
}

std::vector<Page_Task> Builder::spawn_all()
{
    LANTERN_ASSERT(is_set_up());
    std::vector<Page_Task> result;
    for (const Entry& entry : make_root_entries(*m_context)) {
        std::vector<Page_Task> tasks = entry.build(*this);
        result.insert(
            result.end(), std::make_move_iterator(tasks.begin()),
            std::make_move_iterator(tasks.end())
        );
    }
    return result;
}

Result<std::size_t, Build_Error> Builder::build(Progress_Callback progress)
{
    if (Result<void, Build_Error> r = setup(); !r) {
        return std::move(r).error();
    }
    const std::vector<Page_Task> tasks = spawn_all();
    return join_tasks(tasks, m_context->logger, progress);
}

Result<std::u8string, Build_Error> render_nav(const Build_Context& context)
{
    std::pmr::unsynchronized_pool_resource memory;

    const std::u8string namespaces
        = nav_html_of(Entry { Namespace_Entry { &context.graph.root() } }.nav(context));

    std::u8string files;
    if (!context.files.empty()) {
        Nav_Root root { .name = u8"Files", .items = {} };
        for (const File_Root& file_root : context.files) {
            root.items.push_back(Entry { File_Root_Entry { &file_root } }.nav(context));
        }
        files = nav_html_of(Nav_Item { std::move(root) });
    }

    std::u8string tutorials;
    if (context.tutorials) {
        tutorials = nav_html_of(Entry { Tutorial_Folder_Entry { &*context.tutorials } }.nav(context));
    }

    const Site_Variables site { context, &memory };
    std::vector<Template_Variable> variables = site.to_variables();
    variables.push_back({ u8"namespaces", namespaces });
    variables.push_back({ u8"files", files });
    variables.push_back({ u8"tutorials", tutorials });

    Result<std::pmr::u8string, Render_Error> result
        = context.renderer.render(template_id::nav, variables, &memory);
    if (!result) {
        return Build_Error { .url = {}, .cause = std::move(result.error().message) };
    }
    return std::u8string { *result };
}

Page_Result write_page(const Build_Context& context, const Entry& entry)
{
    std::pmr::unsynchronized_pool_resource memory;
    const Url_Path url = entry.url(context);

    std::pmr::u8string content { &memory };
    {
        HTML_Writer writer { content };
        entry.write_content(writer, context, &memory);
    }

    const Page_Info info = entry.page_info(context);
    const std::pmr::u8string page_title = escape_html(info.title, &memory);
    const std::pmr::u8string page_description = escape_html(info.description, &memory);
    const std::pmr::u8string page_url
        = escape_html(context.linker.page_url(url).to_encoded_string(), &memory);

    const Site_Variables site { context, &memory };
    std::vector<Template_Variable> variables = site.to_variables();
    variables.push_back({ u8"page_url", page_url });
    variables.push_back({ u8"page_title", page_title });
    variables.push_back({ u8"page_description", page_description });

    Result<std::pmr::u8string, Render_Error> head
        = context.renderer.render(template_id::head, variables, &memory);
    if (!head) {
        return page_failure(url, head.error().message);
    }
    variables.push_back({ u8"head", *head });
    variables.push_back({ u8"nav", context.nav_html });
    variables.push_back({ u8"main_content", content });

    Result<std::pmr::u8string, Render_Error> page
        = context.renderer.render(template_id::page, variables, &memory);
    if (!page) {
        return page_failure(url, page.error().message);
    }

    std::pmr::u8string metadata { u8"{\"title\":", &memory };
    json::append_quoted(metadata, info.title);
    metadata += u8",\"description\":";
    json::append_quoted(metadata, info.description);
    metadata += u8'}';

    const std::filesystem::path directory
        = context.output_dir / std::filesystem::path { url.to_raw_string() };
    if (const Result<void, IO_Error_Code> r = create_directories(directory); !r) {
        return page_failure(url, io_error_code_message(r.error()));
    }
    const std::pair<std::u8string_view, std::u8string_view> files[] {
        { u8"index.html", *page },
        { u8"content.html", content },
        { u8"metadata.json", metadata },
    };
    for (const auto& [name, data] : files) {
        if (const Result<void, IO_Error_Code> r = bytes_to_file(data, directory / std::filesystem::path { name }); !r) {
            std::u8string cause { u8"Unable to write " };
            cause += name;
            cause += u8": ";
            cause += io_error_code_message(r.error());
            return page_failure(url, cause);
        }
    }
    return url;
}

Result<std::size_t, Build_Error>
join_tasks(std::span<const Page_Task> tasks, Logger& logger, Progress_Callback progress)
{
    std::optional<Build_Error> first_error;
    for (const Page_Task& task : tasks) {
        const Page_Result& result = task.get();
        if (!result) {
            if (!first_error) {
                first_error = result.error();
            }
            continue;
        }
        if (!progress) {
            continue;
        }
        std::u8string message { u8"Built /" };
        message += result->to_raw_string();
        try {
            progress(message);
        } catch (const std::exception& e) {
            const std::u8string cause = to_u8string(e.what());
            logger.log(Severity::warning, diagnostic::build_progress_failed, cause);
        }
    }
    if (first_error) {
        return std::move(*first_error);
    }
    return tasks.size();
}

} // namespace lantern
