#ifndef LANTERN_BUILD_CONTEXT_HPP
#define LANTERN_BUILD_CONTEXT_HPP

#include <filesystem>
#include <future>
#include <optional>
#include <string>
#include <vector>

#include "lantern/util/result.hpp"

#include "lantern/config.hpp"
#include "lantern/file_tree.hpp"
#include "lantern/fwd.hpp"
#include "lantern/linker.hpp"
#include "lantern/symbol_graph.hpp"
#include "lantern/tutorial_tree.hpp"
#include "lantern/url_path.hpp"

namespace lantern {

/// @brief The reason why a page could not be generated.
struct Build_Error {
    /// @brief The site-relative URL of the failed page, or empty if the failure is not tied to a
    /// page.
    std::u8string url;
    std::u8string cause;
};

/// @brief The outcome of one page generation task,
/// which is the site-relative URL of the page on success.
using Page_Result = Result<Url_Path, Build_Error>;

/// @brief A handle to a scheduled page generation task.
using Page_Task = std::shared_future<Page_Result>;

/// @brief Everything that page generation depends on.
/// Once page generation has begun, the context is shared between all tasks and never modified.
struct Build_Context {
    Config config;
    Symbol_Graph graph;
    Linker linker;
    std::vector<File_Root> files;
    std::optional<Tutorial_Folder> tutorials;
    const Renderer& renderer;
    const Syntax_Highlighter& highlighter;
    /// @brief The logger for all tasks.
    /// This shall be safe to call from multiple threads, such as a `Synchronized_Logger`.
    Logger& logger;
    std::filesystem::path output_dir;
    /// @brief The rendered navigation sidebar.
    /// This is set once by `Builder::setup`, before any task is scheduled.
    std::u8string nav_html {};
};

} // namespace lantern

#endif
