#ifndef LANTERN_BUILDER_HPP
#define LANTERN_BUILDER_HPP

#include <cstddef>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "llvm/Support/ThreadPool.h"

#include "lantern/util/function_ref.hpp"
#include "lantern/util/result.hpp"

#include "lantern/build_context.hpp"
#include "lantern/entry.hpp"
#include "lantern/fwd.hpp"

namespace lantern {

/// @brief Receives a human-readable message whenever a page task completes.
using Progress_Callback = Function_Ref<void(std::u8string_view message)>;

/// @brief Generates the whole site.
///
/// A build happens in three phases:
/// 1. `setup` writes the static files and renders the navigation once.
/// 2. `spawn_all` schedules one task per page on a thread pool.
///    Every task formats its page and writes it to disk independently.
/// 3. `join_tasks` waits for all tasks and reports the first failure.
struct Builder {
private:
    /// @brief The context while it is still being set up.
    std::shared_ptr<Build_Context> m_setup_context;
    /// @brief The context once setup is complete, which is shared with the tasks.
    std::shared_ptr<const Build_Context> m_context;
    llvm::ThreadPool m_pool;

public:
    /// @param context The inputs of the build.
    /// @param thread_count The number of worker threads, or zero to use one per hardware thread.
    [[nodiscard]]
    Builder(Build_Context&& context, unsigned thread_count = 0);

    Builder(const Builder&) = delete;
    Builder& operator=(const Builder&) = delete;

    /// @brief Waits for all scheduled tasks.
    ~Builder();

    /// @brief Returns `true` once `setup` has succeeded.
    [[nodiscard]]
    bool is_set_up() const noexcept
    {
        return m_context != nullptr;
    }

    [[nodiscard]]
    const Build_Context& context() const noexcept
    {
        return m_context ? *m_context : *m_setup_context;
    }

    /// @brief Creates the output directory, writes the stylesheet, copies the project icon and
    /// tutorial assets, and renders the navigation sidebar.
    /// This shall be called exactly once, before any task is scheduled.
    [[nodiscard]]
    Result<void, Build_Error> setup();

    /// @brief Schedules a task which writes the page of `entry`.
    /// `setup` shall have succeeded.
    [[nodiscard]]
    Page_Task spawn(const Entry& entry);

    /// @brief Schedules the tasks for every page of the site.
    /// `setup` shall have succeeded.
    [[nodiscard]]
    std::vector<Page_Task> spawn_all();

    /// @brief Runs all three phases of the build.
    /// @return The number of written pages.
    [[nodiscard]]
    Result<std::size_t, Build_Error> build(Progress_Callback progress = {});
};

/// @brief Renders the navigation of the whole site through the `nav` template.
[[nodiscard]]
Result<std::u8string, Build_Error> render_nav(const Build_Context& context);

/// @brief Generates the page of `entry` and writes `index.html`, `content.html` and
/// `metadata.json` into the directory of its URL.
[[nodiscard]]
Page_Result write_page(const Build_Context& context, const Entry& entry);

/// @brief Waits for every task in `tasks`.
/// All tasks are awaited, even if some of them fail.
/// @param tasks The tasks.
/// @param logger Receives a warning if `progress` fails.
/// @param progress Invoked with a message like `Built /class/Foo` whenever a task succeeds.
/// A failure of the callback is logged, but does not affect the result.
/// @return The number of tasks on success, or the error of the first failed task in `tasks`.
[[nodiscard]]
Result<std::size_t, Build_Error>
join_tasks(std::span<const Page_Task> tasks, Logger& logger, Progress_Callback progress = {});

} // namespace lantern

#endif
