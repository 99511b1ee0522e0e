/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef COMPOSITING_H
#define COMPOSITING_H

#include <optional>
#include <vector>

#include <command.h>
#include <desktop.h>

namespace DisplayDetect {

//!
//! \brief A command that reports the compositing state and the exact stdout that means "enabled".
//!
struct CompositingQuery
{
    CommandLine m_command;
    std::string m_enabled_output;
};

//!
//! \brief The commands that start and stop the compositor. Either may be empty if the desktop environment has no
//! known way to do it.
//!
struct CompositorCommands
{
    std::optional<CommandLine> m_start;
    std::optional<CommandLine> m_stop;
};

//!
//! \brief The CompositingManager class turns desktop compositing off and back on around full screen games. Nested
//! calls are tracked with a stack: one entry is pushed per DisableCompositing() call, recording whether that call
//! actually stopped the compositor, and EnableCompositing() pops the entry and restarts the compositor only if it
//! was. This keeps an inner disable/enable pair from turning compositing back on while an outer pair is still active.
//!
//! There is no locking. Calls must be made from one thread and be strictly nested.
//!
class CompositingManager
{
public:
    //!
    //! \brief Constructor.
    //! \param desktop_environment selects the commands used.
    //! \param runner spawns the commands. Must outlive the manager.
    //!
    CompositingManager(std::optional<DesktopEnvironment> desktop_environment, CommandRunner& runner);

    //!
    //! \brief Queries the desktop environment for the compositing state.
    //! \return true for enabled, false for disabled, std::nullopt if unknown.
    //!
    std::optional<bool> IsCompositingEnabled();

    //!
    //! \brief Disables compositing if it is enabled and no outer call has already disabled it. An unknown state is
    //! treated as enabled.
    //!
    void DisableCompositing();

    //!
    //! \brief Re-enables compositing if the matching DisableCompositing() call disabled it.
    //! \throws CompositingStackException if there is no matching DisableCompositing() call.
    //!
    void EnableCompositing();

    //!
    //! \brief Number of DisableCompositing() calls not yet matched by EnableCompositing().
    //!
    size_t GetStackDepth() const;

    //!
    //! \brief Returns the query command for the desktop environment, or std::nullopt if the state cannot be queried.
    //!
    static std::optional<CompositingQuery> GetCompositingQuery(const std::optional<DesktopEnvironment>& desktop_environment);

    //!
    //! \brief Returns the start and stop commands for the desktop environment.
    //!
    static CompositorCommands GetCompositorCommands(const std::optional<DesktopEnvironment>& desktop_environment);

private:
    std::optional<DesktopEnvironment> m_desktop_environment;

    CommandRunner& m_runner;

    //!
    //! \brief One entry per unmatched DisableCompositing() call. True if that call stopped the compositor.
    //!
    std::vector<bool> m_compositing_disabled_stack;
};

//!
//! \brief Returns the process wide compositing manager, bound to GetDesktopEnvironment() and the default runner.
//!
CompositingManager& GetCompositingManager();

} // namespace DisplayDetect

#endif // COMPOSITING_H
