/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef SESSION_H
#define SESSION_H

#include <compositing.h>
#include <display.h>
#include <screensaver.h>

namespace DisplayDetect {

struct GameSessionOptions
{
    bool m_disable_compositing = true;
    bool m_inhibit_screensaver = true;
    bool m_restore_gamma = false;
    bool m_restore_resolution = false;
};

//!
//! \brief The GameSession class prepares the desktop for a game, runs it, and puts the desktop back afterwards.
//! Compositing is disabled and the screen saver inhibited for the duration of the command. After it exits the
//! inhibit is released, compositing re-enabled if this session disabled it, and gamma and the display configuration
//! restored if requested.
//!
class GameSession
{
public:
    //!
    //! \param inhibitor may be nullptr, in which case the screen saver is left alone.
    //! \param display_manager may be nullptr, in which case the resolution is not restored.
    //!
    GameSession(const std::string& game_name,
                const CommandLine& command,
                const GameSessionOptions& options,
                CommandRunner& runner,
                CompositingManager& compositing,
                ScreenSaverInhibitor* inhibitor,
                DisplayManager* display_manager);

    //!
    //! \brief Runs the session.
    //! \return exit code of the game command, or 1 if it could not be started.
    //!
    int Run();

private:
    std::string m_game_name;
    CommandLine m_command;
    GameSessionOptions m_options;

    CommandRunner& m_runner;
    CompositingManager& m_compositing;
    ScreenSaverInhibitor* m_inhibitor;
    DisplayManager* m_display_manager;

    void Restore(const std::optional<uint32_t>& cookie, const std::vector<Output>& saved_config);
};

} // namespace DisplayDetect

#endif // SESSION_H
