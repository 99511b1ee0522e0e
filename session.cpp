/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <session.h>

namespace DisplayDetect {

GameSession::GameSession(const std::string& game_name,
                         const CommandLine& command,
                         const GameSessionOptions& options,
                         CommandRunner& runner,
                         CompositingManager& compositing,
                         ScreenSaverInhibitor* inhibitor,
                         DisplayManager* display_manager)
    : m_game_name(game_name)
    , m_command(command)
    , m_options(options)
    , m_runner(runner)
    , m_compositing(compositing)
    , m_inhibitor(inhibitor)
    , m_display_manager(display_manager)
{}

int GameSession::Run()
{
    std::vector<Output> saved_config;

    if (m_options.m_restore_resolution && m_display_manager) {
        saved_config = m_display_manager->GetConfig();

        for (const auto& output : saved_config) {
            debug_log("INFO: %s: Saved display configuration: %s", __func__, output.ToString());
        }
    }

    if (m_options.m_disable_compositing) {
        m_compositing.DisableCompositing();
    }

    std::optional<uint32_t> cookie;

    if (m_options.m_inhibit_screensaver && m_inhibitor) {
        cookie = m_inhibitor->Inhibit(m_game_name);
    }

    log("INFO: %s: Starting %s", __func__, m_game_name);

    int exit_code = m_runner.RunCommandAndWait(m_command);

    if (exit_code < 0) {
        error_log("%s: %s could not be started.", __func__, m_game_name);
        exit_code = 1;
    } else {
        log("INFO: %s: %s exited with code %d", __func__, m_game_name, exit_code);
    }

    Restore(cookie, saved_config);

    return exit_code;
}

void GameSession::Restore(const std::optional<uint32_t>& cookie, const std::vector<Output>& saved_config)
{
    if (m_inhibitor) {
        m_inhibitor->Uninhibit(cookie);
    }

    if (m_options.m_disable_compositing) {
        m_compositing.EnableCompositing();
    }

    if (m_options.m_restore_gamma) {
        RestoreGamma(m_runner);
    }

    if (!saved_config.empty()) {
        if (m_display_manager->GetConfig() == saved_config) {
            debug_log("INFO: %s: Display configuration unchanged.", __func__);
        } else if (!m_display_manager->SetResolution(saved_config)) {
            log("WARNING: %s: Failed to restore the display configuration.", __func__);
        }
    }
}

} // namespace DisplayDetect
