/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <compositing.h>
#include <config.h>
#include <desktop.h>
#include <display.h>
#include <graphics.h>
#include <release.h>
#include <screensaver.h>
#include <session.h>

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

using namespace DisplayDetect;

//! Global config singleton for display_detect
DisplayDetectConfig g_config;

//! Global flag for signal handling
std::atomic<bool> g_shutdown_requested = false;

//!
//! \brief Signal handler. While a game runs the signal also reaches the game, so the session only notes it and
//! restores the desktop after the game exits.
//! \param signum
//!
void HandleSignal(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        log("INFO: %s: Received signal %d. Waiting for the game to exit.",
            __func__,
            signum);
        g_shutdown_requested.store(true);
    } else {
        log("INFO: %s: Received unexpected signal %d.",
            __func__,
            signum);
    }
}

void PrintUsage()
{
    std::cout << "display_detect " << g_version << "\n\n"
              << "Usage: display_detect [--config=<path>] <command> [args]\n\n"
              << "Commands:\n"
              << "  run <game name> -- <command...>  Run a game with compositing disabled and the screen saver inhibited\n"
              << "  desktop                          Show the detected desktop environment\n"
              << "  gpus                             List the GPUs found in /sys/class/drm\n"
              << "  adapters                         List the graphics adapters reported by lspci\n"
              << "  displays                         List the connected displays\n"
              << "  resolutions                      List the available resolutions\n"
              << "  current                          Show the current resolution and display configuration\n"
              << "  set-resolution [WxH]             Set the resolution of the primary display\n"
              << "  dpi                              Show the DPI of the primary monitor\n"
              << "  compositing                      Show whether compositing is enabled\n"
              << "  restore-gamma                    Reset the gamma to 1.0 with xgamma\n"
              << "  version                          Show the version\n";
}

int RunGame(const std::vector<std::string>& args)
{
    auto separator = std::find(args.begin(), args.end(), "--");

    if (args.empty() || args[0] == "--" || separator == args.end() || separator + 1 == args.end()) {
        error_log("%s: Usage: display_detect run <game name> -- <command...>", __func__);
        return 1;
    }

    std::string game_name = args[0];
    CommandLine command(separator + 1, args.end());

    GameSessionOptions options;

    options.m_disable_compositing = std::get<bool>(g_config.GetArg("disable_compositing"));
    options.m_inhibit_screensaver = std::get<bool>(g_config.GetArg("inhibit_screensaver"));
    options.m_restore_gamma = std::get<bool>(g_config.GetArg("restore_gamma"));
    options.m_restore_resolution = std::get<bool>(g_config.GetArg("restore_resolution"));

    CommandRunner& runner = GetDefaultCommandRunner();
    std::optional<DesktopEnvironment> desktop_environment = GetDesktopEnvironment();

    std::unique_ptr<ScreenSaverInhibitor> inhibitor;

    if (options.m_inhibit_screensaver) {
        inhibitor = MakeScreenSaverInhibitor(desktop_environment, std::get<std::string>(g_config.GetArg("app_id")));
    }

    std::unique_ptr<DisplayManager> display_manager;

    if (options.m_restore_resolution) {
        display_manager = GetDisplayManager(runner);
    }

    // --- Signal Handling Setup ---
    struct sigaction action;
    memset(&action, 0, sizeof(struct sigaction));
    action.sa_handler = HandleSignal;
    action.sa_flags = 0;
    sigemptyset(&action.sa_mask);
    if (sigaction(SIGINT, &action, nullptr) == -1 || sigaction(SIGTERM, &action, nullptr) == -1) {
        error_log("%s: Failed to set signal handlers: %s",
                  __func__,
                  strerror(errno));
        return 1;
    }

    log("INFO: %s: display_detect C++ program, %s, started, pid %i, desktop %s",
        __func__,
        g_version,
        getpid(),
        DesktopEnvironmentToString(desktop_environment));

    GameSession session(game_name,
                        command,
                        options,
                        runner,
                        GetCompositingManager(),
                        inhibitor.get(),
                        display_manager.get());

    int exit_code = session.Run();

    if (g_shutdown_requested.load()) {
        log("INFO: %s: Desktop restored after shutdown request.", __func__);
    }

    return exit_code;
}

int ShowCurrent()
{
    std::unique_ptr<DisplayManager> display_manager = GetDisplayManager(GetDefaultCommandRunner());

    auto [width, height] = display_manager->GetCurrentResolution();

    std::cout << width << "x" << height << " (" << display_manager->Name() << ")\n";

    for (const auto& output : display_manager->GetConfig()) {
        std::cout << "  " << output.ToString() << "\n";
    }

    return 0;
}

int SetPrimaryResolution(const std::vector<std::string>& args)
{
    std::string resolution = args.empty() ? std::get<std::string>(g_config.GetArg("default_resolution")) : args[0];

    if (!ParseResolution(resolution)) {
        error_log("%s: Invalid resolution \"%s\". Expected WxH.", __func__, resolution);
        return 1;
    }

    std::unique_ptr<DisplayManager> display_manager = GetDisplayManager(GetDefaultCommandRunner());

    log("INFO: %s: Setting resolution %s with %s", __func__, resolution, display_manager->Name());

    return display_manager->SetResolution(resolution) ? 0 : 1;
}

int Dispatch(const std::string& command, const std::vector<std::string>& args)
{
    CommandRunner& runner = GetDefaultCommandRunner();

    if (command == "run") {
        return RunGame(args);
    } else if (command == "desktop") {
        std::cout << DesktopEnvironmentToString(GetDesktopEnvironment()) << "\n";
    } else if (command == "gpus") {
        for (const auto& [card, info] : GetGpus()) {
            auto driver = info.find("DRIVER");
            auto pci_id = info.find("PCI_ID");

            std::cout << card << ": "
                      << (pci_id != info.end() ? pci_id->second : "unknown") << " "
                      << (driver != info.end() ? driver->second : "unknown") << "\n";
        }

        std::cout << "DRI_PRIME useful: " << (UseDriPrime() ? "yes" : "no") << "\n";
    } else if (command == "adapters") {
        for (const auto& [pci_id, description] : GetGraphicsAdapters(runner, std::get<int>(g_config.GetArg("lspci_timeout")))) {
            std::cout << pci_id << " " << description << "\n";
        }
    } else if (command == "displays") {
        for (const auto& name : GetDisplayManager(runner)->GetDisplayNames()) {
            std::cout << name << "\n";
        }
    } else if (command == "resolutions") {
        for (const auto& resolution : GetDisplayManager(runner)->GetResolutions()) {
            std::cout << resolution << "\n";
        }
    } else if (command == "current") {
        return ShowCurrent();
    } else if (command == "set-resolution") {
        return SetPrimaryResolution(args);
    } else if (command == "dpi") {
        std::cout << GetDefaultDpi() << "\n";
    } else if (command == "compositing") {
        std::optional<bool> enabled = GetCompositingManager().IsCompositingEnabled();

        std::cout << (enabled ? (*enabled ? "enabled" : "disabled") : "unknown") << "\n";
    } else if (command == "restore-gamma") {
        RestoreGamma(runner);
    } else if (command == "version") {
        std::cout << "display_detect " << g_version << "\n";
    } else {
        error_log("%s: Unknown command \"%s\".", __func__, command);
        PrintUsage();
        return 1;
    }

    return 0;
}

//!
//! \brief main
//! \param argc
//! \param argv. An optional --config=<path> followed by the command and its arguments.
//! \return exit code, 0 for normal, non-zero otherwise. For run, the exit code of the game.
//!
int main(int argc, char* argv[])
{
    const char* journal_stream = getenv("JOURNAL_STREAM");
    bool journald = (journal_stream != nullptr && strlen(journal_stream) > 0);

    // If JOURNAL_STREAM is set, assume output is handled by journald
    g_log_timestamps.store(!journald);

    std::vector<std::string> args(argv + 1, argv + argc);
    fs::path config_file_path = GetDefaultConfigPath();

    if (!args.empty() && args[0].rfind("--config=", 0) == 0) {
        config_file_path = args[0].substr(strlen("--config="));
        args.erase(args.begin());
    }

    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        PrintUsage();
        return args.empty() ? 1 : 0;
    }

    try {
        g_config.ReadAndUpdateConfig(config_file_path);

        g_debug = std::get<bool>(g_config.GetArg("debug"));

        if (!journald) {
            g_log_timestamps = std::get<bool>(g_config.GetArg("log_timestamps"));
        }
    } catch (const std::bad_variant_access& e) {
        error_log("%s: Configuration value missing or has wrong type: %s",
                  __func__,
                  e.what());
        return 1;
    } catch (const std::exception& e) {
        error_log("%s: Failed to read/process config: %s",
                  __func__,
                  e.what());
        return 1;
    }

    debug_log("INFO: %s: Config file: %s", __func__, config_file_path.string());

    std::string command = args[0];
    args.erase(args.begin());

    try {
        return Dispatch(command, args);
    } catch (const DisplayDetectException& e) {
        error_log("%s: %s failed: %s", __func__, command, e.what());
    } catch (const std::exception& e) {
        error_log("%s: Unexpected error in %s: %s", __func__, command, e.what());
    }

    return 1;
}
