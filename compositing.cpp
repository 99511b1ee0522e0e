/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <compositing.h>

#include <algorithm>

namespace DisplayDetect {

namespace {
const CommandLine KWIN_COMPOSITOR {"qdbus", "org.kde.KWin", "/Compositor"};

const CommandLine DEEPIN_WM_SWITCHER {"dbus-send", "--session", "--dest=com.deepin.WMSwitcher", "--type=method_call"};

CommandLine Concat(CommandLine command, const CommandLine& tail)
{
    command.insert(command.end(), tail.begin(), tail.end());
    return command;
}
} // anonymous namespace

CompositingManager::CompositingManager(std::optional<DesktopEnvironment> desktop_environment, CommandRunner& runner)
    : m_desktop_environment(desktop_environment)
    , m_runner(runner)
{}

std::optional<CompositingQuery> CompositingManager::GetCompositingQuery(
    const std::optional<DesktopEnvironment>& desktop_environment)
{
    if (!desktop_environment) {
        return std::nullopt;
    }

    switch (*desktop_environment) {
    case DesktopEnvironment::PLASMA:
        return CompositingQuery {Concat(KWIN_COMPOSITOR, {"org.kde.kwin.Compositing.active"}), "true\n"};
    case DesktopEnvironment::MATE:
        return CompositingQuery {{"gsettings", "get", "org.mate.Marco.general", "compositing-manager"}, "true\n"};
    case DesktopEnvironment::XFCE:
        return CompositingQuery {{"xfconf-query", "--channel=xfwm4", "--property=/general/use_compositing"}, "true\n"};
    case DesktopEnvironment::DEEPIN:
        return CompositingQuery {Concat(DEEPIN_WM_SWITCHER, {"--print-reply=literal",
                                                             "/com/deepin/WMSwitcher",
                                                             "com.deepin.WMSwitcher.CurrentWM"}),
                                 "deepin wm\n"};
    case DesktopEnvironment::UNKNOWN:
        break;
    }

    return std::nullopt;
}

CompositorCommands CompositingManager::GetCompositorCommands(
    const std::optional<DesktopEnvironment>& desktop_environment)
{
    CompositorCommands commands;

    if (!desktop_environment) {
        return commands;
    }

    switch (*desktop_environment) {
    case DesktopEnvironment::PLASMA:
        commands.m_stop = Concat(KWIN_COMPOSITOR, {"org.kde.kwin.Compositing.suspend"});
        commands.m_start = Concat(KWIN_COMPOSITOR, {"org.kde.kwin.Compositing.resume"});
        break;
    case DesktopEnvironment::MATE:
        commands.m_stop = CommandLine {"gsettings", "set", "org.mate.Marco.general", "compositing-manager", "false"};
        commands.m_start = CommandLine {"gsettings", "set", "org.mate.Marco.general", "compositing-manager", "true"};
        break;
    case DesktopEnvironment::XFCE:
        commands.m_stop = CommandLine {"xfconf-query", "--channel=xfwm4", "--property=/general/use_compositing",
                                       "--set=false"};
        commands.m_start = CommandLine {"xfconf-query", "--channel=xfwm4", "--property=/general/use_compositing",
                                        "--set=true"};
        break;
    case DesktopEnvironment::DEEPIN:
        // RequestSwitchWM toggles between the compositing and non compositing window managers.
        commands.m_start = Concat(DEEPIN_WM_SWITCHER, {"/com/deepin/WMSwitcher", "com.deepin.WMSwitcher.RequestSwitchWM"});
        commands.m_stop = commands.m_start;
        break;
    case DesktopEnvironment::UNKNOWN:
        break;
    }

    return commands;
}

std::optional<bool> CompositingManager::IsCompositingEnabled()
{
    std::optional<CompositingQuery> query = GetCompositingQuery(m_desktop_environment);

    if (!query) {
        debug_log("INFO: %s: No compositing query for desktop environment %s.",
                  __func__,
                  DesktopEnvironmentToString(m_desktop_environment));
        return std::nullopt;
    }

    std::optional<std::string> output = m_runner.GetCommandOutput(query->m_command);

    if (!output) {
        return std::nullopt;
    }

    bool enabled = (*output == query->m_enabled_output);

    debug_log("INFO: %s: compositing is %s", __func__, enabled ? "enabled" : "disabled");

    return enabled;
}

void CompositingManager::DisableCompositing()
{
    // Unknown counts as enabled so the stop command still runs.
    bool compositing_enabled = IsCompositingEnabled().value_or(true);

    if (std::any_of(m_compositing_disabled_stack.begin(), m_compositing_disabled_stack.end(),
                    [](bool disabled) { return disabled; })) {
        compositing_enabled = false;
    }

    m_compositing_disabled_stack.push_back(compositing_enabled);

    debug_log("INFO: %s: depth %u, this call disables compositing: %s",
              __func__,
              m_compositing_disabled_stack.size(),
              compositing_enabled ? "yes" : "no");

    if (!compositing_enabled) {
        return;
    }

    CompositorCommands commands = GetCompositorCommands(m_desktop_environment);

    if (commands.m_stop) {
        log("INFO: %s: Disabling compositing.", __func__);
        if (!m_runner.RunCommand(*commands.m_stop)) {
            error_log("%s: Failed to stop the compositor: %s", __func__, CommandLineToString(*commands.m_stop));
        }
    }
}

void CompositingManager::EnableCompositing()
{
    if (m_compositing_disabled_stack.empty()) {
        throw CompositingStackException("EnableCompositing called without a matching DisableCompositing.");
    }

    bool compositing_disabled = m_compositing_disabled_stack.back();
    m_compositing_disabled_stack.pop_back();

    debug_log("INFO: %s: depth %u, re-enabling compositing: %s",
              __func__,
              m_compositing_disabled_stack.size(),
              compositing_disabled ? "yes" : "no");

    if (!compositing_disabled) {
        return;
    }

    CompositorCommands commands = GetCompositorCommands(m_desktop_environment);

    if (commands.m_start) {
        log("INFO: %s: Re-enabling compositing.", __func__);
        if (!m_runner.RunCommand(*commands.m_start)) {
            error_log("%s: Failed to start the compositor: %s", __func__, CommandLineToString(*commands.m_start));
        }
    }
}

size_t CompositingManager::GetStackDepth() const
{
    return m_compositing_disabled_stack.size();
}

CompositingManager& GetCompositingManager()
{
    static CompositingManager compositing_manager(GetDesktopEnvironment(), GetDefaultCommandRunner());

    return compositing_manager;
}

} // namespace DisplayDetect
