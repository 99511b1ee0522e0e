/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <desktop.h>
#include <util.h>

namespace DisplayDetect {

std::optional<DesktopEnvironment> ClassifyDesktopSession(const std::string& desktop_session)
{
    std::string session = ToLower(desktop_session);

    if (session.empty()) {
        return std::nullopt;
    }

    if (EndsWith(session, "mate")) {
        return DesktopEnvironment::MATE;
    }

    if (EndsWith(session, "xfce")) {
        return DesktopEnvironment::XFCE;
    }

    if (EndsWith(session, "deepin")) {
        return DesktopEnvironment::DEEPIN;
    }

    if (session.find("plasma") != std::string::npos) {
        return DesktopEnvironment::PLASMA;
    }

    return DesktopEnvironment::UNKNOWN;
}

std::optional<DesktopEnvironment> GetDesktopEnvironment()
{
    static const std::optional<DesktopEnvironment> desktop_environment = []() {
        std::optional<DesktopEnvironment> result = ClassifyDesktopSession(GetEnvVariable("DESKTOP_SESSION").value_or(""));

        debug_log("INFO: GetDesktopEnvironment: desktop environment is %s",
                  DesktopEnvironmentToString(result));

        return result;
    }();

    return desktop_environment;
}

std::string DesktopEnvironmentToString(const DesktopEnvironment& desktop_environment)
{
    std::string out;

    switch (desktop_environment) {
    case DesktopEnvironment::PLASMA:
        out = "PLASMA";
        break;
    case DesktopEnvironment::MATE:
        out = "MATE";
        break;
    case DesktopEnvironment::XFCE:
        out = "XFCE";
        break;
    case DesktopEnvironment::DEEPIN:
        out = "DEEPIN";
        break;
    case DesktopEnvironment::UNKNOWN:
        out = "UNKNOWN";
        break;
    }

    return out;
}

std::string DesktopEnvironmentToString(const std::optional<DesktopEnvironment>& desktop_environment)
{
    if (!desktop_environment) {
        return "NONE";
    }

    return DesktopEnvironmentToString(*desktop_environment);
}

} // namespace DisplayDetect
