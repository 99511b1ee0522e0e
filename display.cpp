/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <display.h>
#include <mutter.h>
#include <xrandr.h>

#include <algorithm>
#include <set>

#include <X11/Xlib.h>

namespace DisplayDetect {

std::string DefaultResolution()
{
    return strprintf("%dx%d", DEFAULT_RESOLUTION_WIDTH, DEFAULT_RESOLUTION_HEIGHT);
}

std::optional<std::pair<int, int>> ParseResolution(const std::string& resolution)
{
    std::vector<std::string> parts = StringSplit(TrimString(resolution), "x");

    if (parts.size() != 2 || parts[0].empty() || parts[1].empty()) {
        return std::nullopt;
    }

    std::string height_str = parts[1];

    if (height_str.back() == 'i') {
        height_str.pop_back();
    }

    auto all_digits = [](const std::string& str) {
        return !str.empty() && std::all_of(str.begin(), str.end(), [](char c) { return c >= '0' && c <= '9'; });
    };

    if (!all_digits(parts[0]) || !all_digits(height_str)) {
        return std::nullopt;
    }

    try {
        return std::make_pair(std::stoi(parts[0]), std::stoi(height_str));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::vector<std::string> SortResolutions(const std::vector<std::string>& resolutions)
{
    std::set<std::pair<int, int>> unique_resolutions;

    for (const auto& resolution : resolutions) {
        std::optional<std::pair<int, int>> parsed = ParseResolution(resolution);

        if (parsed) {
            unique_resolutions.insert(*parsed);
        }
    }

    std::vector<std::string> sorted;

    for (auto iter = unique_resolutions.rbegin(); iter != unique_resolutions.rend(); ++iter) {
        sorted.push_back(strprintf("%dx%d", iter->first, iter->second));
    }

    if (sorted.empty()) {
        error_log("%s: Failed to generate resolution list, using %s", __func__, DefaultResolution());
        sorted.push_back(DefaultResolution());
    }

    return sorted;
}

std::string Output::ToString() const
{
    std::string out = strprintf("%s %s+%d+%d %s", m_name, m_mode, m_x, m_y, m_rotation);

    if (m_rate) {
        out += strprintf(" %.2fHz", *m_rate);
    }

    if (m_primary) {
        out += " primary";
    }

    return out;
}

bool Output::operator==(const Output& other) const
{
    return m_name == other.m_name
           && m_mode == other.m_mode
           && m_x == other.m_x
           && m_y == other.m_y
           && m_rotation == other.m_rotation
           && m_primary == other.m_primary
           && m_rate == other.m_rate;
}

std::unique_ptr<DisplayManager> GetDisplayManager(CommandRunner& runner)
{
    try {
        return std::make_unique<MutterDisplayManager>();
    } catch (const DBusException& e) {
        debug_log("INFO: %s: Mutter DBus service not reachable: %s", __func__, e.what());
    } catch (const std::exception& e) {
        error_log("%s: Failed to instantiate MutterDisplayManager. Please report with exception: %s",
                  __func__,
                  e.what());
    }

    try {
        return std::make_unique<XrandrDisplayManager>(runner);
    } catch (const NoScreenDetected& e) {
        debug_log("INFO: %s: XRandR display manager unavailable: %s", __func__, e.what());
    }

    return std::make_unique<LegacyDisplayManager>(runner);
}

int ComputeDpi(const std::optional<std::string>& gdk_scale, const std::optional<std::string>& xft_dpi)
{
    int scale = 0;

    if (gdk_scale) {
        try {
            scale = std::stoi(TrimString(*gdk_scale));
        } catch (const std::exception&) {
            debug_log("INFO: %s: Ignoring invalid GDK_SCALE value \"%s\".", __func__, *gdk_scale);
            scale = 0;
        }
    }

    if (scale <= 0 && xft_dpi) {
        try {
            scale = static_cast<int>(std::stod(TrimString(*xft_dpi)) / DEFAULT_DPI);
        } catch (const std::exception&) {
            debug_log("INFO: %s: Ignoring invalid Xft.dpi value \"%s\".", __func__, *xft_dpi);
            scale = 0;
        }
    }

    if (scale <= 0) {
        scale = 1;
    }

    return DEFAULT_DPI * scale;
}

std::optional<std::string> GetXftDpiResource()
{
    Display* display = XOpenDisplay(nullptr);

    if (!display) {
        debug_log("INFO: %s: Could not open X display.", __func__);
        return std::nullopt;
    }

    std::optional<std::string> xft_dpi;

    // The resource manager string is a newline separated list of "name:\tvalue" entries.
    const char* resources = XResourceManagerString(display);

    if (resources) {
        for (const auto& line : StringSplit(resources, "\n")) {
            std::string::size_type colon = line.find(':');

            if (colon == std::string::npos) {
                continue;
            }

            if (TrimString(line.substr(0, colon)) == "Xft.dpi") {
                xft_dpi = TrimString(line.substr(colon + 1));
                break;
            }
        }
    }

    XCloseDisplay(display);

    return xft_dpi;
}

int GetDefaultDpi()
{
    int dpi = ComputeDpi(GetEnvVariable("GDK_SCALE"), GetXftDpiResource());

    debug_log("INFO: %s: DPI for the primary monitor is %d", __func__, dpi);

    return dpi;
}

void RestoreGamma(CommandRunner& runner)
{
    std::optional<fs::path> xgamma_path = FindExecutable("xgamma");

    if (!xgamma_path) {
        // Distinguish a present but non executable xgamma from a missing one.
        for (const auto& dir : StringSplit(GetEnvVariable("PATH").value_or(""), ":")) {
            std::error_code ec;
            fs::path candidate = fs::path(dir) / "xgamma";

            if (!dir.empty() && fs::is_regular_file(candidate, ec)) {
                log("WARNING: %s: you do not have permission to call xgamma", __func__);
                return;
            }
        }

        log("WARNING: %s: xgamma is not available on your system", __func__);
        return;
    }

    if (!runner.RunCommand({xgamma_path->string(), "-gamma", "1.0"})) {
        log("WARNING: %s: xgamma could not be started", __func__);
    }
}

} // namespace DisplayDetect
