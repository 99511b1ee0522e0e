/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <xrandr.h>
#include <x11_error.h>

#include <sstream>

#include <X11/Xlib.h>
#include <X11/extensions/Xrandr.h>

namespace DisplayDetect {

namespace {
constexpr int XRANDR_TIMEOUT_SECONDS = 10;

std::vector<std::string> Tokenize(const std::string& line)
{
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string token;

    while (iss >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

bool IsRotation(const std::string& token)
{
    return token == "normal" || token == "left" || token == "inverted" || token == "right";
}

//!
//! \brief Parses a "WxH+X+Y" geometry token.
//!
bool ParseGeometry(const std::string& token, int& width, int& height, int& x, int& y)
{
    std::vector<std::string> parts = StringSplit(token, "+");

    if (parts.size() != 3) {
        return false;
    }

    std::optional<std::pair<int, int>> size = ParseResolution(parts[0]);

    if (!size) {
        return false;
    }

    try {
        x = std::stoi(parts[1]);
        y = std::stoi(parts[2]);
    } catch (const std::exception&) {
        return false;
    }

    width = size->first;
    height = size->second;

    return true;
}

std::string RotationToString(Rotation rotation)
{
    if (rotation & RR_Rotate_90) {
        return "left";
    }

    if (rotation & RR_Rotate_180) {
        return "inverted";
    }

    if (rotation & RR_Rotate_270) {
        return "right";
    }

    return "normal";
}

const XRRModeInfo* FindModeInfo(const XRRScreenResources* resources, RRMode mode)
{
    for (int i = 0; i < resources->nmode; ++i) {
        if (resources->modes[i].id == mode) {
            return &resources->modes[i];
        }
    }

    return nullptr;
}

std::optional<double> ModeRefreshRate(const XRRModeInfo* mode_info)
{
    if (!mode_info || mode_info->hTotal == 0 || mode_info->vTotal == 0) {
        return std::nullopt;
    }

    double v_total = static_cast<double>(mode_info->vTotal);

    if (mode_info->modeFlags & RR_DoubleScan) {
        v_total *= 2;
    }

    if (mode_info->modeFlags & RR_Interlace) {
        v_total /= 2;
    }

    return static_cast<double>(mode_info->dotClock) / (static_cast<double>(mode_info->hTotal) * v_total);
}

//!
//! \brief Walks the connected outputs of the screen, calling fn(output_info, crtc_info_or_null, is_primary, resources).
//! An output or CRTC that vanishes during the walk is skipped.
//!
template <typename Fn>
void ForEachConnectedOutput(Display* display, Fn fn)
{
    XErrorTrap error_trap(display);

    Window root = DefaultRootWindow(display);
    XRRScreenResources* resources = XRRGetScreenResources(display, root);

    if (!resources) {
        error_log("ForEachConnectedOutput: Failed to get screen resources.");
        return;
    }

    RROutput primary_output = XRRGetOutputPrimary(display, root);

    for (int i = 0; i < resources->noutput; ++i) {
        XRROutputInfo* output_info = XRRGetOutputInfo(display, resources, resources->outputs[i]);

        if (!output_info) {
            continue;
        }

        if (output_info->connection == RR_Connected) {
            XRRCrtcInfo* crtc_info = nullptr;

            if (output_info->crtc != None) {
                crtc_info = XRRGetCrtcInfo(display, resources, output_info->crtc);
            }

            fn(output_info, crtc_info, resources->outputs[i] == primary_output, resources);

            if (crtc_info) {
                XRRFreeCrtcInfo(crtc_info);
            }
        }

        XRRFreeOutputInfo(output_info);
    }

    XRRFreeScreenResources(resources);

    if (error_trap.HasError()) {
        log("WARNING: ForEachConnectedOutput: The output configuration changed while it was read. "
            "Results may be incomplete.");
    }
}
} // anonymous namespace

std::vector<XrandrOutputInfo> ParseXrandrOutput(const std::string& xrandr_output)
{
    std::vector<XrandrOutputInfo> outputs;

    for (const auto& line : StringSplit(xrandr_output, "\n")) {
        if (line.empty() || line.rfind("Screen ", 0) == 0) {
            continue;
        }

        std::vector<std::string> tokens = Tokenize(line);

        if (tokens.empty()) {
            continue;
        }

        // Mode lines are indented under their output.
        if (line[0] == ' ' || line[0] == '\t') {
            if (outputs.empty() || !ParseResolution(tokens[0])) {
                continue;
            }

            XrandrOutputInfo& output = outputs.back();
            output.m_modes.push_back(tokens[0]);

            for (size_t i = 1; i < tokens.size(); ++i) {
                if (tokens[i].find('*') == std::string::npos || !output.m_current) {
                    continue;
                }

                std::optional<std::pair<int, int>> mode = ParseResolution(tokens[0]);
                output.m_current->m_mode = strprintf("%dx%d", mode->first, mode->second);

                std::string rate = tokens[i];
                rate.erase(rate.find_first_of("*+"));

                try {
                    output.m_current->m_rate = std::stod(rate);
                } catch (const std::exception&) {
                    output.m_current->m_rate.reset();
                }
            }

            continue;
        }

        if (tokens.size() < 2 || (tokens[1] != "connected" && tokens[1] != "disconnected")) {
            continue;
        }

        XrandrOutputInfo output;
        output.m_name = tokens[0];
        output.m_connected = (tokens[1] == "connected");

        size_t pos = 2;

        if (pos < tokens.size() && tokens[pos] == "primary") {
            output.m_primary = true;
            ++pos;
        }

        int width = 0;
        int height = 0;
        int x = 0;
        int y = 0;

        if (output.m_connected && pos < tokens.size() && ParseGeometry(tokens[pos], width, height, x, y)) {
            ++pos;

            Output current;
            current.m_name = output.m_name;
            current.m_mode = strprintf("%dx%d", width, height);
            current.m_x = x;
            current.m_y = y;
            current.m_primary = output.m_primary;

            if (pos < tokens.size() && IsRotation(tokens[pos])) {
                current.m_rotation = tokens[pos];
            }

            output.m_current = current;
        }

        outputs.push_back(output);
    }

    return outputs;
}

std::vector<CommandLine> BuildXrandrCommands(const std::vector<Output>& outputs)
{
    std::vector<CommandLine> commands;

    for (const auto& output : outputs) {
        CommandLine command {"xrandr",
                             "--output", output.m_name,
                             "--mode", output.m_mode,
                             "--pos", strprintf("%dx%d", output.m_x, output.m_y),
                             "--rotate", output.m_rotation};

        if (output.m_rate) {
            command.push_back("--rate");
            command.push_back(strprintf("%.2f", *output.m_rate));
        }

        if (output.m_primary) {
            command.push_back("--primary");
        }

        commands.push_back(command);
    }

    return commands;
}

bool ApplyXrandrCommands(CommandRunner& runner, const std::vector<CommandLine>& commands)
{
    bool success = true;

    for (const auto& command : commands) {
        debug_log("INFO: %s: %s", __func__, CommandLineToString(command));

        std::optional<CommandResult> result = runner.ExecuteCommand(command, XRANDR_TIMEOUT_SECONDS);

        if (!result) {
            error_log("%s: Failed to run %s", __func__, CommandLineToString(command));
            success = false;
        } else if (!result->Succeeded()) {
            error_log("%s: %s exited with %d", __func__, CommandLineToString(command), result->m_exit_code);
            success = false;
        }
    }

    return success;
}

bool ApplyXrandrScreenSize(CommandRunner& runner, const std::string& resolution)
{
    if (!ParseResolution(resolution)) {
        error_log("%s: Invalid resolution \"%s\"", __func__, resolution);
        return false;
    }

    return ApplyXrandrCommands(runner, {{"xrandr", "-s", resolution}});
}

// Class LegacyDisplayManager

LegacyDisplayManager::LegacyDisplayManager(CommandRunner& runner)
    : m_runner(runner)
{}

std::string LegacyDisplayManager::Name() const
{
    return "xrandr";
}

std::vector<XrandrOutputInfo> LegacyDisplayManager::QueryOutputs()
{
    std::optional<std::string> xrandr_output = m_runner.GetCommandOutput({"xrandr"}, XRANDR_TIMEOUT_SECONDS);

    if (!xrandr_output) {
        return {};
    }

    return ParseXrandrOutput(*xrandr_output);
}

std::vector<std::string> LegacyDisplayManager::GetDisplayNames()
{
    std::vector<std::string> names;

    for (const auto& output : QueryOutputs()) {
        if (output.m_connected) {
            names.push_back(output.m_name);
        }
    }

    return names;
}

std::vector<std::string> LegacyDisplayManager::GetResolutions()
{
    std::vector<std::string> resolutions;

    for (const auto& output : QueryOutputs()) {
        if (output.m_connected) {
            resolutions.insert(resolutions.end(), output.m_modes.begin(), output.m_modes.end());
        }
    }

    return SortResolutions(resolutions);
}

std::pair<std::string, std::string> LegacyDisplayManager::GetCurrentResolution()
{
    std::optional<Output> current;

    for (const auto& output : QueryOutputs()) {
        if (!output.m_current) {
            continue;
        }

        if (output.m_primary) {
            current = output.m_current;
            break;
        }

        if (!current) {
            current = output.m_current;
        }
    }

    std::optional<std::pair<int, int>> resolution;

    if (current) {
        resolution = ParseResolution(current->m_mode);
    }

    if (!resolution) {
        error_log("%s: Failed to get a default output", __func__);
        return {ToString(DEFAULT_RESOLUTION_WIDTH), ToString(DEFAULT_RESOLUTION_HEIGHT)};
    }

    return {ToString(resolution->first), ToString(resolution->second)};
}

bool LegacyDisplayManager::SetResolution(const std::string& resolution)
{
    return ApplyXrandrScreenSize(m_runner, resolution);
}

bool LegacyDisplayManager::SetResolution(const std::vector<Output>& outputs)
{
    return ApplyXrandrCommands(m_runner, BuildXrandrCommands(outputs));
}

std::vector<Output> LegacyDisplayManager::GetConfig()
{
    std::vector<Output> config;

    for (const auto& output : QueryOutputs()) {
        if (output.m_current) {
            config.push_back(*output.m_current);
        }
    }

    return config;
}

// Class XrandrDisplayManager

XrandrDisplayManager::XrandrDisplayManager(CommandRunner& runner)
    : m_display(nullptr)
    , m_runner(runner)
{
    m_display = XOpenDisplay(nullptr);

    if (!m_display) {
        throw NoScreenDetected("Could not open X display.");
    }

    int event_base, error_base;
    if (!XRRQueryExtension(m_display, &event_base, &error_base)) {
        XCloseDisplay(m_display);
        m_display = nullptr;

        throw NoScreenDetected("XRandR extension unavailable.");
    }
}

XrandrDisplayManager::~XrandrDisplayManager()
{
    if (m_display) {
        XCloseDisplay(m_display);
    }
}

std::string XrandrDisplayManager::Name() const
{
    return "XRandR";
}

std::vector<std::string> XrandrDisplayManager::GetDisplayNames()
{
    std::vector<std::string> names;

    ForEachConnectedOutput(m_display, [&names](XRROutputInfo* output_info, XRRCrtcInfo*, bool, XRRScreenResources*) {
        names.push_back(output_info->name ? output_info->name : "Unknown");
    });

    return names;
}

std::vector<std::string> XrandrDisplayManager::GetResolutions()
{
    std::vector<std::string> resolutions;

    ForEachConnectedOutput(m_display, [&resolutions](XRROutputInfo* output_info, XRRCrtcInfo*, bool,
                                                     XRRScreenResources* resources) {
        for (int i = 0; i < output_info->nmode; ++i) {
            const XRRModeInfo* mode_info = FindModeInfo(resources, output_info->modes[i]);

            if (mode_info) {
                resolutions.push_back(strprintf("%ux%u", mode_info->width, mode_info->height));
            }
        }
    });

    return SortResolutions(resolutions);
}

std::pair<std::string, std::string> XrandrDisplayManager::GetCurrentResolution()
{
    std::optional<std::pair<unsigned int, unsigned int>> primary;
    std::optional<std::pair<unsigned int, unsigned int>> first;

    ForEachConnectedOutput(m_display, [&primary, &first](XRROutputInfo*, XRRCrtcInfo* crtc_info, bool is_primary,
                                                         XRRScreenResources*) {
        if (!crtc_info) {
            return;
        }

        if (is_primary) {
            primary = std::make_pair(crtc_info->width, crtc_info->height);
        } else if (!first) {
            first = std::make_pair(crtc_info->width, crtc_info->height);
        }
    });

    std::optional<std::pair<unsigned int, unsigned int>> current = primary ? primary : first;

    if (!current) {
        error_log("%s: Failed to get a default output", __func__);
        return {ToString(DEFAULT_RESOLUTION_WIDTH), ToString(DEFAULT_RESOLUTION_HEIGHT)};
    }

    return {ToString(current->first), ToString(current->second)};
}

bool XrandrDisplayManager::SetResolution(const std::string& resolution)
{
    return ApplyXrandrScreenSize(m_runner, resolution);
}

bool XrandrDisplayManager::SetResolution(const std::vector<Output>& outputs)
{
    return ApplyXrandrCommands(m_runner, BuildXrandrCommands(outputs));
}

std::vector<Output> XrandrDisplayManager::GetConfig()
{
    std::vector<Output> config;

    ForEachConnectedOutput(m_display, [&config](XRROutputInfo* output_info, XRRCrtcInfo* crtc_info, bool is_primary,
                                                XRRScreenResources* resources) {
        if (!crtc_info || crtc_info->mode == None) {
            return;
        }

        const XRRModeInfo* mode_info = FindModeInfo(resources, crtc_info->mode);

        Output output;
        output.m_name = output_info->name ? output_info->name : "Unknown";
        output.m_x = crtc_info->x;
        output.m_y = crtc_info->y;
        output.m_rotation = RotationToString(crtc_info->rotation);
        output.m_primary = is_primary;
        output.m_rate = ModeRefreshRate(mode_info);

        if (mode_info) {
            output.m_mode = strprintf("%ux%u", mode_info->width, mode_info->height);
        } else {
            output.m_mode = strprintf("%ux%u", crtc_info->width, crtc_info->height);
        }

        config.push_back(output);
    });

    return config;
}

} // namespace DisplayDetect
