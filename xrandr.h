/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef XRANDR_H
#define XRANDR_H

#include <display.h>

// Forward declare Xlib types
typedef struct _XDisplay Display;

namespace DisplayDetect {

//!
//! \brief One output block of the xrandr tool's listing.
//!
struct XrandrOutputInfo
{
    std::string m_name;
    bool m_connected = false;
    bool m_primary = false;

    //!
    //! \brief Current configuration. Only set for connected outputs that are driving a CRTC.
    //!
    std::optional<Output> m_current;

    //!
    //! \brief Mode names listed for the output, in xrandr order.
    //!
    std::vector<std::string> m_modes;
};

//!
//! \brief Parses the output of `xrandr` (no arguments).
//!
std::vector<XrandrOutputInfo> ParseXrandrOutput(const std::string& xrandr_output);

//!
//! \brief Builds one `xrandr --output ...` command line per output.
//!
std::vector<CommandLine> BuildXrandrCommands(const std::vector<Output>& outputs);

//!
//! \brief Runs the xrandr command lines in order and waits for each.
//! \return true if every command ran.
//!
bool ApplyXrandrCommands(CommandRunner& runner, const std::vector<CommandLine>& commands);

//!
//! \brief Sets the screen size with `xrandr -s WxH`.
//! \return true if the command ran.
//!
bool ApplyXrandrScreenSize(CommandRunner& runner, const std::string& resolution);

//!
//! \brief The LegacyDisplayManager class drives the xrandr command line tool. It does not work on Wayland but is
//! always available as the last resort.
//!
class LegacyDisplayManager : public DisplayManager
{
public:
    explicit LegacyDisplayManager(CommandRunner& runner);

    std::string Name() const override;

    std::vector<std::string> GetDisplayNames() override;

    std::vector<std::string> GetResolutions() override;

    std::pair<std::string, std::string> GetCurrentResolution() override;

    bool SetResolution(const std::string& resolution) override;

    bool SetResolution(const std::vector<Output>& outputs) override;

    std::vector<Output> GetConfig() override;

private:
    CommandRunner& m_runner;

    //!
    //! \brief Runs xrandr and parses the result. An empty vector if xrandr is unavailable.
    //!
    std::vector<XrandrOutputInfo> QueryOutputs();
};

//!
//! \brief The XrandrDisplayManager class reads the display configuration with the XRandR extension through Xlib.
//! Changes are applied with the xrandr tool.
//!
class XrandrDisplayManager : public DisplayManager
{
public:
    //!
    //! \brief Opens the default X display.
    //! \throws NoScreenDetected if there is no X display or it lacks the XRandR extension.
    //!
    explicit XrandrDisplayManager(CommandRunner& runner);

    ~XrandrDisplayManager();

    XrandrDisplayManager(const XrandrDisplayManager&) = delete;
    XrandrDisplayManager& operator=(const XrandrDisplayManager&) = delete;

    std::string Name() const override;

    std::vector<std::string> GetDisplayNames() override;

    std::vector<std::string> GetResolutions() override;

    std::pair<std::string, std::string> GetCurrentResolution() override;

    bool SetResolution(const std::string& resolution) override;

    bool SetResolution(const std::vector<Output>& outputs) override;

    std::vector<Output> GetConfig() override;

private:
    Display* m_display;

    CommandRunner& m_runner;
};

} // namespace DisplayDetect

#endif // XRANDR_H
