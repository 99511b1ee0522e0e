/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef DISPLAY_H
#define DISPLAY_H

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <command.h>

namespace DisplayDetect {

constexpr int DEFAULT_RESOLUTION_WIDTH = 1280;
constexpr int DEFAULT_RESOLUTION_HEIGHT = 720;

constexpr int DEFAULT_DPI = 96;

//!
//! \brief The default resolution as a "WxH" string.
//!
std::string DefaultResolution();

//!
//! \brief Parses a "WxH" resolution string. An interlace suffix ("1920x1080i") is accepted and ignored.
//! \return (width, height), or std::nullopt if the string is not a resolution.
//!
std::optional<std::pair<int, int>> ParseResolution(const std::string& resolution);

//!
//! \brief Removes duplicates and sorts resolutions widest first, then tallest first. Entries that do not parse are
//! dropped. An empty result is replaced by the default resolution and an error is logged.
//!
std::vector<std::string> SortResolutions(const std::vector<std::string>& resolutions);

//!
//! \brief The Output struct is one entry of a display configuration, as returned by DisplayManager::GetConfig() and
//! accepted by DisplayManager::SetResolution().
//!
struct Output
{
    std::string m_name;
    std::string m_mode;           //!< "WxH"
    int m_x = 0;
    int m_y = 0;
    std::string m_rotation = "normal"; //!< normal, left, inverted or right
    bool m_primary = false;
    std::optional<double> m_rate;

    std::string ToString() const;

    bool operator==(const Output& other) const;
};

//!
//! \brief The DisplayManager class is the interface to the display configuration of the session. Implementations
//! are tried in order by GetDisplayManager().
//!
class DisplayManager
{
public:
    virtual ~DisplayManager() = default;

    //!
    //! \brief Name of the implementation, for logging.
    //!
    virtual std::string Name() const = 0;

    //!
    //! \brief Names of the connected displays.
    //!
    virtual std::vector<std::string> GetDisplayNames() = 0;

    //!
    //! \brief Available resolutions, deduplicated and sorted by SortResolutions().
    //!
    virtual std::vector<std::string> GetResolutions() = 0;

    //!
    //! \brief Resolution of the primary display as (width, height) strings. Falls back to the default resolution.
    //!
    virtual std::pair<std::string, std::string> GetCurrentResolution() = 0;

    //!
    //! \brief Applies a "WxH" resolution to the primary display.
    //! \return true on success.
    //!
    virtual bool SetResolution(const std::string& resolution) = 0;

    //!
    //! \brief Applies a full configuration as returned by GetConfig().
    //! \return true on success.
    //!
    virtual bool SetResolution(const std::vector<Output>& outputs) = 0;

    //!
    //! \brief The current configuration of the connected, active displays.
    //!
    virtual std::vector<Output> GetConfig() = 0;
};

//!
//! \brief Returns the display manager for this session. Mutter over D-Bus is tried first, as it is the only one that
//! works on Wayland. XRandR through Xlib is next, and the xrandr command line tool is the last resort.
//! \param runner used by implementations that drive the xrandr tool. Must outlive the returned object.
//!
std::unique_ptr<DisplayManager> GetDisplayManager(CommandRunner& runner);

//!
//! \brief Computes the DPI to pass to Wine for the primary monitor: 96 times the scale factor. GDK_SCALE is used if
//! it is a positive integer, otherwise the integer part of Xft.dpi / 96, otherwise 1.
//! \param gdk_scale value of GDK_SCALE, if set
//! \param xft_dpi value of the Xft.dpi X resource, if set
//!
int ComputeDpi(const std::optional<std::string>& gdk_scale, const std::optional<std::string>& xft_dpi);

//!
//! \brief ComputeDpi() with the values of this session.
//!
int GetDefaultDpi();

//!
//! \brief Reads the Xft.dpi resource from the X resource database of the default display.
//! \return the resource value, or std::nullopt if there is no display or no such resource.
//!
std::optional<std::string> GetXftDpiResource();

//!
//! \brief Restores gamma to 1.0 with xgamma. A missing or non executable xgamma is logged as a warning.
//!
void RestoreGamma(CommandRunner& runner);

} // namespace DisplayDetect

#endif // DISPLAY_H
