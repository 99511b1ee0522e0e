/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef DESKTOP_H
#define DESKTOP_H

#include <optional>
#include <string>

namespace DisplayDetect {

//!
//! \brief The DesktopEnvironment enum classifies the desktop session. Only the environments that need special
//! handling for compositing or screen saver inhibition are listed.
//!
enum class DesktopEnvironment {
    PLASMA = 0,
    MATE = 1,
    XFCE = 2,
    DEEPIN = 3,
    UNKNOWN = 999
};

//!
//! \brief Classifies a DESKTOP_SESSION value. Matching is case insensitive and done in this order: ends with "mate",
//! ends with "xfce", ends with "deepin", contains "plasma". Anything else is UNKNOWN.
//! \param desktop_session value of DESKTOP_SESSION
//! \return std::nullopt if desktop_session is empty, otherwise the classification.
//!
std::optional<DesktopEnvironment> ClassifyDesktopSession(const std::string& desktop_session);

//!
//! \brief Classifies the DESKTOP_SESSION environment variable of this process. The value is computed on first call
//! and does not change afterwards.
//! \return std::nullopt if DESKTOP_SESSION is empty or unset.
//!
std::optional<DesktopEnvironment> GetDesktopEnvironment();

std::string DesktopEnvironmentToString(const DesktopEnvironment& desktop_environment);

//!
//! \brief String form of an optional desktop environment. An empty optional is "NONE".
//!
std::string DesktopEnvironmentToString(const std::optional<DesktopEnvironment>& desktop_environment);

} // namespace DisplayDetect

#endif // DESKTOP_H
