/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef RELEASE_H
#define RELEASE_H

#include <string>

#define DISPLAY_DETECT_VERSION_MAJOR 0
#define DISPLAY_DETECT_VERSION_MINOR 3
#define DISPLAY_DETECT_VERSION_PATCH 0
#define DISPLAY_DETECT_VERSION_TWEAK 0

#define DD__STRINGIFY(x) #x
#define DD_STRINGIFY(x) DD__STRINGIFY(x)

#define DISPLAY_DETECT_VERSION_STRING \
DD_STRINGIFY(DISPLAY_DETECT_VERSION_MAJOR) "." \
    DD_STRINGIFY(DISPLAY_DETECT_VERSION_MINOR) "." \
    DD_STRINGIFY(DISPLAY_DETECT_VERSION_PATCH) "." \
    DD_STRINGIFY(DISPLAY_DETECT_VERSION_TWEAK)

const std::string g_version_datetime = "20251019";

const std::string g_version = std::string("version ") + std::string(DISPLAY_DETECT_VERSION_STRING) + " - " + g_version_datetime;

#endif // RELEASE_H
