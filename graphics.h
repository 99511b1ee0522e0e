/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef GRAPHICS_H
#define GRAPHICS_H

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <command.h>

namespace DisplayDetect {

typedef std::map<std::string, std::string> GpuInfo;

//!
//! \brief A graphics adapter as (PCI slot ID, description).
//!
typedef std::pair<std::string, std::string> GraphicsAdapter;

//!
//! \brief Reads the uevent file of a DRM card (card_path/device/uevent) into a key/value map.
//! \throws FileSystemException if the file cannot be read.
//!
GpuInfo GetGpuInfo(const fs::path& card_path);

//!
//! \brief Enumerates the GPUs from drm_root (/sys/class/drm) without calling lspci. Each card is logged as
//! "GPU: <PCI_ID> <PCI_SUBSYS_ID> (<DRIVER> drivers)".
//! \return card name (card0, card1, ...) to GpuInfo.
//!
std::map<std::string, GpuInfo> GetGpus(const fs::path& drm_root = "/sys/class/drm");

//!
//! \brief Whether DRI_PRIME is useful, i.e. more than one GPU is present.
//!
bool UseDriPrime(const fs::path& drm_root = "/sys/class/drm");

//!
//! \brief Parses `lspci` output, keeping the VGA, XGA, 3D controller and Display controller devices.
//!
std::vector<GraphicsAdapter> ParseLspciOutput(const std::string& lspci_output);

//!
//! \brief Lists the graphics adapters with lspci.
//! \param timeout_seconds lspci is killed after this many seconds.
//! \return adapters, or an empty vector if lspci is unavailable.
//!
std::vector<GraphicsAdapter> GetGraphicsAdapters(CommandRunner& runner, int timeout_seconds = 3);

//!
//! \brief Whether a graphics adapter has match_text in its description.
//!
bool HasGraphicAdapterDescription(CommandRunner& runner, const std::string& match_text, int timeout_seconds = 3);

} // namespace DisplayDetect

#endif // GRAPHICS_H
