/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <graphics.h>

#include <fstream>

namespace DisplayDetect {

namespace {
const std::vector<std::string> DISPLAY_DEVICE_CLASSES {"VGA", "XGA", "3D controller", "Display controller"};
} // anonymous namespace

GpuInfo GetGpuInfo(const fs::path& card_path)
{
    fs::path uevent_path = card_path / "device" / "uevent";
    std::ifstream uevent_file(uevent_path);

    if (!uevent_file.is_open()) {
        throw FileSystemException("Could not open uevent file.", uevent_path);
    }

    GpuInfo info;
    std::string line;

    while (std::getline(uevent_file, line)) {
        std::string::size_type equals = line.find('=');

        if (equals == std::string::npos) {
            continue;
        }

        info[line.substr(0, equals)] = TrimString(line.substr(equals + 1));
    }

    return info;
}

std::map<std::string, GpuInfo> GetGpus(const fs::path& drm_root)
{
    std::map<std::string, GpuInfo> gpus;

    // Connector entries such as card0-DP-1 are excluded by the pattern.
    for (const auto& card_path : FindDirEntriesWithWildcard(drm_root, "card[0-9]+")) {
        std::string card = card_path.filename().string();

        GpuInfo info;

        try {
            info = GetGpuInfo(card_path);
        } catch (const FileSystemException& e) {
            error_log("%s: Unable to get GPU information from '%s': %s", __func__, card, e.what());
            continue;
        }

        gpus[card] = info;

        auto pci_id = info.find("PCI_ID");
        auto pci_subsys_id = info.find("PCI_SUBSYS_ID");
        auto driver = info.find("DRIVER");

        if (pci_id == info.end() || pci_subsys_id == info.end() || driver == info.end()) {
            error_log("%s: Unable to get GPU information from '%s'", __func__, card);
            continue;
        }

        log("INFO: GPU: %s %s (%s drivers)", pci_id->second, pci_subsys_id->second, driver->second);
    }

    return gpus;
}

bool UseDriPrime(const fs::path& drm_root)
{
    return GetGpus(drm_root).size() > 1;
}

std::vector<GraphicsAdapter> ParseLspciOutput(const std::string& lspci_output)
{
    std::vector<GraphicsAdapter> adapters;

    for (const auto& line : StringSplit(lspci_output, "\n")) {
        bool is_display_device = false;

        for (const auto& device_class : DISPLAY_DEVICE_CLASSES) {
            if (line.find(device_class) != std::string::npos) {
                is_display_device = true;
                break;
            }
        }

        if (!is_display_device) {
            continue;
        }

        // <slot> <class>: <description>
        std::string::size_type space = line.find_first_of(" \t");
        std::string::size_type separator = line.find(": ");

        if (space == std::string::npos || separator == std::string::npos || separator < space) {
            debug_log("INFO: %s: Skipping unexpected lspci line: %s", __func__, line);
            continue;
        }

        adapters.push_back(std::make_pair(line.substr(0, space), line.substr(separator + 2)));
    }

    return adapters;
}

std::vector<GraphicsAdapter> GetGraphicsAdapters(CommandRunner& runner, int timeout_seconds)
{
    std::optional<fs::path> lspci_path = FindExecutable("lspci");

    if (!lspci_path) {
        log("WARNING: %s: lspci is not available. List of graphics cards not available", __func__);
        return {};
    }

    std::optional<std::string> lspci_output = runner.GetCommandOutput({lspci_path->string()}, timeout_seconds);

    if (!lspci_output) {
        return {};
    }

    return ParseLspciOutput(*lspci_output);
}

bool HasGraphicAdapterDescription(CommandRunner& runner, const std::string& match_text, int timeout_seconds)
{
    for (const auto& adapter : GetGraphicsAdapters(runner, timeout_seconds)) {
        if (adapter.second.find(match_text) != std::string::npos) {
            return true;
        }
    }

    return false;
}

} // namespace DisplayDetect
