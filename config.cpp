/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <config.h>
#include <display.h>

// DisplayDetectConfig class

void DisplayDetectConfig::ProcessArgs()
{
    // debug

    ProcessBoolArg("debug", false);

    // log_timestamps

    ProcessBoolArg("log_timestamps", true);

    // disable_compositing

    ProcessBoolArg("disable_compositing", true);

    // inhibit_screensaver

    ProcessBoolArg("inhibit_screensaver", true);

    // restore_gamma

    ProcessBoolArg("restore_gamma", false);

    // restore_resolution

    ProcessBoolArg("restore_resolution", false);

    // default_resolution

    std::string default_resolution = GetArgString("default_resolution", DisplayDetect::DefaultResolution());

    if (!DisplayDetect::ParseResolution(default_resolution)) {
        error_log("%s: default_resolution parameter in config file has invalid value: %s",
                  __func__,
                  default_resolution);

        default_resolution = DisplayDetect::DefaultResolution();
    }

    m_config.insert(std::make_pair("default_resolution", default_resolution));

    // lspci_timeout

    int lspci_timeout = 3;

    try {
        lspci_timeout = ParseStringToInt(GetArgString("lspci_timeout", "3"));
    } catch (std::exception& e) {
        error_log("%s: lspci_timeout parameter in config file has invalid value: %s",
                  __func__,
                  e.what());
    }

    if (lspci_timeout <= 0) {
        error_log("%s: lspci_timeout must be positive, using 3 seconds.", __func__);
        lspci_timeout = 3;
    }

    m_config.insert(std::make_pair("lspci_timeout", lspci_timeout));

    // app_id

    m_config.insert(std::make_pair("app_id", GetArgString("app_id", "display_detect")));
}

fs::path GetDefaultConfigPath()
{
    std::optional<std::string> xdg_config_home = GetEnvVariable("XDG_CONFIG_HOME");

    if (xdg_config_home && !xdg_config_home->empty()) {
        return fs::path(*xdg_config_home) / "display_detect.conf";
    }

    return fs::path(GetEnvVariable("HOME").value_or("")) / ".config" / "display_detect.conf";
}
