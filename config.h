/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef CONFIG_H
#define CONFIG_H

#include <util.h>

//!
//! \brief The DisplayDetectConfig class is the specialization of the Config class for display_detect.
//!
class DisplayDetectConfig : public Config
{
private:
    //!
    //! \brief Populates m_config with the typed display_detect parameters, using defaults for anything missing from
    //! the config file.
    //!
    void ProcessArgs() override;
};

//!
//! \brief Returns the default config file location: $XDG_CONFIG_HOME/display_detect.conf, or
//! ~/.config/display_detect.conf if XDG_CONFIG_HOME is not set.
//!
fs::path GetDefaultConfigPath();

#endif // CONFIG_H
