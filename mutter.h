/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef MUTTER_H
#define MUTTER_H

#include <cstdint>

#include <display.h>

#include <gio/gio.h>

namespace DisplayDetect {

//!
//! \brief A mode of a physical monitor as reported by org.gnome.Mutter.DisplayConfig.
//!
struct MutterMode
{
    std::string m_id;
    int m_width = 0;
    int m_height = 0;
    double m_refresh_rate = 0.0;
    bool m_is_current = false;
    bool m_is_preferred = false;

    std::string Resolution() const;
};

//!
//! \brief A physical monitor. The connector, vendor, product and serial quadruple identifies it.
//!
struct MutterMonitor
{
    std::string m_connector;
    std::string m_vendor;
    std::string m_product;
    std::string m_serial;
    std::string m_display_name;
    std::vector<MutterMode> m_modes;

    //!
    //! \brief The mode flagged is-current, or nullptr if the monitor is off.
    //!
    const MutterMode* GetCurrentMode() const;

    //!
    //! \brief The mode with the given resolution. The highest refresh rate wins, or the closest to refresh_rate if
    //! given.
    //!
    const MutterMode* FindMode(const std::string& resolution, std::optional<double> refresh_rate = std::nullopt) const;
};

//!
//! \brief A logical monitor: a region of the desktop shown on one or more physical monitors.
//!
struct MutterLogicalMonitor
{
    int m_x = 0;
    int m_y = 0;
    double m_scale = 1.0;
    uint32_t m_transform = 0;
    bool m_primary = false;
    std::vector<std::string> m_connectors;
};

//!
//! \brief The display state returned by GetCurrentState.
//!
struct MutterState
{
    uint32_t m_serial = 0;
    std::vector<MutterMonitor> m_monitors;
    std::vector<MutterLogicalMonitor> m_logical_monitors;

    const MutterMonitor* FindMonitor(const std::string& connector) const;

    const MutterLogicalMonitor* GetPrimaryLogicalMonitor() const;
};

//!
//! \brief Parses a GetCurrentState reply of type (ua((ssss)a(siiddada{sv})a{sv})a(iiduba(ssss)a{sv})a{sv}).
//! \throws DBusException if the reply has a different type.
//!
MutterState ParseMutterState(GVariant* reply);

//!
//! \brief Converts between Mutter transforms and xrandr rotation names. Flipped transforms map to their rotation.
//!
std::string MutterTransformToRotation(uint32_t transform);
uint32_t RotationToMutterTransform(const std::string& rotation);

//!
//! \brief Builds the ApplyMonitorsConfig parameters, of type (uua(iiduba(ssa{sv}))a{sv}), that apply outputs to
//! state. Outputs at the same position share a logical monitor, which keeps the scale the monitors have now.
//! \return a floating GVariant reference.
//! \throws DisplayDetectException if an output names an unknown connector or an unsupported mode.
//!
GVariant* BuildApplyMonitorsConfig(const MutterState& state, const std::vector<Output>& outputs, uint32_t method);

//!
//! \brief Converts a Mutter state into the Output list returned by DisplayManager::GetConfig().
//!
std::vector<Output> MutterStateToOutputs(const MutterState& state);

//!
//! \brief The MutterDisplayManager class uses org.gnome.Mutter.DisplayConfig on the session bus. This is the only
//! display manager that works on Wayland.
//!
class MutterDisplayManager : public DisplayManager
{
public:
    //! ApplyMonitorsConfig methods.
    static constexpr uint32_t APPLY_VERIFY = 0;
    static constexpr uint32_t APPLY_TEMPORARY = 1;
    static constexpr uint32_t APPLY_PERSISTENT = 2;

    //!
    //! \brief Connects to the session bus and loads the current state.
    //! \throws DBusException if the bus or the Mutter service is not reachable.
    //!
    MutterDisplayManager();

    ~MutterDisplayManager();

    MutterDisplayManager(const MutterDisplayManager&) = delete;
    MutterDisplayManager& operator=(const MutterDisplayManager&) = delete;

    std::string Name() const override;

    std::vector<std::string> GetDisplayNames() override;

    std::vector<std::string> GetResolutions() override;

    std::pair<std::string, std::string> GetCurrentResolution() override;

    bool SetResolution(const std::string& resolution) override;

    bool SetResolution(const std::vector<Output>& outputs) override;

    std::vector<Output> GetConfig() override;

private:
    GDBusConnection* m_connection;

    MutterState m_state;

    //!
    //! \brief Calls GetCurrentState and replaces m_state.
    //! \throws DBusException on failure.
    //!
    void LoadCurrentState();

    //!
    //! \brief Reloads the state, logging instead of throwing. Used before reads.
    //!
    void RefreshState();
};

} // namespace DisplayDetect

#endif // MUTTER_H
