/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef SCREENSAVER_H
#define SCREENSAVER_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <desktop.h>

#include <gio/gio.h>

namespace DisplayDetect {

//!
//! \brief A D-Bus screen saver interface that exposes Inhibit(ss) -> u and UnInhibit(u).
//!
struct ScreenSaverInterface
{
    std::string m_name;
    std::string m_path;
    std::string m_interface;
};

//!
//! \brief Returns the desktop specific screen saver interface, or std::nullopt if the session manager should be used.
//! MATE and XFCE ship their own interfaces. Older XFCE releases lack org.freedesktop.ScreenSaver.
//!
std::optional<ScreenSaverInterface> GetScreenSaverInterface(const std::optional<DesktopEnvironment>& desktop_environment);

//!
//! \brief Extracts the cookie from an Inhibit reply. Both interfaces report failure with a zero cookie.
//! \param reply (u) reply. Ownership stays with the caller.
//! \return the cookie, or std::nullopt if the reply is null, of another type, or zero.
//!
std::optional<uint32_t> CookieFromInhibitReply(GVariant* reply);

//!
//! \brief The ScreenSaverInhibitor class inhibits and uninhibits the screen saver.
//!
//! By default it asks org.gnome.SessionManager for an application inhibit with the SUSPEND and IDLE flags. This is the
//! request a GUI toolkit makes on behalf of an application window. For environments that do not provide the session
//! manager, a D-Bus interface with Inhibit() and UnInhibit() methods can be set with SetDBusInterface().
//!
//! Inhibits are owned by the bus connection that made them, so the inhibitor keeps its connection open until it is
//! destroyed.
//!
class ScreenSaverInhibitor
{
public:
    //! Session manager inhibit flags.
    static constexpr uint32_t INHIBIT_SUSPEND = 4;
    static constexpr uint32_t INHIBIT_IDLE = 8;

    explicit ScreenSaverInhibitor(const std::string& app_id = "display_detect");

    ~ScreenSaverInhibitor();

    ScreenSaverInhibitor(const ScreenSaverInhibitor&) = delete;
    ScreenSaverInhibitor& operator=(const ScreenSaverInhibitor&) = delete;

    //!
    //! \brief Sets a D-Bus proxy to be used instead of the session manager.
    //! \throws DBusException if the proxy cannot be created.
    //!
    void SetDBusInterface(const ScreenSaverInterface& iface, GBusType bus_type = G_BUS_TYPE_SESSION);

    //!
    //! \brief Whether a D-Bus proxy set by SetDBusInterface() is in use.
    //!
    bool HasProxy() const;

    //!
    //! \brief Inhibits the screen saver.
    //! \param game_name used in the inhibit reason.
    //! \return the cookie to pass to Uninhibit(), or std::nullopt if an error occurred.
    //!
    std::optional<uint32_t> Inhibit(const std::string& game_name);

    //!
    //! \brief Uninhibits the screen saver. No action is taken if the cookie is empty.
    //!
    void Uninhibit(const std::optional<uint32_t>& cookie);

    //!
    //! \brief The reason string sent with an inhibit request.
    //!
    static std::string InhibitReason(const std::string& game_name);

private:
    std::string m_app_id;

    GDBusProxy* m_proxy;

    //!
    //! \brief Session bus connection used for org.gnome.SessionManager. Opened on first use.
    //!
    GDBusConnection* m_connection;

    //!
    //! \brief Returns the session bus connection, opening it if needed.
    //! \throws DBusException if the session bus is unavailable.
    //!
    GDBusConnection* GetSessionConnection();

    std::optional<uint32_t> InhibitViaProxy(const std::string& reason);

    std::optional<uint32_t> InhibitViaSessionManager(const std::string& reason);
};

//!
//! \brief Creates an inhibitor for the desktop environment. If the desktop specific proxy cannot be created a warning
//! is logged and the session manager is used.
//!
std::unique_ptr<ScreenSaverInhibitor> MakeScreenSaverInhibitor(const std::optional<DesktopEnvironment>& desktop_environment,
                                                               const std::string& app_id = "display_detect");

} // namespace DisplayDetect

#endif // SCREENSAVER_H
