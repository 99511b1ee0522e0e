/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <screensaver.h>
#include <util.h>

namespace DisplayDetect {

namespace {
constexpr int DBUS_CALL_TIMEOUT_MS = 1000;

const char* SESSION_MANAGER_NAME = "org.gnome.SessionManager";
const char* SESSION_MANAGER_PATH = "/org/gnome/SessionManager";
const char* SESSION_MANAGER_INTERFACE = "org.gnome.SessionManager";
} // anonymous namespace

std::optional<ScreenSaverInterface> GetScreenSaverInterface(const std::optional<DesktopEnvironment>& desktop_environment)
{
    if (desktop_environment == DesktopEnvironment::MATE) {
        return ScreenSaverInterface {"org.mate.ScreenSaver", "/", "org.mate.ScreenSaver"};
    }

    // xfce4-session supports org.freedesktop.ScreenSaver, but older releases do not.
    if (desktop_environment == DesktopEnvironment::XFCE) {
        return ScreenSaverInterface {"org.xfce.ScreenSaver", "/", "org.xfce.ScreenSaver"};
    }

    return std::nullopt;
}

std::optional<uint32_t> CookieFromInhibitReply(GVariant* reply)
{
    if (!reply) {
        return std::nullopt;
    }

    if (!g_variant_is_of_type(reply, G_VARIANT_TYPE("(u)"))) {
        error_log("%s: Unexpected reply type %s from Inhibit.", __func__, g_variant_get_type_string(reply));
        return std::nullopt;
    }

    guint32 cookie = 0;
    g_variant_get(reply, "(u)", &cookie);

    if (cookie == 0) {
        error_log("%s: Inhibit returned a zero cookie.", __func__);
        return std::nullopt;
    }

    return static_cast<uint32_t>(cookie);
}

ScreenSaverInhibitor::ScreenSaverInhibitor(const std::string& app_id)
    : m_app_id(app_id)
    , m_proxy(nullptr)
    , m_connection(nullptr)
{}

ScreenSaverInhibitor::~ScreenSaverInhibitor()
{
    if (m_proxy) {
        g_object_unref(m_proxy);
    }

    if (m_connection) {
        g_object_unref(m_connection);
    }
}

void ScreenSaverInhibitor::SetDBusInterface(const ScreenSaverInterface& iface, GBusType bus_type)
{
    GError* dbus_error = nullptr;

    GDBusProxy* proxy = g_dbus_proxy_new_for_bus_sync(bus_type,
                                                      G_DBUS_PROXY_FLAGS_NONE,
                                                      nullptr, // GDBusInterfaceInfo
                                                      iface.m_name.c_str(),
                                                      iface.m_path.c_str(),
                                                      iface.m_interface.c_str(),
                                                      nullptr, // Cancellable
                                                      &dbus_error);

    if (!proxy) {
        std::string message = dbus_error ? dbus_error->message : "unknown error";

        if (dbus_error) {
            g_error_free(dbus_error);
        }

        throw DBusException(message);
    }

    if (m_proxy) {
        g_object_unref(m_proxy);
    }

    m_proxy = proxy;

    debug_log("INFO: %s: Using screen saver interface %s on %s.", __func__, iface.m_interface, iface.m_name);
}

bool ScreenSaverInhibitor::HasProxy() const
{
    return m_proxy != nullptr;
}

std::string ScreenSaverInhibitor::InhibitReason(const std::string& game_name)
{
    return "Running game: " + game_name;
}

GDBusConnection* ScreenSaverInhibitor::GetSessionConnection()
{
    if (m_connection) {
        return m_connection;
    }

    GError* dbus_error = nullptr;

    m_connection = g_bus_get_sync(G_BUS_TYPE_SESSION, nullptr, &dbus_error);

    if (!m_connection) {
        std::string message = dbus_error ? dbus_error->message : "unknown error";

        if (dbus_error) {
            g_error_free(dbus_error);
        }

        throw DBusException("Failed to connect to session bus: " + message);
    }

    return m_connection;
}

std::optional<uint32_t> ScreenSaverInhibitor::Inhibit(const std::string& game_name)
{
    std::string reason = InhibitReason(game_name);

    std::optional<uint32_t> cookie;

    try {
        cookie = m_proxy ? InhibitViaProxy(reason) : InhibitViaSessionManager(reason);
    } catch (const DBusException& e) {
        error_log("%s: Failed to inhibit the screen saver: %s", __func__, e.what());
        return std::nullopt;
    }

    if (cookie) {
        log("INFO: %s: Screen saver inhibited (%s), cookie %u.", __func__, reason, *cookie);
    }

    return cookie;
}

std::optional<uint32_t> ScreenSaverInhibitor::InhibitViaProxy(const std::string& reason)
{
    GError* dbus_error = nullptr;

    GVariant* dbus_result = g_dbus_proxy_call_sync(m_proxy,
                                                   "Inhibit",
                                                   g_variant_new("(ss)", m_app_id.c_str(), reason.c_str()),
                                                   G_DBUS_CALL_FLAGS_NONE,
                                                   DBUS_CALL_TIMEOUT_MS,
                                                   nullptr,
                                                   &dbus_error);

    if (dbus_error) {
        std::string message = dbus_error->message;
        g_error_free(dbus_error);

        throw DBusException("Inhibit: " + message);
    }

    if (!dbus_result) {
        return std::nullopt;
    }

    std::optional<uint32_t> cookie = CookieFromInhibitReply(dbus_result);
    g_variant_unref(dbus_result);

    return cookie;
}

std::optional<uint32_t> ScreenSaverInhibitor::InhibitViaSessionManager(const std::string& reason)
{
    GDBusConnection* connection = GetSessionConnection();
    GError* dbus_error = nullptr;

    guint32 toplevel_xid = 0; // No window
    guint32 flags = INHIBIT_SUSPEND | INHIBIT_IDLE;

    GVariant* dbus_result = g_dbus_connection_call_sync(connection,
                                                        SESSION_MANAGER_NAME,
                                                        SESSION_MANAGER_PATH,
                                                        SESSION_MANAGER_INTERFACE,
                                                        "Inhibit",
                                                        g_variant_new("(susu)", m_app_id.c_str(), toplevel_xid,
                                                                      reason.c_str(), flags),
                                                        G_VARIANT_TYPE("(u)"),
                                                        G_DBUS_CALL_FLAGS_NONE,
                                                        DBUS_CALL_TIMEOUT_MS,
                                                        nullptr,
                                                        &dbus_error);

    if (dbus_error) {
        std::string message = dbus_error->message;
        g_error_free(dbus_error);

        throw DBusException("org.gnome.SessionManager.Inhibit: " + message);
    }

    if (!dbus_result) {
        return std::nullopt;
    }

    std::optional<uint32_t> cookie = CookieFromInhibitReply(dbus_result);
    g_variant_unref(dbus_result);

    return cookie;
}

void ScreenSaverInhibitor::Uninhibit(const std::optional<uint32_t>& cookie)
{
    if (!cookie) {
        return;
    }

    GError* dbus_error = nullptr;
    GVariant* dbus_result = nullptr;

    if (m_proxy) {
        dbus_result = g_dbus_proxy_call_sync(m_proxy,
                                             "UnInhibit",
                                             g_variant_new("(u)", static_cast<guint32>(*cookie)),
                                             G_DBUS_CALL_FLAGS_NONE,
                                             DBUS_CALL_TIMEOUT_MS,
                                             nullptr,
                                             &dbus_error);
    } else {
        try {
            dbus_result = g_dbus_connection_call_sync(GetSessionConnection(),
                                                      SESSION_MANAGER_NAME,
                                                      SESSION_MANAGER_PATH,
                                                      SESSION_MANAGER_INTERFACE,
                                                      "Uninhibit",
                                                      g_variant_new("(u)", static_cast<guint32>(*cookie)),
                                                      nullptr,
                                                      G_DBUS_CALL_FLAGS_NONE,
                                                      DBUS_CALL_TIMEOUT_MS,
                                                      nullptr,
                                                      &dbus_error);
        } catch (const DBusException& e) {
            error_log("%s: %s", __func__, e.what());
            return;
        }
    }

    if (dbus_error) {
        error_log("%s: Failed to uninhibit the screen saver (cookie %u): %s", __func__, *cookie, dbus_error->message);
        g_error_free(dbus_error);
        return;
    }

    if (dbus_result) {
        g_variant_unref(dbus_result);
    }

    log("INFO: %s: Screen saver uninhibited, cookie %u.", __func__, *cookie);
}

std::unique_ptr<ScreenSaverInhibitor> MakeScreenSaverInhibitor(const std::optional<DesktopEnvironment>& desktop_environment,
                                                               const std::string& app_id)
{
    auto inhibitor = std::make_unique<ScreenSaverInhibitor>(app_id);

    std::optional<ScreenSaverInterface> iface = GetScreenSaverInterface(desktop_environment);

    if (iface) {
        try {
            inhibitor->SetDBusInterface(*iface);
        } catch (const DBusException& e) {
            log("WARNING: %s: Failed to set up a DBus proxy for name %s, path %s, interface %s: %s",
                __func__,
                iface->m_name,
                iface->m_path,
                iface->m_interface,
                e.what());
        }
    }

    return inhibitor;
}

} // namespace DisplayDetect
