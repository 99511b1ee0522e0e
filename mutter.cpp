/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <mutter.h>

#include <cmath>
#include <map>

namespace DisplayDetect {

namespace {
const char* DISPLAY_CONFIG_NAME = "org.gnome.Mutter.DisplayConfig";
const char* DISPLAY_CONFIG_PATH = "/org/gnome/Mutter/DisplayConfig";
const char* DISPLAY_CONFIG_INTERFACE = "org.gnome.Mutter.DisplayConfig";

constexpr int DBUS_CALL_TIMEOUT_MS = 1000;

const char* CURRENT_STATE_TYPE = "(ua((ssss)a(siiddada{sv})a{sv})a(iiduba(ssss)a{sv})a{sv})";

//!
//! \brief Looks up a boolean in an a{sv} dictionary. Missing keys are false.
//!
bool LookupBool(GVariant* dict, const char* key)
{
    gboolean value = FALSE;

    if (!g_variant_lookup(dict, key, "b", &value)) {
        return false;
    }

    return value == TRUE;
}

std::string TakeDBusErrorMessage(GError* dbus_error)
{
    if (!dbus_error) {
        return "unknown error";
    }

    std::string message = dbus_error->message;
    g_error_free(dbus_error);

    return message;
}

MutterMode ParseMode(GVariant* mode_variant)
{
    MutterMode mode;

    const char* id = nullptr;
    gint32 width = 0;
    gint32 height = 0;
    gdouble refresh_rate = 0.0;
    gdouble preferred_scale = 0.0;
    GVariant* supported_scales = nullptr;
    GVariant* properties = nullptr;

    g_variant_get(mode_variant, "(&siidd@ad@a{sv})",
                  &id, &width, &height, &refresh_rate, &preferred_scale, &supported_scales, &properties);

    mode.m_id = id;
    mode.m_width = width;
    mode.m_height = height;
    mode.m_refresh_rate = refresh_rate;
    mode.m_is_current = LookupBool(properties, "is-current");
    mode.m_is_preferred = LookupBool(properties, "is-preferred");

    g_variant_unref(supported_scales);
    g_variant_unref(properties);

    return mode;
}

MutterMonitor ParseMonitor(GVariant* monitor_variant)
{
    MutterMonitor monitor;

    const char* connector = nullptr;
    const char* vendor = nullptr;
    const char* product = nullptr;
    const char* serial = nullptr;
    GVariant* modes = nullptr;
    GVariant* properties = nullptr;

    g_variant_get(monitor_variant, "((&s&s&s&s)@a(siiddada{sv})@a{sv})",
                  &connector, &vendor, &product, &serial, &modes, &properties);

    monitor.m_connector = connector;
    monitor.m_vendor = vendor;
    monitor.m_product = product;
    monitor.m_serial = serial;

    const char* display_name = nullptr;

    if (g_variant_lookup(properties, "display-name", "&s", &display_name) && display_name) {
        monitor.m_display_name = display_name;
    } else {
        monitor.m_display_name = monitor.m_connector;
    }

    GVariantIter iter;
    GVariant* mode_variant = nullptr;

    g_variant_iter_init(&iter, modes);
    while ((mode_variant = g_variant_iter_next_value(&iter))) {
        monitor.m_modes.push_back(ParseMode(mode_variant));
        g_variant_unref(mode_variant);
    }

    g_variant_unref(modes);
    g_variant_unref(properties);

    return monitor;
}

MutterLogicalMonitor ParseLogicalMonitor(GVariant* logical_variant)
{
    MutterLogicalMonitor logical_monitor;

    gint32 x = 0;
    gint32 y = 0;
    gdouble scale = 1.0;
    guint32 transform = 0;
    gboolean primary = FALSE;
    GVariant* monitors = nullptr;
    GVariant* properties = nullptr;

    g_variant_get(logical_variant, "(iidub@a(ssss)@a{sv})",
                  &x, &y, &scale, &transform, &primary, &monitors, &properties);

    logical_monitor.m_x = x;
    logical_monitor.m_y = y;
    logical_monitor.m_scale = scale;
    logical_monitor.m_transform = transform;
    logical_monitor.m_primary = (primary == TRUE);

    GVariantIter iter;
    const char* connector = nullptr;
    const char* vendor = nullptr;
    const char* product = nullptr;
    const char* serial = nullptr;

    g_variant_iter_init(&iter, monitors);
    while (g_variant_iter_next(&iter, "(&s&s&s&s)", &connector, &vendor, &product, &serial)) {
        logical_monitor.m_connectors.push_back(connector);
    }

    g_variant_unref(monitors);
    g_variant_unref(properties);

    return logical_monitor;
}
} // anonymous namespace

std::string MutterMode::Resolution() const
{
    return strprintf("%dx%d", m_width, m_height);
}

const MutterMode* MutterMonitor::GetCurrentMode() const
{
    for (const auto& mode : m_modes) {
        if (mode.m_is_current) {
            return &mode;
        }
    }

    return nullptr;
}

const MutterMode* MutterMonitor::FindMode(const std::string& resolution, std::optional<double> refresh_rate) const
{
    std::optional<std::pair<int, int>> size = ParseResolution(resolution);

    if (!size) {
        return nullptr;
    }

    const MutterMode* best = nullptr;

    for (const auto& mode : m_modes) {
        if (mode.m_width != size->first || mode.m_height != size->second) {
            continue;
        }

        if (!best) {
            best = &mode;
        } else if (refresh_rate) {
            if (std::fabs(mode.m_refresh_rate - *refresh_rate) < std::fabs(best->m_refresh_rate - *refresh_rate)) {
                best = &mode;
            }
        } else if (mode.m_refresh_rate > best->m_refresh_rate) {
            best = &mode;
        }
    }

    return best;
}

const MutterMonitor* MutterState::FindMonitor(const std::string& connector) const
{
    for (const auto& monitor : m_monitors) {
        if (monitor.m_connector == connector) {
            return &monitor;
        }
    }

    return nullptr;
}

const MutterLogicalMonitor* MutterState::GetPrimaryLogicalMonitor() const
{
    for (const auto& logical_monitor : m_logical_monitors) {
        if (logical_monitor.m_primary) {
            return &logical_monitor;
        }
    }

    return nullptr;
}

MutterState ParseMutterState(GVariant* reply)
{
    if (!reply || !g_variant_is_of_type(reply, G_VARIANT_TYPE(CURRENT_STATE_TYPE))) {
        throw DBusException(strprintf("Unexpected GetCurrentState reply type %s",
                                      reply ? g_variant_get_type_string(reply) : "(null)"));
    }

    MutterState state;

    guint32 serial = 0;
    GVariant* monitors = nullptr;
    GVariant* logical_monitors = nullptr;
    GVariant* properties = nullptr;

    g_variant_get(reply, "(u@a((ssss)a(siiddada{sv})a{sv})@a(iiduba(ssss)a{sv})@a{sv})",
                  &serial, &monitors, &logical_monitors, &properties);

    state.m_serial = serial;

    GVariantIter iter;
    GVariant* child = nullptr;

    g_variant_iter_init(&iter, monitors);
    while ((child = g_variant_iter_next_value(&iter))) {
        state.m_monitors.push_back(ParseMonitor(child));
        g_variant_unref(child);
    }

    g_variant_iter_init(&iter, logical_monitors);
    while ((child = g_variant_iter_next_value(&iter))) {
        state.m_logical_monitors.push_back(ParseLogicalMonitor(child));
        g_variant_unref(child);
    }

    g_variant_unref(monitors);
    g_variant_unref(logical_monitors);
    g_variant_unref(properties);

    return state;
}

std::string MutterTransformToRotation(uint32_t transform)
{
    // 4-7 are the flipped variants of 0-3.
    switch (transform % 4) {
    case 1:
        return "left";
    case 2:
        return "inverted";
    case 3:
        return "right";
    default:
        return "normal";
    }
}

uint32_t RotationToMutterTransform(const std::string& rotation)
{
    if (rotation == "left") return 1;
    if (rotation == "inverted") return 2;
    if (rotation == "right") return 3;

    return 0;
}

std::vector<Output> MutterStateToOutputs(const MutterState& state)
{
    std::vector<Output> outputs;

    for (const auto& logical_monitor : state.m_logical_monitors) {
        for (const auto& connector : logical_monitor.m_connectors) {
            const MutterMonitor* monitor = state.FindMonitor(connector);

            if (!monitor) {
                continue;
            }

            const MutterMode* mode = monitor->GetCurrentMode();

            if (!mode) {
                continue;
            }

            Output output;
            output.m_name = connector;
            output.m_mode = mode->Resolution();
            output.m_x = logical_monitor.m_x;
            output.m_y = logical_monitor.m_y;
            output.m_rotation = MutterTransformToRotation(logical_monitor.m_transform);
            output.m_primary = logical_monitor.m_primary;
            output.m_rate = mode->m_refresh_rate;

            outputs.push_back(output);
        }
    }

    return outputs;
}

GVariant* BuildApplyMonitorsConfig(const MutterState& state, const std::vector<Output>& outputs, uint32_t method)
{
    // Outputs at the same position mirror each other and share a logical monitor.
    std::map<std::pair<int, int>, std::vector<const Output*>> groups;

    for (const auto& output : outputs) {
        groups[std::make_pair(output.m_x, output.m_y)].push_back(&output);
    }

    GVariantBuilder logical_builder;
    g_variant_builder_init(&logical_builder, G_VARIANT_TYPE("a(iiduba(ssa{sv}))"));

    try {
        for (const auto& [position, group] : groups) {
            GVariantBuilder monitor_builder;
            g_variant_builder_init(&monitor_builder, G_VARIANT_TYPE("a(ssa{sv})"));

            double scale = 1.0;
            bool primary = false;
            uint32_t transform = RotationToMutterTransform(group.front()->m_rotation);

            for (const Output* output : group) {
                const MutterMonitor* monitor = state.FindMonitor(output->m_name);

                if (!monitor) {
                    g_variant_builder_clear(&monitor_builder);
                    throw DisplayDetectException("Unknown monitor connector " + output->m_name);
                }

                const MutterMode* mode = monitor->FindMode(output->m_mode, output->m_rate);

                if (!mode) {
                    g_variant_builder_clear(&monitor_builder);
                    throw DisplayDetectException(strprintf("Mode %s is not supported by %s", output->m_mode, output->m_name));
                }

                for (const auto& logical_monitor : state.m_logical_monitors) {
                    for (const auto& connector : logical_monitor.m_connectors) {
                        if (connector == output->m_name) {
                            scale = logical_monitor.m_scale;
                        }
                    }
                }

                primary = primary || output->m_primary;

                g_variant_builder_add(&monitor_builder, "(ss@a{sv})",
                                      output->m_name.c_str(),
                                      mode->m_id.c_str(),
                                      g_variant_new_array(G_VARIANT_TYPE("{sv}"), nullptr, 0));
            }

            g_variant_builder_add(&logical_builder, "(iidub@a(ssa{sv}))",
                                  static_cast<gint32>(position.first),
                                  static_cast<gint32>(position.second),
                                  scale,
                                  static_cast<guint32>(transform),
                                  primary ? TRUE : FALSE,
                                  g_variant_builder_end(&monitor_builder));
        }
    } catch (...) {
        g_variant_builder_clear(&logical_builder);
        throw;
    }

    return g_variant_new("(uu@a(iiduba(ssa{sv}))@a{sv})",
                         static_cast<guint32>(state.m_serial),
                         static_cast<guint32>(method),
                         g_variant_builder_end(&logical_builder),
                         g_variant_new_array(G_VARIANT_TYPE("{sv}"), nullptr, 0));
}

// Class MutterDisplayManager

MutterDisplayManager::MutterDisplayManager()
    : m_connection(nullptr)
{
    GError* dbus_error = nullptr;

    m_connection = g_bus_get_sync(G_BUS_TYPE_SESSION, nullptr, &dbus_error);

    if (!m_connection) {
        throw DBusException("Failed to connect to session bus: " + TakeDBusErrorMessage(dbus_error));
    }

    try {
        LoadCurrentState();
    } catch (...) {
        g_object_unref(m_connection);
        m_connection = nullptr;
        throw;
    }
}

MutterDisplayManager::~MutterDisplayManager()
{
    if (m_connection) {
        g_object_unref(m_connection);
    }
}

std::string MutterDisplayManager::Name() const
{
    return "Mutter";
}

void MutterDisplayManager::LoadCurrentState()
{
    GError* dbus_error = nullptr;

    GVariant* dbus_result = g_dbus_connection_call_sync(m_connection,
                                                        DISPLAY_CONFIG_NAME,
                                                        DISPLAY_CONFIG_PATH,
                                                        DISPLAY_CONFIG_INTERFACE,
                                                        "GetCurrentState",
                                                        nullptr,
                                                        G_VARIANT_TYPE(CURRENT_STATE_TYPE),
                                                        G_DBUS_CALL_FLAGS_NONE,
                                                        DBUS_CALL_TIMEOUT_MS,
                                                        nullptr,
                                                        &dbus_error);

    if (!dbus_result) {
        throw DBusException("GetCurrentState: " + TakeDBusErrorMessage(dbus_error));
    }

    try {
        m_state = ParseMutterState(dbus_result);
    } catch (...) {
        g_variant_unref(dbus_result);
        throw;
    }

    g_variant_unref(dbus_result);

    debug_log("INFO: %s: serial %u, %u monitors, %u logical monitors",
              __func__,
              m_state.m_serial,
              m_state.m_monitors.size(),
              m_state.m_logical_monitors.size());
}

void MutterDisplayManager::RefreshState()
{
    try {
        LoadCurrentState();
    } catch (const DBusException& e) {
        error_log("%s: Using the last known display state: %s", __func__, e.what());
    }
}

std::vector<std::string> MutterDisplayManager::GetDisplayNames()
{
    RefreshState();

    std::vector<std::string> names;

    for (const auto& monitor : m_state.m_monitors) {
        names.push_back(monitor.m_display_name);
    }

    return names;
}

std::vector<std::string> MutterDisplayManager::GetResolutions()
{
    RefreshState();

    std::vector<std::string> resolutions;

    for (const auto& monitor : m_state.m_monitors) {
        for (const auto& mode : monitor.m_modes) {
            resolutions.push_back(mode.Resolution());
        }
    }

    return SortResolutions(resolutions);
}

std::pair<std::string, std::string> MutterDisplayManager::GetCurrentResolution()
{
    RefreshState();

    const MutterLogicalMonitor* primary = m_state.GetPrimaryLogicalMonitor();
    const MutterMode* mode = nullptr;

    if (primary && !primary->m_connectors.empty()) {
        const MutterMonitor* monitor = m_state.FindMonitor(primary->m_connectors.front());

        if (monitor) {
            mode = monitor->GetCurrentMode();
        }
    }

    if (!mode) {
        error_log("%s: Failed to get a default output", __func__);
        return {ToString(DEFAULT_RESOLUTION_WIDTH), ToString(DEFAULT_RESOLUTION_HEIGHT)};
    }

    return {ToString(mode->m_width), ToString(mode->m_height)};
}

bool MutterDisplayManager::SetResolution(const std::string& resolution)
{
    if (!ParseResolution(resolution)) {
        error_log("%s: Invalid resolution \"%s\"", __func__, resolution);
        return false;
    }

    RefreshState();

    std::vector<Output> outputs = MutterStateToOutputs(m_state);
    bool found_primary = false;

    for (auto& output : outputs) {
        if (output.m_primary) {
            output.m_mode = resolution;
            output.m_rate.reset();
            found_primary = true;
        }
    }

    if (!found_primary) {
        error_log("%s: No primary monitor to apply %s to", __func__, resolution);
        return false;
    }

    return SetResolution(outputs);
}

bool MutterDisplayManager::SetResolution(const std::vector<Output>& outputs)
{
    GVariant* parameters = nullptr;

    try {
        parameters = BuildApplyMonitorsConfig(m_state, outputs, APPLY_TEMPORARY);
    } catch (const DisplayDetectException& e) {
        error_log("%s: %s", __func__, e.what());
        return false;
    }

    GError* dbus_error = nullptr;

    GVariant* dbus_result = g_dbus_connection_call_sync(m_connection,
                                                        DISPLAY_CONFIG_NAME,
                                                        DISPLAY_CONFIG_PATH,
                                                        DISPLAY_CONFIG_INTERFACE,
                                                        "ApplyMonitorsConfig",
                                                        parameters,
                                                        nullptr,
                                                        G_DBUS_CALL_FLAGS_NONE,
                                                        DBUS_CALL_TIMEOUT_MS,
                                                        nullptr,
                                                        &dbus_error);

    if (!dbus_result) {
        error_log("%s: ApplyMonitorsConfig failed: %s", __func__, TakeDBusErrorMessage(dbus_error));
        return false;
    }

    g_variant_unref(dbus_result);

    RefreshState();

    return true;
}

std::vector<Output> MutterDisplayManager::GetConfig()
{
    RefreshState();

    return MutterStateToOutputs(m_state);
}

} // namespace DisplayDetect
