/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <gtest/gtest.h>
#include <screensaver.h>

using namespace DisplayDetect;

TEST(GetScreenSaverInterface, Mate)
{
    auto iface = GetScreenSaverInterface(DesktopEnvironment::MATE);
    ASSERT_TRUE(iface.has_value());
    EXPECT_EQ(iface->m_name, "org.mate.ScreenSaver");
    EXPECT_EQ(iface->m_path, "/");
    EXPECT_EQ(iface->m_interface, "org.mate.ScreenSaver");
}

TEST(GetScreenSaverInterface, Xfce)
{
    auto iface = GetScreenSaverInterface(DesktopEnvironment::XFCE);
    ASSERT_TRUE(iface.has_value());
    EXPECT_EQ(iface->m_name, "org.xfce.ScreenSaver");
    EXPECT_EQ(iface->m_path, "/");
}

TEST(GetScreenSaverInterface, OthersUseSessionManager)
{
    EXPECT_FALSE(GetScreenSaverInterface(DesktopEnvironment::PLASMA).has_value());
    EXPECT_FALSE(GetScreenSaverInterface(DesktopEnvironment::DEEPIN).has_value());
    EXPECT_FALSE(GetScreenSaverInterface(DesktopEnvironment::UNKNOWN).has_value());
    EXPECT_FALSE(GetScreenSaverInterface(std::nullopt).has_value());
}

TEST(ScreenSaverInhibitor, InhibitReason)
{
    EXPECT_EQ(ScreenSaverInhibitor::InhibitReason("Quake"), "Running game: Quake");
}

TEST(ScreenSaverInhibitor, InhibitFlags)
{
    EXPECT_EQ(ScreenSaverInhibitor::INHIBIT_SUSPEND | ScreenSaverInhibitor::INHIBIT_IDLE, 12u);
}

TEST(ScreenSaverInhibitor, NoProxyByDefault)
{
    ScreenSaverInhibitor inhibitor;
    EXPECT_FALSE(inhibitor.HasProxy());
}

TEST(ScreenSaverInhibitor, UninhibitEmptyCookieIsNoop)
{
    // No bus connection is opened for an empty cookie.
    ScreenSaverInhibitor inhibitor;
    inhibitor.Uninhibit(std::nullopt);
    EXPECT_FALSE(inhibitor.HasProxy());
}

TEST(MakeScreenSaverInhibitor, SessionManagerWithoutInterface)
{
    auto inhibitor = MakeScreenSaverInhibitor(DesktopEnvironment::PLASMA, "test_app");
    ASSERT_NE(inhibitor, nullptr);
    EXPECT_FALSE(inhibitor->HasProxy());
}

TEST(CookieFromInhibitReply, NonZeroCookie)
{
    GVariant* reply = g_variant_ref_sink(g_variant_new("(u)", 42u));

    EXPECT_EQ(CookieFromInhibitReply(reply), std::optional<uint32_t>(42));

    g_variant_unref(reply);
}

TEST(CookieFromInhibitReply, ZeroCookieIsFailure)
{
    GVariant* reply = g_variant_ref_sink(g_variant_new("(u)", 0u));

    EXPECT_FALSE(CookieFromInhibitReply(reply).has_value());

    g_variant_unref(reply);
}

TEST(CookieFromInhibitReply, WrongTypeOrNull)
{
    GVariant* reply = g_variant_ref_sink(g_variant_new("(s)", "not a cookie"));

    EXPECT_FALSE(CookieFromInhibitReply(reply).has_value());
    EXPECT_FALSE(CookieFromInhibitReply(nullptr).has_value());

    g_variant_unref(reply);
}
