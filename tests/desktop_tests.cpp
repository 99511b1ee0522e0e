/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <gtest/gtest.h>
#include <desktop.h>

using namespace DisplayDetect;

// ============================================================================
// ClassifyDesktopSession
// ============================================================================

TEST(ClassifyDesktopSession, EmptyIsNone)
{
    EXPECT_FALSE(ClassifyDesktopSession("").has_value());
}

TEST(ClassifyDesktopSession, Mate)
{
    EXPECT_EQ(ClassifyDesktopSession("mate"), DesktopEnvironment::MATE);
    EXPECT_EQ(ClassifyDesktopSession("lightdm-xsession-MATE"), DesktopEnvironment::MATE);
}

TEST(ClassifyDesktopSession, Xfce)
{
    EXPECT_EQ(ClassifyDesktopSession("xfce"), DesktopEnvironment::XFCE);
    EXPECT_EQ(ClassifyDesktopSession("XFCE"), DesktopEnvironment::XFCE);
}

TEST(ClassifyDesktopSession, Deepin)
{
    EXPECT_EQ(ClassifyDesktopSession("deepin"), DesktopEnvironment::DEEPIN);
}

TEST(ClassifyDesktopSession, PlasmaAnywhere)
{
    EXPECT_EQ(ClassifyDesktopSession("plasma"), DesktopEnvironment::PLASMA);
    EXPECT_EQ(ClassifyDesktopSession("plasmawayland"), DesktopEnvironment::PLASMA);
    EXPECT_EQ(ClassifyDesktopSession("/usr/share/xsessions/plasma5"), DesktopEnvironment::PLASMA);
}

TEST(ClassifyDesktopSession, SuffixOnlyForMate)
{
    // "mate" must end the session name.
    EXPECT_EQ(ClassifyDesktopSession("mate-session-extra"), DesktopEnvironment::UNKNOWN);
}

TEST(ClassifyDesktopSession, Unknown)
{
    EXPECT_EQ(ClassifyDesktopSession("gnome"), DesktopEnvironment::UNKNOWN);
    EXPECT_EQ(ClassifyDesktopSession("ubuntu"), DesktopEnvironment::UNKNOWN);
}

// ============================================================================
// DesktopEnvironmentToString
// ============================================================================

TEST(DesktopEnvironmentToString, Values)
{
    EXPECT_EQ(DesktopEnvironmentToString(DesktopEnvironment::PLASMA), "PLASMA");
    EXPECT_EQ(DesktopEnvironmentToString(DesktopEnvironment::UNKNOWN), "UNKNOWN");
    EXPECT_EQ(DesktopEnvironmentToString(std::optional<DesktopEnvironment>()), "NONE");
}

TEST(DesktopEnvironment, NumericValues)
{
    EXPECT_EQ(static_cast<int>(DesktopEnvironment::PLASMA), 0);
    EXPECT_EQ(static_cast<int>(DesktopEnvironment::MATE), 1);
    EXPECT_EQ(static_cast<int>(DesktopEnvironment::XFCE), 2);
    EXPECT_EQ(static_cast<int>(DesktopEnvironment::DEEPIN), 3);
    EXPECT_EQ(static_cast<int>(DesktopEnvironment::UNKNOWN), 999);
}
