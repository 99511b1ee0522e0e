/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <gtest/gtest.h>
#include <command.h>

#include <chrono>

using namespace DisplayDetect;

// ============================================================================
// FindExecutable
// ============================================================================

TEST(FindExecutable, FindsShell)
{
    auto sh = FindExecutable("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_EQ(sh->filename(), "sh");
}

TEST(FindExecutable, AbsolutePath)
{
    auto sh = FindExecutable("/bin/sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_EQ(*sh, fs::path("/bin/sh"));
}

TEST(FindExecutable, Missing)
{
    EXPECT_FALSE(FindExecutable("display_detect_no_such_program").has_value());
    EXPECT_FALSE(FindExecutable("/nonexistent/display_detect_no_such_program").has_value());
    EXPECT_FALSE(FindExecutable("").has_value());
}

TEST(CommandLineToString, JoinsWithSpaces)
{
    EXPECT_EQ(CommandLineToString({"xrandr", "--output", "HDMI-1"}), "xrandr --output HDMI-1");
    EXPECT_EQ(CommandLineToString({}), "");
}

// ============================================================================
// SubprocessRunner
// ============================================================================

TEST(SubprocessRunner, GetCommandOutput)
{
    SubprocessRunner runner;

    auto output = runner.GetCommandOutput({"/bin/sh", "-c", "echo hello"});
    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(*output, "hello\n");
}

TEST(SubprocessRunner, GetCommandOutputStdinIsEmpty)
{
    SubprocessRunner runner;

    auto output = runner.GetCommandOutput({"/bin/sh", "-c", "cat; echo done"});
    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(*output, "done\n");
}

TEST(SubprocessRunner, GetCommandOutputMissingExecutable)
{
    SubprocessRunner runner;

    EXPECT_FALSE(runner.GetCommandOutput({"display_detect_no_such_program"}).has_value());
}

TEST(SubprocessRunner, GetCommandOutputTimeout)
{
    SubprocessRunner runner;

    auto start = std::chrono::steady_clock::now();
    auto output = runner.GetCommandOutput({"/bin/sh", "-c", "sleep 10"}, 1);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(output.has_value());
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(SubprocessRunner, ExecuteCommandReportsExitCode)
{
    SubprocessRunner runner;

    auto result = runner.ExecuteCommand({"/bin/sh", "-c", "echo partial; exit 3"});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->m_exit_code, 3);
    EXPECT_EQ(result->m_output, "partial\n");
    EXPECT_FALSE(result->Succeeded());

    result = runner.ExecuteCommand({"true"});
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->Succeeded());
}

TEST(SubprocessRunner, GetCommandOutputIgnoresExitCode)
{
    SubprocessRunner runner;

    auto output = runner.GetCommandOutput({"/bin/sh", "-c", "echo off; exit 1"});
    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(*output, "off\n");
}

TEST(SubprocessRunner, TimeoutKillsChildHoldingOutputOpen)
{
    SubprocessRunner runner;

    // sleep replaces the shell and keeps stdout open, so EOF only arrives once the child is killed.
    auto start = std::chrono::steady_clock::now();
    auto result = runner.ExecuteCommand({"/bin/sh", "-c", "echo started; exec sleep 10"}, 1);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(result.has_value());
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(SubprocessRunner, RunCommand)
{
    SubprocessRunner runner;

    EXPECT_TRUE(runner.RunCommand({"true"}));
    EXPECT_FALSE(runner.RunCommand({"display_detect_no_such_program"}));
}

TEST(SubprocessRunner, RunCommandAndWaitExitCode)
{
    SubprocessRunner runner;

    EXPECT_EQ(runner.RunCommandAndWait({"true"}), 0);
    EXPECT_EQ(runner.RunCommandAndWait({"/bin/sh", "-c", "exit 3"}), 3);
    EXPECT_EQ(runner.RunCommandAndWait({"display_detect_no_such_program"}), -1);
}

TEST(SubprocessRunner, RunCommandAndWaitKilledBySignal)
{
    SubprocessRunner runner;

    EXPECT_EQ(runner.RunCommandAndWait({"/bin/sh", "-c", "kill -9 $$"}), 128 + 9);
}
