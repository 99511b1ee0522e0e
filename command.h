/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef COMMAND_H
#define COMMAND_H

#include <optional>
#include <string>
#include <vector>

#include <util.h>

namespace DisplayDetect {

typedef std::vector<std::string> CommandLine;

//!
//! \brief Searches PATH for an executable regular file with the given name. A name containing a '/' is checked
//! directly.
//! \param name of the executable
//! \return full path, or std::nullopt if not found.
//!
std::optional<fs::path> FindExecutable(const std::string& name);

//!
//! \brief Joins a command line with spaces for logging.
//!
std::string CommandLineToString(const CommandLine& command);

//!
//! \brief Exit code and captured stdout of a command that ran to completion.
//!
struct CommandResult
{
    int m_exit_code = -1; //!< exit status, or 128 + signal number if the child was killed by a signal
    std::string m_output;

    bool Succeeded() const { return m_exit_code == 0; }
};

//!
//! \brief The CommandRunner class is the seam through which all child processes are spawned. The compositing and
//! display code hold a reference to a CommandRunner so that tests can substitute a recording fake.
//!
class CommandRunner
{
public:
    virtual ~CommandRunner() = default;

    //!
    //! \brief Runs the command with stdin from /dev/null, waits for it, and captures its stdout and exit code.
    //! \param command argv vector. command[0] is looked up in PATH.
    //! \param timeout_seconds kill the child after this many seconds. 0 means no timeout.
    //! \return the result, or std::nullopt if the executable was not found, could not be spawned, or timed out.
    //!
    virtual std::optional<CommandResult> ExecuteCommand(const CommandLine& command, int timeout_seconds = 0) = 0;

    //!
    //! \brief Same as ExecuteCommand() but only returns stdout. The exit code is not checked, which suits queries
    //! whose output is compared against an expected value.
    //!
    std::optional<std::string> GetCommandOutput(const CommandLine& command, int timeout_seconds = 0);

    //!
    //! \brief Spawns the command with stdin from /dev/null and does not wait for it.
    //! \return true if the child was spawned.
    //!
    virtual bool RunCommand(const CommandLine& command) = 0;

    //!
    //! \brief Spawns the command with the inherited stdio and waits for it.
    //! \return exit code of the child, 128 + signal number if it was killed, or -1 if it could not be started.
    //!
    virtual int RunCommandAndWait(const CommandLine& command) = 0;
};

//!
//! \brief The SubprocessRunner class implements CommandRunner with fork/execv.
//!
class SubprocessRunner : public CommandRunner
{
public:
    std::optional<CommandResult> ExecuteCommand(const CommandLine& command, int timeout_seconds = 0) override;

    bool RunCommand(const CommandLine& command) override;

    int RunCommandAndWait(const CommandLine& command) override;

private:
    //!
    //! \brief Resolves command[0] and logs the failure if it cannot be found.
    //!
    std::optional<fs::path> ResolveExecutable(const CommandLine& command, const char* caller) const;
};

//!
//! \brief Returns the process wide default runner.
//!
CommandRunner& GetDefaultCommandRunner();

} // namespace DisplayDetect

#endif // COMMAND_H
