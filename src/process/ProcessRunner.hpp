// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <functional>
#include <map>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace clockr
{

/// @brief Describes an external program invocation.
struct ProcessSpec
{
    std::string command;                     ///< Program name (looked up in PATH) or path.
    std::vector<std::string> args;           ///< Arguments, excluding argv[0].
    std::map<std::string, std::string> env;  ///< Variables added to (or replacing) the inherited environment.
    std::vector<std::string> unsetEnv;       ///< Inherited variables removed before spawning.
    std::string stdinData;                   ///< Bytes written to the child's stdin before it is closed.
};

/// @brief Outcome of a finished process.
struct ProcessOutput
{
    int exitCode = 0;        ///< Exit status, or 128 + signal number when killed by a signal.
    bool cancelled = false;  ///< True if the run was stopped through the stop token.
    std::string stdoutData;  ///< Everything the child wrote to stdout.
    std::string stderrData;  ///< Everything the child wrote to stderr.
};

/// @brief Receives complete stdout lines (without the trailing newline) while the child runs.
using LineCallback = std::function<void(std::string_view line)>;

/// @brief Runs a program to completion, capturing its output.
///
/// The child is spawned directly (no shell). Stdout is split into lines and
/// handed to @p onLine as they arrive; a trailing line without a newline is
/// delivered once the child closes stdout. When @p stopToken is triggered the
/// child receives SIGTERM, the remaining output is drained and the result is
/// marked as cancelled.
///
/// @return The captured output, or ProcessError if the program could not be spawned.
[[nodiscard]] auto runProcess(ProcessSpec const& spec,
                              LineCallback const& onLine = {},
                              std::stop_token stopToken = {}) -> Result<ProcessOutput>;

/// @brief Builds a child environment from @p inherited ("KEY=VALUE" strings).
///
/// Entries named in @p unset are removed, entries in @p overrides replace or extend the rest.
[[nodiscard]] auto buildEnvironment(std::vector<std::string> const& inherited,
                                    std::map<std::string, std::string> const& overrides,
                                    std::vector<std::string> const& unset) -> std::vector<std::string>;

} // namespace clockr
