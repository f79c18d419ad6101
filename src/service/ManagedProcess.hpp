// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <service/ServiceTypes.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentloop
{

/// @brief Configuration for spawning a supervised child process.
struct ProcessOptions
{
    std::string name; // used as log prefix
    std::vector<std::string> argv;
    std::map<std::string, std::string> env; // added to the inherited environment

    /// @brief Called for every non-empty output line, from the reader thread.
    std::function<void(OutputStream stream, std::string_view line)> onLine;

    /// @brief Called once with the exit code (128 + signal when killed), from the waiter thread.
    ///
    /// The callback must not destroy the ManagedProcess.
    std::function<void(int exitCode)> onExit;
};

/// @brief A child process in its own process group with line-buffered output capture.
///
/// Stdin is connected to /dev/null; stdout and stderr are read by a
/// background thread and split into lines.
class ManagedProcess
{
  public:
    explicit ManagedProcess(ProcessOptions options);
    ~ManagedProcess();

    ManagedProcess(const ManagedProcess&) = delete;
    ManagedProcess& operator=(const ManagedProcess&) = delete;

    /// @brief Spawns the process.
    /// @return Success, or a ProcessError if the process is already running or cannot be spawned.
    [[nodiscard]] auto start() -> VoidResult;

    /// @brief Terminates the process group: SIGTERM, then SIGKILL after @p grace.
    ///
    /// Blocks until the process has exited. Does nothing if it is not running.
    void stop(std::chrono::milliseconds grace = std::chrono::milliseconds(2'000));

    /// @brief Blocks until the process exits or @p timeout elapses.
    /// @return The exit code, or std::nullopt on timeout.
    [[nodiscard]] auto waitForExit(std::chrono::milliseconds timeout) -> std::optional<int>;

    [[nodiscard]] auto isRunning() const -> bool;
    [[nodiscard]] auto pid() const -> std::optional<int>;
    [[nodiscard]] auto exitCode() const -> std::optional<int>;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace agentloop
