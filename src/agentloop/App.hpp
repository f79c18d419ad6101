// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agentloop/Config.hpp>
#include <core/Error.hpp>

#include <memory>

namespace agentloop
{

/// @brief Wires the engine components together and serves them over WebSocket.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The fully resolved configuration (file, environment and CLI).
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Binds the listening socket and writes the state file.
    /// @return Success, or the bind error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Serves clients until SIGINT or SIGTERM, then stops every backend.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace agentloop
