// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcprunner/Config.hpp>

#include <iosfwd>
#include <memory>

namespace mcprunner
{

/// @brief Wires configuration, logging, the session manager and the cleanup loop together
/// and serves JSON-lines requests.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The effective runner configuration.
    explicit App(RunnerConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Sets up logging, the session manager and (if enabled) the cleanup scheduler.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Serves requests from stdin until end of input, then shuts down.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

    /// @brief Serves one request per line from @p input, writing one response per line to @p output.
    ///
    /// Each request is handled on its own worker thread, so responses may be written out of
    /// order; callers correlate them by "request_id". Returns after all workers have finished.
    void serve(std::istream& input, std::ostream& output);

    /// @brief Stops the cleanup loop and every session.
    void shutdown();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcprunner
