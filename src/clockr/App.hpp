// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include "Commands.hpp"
#include "Config.hpp"

#include <filesystem>
#include <memory>

namespace clockr
{

/// @brief Wires configuration, Clockify, the entry store and the AI backend into the CLI commands.
///
/// Every command reports failure through its return value; user-facing output
/// goes to stdout.
class App
{
  public:
    App(AppConfig config, std::filesystem::path configPath);
    ~App();

    App(App const&) = delete;
    auto operator=(App const&) -> App& = delete;

    /// @brief `clockr log`: interactive review of the current interval, a date range, or a repeat of the last entry.
    [[nodiscard]] auto log(LogOptions const& options) -> VoidResult;

    /// @brief `clockr status`: today's entries and totals.
    [[nodiscard]] auto status() -> VoidResult;

    /// @brief `clockr projects`: the workspace's projects.
    [[nodiscard]] auto projects() -> VoidResult;

    /// @brief `clockr retry`: resubmits entries whose remote creation failed.
    [[nodiscard]] auto retry() -> VoidResult;

    /// @brief `clockr config`: shows the config path and optionally writes a default file.
    [[nodiscard]] auto config(bool init) -> VoidResult;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace clockr
