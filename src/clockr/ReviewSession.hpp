// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <review/ReviewStateMachine.hpp>
#include <tui/Theme.hpp>

#include <filesystem>

namespace clockr
{

/// @brief Runs a review state machine on the controlling terminal until it finishes.
///
/// Owns the terminal for the duration of the call: raw mode, alternate screen
/// and bracketed paste are active until the function returns. Log output is
/// redirected to @p logFile meanwhile; if that file cannot be opened, messages
/// are held back and written to stderr once the screen is restored.
///
/// @return Success, or an IoError if the terminal cannot be set up.
template <typename Machine>
[[nodiscard]] auto runReviewSession(Machine& machine, tui::Theme const& theme, std::filesystem::path const& logFile)
    -> VoidResult;

extern template auto runReviewSession<review::ReviewStateMachine>(review::ReviewStateMachine&,
                                                                  tui::Theme const&,
                                                                  std::filesystem::path const&) -> VoidResult;
extern template auto runReviewSession<review::BatchReviewStateMachine>(review::BatchReviewStateMachine&,
                                                                       tui::Theme const&,
                                                                       std::filesystem::path const&) -> VoidResult;

} // namespace clockr
