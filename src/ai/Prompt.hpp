// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ai/Models.hpp>
#include <clockify/Models.hpp>

#include <span>
#include <string>
#include <string_view>

namespace clockr::ai
{

/// @brief JSON schema constraining a single-interval suggestion.
[[nodiscard]] auto suggestionSchema() noexcept -> std::string_view;

/// @brief JSON schema constraining a batch suggestion.
[[nodiscard]] auto batchSuggestionSchema() noexcept -> std::string_view;

/// @brief Compact JSON array of {id, name, client_name?} used to list projects in prompts.
[[nodiscard]] auto projectCatalogJson(std::span<clockify::Project const> projects) -> std::string;

/// @brief System prompt for matching one interval of @p intervalMinutes minutes.
[[nodiscard]] auto buildSystemPrompt(std::span<clockify::Project const> projects,
                                     int intervalMinutes,
                                     std::span<std::string const> contextItems) -> std::string;

/// @brief System prompt for matching a multi-day work schedule.
[[nodiscard]] auto buildBatchSystemPrompt(std::span<clockify::Project const> projects,
                                          std::span<DaySlot const> days) -> std::string;

/// @brief One "Work schedule" line describing a day slot.
[[nodiscard]] auto formatScheduleLine(DaySlot const& day) -> std::string;

/// @brief The user turn carrying the free-text description.
[[nodiscard]] auto buildUserPrompt(std::string_view description) -> std::string;

} // namespace clockr::ai
