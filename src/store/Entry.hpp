// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Time.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace clockr::store
{

/// @brief Whether a locally recorded entry reached the time-tracking service.
enum class EntryStatus
{
    Logged, ///< Created remotely; clockifyId is set.
    Failed, ///< Remote creation failed; eligible for retry.
};

[[nodiscard]] constexpr auto toString(EntryStatus status) noexcept -> std::string_view
{
    return status == EntryStatus::Logged ? "logged" : "failed";
}

[[nodiscard]] constexpr auto parseEntryStatus(std::string_view text) noexcept -> std::optional<EntryStatus>
{
    if (text == "logged")
        return EntryStatus::Logged;
    if (text == "failed")
        return EntryStatus::Failed;
    return std::nullopt;
}

/// @brief A locally persisted time entry.
struct Entry
{
    std::int64_t id = 0;     ///< Local identifier, assigned by the store.
    std::string clockifyId;  ///< External identifier; empty when status is Failed.
    std::string projectId;
    std::string projectName;
    std::string clientName;
    std::string description;
    TimePoint start {};
    TimePoint end {};
    int minutes = 0;
    EntryStatus status = EntryStatus::Logged;
    std::string rawInput;    ///< The free text the user typed for this entry.
    TimePoint createdAt {};
};

} // namespace clockr::store
