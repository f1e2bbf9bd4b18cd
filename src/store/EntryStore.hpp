// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <store/Entry.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clockr::store
{

/// @brief Local durable record of submitted time entries.
class EntryStore
{
  public:
    virtual ~EntryStore() = default;

    /// @brief Persists a new entry and returns its local id.
    ///
    /// The entry's id and createdAt fields are assigned by the store.
    [[nodiscard]] virtual auto insert(Entry const& entry) -> Result<std::int64_t> = 0;

    [[nodiscard]] virtual auto updateStatus(std::int64_t id, EntryStatus status, std::string_view clockifyId)
        -> VoidResult = 0;

    /// @brief Entries starting on the current local day, ordered by start time.
    [[nodiscard]] virtual auto todayEntries() -> Result<std::vector<Entry>> = 0;

    /// @brief The most recently created entry with status Logged.
    [[nodiscard]] virtual auto lastLogged() -> Result<std::optional<Entry>> = 0;

    /// @brief All entries with status Failed, oldest first.
    [[nodiscard]] virtual auto failedEntries() -> Result<std::vector<Entry>> = 0;

    /// @brief The most recent free-text description the user submitted, or an empty string.
    [[nodiscard]] virtual auto lastRawInput() -> Result<std::string> = 0;
};

} // namespace clockr::store
