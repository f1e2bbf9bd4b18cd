// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <store/EntryStore.hpp>

#include <filesystem>
#include <memory>
#include <mutex>

namespace clockr::store
{

/// @brief EntryStore backed by a single JSON document on disk.
///
/// The whole document is rewritten through a temporary file and rename on
/// every mutation, so a crash never leaves a half-written file behind.
class JsonEntryStore: public EntryStore
{
  public:
    /// @brief Opens (or creates) the store at @p path.
    [[nodiscard]] static auto open(std::filesystem::path path) -> Result<std::unique_ptr<JsonEntryStore>>;

    [[nodiscard]] auto insert(Entry const& entry) -> Result<std::int64_t> override;
    [[nodiscard]] auto updateStatus(std::int64_t id, EntryStatus status, std::string_view clockifyId)
        -> VoidResult override;
    [[nodiscard]] auto todayEntries() -> Result<std::vector<Entry>> override;
    [[nodiscard]] auto lastLogged() -> Result<std::optional<Entry>> override;
    [[nodiscard]] auto failedEntries() -> Result<std::vector<Entry>> override;
    [[nodiscard]] auto lastRawInput() -> Result<std::string> override;

    /// @brief Entries whose start lies in [from, to), ordered by start time.
    [[nodiscard]] auto entriesBetween(TimePoint from, TimePoint to) -> Result<std::vector<Entry>>;

    [[nodiscard]] auto path() const noexcept -> std::filesystem::path const& { return _path; }

  private:
    explicit JsonEntryStore(std::filesystem::path path);

    [[nodiscard]] auto load() -> VoidResult;
    [[nodiscard]] auto save() const -> VoidResult;

    std::filesystem::path _path;
    mutable std::mutex _mutex;
    std::int64_t _nextId = 1;
    std::vector<Entry> _entries;
};

} // namespace clockr::store
