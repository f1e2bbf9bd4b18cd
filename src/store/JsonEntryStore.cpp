// SPDX-License-Identifier: Apache-2.0
#include <store/JsonEntryStore.hpp>

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace clockr::store
{

namespace
{
    auto entryToJson(Entry const& entry) -> nlohmann::json
    {
        return nlohmann::json {
            { "id", entry.id },
            { "clockify_id", entry.clockifyId },
            { "project_id", entry.projectId },
            { "project_name", entry.projectName },
            { "client_name", entry.clientName },
            { "description", entry.description },
            { "start", formatUtcTimestamp(entry.start) },
            { "end", formatUtcTimestamp(entry.end) },
            { "minutes", entry.minutes },
            { "status", toString(entry.status) },
            { "raw_input", entry.rawInput },
            { "created_at", formatUtcTimestamp(entry.createdAt) },
        };
    }

    auto timestampOr(nlohmann::json const& obj, std::string_view key) -> TimePoint
    {
        auto const parsed = parseUtcTimestamp(json::getStringOr(obj, key, ""));
        return parsed ? *parsed : TimePoint {};
    }

    auto entryFromJson(nlohmann::json const& obj) -> Result<Entry>
    {
        auto const status = parseEntryStatus(json::getStringOr(obj, "status", ""));
        if (!status)
            return makeError(ErrorCode::StorageError,
                             std::format("invalid status for entry {}", json::getInt64Or(obj, "id", 0)));

        return Entry {
            .id = json::getInt64Or(obj, "id", 0),
            .clockifyId = json::getStringOr(obj, "clockify_id", ""),
            .projectId = json::getStringOr(obj, "project_id", ""),
            .projectName = json::getStringOr(obj, "project_name", ""),
            .clientName = json::getStringOr(obj, "client_name", ""),
            .description = json::getStringOr(obj, "description", ""),
            .start = timestampOr(obj, "start"),
            .end = timestampOr(obj, "end"),
            .minutes = json::getIntOr(obj, "minutes", 0),
            .status = *status,
            .rawInput = json::getStringOr(obj, "raw_input", ""),
            .createdAt = timestampOr(obj, "created_at"),
        };
    }
} // namespace

JsonEntryStore::JsonEntryStore(std::filesystem::path path): _path(std::move(path))
{
}

auto JsonEntryStore::open(std::filesystem::path path) -> Result<std::unique_ptr<JsonEntryStore>>
{
    auto store = std::unique_ptr<JsonEntryStore>(new JsonEntryStore(std::move(path)));
    if (auto loaded = store->load(); !loaded)
        return std::unexpected(loaded.error());
    return store;
}

auto JsonEntryStore::load() -> VoidResult
{
    auto ec = std::error_code {};
    if (!std::filesystem::exists(_path, ec))
    {
        log::debug("No entry store at {}, starting empty", _path.string());
        return {};
    }

    auto file = std::ifstream(_path);
    if (!file)
        return makeError(ErrorCode::StorageError, std::format("Cannot open entry store: {}", _path.string()));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto const parsed = json::parse(ss.str());
    if (!parsed)
        return makeError(ErrorCode::StorageError,
                         std::format("Corrupt entry store {}: {}", _path.string(), parsed.error().message));

    _nextId = json::getInt64Or(*parsed, "next_id", 1);
    if (parsed->contains("entries") && (*parsed)["entries"].is_array())
    {
        for (auto const& item: (*parsed)["entries"])
        {
            auto entry = entryFromJson(item);
            if (!entry)
                return std::unexpected(entry.error());
            _nextId = std::max(_nextId, entry->id + 1);
            _entries.push_back(std::move(*entry));
        }
    }

    log::debug("Loaded {} entries from {}", _entries.size(), _path.string());
    return {};
}

auto JsonEntryStore::save() const -> VoidResult
{
    auto ec = std::error_code {};
    if (_path.has_parent_path())
        std::filesystem::create_directories(_path.parent_path(), ec);
    if (ec)
        return makeError(ErrorCode::StorageError,
                         std::format("Failed to create data directory '{}': {}",
                                     _path.parent_path().string(),
                                     ec.message()));

    auto doc = nlohmann::json { { "next_id", _nextId }, { "entries", nlohmann::json::array() } };
    for (auto const& entry: _entries)
        doc["entries"].push_back(entryToJson(entry));

    auto tempPath = _path;
    tempPath += ".tmp";
    {
        auto file = std::ofstream(tempPath, std::ios::trunc);
        if (!file)
            return makeError(ErrorCode::StorageError,
                             std::format("Cannot write entry store: {}", tempPath.string()));
        file << doc.dump(2) << '\n';
        if (!file.flush())
            return makeError(ErrorCode::StorageError,
                             std::format("Failed writing entry store: {}", tempPath.string()));
    }

    std::filesystem::rename(tempPath, _path, ec);
    if (ec)
        return makeError(ErrorCode::StorageError,
                         std::format("Failed to replace entry store '{}': {}", _path.string(), ec.message()));
    return {};
}

auto JsonEntryStore::insert(Entry const& entry) -> Result<std::int64_t>
{
    auto const lock = std::lock_guard { _mutex };

    auto stored = entry;
    stored.id = _nextId++;
    stored.createdAt = now();
    _entries.push_back(stored);

    if (auto saved = save(); !saved)
    {
        _entries.pop_back();
        --_nextId;
        return std::unexpected(saved.error());
    }
    return stored.id;
}

auto JsonEntryStore::updateStatus(std::int64_t id, EntryStatus status, std::string_view clockifyId) -> VoidResult
{
    auto const lock = std::lock_guard { _mutex };

    auto const it = std::ranges::find(_entries, id, &Entry::id);
    if (it == _entries.end())
        return makeError(ErrorCode::StorageError, std::format("no entry with id {}", id));

    auto const previous = *it;
    it->status = status;
    it->clockifyId = std::string(clockifyId);
    if (auto saved = save(); !saved)
    {
        *it = previous;
        return std::unexpected(saved.error());
    }
    return {};
}

auto JsonEntryStore::entriesBetween(TimePoint from, TimePoint to) -> Result<std::vector<Entry>>
{
    auto const lock = std::lock_guard { _mutex };

    auto result = std::vector<Entry> {};
    for (auto const& entry: _entries)
        if (entry.start >= from && entry.start < to)
            result.push_back(entry);
    std::ranges::stable_sort(result, {}, &Entry::start);
    return result;
}

auto JsonEntryStore::todayEntries() -> Result<std::vector<Entry>>
{
    auto const startOfDay = startOfLocalDay(now());
    auto const nextDay = localTimePoint(
        std::chrono::year_month_day { std::chrono::sys_days { localDate(startOfDay) } + std::chrono::days { 1 } },
        ClockTime {});
    return entriesBetween(startOfDay, nextDay);
}

auto JsonEntryStore::lastLogged() -> Result<std::optional<Entry>>
{
    auto const lock = std::lock_guard { _mutex };

    auto const* latest = static_cast<Entry const*>(nullptr);
    for (auto const& entry: _entries)
        if (entry.status == EntryStatus::Logged && (!latest || entry.createdAt >= latest->createdAt))
            latest = &entry;

    if (!latest)
        return std::optional<Entry> {};
    return std::optional<Entry> { *latest };
}

auto JsonEntryStore::failedEntries() -> Result<std::vector<Entry>>
{
    auto const lock = std::lock_guard { _mutex };

    auto result = std::vector<Entry> {};
    for (auto const& entry: _entries)
        if (entry.status == EntryStatus::Failed)
            result.push_back(entry);
    std::ranges::stable_sort(result, {}, &Entry::createdAt);
    return result;
}

auto JsonEntryStore::lastRawInput() -> Result<std::string>
{
    auto const lock = std::lock_guard { _mutex };

    // Entries are appended in creation order.
    for (auto it = _entries.rbegin(); it != _entries.rend(); ++it)
        if (!it->rawInput.empty() && !it->rawInput.starts_with('('))
            return it->rawInput;
    return std::string {};
}

} // namespace clockr::store
