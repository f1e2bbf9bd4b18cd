// SPDX-License-Identifier: Apache-2.0
#include <ai/Prompt.hpp>

#include <format>

namespace clockr::ai
{

namespace
{
    constexpr auto SuggestionSchema = std::string_view { R"({
  "type": "object",
  "properties": {
    "allocations": {
      "type": "array",
      "items": {
        "type": "object",
        "properties": {
          "project_id": {"type": "string"},
          "project_name": {"type": "string"},
          "client_name": {"type": "string"},
          "minutes": {"type": "integer"},
          "description": {"type": "string"},
          "confidence": {"type": "number"}
        },
        "required": ["project_id", "project_name", "minutes", "description", "confidence"]
      }
    },
    "clarification": {"type": "string"}
  },
  "required": ["allocations"]
})" };

    constexpr auto BatchSuggestionSchema = std::string_view { R"({
  "type": "object",
  "properties": {
    "allocations": {
      "type": "array",
      "items": {
        "type": "object",
        "properties": {
          "date": {"type": "string"},
          "start_time": {"type": "string"},
          "end_time": {"type": "string"},
          "project_id": {"type": "string"},
          "project_name": {"type": "string"},
          "client_name": {"type": "string"},
          "minutes": {"type": "integer"},
          "description": {"type": "string"},
          "confidence": {"type": "number"}
        },
        "required": ["date", "start_time", "end_time", "project_id", "project_name", "minutes", "description", "confidence"]
      }
    },
    "clarification": {"type": "string"}
  },
  "required": ["allocations"]
})" };

    /// Renders a list as "[a b c]", or "none" when empty.
    auto bracketList(std::span<std::string const> items) -> std::string
    {
        if (items.empty())
            return "none";
        auto text = std::string { "[" };
        for (auto i = std::size_t { 0 }; i < items.size(); ++i)
        {
            if (i > 0)
                text += ' ';
            text += items[i];
        }
        text += ']';
        return text;
    }
} // namespace

auto suggestionSchema() noexcept -> std::string_view
{
    return SuggestionSchema;
}

auto batchSuggestionSchema() noexcept -> std::string_view
{
    return BatchSuggestionSchema;
}

auto projectCatalogJson(std::span<clockify::Project const> projects) -> std::string
{
    auto catalog = nlohmann::ordered_json::array();
    for (auto const& project: projects)
    {
        auto item = nlohmann::ordered_json { { "id", project.id }, { "name", project.name } };
        if (!project.clientName.empty())
            item["client_name"] = project.clientName;
        catalog.push_back(std::move(item));
    }
    return catalog.dump();
}

auto buildSystemPrompt(std::span<clockify::Project const> projects,
                       int intervalMinutes,
                       std::span<std::string const> contextItems) -> std::string
{
    auto contextSection = std::string {};
    if (!contextItems.empty())
    {
        contextSection = "\nContext (calendar events, commits, PRs):\n";
        for (auto const& item: contextItems)
            contextSection += std::format("  - {}\n", item);
        contextSection += '\n';
    }

    return std::format(
        "You are a time-tracking assistant. Your job is to match work descriptions to Clockify projects and "
        "create time entry allocations.\n"
        "\n"
        "Available projects:\n"
        "{}\n"
        "{}Rules:\n"
        "- The time period is {} minutes total\n"
        "- Each allocation must be at least 30 minutes\n"
        "- Maximum 2 allocations per hour\n"
        "- Allocations must sum to exactly {} minutes\n"
        "- Use exact project IDs and names from the list above\n"
        "- Write professional, concise descriptions suitable for Clockify time entries\n"
        "- Use git commits and PRs as additional context clues for what was worked on and which projects to "
        "assign\n"
        "- If the description is unclear, set clarification to ask for more detail and return empty "
        "allocations\n"
        "- Set confidence between 0 and 1 based on how well the description matches a project\n"
        "- If you cannot match to any project with reasonable confidence, set clarification to explain why\n"
        "\n"
        "Return valid JSON matching the required schema.",
        projectCatalogJson(projects),
        contextSection,
        intervalMinutes,
        intervalMinutes);
}

auto formatScheduleLine(DaySlot const& day) -> std::string
{
    return std::format("  {} {}: {}–{} ({} min), calendar: {}, commits: {}\n",
                       day.date,
                       day.weekday,
                       formatLocalClock(day.workStart),
                       formatLocalClock(day.workEnd),
                       day.totalMinutes,
                       bracketList(day.calendarEvents),
                       bracketList(day.commitContext));
}

auto buildBatchSystemPrompt(std::span<clockify::Project const> projects, std::span<DaySlot const> days)
    -> std::string
{
    auto schedule = std::string {};
    for (auto const& day: days)
        schedule += formatScheduleLine(day);

    return std::format(
        "You are a time-tracking assistant. Your job is to match work descriptions to Clockify projects and "
        "create time entry allocations across multiple days.\n"
        "\n"
        "Available projects:\n"
        "{}\n"
        "\n"
        "Work schedule:\n"
        "{}\n"
        "Rules:\n"
        "- Create allocations for EACH work day listed above\n"
        "- Each day's allocations must sum to exactly that day's total minutes\n"
        "- Each allocation must be at least 30 minutes\n"
        "- Allocations must be contiguous within work hours (no gaps or overlaps within a day)\n"
        "- Use exact project IDs and names from the list above\n"
        "- The \"date\" field must be \"YYYY-MM-DD\" format\n"
        "- The \"start_time\" and \"end_time\" fields must be \"HH:MM\" format (24h)\n"
        "- Write professional, concise descriptions suitable for Clockify time entries\n"
        "- Use calendar events as context clues for what was worked on\n"
        "- Use git commits and PRs as additional context clues for what was worked on and which projects to "
        "assign\n"
        "- If the description is unclear, set clarification to ask for more detail and return empty "
        "allocations\n"
        "- Set confidence between 0 and 1 based on how well the description matches a project\n"
        "\n"
        "Return valid JSON matching the required schema.",
        projectCatalogJson(projects),
        schedule);
}

auto buildUserPrompt(std::string_view description) -> std::string
{
    return std::format("What I worked on: {}", description);
}

} // namespace clockr::ai
