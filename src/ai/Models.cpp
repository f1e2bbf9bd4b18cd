// SPDX-License-Identifier: Apache-2.0
#include <ai/Envelope.hpp>
#include <ai/Models.hpp>

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <format>

namespace clockr::ai
{

namespace
{
    auto fieldError(std::string_view field, std::string_view expected) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::ParseError, std::format("field \"{}\": expected {}", field, expected));
    }

    /// Reads an optional string field, rejecting values of the wrong type.
    auto readString(nlohmann::json const& obj, std::string_view key, std::string& out) -> VoidResult
    {
        auto const keyStr = std::string(key);
        if (!obj.contains(keyStr) || obj[keyStr].is_null())
            return {};
        if (!obj[keyStr].is_string())
            return fieldError(key, "string");
        out = obj[keyStr].get<std::string>();
        return {};
    }

    auto readCommon(nlohmann::json const& item, auto& allocation) -> VoidResult
    {
        if (!item.is_object())
            return makeError(ErrorCode::ParseError, "allocation is not an object");

        for (auto const& [key, target]: { std::pair { "project_id", &allocation.projectId },
                                          std::pair { "project_name", &allocation.projectName },
                                          std::pair { "client_name", &allocation.clientName },
                                          std::pair { "description", &allocation.description } })
        {
            if (auto ok = readString(item, key, *target); !ok)
                return ok;
        }

        if (item.contains("minutes") && !item["minutes"].is_null())
        {
            if (!item["minutes"].is_number_integer())
                return fieldError("minutes", "integer");
            allocation.minutes = item["minutes"].get<int>();
        }
        if (item.contains("confidence") && !item["confidence"].is_null())
        {
            if (!item["confidence"].is_number())
                return fieldError("confidence", "number");
            allocation.confidence = std::clamp(item["confidence"].get<double>(), 0.0, 1.0);
        }
        return {};
    }

    auto readAllocation(nlohmann::json const& item, Allocation& allocation) -> VoidResult
    {
        return readCommon(item, allocation);
    }

    auto readAllocation(nlohmann::json const& item, BatchAllocation& allocation) -> VoidResult
    {
        if (auto ok = readCommon(item, allocation); !ok)
            return ok;
        for (auto const& [key, target]: { std::pair { "date", &allocation.date },
                                          std::pair { "start_time", &allocation.startTime },
                                          std::pair { "end_time", &allocation.endTime } })
        {
            if (auto ok = readString(item, key, *target); !ok)
                return ok;
        }
        return {};
    }

    template <typename A>
    auto decode(std::string_view text) -> Result<SuggestionOf<A>>
    {
        auto const parsed = json::parse(text);
        if (!parsed)
            return std::unexpected(parsed.error());
        if (!parsed->is_object())
            return makeError(ErrorCode::ParseError, "expected a JSON object");

        auto suggestion = SuggestionOf<A> {};
        if (auto ok = readString(*parsed, "clarification", suggestion.clarification); !ok)
            return std::unexpected(ok.error());

        if (parsed->contains("allocations") && !(*parsed)["allocations"].is_null())
        {
            auto const& items = (*parsed)["allocations"];
            if (!items.is_array())
                return fieldError("allocations", "array");
            for (auto const& item: items)
            {
                auto allocation = A {};
                if (auto ok = readAllocation(item, allocation); !ok)
                    return std::unexpected(ok.error());
                suggestion.allocations.push_back(std::move(allocation));
            }
        }

        // Allocations are ignored while a clarification is pending.
        if (!suggestion.needsClarification())
        {
            for (auto const& allocation: suggestion.allocations)
            {
                if (allocation.minutes <= 0)
                    return makeError(ErrorCode::ParseError,
                                     std::format("allocation \"{}\": minutes must be positive, got {}",
                                                 allocation.projectId,
                                                 allocation.minutes));
            }
        }
        return suggestion;
    }

    template <typename A>
    auto decodeWithPreview(std::string_view text, std::string_view what) -> Result<SuggestionOf<A>>
    {
        auto result = decode<A>(text);
        if (!result)
            return makeError(ErrorCode::ParseError,
                             std::format("parsing {}: {} (raw: {})",
                                         what,
                                         result.error().message,
                                         truncatePreview(text, ParsePreviewLength)));
        return result;
    }
} // namespace

auto decodeSuggestion(std::string_view text) -> Result<Suggestion>
{
    return decodeWithPreview<Allocation>(text, "suggestion");
}

auto decodeBatchSuggestion(std::string_view text) -> Result<BatchSuggestion>
{
    return decodeWithPreview<BatchAllocation>(text, "batch suggestion");
}

auto toJson(Allocation const& allocation) -> nlohmann::json
{
    auto obj = nlohmann::json {
        { "project_id", allocation.projectId },
        { "project_name", allocation.projectName },
        { "minutes", allocation.minutes },
        { "description", allocation.description },
        { "confidence", allocation.confidence },
    };
    if (!allocation.clientName.empty())
        obj["client_name"] = allocation.clientName;
    return obj;
}

auto toJson(BatchAllocation const& allocation) -> nlohmann::json
{
    auto obj = nlohmann::json {
        { "date", allocation.date },
        { "start_time", allocation.startTime },
        { "end_time", allocation.endTime },
        { "project_id", allocation.projectId },
        { "project_name", allocation.projectName },
        { "minutes", allocation.minutes },
        { "description", allocation.description },
        { "confidence", allocation.confidence },
    };
    if (!allocation.clientName.empty())
        obj["client_name"] = allocation.clientName;
    return obj;
}

} // namespace clockr::ai
