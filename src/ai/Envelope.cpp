// SPDX-License-Identifier: Apache-2.0
#include <ai/Envelope.hpp>

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

namespace clockr::ai
{

namespace
{
    auto isContainer(nlohmann::json const& value) noexcept -> bool
    {
        return value.is_object() || value.is_array();
    }

    /// result-as-string, then result-as-raw-value.
    auto unwrapResultField(nlohmann::json const& envelope) -> std::optional<std::string>
    {
        if (!envelope.is_object() || !envelope.contains("result"))
            return std::nullopt;

        auto const& result = envelope["result"];
        if (result.is_string() && !result.get_ref<std::string const&>().empty())
            return result.get<std::string>();
        if (isContainer(result))
            return result.dump();
        return std::nullopt;
    }
} // namespace

auto unwrapEnvelope(std::string_view stdoutText) -> std::string
{
    auto const envelope = json::parse(stdoutText);
    if (!envelope)
    {
        log::debug("Envelope parse failed, treating output as raw: {}", envelope.error().message);
        return std::string(stdoutText);
    }

    if (envelope->is_object())
    {
        log::debug("Envelope type={} subtype={}",
                   json::getStringOr(*envelope, "type", ""),
                   json::getStringOr(*envelope, "subtype", ""));

        if (envelope->contains("structured_output") && (*envelope)["structured_output"].is_object())
            return (*envelope)["structured_output"].dump();

        if (auto unwrapped = unwrapResultField(*envelope))
            return std::move(*unwrapped);
    }

    return std::string(stdoutText);
}

auto parseStreamLine(std::string_view line) -> std::optional<StreamLine>
{
    if (line.empty())
        return std::nullopt;

    auto const event = json::parse(line);
    if (!event || !event->is_object())
    {
        log::trace("Skipping unparseable stream line: {}", truncatePreview(line, 200));
        return std::nullopt;
    }

    auto parsed = StreamLine {};
    auto const type = json::getStringOr(*event, "type", "");

    if (type == "content_block_delta")
    {
        if (event->contains("delta"))
        {
            auto text = json::getStringOr((*event)["delta"], "text", "");
            if (!text.empty())
                parsed.chunks.push_back(std::move(text));
        }
    }
    else if (type == "assistant")
    {
        if (event->contains("message") && (*event)["message"].is_object()
            && (*event)["message"].contains("content") && (*event)["message"]["content"].is_array())
        {
            for (auto const& block: (*event)["message"]["content"])
            {
                if (json::getStringOr(block, "type", "") != "text")
                    continue;
                auto text = json::getStringOr(block, "text", "");
                if (!text.empty())
                    parsed.chunks.push_back(std::move(text));
            }
        }
    }
    else if (type == "result")
    {
        if (event->contains("structured_output") && (*event)["structured_output"].is_object())
            parsed.result = (*event)["structured_output"].dump();
        else if (event->contains("result") && !(*event)["result"].is_null())
        {
            auto const& result = (*event)["result"];
            parsed.result = result.is_string() ? result.get<std::string>() : result.dump();
        }
        if (parsed.result)
            log::debug("Stream result event ({} bytes)", parsed.result->size());
    }

    return parsed;
}

auto unwrapNestedResult(std::string text) -> std::string
{
    auto const wrapper = json::parse(text);
    if (!wrapper)
        return text;
    if (auto unwrapped = unwrapResultField(*wrapper))
        return std::move(*unwrapped);
    return text;
}

auto truncatePreview(std::string_view text, std::size_t maxLength) -> std::string
{
    if (text.size() <= maxLength)
        return std::string(text);

    auto cut = maxLength;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
        --cut;
    return std::string(text.substr(0, cut)) + "...";
}

} // namespace clockr::ai
