// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clockr::ai
{

/// @brief Extracts the payload from a `--output-format json` envelope.
///
/// Tried in order: a `structured_output` object, `result` as a non-empty
/// string, `result` as a raw object or array. If none applies (or the text
/// is not an envelope at all) the text is returned unchanged.
[[nodiscard]] auto unwrapEnvelope(std::string_view stdoutText) -> std::string;

/// @brief What one line of `--output-format stream-json` contributed.
struct StreamLine
{
    std::vector<std::string> chunks;   ///< Incremental text for display.
    std::optional<std::string> result; ///< Set by the terminal "result" event.
};

/// @brief Decodes one stream-json line.
/// @return nullopt for empty or unparseable lines, which are to be skipped.
[[nodiscard]] auto parseStreamLine(std::string_view line) -> std::optional<StreamLine>;

/// @brief Unwraps a final stream result that is itself an object with a `result` field.
[[nodiscard]] auto unwrapNestedResult(std::string text) -> std::string;

/// @brief Returns at most @p maxLength bytes of @p text, followed by "..." when shortened.
///
/// The cut never splits a UTF-8 sequence.
[[nodiscard]] auto truncatePreview(std::string_view text, std::size_t maxLength) -> std::string;

} // namespace clockr::ai
