// SPDX-License-Identifier: Apache-2.0
#include <ai/ClaudeCli.hpp>
#include <ai/Envelope.hpp>
#include <ai/Prompt.hpp>

#include <core/Log.hpp>
#include <process/ProcessRunner.hpp>

#include <chrono>
#include <format>

namespace clockr::ai
{

ClaudeCli::ClaudeCli(ClaudeCliConfig config): _config(std::move(config))
{
    if (_config.model.empty())
        _config.model = "sonnet";
    if (_config.executable.empty())
        _config.executable = "claude";
}

auto ClaudeCli::blockedEnvironment() -> std::vector<std::string>
{
    return { "CLAUDECODE", "CLAUDE_CODE_ENTRYPOINT", "CLAUDE_CODE_EXPERIMENTAL_AGENT_TEAMS" };
}

auto ClaudeCli::buildArgs(std::string_view systemPrompt,
                          std::string_view userPrompt,
                          std::string_view schema,
                          bool streaming) const -> std::vector<std::string>
{
    auto args = std::vector<std::string> {
        "-p",
        std::string(userPrompt),
        "--output-format",
        streaming ? "stream-json" : "json",
        "--model",
        _config.model,
        "--system-prompt",
        std::string(systemPrompt),
        "--json-schema",
        std::string(schema),
        "--no-session-persistence",
        "--effort",
        "low",
        "--no-thinking",
    };
    // stream-json requires --verbose together with --print.
    if (streaming)
        args.emplace_back("--verbose");
    return args;
}

auto ClaudeCli::run(std::vector<std::string> args, ThinkingCallback const& onThinking, std::stop_token stopToken)
    const -> Result<std::string>
{
    auto const spec = ProcessSpec {
        .command = _config.executable,
        .args = std::move(args),
        .env = {},
        .unsetEnv = blockedEnvironment(),
        .stdinData = {},
    };

    auto resultText = std::optional<std::string> {};
    auto onLine = LineCallback {};
    if (onThinking)
    {
        onLine = [&](std::string_view line) {
            auto event = parseStreamLine(line);
            if (!event)
                return;
            for (auto const& chunk: event->chunks)
                onThinking(chunk);
            if (event->result)
                resultText = std::move(event->result);
        };
    }

    auto const startTime = std::chrono::steady_clock::now();
    auto output = runProcess(spec, onLine, stopToken);
    auto const elapsed =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startTime);

    if (!output)
    {
        log::error("claude CLI could not be started: {}", output.error().message);
        return makeError(ErrorCode::ProcessError, std::format("running claude CLI: {}", output.error().message));
    }

    log::debug("claude CLI finished after {}s (exit {}, {} stdout bytes, {} stderr bytes)",
               elapsed.count(),
               output->exitCode,
               output->stdoutData.size(),
               output->stderrData.size());

    if (output->cancelled || stopToken.stop_requested())
    {
        log::error("claude CLI stopped after {}s", elapsed.count());
        return makeError(ErrorCode::TimeoutError, std::format("claude CLI timed out after {}s", elapsed.count()));
    }
    if (output->exitCode != 0)
    {
        log::error("claude CLI failed with exit status {}: {}", output->exitCode, output->stderrData);
        return makeError(
            ErrorCode::ProcessError,
            std::format("running claude CLI: exit status {} (stderr: {})", output->exitCode, output->stderrData));
    }

    if (!onThinking)
        return unwrapEnvelope(output->stdoutData);

    if (!resultText || resultText->empty())
        return makeError(ErrorCode::AiError, "no result received from claude CLI stream");
    return unwrapNestedResult(std::move(*resultText));
}

auto ClaudeCli::matchSingle(MatchRequest const& request,
                            ThinkingCallback const& onThinking,
                            std::stop_token stopToken) -> Result<Suggestion>
{
    auto const systemPrompt = buildSystemPrompt(request.projects, request.intervalMinutes, request.contextItems);
    auto const userPrompt = buildUserPrompt(request.description);

    log::debug("Invoking claude CLI: model={} projects={} context_items={} system_prompt_len={}",
               _config.model,
               request.projects.size(),
               request.contextItems.size(),
               systemPrompt.size());

    auto const text = run(buildArgs(systemPrompt, userPrompt, suggestionSchema(), static_cast<bool>(onThinking)),
                          onThinking,
                          stopToken);
    if (!text)
        return std::unexpected(text.error());

    log::trace("Suggestion payload: {}", truncatePreview(*text, 2000));
    auto suggestion = decodeSuggestion(*text);
    if (!suggestion)
    {
        log::error("Failed to parse suggestion: {}", suggestion.error().message);
        return suggestion;
    }

    log::debug("Parsed suggestion: {} allocations, clarification=\"{}\"",
               suggestion->allocations.size(),
               suggestion->clarification);
    return suggestion;
}

auto ClaudeCli::matchBatch(BatchMatchRequest const& request,
                           ThinkingCallback const& onThinking,
                           std::stop_token stopToken) -> Result<BatchSuggestion>
{
    auto const systemPrompt = buildBatchSystemPrompt(request.projects, request.days);
    auto const userPrompt = buildUserPrompt(request.description);

    log::debug("Invoking claude CLI (batch): model={} days={} projects={} system_prompt_len={}",
               _config.model,
               request.days.size(),
               request.projects.size(),
               systemPrompt.size());

    auto const text =
        run(buildArgs(systemPrompt, userPrompt, batchSuggestionSchema(), static_cast<bool>(onThinking)),
            onThinking,
            stopToken);
    if (!text)
        return std::unexpected(text.error());

    log::trace("Batch suggestion payload: {}", truncatePreview(*text, 2000));
    auto suggestion = decodeBatchSuggestion(*text);
    if (!suggestion)
    {
        log::error("Failed to parse batch suggestion: {}", suggestion.error().message);
        return suggestion;
    }

    for (auto const& allocation: suggestion->allocations)
        log::debug("Batch allocation: {} {}-{} {} ({} min)",
                   allocation.date,
                   allocation.startTime,
                   allocation.endTime,
                   allocation.projectName,
                   allocation.minutes);
    return suggestion;
}

} // namespace clockr::ai
