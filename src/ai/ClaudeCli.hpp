// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ai/Matcher.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace clockr::ai
{

/// @brief Settings for the Claude CLI backend.
struct ClaudeCliConfig
{
    std::string executable = "claude";
    std::string model = "sonnet";
};

/// @brief Matcher that shells out to the `claude` command-line tool.
///
/// With a thinking callback the CLI runs in stream-json mode and every text
/// fragment is forwarded as it arrives; otherwise the single JSON envelope is
/// read at exit.
class ClaudeCli: public Matcher
{
  public:
    explicit ClaudeCli(ClaudeCliConfig config = {});

    [[nodiscard]] auto matchSingle(MatchRequest const& request,
                                   ThinkingCallback const& onThinking,
                                   std::stop_token stopToken) -> Result<Suggestion> override;

    [[nodiscard]] auto matchBatch(BatchMatchRequest const& request,
                                  ThinkingCallback const& onThinking,
                                  std::stop_token stopToken) -> Result<BatchSuggestion> override;

    /// @brief Command-line arguments for one invocation.
    [[nodiscard]] auto buildArgs(std::string_view systemPrompt,
                                 std::string_view userPrompt,
                                 std::string_view schema,
                                 bool streaming) const -> std::vector<std::string>;

    /// @brief Environment variables removed so the CLI does not refuse to run nested.
    [[nodiscard]] static auto blockedEnvironment() -> std::vector<std::string>;

  private:
    [[nodiscard]] auto run(std::vector<std::string> args,
                           ThinkingCallback const& onThinking,
                           std::stop_token stopToken) const -> Result<std::string>;

    ClaudeCliConfig _config;
};

} // namespace clockr::ai
