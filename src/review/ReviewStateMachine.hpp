// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ai/Matcher.hpp>
#include <ai/Models.hpp>
#include <clockify/Models.hpp>
#include <core/Error.hpp>
#include <core/Time.hpp>
#include <store/Entry.hpp>
#include <tui/InputField.hpp>
#include <tui/Spinner.hpp>
#include <tui/Theme.hpp>

#include <review/AllocationEditor.hpp>
#include <review/ChunkChannel.hpp>
#include <review/FuzzyProjectIndex.hpp>
#include <review/Message.hpp>
#include <review/StreamingInvoker.hpp>
#include <review/SubmissionPipeline.hpp>
#include <review/SuggestionReviewer.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace clockr::review
{

/// @brief The screen a review session is on.
enum class ViewState : std::uint8_t
{
    Input,
    Loading,
    Suggestion,
    Edit,
    Confirmation,
};

[[nodiscard]] constexpr auto viewStateName(ViewState state) noexcept -> std::string_view
{
    switch (state)
    {
        case ViewState::Input: return "input";
        case ViewState::Loading: return "loading";
        case ViewState::Suggestion: return "suggestion";
        case ViewState::Edit: return "edit";
        case ViewState::Confirmation: return "confirmation";
    }
    return "unknown";
}

/// @brief Outcome of a finished review session.
///
/// A session canceled while submitting is skipped but still lists the entries
/// that were submitted before the cancellation took effect.
struct RunResult
{
    bool skipped = false;
    std::vector<store::Entry> entries;
};

/// @brief Collaborators and tunables shared by both review flavours.
struct ReviewDependencies
{
    ai::Matcher& matcher;
    SubmissionPipeline& pipeline;
    std::vector<clockify::Project> projects;
    std::string lastInput; ///< Offered through Ctrl+L on the input screen; may be empty.
    std::chrono::milliseconds tickInterval = std::chrono::seconds(1);
    std::optional<StreamingOptions> streaming; ///< Replaces the mode's default limits when set.
};

/// @brief Review of one interval ending now.
class SingleIntervalMode
{
  public:
    using SuggestionType = ai::Suggestion;
    using AllocationType = ai::Allocation;

    SingleIntervalMode(TimePoint start, TimePoint end, std::vector<std::string> contextItems = {});

    /// @brief "HH:MM – HH:MM (N min)" in local time.
    [[nodiscard]] auto timeLabel() const -> std::string;
    [[nodiscard]] auto loadingLabel() const noexcept -> std::string_view { return "Thinking..."; }
    [[nodiscard]] auto hardCeiling() const noexcept -> std::chrono::milliseconds { return std::chrono::seconds(60); }

    [[nodiscard]] auto match(ai::Matcher& matcher,
                             std::string const& description,
                             std::vector<clockify::Project> const& projects,
                             ai::ThinkingCallback const& onThinking,
                             std::stop_token stopToken) const -> Result<SuggestionType>;

    [[nodiscard]] auto submit(SubmissionPipeline& pipeline,
                              std::vector<AllocationType> const& allocations,
                              std::string_view rawInput,
                              std::stop_token stopToken) const -> Result<std::vector<store::Entry>>;

    [[nodiscard]] auto renderSuccess(std::vector<store::Entry> const& entries, tui::Theme const& theme) const
        -> std::string;

    [[nodiscard]] auto start() const noexcept -> TimePoint { return _start; }
    [[nodiscard]] auto end() const noexcept -> TimePoint { return _end; }
    [[nodiscard]] auto intervalMinutes() const noexcept -> int;

  private:
    TimePoint _start;
    TimePoint _end;
    std::vector<std::string> _contextItems;
};

/// @brief Review of several work days at once.
class BatchMode
{
  public:
    using SuggestionType = ai::BatchSuggestion;
    using AllocationType = ai::BatchAllocation;

    /// @param days Must not be empty.
    explicit BatchMode(std::vector<ai::DaySlot> days);

    /// @brief "Batch: <first> to <last> (<n> days, <m> min total)".
    [[nodiscard]] auto timeLabel() const -> std::string;
    [[nodiscard]] auto loadingLabel() const noexcept -> std::string_view
    {
        return "Thinking (batch mode, this may take a moment)...";
    }
    [[nodiscard]] auto hardCeiling() const noexcept -> std::chrono::milliseconds { return std::chrono::seconds(120); }

    [[nodiscard]] auto match(ai::Matcher& matcher,
                             std::string const& description,
                             std::vector<clockify::Project> const& projects,
                             ai::ThinkingCallback const& onThinking,
                             std::stop_token stopToken) const -> Result<SuggestionType>;

    [[nodiscard]] auto submit(SubmissionPipeline& pipeline,
                              std::vector<AllocationType> const& allocations,
                              std::string_view rawInput,
                              std::stop_token stopToken) const -> Result<std::vector<store::Entry>>;

    [[nodiscard]] auto renderSuccess(std::vector<store::Entry> const& entries, tui::Theme const& theme) const
        -> std::string;

    [[nodiscard]] auto days() const noexcept -> std::vector<ai::DaySlot> const& { return _days; }

  private:
    std::vector<ai::DaySlot> _days;
};

/// @brief The capture → matching → review → edit → confirmation flow.
///
/// Elm-style: update() applies one message and returns the commands to run
/// asynchronously; the messages those commands produce are fed back through
/// update(), one at a time, on the same thread. render() is a pure function
/// of the current state. Ctrl+C ends the session as skipped from any screen.
/// While entries are being submitted it stops the submission instead: the
/// result turns skipped at once, and the session finishes as soon as the
/// submission reports the entries it created up to that point.
///
/// Each AI request gets a new generation number; ticks, chunks and results
/// carrying an older generation are ignored.
template <typename Mode>
class BasicReviewMachine
{
  public:
    using SuggestionType = typename Mode::SuggestionType;
    using AllocationType = typename Mode::AllocationType;

    static constexpr std::string_view InputPlaceholder = "Describe what you worked on...";

    BasicReviewMachine(Mode mode, ReviewDependencies dependencies);

    // The editor refers to the machine's project index.
    BasicReviewMachine(BasicReviewMachine const&) = delete;
    auto operator=(BasicReviewMachine const&) -> BasicReviewMachine& = delete;
    BasicReviewMachine(BasicReviewMachine&&) = delete;
    auto operator=(BasicReviewMachine&&) -> BasicReviewMachine& = delete;

    [[nodiscard]] auto update(Message message) -> std::vector<Command>;

    [[nodiscard]] auto render(tui::Theme const& theme) const -> std::string;

    /// @brief Pre-fills the capture field.
    void setInitialInput(std::string_view text);

    [[nodiscard]] auto state() const noexcept -> ViewState { return _state; }
    [[nodiscard]] auto finished() const noexcept -> bool { return _finished; }

    /// @brief Set once the session produced an outcome: skipped, or the submitted entries.
    [[nodiscard]] auto result() const noexcept -> std::optional<RunResult> const& { return _result; }

    [[nodiscard]] auto errorMessage() const noexcept -> std::string const& { return _errorMessage; }
    [[nodiscard]] auto transcript() const noexcept -> std::string const& { return _transcript; }
    [[nodiscard]] auto inputText() const noexcept -> std::string_view { return _input.text(); }
    [[nodiscard]] auto timeLabel() const -> std::string { return _mode.timeLabel(); }
    [[nodiscard]] auto generation() const noexcept -> std::uint64_t { return _generation; }
    [[nodiscard]] auto isSubmitting() const noexcept -> bool { return _submitting; }
    [[nodiscard]] auto isStoppingSubmission() const noexcept -> bool
    {
        return _submitting && _submissionStop.stop_requested();
    }

    [[nodiscard]] auto reviewer() const noexcept -> SuggestionReviewer<AllocationType> const*
    {
        return _reviewer ? &*_reviewer : nullptr;
    }

    [[nodiscard]] auto editor() const noexcept -> AllocationEditor<AllocationType> const*
    {
        return _editor ? &*_editor : nullptr;
    }

  private:
    auto handle(KeyMsg const& message) -> std::vector<Command>;
    auto handle(PasteMsg const& message) -> std::vector<Command>;
    auto handle(ResizeMsg const& message) -> std::vector<Command>;
    auto handle(TickMsg const& message) -> std::vector<Command>;
    auto handle(ChunkMsg& message) -> std::vector<Command>;
    auto handle(ChunksDoneMsg const& message) -> std::vector<Command>;
    auto handle(SubmitDoneMsg& message) -> std::vector<Command>;

    template <typename S>
    auto handle(MatchDoneMsg<S>& message) -> std::vector<Command>;

    auto handleInputKey(tui::KeyEvent const& key) -> std::vector<Command>;
    auto handleSuggestionKey(tui::KeyEvent const& key) -> std::vector<Command>;
    auto handleEditKey(tui::KeyEvent const& key) -> std::vector<Command>;
    auto handleConfirmationKey(tui::KeyEvent const& key) -> std::vector<Command>;

    auto startMatching() -> std::vector<Command>;
    auto startSubmission() -> std::vector<Command>;
    void cancel();
    void stopSubmission();

    [[nodiscard]] auto matchCommand() const -> Command;
    [[nodiscard]] auto readChunkCommand() const -> Command;
    [[nodiscard]] auto tickCommand() const -> Command;

    [[nodiscard]] auto renderInput(tui::Theme const& theme) const -> std::string;
    [[nodiscard]] auto renderLoading(tui::Theme const& theme) const -> std::string;
    [[nodiscard]] auto renderConfirmation(tui::Theme const& theme) const -> std::string;

    Mode _mode;
    ReviewDependencies _deps;
    FuzzyProjectIndex _projectIndex;

    ViewState _state = ViewState::Input;
    bool _finished = false;
    bool _submitting = false;
    std::optional<RunResult> _result;
    std::string _errorMessage;

    tui::InputField _input;
    std::string _submittedInput; ///< Text sent to the AI; stored with each entry.
    tui::Spinner _spinner { tui::SpinnerType::Dots };

    std::uint64_t _generation = 0;
    std::shared_ptr<ChunkChannel> _channel;
    std::string _transcript;
    std::chrono::steady_clock::time_point _loadingStarted;

    std::optional<SuggestionReviewer<AllocationType>> _reviewer;
    std::optional<AllocationEditor<AllocationType>> _editor;
    std::size_t _pendingCount = 0;
    std::stop_source _submissionStop;

    int _columns = 80;
    int _rows = 24;
};

using ReviewStateMachine = BasicReviewMachine<SingleIntervalMode>;
using BatchReviewStateMachine = BasicReviewMachine<BatchMode>;

extern template class BasicReviewMachine<SingleIntervalMode>;
extern template class BasicReviewMachine<BatchMode>;

} // namespace clockr::review
