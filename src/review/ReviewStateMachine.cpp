// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <tui/Text.hpp>

#include <review/ReviewStateMachine.hpp>

#include <algorithm>
#include <format>
#include <map>
#include <utility>

namespace clockr::review
{

namespace
{
    auto countFailed(std::vector<store::Entry> const& entries) -> std::size_t
    {
        return static_cast<std::size_t>(std::ranges::count_if(
            entries, [](store::Entry const& entry) { return entry.status == store::EntryStatus::Failed; }));
    }

    auto failedNotice(std::vector<store::Entry> const& entries, tui::Theme const& theme) -> std::string
    {
        auto const failed = countFailed(entries);
        if (failed == 0)
            return {};
        return "\n"
               + tui::styled(std::format("{} of {} entries failed to sync; run 'clockr retry' to resubmit them",
                                    failed,
                                    entries.size()),
                        theme.warning);
    }

    /// Keeps the last @p maxLines lines of @p text.
    auto tail(std::string_view text, int maxLines) -> std::string
    {
        auto const lines = tui::splitLines(text);
        auto const count = static_cast<std::size_t>(std::max(maxLines, 1));
        auto const first = lines.size() > count ? lines.size() - count : std::size_t { 0 };

        auto out = std::string {};
        for (auto i = first; i < lines.size(); ++i)
        {
            if (i != first)
                out += '\n';
            out += lines[i];
        }
        return out;
    }
} // namespace

SingleIntervalMode::SingleIntervalMode(TimePoint start, TimePoint end, std::vector<std::string> contextItems):
    _start { start }, _end { end }, _contextItems { std::move(contextItems) }
{
}

auto SingleIntervalMode::intervalMinutes() const noexcept -> int
{
    return static_cast<int>(std::chrono::duration_cast<std::chrono::minutes>(_end - _start).count());
}

auto SingleIntervalMode::timeLabel() const -> std::string
{
    return std::format(
        "{} – {} ({} min)", formatLocalClock(_start), formatLocalClock(_end), intervalMinutes());
}

auto SingleIntervalMode::match(ai::Matcher& matcher,
                               std::string const& description,
                               std::vector<clockify::Project> const& projects,
                               ai::ThinkingCallback const& onThinking,
                               std::stop_token stopToken) const -> Result<SuggestionType>
{
    auto const request = ai::MatchRequest {
        .description = description,
        .projects = projects,
        .intervalMinutes = intervalMinutes(),
        .contextItems = _contextItems,
    };
    return matcher.matchSingle(request, onThinking, std::move(stopToken));
}

auto SingleIntervalMode::submit(SubmissionPipeline& pipeline,
                                std::vector<AllocationType> const& allocations,
                                std::string_view rawInput,
                                std::stop_token stopToken) const -> Result<std::vector<store::Entry>>
{
    return pipeline.submitInterval(allocations, _start, _end, rawInput, std::move(stopToken));
}

auto SingleIntervalMode::renderSuccess(std::vector<store::Entry> const& entries, tui::Theme const& theme) const
    -> std::string
{
    return tui::styled("Entries logged successfully!", theme.success) + failedNotice(entries, theme);
}

BatchMode::BatchMode(std::vector<ai::DaySlot> days): _days { std::move(days) }
{
}

auto BatchMode::timeLabel() const -> std::string
{
    if (_days.empty())
        return "Batch: no days";

    auto total = 0;
    for (auto const& day: _days)
        total += day.totalMinutes;

    return std::format(
        "Batch: {} to {} ({} days, {} min total)", _days.front().date, _days.back().date, _days.size(), total);
}

auto BatchMode::match(ai::Matcher& matcher,
                      std::string const& description,
                      std::vector<clockify::Project> const& projects,
                      ai::ThinkingCallback const& onThinking,
                      std::stop_token stopToken) const -> Result<SuggestionType>
{
    auto const request = ai::BatchMatchRequest {
        .description = description,
        .projects = projects,
        .days = _days,
    };
    return matcher.matchBatch(request, onThinking, std::move(stopToken));
}

auto BatchMode::submit(SubmissionPipeline& pipeline,
                       std::vector<AllocationType> const& allocations,
                       std::string_view rawInput,
                       std::stop_token stopToken) const -> Result<std::vector<store::Entry>>
{
    return pipeline.submitBatch(allocations, rawInput, std::move(stopToken));
}

auto BatchMode::renderSuccess(std::vector<store::Entry> const& entries, tui::Theme const& theme) const
    -> std::string
{
    if (entries.empty())
        return tui::styled("No entries to log.", theme.success);

    struct DayTotals
    {
        int count = 0;
        int minutes = 0;
    };
    auto perDay = std::map<std::string, DayTotals> {};
    for (auto const& entry: entries)
    {
        auto& totals = perDay[formatDate(localDate(entry.start))];
        ++totals.count;
        totals.minutes += entry.minutes;
    }

    auto out = tui::styled(std::format("Logged {} entries across {} days!", entries.size(), perDay.size()),
                      theme.success);
    out += "\n";
    for (auto const& day: _days)
    {
        auto const it = perDay.find(day.date);
        if (it == perDay.end())
            continue;
        out += std::format(
            "\n  {} {}: {} entries, {} min", day.date, day.weekday, it->second.count, it->second.minutes);
    }
    out += failedNotice(entries, theme);
    return out;
}

template <typename Mode>
BasicReviewMachine<Mode>::BasicReviewMachine(Mode mode, ReviewDependencies dependencies):
    _mode { std::move(mode) }, _deps { std::move(dependencies) }, _projectIndex { _deps.projects }
{
    _input.setPlaceholder(InputPlaceholder);
}

template <typename Mode>
void BasicReviewMachine<Mode>::setInitialInput(std::string_view text)
{
    _input.setText(text);
}

template <typename Mode>
auto BasicReviewMachine<Mode>::update(Message message) -> std::vector<Command>
{
    if (_finished)
        return {};
    return std::visit([this](auto& msg) { return handle(msg); }, message);
}

template <typename Mode>
auto BasicReviewMachine<Mode>::handle(KeyMsg const& message) -> std::vector<Command>
{
    auto const& key = message.key;
    if (key.isCtrl('c'))
    {
        if (_submitting)
            stopSubmission();
        else
            cancel();
        return {};
    }

    switch (_state)
    {
        case ViewState::Input: return handleInputKey(key);
        case ViewState::Loading: return {};
        case ViewState::Suggestion: return handleSuggestionKey(key);
        case ViewState::Edit: return handleEditKey(key);
        case ViewState::Confirmation: return handleConfirmationKey(key);
    }
    return {};
}

template <typename Mode>
auto BasicReviewMachine<Mode>::handle(PasteMsg const& message) -> std::vector<Command>
{
    if (_state == ViewState::Input)
        static_cast<void>(_input.processEvent(tui::PasteEvent { .text = message.text }));
    else if (_state == ViewState::Edit && _editor)
        static_cast<void>(_editor->handlePaste(message.text));
    return {};
}

template <typename Mode>
auto BasicReviewMachine<Mode>::handle(ResizeMsg const& message) -> std::vector<Command>
{
    _columns = message.columns;
    _rows = message.rows;
    return {};
}

template <typename Mode>
auto BasicReviewMachine<Mode>::handle(TickMsg const& message) -> std::vector<Command>
{
    if (message.generation != _generation || _state != ViewState::Loading)
        return {};
    _spinner.advance();
    return { tickCommand() };
}

template <typename Mode>
auto BasicReviewMachine<Mode>::handle(ChunkMsg& message) -> std::vector<Command>
{
    if (message.generation != _generation)
        return {};
    _transcript += message.text;
    return { readChunkCommand() };
}

template <typename Mode>
auto BasicReviewMachine<Mode>::handle(ChunksDoneMsg const& /*message*/) -> std::vector<Command>
{
    return {};
}

template <typename Mode>
template <typename S>
auto BasicReviewMachine<Mode>::handle(MatchDoneMsg<S>& message) -> std::vector<Command>
{
    if constexpr (!std::is_same_v<S, SuggestionType>)
        return {};
    else
    {
        if (message.generation != _generation || _state != ViewState::Loading)
            return {};

        if (!message.result)
        {
            log::warning("AI matching failed: {}", message.result.error().message);
            _errorMessage = message.result.error().message;
            _state = ViewState::Confirmation;
            return {};
        }

        log::debug("AI returned {} allocations", message.result->allocations.size());
        _reviewer.emplace(std::move(*message.result));
        _state = ViewState::Suggestion;
        return {};
    }
}

template <typename Mode>
auto BasicReviewMachine<Mode>::handle(SubmitDoneMsg& message) -> std::vector<Command>
{
    if (!_submitting)
        return {};
    _submitting = false;

    if (_submissionStop.stop_requested())
    {
        if (message.result)
            _result->entries = std::move(*message.result);
        log::info("Submission canceled with {} entries submitted", _result->entries.size());
        _finished = true;
        return {};
    }

    if (!message.result)
    {
        log::error("Submitting entries failed: {}", message.result.error().message);
        _errorMessage = message.result.error().message;
        return {};
    }

    _result = RunResult { .skipped = false, .entries = std::move(*message.result) };
    return {};
}

template <typename Mode>
auto BasicReviewMachine<Mode>::handleInputKey(tui::KeyEvent const& key) -> std::vector<Command>
{
    if (key.isCtrl('l'))
    {
        if (!_deps.lastInput.empty())
            _input.setText(_deps.lastInput);
        return {};
    }

    if (_input.processEvent(key) == tui::InputFieldAction::Submit && !_input.text().empty())
        return startMatching();
    return {};
}

template <typename Mode>
auto BasicReviewMachine<Mode>::handleSuggestionKey(tui::KeyEvent const& key) -> std::vector<Command>
{
    switch (_reviewer->handleKey(key))
    {
        case ReviewAction::Accept: return startSubmission();
        case ReviewAction::Edit:
            _editor.emplace(_reviewer->takeAllocations(), _projectIndex);
            _state = ViewState::Edit;
            return {};
        case ReviewAction::Retry:
            _reviewer.reset();
            _input.clear();
            _state = ViewState::Input;
            return {};
        case ReviewAction::Skip:
            _result = RunResult { .skipped = true };
            _finished = true;
            return {};
        case ReviewAction::None: return {};
    }
    return {};
}

template <typename Mode>
auto BasicReviewMachine<Mode>::handleEditKey(tui::KeyEvent const& key) -> std::vector<Command>
{
    if (key.is(tui::KeyCode::Escape) && !_editor->isEditing())
    {
        _reviewer->replaceAllocations(std::move(*_editor).takeAllocations());
        _editor.reset();
        _state = ViewState::Suggestion;
        return {};
    }

    static_cast<void>(_editor->handleKey(key));
    return {};
}

template <typename Mode>
auto BasicReviewMachine<Mode>::handleConfirmationKey(tui::KeyEvent const& /*key*/) -> std::vector<Command>
{
    if (!_submitting)
        _finished = true;
    return {};
}

template <typename Mode>
auto BasicReviewMachine<Mode>::startMatching() -> std::vector<Command>
{
    ++_generation;
    _state = ViewState::Loading;
    _submittedInput = std::string(_input.text());
    _transcript.clear();
    _errorMessage.clear();
    _spinner.reset();
    _loadingStarted = std::chrono::steady_clock::now();
    _channel = std::make_shared<ChunkChannel>();

    log::debug("Starting AI request (generation {})", _generation);
    return { matchCommand(), readChunkCommand(), tickCommand() };
}

template <typename Mode>
auto BasicReviewMachine<Mode>::startSubmission() -> std::vector<Command>
{
    auto allocations = _reviewer->allocations();
    _pendingCount = allocations.size();
    _submitting = true;
    _submissionStop = std::stop_source {};
    _state = ViewState::Confirmation;

    return { Command {
        .kind = CommandKind::Submit,
        .run = [mode = _mode,
                &pipeline = _deps.pipeline,
                allocations = std::move(allocations),
                rawInput = _submittedInput,
                userStop = _submissionStop.get_token()](std::stop_token stopToken) -> std::optional<Message> {
            // Either the runner shutting down or Ctrl+C stops the submission.
            auto linked = std::stop_source {};
            auto const onShutdown = std::stop_callback(stopToken, [&linked] { linked.request_stop(); });
            auto const onCancel = std::stop_callback(userStop, [&linked] { linked.request_stop(); });
            return Message { SubmitDoneMsg {
                .result = mode.submit(pipeline, allocations, rawInput, linked.get_token()) } };
        },
    } };
}

template <typename Mode>
void BasicReviewMachine<Mode>::cancel()
{
    log::debug("Review canceled in state {}", viewStateName(_state));
    _result = RunResult { .skipped = true };
    _finished = true;
    ++_generation;
}

template <typename Mode>
void BasicReviewMachine<Mode>::stopSubmission()
{
    if (_submissionStop.stop_requested())
        return;
    log::info("Stopping submission of {} entries", _pendingCount);
    _result = RunResult { .skipped = true };
    _submissionStop.request_stop();
}

template <typename Mode>
auto BasicReviewMachine<Mode>::matchCommand() const -> Command
{
    auto const options = _deps.streaming.value_or(StreamingOptions { .hardCeiling = _mode.hardCeiling() });

    return Command {
        .kind = CommandKind::Match,
        .run = [mode = _mode,
                &matcher = _deps.matcher,
                projects = _deps.projects,
                description = _submittedInput,
                channel = _channel,
                invoker = StreamingInvoker(options),
                generation = _generation](std::stop_token stopToken) -> std::optional<Message> {
            auto const call = MatchCall<SuggestionType> {
                [&](ai::ThinkingCallback const& onThinking, std::stop_token token) {
                    return mode.match(matcher, description, projects, onThinking, std::move(token));
                }
            };
            auto result = invoker.invoke(call, *channel, std::move(stopToken));
            return Message { MatchDoneMsg<SuggestionType> { .generation = generation, .result = std::move(result) } };
        },
    };
}

template <typename Mode>
auto BasicReviewMachine<Mode>::readChunkCommand() const -> Command
{
    return Command {
        .kind = CommandKind::ReadChunk,
        .run = [channel = _channel, generation = _generation](std::stop_token stopToken) -> std::optional<Message> {
            if (auto chunk = channel->receive(stopToken))
                return Message { ChunkMsg { .generation = generation, .text = std::move(*chunk) } };
            return Message { ChunksDoneMsg { .generation = generation } };
        },
    };
}

template <typename Mode>
auto BasicReviewMachine<Mode>::tickCommand() const -> Command
{
    return Command {
        .kind = CommandKind::Tick,
        .run = [interval = _deps.tickInterval, generation = _generation](
                   std::stop_token stopToken) -> std::optional<Message> {
            if (!sleepFor(interval, stopToken))
                return std::nullopt;
            return Message { TickMsg { .generation = generation } };
        },
    };
}

template <typename Mode>
auto BasicReviewMachine<Mode>::render(tui::Theme const& theme) const -> std::string
{
    switch (_state)
    {
        case ViewState::Input: return renderInput(theme);
        case ViewState::Loading: return renderLoading(theme);
        case ViewState::Suggestion: return _reviewer->render(theme);
        case ViewState::Edit: return _editor->render(theme);
        case ViewState::Confirmation: return renderConfirmation(theme);
    }
    return {};
}

template <typename Mode>
auto BasicReviewMachine<Mode>::renderInput(tui::Theme const& theme) const -> std::string
{
    auto help = std::string("Enter: submit • Ctrl+C: cancel");
    if (!_deps.lastInput.empty())
        help += " • Ctrl+L: load last description";

    auto out = tui::styled("clockr - Time Entry", theme.title);
    out += "\n\n";
    out += tui::styled(_mode.timeLabel(), theme.subtitle);
    out += "\n\n";
    out += _input.render({}, theme.placeholder, theme.cursor);
    out += "\n\n";
    out += tui::styled(help, theme.help);
    return out;
}

template <typename Mode>
auto BasicReviewMachine<Mode>::renderLoading(tui::Theme const& theme) const -> std::string
{
    auto const elapsed =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - _loadingStarted);

    auto out = _spinner.renderWithLabel(_mode.loadingLabel(), theme.spinner);
    out += "  ";
    out += tui::styled(formatElapsed(elapsed), theme.dim);

    if (_transcript.empty())
        return out;

    auto separator = std::string {};
    for (auto i = 0; i < std::max(_columns, 1); ++i)
        separator += "\u2500"; // ─

    out += "\n";
    out += tui::styled(separator, theme.dim);
    out += "\n";
    out += tui::styled(tail(_transcript, _rows - 3), theme.dim);
    return out;
}

template <typename Mode>
auto BasicReviewMachine<Mode>::renderConfirmation(tui::Theme const& theme) const -> std::string
{
    if (isStoppingSubmission())
        return _spinner.renderWithLabel("Canceling, waiting for the current entry...", theme.spinner);
    if (_submitting)
        return _spinner.renderWithLabel(std::format("Submitting {} entries...", _pendingCount), theme.spinner);

    auto out = std::string {};
    if (!_errorMessage.empty())
        out = tui::styled("Error: ", theme.error) + _errorMessage;
    else if (_result)
        out = _mode.renderSuccess(_result->entries, theme);
    else
        out = _mode.renderSuccess({}, theme);

    out += "\n\n";
    out += tui::styled("Press any key to exit", theme.help);
    return out;
}

template class BasicReviewMachine<SingleIntervalMode>;
template class BasicReviewMachine<BatchMode>;

} // namespace clockr::review
