#include "ScanEngine.hpp"

#include "../util/Diagnostics.hpp"
#include "../util/Profile.hpp"

#include <algorithm>

#include <plog/Log.h>

namespace sweep
{

ScanEngine::ScanEngine(std::string_view input, const std::vector<Matcher>& matchers)
    : input_(input)
    , matchers_(matchers)
{
}

void ScanEngine::Reset()
{
    states_.assign(matchers_.size(), MatcherState::Idle);
    active_.clear();
    partial_.clear();
    dropped_.clear();
    closing_.assign(matchers_.size(), Closing{});

    idle_.clear();
    idle_.reserve(matchers_.size());
    for (MatcherId id = 0; id < matchers_.size(); ++id)
        idle_.push_back(id);

    stats_ = ScanStats{};
}

ScanStats ScanEngine::Run()
{
    PROFILE_SCOPE_FUNCTION();
    Reset();

    for (std::size_t position = 0; position < input_.size(); ++position)
    {
        if (Finished())
        {
            stats_.stopped_early = true;
            break;
        }

        ++stats_.positions_visited;
        AdvanceActiveSessions(position, 0);
        AdvancePartialSessions(position);
        AdvanceIdleMatchers(position);
    }

    stats_.sessions_discarded = active_.size();

    PLOG_DEBUG_(Diagnostics::kLogInstance) << "Scan of " << input_.size() << " bytes with " << matchers_.size()
                                           << " matcher(s): " << stats_.matches_emitted << " match(es), "
                                           << stats_.positions_visited << " position(s) visited"
                                           << (stats_.stopped_early ? ", stopped early" : "")
                                           << (stats_.sessions_discarded ? ", unterminated sessions discarded" : "");
    return stats_;
}

void ScanEngine::AdvanceActiveSessions(std::size_t position, std::size_t first_session)
{
    bool any_closing = false;
    for (std::size_t index = first_session; index < active_.size(); ++index)
    {
        const ActiveSession& session = active_[index];

        // Opened at this position by a one-character identifier.
        if (session.content_begin > position)
            continue;

        auto terminator = FindTerminator(session, position);
        if (!terminator)
            continue;

        // Sessions are stored in opening order, so a later hit for the same
        // matcher replaces an earlier one, unless it would trade content for
        // an empty match.
        Closing& closing = closing_[session.matcher];
        const bool has_content = HasContent(session, *terminator, position);
        if (!closing.pending || has_content || !HasContent(closing.session, closing.terminator, position))
            closing = Closing{ session, *terminator, true };
        any_closing = true;
    }

    if (!any_closing)
        return;

    for (MatcherId id = 0; id < closing_.size(); ++id)
    {
        if (closing_[id].pending)
            Emit(closing_[id].session, closing_[id].terminator, position);
    }

    auto closed = [this](MatcherId id)
    {
        return closing_[id].pending;
    };
    std::erase_if(active_, [&](const ActiveSession& session) { return closed(session.matcher); });
    std::erase_if(partial_, [&](const PartialSession& session) { return closed(session.matcher); });

    for (MatcherId id = 0; id < closing_.size(); ++id)
    {
        if (!closing_[id].pending)
            continue;

        closing_[id].pending = false;
        ReleaseMatcher(id, true);
    }
}

void ScanEngine::AdvancePartialSessions(std::size_t position)
{
    if (partial_.empty())
        return;

    const char ch = input_[position];
    std::size_t kept = 0;
    for (std::size_t index = 0; index < partial_.size(); ++index)
    {
        const PartialSession candidate = partial_[index];
        const std::string& text = matchers_[candidate.matcher].identifiers[candidate.identifier].Text();
        const std::size_t offset = position - candidate.begin;

        if (offset < text.size() && text[offset] == ch)
        {
            if (offset + 1 == text.size())
                active_.push_back(ActiveSession{ candidate.matcher, candidate.identifier, position + 1 });
            else
                partial_[kept++] = candidate;
            continue;
        }

        dropped_.push_back(candidate.matcher);
    }
    partial_.resize(kept);

    // A matcher whose last candidate was contradicted starts over at this
    // position.
    for (MatcherId id : dropped_)
    {
        if (states_[id] == MatcherState::Engaged && !HasSessions(id))
            ReleaseMatcher(id, false);
    }
    dropped_.clear();
}

void ScanEngine::AdvanceIdleMatchers(std::size_t position)
{
    if (idle_.empty())
        return;

    const char ch = input_[position];
    const std::size_t first_new_session = active_.size();
    bool opened_zero_width = false;

    std::size_t kept = 0;
    for (std::size_t index = 0; index < idle_.size(); ++index)
    {
        const MatcherId id = idle_[index];
        const auto& identifiers = matchers_[id].identifiers;
        bool engaged = false;

        for (std::size_t k = 0; k < identifiers.size(); ++k)
        {
            const Identifier& identifier = identifiers[k];
            if (identifier.IsPrefix() && position != 0)
                continue;

            if (identifier.IsZeroWidth())
            {
                active_.push_back(ActiveSession{ id, k, position });
                opened_zero_width = true;
                engaged = true;
                continue;
            }

            if (identifier.Text().empty() || identifier.Text().front() != ch)
                continue;

            if (identifier.Size() == 1)
                active_.push_back(ActiveSession{ id, k, position + 1 });
            else
                partial_.push_back(PartialSession{ id, k, position });
            engaged = true;
        }

        if (engaged)
            states_[id] = MatcherState::Engaged;
        else
            idle_[kept++] = id;
    }
    idle_.resize(kept);

    // Zero-width sessions already cover input[position].
    if (opened_zero_width)
        AdvanceActiveSessions(position, first_new_session);
}

std::optional<std::size_t> ScanEngine::FindTerminator(const ActiveSession& session, std::size_t position) const
{
    const auto& terminators = matchers_[session.matcher].terminators;
    const std::string_view span = input_.substr(session.content_begin, position + 1 - session.content_begin);
    const bool at_end = position + 1 == input_.size();

    for (std::size_t index = 0; index < terminators.size(); ++index)
    {
        const Terminator& terminator = terminators[index];
        if (!terminator.CanMatch())
            continue;
        if (terminator.IsSuffix() && !at_end)
            continue;
        if (span.ends_with(terminator.Text()))
            return index;
    }

    return std::nullopt;
}

void ScanEngine::Emit(const ActiveSession& session, std::size_t terminator, std::size_t position)
{
    if (!HasContent(session, terminator, position))
        return;

    const Matcher& matcher = matchers_[session.matcher];
    const Identifier& identifier = matcher.identifiers[session.identifier];
    const Terminator& closer = matcher.terminators[terminator];
    const std::size_t end = position + 1;
    const std::size_t content_end = end - closer.Size();

    MatchRange range;
    range.begin = session.content_begin - identifier.Size();
    range.end = end;
    range.content_begin = session.content_begin;
    range.content_end = content_end;

    const std::string_view content = input_.substr(range.content_begin, range.content_end - range.content_begin);
    ++stats_.matches_emitted;

    if (Diagnostics::IsVerbose())
    {
        PLOG_VERBOSE_(Diagnostics::kLogInstance) << "Matcher #" << session.matcher << " matched \""
                                                 << Diagnostics::Preview(content) << "\" at [" << range.begin << ", "
                                                 << range.end << ") between " << Diagnostics::Describe(identifier)
                                                 << " and " << Diagnostics::Describe(closer);
    }

    if (matcher.handler)
        matcher.handler(content, range);
}

bool ScanEngine::HasContent(const ActiveSession& session, std::size_t terminator, std::size_t position) const
{
    const std::size_t terminator_size = matchers_[session.matcher].terminators[terminator].Size();
    return position + 1 - terminator_size > session.content_begin;
}

// A terminated single-shot matcher retires whether or not its content was
// empty; a matcher whose candidates were all contradicted is idle again.
void ScanEngine::ReleaseMatcher(MatcherId id, bool terminated)
{
    if (terminated && !matchers_[id].allow_multiple_matches)
    {
        states_[id] = MatcherState::Retired;
        return;
    }

    states_[id] = MatcherState::Idle;
    idle_.insert(std::upper_bound(idle_.begin(), idle_.end(), id), id);
}

bool ScanEngine::HasSessions(MatcherId id) const
{
    auto owned = [id](const auto& session)
    {
        return session.matcher == id;
    };
    return std::any_of(active_.begin(), active_.end(), owned) || std::any_of(partial_.begin(), partial_.end(), owned);
}

bool ScanEngine::Finished() const noexcept
{
    return active_.empty() && partial_.empty() && idle_.empty();
}

void Scan(std::string_view input, const std::vector<Matcher>& matchers)
{
    ScanEngine(input, matchers).Run();
}

} // namespace sweep
