#pragma once

#include "../matching/Matcher.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace sweep
{

struct ScanStats
{
    std::size_t positions_visited = 0;
    std::size_t matches_emitted = 0;
    std::size_t sessions_discarded = 0; // active sessions still open when the input ran out
    bool stopped_early = false;         // every matcher retired before the end of the input
};

/**
 * @brief Single forward pass of a set of matchers over one input
 *
 * Holds the working state of one scan: active sessions, partial sessions and
 * idle matchers. Each position of the input is visited once; all matchers
 * advance together. Handlers run synchronously from inside Run(); an
 * exception thrown by a handler leaves Run() and abandons the open sessions.
 *
 * The engine borrows both the input and the matchers. They must outlive it.
 */
class ScanEngine
{
public:
    ScanEngine(std::string_view input, const std::vector<Matcher>& matchers);

    ScanEngine(const ScanEngine&) = delete;
    ScanEngine& operator=(const ScanEngine&) = delete;

    /**
     * @brief Scan the whole input, invoking matcher handlers in discovery order
     * @return Counters describing the pass
     */
    ScanStats Run();

private:
    enum class MatcherState : std::uint8_t
    {
        Idle,
        Engaged,
        Retired
    };

    // Identifier `identifier` of matcher `matcher` completed; content starts
    // at content_begin.
    struct ActiveSession
    {
        MatcherId matcher;
        std::size_t identifier;
        std::size_t content_begin;
    };

    // Identifier `identifier` of matcher `matcher` matched input[begin, position)
    // so far.
    struct PartialSession
    {
        MatcherId matcher;
        std::size_t identifier;
        std::size_t begin;
    };

    struct Closing
    {
        ActiveSession session{};
        std::size_t terminator = 0;
        bool pending = false;
    };

    void Reset();

    void AdvanceActiveSessions(std::size_t position, std::size_t first_session);
    void AdvancePartialSessions(std::size_t position);
    void AdvanceIdleMatchers(std::size_t position);

    std::optional<std::size_t> FindTerminator(const ActiveSession& session, std::size_t position) const;
    bool HasContent(const ActiveSession& session, std::size_t terminator, std::size_t position) const;
    void Emit(const ActiveSession& session, std::size_t terminator, std::size_t position);
    void ReleaseMatcher(MatcherId id, bool terminated);
    bool HasSessions(MatcherId id) const;
    bool Finished() const noexcept;

    std::string_view input_;
    const std::vector<Matcher>& matchers_;

    std::vector<MatcherState> states_;
    std::vector<ActiveSession> active_;
    std::vector<PartialSession> partial_;
    std::vector<MatcherId> idle_; // kept in registration order
    std::vector<Closing> closing_;
    std::vector<MatcherId> dropped_;

    ScanStats stats_;
};

/**
 * @brief Scan `input` once with every matcher in `matchers`
 *
 * Handlers are called with each non-empty substring found between one of
 * their matcher's identifiers and one of its terminators, left to right.
 * When several matchers match at the same position they are called in list
 * order. Finding nothing is not an error.
 */
void Scan(std::string_view input, const std::vector<Matcher>& matchers);

} // namespace sweep
