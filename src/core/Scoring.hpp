//
// Created by Malik T on 06/10/2025.
//

#ifndef TENNISSIM_SCORING_HPP
#define TENNISSIM_SCORING_HPP

#include <cstdint>
#include <string>

#include "Actions.hpp"
#include "Exception.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace tennis::core::scoring
{
    struct MatchFormat
    {
        uint8_t best_of_sets{3};
        bool final_set_tiebreak{true};

        [[nodiscard]]
        constexpr auto SetsToWin() const noexcept -> int { return best_of_sets / 2 + 1; }
    };

    struct PointResult
    {
        MatchScore score{};
        // PointOver, GameOver, SetOver or MatchOver
        RallyStatus level{RallyStatus::PointOver};
        PlayerId point_winner{};
    };

    auto InitialScore(PlayerId first_server) -> MatchScore;

    // The scoring state machine: a pure function of the current score and the
    // point winner. Rejects a finished match with Match_Finished.
    auto AwardPoint(MatchScore const& score, PlayerId winner, MatchFormat const& fmt)
        -> error::Result<PointResult>;

    // Server of tiebreak point `index` (0-based): first, then 2 each, alternating.
    auto TiebreakServer(PlayerId first_server, int index) noexcept -> PlayerId;

    auto IsDecidingSet(MatchScore const& score, MatchFormat const& fmt) noexcept -> bool;

    // `p` wins the game (or the tiebreak) with the next point.
    auto IsGamePoint(MatchScore const& score, PlayerId p) noexcept -> bool;
    auto IsBreakPoint(MatchScore const& score) noexcept -> bool;
    auto IsSetPoint(MatchScore const& score, PlayerId p, MatchFormat const& fmt) -> bool;
    auto IsMatchPoint(MatchScore const& score, PlayerId p, MatchFormat const& fmt) -> bool;

    // "0", "15", "30", "40", "Ad", "" (trailing side at advantage) or tiebreak count.
    auto PointLabel(MatchScore const& score, PlayerId p) -> std::string;

    // e.g. "Sets 1-0 | Games 4-3 | Ad-40"
    auto ScoreLine(MatchScore const& score) -> std::string;
}

#endif //TENNISSIM_SCORING_HPP
