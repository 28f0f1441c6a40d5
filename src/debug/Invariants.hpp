//
// Created by Malik T on 10/10/2025.
//

#ifndef TENNISSIM_INVARIANTS_HPP
#define TENNISSIM_INVARIANTS_HPP

#include "../core/Match.hpp"
#include "../core/Exception.hpp"
#include "Inspector.hpp"
#include <algorithm>

namespace tennis::core::debug
{
    // Every completed set must be a score a real set can end on.
    inline auto CheckCompletedSet(CompletedSet const& cs) -> void
    {
        int const hi = std::max(cs.games[0], cs.games[1]);
        int const lo = std::min(cs.games[0], cs.games[1]);
        TNS_ASSERT(hi >= constants::GamesToWinSet, "Set closed before six games");
        if (cs.tiebreak_played)
        {
            TNS_ASSERT(hi == 7 && lo == 6, "Tiebreak set not closed 7-6");
            int const thi = std::max(cs.tiebreak_points[0], cs.tiebreak_points[1]);
            int const tlo = std::min(cs.tiebreak_points[0], cs.tiebreak_points[1]);
            TNS_ASSERT((thi > constants::TiebreakPointsToWin && thi - tlo == 2) ||
                       (thi == constants::TiebreakPointsToWin && tlo <= 5), "Tiebreak closed on an illegal count");
        }
        else
        {
            TNS_ASSERT(hi - lo >= 2, "Set closed without a two game lead");
            TNS_ASSERT(hi == constants::GamesToWinSet || hi - lo == 2, "Set ran past its closing game");
        }
    }

    // Whole-model checks used by the self-play tests. Throws AssertionError.
    inline auto CheckInvariants(Match const& m) -> void
    {
#if TNS_ENABLE_TEST_HOOKS == false
        (void)m;
#else
        Inspector::SnapshotAll const s = Inspector::Gather(m);
        MatchScore const& sc = s.score;
        int const to_win = s.format.SetsToWin();

        // 1) Exactly one rally while a point is played, none between points
        switch (s.phase)
        {
        case Phase::FirstServe:
            TNS_ASSERT(!s.rally.has_value(), "Rally left over between points");
            break;
        case Phase::SecondServe:
            TNS_ASSERT(s.rally.has_value() && s.rally->Length() == 1, "Second serve without a single fault on record");
            TNS_ASSERT(s.rally->shots.front().outcome == ShotOutcome::Fault, "Second serve not preceded by a fault");
            break;
        case Phase::Rally:
            TNS_ASSERT(s.rally.has_value() && s.rally->Length() >= 1, "Rally phase without rally");
            break;
        case Phase::Finished:
            TNS_ASSERT(!s.rally.has_value(), "Finished match still holds a rally");
            TNS_ASSERT(sc.IsOver(), "Finished phase without a winner");
            break;
        }
        TNS_ASSERT(!s.has_pending_point, "Decided point not fed to the score");

        // 2) Point counters
        int const phi = std::max(sc.points[0], sc.points[1]);
        int const plo = std::min(sc.points[0], sc.points[1]);
        TNS_ASSERT(plo >= 0, "Negative point count");
        if (sc.tiebreak)
        {
            TNS_ASSERT(sc.games[0] == 6 && sc.games[1] == 6, "Tiebreak outside 6-6");
            TNS_ASSERT(!(phi >= constants::TiebreakPointsToWin && phi - plo >= 2), "Decided tiebreak still open");
        }
        else
        {
            TNS_ASSERT(phi <= 4, "Point counter past advantage");
            TNS_ASSERT(phi < 4 || plo == 3, "Game should have closed");
        }

        // 3) Game counters
        int const ghi = std::max(sc.games[0], sc.games[1]);
        int const glo = std::min(sc.games[0], sc.games[1]);
        TNS_ASSERT(!(ghi >= constants::GamesToWinSet && ghi - glo >= 2), "Set should have closed");
        bool const advantage_set = !s.format.final_set_tiebreak && scoring::IsDecidingSet(sc, s.format);
        if (!advantage_set)
            TNS_ASSERT(ghi <= constants::TiebreakAtGames, "Games past six in a tiebreak set");

        // 4) Sets
        for (CompletedSet const& cs : sc.completed_sets) CheckCompletedSet(cs);
        TNS_ASSERT(static_cast<int>(sc.completed_sets.size()) == sc.sets[0] + sc.sets[1], "Completed sets out of sync");
        if (sc.winner)
        {
            TNS_ASSERT(sc.sets[Idx(*sc.winner)] == to_win, "Winner without the sets to win");
            TNS_ASSERT(sc.sets[Idx(Other(*sc.winner))] < to_win, "Both players reached the sets to win");
        }
        else
        {
            TNS_ASSERT(sc.sets[0] < to_win && sc.sets[1] < to_win, "Match over without a winner");
            TNS_ASSERT(sc.current_set == sc.sets[0] + sc.sets[1], "current_set out of sync");
        }

        // 5) Stamina bounds
        for (PlayerState const& p : s.players)
        {
            TNS_ASSERT(p.stamina >= s.stamina_floor && p.stamina <= 1.0, "Stamina outside [floor, 1]");
        }

        // 6) Statistics agree with the score
        int const points_won = s.stats.players[0].points_won + s.stats.players[1].points_won;
        TNS_ASSERT(points_won == s.stats.points_played, "Points won out of sync with points played");

#endif // TNS_ENABLE_TEST_HOOKS == true
    }
}
#endif //TENNISSIM_INVARIANTS_HPP
