//
// Created by Malik T on 06/10/2025.
//

#include "Scoring.hpp"

#include <array>

namespace tennis::core::scoring
{
    namespace
    {
        auto Viol(error::RuleViolationCode code) -> error::RuleViolation
        {
            return error::RuleViolation{ .code = code };
        }

        auto TiebreakAllowed(MatchScore const& s, MatchFormat const& fmt) -> bool
        {
            return fmt.final_set_tiebreak || !IsDecidingSet(s, fmt);
        }

        auto CloseSet(MatchScore& s, PlayerId const w, MatchFormat const& fmt) -> RallyStatus
        {
            CompletedSet done{};
            done.games = s.games;
            done.tiebreak_played = s.tiebreak;
            if (s.tiebreak) done.tiebreak_points = s.points;
            s.completed_sets.push_back(done);

            if (s.tiebreak)
            {
                // Receiver of the first tiebreak point opens the next set.
                s.server = Other(s.tiebreak_first_server);
                s.tiebreak = false;
            }

            s.points = {};
            s.games = {};
            ++s.sets[Idx(w)];

            if (s.sets[Idx(w)] >= fmt.SetsToWin())
            {
                s.winner = w;
                return RallyStatus::MatchOver;
            }
            ++s.current_set;
            return RallyStatus::SetOver;
        }

        auto CloseGame(MatchScore& s, PlayerId const w, MatchFormat const& fmt) -> RallyStatus
        {
            s.points = {};
            ++s.games[Idx(w)];
            s.server = Other(s.server);

            int const gw = s.games[Idx(w)];
            int const gl = s.games[Idx(Other(w))];
            if (gw >= constants::GamesToWinSet && gw - gl >= 2)
                return CloseSet(s, w, fmt);

            if (gw == constants::TiebreakAtGames && gl == constants::TiebreakAtGames && TiebreakAllowed(s, fmt))
            {
                s.tiebreak = true;
                s.tiebreak_first_server = s.server;
            }
            return RallyStatus::GameOver;
        }
    }

    auto InitialScore(PlayerId const first_server) -> MatchScore
    {
        MatchScore s{};
        s.server = first_server;
        s.tiebreak_first_server = first_server;
        return s;
    }

    auto TiebreakServer(PlayerId const first_server, int const index) noexcept -> PlayerId
    {
        if (index <= 0) return first_server;
        return ((index - 1) / 2) % 2 == 0 ? Other(first_server) : first_server;
    }

    auto IsDecidingSet(MatchScore const& score, MatchFormat const& fmt) noexcept -> bool
    {
        int const last = fmt.SetsToWin() - 1;
        return score.sets[0] == last && score.sets[1] == last;
    }

    auto AwardPoint(MatchScore const& score, PlayerId const winner, MatchFormat const& fmt)
        -> error::Result<PointResult>
    {
        using RVC = error::RuleViolationCode;
        if (score.IsOver())
            return std::unexpected(Viol(RVC::Match_Finished).with_actor(winner));

        PointResult out{};
        out.point_winner = winner;
        out.score = score;
        MatchScore& s = out.score;

        std::size_t const w = Idx(winner);
        std::size_t const l = Idx(Other(winner));
        ++s.points[w];

        if (s.tiebreak)
        {
            if (s.points[w] >= constants::TiebreakPointsToWin && s.points[w] - s.points[l] >= 2)
            {
                ++s.games[w];
                out.level = CloseSet(s, winner, fmt);
                return out;
            }
            s.server = TiebreakServer(s.tiebreak_first_server, s.points[0] + s.points[1]);
            out.level = RallyStatus::PointOver;
            return out;
        }

        if (s.points[w] >= constants::PointsToWinGame && s.points[w] - s.points[l] >= 2)
        {
            out.level = CloseGame(s, winner, fmt);
            return out;
        }

        // Keep deuce games bounded: level is 40-40, a lead of one is advantage.
        if (s.points[w] >= 3 && s.points[l] >= 3)
        {
            if (s.points[w] == s.points[l]) s.points = {3, 3};
            else s.points[w] = s.points[l] + 1;
        }
        out.level = RallyStatus::PointOver;
        return out;
    }

    auto IsGamePoint(MatchScore const& score, PlayerId const p) noexcept -> bool
    {
        if (score.IsOver()) return false;
        int const mine = score.points[Idx(p)];
        int const theirs = score.points[Idx(Other(p))];
        if (score.tiebreak)
            return mine >= constants::TiebreakPointsToWin - 1 && mine > theirs;
        return mine >= constants::PointsToWinGame - 1 && mine > theirs;
    }

    auto IsBreakPoint(MatchScore const& score) noexcept -> bool
    {
        return !score.tiebreak && IsGamePoint(score, Other(score.server));
    }

    auto IsSetPoint(MatchScore const& score, PlayerId const p, MatchFormat const& fmt) -> bool
    {
        auto const r = AwardPoint(score, p, fmt);
        return r.has_value() && (r->level == RallyStatus::SetOver || r->level == RallyStatus::MatchOver);
    }

    auto IsMatchPoint(MatchScore const& score, PlayerId const p, MatchFormat const& fmt) -> bool
    {
        auto const r = AwardPoint(score, p, fmt);
        return r.has_value() && r->level == RallyStatus::MatchOver;
    }

    auto PointLabel(MatchScore const& score, PlayerId const p) -> std::string
    {
        int const mine = score.points[Idx(p)];
        int const theirs = score.points[Idx(Other(p))];
        if (score.tiebreak) return std::to_string(mine);

        static constexpr std::array<char const*, 4> names{"0", "15", "30", "40"};
        if (mine >= 3 && theirs >= 3)
        {
            if (mine > theirs) return "Ad";
            if (mine < theirs) return "";
            return "40";
        }
        return names[static_cast<std::size_t>(mine < 3 ? mine : 3)];
    }

    auto ScoreLine(MatchScore const& score) -> std::string
    {
        std::string line = "Sets " + std::to_string(score.sets[0]) + "-" + std::to_string(score.sets[1]) +
                           " | Games " + std::to_string(score.games[0]) + "-" + std::to_string(score.games[1]);
        if (score.tiebreak)
        {
            line += " | Tiebreak " + PointLabel(score, PlayerId::Human) + "-" + PointLabel(score, PlayerId::Opponent);
        }
        else if (score.IsDeuce())
        {
            line += " | Deuce";
        }
        else if (auto const adv = score.Advantage())
        {
            line += *adv == PlayerId::Human ? " | Ad-40" : " | 40-Ad";
        }
        else
        {
            line += " | " + PointLabel(score, PlayerId::Human) + "-" + PointLabel(score, PlayerId::Opponent);
        }
        return line;
    }
}
