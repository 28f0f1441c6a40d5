#include <gtest/gtest.h>

#include "../core/Scoring.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

using namespace tennis::core;
using namespace tennis::core::scoring;

namespace
{
    constexpr PlayerId H = PlayerId::Human;
    constexpr PlayerId O = PlayerId::Opponent;

    MatchFormat const kBestOf3{3, true};

    auto Point(MatchScore const& s, PlayerId w, MatchFormat const& fmt = kBestOf3) -> PointResult
    {
        auto r = AwardPoint(s, w, fmt);
        EXPECT_TRUE(r.has_value());
        return *r;
    }

    auto Points(MatchScore s, PlayerId w, int n, MatchFormat const& fmt = kBestOf3) -> PointResult
    {
        PointResult last{};
        for (int i = 0; i < n; ++i)
        {
            last = Point(s, w, fmt);
            s = last.score;
        }
        return last;
    }
}

TEST(Scoring, FirstPointIsFifteenLove)
{
    PointResult const r = Point(InitialScore(H), H);
    EXPECT_EQ(r.level, RallyStatus::PointOver);
    EXPECT_EQ(r.point_winner, H);
    EXPECT_EQ(PointLabel(r.score, H), "15");
    EXPECT_EQ(PointLabel(r.score, O), "0");
    EXPECT_EQ(ScoreLine(r.score), "Sets 0-0 | Games 0-0 | 15-0");
}

TEST(Scoring, LoveGameRotatesServer)
{
    PointResult const r = Points(InitialScore(H), H, 4);
    EXPECT_EQ(r.level, RallyStatus::GameOver);
    EXPECT_EQ(r.score.Games(H), 1);
    EXPECT_EQ(r.score.Points(H), 0);
    EXPECT_EQ(r.score.server, O);
}

TEST(Scoring, DeuceAndAdvantage)
{
    MatchScore s = InitialScore(H);
    s.points = {3, 3};
    EXPECT_TRUE(s.IsDeuce());

    PointResult r = Point(s, H);
    EXPECT_EQ(r.score.Advantage(), H);
    EXPECT_EQ(PointLabel(r.score, H), "Ad");
    EXPECT_EQ(ScoreLine(r.score), "Sets 0-0 | Games 0-0 | Ad-40");

    r = Point(r.score, O);
    EXPECT_TRUE(r.score.IsDeuce());
    EXPECT_EQ(r.score.points, (std::array<int, 2>{3, 3}));

    r = Point(r.score, O);
    EXPECT_EQ(r.score.Advantage(), O);
    r = Point(r.score, O);
    EXPECT_EQ(r.level, RallyStatus::GameOver);
    EXPECT_EQ(r.score.Games(O), 1);
}

TEST(Scoring, SetWonSixFour)
{
    MatchScore s = InitialScore(H);
    s.games = {5, 4};
    PointResult const r = Points(s, H, 4);
    EXPECT_EQ(r.level, RallyStatus::SetOver);
    EXPECT_EQ(r.score.Sets(H), 1);
    EXPECT_EQ(r.score.current_set, 1);
    EXPECT_EQ(r.score.games, (std::array<int, 2>{0, 0}));
    ASSERT_EQ(r.score.completed_sets.size(), 1u);
    EXPECT_EQ(r.score.completed_sets[0].games, (std::array<int, 2>{6, 4}));
    EXPECT_FALSE(r.score.completed_sets[0].tiebreak_played);
}

TEST(Scoring, FiveAllNeedsTwoGames)
{
    MatchScore s = InitialScore(H);
    s.games = {5, 5};
    PointResult r = Points(s, H, 4);
    EXPECT_EQ(r.level, RallyStatus::GameOver);
    EXPECT_EQ(r.score.games, (std::array<int, 2>{6, 5}));
    r = Points(r.score, H, 4);
    EXPECT_EQ(r.level, RallyStatus::SetOver);
    EXPECT_EQ(r.score.completed_sets.back().games, (std::array<int, 2>{7, 5}));
}

TEST(Scoring, TiebreakServePattern)
{
    MatchScore s = InitialScore(H);
    s.games = {6, 5};
    PointResult r = Points(s, O, 4);
    EXPECT_EQ(r.level, RallyStatus::GameOver);
    ASSERT_TRUE(r.score.IsTiebreak());
    // Human served the 12th game, so the opponent opens the tiebreak.
    EXPECT_EQ(r.score.tiebreak_first_server, O);
    EXPECT_EQ(r.score.server, O);

    PlayerId const expected[]{H, H, O, O, H, H, O};
    MatchScore cur = r.score;
    for (int i = 0; i < 7; ++i)
    {
        PointResult const p = Point(cur, i % 2 == 0 ? H : O);
        cur = p.score;
        EXPECT_EQ(cur.server, expected[i]) << "after tiebreak point " << i + 1;
    }
}

TEST(Scoring, TiebreakNeedsTwoPointLead)
{
    MatchScore s = InitialScore(H);
    s.games = {6, 6};
    s.tiebreak = true;
    s.tiebreak_first_server = O;
    s.points = {6, 6};

    PointResult r = Point(s, H);
    EXPECT_EQ(r.level, RallyStatus::PointOver);
    EXPECT_EQ(PointLabel(r.score, H), "7");

    r = Point(r.score, H);
    EXPECT_EQ(r.level, RallyStatus::SetOver);
    ASSERT_EQ(r.score.completed_sets.size(), 1u);
    CompletedSet const& cs = r.score.completed_sets[0];
    EXPECT_TRUE(cs.tiebreak_played);
    EXPECT_EQ(cs.games, (std::array<int, 2>{7, 6}));
    EXPECT_EQ(cs.tiebreak_points, (std::array<int, 2>{8, 6}));
    // Receiver of the first tiebreak point serves first in the next set.
    EXPECT_EQ(r.score.server, H);
    EXPECT_FALSE(r.score.IsTiebreak());
}

TEST(Scoring, TiebreakServers)
{
    EXPECT_EQ(TiebreakServer(H, 0), H);
    EXPECT_EQ(TiebreakServer(H, 1), O);
    EXPECT_EQ(TiebreakServer(H, 2), O);
    EXPECT_EQ(TiebreakServer(H, 3), H);
    EXPECT_EQ(TiebreakServer(H, 4), H);
    EXPECT_EQ(TiebreakServer(H, 5), O);
}

TEST(Scoring, BestOfThreeEndsAtTwoSets)
{
    MatchScore s = InitialScore(H);
    s.sets = {1, 0};
    s.current_set = 1;
    s.completed_sets.push_back(CompletedSet{{6, 3}, false, {}});
    s.games = {5, 0};

    PointResult const r = Points(s, H, 4);
    EXPECT_EQ(r.level, RallyStatus::MatchOver);
    EXPECT_EQ(r.score.winner, H);
    EXPECT_EQ(r.score.current_set, 1);

    auto const again = AwardPoint(r.score, O, kBestOf3);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error::RuleViolationCode::Match_Finished);
}

TEST(Scoring, BestOfFiveNeedsThreeSets)
{
    MatchFormat const bo5{5, true};
    MatchScore s = InitialScore(H);
    s.sets = {1, 0};
    s.current_set = 1;
    s.completed_sets.push_back(CompletedSet{{6, 3}, false, {}});
    s.games = {5, 0};

    PointResult const r = Points(s, H, 4, bo5);
    EXPECT_EQ(r.level, RallyStatus::SetOver);
    EXPECT_FALSE(r.score.IsOver());
    EXPECT_EQ(r.score.Sets(H), 2);
}

TEST(Scoring, AdvantageFinalSet)
{
    MatchFormat const adv{3, false};
    MatchScore s = InitialScore(H);
    s.sets = {1, 1};
    s.current_set = 2;
    s.completed_sets = {CompletedSet{{6, 3}, false, {}}, CompletedSet{{4, 6}, false, {}}};
    s.games = {6, 5};
    ASSERT_TRUE(IsDecidingSet(s, adv));

    PointResult r = Points(s, O, 4, adv);
    EXPECT_EQ(r.level, RallyStatus::GameOver);
    EXPECT_FALSE(r.score.IsTiebreak());
    EXPECT_EQ(r.score.games, (std::array<int, 2>{6, 6}));

    r = Points(r.score, H, 4, adv);
    EXPECT_EQ(r.level, RallyStatus::GameOver);
    EXPECT_EQ(r.score.games, (std::array<int, 2>{7, 6}));

    r = Points(r.score, H, 4, adv);
    EXPECT_EQ(r.level, RallyStatus::MatchOver);
    EXPECT_EQ(r.score.completed_sets.back().games, (std::array<int, 2>{8, 6}));
}

TEST(Scoring, DecidingSetTiebreakWhenEnabled)
{
    MatchScore s = InitialScore(H);
    s.sets = {1, 1};
    s.current_set = 2;
    s.games = {6, 5};

    PointResult const r = Points(s, O, 4);
    EXPECT_TRUE(r.score.IsTiebreak());
}

TEST(Scoring, PressurePoints)
{
    MatchScore s = InitialScore(H);
    s.points = {0, 3};
    EXPECT_TRUE(IsBreakPoint(s));
    EXPECT_TRUE(IsGamePoint(s, O));
    EXPECT_FALSE(IsSetPoint(s, O, kBestOf3));

    s.games = {4, 5};
    EXPECT_TRUE(IsSetPoint(s, O, kBestOf3));
    EXPECT_FALSE(IsMatchPoint(s, O, kBestOf3));

    s.sets = {0, 1};
    s.current_set = 1;
    EXPECT_TRUE(IsMatchPoint(s, O, kBestOf3));
    EXPECT_FALSE(IsMatchPoint(s, H, kBestOf3));

    s.points = {3, 0};
    EXPECT_FALSE(IsBreakPoint(s));
    EXPECT_TRUE(IsGamePoint(s, H));
}
