#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <vector>

#include "../core/Match.hpp"
#include "../core/Profile.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/MatchLogger.hpp"

using namespace tennis::core;

namespace
{
    // Human side: uniform over whatever is legal right now.
    auto HumanTurn(Match& m, Rng& rng) -> error::Result<RallyUpdate>
    {
        if (m.PhaseNow() == Phase::Rally)
        {
            std::vector<ShotType> const legal = m.LegalActionsFor(PlayerId::Human);
            std::uniform_int_distribution<std::size_t> pick{0, legal.size() - 1};
            return m.PlayShot(legal[pick(rng)]);
        }
        return m.ServeChoice(m.PhaseNow() == Phase::FirstServe ? ServeKind::First : ServeKind::Second);
    }

    auto PlayOut(Config const& cfg, std::string const& log_path) -> MatchHandle
    {
        Rng roll{cfg.seed + 1};
        MatchHandle m = StartMatch(DefaultHumanProfile(), RandomOpponentProfile(roll), cfg);
        debug::MatchLogger log(log_path);
        EXPECT_TRUE(log.is_open());
        log.start(*m);

        Rng human_rng{cfg.seed + 2};
        std::size_t calls = 0;
        while (m->PhaseNow() != Phase::Finished)
        {
            error::Result<RallyUpdate> const r = m->Actor() == PlayerId::Opponent
                ? m->ContinueRally()
                : HumanTurn(*m, human_rng);
            if (!r.has_value())
            {
                log.violation(r.error());
                ADD_FAILURE() << "Legal self-play call rejected: " << error::describe(r.error());
                break;
            }
            log.update(*r);
            debug::CheckInvariants(*m);

            if (++calls > 500000)
            {
                ADD_FAILURE() << "Match did not finish";
                break;
            }
        }
        log.end(*m);
        log.flush();
        return m;
    }
}

TEST(SelfPlay, BestOfThree_Transcripts_And_End)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    try
    {
        for (std::uint64_t seed : {111ull, 222ull, 333ull})
        {
            Config cfg{};
            cfg.seed = seed;
            cfg.first_server = std::nullopt;
            MatchHandle m = PlayOut(cfg, "_artifacts/match_bo3_" + std::to_string(seed) + ".log");

            MatchScore const& s = m->Score();
            ASSERT_TRUE(s.IsOver());
            EXPECT_EQ(s.Sets(*s.winner), 2);
            EXPECT_GE(s.completed_sets.size(), 2u);
            EXPECT_LE(s.completed_sets.size(), 3u);
            EXPECT_TRUE(m->LegalActionsFor(PlayerId::Human).empty());
            EXPECT_FALSE(m->ContinueRally().has_value());

            std::ifstream in("_artifacts/match_bo3_" + std::to_string(seed) + ".log");
            std::string const transcript{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
            EXPECT_NE(transcript.find("Shot "), std::string::npos);
            EXPECT_NE(transcript.find(" (Fresh)/"), std::string::npos);
            EXPECT_NE(transcript.find("Winner="), std::string::npos);
        }
    }
    catch (error::AssertionError const& e)
    {
        FAIL() << "Invariant broken: " << e.what() << "\n" << e.to_str();
    }
}

TEST(SelfPlay, BestOfFive_Transcripts_And_End)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    try
    {
        for (std::uint64_t seed : {444ull, 555ull})
        {
            Config cfg{};
            cfg.seed = seed;
            cfg.best_of_sets = 5;
            cfg.first_server = PlayerId::Opponent;
            MatchHandle m = PlayOut(cfg, "_artifacts/match_bo5_" + std::to_string(seed) + ".log");

            MatchScore const& s = m->Score();
            ASSERT_TRUE(s.IsOver());
            EXPECT_EQ(s.Sets(*s.winner), 3);
            EXPECT_GE(s.completed_sets.size(), 3u);
            EXPECT_LE(s.completed_sets.size(), 5u);
        }
    }
    catch (error::AssertionError const& e)
    {
        FAIL() << "Invariant broken: " << e.what() << "\n" << e.to_str();
    }
}

TEST(SelfPlay, AdvantageFinalSet_Ends)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    try
    {
        Config cfg{};
        cfg.seed = 666;
        cfg.final_set_tiebreak = false;
        MatchHandle m = PlayOut(cfg, "_artifacts/match_adv_666.log");

        MatchScore const& s = m->Score();
        ASSERT_TRUE(s.IsOver());
        if (s.completed_sets.size() == 3)
        {
            EXPECT_FALSE(s.completed_sets.back().tiebreak_played);
        }
        EXPECT_EQ(m->Stats().players[0].points_won + m->Stats().players[1].points_won, m->Stats().points_played);
    }
    catch (error::AssertionError const& e)
    {
        FAIL() << "Invariant broken: " << e.what() << "\n" << e.to_str();
    }
}

TEST(SelfPlay, SeparateMatchesDoNotInterfere)
{
    Config cfg{};
    cfg.seed = 42;

    MatchHandle a = StartMatch(DefaultHumanProfile(), DefaultHumanProfile(), cfg);
    MatchHandle b = StartMatch(DefaultHumanProfile(), DefaultHumanProfile(), cfg);

    // Drive only `a`; `b` must still be at its first serve.
    ASSERT_TRUE(a->ServeChoice(ServeKind::First).has_value());
    EXPECT_EQ(b->PhaseNow(), Phase::FirstServe);
    EXPECT_EQ(b->Stats().players[0].first_serves_attempted, 0);

    // Same seed, same first call: same outcome.
    auto const rb = b->ServeChoice(ServeKind::First);
    ASSERT_TRUE(rb.has_value());
    EXPECT_EQ(a->Snapshot().rally.has_value(), b->Snapshot().rally.has_value());
    EXPECT_EQ(a->Score().points, b->Score().points);
}
