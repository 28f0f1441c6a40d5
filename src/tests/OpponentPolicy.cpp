#include <gtest/gtest.h>

#include <algorithm>

#include "../core/Court.hpp"
#include "../core/OpponentPolicy.hpp"
#include "../core/Profile.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

using namespace tennis::core;

namespace
{
    auto Flat(PlayStyle style, CourtZone zone, double skill = 0.5) -> PlayerState
    {
        PlayerState p{};
        for (ShotType const s : AllShots) p.profile.skills[s] = skill;
        p.profile.style = style;
        p.zone = zone;
        return p;
    }

    constexpr PlayStyle kStyles[]{
        PlayStyle::AggressiveBaseliner, PlayStyle::CounterPuncher, PlayStyle::NetRusher,
        PlayStyle::AllCourt, PlayStyle::ForehandDominant, PlayStyle::BackhandDominant
    };

    constexpr CourtZone kZones[]{
        CourtZone::Baseline, CourtZone::MidCourt, CourtZone::Net, CourtZone::WideLeft, CourtZone::WideRight
    };
}

TEST(OpponentPolicy, NeverPicksAnIllegalShot)
{
    Rng rng{2024};
    for (PlayStyle const style : kStyles)
    {
        for (CourtZone const zone : kZones)
        {
            PlayerState const me = Flat(style, zone);
            PolicyContext ctx{};
            ctx.previous_shot = ShotType::ForehandCrossCourt;
            for (int i = 0; i < 200; ++i)
            {
                ShotType const s = OpponentPolicy::ChooseShot(me, ctx, rng);
                ASSERT_TRUE(court::IsLegal(zone, s)) << "style " << int(style) << " zone " << int(zone);
            }
        }
    }
}

TEST(OpponentPolicy, IllegalAndServeWeightsAreZero)
{
    ShotWeights const w = OpponentPolicy::Weights(Flat(PlayStyle::AllCourt, CourtZone::Net), PolicyContext{});
    EXPECT_EQ(w[ShotIdx(ShotType::FirstServe)], 0.0);
    EXPECT_EQ(w[ShotIdx(ShotType::SecondServe)], 0.0);
    EXPECT_EQ(w[ShotIdx(ShotType::Lob)], 0.0);
    EXPECT_EQ(w[ShotIdx(ShotType::ApproachShot)], 0.0);
}

TEST(OpponentPolicy, VolleyDominatesAtTheNet)
{
    ShotWeights const w = OpponentPolicy::Weights(Flat(PlayStyle::AllCourt, CourtZone::Net), PolicyContext{});
    double const volley = w[ShotIdx(ShotType::Volley)];
    for (ShotType const s : AllShots)
    {
        if (s == ShotType::Volley) continue;
        EXPECT_GT(volley, w[ShotIdx(s)]) << int(s);
    }
}

TEST(OpponentPolicy, CounterPuncherLobsTheNetRusher)
{
    PlayerState const me = Flat(PlayStyle::CounterPuncher, CourtZone::Baseline);
    PolicyContext deep{};
    PolicyContext at_net{};
    at_net.receiver_zone = CourtZone::Net;

    double const lob_deep = OpponentPolicy::Weights(me, deep)[ShotIdx(ShotType::Lob)];
    double const lob_net = OpponentPolicy::Weights(me, at_net)[ShotIdx(ShotType::Lob)];
    EXPECT_NEAR(lob_net, 3.0 * lob_deep, 1e-12);
}

TEST(OpponentPolicy, WeakShotsArePickedLess)
{
    PlayerState me = Flat(PlayStyle::AllCourt, CourtZone::Baseline);
    me.profile.skills[ShotType::DropShot] = 0.1;
    ShotWeights const w = OpponentPolicy::Weights(me, PolicyContext{});
    EXPECT_LT(w[ShotIdx(ShotType::DropShot)], w[ShotIdx(ShotType::Slice)]);
}

TEST(OpponentPolicy, FacingBreakPointPlaysSafe)
{
    PlayerState const me = Flat(PlayStyle::AggressiveBaseliner, CourtZone::Baseline);
    PolicyContext calm{};
    PolicyContext facing{};
    facing.pressure = Pressure::BreakPoint;
    facing.holds_pressure_point = false;

    ShotWeights const a = OpponentPolicy::Weights(me, calm);
    ShotWeights const b = OpponentPolicy::Weights(me, facing);
    EXPECT_GT(b[ShotIdx(ShotType::ForehandCrossCourt)], a[ShotIdx(ShotType::ForehandCrossCourt)]);
    EXPECT_LT(b[ShotIdx(ShotType::ForehandDownTheLine)], a[ShotIdx(ShotType::ForehandDownTheLine)]);
}

TEST(OpponentPolicy, HoldingMatchPointGoesForIt)
{
    PlayerState const me = Flat(PlayStyle::NetRusher, CourtZone::MidCourt);
    PolicyContext calm{};
    PolicyContext holding{};
    holding.pressure = Pressure::MatchPoint;
    holding.holds_pressure_point = true;

    ShotWeights const a = OpponentPolicy::Weights(me, calm);
    ShotWeights const b = OpponentPolicy::Weights(me, holding);
    EXPECT_GT(b[ShotIdx(ShotType::Volley)], a[ShotIdx(ShotType::Volley)]);
    EXPECT_DOUBLE_EQ(b[ShotIdx(ShotType::Slice)], a[ShotIdx(ShotType::Slice)]);
}

TEST(OpponentPolicy, ServeFollowsPhase)
{
    EXPECT_EQ(OpponentPolicy::ChooseServe(Phase::FirstServe), ServeKind::First);
    EXPECT_EQ(OpponentPolicy::ChooseServe(Phase::SecondServe), ServeKind::Second);
}

TEST(OpponentPolicy, SameSeedSameChoices)
{
    PlayerState const me = Flat(PlayStyle::ForehandDominant, CourtZone::Baseline);
    Rng a{5};
    Rng b{5};
    for (int i = 0; i < 100; ++i)
    {
        EXPECT_EQ(OpponentPolicy::ChooseShot(me, PolicyContext{}, a),
                  OpponentPolicy::ChooseShot(me, PolicyContext{}, b));
    }
}
