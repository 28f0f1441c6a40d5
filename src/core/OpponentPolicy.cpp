//
// Created by Malik T on 07/10/2025.
//

#include "OpponentPolicy.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

#include "Court.hpp"
#include "Exception.hpp"

namespace tennis::core
{
    namespace
    {
        //                                 FS   SS   FHCC BHCC FHDL BHDL Drop Lob  Slc  App  Vol
        constexpr ShotWeights kAggressive{0.0, 0.0, 1.0, 1.0, 1.5, 1.5, 0.7, 0.8, 0.8, 1.1, 1.0};
        constexpr ShotWeights kCounter   {0.0, 0.0, 1.5, 1.5, 0.9, 0.9, 0.8, 1.3, 1.2, 0.5, 0.5};
        constexpr ShotWeights kNetRusher {0.0, 0.0, 1.0, 1.0, 1.0, 1.0, 0.9, 0.8, 1.0, 2.0, 2.0};
        constexpr ShotWeights kAllCourt  {0.0, 0.0, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0};
        constexpr ShotWeights kForehand  {0.0, 0.0, 1.8, 1.0, 1.8, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0};
        constexpr ShotWeights kBackhand  {0.0, 0.0, 1.0, 1.8, 1.0, 1.8, 1.0, 1.0, 1.2, 1.0, 1.0};

        constexpr double kMinSkill = 0.05;

        auto IsCrossCourt(ShotType const s) -> bool
        {
            return s == ShotType::ForehandCrossCourt || s == ShotType::BackhandCrossCourt;
        }

        auto IsDownTheLine(ShotType const s) -> bool
        {
            return s == ShotType::ForehandDownTheLine || s == ShotType::BackhandDownTheLine;
        }

        auto IsImpatient(PlayStyle const s) -> bool
        {
            return s == PlayStyle::AggressiveBaseliner || s == PlayStyle::ForehandDominant;
        }

        auto PressureMultiplier(PlayStyle const style, ShotType const shot, PolicyContext const& ctx) -> double
        {
            if (ctx.pressure == Pressure::None) return 1.0;
            double const k = static_cast<double>(std::to_underlying(ctx.pressure));

            if (ctx.holds_pressure_point)
            {
                if (!IsWinnerCapable(shot)) return 1.0;
                double const step = style == PlayStyle::AggressiveBaseliner || style == PlayStyle::NetRusher ? 0.2 : 0.1;
                return 1.0 + step * k;
            }

            // Facing the point: keep the ball in.
            if (IsCrossCourt(shot) || shot == ShotType::Slice) return 1.0 + 0.2 * k;
            if (IsWinnerCapable(shot)) return 1.0 / (1.0 + 0.1 * k);
            return 1.0;
        }
    }

    auto OpponentPolicy::StyleTable(PlayStyle const style) -> ShotWeights const&
    {
        switch (style)
        {
        case PlayStyle::AggressiveBaseliner: return kAggressive;
        case PlayStyle::CounterPuncher: return kCounter;
        case PlayStyle::NetRusher: return kNetRusher;
        case PlayStyle::AllCourt: return kAllCourt;
        case PlayStyle::ForehandDominant: return kForehand;
        case PlayStyle::BackhandDominant: return kBackhand;
        }
        return kAllCourt;
    }

    auto OpponentPolicy::Weights(PlayerState const& me, PolicyContext const& ctx) -> ShotWeights
    {
        PlayStyle const style = me.profile.style;
        ShotWeights w = StyleTable(style);

        for (ShotType const shot : AllShots)
        {
            double& weight = w[ShotIdx(shot)];
            if (IsServe(shot) || !court::IsLegal(me.zone, shot))
            {
                weight = 0.0;
                continue;
            }

            double const skill = std::max(me.profile.Skill(shot), kMinSkill) / 0.5;
            weight *= skill * skill;

            if (ctx.previous_shot && IsCrossCourt(*ctx.previous_shot) && IsDownTheLine(shot))
                weight *= 1.3;

            if (me.zone == CourtZone::Net)
                weight *= shot == ShotType::Volley ? 3.0 : 0.2;

            if (style == PlayStyle::NetRusher && me.zone == CourtZone::MidCourt &&
                (shot == ShotType::ApproachShot || shot == ShotType::Volley))
                weight *= 1.5;

            if (ctx.receiver_zone == CourtZone::Net)
            {
                if (shot == ShotType::Lob) weight *= style == PlayStyle::CounterPuncher ? 3.0 : 2.0;
                if (IsDownTheLine(shot)) weight *= 1.2;
            }

            if (ctx.rally_length > 6 && IsImpatient(style) && (IsDownTheLine(shot) || shot == ShotType::DropShot))
                weight *= 1.0 + static_cast<double>(ctx.rally_length - 6) * 0.1;

            weight *= PressureMultiplier(style, shot, ctx);
        }
        return w;
    }

    auto OpponentPolicy::ChooseShot(PlayerState const& me, PolicyContext const& ctx, Rng& rng) -> ShotType
    {
        ShotWeights const w = Weights(me, ctx);
        if (std::accumulate(w.begin(), w.end(), 0.0) <= 0.0)
            return ShotType::ForehandCrossCourt;

        ShotType const chosen = AllShots[pick(w, rng)];
        TNS_ASSERT(court::IsLegal(me.zone, chosen), "Policy picked a shot illegal from its zone");
        return chosen;
    }

    auto OpponentPolicy::ChooseServe(Phase const phase) -> ServeKind
    {
        return phase == Phase::SecondServe ? ServeKind::Second : ServeKind::First;
    }
}
