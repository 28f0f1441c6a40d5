//
// Created by Malik T on 05/10/2025.
//

#include "ShotResolver.hpp"

#include <algorithm>
#include <random>

#include "Court.hpp"

namespace tennis::core
{
    static auto IsCrossCourt(ShotType const s) -> bool
    {
        return s == ShotType::ForehandCrossCourt || s == ShotType::BackhandCrossCourt;
    }

    static auto IsDownTheLine(ShotType const s) -> bool
    {
        return s == ShotType::ForehandDownTheLine || s == ShotType::BackhandDownTheLine;
    }

    static auto Draw(Rng& rng) -> double
    {
        return std::uniform_real_distribution<double>{0.0, 1.0}(rng);
    }

    auto ShotResolver::Clamp(double const p) const -> double
    {
        return std::clamp(p, t_.min_floor, t_.max_ceiling);
    }

    auto ShotResolver::BaseSkill(PlayerState const& hitter, ShotType const shot) const -> double
    {
        return t_.skill_base + t_.skill_weight * hitter.profile.Skill(shot);
    }

    auto ShotResolver::StrengthBonus(PlayerState const& hitter, ShotType const shot) const -> double
    {
        return hitter.profile.IsStrength(shot) ? t_.strength_bonus : 1.0;
    }

    auto ShotResolver::PositionalFitness(CourtZone const hitter_zone, CourtZone const receiver_zone,
                                         ShotType const shot) const -> double
    {
        if (IsServe(shot)) return 1.0;

        double f = 1.0;
        if (court::IsWide(hitter_zone))
            f *= t_.off_center_factor;
        if (hitter_zone == CourtZone::Net && IsCrossCourt(shot))
            f *= t_.groundstroke_from_net_factor;
        if (shot == ShotType::Volley && hitter_zone == CourtZone::MidCourt)
            f *= t_.volley_from_midcourt_factor;

        if (shot == ShotType::DropShot)
        {
            if (court::IsBackCourt(receiver_zone)) f *= t_.drop_vs_deep_factor;
            else if (receiver_zone == CourtZone::Net) f *= t_.drop_vs_net_factor;
        }
        if (shot == ShotType::Lob && receiver_zone == CourtZone::Net)
            f *= t_.lob_vs_net_factor;
        if (IsDownTheLine(shot) && receiver_zone == CourtZone::Net)
            f *= t_.passing_shot_factor;
        return f;
    }

    auto ShotResolver::RiskProfile(ShotType const shot) const -> double
    {
        return t_.risk_profile[ShotIdx(shot)];
    }

    auto ShotResolver::ContextFactor(std::optional<ShotType> const previous, ShotType const shot) const -> double
    {
        if (!previous) return 1.0;
        if (*previous == ShotType::DropShot && shot == ShotType::Lob) return t_.lob_after_drop_factor;
        if (*previous == ShotType::Lob && shot == ShotType::Volley) return t_.volley_after_lob_factor;
        return 1.0;
    }

    auto ShotResolver::Probability(PlayerState const& hitter, ShotType const shot, ShotContext const& ctx) const
        -> double
    {
        double const p = BaseSkill(hitter, shot)
                       * StrengthBonus(hitter, shot)
                       * fatigue_.Factor(hitter.stamina)
                       * PositionalFitness(ctx.hitter_zone, ctx.receiver_zone, shot)
                       * RiskProfile(shot)
                       * ContextFactor(ctx.previous_shot, shot);
        return Clamp(p);
    }

    auto ShotResolver::Resolve(PlayerState const& hitter, ShotType const shot, ShotContext const& ctx,
                               Rng& rng) const -> ShotResolution
    {
        ShotResolution res{};
        res.probability = Probability(hitter, shot, ctx);
        res.roll = Draw(rng);

        if (res.roll >= res.probability)
        {
            res.outcome = ctx.under_pressure ? ShotOutcome::ForcedError : ShotOutcome::UnforcedError;
            return res;
        }

        double const share = IsWinnerCapable(shot) ? t_.winner_share[ShotIdx(shot)] : 0.0;
        res.outcome = (res.roll >= res.probability * (1.0 - share)) ? ShotOutcome::Winner : ShotOutcome::InPlay;
        return res;
    }

    auto ShotResolver::AceChance(PlayerState const& server, ServeKind const kind) const -> double
    {
        double const base = kind == ServeKind::First ? t_.first_serve_ace_chance : t_.second_serve_ace_chance;
        double const skill = server.profile.Skill(ServeShot(kind));
        return std::clamp(base + (skill - 0.5) * t_.ace_skill_weight, 0.0, 0.5);
    }

    auto ShotResolver::ResolveServe(PlayerState const& server, ServeKind const kind, Rng& rng) const
        -> ShotResolution
    {
        ShotType const shot = ServeShot(kind);
        ShotContext ctx{};
        ctx.hitter_zone = CourtZone::Baseline;
        ctx.receiver_zone = CourtZone::Baseline;

        ShotResolution res{};
        res.probability = Probability(server, shot, ctx);
        res.roll = Draw(rng);

        if (res.roll >= res.probability)
        {
            res.outcome = kind == ServeKind::First ? ShotOutcome::Fault : ShotOutcome::DoubleFault;
            return res;
        }
        res.outcome = Draw(rng) < AceChance(server, kind) ? ShotOutcome::Ace : ShotOutcome::InPlay;
        return res;
    }
}
