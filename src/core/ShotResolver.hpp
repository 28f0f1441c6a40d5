//
// Created by Malik T on 05/10/2025.
//

#ifndef TENNISSIM_SHOTRESOLVER_HPP
#define TENNISSIM_SHOTRESOLVER_HPP

#include <cstddef>
#include <optional>

#include "Actions.hpp"
#include "Fatigue.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace tennis::core
{
    // Everything about the rally the resolver looks at besides the hitter.
    struct ShotContext
    {
        CourtZone hitter_zone{CourtZone::Baseline};
        CourtZone receiver_zone{CourtZone::Baseline};
        std::optional<ShotType> previous_shot{};
        // Previous ball was winner-capable and landed: a miss now is a forced error.
        bool under_pressure{false};
        std::size_t rally_length{0};
    };

    struct ShotResolution
    {
        ShotOutcome outcome{ShotOutcome::InPlay};
        double probability{};
        double roll{};
    };

    class ShotResolver
    {
    public:
        explicit ShotResolver(Tuning const& tuning) : t_(tuning), fatigue_(tuning) {}

        // Composite success probability, clamped to [min_floor, max_ceiling].
        [[nodiscard]]
        auto Probability(PlayerState const& hitter, ShotType shot, ShotContext const& ctx) const -> double;

        // Rally shot: InPlay, Winner, UnforcedError or ForcedError.
        auto Resolve(PlayerState const& hitter, ShotType shot, ShotContext const& ctx, Rng& rng) const
            -> ShotResolution;

        // Serve: InPlay, Ace, Fault (first) or DoubleFault (second).
        auto ResolveServe(PlayerState const& server, ServeKind kind, Rng& rng) const -> ShotResolution;

        [[nodiscard]]
        auto AceChance(PlayerState const& server, ServeKind kind) const -> double;

        [[nodiscard]]
        auto BaseSkill(PlayerState const& hitter, ShotType shot) const -> double;
        [[nodiscard]]
        auto StrengthBonus(PlayerState const& hitter, ShotType shot) const -> double;
        [[nodiscard]]
        auto PositionalFitness(CourtZone hitter_zone, CourtZone receiver_zone, ShotType shot) const -> double;
        [[nodiscard]]
        auto RiskProfile(ShotType shot) const -> double;
        [[nodiscard]]
        auto ContextFactor(std::optional<ShotType> previous, ShotType shot) const -> double;

        [[nodiscard]]
        auto Fatigue() const noexcept -> FatigueModel const& { return fatigue_; }

    private:
        auto Clamp(double p) const -> double;

    private:
        Tuning t_;
        FatigueModel fatigue_;
    };

    inline constexpr auto ServeShot(ServeKind const k) noexcept -> ShotType
    {
        return k == ServeKind::First ? ShotType::FirstServe : ShotType::SecondServe;
    }
}

#endif //TENNISSIM_SHOTRESOLVER_HPP
