//
// Created by Malik T on 07/10/2025.
//

#ifndef TENNISSIM_OPPONENTPOLICY_HPP
#define TENNISSIM_OPPONENTPOLICY_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <random>

#include "Actions.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace tennis::core
{
    // Most important score situation of the point about to be decided.
    enum class Pressure : uint8_t
    {
        None = 0,
        BreakPoint,
        SetPoint,
        MatchPoint
    };

    struct PolicyContext
    {
        CourtZone receiver_zone{CourtZone::Baseline};
        std::optional<ShotType> previous_shot{};
        std::size_t rally_length{0};
        Pressure pressure{Pressure::None};
        // true when the chooser is the one holding the break/set/match point
        bool holds_pressure_point{false};
    };

    using ShotWeights = std::array<double, constants::ShotTypeCount>;

    // Style-keyed weighted shot choice. Holds no generator, the match passes its own.
    class OpponentPolicy
    {
    public:
        // Unnormalised weights, zero for every shot illegal from the chooser's zone.
        [[nodiscard]]
        static auto Weights(PlayerState const& me, PolicyContext const& ctx) -> ShotWeights;

        // Never returns a shot illegal from me.zone.
        static auto ChooseShot(PlayerState const& me, PolicyContext const& ctx, Rng& rng) -> ShotType;

        [[nodiscard]]
        static auto ChooseServe(Phase phase) -> ServeKind;

        [[nodiscard]]
        static auto StyleTable(PlayStyle style) -> ShotWeights const&;

    private:
        template <class Arr>
        static auto pick(Arr const& weights, Rng& rng) -> std::size_t
        {
            return std::discrete_distribution<std::size_t>{weights.begin(), weights.end()}(rng);
        }
    };
}

#endif //TENNISSIM_OPPONENTPOLICY_HPP
