//
// Created by Malik T on 03/10/2025.
//

#ifndef TENNISSIM_FATIGUE_HPP
#define TENNISSIM_FATIGUE_HPP

#include <cstddef>
#include <string_view>

#include "State.hpp"
#include "Types.hpp"

namespace tennis::core
{
    // Stamina bookkeeping. Every call is a pure transform of the inputs.
    class FatigueModel
    {
    public:
        explicit FatigueModel(Tuning const& tuning) : t_(tuning) {}

        // rally_length counts the shot being hit (serve = 1). Never below the floor.
        [[nodiscard]]
        auto ApplyShot(PlayerState const& player, ShotType shot, std::size_t rally_length) const -> double;

        // Between points; capped at 1.0.
        [[nodiscard]]
        auto Recover(PlayerState const& player) const -> double;

        // In [fatigue_min_factor, 1], increasing with stamina.
        [[nodiscard]]
        auto Factor(double stamina) const -> double;

        [[nodiscard]]
        auto ShotCost(ShotType shot, std::size_t rally_length, double endurance) const -> double;

        [[nodiscard]]
        auto Floor() const noexcept -> double { return t_.stamina_floor; }

    private:
        Tuning t_;
    };

    // Fresh, Slightly Tired, Tiring, Very Tired or Exhausted, in steps of 0.2 stamina.
    [[nodiscard]]
    auto FatigueLabel(double stamina) noexcept -> std::string_view;
}

#endif //TENNISSIM_FATIGUE_HPP
