//
// Created by Malik T on 03/10/2025.
//

#include "Fatigue.hpp"

#include <algorithm>

namespace tennis::core
{
    auto FatigueModel::ShotCost(ShotType const shot, std::size_t const rally_length, double const endurance) const
        -> double
    {
        double cost{};
        if (IsServe(shot))
        {
            cost = t_.serve_cost;
        }
        else
        {
            cost = t_.shot_cost;
            if (shot == ShotType::DropShot || shot == ShotType::Lob)
                cost += t_.special_shot_surcharge;
            if (rally_length > t_.long_rally_threshold)
                cost += static_cast<double>(rally_length - t_.long_rally_threshold) * t_.long_rally_cost_per_shot;
        }
        double const e = std::clamp(endurance, 0.0, 1.0);
        return cost * (t_.endurance_cost_high - t_.endurance_cost_span * e);
    }

    auto FatigueModel::ApplyShot(PlayerState const& player, ShotType const shot, std::size_t const rally_length) const
        -> double
    {
        double const cost = ShotCost(shot, rally_length, player.profile.endurance);
        return std::max(t_.stamina_floor, player.stamina - cost);
    }

    auto FatigueModel::Recover(PlayerState const& player) const -> double
    {
        return std::min(1.0, std::max(t_.stamina_floor, player.stamina) + t_.recovery_per_point);
    }

    auto FatigueModel::Factor(double const stamina) const -> double
    {
        double const s = std::clamp(stamina, 0.0, 1.0);
        return t_.fatigue_min_factor + (1.0 - t_.fatigue_min_factor) * s;
    }

    auto FatigueLabel(double const stamina) noexcept -> std::string_view
    {
        if (stamina > 0.8) return "Fresh";
        if (stamina > 0.6) return "Slightly Tired";
        if (stamina > 0.4) return "Tiring";
        if (stamina > 0.2) return "Very Tired";
        return "Exhausted";
    }
}
