//
// Created by Malik T on 02/10/2025.
//

#ifndef TENNISSIM_ACTIONS_HPP
#define TENNISSIM_ACTIONS_HPP

#include <variant>

#include "Types.hpp"

namespace tennis::core
{
    struct ServeAction { ServeKind kind{ServeKind::First}; };
    struct ShotAction  { ShotType shot{ShotType::ForehandCrossCourt}; };

    using PlayerAction = std::variant<ServeAction, ShotAction>;

    // What the engine expects next from the actor on turn.
    enum class Phase : uint8_t
    {
        FirstServe,
        SecondServe,
        Rally,
        Finished
    };

    enum class RallyStatus : uint8_t
    {
        InProgress,
        PointOver,
        GameOver,
        SetOver,
        MatchOver
    };

    enum class ShotOutcome : uint8_t
    {
        InPlay,
        Winner,
        UnforcedError,
        ForcedError,
        Fault,
        DoubleFault,
        Ace
    };

    // True when the outcome decides the point.
    inline constexpr auto EndsPoint(ShotOutcome const o) noexcept -> bool
    {
        return o != ShotOutcome::InPlay && o != ShotOutcome::Fault;
    }

    inline constexpr auto IsSuccess(ShotOutcome const o) noexcept -> bool
    {
        return o == ShotOutcome::InPlay || o == ShotOutcome::Winner || o == ShotOutcome::Ace;
    }
} // namespace tennis::core

#endif //TENNISSIM_ACTIONS_HPP
