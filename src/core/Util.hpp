//
// Created by Malik T on 02/10/2025.
//

#ifndef TENNISSIM_UTIL_HPP
#define TENNISSIM_UTIL_HPP

#include <algorithm>
#include <array>
#include <iterator>
#include <optional>
#include <string_view>

#include "Actions.hpp"
#include "Types.hpp"

// Boundary vocabulary: stable display names for every enumeration the
// collaborator layer sees, plus the reverse lookups it needs for input.
namespace tennis::core::util
{
    inline constexpr std::array<std::string_view, constants::ShotTypeCount> ShotNames{
        "First Serve",
        "Second Serve",
        "Forehand Cross-court",
        "Backhand Cross-court",
        "Forehand Down-the-line",
        "Backhand Down-the-line",
        "Drop Shot",
        "Lob",
        "Slice",
        "Approach Shot",
        "Volley"
    };

    inline constexpr std::array<std::string_view, constants::ZoneCount> ZoneNames{
        "Baseline", "Mid-court", "Net", "Wide Left", "Wide Right"
    };

    inline constexpr std::array<std::string_view, 6> StyleNames{
        "Aggressive Baseliner",
        "Counter-puncher",
        "Net Rusher",
        "All-Court Player",
        "Forehand Dominant",
        "Backhand Dominant"
    };

    inline auto ToString(ShotType const s) -> std::string_view { return ShotNames[ShotIdx(s)]; }
    inline auto ToString(CourtZone const z) -> std::string_view { return ZoneNames[std::to_underlying(z)]; }
    inline auto ToString(PlayStyle const s) -> std::string_view { return StyleNames[std::to_underlying(s)]; }

    inline auto ToString(PlayerId const p) -> std::string_view
    {
        return p == PlayerId::Human ? "Player" : "Opponent";
    }

    inline auto ToString(ServeKind const k) -> std::string_view
    {
        return k == ServeKind::First ? "First" : "Second";
    }

    inline auto ToString(Phase const p) -> std::string_view
    {
        switch (p)
        {
        case Phase::FirstServe:  return "FirstServe";
        case Phase::SecondServe: return "SecondServe";
        case Phase::Rally:       return "Rally";
        case Phase::Finished:    return "Finished";
        }
        return "?";
    }

    inline auto ToString(RallyStatus const s) -> std::string_view
    {
        switch (s)
        {
        case RallyStatus::InProgress: return "InProgress";
        case RallyStatus::PointOver:  return "PointOver";
        case RallyStatus::GameOver:   return "GameOver";
        case RallyStatus::SetOver:    return "SetOver";
        case RallyStatus::MatchOver:  return "MatchOver";
        }
        return "?";
    }

    inline auto ToString(ShotOutcome const o) -> std::string_view
    {
        switch (o)
        {
        case ShotOutcome::InPlay:        return "InPlay";
        case ShotOutcome::Winner:        return "Winner";
        case ShotOutcome::UnforcedError: return "UnforcedError";
        case ShotOutcome::ForcedError:   return "ForcedError";
        case ShotOutcome::Fault:         return "Fault";
        case ShotOutcome::DoubleFault:   return "DoubleFault";
        case ShotOutcome::Ace:           return "Ace";
        }
        return "?";
    }

    template <typename E, std::size_t N>
    inline auto ParseByName(std::array<std::string_view, N> const& names, std::string_view const name)
        -> std::optional<E>
    {
        auto const it = std::ranges::find(names, name);
        if (it == names.end()) return std::nullopt;
        return static_cast<E>(std::distance(names.begin(), it));
    }

    inline auto ParseShot(std::string_view const name) -> std::optional<ShotType>
    {
        return ParseByName<ShotType>(ShotNames, name);
    }

    inline auto ParseZone(std::string_view const name) -> std::optional<CourtZone>
    {
        return ParseByName<CourtZone>(ZoneNames, name);
    }

    inline auto ParseStyle(std::string_view const name) -> std::optional<PlayStyle>
    {
        return ParseByName<PlayStyle>(StyleNames, name);
    }
}

#endif //TENNISSIM_UTIL_HPP
