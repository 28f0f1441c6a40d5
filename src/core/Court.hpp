//
// Created by Malik T on 04/10/2025.
//

#ifndef TENNISSIM_COURT_HPP
#define TENNISSIM_COURT_HPP

#include <vector>

#include "Actions.hpp"
#include "Types.hpp"

// Positional bookkeeping. Deterministic tables only; randomness lives in the
// shot resolver.
namespace tennis::core::court
{
    // Hitter's zone after playing `shot` from `current`.
    auto NextZone(CourtZone current, ShotType shot) noexcept -> CourtZone;

    // Receiver's zone after `shot` lands with `outcome`.
    auto OpponentZone(CourtZone current, ShotType shot, ShotOutcome outcome) noexcept -> CourtZone;

    // Rally legality only: serves are never legal here.
    auto IsLegal(CourtZone zone, ShotType shot) noexcept -> bool;

    auto LegalShots(CourtZone zone) -> std::vector<ShotType>;

    inline constexpr auto IsBackCourt(CourtZone const z) noexcept -> bool
    {
        return z == CourtZone::Baseline || z == CourtZone::WideLeft || z == CourtZone::WideRight;
    }

    inline constexpr auto IsWide(CourtZone const z) noexcept -> bool
    {
        return z == CourtZone::WideLeft || z == CourtZone::WideRight;
    }

    // One step in: back-court -> MidCourt -> Net.
    inline constexpr auto TowardNet(CourtZone const z) noexcept -> CourtZone
    {
        return (z == CourtZone::MidCourt || z == CourtZone::Net) ? CourtZone::Net : CourtZone::MidCourt;
    }
}

#endif //TENNISSIM_COURT_HPP
