//
// Created by Malik T on 04/10/2025.
//

#include "Court.hpp"

namespace tennis::core::court
{
    auto NextZone(CourtZone const current, ShotType const shot) noexcept -> CourtZone
    {
        switch (shot)
        {
        case ShotType::FirstServe:
        case ShotType::SecondServe:
            return CourtZone::Baseline;

        case ShotType::ApproachShot:
        case ShotType::Volley:
            return CourtZone::Net;

        case ShotType::ForehandDownTheLine:
        case ShotType::BackhandDownTheLine:
            return TowardNet(current);

        case ShotType::DropShot:
            return IsBackCourt(current) ? CourtZone::MidCourt : current;

        case ShotType::Lob:
            if (current == CourtZone::Net) return CourtZone::MidCourt;
            return IsWide(current) ? CourtZone::Baseline : current;

        case ShotType::ForehandCrossCourt:
        case ShotType::BackhandCrossCourt:
        case ShotType::Slice:
            return IsWide(current) ? CourtZone::Baseline : current;
        }
        return current;
    }

    auto OpponentZone(CourtZone const current, ShotType const shot, ShotOutcome const outcome) noexcept -> CourtZone
    {
        switch (shot)
        {
        case ShotType::FirstServe:
        case ShotType::SecondServe:
            return CourtZone::Baseline;

        case ShotType::DropShot:
            // A winner leaves the receiver stranded where they stood.
            return outcome == ShotOutcome::Winner ? current : TowardNet(current);

        case ShotType::Lob:
            return CourtZone::Baseline;

        case ShotType::ForehandCrossCourt:
        case ShotType::BackhandDownTheLine:
            return IsBackCourt(current) ? CourtZone::WideLeft : current;

        case ShotType::BackhandCrossCourt:
        case ShotType::ForehandDownTheLine:
            return IsBackCourt(current) ? CourtZone::WideRight : current;

        case ShotType::ApproachShot:
            return current == CourtZone::Net ? CourtZone::Net : CourtZone::Baseline;

        case ShotType::Slice:
        case ShotType::Volley:
            return current;
        }
        return current;
    }

    auto IsLegal(CourtZone const zone, ShotType const shot) noexcept -> bool
    {
        switch (shot)
        {
        case ShotType::FirstServe:
        case ShotType::SecondServe:
            return false;

        case ShotType::ForehandCrossCourt:
        case ShotType::BackhandCrossCourt:
        case ShotType::DropShot:
            return true;

        case ShotType::Volley:
            return zone == CourtZone::Net || zone == CourtZone::MidCourt;

        case ShotType::ApproachShot:
            return zone == CourtZone::Baseline || zone == CourtZone::MidCourt;

        case ShotType::ForehandDownTheLine:
        case ShotType::BackhandDownTheLine:
        case ShotType::Lob:
        case ShotType::Slice:
            return zone != CourtZone::Net;
        }
        return false;
    }

    auto LegalShots(CourtZone const zone) -> std::vector<ShotType>
    {
        std::vector<ShotType> out;
        out.reserve(constants::ShotTypeCount);
        for (ShotType const s : AllShots)
        {
            if (IsLegal(zone, s)) out.push_back(s);
        }
        return out;
    }
}
