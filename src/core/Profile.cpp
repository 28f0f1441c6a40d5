//
// Created by Malik T on 03/10/2025.
//

#include "Profile.hpp"

#include <string>

#include "Exception.hpp"
#include "Util.hpp"

namespace tennis::core
{
    namespace
    {
        // Per-stroke ratings on the 1..10 scale a profile is described with.
        struct Ratings
        {
            int serve{5};
            int forehand{5};
            int backhand{5};
            int volley{5};
            int drop_shot{5};
            int lob{5};
            int endurance{5};
        };

        constexpr int StrengthRating = 7;

        auto BuildProfile(Ratings const& r, PlayStyle const style) -> Profile
        {
            Profile p{};
            p.style = style;
            p.endurance = FromRating(r.endurance);

            p.skills[ShotType::FirstServe] = FromRating(r.serve);
            p.skills[ShotType::SecondServe] = FromRating(r.serve);
            p.skills[ShotType::ForehandCrossCourt] = FromRating(r.forehand);
            p.skills[ShotType::ForehandDownTheLine] = FromRating(r.forehand);
            p.skills[ShotType::BackhandCrossCourt] = FromRating(r.backhand);
            p.skills[ShotType::BackhandDownTheLine] = FromRating(r.backhand);
            p.skills[ShotType::DropShot] = FromRating(r.drop_shot);
            p.skills[ShotType::Lob] = FromRating(r.lob);
            p.skills[ShotType::Volley] = FromRating(r.volley);
            // Slice leans on the backhand, approach mixes groundstroke and net play.
            p.skills[ShotType::Slice] = (FromRating(r.backhand) + 0.5) / 2.0;
            p.skills[ShotType::ApproachShot] = (FromRating(r.forehand) + FromRating(r.volley)) / 2.0;

            if (r.serve >= StrengthRating)
            {
                p.strengths.insert(ShotType::FirstServe);
                p.strengths.insert(ShotType::SecondServe);
            }
            if (r.forehand >= StrengthRating)
            {
                p.strengths.insert(ShotType::ForehandCrossCourt);
                p.strengths.insert(ShotType::ForehandDownTheLine);
            }
            if (r.backhand >= StrengthRating)
            {
                p.strengths.insert(ShotType::BackhandCrossCourt);
                p.strengths.insert(ShotType::BackhandDownTheLine);
            }
            if (r.volley >= StrengthRating) p.strengths.insert(ShotType::Volley);
            if (r.drop_shot >= StrengthRating) p.strengths.insert(ShotType::DropShot);
            if (r.lob >= StrengthRating) p.strengths.insert(ShotType::Lob);
            return p;
        }

        auto InUnitRange(double const v) -> bool
        {
            return v >= 0.0 && v <= 1.0;
        }
    }

    auto ValidateProfile(Profile const& p, PlayerId const who) -> void
    {
        std::string const owner{util::ToString(who)};
        for (ShotType const s : AllShots)
        {
            auto const it = p.skills.find(s);
            if (it == p.skills.end())
            {
                TNS_THROW(error::Code::MalformedProfile,
                          owner + " profile is missing skill '" + std::string{util::ToString(s)} + "'");
            }
            if (!InUnitRange(it->second))
            {
                TNS_THROW(error::Code::MalformedProfile,
                          owner + " profile skill '" + std::string{util::ToString(s)} + "' outside [0,1]");
            }
        }
        if (!InUnitRange(p.endurance))
        {
            TNS_THROW(error::Code::MalformedProfile, owner + " profile endurance outside [0,1]");
        }
    }

    auto DefaultHumanProfile() -> Profile
    {
        Ratings r{};
        r.serve = 5;
        r.forehand = 8;
        r.backhand = 5;
        r.volley = 3;
        r.drop_shot = 7;
        r.lob = 5;
        r.endurance = 5;
        return BuildProfile(r, PlayStyle::AllCourt);
    }

    auto RandomOpponentProfile(Rng& rng) -> Profile
    {
        std::uniform_int_distribution<int> rating{3, 9};
        Ratings r{};
        r.serve = rating(rng);
        r.forehand = rating(rng);
        r.backhand = rating(rng);
        r.volley = rating(rng);
        r.drop_shot = rating(rng);
        r.lob = rating(rng);
        r.endurance = rating(rng);

        std::uniform_int_distribution<int> style{0, static_cast<int>(util::StyleNames.size()) - 1};
        return BuildProfile(r, static_cast<PlayStyle>(style(rng)));
    }
}
