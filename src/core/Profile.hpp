//
// Created by Malik T on 03/10/2025.
//

#ifndef TENNISSIM_PROFILE_HPP
#define TENNISSIM_PROFILE_HPP

#include <map>
#include <set>

#include "Types.hpp"

namespace tennis::core
{
    // Static per-player attributes handed over by the collaborator layer.
    struct Profile
    {
        std::map<ShotType, double> skills;
        std::set<ShotType> strengths;
        PlayStyle style{PlayStyle::AllCourt};
        double endurance{0.5};

        [[nodiscard]]
        auto Skill(ShotType const s) const -> double { return skills.at(s); }

        [[nodiscard]]
        auto IsStrength(ShotType const s) const -> bool { return strengths.contains(s); }
    };

    // Throws MalformedProfileError when a skill entry is missing or a value
    // lies outside [0,1].
    auto ValidateProfile(Profile const& p, PlayerId who) -> void;

    // Fixed profile for the human: strong forehand and drop shot, weak volley.
    auto DefaultHumanProfile() -> Profile;

    // Rolls every skill on the 3..9 scale and picks a style.
    auto RandomOpponentProfile(Rng& rng) -> Profile;

    // Maps a 1..10 rating onto [0,1].
    inline constexpr auto FromRating(int const rating) noexcept -> double
    {
        return static_cast<double>(rating) / 10.0;
    }
}

#endif //TENNISSIM_PROFILE_HPP
