//
// Created by Malik T on 03/10/2025.
//

#ifndef TENNISSIM_STATE_HPP
#define TENNISSIM_STATE_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include "Types.hpp"
#include "Actions.hpp"
#include "Profile.hpp"

namespace tennis::core
{
    struct PlayerState
    {
        Profile profile{};
        double stamina{1.0};
        CourtZone zone{CourtZone::Baseline};
    };

    // Immutable once recorded; append-only within a Rally.
    struct ShotEvent
    {
        ShotType type{};
        PlayerId hitter{};
        ShotOutcome outcome{};
        bool success{false};
        CourtZone resulting_zone{}; // hitter, after the shot
        CourtZone receiver_zone{};  // receiver, after the shot
        PlayerId beneficiary{};
        double probability{};
    };

    struct Rally
    {
        std::vector<ShotEvent> shots;
        PlayerId hitter{};
        CourtZone ball_zone{CourtZone::Baseline};

        [[nodiscard]]
        auto Length() const noexcept -> std::size_t { return shots.size(); }

        [[nodiscard]]
        auto Last() const -> ShotEvent const* { return shots.empty() ? nullptr : &shots.back(); }
    };

    struct CompletedSet
    {
        std::array<int, 2> games{};
        bool tiebreak_played{false};
        std::array<int, 2> tiebreak_points{};
    };

    struct MatchScore
    {
        std::array<int, 2> points{};
        std::array<int, 2> games{};
        std::array<int, 2> sets{};
        int current_set{0};
        PlayerId server{PlayerId::Human};
        bool tiebreak{false};
        PlayerId tiebreak_first_server{PlayerId::Human};
        std::vector<CompletedSet> completed_sets;
        std::optional<PlayerId> winner{};

        [[nodiscard]]
        auto Points(PlayerId p) const -> int { return points[Idx(p)]; }
        [[nodiscard]]
        auto Games(PlayerId p) const -> int { return games[Idx(p)]; }
        [[nodiscard]]
        auto Sets(PlayerId p) const -> int { return sets[Idx(p)]; }

        [[nodiscard]]
        auto IsTiebreak() const noexcept -> bool { return tiebreak; }

        [[nodiscard]]
        auto IsOver() const noexcept -> bool { return winner.has_value(); }

        // 40-40 or any level score beyond it, outside a tiebreak.
        [[nodiscard]]
        auto IsDeuce() const noexcept -> bool
        {
            return !tiebreak && points[0] >= 3 && points[0] == points[1];
        }

        [[nodiscard]]
        auto Advantage() const noexcept -> std::optional<PlayerId>
        {
            if (tiebreak || points[0] < 3 || points[1] < 3) return std::nullopt;
            if (points[0] == points[1] + 1) return PlayerId::Human;
            if (points[1] == points[0] + 1) return PlayerId::Opponent;
            return std::nullopt;
        }
    };

    struct PlayerStats
    {
        int points_won{0};
        int aces{0};
        int double_faults{0};
        int first_serves_attempted{0};
        int first_serves_in{0};
        int winners{0};
        int unforced_errors{0};
        int forced_errors_drawn{0};
    };

    struct MatchStats
    {
        std::array<PlayerStats, 2> players{};
        std::size_t longest_rally{0};
        int points_played{0};
    };

    // What the collaborator layer receives after every accepted call.
    struct RallyUpdate
    {
        std::array<CourtZone, 2> zones{};
        std::array<double, 2> stamina{};
        std::optional<ShotEvent> last_shot{};
        MatchScore score{};
        RallyStatus status{RallyStatus::InProgress};
        std::optional<PlayerId> point_winner{};
        PlayerId next_actor{};
        Phase phase{Phase::FirstServe};
        std::vector<ShotType> legal_shots;
    };

    // Plain copy of a whole match for the collaborator layer.
    struct MatchSnapshot
    {
        std::array<PlayerState, 2> players{};
        MatchScore score{};
        Phase phase{Phase::FirstServe};
        PlayerId actor{};
        std::optional<Rally> rally{};
        MatchStats stats{};
        uint8_t best_of_sets{3};
    };

} // namespace tennis::core

#endif //TENNISSIM_STATE_HPP
