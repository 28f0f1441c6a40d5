//
// Created by Malik T on 10/10/2025.
//

#ifndef TENNISSIM_INSPECTOR_HPP
#define TENNISSIM_INSPECTOR_HPP

#include <array>
#include <cstddef>
#include <optional>

#include "../core/Types.hpp"
#include "../core/Match.hpp"

namespace tennis::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            std::array<PlayerState, constants::PlayerCount> players{};
            MatchScore score{};
            std::optional<Rally> rally{};
            Phase phase{};
            MatchStats stats{};
            scoring::MatchFormat format{};
            double stamina_floor{};
            bool has_pending_point{false};
        };

        static inline auto Gather(Match const& m) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.players = m.players_;
            ret.score = m.score_;
            ret.rally = m.rally_;
            ret.phase = m.phase_;
            ret.stats = m.stats_;
            ret.format = m.fmt_;
            ret.stamina_floor = m.resolver_.Fatigue().Floor();
            ret.has_pending_point = m.point_winner_.has_value() && m.rally_.has_value();
            return ret;
        }

        // Test-only: jump the match to a chosen score between points.
        static inline auto ForceScore(Match& m, MatchScore const& score) -> void
        {
            m.score_ = score;
            m.rally_.reset();
            m.phase_ = score.IsOver() ? Phase::Finished : Phase::FirstServe;
        }

        // Test-only: no rally is created or cleared.
        static inline auto ForcePhase(Match& m, Phase const phase) -> void
        {
            m.phase_ = phase;
        }

        static inline auto ForceZone(Match& m, PlayerId const who, CourtZone const zone) -> void
        {
            m.players_[Idx(who)].zone = zone;
        }
    };
}

#endif //TENNISSIM_INSPECTOR_HPP
