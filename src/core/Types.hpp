//
// Created by Malik T on 02/10/2025.
//

#ifndef TENNISSIM_TYPES_HPP
#define TENNISSIM_TYPES_HPP

#define TNS_ENABLE_TEST_HOOKS true

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <utility>

namespace tennis::core::constants
{
    inline constexpr std::size_t ShotTypeCount = 11;
    inline constexpr std::size_t ZoneCount = 5;
    inline constexpr std::size_t PlayerCount = 2;

    inline constexpr int GamesToWinSet = 6;
    inline constexpr int TiebreakAtGames = 6;
    inline constexpr int TiebreakPointsToWin = 7;
    inline constexpr int PointsToWinGame = 4;
}

namespace tennis::core
{
    enum class PlayerId : uint8_t
    {
        Human = 0,
        Opponent
    };

    inline constexpr auto Other(PlayerId const p) noexcept -> PlayerId
    {
        return p == PlayerId::Human ? PlayerId::Opponent : PlayerId::Human;
    }

    inline constexpr auto Idx(PlayerId const p) noexcept -> std::size_t
    {
        return static_cast<std::size_t>(std::to_underlying(p));
    }

    // Values are part of the boundary vocabulary, do not reorder.
    enum class ShotType : uint8_t
    {
        FirstServe = 0,
        SecondServe,
        ForehandCrossCourt,
        BackhandCrossCourt,
        ForehandDownTheLine,
        BackhandDownTheLine,
        DropShot,
        Lob,
        Slice,
        ApproachShot,
        Volley
    };

    enum class CourtZone : uint8_t
    {
        Baseline = 0,
        MidCourt,
        Net,
        WideLeft,
        WideRight
    };

    enum class PlayStyle : uint8_t
    {
        AggressiveBaseliner = 0,
        CounterPuncher,
        NetRusher,
        AllCourt,
        ForehandDominant,
        BackhandDominant
    };

    enum class ServeKind : uint8_t
    {
        First = 0,
        Second
    };

    inline constexpr std::array<ShotType, constants::ShotTypeCount> AllShots{
        ShotType::FirstServe, ShotType::SecondServe,
        ShotType::ForehandCrossCourt, ShotType::BackhandCrossCourt,
        ShotType::ForehandDownTheLine, ShotType::BackhandDownTheLine,
        ShotType::DropShot, ShotType::Lob, ShotType::Slice,
        ShotType::ApproachShot, ShotType::Volley
    };

    inline constexpr auto ShotIdx(ShotType const s) noexcept -> std::size_t
    {
        return static_cast<std::size_t>(std::to_underlying(s));
    }

    inline constexpr auto IsServe(ShotType const s) noexcept -> bool
    {
        return s == ShotType::FirstServe || s == ShotType::SecondServe;
    }

    // Shots that can end a rally outright when they land.
    inline constexpr auto IsWinnerCapable(ShotType const s) noexcept -> bool
    {
        switch (s)
        {
        case ShotType::ForehandDownTheLine:
        case ShotType::BackhandDownTheLine:
        case ShotType::DropShot:
        case ShotType::Lob:
        case ShotType::ApproachShot:
        case ShotType::Volley:
            return true;
        default:
            return false;
        }
    }

    using Rng = std::mt19937_64;

    // Every coefficient of the shot model. Defaults are a playable baseline,
    // not measured values; tests only rely on shape (monotonicity, clamping).
    struct Tuning
    {
        // p_base = skill_base + skill_weight * skill
        double skill_base{0.55};
        double skill_weight{0.45};

        // Indexed by ShotType. Cross-court > down-the-line > drop/lob.
        std::array<double, constants::ShotTypeCount> risk_profile{
            0.80, // FirstServe
            1.20, // SecondServe
            0.96, // ForehandCrossCourt
            0.94, // BackhandCrossCourt
            0.90, // ForehandDownTheLine
            0.88, // BackhandDownTheLine
            0.82, // DropShot
            0.84, // Lob
            0.94, // Slice
            0.88, // ApproachShot
            0.91  // Volley
        };

        // Share of the success band that becomes an outright winner.
        std::array<double, constants::ShotTypeCount> winner_share{
            0.0, 0.0, 0.0, 0.0,
            0.18, 0.18, 0.25, 0.15, 0.0, 0.10, 0.22
        };

        double strength_bonus{1.12};

        // fatigue_factor = fatigue_min_factor + (1 - fatigue_min_factor) * stamina
        double fatigue_min_factor{0.75};
        double stamina_floor{0.15};
        double serve_cost{0.03};
        double shot_cost{0.05};
        double special_shot_surcharge{0.02};
        std::size_t long_rally_threshold{4};
        double long_rally_cost_per_shot{0.01};
        // cost *= endurance_cost_high - endurance_cost_span * endurance
        double endurance_cost_high{1.25};
        double endurance_cost_span{0.5};
        double recovery_per_point{0.30};

        double off_center_factor{0.92};
        double groundstroke_from_net_factor{0.85};
        double volley_from_midcourt_factor{0.85};
        double drop_vs_deep_factor{1.10};
        double drop_vs_net_factor{0.70};
        double lob_vs_net_factor{1.15};
        double passing_shot_factor{1.08};

        double lob_after_drop_factor{1.10};
        double volley_after_lob_factor{1.10};

        double min_floor{0.10};
        double max_ceiling{0.95};

        double first_serve_ace_chance{0.10};
        double second_serve_ace_chance{0.03};
        double ace_skill_weight{0.20};
    };

    struct Config
    {
        // 3 or 5
        uint8_t best_of_sets{3};
        uint64_t seed{std::random_device{}()};
        // Drawn from the seed when empty.
        std::optional<PlayerId> first_server{PlayerId::Human};
        // false = the deciding set is an advantage set
        bool final_set_tiebreak{true};
        Tuning tuning{};
    };
}

#endif //TENNISSIM_TYPES_HPP
