//
// Created by Malik T on 08/10/2025.
//

#ifndef TENNISSIM_MATCH_HPP
#define TENNISSIM_MATCH_HPP

#include <array>
#include <memory>
#include <optional>
#include <vector>

#include "Types.hpp"
#include "Actions.hpp"
#include "Exception.hpp"
#include "OpponentPolicy.hpp"
#include "Profile.hpp"
#include "Rules.hpp"
#include "Scoring.hpp"
#include "ShotResolver.hpp"
#include "State.hpp"

namespace tennis::core::debug {struct Inspector;}
namespace tennis::core
{
    // Owns every piece of state of one match. Separate matches share nothing.
    class Match
    {
    public:
        Match() = delete;
        Match(Profile human, Profile opponent, Config const& config, std::unique_ptr<Rules> rules);

        Match(Match const&) = delete;
        auto operator=(Match const&) -> Match& = delete;

        // Human turn. Every call either applies fully or leaves the match untouched.
        auto ServeChoice(ServeKind kind) -> error::Result<RallyUpdate>;
        auto PlayShot(ShotType shot) -> error::Result<RallyUpdate>;

        // Computer turn: serve or shot picked by the opponent policy.
        auto ContinueRally() -> error::Result<RallyUpdate>;

        [[nodiscard]]
        auto Snapshot() const -> MatchSnapshot;

        // Current state in update form, no shot attached. Sent when a match starts.
        [[nodiscard]]
        auto StateUpdate() const -> RallyUpdate;

        auto Stats() const noexcept -> MatchStats const& { return stats_; }
        auto Score() const noexcept -> MatchScore const& { return score_; }
        auto PhaseNow() const noexcept -> Phase { return phase_; }
        auto Format() const noexcept -> scoring::MatchFormat const& { return fmt_; }
        auto Seed() const noexcept -> uint64_t { return cfg_.seed; }
        auto Player(PlayerId const p) const -> PlayerState const& { return players_[Idx(p)]; }

        // Server between points, the rally hitter during one.
        [[nodiscard]]
        auto Actor() const noexcept -> PlayerId;

        // What `who` may submit right now; empty when it is not their turn.
        [[nodiscard]]
        auto LegalActionsFor(PlayerId who) const -> std::vector<ShotType>;

        // The inputs the opponent policy sees when `who` is to act.
        [[nodiscard]]
        auto PolicyContextFor(PlayerId who) const -> PolicyContext;

        //allows class to directly access private data on an instance
        friend class StandardRules;
        friend struct debug::Inspector;

    private:
        auto Step(PlayerId actor, PlayerAction const& action) -> error::Result<RallyUpdate>;
        auto MakeUpdate(RallyStatus status) const -> RallyUpdate;

        // Both players recover and walk back to the baseline.
        auto ResetForNextPoint() -> void;

    private:
        Config cfg_;
        scoring::MatchFormat fmt_;
        std::unique_ptr<Rules> rules_;
        Rng rng_;
        ShotResolver resolver_;

        // Authoritative state
        std::array<PlayerState, constants::PlayerCount> players_{};
        MatchScore score_{};
        std::optional<Rally> rally_{};
        Phase phase_{Phase::FirstServe};
        MatchStats stats_{};

        // Result of the call in flight, read by MakeUpdate
        std::optional<ShotEvent> last_event_{};
        std::optional<PlayerId> point_winner_{};
    };

    using MatchHandle = std::unique_ptr<Match>;

    // Throws MalformedProfileError for a bad profile and StateError for an
    // unsupported format, before any point is played.
    auto StartMatch(Profile const& human, Profile const& opponent, Config const& config) -> MatchHandle;
}

#endif //TENNISSIM_MATCH_HPP
