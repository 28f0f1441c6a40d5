//
// Created by Malik T on 08/10/2025.
//
#include "Match.hpp"

#include <random>
#include <string>
#include <utility>

#include "Court.hpp"
#include "StandardRules.hpp"
#include "Util.hpp"

namespace tennis::core
{
    Match::Match(Profile human, Profile opponent, Config const& config, std::unique_ptr<Rules> rules) :
        cfg_(config),
        fmt_{config.best_of_sets, config.final_set_tiebreak},
        rules_(std::move(rules)),
        rng_{cfg_.seed},
        resolver_(cfg_.tuning)
    {
        TNS_ASSERT(rules_ != nullptr, "Match constructed without rules");
        players_[Idx(PlayerId::Human)].profile = std::move(human);
        players_[Idx(PlayerId::Opponent)].profile = std::move(opponent);

        PlayerId first = PlayerId::Human;
        if (cfg_.first_server)
            first = *cfg_.first_server;
        else
            first = std::uniform_int_distribution<int>{0, 1}(rng_) == 0 ? PlayerId::Human : PlayerId::Opponent;

        score_ = scoring::InitialScore(first);
        phase_ = Phase::FirstServe;
    }

    auto Match::Actor() const noexcept -> PlayerId
    {
        if (phase_ == Phase::Rally && rally_) return rally_->hitter;
        return score_.server;
    }

    auto Match::LegalActionsFor(PlayerId const who) const -> std::vector<ShotType>
    {
        if (phase_ == Phase::Finished || who != Actor()) return {};
        switch (phase_)
        {
        case Phase::FirstServe: return {ShotType::FirstServe};
        case Phase::SecondServe: return {ShotType::SecondServe};
        case Phase::Rally: return court::LegalShots(players_[Idx(who)].zone);
        case Phase::Finished: break;
        }
        return {};
    }

    auto Match::PolicyContextFor(PlayerId const who) const -> PolicyContext
    {
        PolicyContext ctx{};
        ctx.receiver_zone = players_[Idx(Other(who))].zone;
        if (rally_)
        {
            ctx.rally_length = rally_->Length();
            if (ShotEvent const* last = rally_->Last()) ctx.previous_shot = last->type;
        }
        if (score_.IsOver()) return ctx;

        PlayerId const other = Other(who);
        if (scoring::IsMatchPoint(score_, who, fmt_) || scoring::IsMatchPoint(score_, other, fmt_))
        {
            ctx.pressure = Pressure::MatchPoint;
            ctx.holds_pressure_point = scoring::IsMatchPoint(score_, who, fmt_);
        }
        else if (scoring::IsSetPoint(score_, who, fmt_) || scoring::IsSetPoint(score_, other, fmt_))
        {
            ctx.pressure = Pressure::SetPoint;
            ctx.holds_pressure_point = scoring::IsSetPoint(score_, who, fmt_);
        }
        else if (scoring::IsBreakPoint(score_))
        {
            ctx.pressure = Pressure::BreakPoint;
            ctx.holds_pressure_point = who != score_.server;
        }
        return ctx;
    }

    auto Match::ServeChoice(ServeKind const kind) -> error::Result<RallyUpdate>
    {
        return Step(PlayerId::Human, ServeAction{kind});
    }

    auto Match::PlayShot(ShotType const shot) -> error::Result<RallyUpdate>
    {
        return Step(PlayerId::Human, ShotAction{shot});
    }

    auto Match::ContinueRally() -> error::Result<RallyUpdate>
    {
        PlayerId constexpr me = PlayerId::Opponent;
        // Let the rules report the turn violation; no draw is spent on it.
        if (phase_ == Phase::Finished || Actor() != me)
            return Step(me, ServeAction{});

        if (phase_ == Phase::Rally)
        {
            ShotType const shot = OpponentPolicy::ChooseShot(players_[Idx(me)], PolicyContextFor(me), rng_);
            return Step(me, ShotAction{shot});
        }
        return Step(me, ServeAction{OpponentPolicy::ChooseServe(phase_)});
    }

    auto Match::Step(PlayerId const actor, PlayerAction const& action) -> error::Result<RallyUpdate>
    {
        if (auto const ok = rules_->Validate(*this, actor, action); !ok.has_value())
            return std::unexpected(ok.error());

        last_event_.reset();
        point_winner_.reset();
        rules_->Apply(*this, actor, action);
        RallyStatus const status = rules_->Advance(*this);
        return MakeUpdate(status);
    }

    auto Match::MakeUpdate(RallyStatus const status) const -> RallyUpdate
    {
        RallyUpdate u{};
        for (PlayerId const p : {PlayerId::Human, PlayerId::Opponent})
        {
            u.zones[Idx(p)] = players_[Idx(p)].zone;
            u.stamina[Idx(p)] = players_[Idx(p)].stamina;
        }
        u.last_shot = last_event_;
        u.score = score_;
        u.status = status;
        u.point_winner = point_winner_;
        u.next_actor = Actor();
        u.phase = phase_;
        u.legal_shots = LegalActionsFor(u.next_actor);
        return u;
    }

    auto Match::StateUpdate() const -> RallyUpdate
    {
        RallyUpdate u = MakeUpdate(phase_ == Phase::Finished ? RallyStatus::MatchOver : RallyStatus::InProgress);
        u.last_shot.reset();
        u.point_winner.reset();
        return u;
    }

    auto Match::ResetForNextPoint() -> void
    {
        FatigueModel const& fatigue = resolver_.Fatigue();
        for (PlayerState& p : players_)
        {
            p.stamina = fatigue.Recover(p);
            p.zone = CourtZone::Baseline;
        }
        rally_.reset();
        phase_ = score_.IsOver() ? Phase::Finished : Phase::FirstServe;
    }

    auto Match::Snapshot() const -> MatchSnapshot
    {
        MatchSnapshot snap{};
        snap.players = players_;
        snap.score = score_;
        snap.phase = phase_;
        snap.actor = Actor();
        snap.rally = rally_;
        snap.stats = stats_;
        snap.best_of_sets = fmt_.best_of_sets;
        return snap;
    }

    namespace
    {
        auto InUnit(double const v) noexcept -> bool { return v >= 0.0 && v <= 1.0; }

        // Bounds the resolver and the fatigue model rely on.
        auto ValidateTuning(Tuning const& t) -> void
        {
            if (!(t.stamina_floor > 0.0 && t.stamina_floor <= 1.0))
                TNS_THROW(error::Code::State, "stamina_floor must be in (0,1], got " + std::to_string(t.stamina_floor));

            if (!InUnit(t.min_floor) || !InUnit(t.max_ceiling) || t.min_floor > t.max_ceiling)
            {
                TNS_THROW(error::Code::State,
                          "probability bounds must satisfy 0 <= min_floor <= max_ceiling <= 1, got " +
                          std::to_string(t.min_floor) + " / " + std::to_string(t.max_ceiling));
            }

            if (!InUnit(t.fatigue_min_factor))
                TNS_THROW(error::Code::State,
                          "fatigue_min_factor outside [0,1]: " + std::to_string(t.fatigue_min_factor));

            for (ShotType const s : AllShots)
            {
                if (!InUnit(t.winner_share[ShotIdx(s)]))
                    TNS_THROW(error::Code::State, "winner_share outside [0,1] for " + std::string{util::ToString(s)});
            }
        }
    }

    auto StartMatch(Profile const& human, Profile const& opponent, Config const& config) -> MatchHandle
    {
        if (config.best_of_sets != 3 && config.best_of_sets != 5)
        {
            TNS_THROW(error::Code::State,
                      "best_of_sets must be 3 or 5, got " + std::to_string(config.best_of_sets));
        }
        ValidateTuning(config.tuning);
        ValidateProfile(human, PlayerId::Human);
        ValidateProfile(opponent, PlayerId::Opponent);

        return std::make_unique<Match>(human, opponent, config, std::make_unique<StandardRules>());
    }
}
