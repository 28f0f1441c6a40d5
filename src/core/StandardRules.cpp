//
// Created by Malik T on 08/10/2025.
//

#include "StandardRules.hpp"

#include <algorithm>
#include <type_traits>
#include <variant>

#include "Court.hpp"
#include "Match.hpp"
#include "Scoring.hpp"

namespace
{
    inline auto Viol(tennis::core::error::RuleViolationCode code) -> tennis::core::error::RuleViolation
    {
        return tennis::core::error::RuleViolation{ .code = code };
    }
}

namespace tennis::core
{
    auto StandardRules::Validate(Match const& match, PlayerId const actor, PlayerAction const& a) const
        -> CheckResult
    {
        using RVC = ::tennis::core::error::RuleViolationCode;

        if (match.phase_ == Phase::Finished || match.score_.IsOver())
            return std::unexpected(Viol(RVC::Match_Finished).with_phase(match.phase_).with_actor(actor));

        PlayerId const expected = match.Actor();
        if (actor != expected)
        {
            RVC const code = expected == PlayerId::Human ? RVC::WrongActor_HumanRequired
                                                         : RVC::WrongActor_OpponentRequired;
            return std::unexpected(Viol(code).with_phase(match.phase_).with_actor(actor));
        }

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, ServeAction>)
            {
                if (match.phase_ == Phase::Rally)
                    return std::unexpected(Viol(RVC::Serve_NotServing)
                                           .with_phase(match.phase_).with_actor(actor).with_serve(act.kind));

                if (match.phase_ == Phase::FirstServe && act.kind != ServeKind::First)
                    return std::unexpected(Viol(RVC::Serve_FirstRequired)
                                           .with_actor(actor).with_serve(act.kind));

                if (match.phase_ == Phase::SecondServe && act.kind != ServeKind::Second)
                    return std::unexpected(Viol(RVC::Serve_SecondRequired)
                                           .with_actor(actor).with_serve(act.kind));
                return {};
            }
            else if constexpr (std::is_same_v<T, ShotAction>)
            {
                if (match.phase_ != Phase::Rally)
                    return std::unexpected(Viol(RVC::Shot_ServeRequired)
                                           .with_phase(match.phase_).with_actor(actor).with_shot(act.shot));

                CourtZone const zone = match.players_[Idx(actor)].zone;
                if (IsServe(act.shot))
                    return std::unexpected(Viol(RVC::Shot_ServeInRally)
                                           .with_actor(actor).with_shot(act.shot).with_zone(zone));

                if (!court::IsLegal(zone, act.shot))
                    return std::unexpected(Viol(RVC::Shot_IllegalFromZone)
                                           .with_actor(actor).with_shot(act.shot).with_zone(zone));
                return {};
            }

            TNS_THROW(error::Code::Unknown, "Unreachable variant in Validate");
        }, a);
    }

    auto StandardRules::Apply(Match& match, PlayerId const actor, PlayerAction const& a) -> void
    {
        std::visit([&]<typename T0>(T0 const& act)
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, ServeAction>)
                {
                    ApplyServe(match, actor, act.kind);
                }
                else if constexpr (std::is_same_v<T, ShotAction>)
                {
                    ApplyShot(match, actor, act.shot);
                }
            }, a);
    }

    auto StandardRules::ApplyServe(Match& match, PlayerId const server, ServeKind const kind) -> void
    {
        PlayerId const receiver = Other(server);
        PlayerState& sp = match.players_[Idx(server)];
        PlayerState& rp = match.players_[Idx(receiver)];
        PlayerStats& stats = match.stats_.players[Idx(server)];

        if (!match.rally_)
            match.rally_ = Rally{ .shots = {}, .hitter = server, .ball_zone = CourtZone::Baseline };

        ShotType const shot = ServeShot(kind);
        ShotResolution const res = match.resolver_.ResolveServe(sp, kind, match.rng_);
        sp.stamina = match.resolver_.Fatigue().ApplyShot(sp, shot, match.rally_->Length() + 1);

        ShotEvent ev{};
        ev.type = shot;
        ev.hitter = server;
        ev.outcome = res.outcome;
        ev.success = IsSuccess(res.outcome);
        ev.probability = res.probability;

        if (kind == ServeKind::First)
        {
            ++stats.first_serves_attempted;
            if (ev.success) ++stats.first_serves_in;
        }

        switch (res.outcome)
        {
        case ShotOutcome::Fault:
            ev.beneficiary = receiver;
            match.phase_ = Phase::SecondServe;
            break;
        case ShotOutcome::DoubleFault:
            ev.beneficiary = receiver;
            ++stats.double_faults;
            match.point_winner_ = receiver;
            break;
        case ShotOutcome::Ace:
            ev.beneficiary = server;
            ++stats.aces;
            match.point_winner_ = server;
            break;
        case ShotOutcome::InPlay:
            ev.beneficiary = server;
            sp.zone = court::NextZone(sp.zone, shot);
            rp.zone = court::OpponentZone(rp.zone, shot, res.outcome);
            match.rally_->hitter = receiver;
            match.rally_->ball_zone = rp.zone;
            match.phase_ = Phase::Rally;
            break;
        default:
            TNS_THROW(error::Code::Rules, "Serve resolved to a rally outcome");
        }

        ev.resulting_zone = sp.zone;
        ev.receiver_zone = rp.zone;
        match.rally_->shots.push_back(ev);
        match.last_event_ = ev;
    }

    auto StandardRules::ApplyShot(Match& match, PlayerId const hitter, ShotType const shot) -> void
    {
        TNS_ASSERT(match.rally_.has_value(), "Rally shot without an active rally");
        PlayerId const receiver = Other(hitter);
        PlayerState& hp = match.players_[Idx(hitter)];
        PlayerState& rp = match.players_[Idx(receiver)];
        Rally& rally = *match.rally_;

        ShotContext ctx{};
        ctx.hitter_zone = hp.zone;
        ctx.receiver_zone = rp.zone;
        ctx.rally_length = rally.Length();
        if (ShotEvent const* last = rally.Last())
        {
            ctx.previous_shot = last->type;
            ctx.under_pressure = last->hitter == receiver && last->success && IsWinnerCapable(last->type);
        }

        ShotResolution const res = match.resolver_.Resolve(hp, shot, ctx, match.rng_);
        hp.stamina = match.resolver_.Fatigue().ApplyShot(hp, shot, rally.Length() + 1);

        ShotEvent ev{};
        ev.type = shot;
        ev.hitter = hitter;
        ev.outcome = res.outcome;
        ev.success = IsSuccess(res.outcome);
        ev.probability = res.probability;

        switch (res.outcome)
        {
        case ShotOutcome::InPlay:
        case ShotOutcome::Winner:
            ev.beneficiary = hitter;
            hp.zone = court::NextZone(hp.zone, shot);
            rp.zone = court::OpponentZone(rp.zone, shot, res.outcome);
            if (res.outcome == ShotOutcome::Winner)
            {
                ++match.stats_.players[Idx(hitter)].winners;
                match.point_winner_ = hitter;
            }
            else
            {
                rally.hitter = receiver;
                rally.ball_zone = rp.zone;
            }
            break;
        case ShotOutcome::UnforcedError:
            ev.beneficiary = receiver;
            ++match.stats_.players[Idx(hitter)].unforced_errors;
            match.point_winner_ = receiver;
            break;
        case ShotOutcome::ForcedError:
            ev.beneficiary = receiver;
            ++match.stats_.players[Idx(receiver)].forced_errors_drawn;
            match.point_winner_ = receiver;
            break;
        default:
            TNS_THROW(error::Code::Rules, "Rally shot resolved to a serve outcome");
        }

        ev.resulting_zone = hp.zone;
        ev.receiver_zone = rp.zone;
        rally.shots.push_back(ev);
        match.last_event_ = ev;
    }

    auto StandardRules::Advance(Match& match) -> RallyStatus
    {
        using tennis::core::error::Code;
        if (!match.point_winner_)
            return RallyStatus::InProgress;

        PlayerId const winner = *match.point_winner_;
        auto const awarded = scoring::AwardPoint(match.score_, winner, match.fmt_);
        if (!awarded.has_value())
            TNS_THROW(Code::State, "Point decided on a finished match: " + error::describe(awarded.error()));

        match.score_ = awarded->score;

        MatchStats& stats = match.stats_;
        ++stats.players[Idx(winner)].points_won;
        ++stats.points_played;
        if (match.rally_)
            stats.longest_rally = std::max(stats.longest_rally, match.rally_->Length());

        match.ResetForNextPoint();
        return awarded->level;
    }
}
