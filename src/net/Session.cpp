//
// Created by Malik T on 12/10/2025.
//

#include "Session.hpp"

#include <filesystem>
#include <random>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace tennis::core::net
{
    namespace
    {
        // Keeps the opponent roll independent from the match stream.
        constexpr std::uint64_t OpponentSeedSalt = 0x9E3779B97F4A7C15ULL;
    }

    Session::Session(std::uint64_t const id, SessionOptions opts) :
        id_(id),
        opts_(std::move(opts))
    {
    }

    auto Session::Handle(std::span<std::byte const> const bytes) -> flatbuffers::DetachedBuffer
    {
        std::expected<Command, ParseError> parsed = DecodeCommand(bytes);
        if (!parsed.has_value())
        {
            return BuildError(parsed.error().message, 0);
        }

        std::uint64_t const msg_id = std::visit([](auto const& cmd) { return cmd.msg_id; }, *parsed);
        try
        {
            return Dispatch(*parsed);
        }
        catch (OmegaException<error::Code> const& e)
        {
            // The engine state can no longer be trusted; drop the match.
            if (log_)
            {
                log_->internal_error(e.what());
                log_->flush();
            }
            log_.reset();
            match_.reset();
            return BuildError("internal error, match abandoned: " + e.what(), msg_id);
        }
    }

    auto Session::Dispatch(Command const& command) -> flatbuffers::DetachedBuffer
    {
        return std::visit([this]<typename T>(T const& cmd) -> flatbuffers::DetachedBuffer
        {
            if constexpr (std::is_same_v<T, StartCommand>)
            {
                return OnStart(cmd);
            }
            else
            {
                if (!match_)
                {
                    return BuildError("no match in progress", cmd.msg_id);
                }
                if constexpr (std::is_same_v<T, ServeCommand>)
                {
                    return Reply(match_->ServeChoice(cmd.kind), cmd.msg_id);
                }
                else if constexpr (std::is_same_v<T, ShotCommand>)
                {
                    return Reply(match_->PlayShot(cmd.shot), cmd.msg_id);
                }
                else
                {
                    return Reply(match_->ContinueRally(), cmd.msg_id);
                }
            }
        }, command);
    }

    auto Session::OnStart(StartCommand const& cmd) -> flatbuffers::DetachedBuffer
    {
        Config cfg{};
        cfg.best_of_sets = cmd.best_of_sets.value_or(opts_.best_of_sets);
        if (cmd.seed)
            cfg.seed = *cmd.seed;
        else if (opts_.seed)
            cfg.seed = *opts_.seed;
        cfg.first_server = cmd.first_server;
        cfg.final_set_tiebreak = cmd.final_set_tiebreak && opts_.final_set_tiebreak;

        Profile const human = cmd.player ? *cmd.player : DefaultHumanProfile();
        Profile opponent{};
        if (cmd.opponent)
        {
            opponent = *cmd.opponent;
        }
        else
        {
            Rng roll{cfg.seed ^ OpponentSeedSalt};
            opponent = RandomOpponentProfile(roll);
            if (cmd.opponent_style) opponent.style = *cmd.opponent_style;
        }

        MatchHandle fresh;
        try
        {
            fresh = StartMatch(human, opponent, cfg);
        }
        catch (error::MalformedProfileError const& e)
        {
            return BuildError(e.what(), cmd.msg_id);
        }
        catch (error::StateError const& e)
        {
            return BuildError(e.what(), cmd.msg_id);
        }

        // A new start replaces whatever match this connection had.
        if (log_) log_->flush();
        log_.reset();
        match_ = std::move(fresh);

        if (opts_.log_dir)
        {
            std::filesystem::path const file = std::filesystem::path{*opts_.log_dir} /
                ("match_" + std::to_string(id_) + "_" + std::to_string(cfg.seed) + ".log");
            auto logger = std::make_unique<debug::MatchLogger>(file.string());
            if (logger->is_open())
            {
                logger->start(*match_);
                log_ = std::move(logger);
            }
        }

        return BuildUpdate(match_->StateUpdate(), cmd.msg_id);
    }

    auto Session::Reply(error::Result<RallyUpdate> const& r, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        if (!r.has_value())
        {
            if (log_) log_->violation(r.error());
            return BuildViolation(r.error(), msg_id);
        }

        if (log_)
        {
            log_->update(*r);
            if (r->status == RallyStatus::MatchOver)
            {
                log_->end(*match_);
                log_->flush();
            }
        }
        return BuildUpdate(*r, msg_id);
    }
}
