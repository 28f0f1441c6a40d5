//
// codec.cpp
//
#include "codec.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "../core/Scoring.hpp"

namespace fb = tennis::gen::net;

namespace
{
    using namespace tennis::core;

    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert(std::to_underlying(ShotType::Volley) == std::to_underlying(fb::ShotType::Volley));
    static_assert(std::to_underlying(CourtZone::WideRight) == std::to_underlying(fb::CourtZone::WideRight));
    static_assert(std::to_underlying(PlayStyle::BackhandDominant) == std::to_underlying(fb::PlayStyle::BackhandDominant));
    static_assert(std::to_underlying(ServeKind::Second) == std::to_underlying(fb::ServeKind::Second));
    static_assert(std::to_underlying(RallyStatus::MatchOver) == std::to_underlying(fb::RallyStatus::MatchOver));
    static_assert(std::to_underlying(ShotOutcome::Ace) == std::to_underlying(fb::ShotOutcome::Ace));

    template <typename Core, typename Wire>
    auto InRange(Wire const w, std::size_t const count) noexcept -> std::optional<Core>
    {
        auto const raw = static_cast<std::size_t>(std::to_underlying(w));
        if (raw >= count) return std::nullopt;
        return static_cast<Core>(raw);
    }

    auto MakePair(std::array<int, 2> const& v) -> fb::Pair
    {
        return fb::Pair(static_cast<uint16_t>(v[0]), static_cast<uint16_t>(v[1]));
    }

    auto FromPair(fb::Pair const* p) -> std::array<int, 2>
    {
        if (!p) return {};
        return {static_cast<int>(p->human()), static_cast<int>(p->opponent())};
    }

    auto Fail(std::string msg) -> std::unexpected<tennis::core::net::ParseError>
    {
        return std::unexpected(tennis::core::net::ParseError{std::move(msg)});
    }

    auto VerifiedEnvelope(std::span<std::byte const> bytes)
        -> std::expected<fb::Envelope const*, tennis::core::net::ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return Fail("buffer too small");

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fb::VerifyEnvelopeBuffer(verifier))
            return Fail("envelope failed verification");

        fb::Envelope const* env = fb::GetEnvelope(data);
        if (!env)
            return Fail("bad root");
        return env;
    }

    auto Finish(flatbuffers::FlatBufferBuilder& fbb, fb::Message type, flatbuffers::Offset<void> body)
        -> flatbuffers::DetachedBuffer
    {
        auto const env = fb::CreateEnvelope(fbb, type, body);
        fbb.Finish(env);
        return fbb.Release();
    }
} // anonymous

namespace tennis::core::net
{
    auto ToFbShot(ShotType const s) noexcept -> fb::ShotType { return static_cast<fb::ShotType>(std::to_underlying(s)); }
    auto ToFbZone(CourtZone const z) noexcept -> fb::CourtZone { return static_cast<fb::CourtZone>(std::to_underlying(z)); }
    auto ToFbStyle(PlayStyle const s) noexcept -> fb::PlayStyle { return static_cast<fb::PlayStyle>(std::to_underlying(s)); }

    auto ToFbPlayer(PlayerId const p) noexcept -> fb::PlayerId
    {
        return p == PlayerId::Human ? fb::PlayerId::Human : fb::PlayerId::Opponent;
    }

    auto ToFbPhase(Phase const p) noexcept -> fb::Phase
    {
        switch (p)
        {
        case Phase::FirstServe: return fb::Phase::FirstServe;
        case Phase::SecondServe: return fb::Phase::SecondServe;
        case Phase::Rally: return fb::Phase::Rally;
        case Phase::Finished: return fb::Phase::Finished;
        }
        return fb::Phase::FirstServe;
    }

    auto FromFbShot(fb::ShotType const s) noexcept -> std::optional<ShotType>
    {
        return InRange<ShotType>(s, constants::ShotTypeCount);
    }

    auto FromFbZone(fb::CourtZone const z) noexcept -> std::optional<CourtZone>
    {
        return InRange<CourtZone>(z, constants::ZoneCount);
    }

    auto FromFbStyle(fb::PlayStyle const s) noexcept -> std::optional<PlayStyle>
    {
        return InRange<PlayStyle>(s, std::to_underlying(PlayStyle::BackhandDominant) + 1u);
    }

    auto FromFbPlayer(fb::PlayerId const p) noexcept -> std::optional<PlayerId>
    {
        return InRange<PlayerId>(p, constants::PlayerCount);
    }

    auto FromFbPhase(fb::Phase const p) noexcept -> std::optional<Phase>
    {
        switch (p)
        {
        case fb::Phase::FirstServe: return Phase::FirstServe;
        case fb::Phase::SecondServe: return Phase::SecondServe;
        case fb::Phase::Rally: return Phase::Rally;
        case fb::Phase::Finished: return Phase::Finished;
        }
        return std::nullopt;
    }

    static auto BuildProfile(flatbuffers::FlatBufferBuilder& fbb, Profile const& p)
        -> flatbuffers::Offset<fb::Profile>
    {
        std::vector<float> skills;
        skills.reserve(constants::ShotTypeCount);
        for (ShotType const s : AllShots)
        {
            auto const it = p.skills.find(s);
            skills.push_back(it == p.skills.end() ? -1.0f : static_cast<float>(it->second));
        }
        std::vector<uint8_t> strengths;
        for (ShotType const s : p.strengths) strengths.push_back(std::to_underlying(s));

        auto const skills_off = fbb.CreateVector(skills);
        auto const strengths_off = fbb.CreateVector(strengths);
        return fb::CreateProfile(fbb, skills_off, strengths_off, ToFbStyle(p.style), static_cast<float>(p.endurance));
    }

    // A missing skill travels as a negative value so ValidateProfile rejects it.
    static auto DecodeProfile(fb::Profile const* p) -> std::expected<Profile, ParseError>
    {
        Profile out{};
        auto const* skills = p->skills();
        if (!skills || skills->size() != constants::ShotTypeCount)
            return Fail("profile needs one skill per shot type");

        for (ShotType const s : AllShots)
        {
            float const v = skills->Get(static_cast<flatbuffers::uoffset_t>(ShotIdx(s)));
            if (v >= 0.0f) out.skills[s] = static_cast<double>(v);
        }

        if (auto const* strengths = p->strengths())
        {
            for (uint8_t const raw : *strengths)
            {
                std::optional<ShotType> const s = FromFbShot(static_cast<fb::ShotType>(raw));
                if (!s) return Fail("strength names an unknown shot type");
                out.strengths.insert(*s);
            }
        }

        std::optional<PlayStyle> const style = FromFbStyle(p->style());
        if (!style) return Fail("unknown play style");
        out.style = *style;
        out.endurance = static_cast<double>(p->endurance());
        return out;
    }

    // ---------- Builders (client -> server) ----------

    auto BuildStartMatch(StartCommand const& cmd) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        flatbuffers::Offset<fb::Profile> opp_off{};
        if (cmd.opponent) opp_off = BuildProfile(fbb, *cmd.opponent);
        flatbuffers::Offset<fb::Profile> player_off{};
        if (cmd.player) player_off = BuildProfile(fbb, *cmd.player);

        fb::StartMatchMsgBuilder b(fbb);
        b.add_msg_id(cmd.msg_id);
        b.add_best_of(cmd.best_of_sets.value_or(0));
        b.add_has_seed(cmd.seed.has_value());
        if (cmd.seed) b.add_seed(*cmd.seed);
        b.add_final_set_tiebreak(cmd.final_set_tiebreak);
        b.add_has_first_server(cmd.first_server.has_value());
        if (cmd.first_server) b.add_first_server(ToFbPlayer(*cmd.first_server));
        b.add_has_opponent_style(cmd.opponent_style.has_value());
        if (cmd.opponent_style) b.add_opponent_style(ToFbStyle(*cmd.opponent_style));
        if (cmd.opponent) b.add_opponent(opp_off);
        if (cmd.player) b.add_player(player_off);
        auto const msg = b.Finish();

        return Finish(fbb, fb::Message::StartMatchMsg, msg.Union());
    }

    auto BuildServe(ServeKind const kind, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const m = fb::CreateServeMsg(fbb, msg_id, static_cast<fb::ServeKind>(std::to_underlying(kind)));
        return Finish(fbb, fb::Message::ServeMsg, m.Union());
    }

    auto BuildShot(ShotType const shot, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const m = fb::CreateShotMsg(fbb, msg_id, ToFbShot(shot));
        return Finish(fbb, fb::Message::ShotMsg, m.Union());
    }

    auto BuildContinue(std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const m = fb::CreateContinueMsg(fbb, msg_id);
        return Finish(fbb, fb::Message::ContinueMsg, m.Union());
    }

    // ---------- Builders (server -> client) ----------

    auto BuildUpdate(RallyUpdate const& u, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<uint8_t> const zones{std::to_underlying(u.zones[0]), std::to_underlying(u.zones[1])};
        std::vector<float> const stamina{static_cast<float>(u.stamina[0]), static_cast<float>(u.stamina[1])};
        std::vector<uint8_t> legal;
        legal.reserve(u.legal_shots.size());
        for (ShotType const s : u.legal_shots) legal.push_back(std::to_underlying(s));

        flatbuffers::Offset<fb::ShotEvent> shot_off{};
        if (u.last_shot)
        {
            ShotEvent const& e = *u.last_shot;
            shot_off = fb::CreateShotEvent(fbb, ToFbShot(e.type), ToFbPlayer(e.hitter),
                                           static_cast<fb::ShotOutcome>(std::to_underlying(e.outcome)),
                                           e.success, ToFbZone(e.resulting_zone), ToFbZone(e.receiver_zone),
                                           ToFbPlayer(e.beneficiary), static_cast<float>(e.probability));
        }

        // Score
        MatchScore const& sc = u.score;
        std::vector<flatbuffers::Offset<fb::SetScore>> sets;
        sets.reserve(sc.completed_sets.size());
        for (CompletedSet const& cs : sc.completed_sets)
        {
            fb::Pair const games = MakePair(cs.games);
            fb::Pair const tb = MakePair(cs.tiebreak_points);
            sets.push_back(fb::CreateSetScore(fbb, &games, cs.tiebreak_played, &tb));
        }
        auto const sets_off = fbb.CreateVector(sets);
        auto const label_off = fbb.CreateString(scoring::ScoreLine(sc));

        fb::Pair const points = MakePair(sc.points);
        fb::Pair const games = MakePair(sc.games);
        fb::Pair const set_count = MakePair(sc.sets);

        fb::ScoreBuilder sb(fbb);
        sb.add_points(&points);
        sb.add_games(&games);
        sb.add_sets(&set_count);
        sb.add_current_set(static_cast<uint8_t>(sc.current_set));
        sb.add_server(ToFbPlayer(sc.server));
        sb.add_tiebreak(sc.tiebreak);
        sb.add_tiebreak_first_server(ToFbPlayer(sc.tiebreak_first_server));
        sb.add_completed_sets(sets_off);
        sb.add_has_winner(sc.winner.has_value());
        if (sc.winner) sb.add_winner(ToFbPlayer(*sc.winner));
        sb.add_label(label_off);
        auto const score_off = sb.Finish();

        auto const zones_off = fbb.CreateVector(zones);
        auto const stamina_off = fbb.CreateVector(stamina);
        auto const legal_off = fbb.CreateVector(legal);

        fb::UpdateMsgBuilder b(fbb);
        b.add_msg_id(msg_id);
        b.add_zones(zones_off);
        b.add_stamina(stamina_off);
        if (u.last_shot) b.add_last_shot(shot_off);
        b.add_score(score_off);
        b.add_status(static_cast<fb::RallyStatus>(std::to_underlying(u.status)));
        b.add_has_point_winner(u.point_winner.has_value());
        if (u.point_winner) b.add_point_winner(ToFbPlayer(*u.point_winner));
        b.add_next_actor(ToFbPlayer(u.next_actor));
        b.add_phase(ToFbPhase(u.phase));
        b.add_legal_shots(legal_off);
        auto const msg = b.Finish();

        return Finish(fbb, fb::Message::UpdateMsg, msg.Union());
    }

    auto BuildViolation(error::RuleViolation const& v, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(error::describe(v));
        auto const vio = fb::CreateViolationMsg(fbb, msg_id, static_cast<int16_t>(v.code),
                                                std::to_underlying(v.kind()), txt);
        return Finish(fbb, fb::Message::ViolationMsg, vio.Union());
    }

    auto BuildError(std::string const& text, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(text);
        auto const err = fb::CreateErrorMsg(fbb, msg_id, txt);
        return Finish(fbb, fb::Message::ErrorMsg, err.Union());
    }

    // ---------- Decode (server <- client) ----------

    auto DecodeCommand(std::span<std::byte const> bytes) -> std::expected<Command, ParseError>
    {
        auto const env = VerifiedEnvelope(bytes);
        if (!env) return std::unexpected(env.error());

        switch ((*env)->message_type())
        {
        case fb::Message::StartMatchMsg:
        {
            auto const* m = (*env)->message_as_StartMatchMsg();
            StartCommand out{};
            out.msg_id = m->msg_id();
            if (m->best_of() != 0) out.best_of_sets = m->best_of();
            if (m->has_seed()) out.seed = m->seed();
            out.final_set_tiebreak = m->final_set_tiebreak();
            if (m->has_first_server())
            {
                out.first_server = FromFbPlayer(m->first_server());
                if (!out.first_server) return Fail("unknown first server");
            }
            else
            {
                out.first_server = std::nullopt;
            }
            if (m->has_opponent_style())
            {
                out.opponent_style = FromFbStyle(m->opponent_style());
                if (!out.opponent_style) return Fail("unknown opponent style");
            }
            if (auto const* p = m->opponent())
            {
                auto prof = DecodeProfile(p);
                if (!prof) return std::unexpected(prof.error());
                out.opponent = std::move(*prof);
            }
            if (auto const* p = m->player())
            {
                auto prof = DecodeProfile(p);
                if (!prof) return std::unexpected(prof.error());
                out.player = std::move(*prof);
            }
            return out;
        }

        case fb::Message::ServeMsg:
        {
            auto const* m = (*env)->message_as_ServeMsg();
            auto const raw = std::to_underlying(m->kind());
            if (raw > std::to_underlying(ServeKind::Second)) return Fail("unknown serve kind");
            return ServeCommand{ .msg_id = m->msg_id(), .kind = static_cast<ServeKind>(raw) };
        }

        case fb::Message::ShotMsg:
        {
            auto const* m = (*env)->message_as_ShotMsg();
            std::optional<ShotType> const shot = FromFbShot(m->shot());
            if (!shot) return Fail("unknown shot type");
            return ShotCommand{ .msg_id = m->msg_id(), .shot = *shot };
        }

        case fb::Message::ContinueMsg:
            return ContinueCommand{ .msg_id = (*env)->message_as_ContinueMsg()->msg_id() };

        default:
            return Fail("not a client command");
        }
    }

    // ---------- Decode (client <- server) ----------

    static auto DecodeScore(fb::Score const* s) -> std::expected<MatchScore, ParseError>
    {
        MatchScore out{};
        if (!s) return Fail("update without score");
        out.points = FromPair(s->points());
        out.games = FromPair(s->games());
        out.sets = FromPair(s->sets());
        out.current_set = s->current_set();
        out.tiebreak = s->tiebreak();

        std::optional<PlayerId> const server = FromFbPlayer(s->server());
        std::optional<PlayerId> const tb_first = FromFbPlayer(s->tiebreak_first_server());
        if (!server || !tb_first) return Fail("unknown player id in score");
        out.server = *server;
        out.tiebreak_first_server = *tb_first;

        if (auto const* sets = s->completed_sets())
        {
            for (auto const* cs : *sets)
            {
                CompletedSet c{};
                c.games = FromPair(cs->games());
                c.tiebreak_played = cs->tiebreak_played();
                c.tiebreak_points = FromPair(cs->tiebreak_points());
                out.completed_sets.push_back(c);
            }
        }
        if (s->has_winner())
        {
            std::optional<PlayerId> const w = FromFbPlayer(s->winner());
            if (!w) return Fail("unknown winner");
            out.winner = *w;
        }
        return out;
    }

    static auto DecodeUpdate(fb::UpdateMsg const* m) -> std::expected<RallyUpdate, ParseError>
    {
        RallyUpdate u{};
        auto const* zones = m->zones();
        auto const* stamina = m->stamina();
        if (!zones || zones->size() != constants::PlayerCount || !stamina || stamina->size() != constants::PlayerCount)
            return Fail("update needs one zone and one stamina per player");

        for (flatbuffers::uoffset_t i = 0; i < constants::PlayerCount; ++i)
        {
            std::optional<CourtZone> const z = FromFbZone(static_cast<fb::CourtZone>(zones->Get(i)));
            if (!z) return Fail("unknown court zone");
            u.zones[i] = *z;
            u.stamina[i] = static_cast<double>(stamina->Get(i));
        }

        if (auto const* e = m->last_shot())
        {
            ShotEvent ev{};
            auto const type = FromFbShot(e->type());
            auto const hitter = FromFbPlayer(e->hitter());
            auto const beneficiary = FromFbPlayer(e->beneficiary());
            auto const rz = FromFbZone(e->resulting_zone());
            auto const oz = FromFbZone(e->receiver_zone());
            auto const outcome_raw = std::to_underlying(e->outcome());
            if (!type || !hitter || !beneficiary || !rz || !oz || outcome_raw > std::to_underlying(ShotOutcome::Ace))
                return Fail("malformed shot event");
            ev.type = *type;
            ev.hitter = *hitter;
            ev.outcome = static_cast<ShotOutcome>(outcome_raw);
            ev.success = e->success();
            ev.resulting_zone = *rz;
            ev.receiver_zone = *oz;
            ev.beneficiary = *beneficiary;
            ev.probability = static_cast<double>(e->probability());
            u.last_shot = ev;
        }

        auto score = DecodeScore(m->score());
        if (!score) return std::unexpected(score.error());
        u.score = std::move(*score);

        auto const status_raw = std::to_underlying(m->status());
        if (status_raw > std::to_underlying(RallyStatus::MatchOver)) return Fail("unknown rally status");
        u.status = static_cast<RallyStatus>(status_raw);

        if (m->has_point_winner())
        {
            u.point_winner = FromFbPlayer(m->point_winner());
            if (!u.point_winner) return Fail("unknown point winner");
        }

        auto const next = FromFbPlayer(m->next_actor());
        auto const phase = FromFbPhase(m->phase());
        if (!next || !phase) return Fail("unknown actor or phase");
        u.next_actor = *next;
        u.phase = *phase;

        if (auto const* legal = m->legal_shots())
        {
            for (uint8_t const raw : *legal)
            {
                std::optional<ShotType> const s = FromFbShot(static_cast<fb::ShotType>(raw));
                if (!s) return Fail("unknown legal shot");
                u.legal_shots.push_back(*s);
            }
        }
        return u;
    }

    auto DecodeReply(std::span<std::byte const> bytes) -> std::expected<Reply, ParseError>
    {
        auto const env = VerifiedEnvelope(bytes);
        if (!env) return std::unexpected(env.error());

        switch ((*env)->message_type())
        {
        case fb::Message::UpdateMsg:
        {
            auto const* m = (*env)->message_as_UpdateMsg();
            auto u = DecodeUpdate(m);
            if (!u) return std::unexpected(u.error());
            return UpdateReply{ .msg_id = m->msg_id(), .update = std::move(*u) };
        }

        case fb::Message::ViolationMsg:
        {
            auto const* m = (*env)->message_as_ViolationMsg();
            auto const code = m->code();
            if (code < 0 || code > static_cast<int16_t>(error::RuleViolationCode::Internal_Unreachable))
                return Fail("unknown violation code");
            ViolationReply out{};
            out.msg_id = m->msg_id();
            out.code = static_cast<error::RuleViolationCode>(code);
            out.kind = error::KindOf(out.code);
            out.text = m->text() ? m->text()->str() : std::string{};
            return out;
        }

        case fb::Message::ErrorMsg:
        {
            auto const* m = (*env)->message_as_ErrorMsg();
            return ErrorReply{ .msg_id = m->msg_id(), .text = m->text() ? m->text()->str() : std::string{} };
        }

        default:
            return Fail("not a server reply");
        }
    }
} // namespace tennis::core::net
