#include "MatchLogger.hpp"

#include <algorithm>
#include <iomanip>
#include <ios>
#include <string>
#include <string_view>

#include "../core/Fatigue.hpp"
#include "../core/Scoring.hpp"
#include "../core/Util.hpp"

using namespace tennis::core;

namespace
{

auto write_profile(std::ostream& out, std::string_view who, Profile const& p) -> void
{
    out << who << ": style=" << util::ToString(p.style)
        << " endurance=" << std::fixed << std::setprecision(2) << p.endurance << " skills=[";
    bool first = true;
    for (ShotType const s : AllShots)
    {
        out << (first ? "" : ",") << util::ToString(s) << ':' << p.Skill(s)
            << (p.IsStrength(s) ? "*" : "");
        first = false;
    }
    out << "]\n";
}

auto write_stats(std::ostream& out, std::string_view who, PlayerStats const& s) -> void
{
    out << who << ": points=" << s.points_won
        << " aces=" << s.aces
        << " double_faults=" << s.double_faults
        << " first_in=" << s.first_serves_in << '/' << s.first_serves_attempted
        << " winners=" << s.winners
        << " unforced=" << s.unforced_errors
        << " forced_drawn=" << s.forced_errors_drawn << '\n';
}

} // anonymous namespace

namespace tennis::core::debug
{

MatchLogger::MatchLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

MatchLogger::~MatchLogger() = default;

auto MatchLogger::start(Match const& match) -> void
{
    out_ << "Seed=" << match.Seed() << '\n';
    out_ << "BestOf=" << static_cast<int>(match.Format().best_of_sets)
         << " FinalSetTiebreak=" << (match.Format().final_set_tiebreak ? "yes" : "no") << '\n';
    out_ << "FirstServer=" << util::ToString(match.Score().server) << '\n';
    write_profile(out_, "Player", match.Player(PlayerId::Human).profile);
    write_profile(out_, "Opponent", match.Player(PlayerId::Opponent).profile);
    out_.flush();
}

auto MatchLogger::update(RallyUpdate const& u) -> void
{
    if (u.last_shot)
    {
        ShotEvent const& e = *u.last_shot;
        out_ << "Shot " << util::ToString(e.hitter) << ' ' << util::ToString(e.type)
             << " p=" << std::fixed << std::setprecision(3) << e.probability
             << " -> " << util::ToString(e.outcome)
             << " zones=" << util::ToString(u.zones[0]) << '/' << util::ToString(u.zones[1])
             << " stamina=" << std::setprecision(2) << u.stamina[0] << " (" << FatigueLabel(u.stamina[0]) << ")/"
             << u.stamina[1] << " (" << FatigueLabel(u.stamina[1]) << ")\n";
    }

    if (u.status != RallyStatus::InProgress)
    {
        out_ << util::ToString(u.status);
        if (u.point_winner) out_ << " to " << util::ToString(*u.point_winner);
        out_ << " | " << scoring::ScoreLine(u.score) << '\n';
    }
}

auto MatchLogger::violation(error::RuleViolation const& v) -> void
{
    out_ << "Rejected: " << error::describe(v) << '\n';
}

auto MatchLogger::internal_error(std::string const& what) -> void
{
    out_ << "Abandoned: " << what << '\n';
}

auto MatchLogger::end(Match const& match) -> void
{
    MatchScore const& score = match.Score();
    out_ << "Winner=" << (score.winner ? util::ToString(*score.winner) : std::string_view{"none"}) << '\n';

    std::string sets;
    for (CompletedSet const& cs : score.completed_sets)
    {
        sets += sets.empty() ? "" : " ";
        sets += std::to_string(cs.games[0]) + "-" + std::to_string(cs.games[1]);
        if (cs.tiebreak_played)
            sets += "(" + std::to_string(std::min(cs.tiebreak_points[0], cs.tiebreak_points[1])) + ")";
    }
    out_ << "Sets=" << sets << '\n';

    MatchStats const& stats = match.Stats();
    write_stats(out_, "Player", stats.players[Idx(PlayerId::Human)]);
    write_stats(out_, "Opponent", stats.players[Idx(PlayerId::Opponent)]);
    out_ << "Points=" << stats.points_played << " LongestRally=" << stats.longest_rally << '\n';
    out_.flush();
}

auto MatchLogger::flush() -> void
{
    out_.flush();
}

}
