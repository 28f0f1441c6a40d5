//
// Created by Malik T on 08/10/2025.
//

#ifndef TENNISSIM_RULES_HPP
#define TENNISSIM_RULES_HPP

#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace tennis::core
{
    //forward declaration
    class Match;

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Turn checks (finished match, wrong actor) come before action checks.
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(Match const& match, PlayerId actor, PlayerAction const& a) const -> CheckResult = 0;

        // Resolves the action against the match rng and records the shot.
        virtual auto Apply(Match& match, PlayerId actor, PlayerAction const& a) -> void = 0;

        // Feeds a decided point into the scoring machine and resets for the next one.
        virtual auto Advance(Match& match) -> RallyStatus = 0;
    };
}

#endif //TENNISSIM_RULES_HPP
