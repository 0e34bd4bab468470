#pragma once

#include "negotiation_core/config.hpp"
#include "negotiation_core/contract.hpp"
#include "negotiation_core/session.hpp"
#include "negotiation_core/team.hpp"

namespace negotiation_core {

// Minimum fit (APY / market value) the agent signs at, given the session's
// current leverage and mood.
double acceptance_threshold(const NegotiationSession &session,
                            const ContractOffer &offer,
                            const TeamContext &team,
                            const EvaluatorConfig &cfg);

// Lowest fit that still earns a counter-offer instead of a rejection.
double near_miss_floor(const Agent &agent, const EvaluatorConfig &cfg);

// Accept / counter / reject. Advances the round, moves the mood and
// recomputes leverage on `session`. Locked-out and accepted sessions are
// left untouched; during a phone-dead window only the round advances.
NegotiationResponse evaluate(NegotiationSession &session,
                             const ContractOffer &offer,
                             const TeamContext &team,
                             const NegotiationConfig &cfg);

// True when the offer was actually weighed (not short-circuited).
inline bool was_evaluated(NegotiationOutcome outcome) {
  return outcome == NegotiationOutcome::Accepted ||
         outcome == NegotiationOutcome::Countered ||
         outcome == NegotiationOutcome::Rejected ||
         outcome == NegotiationOutcome::CapInfeasible;
}

} // namespace negotiation_core
