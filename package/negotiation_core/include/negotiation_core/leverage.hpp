#pragma once

#include <string>

#include "negotiation_core/config.hpp"
#include "negotiation_core/contract.hpp"
#include "negotiation_core/session.hpp"
#include "negotiation_core/team.hpp"

namespace negotiation_core {

// Recomputed from scratch every round; only negotiation_round, the press
// leak count and recorded distrust carry history into the result.
Leverage compute_leverage(const NegotiationSession &session,
                          const ContractOffer &offer, const TeamContext &team,
                          const LeverageConfig &cfg);

// "User", "Agent" or "Balanced" (0.2 margin either way).
std::string dominant_party(const Leverage &leverage);

double leverage_gap(const Leverage &leverage);

} // namespace negotiation_core
