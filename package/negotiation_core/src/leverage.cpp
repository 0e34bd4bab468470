#include "negotiation_core/leverage.hpp"

#include <algorithm>
#include <cmath>

namespace negotiation_core {

namespace {

double clamp01(double v) { return std::min(1.0, std::max(0.0, v)); }

} // namespace

Leverage compute_leverage(const NegotiationSession &session,
                          const ContractOffer &offer, const TeamContext &team,
                          const LeverageConfig &cfg) {
  const double market = std::max(1.0, session.market_value);

  // Agent fatigue works both ways and is capped.
  const double fatigue =
      std::min(cfg.fatigue_cap,
               cfg.fatigue_per_round *
                   static_cast<double>(std::max(0, session.negotiation_round - 1)));

  // Agent: player is worth more than the team can comfortably fit, or the
  // team is thin at the position.
  const double cap_pressure =
      clamp01((session.market_value - team.cap_space) / market);
  const double scarcity =
      1.0 / static_cast<double>(std::max(1, team.position_depth));
  Leverage lev;
  lev.agent_leverage =
      clamp01(cfg.base + cfg.cap_pressure_weight * cap_pressure +
              cfg.scarcity_weight * scarcity + fatigue);

  // User: cap room to spare after this offer, a shot at a ring, and bad press
  // for the player's camp.
  const double margin = clamp01((team.cap_space - cap_hit_year1(offer)) / market);
  const double ring =
      team.is_contender ? cfg.contender_weight * session.agent.ring_weight : 0.0;
  const double press = std::min(
      cfg.press_leak_cap,
      cfg.press_leak_weight * static_cast<double>(session.press_leaks.size()));
  const double distrust =
      cfg.distrust_penalty * static_cast<double>(session.distrust);
  lev.user_leverage = clamp01(cfg.base + cfg.cap_margin_weight * margin + ring +
                              press + fatigue - distrust);
  return lev;
}

std::string dominant_party(const Leverage &leverage) {
  if (leverage.user_leverage > leverage.agent_leverage + 0.2)
    return "User";
  if (leverage.agent_leverage > leverage.user_leverage + 0.2)
    return "Agent";
  return "Balanced";
}

double leverage_gap(const Leverage &leverage) {
  return std::abs(leverage.user_leverage - leverage.agent_leverage);
}

} // namespace negotiation_core
