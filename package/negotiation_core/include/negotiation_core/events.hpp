#pragma once

#include <cstdint>

#include "negotiation_core/config.hpp"
#include "negotiation_core/session.hpp"

namespace negotiation_core {

// What fired during one scheduling pass.
struct ScheduledEvents {
  bool press_leak{false};
  bool phone_dead{false};
  bool shadow_advisor{false};
  bool lockout{false};
};

// Hard cap on rounds before the player walks away.
int max_rounds(const Agent &agent, const EventConfig &cfg);

// Run once after every evaluated offer, in order: press leak, phone dead,
// shadow advisor, lockout. Rolls are drawn from `seed` mixed with the
// player id, round and event kind, so a given seed replays exactly.
ScheduledEvents schedule_events(NegotiationSession &session,
                                const EventConfig &cfg, std::uint64_t seed);

} // namespace negotiation_core
