#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "negotiation_core/agent.hpp"
#include "negotiation_core/contract.hpp"
#include "negotiation_core/mood.hpp"
#include "negotiation_core/team.hpp"

namespace negotiation_core {

// Each side's negotiating power, 0..1. The two values are independent.
struct Leverage {
  double user_leverage{0.5};
  double agent_leverage{0.5};
};

struct PressLeak {
  std::string headline;
  int round{0};
  double offer_amount{0.0}; // APY of the leaked offer
  double market_value{0.0};
};

struct ShadowAdvisorEvent {
  std::string advisor_name;
  std::string player_name;
  double demand{0.0};
  int round{0};
};

enum class ShadowAdvisorAction { Engage, Report };

// Session states. Locked-out and accepted are absorbing.
struct Normal {};
struct PhoneDead {
  int until_round{0};
};
struct ShadowPending {
  ShadowAdvisorEvent event;
};
struct LockedOut {
  std::string reason;
};
struct Accepted {
  ContractOffer offer;
};

using SessionState =
    std::variant<Normal, PhoneDead, ShadowPending, LockedOut, Accepted>;

const char *state_name(const SessionState &state);

struct NegotiationSession {
  std::string player_id;
  std::string player_name;
  Agent agent;
  AgentMood agent_mood{AgentMood::Neutral};
  double market_value{0.0};
  int negotiation_round{1};
  Leverage leverage{};
  SessionState state{Normal{}};
  std::vector<PressLeak> press_leaks;
  TeamContext team;

  // round history
  int consecutive_angry_rejections{0};
  int lowball_strikes{0};
  int shadow_events_seen{0};
  int unanswered_shadow_rounds{0};
  int distrust{0};
  std::optional<ContractOffer> last_offer;
  std::optional<ContractOffer> outstanding_counter; // agent's latest demand

  bool is_active() const {
    return !std::holds_alternative<LockedOut>(state) &&
           !std::holds_alternative<Accepted>(state);
  }
  bool is_locked_out() const {
    return std::holds_alternative<LockedOut>(state);
  }
  bool is_accepted() const { return std::holds_alternative<Accepted>(state); }

  std::optional<std::string> lockout_reason() const {
    if (const auto *l = std::get_if<LockedOut>(&state))
      return l->reason;
    return std::nullopt;
  }
  std::optional<int> phone_dead_until_round() const {
    if (const auto *p = std::get_if<PhoneDead>(&state))
      return p->until_round;
    return std::nullopt;
  }
  std::optional<ShadowAdvisorEvent> pending_shadow_event() const {
    if (const auto *s = std::get_if<ShadowPending>(&state))
      return s->event;
    return std::nullopt;
  }
};

enum class NegotiationOutcome {
  Accepted,
  Countered,
  Rejected,
  CapInfeasible,
  PhoneDead,
  LockedOut,
  AlreadyAgreed
};

const char *to_string(NegotiationOutcome outcome);

struct NegotiationResponse {
  bool accepted{false};
  AgentMood new_mood{AgentMood::Neutral};
  std::string message;
  std::optional<ContractOffer> counter_offer;
  NegotiationOutcome outcome{NegotiationOutcome::Rejected};
  bool is_lockout{false};
  int phone_dead_days{0};
};

} // namespace negotiation_core
