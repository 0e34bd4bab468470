#include "negotiation_core/events.hpp"
#include "negotiation_core/random.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <random>
#include <string>

#include <fmt/format.h>

namespace negotiation_core {

namespace {

enum class EventKind : std::uint64_t {
  PressLeak = 1,
  PressHeadline = 2,
  ShadowAdvisor = 3,
  ShadowDetails = 4
};

const std::array<const char *, 3> kAdvisorNames = {"Saint Omni",
                                                   "Business Partner", "Uncle"};

std::mt19937_64 roll_rng(std::uint64_t seed, const NegotiationSession &s,
                         EventKind kind) {
  const std::uint64_t player = mix_seed(seed, hash_id(s.player_id));
  const std::uint64_t salt =
      (static_cast<std::uint64_t>(s.negotiation_round) << 8) ^
      static_cast<std::uint64_t>(kind);
  return std::mt19937_64(mix_seed(player, salt));
}

double roll(std::uint64_t seed, const NegotiationSession &s, EventKind kind) {
  std::mt19937_64 rng = roll_rng(seed, s, kind);
  std::uniform_real_distribution<double> unif(0.0, 1.0);
  return unif(rng);
}

double leak_mood_factor(AgentMood mood, const EventConfig &cfg) {
  switch (mood) {
  case AgentMood::Angry:
    return cfg.angry_leak_factor;
  case AgentMood::Neutral:
    return cfg.neutral_leak_factor;
  case AgentMood::Interested:
    return cfg.interested_leak_factor;
  case AgentMood::Excited:
    return 0.0;
  }
  return 0.0;
}

std::string leak_headline(const NegotiationSession &s, double offer_apy,
                          int variant) {
  const std::string team = s.team.team_name.empty() ? "the team" : s.team.team_name;
  switch (s.agent_mood) {
  case AgentMood::Angry:
    if (variant == 0)
      return fmt::format("{}'s camp calls {}'s {} offer 'disrespectful'",
                         s.player_name, team, format_money(offer_apy));
    return fmt::format("Report: {} insulted by {} lowball, open to trade",
                       s.player_name, team);
  case AgentMood::Neutral:
    return fmt::format("Sources: {} and {} still far apart in contract talks",
                       s.player_name, team);
  case AgentMood::Interested:
  case AgentMood::Excited:
    return fmt::format("{} talks with {} drag on despite progress",
                       s.player_name, team);
  }
  return s.player_name;
}

bool maybe_press_leak(NegotiationSession &s, const EventConfig &cfg,
                      std::uint64_t seed) {
  if (std::holds_alternative<PhoneDead>(s.state))
    return false;
  if (s.negotiation_round < cfg.press_leak_min_round)
    return false;
  const double mood_factor = leak_mood_factor(s.agent_mood, cfg);
  if (mood_factor <= 0.0)
    return false;

  const double growth = std::min(
      cfg.press_leak_round_cap,
      cfg.press_leak_round_growth *
          static_cast<double>(s.negotiation_round - cfg.press_leak_min_round));
  const double p = std::min(
      1.0, mood_factor * (cfg.press_leak_propensity.of(s.agent.archetype) *
                              (0.5 + s.agent.mood_volatility) +
                          growth));
  if (roll(seed, s, EventKind::PressLeak) >= p)
    return false;

  const double apy = s.last_offer ? average_per_year(*s.last_offer) : 0.0;
  std::mt19937_64 rng = roll_rng(seed, s, EventKind::PressHeadline);
  std::uniform_int_distribution<int> pick(0, 1);

  PressLeak leak;
  leak.headline = leak_headline(s, apy, pick(rng));
  leak.round = s.negotiation_round;
  leak.offer_amount = apy;
  leak.market_value = s.market_value;
  s.press_leaks.push_back(leak);
  return true;
}

bool maybe_phone_dead(NegotiationSession &s, const EventConfig &cfg) {
  if (!std::holds_alternative<Normal>(s.state))
    return false;
  if (s.consecutive_angry_rejections < cfg.phone_dead_after_rejections)
    return false;
  s.state = PhoneDead{s.negotiation_round + cfg.phone_dead_cooldown};
  s.consecutive_angry_rejections = 0;
  return true;
}

bool maybe_shadow_advisor(NegotiationSession &s, const EventConfig &cfg,
                          std::uint64_t seed) {
  if (!std::holds_alternative<Normal>(s.state))
    return false;
  if (s.shadow_events_seen >= cfg.max_shadow_events)
    return false;
  if (s.leverage.agent_leverage < cfg.shadow_min_agent_leverage)
    return false;
  if (roll(seed, s, EventKind::ShadowAdvisor) >=
      cfg.shadow_probability.of(s.agent.archetype))
    return false;

  std::mt19937_64 rng = roll_rng(seed, s, EventKind::ShadowDetails);
  std::uniform_int_distribution<int> pick(0, 2);
  std::uniform_real_distribution<double> spread(0.0, cfg.shadow_demand_spread);

  ShadowAdvisorEvent ev;
  ev.advisor_name = kAdvisorNames[static_cast<std::size_t>(pick(rng))];
  ev.player_name = s.player_name;
  ev.demand = s.market_value * (cfg.shadow_demand_min + spread(rng));
  ev.round = s.negotiation_round;
  s.state = ShadowPending{ev};
  ++s.shadow_events_seen;
  return true;
}

bool maybe_lockout(NegotiationSession &s, const EventConfig &cfg,
                   const std::string &ignored_advisor) {
  std::string reason;
  if (s.lowball_strikes >= s.agent.lowball_tolerance) {
    reason = fmt::format("{} has cut off negotiations after repeated lowball "
                         "offers.",
                         s.agent.name);
  } else if (!ignored_advisor.empty() &&
             s.unanswered_shadow_rounds >= cfg.shadow_ignore_limit) {
    reason = fmt::format("{} went public after being ignored. {} is done "
                         "negotiating.",
                         ignored_advisor, s.player_name);
  } else if (s.negotiation_round > max_rounds(s.agent, cfg)) {
    reason = fmt::format("{} has run out of patience after {} rounds of talks.",
                         s.player_name, s.negotiation_round - 1);
  }
  if (reason.empty())
    return false;
  s.state = LockedOut{reason};
  return true;
}

} // namespace

int max_rounds(const Agent &agent, const EventConfig &cfg) {
  return cfg.base_max_rounds +
         static_cast<int>(std::lround(agent.patience * cfg.patience_round_bonus));
}

ScheduledEvents schedule_events(NegotiationSession &session,
                                const EventConfig &cfg, std::uint64_t seed) {
  ScheduledEvents out;
  if (!session.is_active())
    return out;

  // An offer went in while the advisor was still waiting on an answer.
  std::string ignored_advisor;
  if (const auto *sp = std::get_if<ShadowPending>(&session.state)) {
    ++session.unanswered_shadow_rounds;
    ignored_advisor = sp->event.advisor_name;
  }

  out.press_leak = maybe_press_leak(session, cfg, seed);
  out.phone_dead = maybe_phone_dead(session, cfg);
  out.shadow_advisor = maybe_shadow_advisor(session, cfg, seed);
  out.lockout = maybe_lockout(session, cfg, ignored_advisor);
  return out;
}

} // namespace negotiation_core
