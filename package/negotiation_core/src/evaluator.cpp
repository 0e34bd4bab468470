#include "negotiation_core/evaluator.hpp"
#include "negotiation_core/leverage.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

namespace negotiation_core {

namespace {

double mood_adjust(AgentMood mood, const EvaluatorConfig &cfg) {
  switch (mood) {
  case AgentMood::Excited:
    return cfg.excited_adjust;
  case AgentMood::Interested:
    return cfg.interested_adjust;
  case AgentMood::Neutral:
    return 0.0;
  case AgentMood::Angry:
    return cfg.angry_adjust;
  }
  return 0.0;
}

// Self-represented players take it on the chin: never below Neutral.
AgentMood mood_after_rejection(const NegotiationSession &s) {
  const AgentMood next = worsen(s.agent_mood);
  if (s.agent.archetype == AgentArchetype::SelfRepresented &&
      next < AgentMood::Neutral)
    return AgentMood::Neutral;
  return next;
}

// Scale salaries and bonus so APY lands on target_apy, rounded up to the
// next $1K. Guarantees grow by the same factor.
ContractOffer build_counter(const ContractOffer &offer, double target_apy,
                            int round) {
  const double apy = average_per_year(offer);
  const double factor = apy > 0.0 ? target_apy / apy : 1.0;
  const auto round_up = [](double v) { return std::ceil(v / 1000.0) * 1000.0; };

  Eigen::VectorXd base = offer.base_salary_per_year * factor;
  for (int i = 0; i < base.size(); ++i)
    base[i] = round_up(base[i]);
  const double bonus = round_up(offer.signing_bonus * factor);
  const double total = base.sum() + bonus;
  const double guaranteed =
      std::min(total, round_up(offer.guaranteed_money * factor));

  return ContractOffer(fmt::format("{}-counter-r{}", offer.id, round), base,
                       bonus, guaranteed, offer.void_years,
                       offer.offset_language, offer.ltbe_incentives,
                       offer.nltbe_incentives);
}

// The agent stands by its own demand.
bool meets_counter(const NegotiationSession &s, const ContractOffer &offer) {
  if (!s.outstanding_counter)
    return false;
  const ContractOffer &c = *s.outstanding_counter;
  return average_per_year(offer) >= average_per_year(c) &&
         offer.guaranteed_money >= c.guaranteed_money;
}

void note_rejection(NegotiationSession &s, AgentMood next) {
  s.agent_mood = next;
  if (next == AgentMood::Angry)
    ++s.consecutive_angry_rejections;
  else
    s.consecutive_angry_rejections = 0;
}

} // namespace

double near_miss_floor(const Agent &agent, const EvaluatorConfig &cfg) {
  if (agent.archetype == AgentArchetype::SelfRepresented)
    return cfg.literal_near_miss_floor;
  return cfg.near_miss_floor;
}

double acceptance_threshold(const NegotiationSession &session,
                            const ContractOffer &offer,
                            const TeamContext &team,
                            const EvaluatorConfig &cfg) {
  const Agent &agent = session.agent;
  const double balance =
      session.leverage.user_leverage - session.leverage.agent_leverage;
  double t = cfg.base_threshold * (1.0 - cfg.leverage_weight * balance);
  t += mood_adjust(session.agent_mood, cfg);
  t += cfg.archetype_adjust.of(agent.archetype);
  if (team.is_contender)
    t -= cfg.contender_discount.of(agent.archetype);
  const double extra_gtd =
      std::max(0.0, guaranteed_percentage(offer) - cfg.guarantee_pivot);
  t -= cfg.guarantee_bonus_weight * agent.guarantee_weight * extra_gtd;
  return std::min(cfg.max_threshold, std::max(cfg.min_threshold, t));
}

NegotiationResponse evaluate(NegotiationSession &session,
                             const ContractOffer &offer,
                             const TeamContext &team,
                             const NegotiationConfig &cfg) {
  NegotiationResponse res;
  res.new_mood = session.agent_mood;
  const std::string &agent_name = session.agent.name;

  if (const auto *l = std::get_if<LockedOut>(&session.state)) {
    res.outcome = NegotiationOutcome::LockedOut;
    res.is_lockout = true;
    res.message = fmt::format("Negotiations terminated: {}", l->reason);
    return res;
  }
  if (session.is_accepted()) {
    res.outcome = NegotiationOutcome::AlreadyAgreed;
    res.message = fmt::format(
        "{}: We already have a deal. Send the paperwork.", agent_name);
    return res;
  }
  if (const auto *p = std::get_if<PhoneDead>(&session.state)) {
    if (session.negotiation_round < p->until_round) {
      const int until = p->until_round;
      ++session.negotiation_round;
      if (session.negotiation_round >= until)
        session.state = Normal{};
      res.outcome = NegotiationOutcome::PhoneDead;
      res.phone_dead_days = std::max(0, until - session.negotiation_round) * 7;
      res.message = fmt::format("{} is not taking calls ({} days).",
                                agent_name, res.phone_dead_days);
      return res;
    }
    session.state = Normal{};
  }

  session.leverage = compute_leverage(session, offer, team, cfg.leverage);

  const EvaluatorConfig &ec = cfg.evaluator;
  const double market = std::max(1.0, session.market_value);
  const double apy = average_per_year(offer);
  const double fit = apy / market;
  const double threshold = acceptance_threshold(session, offer, team, ec);
  const double cap_hit = cap_hit_year1(offer);

  if (offer.years > session.agent.max_contract_length) {
    note_rejection(session, mood_after_rejection(session));
    res.outcome = NegotiationOutcome::Rejected;
    res.message = fmt::format("{}: {} won't commit beyond {} years.",
                              agent_name, session.player_name,
                              session.agent.max_contract_length);
  } else if (cap_hit > team.cap_space) {
    res.outcome = NegotiationOutcome::CapInfeasible;
    res.message = fmt::format(
        "Offer rejected: year-1 cap hit of {} exceeds available cap space of {}.",
        format_money(cap_hit), format_money(team.cap_space));
  } else if (fit >= threshold || meets_counter(session, offer)) {
    session.agent_mood = improve(session.agent_mood);
    session.consecutive_angry_rejections = 0;
    session.state = Accepted{offer};
    session.outstanding_counter.reset();
    res.accepted = true;
    res.outcome = NegotiationOutcome::Accepted;
    res.message = fmt::format("{}: We have a deal. {} at {} a year works.",
                              agent_name, session.player_name,
                              format_money(apy));
  } else if (fit >= near_miss_floor(session.agent, ec)) {
    session.agent_mood = step_toward(session.agent_mood, AgentMood::Interested);
    session.consecutive_angry_rejections = 0;
    res.counter_offer =
        build_counter(offer, market * threshold, session.negotiation_round);
    session.outstanding_counter = res.counter_offer;
    res.outcome = NegotiationOutcome::Countered;
    res.message = fmt::format("{}: We're close. Get to {} a year and we can talk.",
                              agent_name,
                              format_money(average_per_year(*res.counter_offer)));
  } else {
    note_rejection(session, mood_after_rejection(session));
    ++session.lowball_strikes;
    res.outcome = NegotiationOutcome::Rejected;
    res.message = fmt::format("{}: {:.0f}% of market value? Not even close.",
                              agent_name, fit * 100.0);
  }

  session.last_offer = offer;
  session.team = team;
  ++session.negotiation_round;
  session.leverage = compute_leverage(session, offer, team, cfg.leverage);
  res.new_mood = session.agent_mood;
  return res;
}

} // namespace negotiation_core
