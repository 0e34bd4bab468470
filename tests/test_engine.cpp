#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "negotiation_core/engine.hpp"
#include "negotiation_core/errors.hpp"
#include "negotiation_core/market.hpp"

#define NC_ASSERT(expr)                                                        \
  do {                                                                         \
    if (!(expr)) {                                                             \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":"             \
                << __LINE__ << ")\n";                                          \
      return 1;                                                                \
    }                                                                          \
  } while (0)

using namespace negotiation_core;

namespace {

Player shark_player(const std::string &id) {
  Player p(id, "Marcus", "Hale", Position::WR, 27, 88);
  PlayerTraits t;
  t.marketability = 80;
  t.team_player = 30;
  p.traits = t;
  return p;
}

Player family_player(const std::string &id) {
  Player p(id, "Danny", "Webb", Position::LB, 27, 75);
  PlayerTraits t;
  t.loyalty = 85;
  t.team_player = 85;
  p.traits = t;
  return p;
}

NegotiationConfig always_shadow() {
  NegotiationConfig cfg;
  cfg.events.shadow_probability = ArchetypeWeights{1.0, 1.0, 1.0, 1.0};
  cfg.events.shadow_min_agent_leverage = 0.0;
  return cfg;
}

// Opens a Family Friend session and submits an offer in the counter band,
// which with always_shadow() leaves a shadow advisor event pending.
int open_shadow_session(NegotiationEngine &engine, const Player &p) {
  engine.begin_negotiation(p, 50e6, 3, false, 10e6);
  const NegotiationResponse r = engine.submit_offer(
      p.id, ContractOffer::flat("near", 1, 8'500'000.0, 0.0, 4e6));
  NC_ASSERT(r.outcome == NegotiationOutcome::Countered);
  NC_ASSERT(engine.get_session(p.id)->pending_shadow_event().has_value());
  return 0;
}

} // namespace

int test_engine_lifecycle() {
  // begin is idempotent.
  {
    NegotiationEngine engine(42);
    const Player p = family_player("fam-1");
    const NegotiationSession &a = engine.begin_negotiation(p, 50e6, 3, false, 10e6);
    const NegotiationSession &b = engine.begin_negotiation(p, 1e6, 0, true, 99e6);
    NC_ASSERT(&a == &b);
    NC_ASSERT(engine.session_count() == 1);
    NC_ASSERT(b.market_value == 10e6);
    NC_ASSERT(b.agent.archetype == AgentArchetype::FamilyFriend);
    NC_ASSERT(b.agent_mood == AgentMood::Interested);
    NC_ASSERT(b.negotiation_round == 1);
  }

  // Opening with a full team snapshot keeps its name and cash tier.
  {
    NegotiationEngine engine(42);
    TeamContext team;
    team.team_name = "Green Bay";
    team.cap_space = 30e6;
    team.position_depth = 2;
    team.is_contender = true;
    team.cash_reserve_tier = CashReserveTier::Tight;
    const NegotiationSession &s =
        engine.begin_negotiation(family_player("fam-team"), team, 10e6);
    NC_ASSERT(s.team.team_name == "Green Bay");
    NC_ASSERT(s.team.cash_reserve_tier == CashReserveTier::Tight);
    NC_ASSERT(s.team.is_contender);
    NC_ASSERT(s.market_value == 10e6);
  }

  // Market value defaults to the player's rating.
  {
    NegotiationEngine engine(42);
    const Player p = family_player("fam-mv");
    const NegotiationSession &s = engine.begin_negotiation(p, 50e6, 3, false);
    NC_ASSERT(s.market_value == market_value_for_player(p));
    NC_ASSERT(s.market_value > 0.0);
  }

  // Unknown sessions.
  {
    NegotiationEngine engine(42);
    NC_ASSERT(engine.get_session("nobody") == nullptr);
    bool threw = false;
    try {
      engine.submit_offer("nobody",
                          ContractOffer::flat("x", 1, 1e6, 0.0, 0.0));
    } catch (const SessionNotFound &e) {
      threw = e.player_id() == "nobody";
    }
    NC_ASSERT(threw);
    threw = false;
    try {
      engine.respond_to_shadow_advisor("nobody", ShadowAdvisorAction::Engage);
    } catch (const SessionNotFound &) {
      threw = true;
    }
    NC_ASSERT(threw);
  }

  // A malformed offer is rejected before anything changes.
  {
    NegotiationEngine engine(42);
    const Player p = family_player("fam-bad");
    engine.begin_negotiation(p, 50e6, 3, false, 10e6);
    ContractOffer bad = ContractOffer::flat("bad", 2, 5e6, 1e6, 0.0);
    bad.signing_bonus = -1.0;
    bool threw = false;
    try {
      engine.submit_offer(p.id, bad);
    } catch (const InvalidOffer &) {
      threw = true;
    }
    NC_ASSERT(threw);
    const NegotiationSession *s = engine.get_session(p.id);
    NC_ASSERT(s->negotiation_round == 1);
    NC_ASSERT(!s->last_offer.has_value());
  }

  // Lowball, then a real offer: the Shark signs.
  {
    NegotiationEngine engine(7);
    const Player p = shark_player("shark-1");
    engine.begin_negotiation(p, 60e6, 4, true, 20e6);
    NC_ASSERT(engine.get_session(p.id)->agent.archetype == AgentArchetype::Shark);

    const NegotiationResponse low = engine.submit_offer(
        p.id, ContractOffer::flat("o1", 3, 14e6, 0.0, 20e6));
    NC_ASSERT(!low.accepted);
    NC_ASSERT(low.outcome == NegotiationOutcome::Rejected);
    NC_ASSERT(low.new_mood == AgentMood::Angry);
    NC_ASSERT(!low.is_lockout);
    NC_ASSERT(engine.get_session(p.id)->lowball_strikes == 1);

    const NegotiationResponse deal = engine.submit_offer(
        p.id, ContractOffer::flat("o2", 3, 19'500'000.0, 0.0, 45e6));
    NC_ASSERT(deal.accepted);
    NC_ASSERT(deal.outcome == NegotiationOutcome::Accepted);
    const NegotiationSession *s = engine.get_session(p.id);
    NC_ASSERT(s->is_accepted());
    NC_ASSERT(s->negotiation_round == 3);
    NC_ASSERT(engine.active_sessions().empty());

    const NegotiationResponse again = engine.submit_offer(
        p.id, ContractOffer::flat("o3", 1, 1e6, 0.0, 0.0));
    NC_ASSERT(!again.accepted);
    NC_ASSERT(again.outcome == NegotiationOutcome::AlreadyAgreed);
    NC_ASSERT(engine.get_session(p.id)->negotiation_round == 3);

    NC_ASSERT(engine.complete_signing(p.id));
    NC_ASSERT(engine.get_session(p.id) == nullptr);
    NC_ASSERT(engine.session_count() == 0);
  }

  // Two lowballs against a Shark: locked out for good.
  {
    NegotiationEngine engine(7);
    const Player p = shark_player("shark-2");
    engine.begin_negotiation(p, 60e6, 4, true, 20e6);
    const ContractOffer low = ContractOffer::flat("low", 2, 10e6, 0.0, 0.0);
    NC_ASSERT(!engine.submit_offer(p.id, low).is_lockout);
    const NegotiationResponse second = engine.submit_offer(p.id, low);
    NC_ASSERT(second.is_lockout);
    NC_ASSERT(engine.get_session(p.id)->is_locked_out());

    const int round = engine.get_session(p.id)->negotiation_round;
    const Leverage lev = engine.get_session(p.id)->leverage;
    const AgentMood mood = engine.get_session(p.id)->agent_mood;
    const NegotiationResponse after = engine.submit_offer(
        p.id, ContractOffer::flat("rich", 3, 30e6, 0.0, 90e6));
    NC_ASSERT(!after.accepted);
    NC_ASSERT(after.is_lockout);
    NC_ASSERT(after.outcome == NegotiationOutcome::LockedOut);
    NC_ASSERT(engine.get_session(p.id)->negotiation_round == round);
    NC_ASSERT(engine.get_session(p.id)->leverage.user_leverage ==
              lev.user_leverage);
    NC_ASSERT(engine.get_session(p.id)->leverage.agent_leverage ==
              lev.agent_leverage);
    NC_ASSERT(engine.get_session(p.id)->agent_mood == mood);
    NC_ASSERT(after.new_mood == mood);
    NC_ASSERT(!engine.complete_signing(p.id));
    NC_ASSERT(engine.active_sessions().empty());
    NC_ASSERT(engine.session_count() == 1);
  }

  // Session bookkeeping.
  {
    NegotiationEngine engine(1);
    engine.begin_negotiation(family_player("b"), 50e6, 3, false, 10e6);
    engine.begin_negotiation(family_player("a"), 50e6, 3, false, 10e6);
    engine.begin_negotiation(family_player("c"), 50e6, 3, false, 10e6);
    NC_ASSERT((engine.active_sessions() == std::vector<std::string>{"a", "b", "c"}));
    NC_ASSERT(!engine.complete_signing("a"));
    NC_ASSERT(engine.abandon_negotiation("b"));
    NC_ASSERT(!engine.abandon_negotiation("b"));
    NC_ASSERT(engine.session_count() == 2);
    engine.close_window();
    NC_ASSERT(engine.session_count() == 0);
    NC_ASSERT(engine.active_sessions().empty());
  }

  // Extension talks pull the team snapshot from the registry.
  {
    RosterTable roster;
    TeamRecord dal;
    dal.id = "DAL";
    dal.name = "Dallas";
    dal.salary_cap = 200e6;
    dal.committed_cap = 150e6;
    dal.wins = 10;
    dal.losses = 4;
    roster.add_team(dal);

    Player p = family_player("ext-1");
    p.team_id = "DAL";
    roster.add_player(p);
    Player mate = family_player("ext-2");
    mate.team_id = "DAL";
    roster.add_player(mate);

    NegotiationEngine engine(3);
    NC_ASSERT(engine.start_extension_negotiation(p) == nullptr);
    engine.set_team_registry(&roster);

    const NegotiationSession *s = engine.start_extension_negotiation(p);
    NC_ASSERT(s != nullptr);
    NC_ASSERT(s->team.team_name == "Dallas");
    NC_ASSERT(s->team.cap_space == 50e6);
    NC_ASSERT(s->team.is_contender);
    NC_ASSERT(s->team.position_depth == 2);

    Player free_agent = family_player("ext-3");
    NC_ASSERT(engine.start_extension_negotiation(free_agent) == nullptr);
    free_agent.team_id = "NYG";
    NC_ASSERT(engine.start_extension_negotiation(free_agent) == nullptr);
    NC_ASSERT(engine.session_count() == 1);
  }
  return 0;
}

int test_engine_events() {
  // Angry twice: the phone goes dead, rounds keep moving, then talks resume.
  {
    NegotiationEngine engine(5);
    const Player p = shark_player("phone-1");
    engine.begin_negotiation(p, 60e6, 4, true, 20e6);
    const ContractOffer too_long = ContractOffer::flat("long", 11, 20e6, 0.0, 0.0);

    const NegotiationResponse r1 = engine.submit_offer(p.id, too_long);
    NC_ASSERT(r1.outcome == NegotiationOutcome::Rejected);
    NC_ASSERT(r1.phone_dead_days == 0);
    const NegotiationResponse r2 = engine.submit_offer(p.id, too_long);
    NC_ASSERT(r2.new_mood == AgentMood::Angry);
    NC_ASSERT(r2.phone_dead_days == 21);
    NC_ASSERT(engine.get_session(p.id)->phone_dead_until_round() == 6);
    NC_ASSERT(engine.get_session(p.id)->negotiation_round == 3);

    const ContractOffer good =
        ContractOffer::flat("good", 3, 19'500'000.0, 0.0, 45e6);
    const NegotiationResponse d1 = engine.submit_offer(p.id, good);
    NC_ASSERT(d1.outcome == NegotiationOutcome::PhoneDead);
    NC_ASSERT(!d1.accepted);
    NC_ASSERT(d1.phone_dead_days == 14);
    const NegotiationResponse d2 = engine.submit_offer(p.id, good);
    NC_ASSERT(d2.phone_dead_days == 7);
    const NegotiationResponse d3 = engine.submit_offer(p.id, good);
    NC_ASSERT(d3.outcome == NegotiationOutcome::PhoneDead);
    NC_ASSERT(d3.phone_dead_days == 0);
    const NegotiationSession *s = engine.get_session(p.id);
    NC_ASSERT(s->negotiation_round == 6);
    NC_ASSERT(std::holds_alternative<Normal>(s->state));
    NC_ASSERT(s->last_offer->id == "long");

    const NegotiationResponse signed_up = engine.submit_offer(p.id, good);
    NC_ASSERT(signed_up.accepted);
    NC_ASSERT(engine.get_session(p.id)->negotiation_round == 7);
  }

  // While the phone is dead no leaks or advisors show up, even when every
  // roll is forced to fire.
  {
    NegotiationConfig cfg;
    cfg.events.press_leak_min_round = 1;
    cfg.events.press_leak_propensity = ArchetypeWeights{2.0, 2.0, 2.0, 2.0};
    cfg.events.angry_leak_factor = 1.0;
    cfg.events.neutral_leak_factor = 1.0;
    cfg.events.interested_leak_factor = 1.0;
    cfg.events.shadow_probability = ArchetypeWeights{1.0, 1.0, 1.0, 1.0};
    cfg.events.shadow_min_agent_leverage = 0.0;
    cfg.events.max_shadow_events = 5;
    NegotiationEngine engine(21, cfg);
    const Player p = shark_player("phone-gated");
    engine.begin_negotiation(p, 60e6, 4, true, 20e6);
    const ContractOffer too_long = ContractOffer::flat("long", 11, 20e6, 0.0, 0.0);

    engine.submit_offer(p.id, too_long);
    NC_ASSERT(engine.get_session(p.id)->press_leaks.size() == 1);
    NC_ASSERT(engine.get_session(p.id)->pending_shadow_event().has_value());
    engine.respond_to_shadow_advisor(p.id, ShadowAdvisorAction::Engage);

    const NegotiationResponse dead = engine.submit_offer(p.id, too_long);
    NC_ASSERT(dead.phone_dead_days == 21);
    const NegotiationSession *s = engine.get_session(p.id);
    NC_ASSERT(s->press_leaks.size() == 2);
    NC_ASSERT(s->shadow_events_seen == 1);
    NC_ASSERT(s->phone_dead_until_round() == 6);

    for (int i = 0; i < 3; ++i) {
      const NegotiationResponse r = engine.submit_offer(p.id, too_long);
      NC_ASSERT(r.outcome == NegotiationOutcome::PhoneDead);
      s = engine.get_session(p.id);
      NC_ASSERT(s->press_leaks.size() == 2);
      NC_ASSERT(s->shadow_events_seen == 1);
      NC_ASSERT(!s->pending_shadow_event().has_value());
      if (i < 2)
        NC_ASSERT(s->phone_dead_until_round() == 6);
    }
    NC_ASSERT(std::holds_alternative<Normal>(s->state));

    // Window over: the same forced rolls fire again.
    engine.submit_offer(p.id, too_long);
    s = engine.get_session(p.id);
    NC_ASSERT(s->press_leaks.size() == 3);
    NC_ASSERT(s->pending_shadow_event().has_value());
  }

  // Reporting the advisor calms the agent but costs the user leverage.
  {
    NegotiationEngine engine(9, always_shadow());
    const Player p = family_player("shadow-report");
    NC_ASSERT(open_shadow_session(engine, p) == 0);
    const NegotiationSession *s = engine.get_session(p.id);
    NC_ASSERT(s->agent_mood == AgentMood::Interested);
    const double user_before = s->leverage.user_leverage;
    const double market_before = s->market_value;

    engine.respond_to_shadow_advisor(p.id, ShadowAdvisorAction::Report);
    s = engine.get_session(p.id);
    NC_ASSERT(std::holds_alternative<Normal>(s->state));
    NC_ASSERT(s->agent_mood == AgentMood::Excited);
    NC_ASSERT(s->distrust == 1);
    NC_ASSERT(std::abs(s->leverage.user_leverage - (user_before - 0.05)) < 1e-9);
    NC_ASSERT(s->market_value == market_before);

    // Nothing pending: answering again changes nothing.
    engine.respond_to_shadow_advisor(p.id, ShadowAdvisorAction::Report);
    NC_ASSERT(engine.get_session(p.id)->distrust == 1);
    NC_ASSERT(engine.get_session(p.id)->agent_mood == AgentMood::Excited);
  }

  // Engaging the advisor resets the market to their demand.
  {
    NegotiationEngine engine(9, always_shadow());
    const Player p = family_player("shadow-engage");
    NC_ASSERT(open_shadow_session(engine, p) == 0);
    const double demand =
        engine.get_session(p.id)->pending_shadow_event()->demand;
    NC_ASSERT(demand > 10e6);

    engine.respond_to_shadow_advisor(p.id, ShadowAdvisorAction::Engage);
    const NegotiationSession *s = engine.get_session(p.id);
    NC_ASSERT(std::holds_alternative<Normal>(s->state));
    NC_ASSERT(s->market_value == demand);
    NC_ASSERT(s->distrust == 0);
    NC_ASSERT(s->shadow_events_seen == 1);
  }

  // Ignoring the advisor for two offers ends the negotiation.
  {
    NegotiationEngine engine(9, always_shadow());
    const Player p = family_player("shadow-ignored");
    NC_ASSERT(open_shadow_session(engine, p) == 0);
    const ContractOffer near = ContractOffer::flat("near", 1, 8'500'000.0, 0.0, 4e6);
    NC_ASSERT(!engine.submit_offer(p.id, near).is_lockout);
    const NegotiationResponse r = engine.submit_offer(p.id, near);
    NC_ASSERT(r.is_lockout);
    const NegotiationSession *s = engine.get_session(p.id);
    NC_ASSERT(s->is_locked_out());
    NC_ASSERT(s->lockout_reason()->find("ignored") != std::string::npos);
  }

  // One seed, one history.
  {
    NegotiationConfig cfg;
    cfg.events.press_leak_propensity = ArchetypeWeights{0.9, 0.9, 0.9, 0.9};
    NegotiationEngine a(1234, cfg);
    NegotiationEngine b(1234, cfg);
    const Player p = shark_player("replay");
    a.begin_negotiation(p, 60e6, 4, true, 20e6);
    b.begin_negotiation(p, 60e6, 4, true, 20e6);
    const ContractOffer offer = ContractOffer::flat("r", 2, 17e6, 0.0, 10e6);
    for (int i = 0; i < 6; ++i) {
      const NegotiationResponse ra = a.submit_offer(p.id, offer);
      const NegotiationResponse rb = b.submit_offer(p.id, offer);
      NC_ASSERT(ra.outcome == rb.outcome);
      NC_ASSERT(ra.message == rb.message);
    }
    const NegotiationSession *sa = a.get_session(p.id);
    const NegotiationSession *sb = b.get_session(p.id);
    NC_ASSERT(sa->negotiation_round == sb->negotiation_round);
    NC_ASSERT(sa->press_leaks.size() == sb->press_leaks.size());
    for (std::size_t i = 0; i < sa->press_leaks.size(); ++i)
      NC_ASSERT(sa->press_leaks[i].headline == sb->press_leaks[i].headline);
    NC_ASSERT(std::string(state_name(sa->state)) == state_name(sb->state));
  }
  return 0;
}
