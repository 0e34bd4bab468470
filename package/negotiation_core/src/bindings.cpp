#include "negotiation_core/agent.hpp"
#include "negotiation_core/config.hpp"
#include "negotiation_core/contract.hpp"
#include "negotiation_core/engine.hpp"
#include "negotiation_core/errors.hpp"
#include "negotiation_core/leverage.hpp"
#include "negotiation_core/market.hpp"
#include "negotiation_core/player.hpp"
#include "negotiation_core/session.hpp"
#include "negotiation_core/team.hpp"
#include <fmt/format.h>
#include <nanobind/nanobind.h>
#include <nanobind/eigen/dense.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

namespace nb = nanobind;
namespace nc = negotiation_core;

// The NB_MODULE macro defines the entry point for the Python module.
NB_MODULE(negotiation_core, m) {
  m.doc() = "Contract negotiation engine and cap economics.";

  nb::exception<nc::InvalidOffer>(m, "InvalidOffer", PyExc_ValueError);
  nb::exception<nc::SessionNotFound>(m, "SessionNotFound", PyExc_KeyError);

  // Enums
  nb::enum_<nc::Position>(m, "Position")
      .value("QB", nc::Position::QB)
      .value("RB", nc::Position::RB)
      .value("WR", nc::Position::WR)
      .value("TE", nc::Position::TE)
      .value("OL", nc::Position::OL)
      .value("DL", nc::Position::DL)
      .value("LB", nc::Position::LB)
      .value("CB", nc::Position::CB)
      .value("S", nc::Position::S)
      .value("K", nc::Position::K)
      .value("P", nc::Position::P);

  nb::enum_<nc::AgentArchetype>(m, "AgentArchetype")
      .value("Shark", nc::AgentArchetype::Shark)
      .value("FamilyFriend", nc::AgentArchetype::FamilyFriend)
      .value("BrandBuilder", nc::AgentArchetype::BrandBuilder)
      .value("SelfRepresented", nc::AgentArchetype::SelfRepresented);

  nb::enum_<nc::AgentMood>(m, "AgentMood")
      .value("Angry", nc::AgentMood::Angry)
      .value("Neutral", nc::AgentMood::Neutral)
      .value("Interested", nc::AgentMood::Interested)
      .value("Excited", nc::AgentMood::Excited);

  nb::enum_<nc::CashReserveTier>(m, "CashReserveTier")
      .value("Wealthy", nc::CashReserveTier::Wealthy)
      .value("Comfortable", nc::CashReserveTier::Comfortable)
      .value("Tight", nc::CashReserveTier::Tight)
      .value("Crisis", nc::CashReserveTier::Crisis);

  nb::enum_<nc::ShadowAdvisorAction>(m, "ShadowAdvisorAction")
      .value("Engage", nc::ShadowAdvisorAction::Engage)
      .value("Report", nc::ShadowAdvisorAction::Report);

  nb::enum_<nc::NegotiationOutcome>(m, "NegotiationOutcome")
      .value("Accepted", nc::NegotiationOutcome::Accepted)
      .value("Countered", nc::NegotiationOutcome::Countered)
      .value("Rejected", nc::NegotiationOutcome::Rejected)
      .value("CapInfeasible", nc::NegotiationOutcome::CapInfeasible)
      .value("PhoneDead", nc::NegotiationOutcome::PhoneDead)
      .value("LockedOut", nc::NegotiationOutcome::LockedOut)
      .value("AlreadyAgreed", nc::NegotiationOutcome::AlreadyAgreed);

  // Players and teams
  nb::class_<nc::PlayerTraits>(m, "PlayerTraits")
      .def(nb::init<>())
      .def_rw("leadership", &nc::PlayerTraits::leadership)
      .def_rw("motivation", &nc::PlayerTraits::motivation)
      .def_rw("loyalty", &nc::PlayerTraits::loyalty)
      .def_rw("marketability", &nc::PlayerTraits::marketability)
      .def_rw("team_player", &nc::PlayerTraits::team_player)
      .def_rw("work_ethic", &nc::PlayerTraits::work_ethic);

  nb::class_<nc::Player>(m, "Player")
      .def(nb::init<>())
      .def(nb::init<std::string, std::string, std::string, nc::Position, int,
                    int>())
      .def_rw("id", &nc::Player::id)
      .def_rw("first_name", &nc::Player::first_name)
      .def_rw("last_name", &nc::Player::last_name)
      .def_rw("position", &nc::Player::position)
      .def_rw("age", &nc::Player::age)
      .def_rw("overall", &nc::Player::overall)
      .def_rw("team_id", &nc::Player::team_id)
      .def_rw("traits", &nc::Player::traits)
      .def("full_name", &nc::Player::full_name)
      .def("__repr__", [](const nc::Player &p) {
        return fmt::format("Player(id={}, name={}, age={}, overall={})", p.id,
                           p.full_name(), p.age, p.overall);
      });

  nb::class_<nc::TeamContext>(m, "TeamContext")
      .def(nb::init<>())
      .def_rw("team_name", &nc::TeamContext::team_name)
      .def_rw("cap_space", &nc::TeamContext::cap_space)
      .def_rw("position_depth", &nc::TeamContext::position_depth)
      .def_rw("is_contender", &nc::TeamContext::is_contender)
      .def_rw("cash_reserve_tier", &nc::TeamContext::cash_reserve_tier);

  nb::class_<nc::TeamRecord>(m, "TeamRecord")
      .def(nb::init<>())
      .def_rw("id", &nc::TeamRecord::id)
      .def_rw("name", &nc::TeamRecord::name)
      .def_rw("salary_cap", &nc::TeamRecord::salary_cap)
      .def_rw("committed_cap", &nc::TeamRecord::committed_cap)
      .def_rw("wins", &nc::TeamRecord::wins)
      .def_rw("losses", &nc::TeamRecord::losses)
      .def_rw("playoff_chances", &nc::TeamRecord::playoff_chances);

  nb::class_<nc::TeamRegistry>(m, "TeamRegistry");

  nb::class_<nc::RosterTable, nc::TeamRegistry>(m, "RosterTable")
      .def(nb::init<>())
      .def("add_team", &nc::RosterTable::add_team)
      .def("add_player", &nc::RosterTable::add_player)
      .def("team", &nc::RosterTable::team)
      .def("cap_space", &nc::RosterTable::cap_space)
      .def("cap_hit", &nc::RosterTable::cap_hit)
      .def("position_depth", &nc::RosterTable::position_depth)
      .def("is_contender", &nc::RosterTable::is_contender);

  m.def("market_value_for_player", &nc::market_value_for_player);

  // Contract economics
  nb::class_<nc::ContractOffer>(m, "ContractOffer")
      .def(nb::init<std::string, Eigen::VectorXd, double, double, int, bool,
                    Eigen::VectorXd, Eigen::VectorXd>(),
           nb::arg("id"), nb::arg("base_salary_per_year"),
           nb::arg("signing_bonus"), nb::arg("guaranteed_money"),
           nb::arg("void_years") = 0, nb::arg("offset_language") = false,
           nb::arg("ltbe_incentives") = Eigen::VectorXd(),
           nb::arg("nltbe_incentives") = Eigen::VectorXd())
      .def_static("flat", &nc::ContractOffer::flat, nb::arg("id"),
                  nb::arg("years"), nb::arg("salary"),
                  nb::arg("signing_bonus"), nb::arg("guaranteed_money"),
                  nb::arg("void_years") = 0)
      .def_ro("id", &nc::ContractOffer::id)
      .def_ro("years", &nc::ContractOffer::years)
      .def_ro("base_salary_per_year", &nc::ContractOffer::base_salary_per_year)
      .def_ro("signing_bonus", &nc::ContractOffer::signing_bonus)
      .def_ro("guaranteed_money", &nc::ContractOffer::guaranteed_money)
      .def_ro("ltbe_incentives", &nc::ContractOffer::ltbe_incentives)
      .def_ro("nltbe_incentives", &nc::ContractOffer::nltbe_incentives)
      .def_ro("void_years", &nc::ContractOffer::void_years)
      .def_ro("offset_language", &nc::ContractOffer::offset_language)
      .def("__repr__", [](const nc::ContractOffer &o) {
        return fmt::format("ContractOffer(id={}, years={}, apy={}, bonus={}, "
                           "guaranteed={}, void_years={})",
                           o.id, o.years,
                           nc::format_money(nc::average_per_year(o)),
                           nc::format_money(o.signing_bonus),
                           nc::format_money(o.guaranteed_money), o.void_years);
      });

  nb::class_<nc::RestructureResult>(m, "RestructureResult")
      .def_ro("converted_amount", &nc::RestructureResult::converted_amount)
      .def_ro("cap_savings", &nc::RestructureResult::cap_savings)
      .def_ro("new_dead_cap", &nc::RestructureResult::new_dead_cap)
      .def_ro("new_current_year_cap",
              &nc::RestructureResult::new_current_year_cap);

  m.def("total_value", &nc::total_value);
  m.def("average_per_year", &nc::average_per_year);
  m.def("guaranteed_percentage", &nc::guaranteed_percentage);
  m.def("signing_bonus_proration", &nc::signing_bonus_proration);
  m.def("cap_hit_year1", &nc::cap_hit_year1);
  m.def("cap_hit_for_year", &nc::cap_hit_for_year);
  m.def("dead_cap_on_release", &nc::dead_cap_on_release, nb::arg("offer"),
        nb::arg("years_elapsed"));
  m.def("dead_cap_on_restructure", &nc::dead_cap_on_restructure,
        nb::arg("offer"), nb::arg("converted_amount"),
        nb::arg("years_elapsed") = 0);
  m.def("dead_cap_risk", &nc::dead_cap_risk);
  m.def("restructure", &nc::restructure, nb::arg("offer"),
        nb::arg("years_elapsed"), nb::arg("conversion_fraction"));
  m.def("format_money", &nc::format_money);

  // Agents and sessions
  nb::class_<nc::Agent>(m, "Agent")
      .def_ro("name", &nc::Agent::name)
      .def_ro("archetype", &nc::Agent::archetype)
      .def_ro("patience", &nc::Agent::patience)
      .def_ro("max_contract_length", &nc::Agent::max_contract_length)
      .def_ro("mood_volatility", &nc::Agent::mood_volatility)
      .def_ro("lowball_tolerance", &nc::Agent::lowball_tolerance)
      .def("__repr__", [](const nc::Agent &a) {
        return fmt::format("Agent(name={}, archetype={}, patience={:.2f}, "
                           "max_contract_length={})",
                           a.name, nc::to_string(a.archetype), a.patience,
                           a.max_contract_length);
      });

  nb::class_<nc::Leverage>(m, "Leverage")
      .def(nb::init<>())
      .def_rw("user_leverage", &nc::Leverage::user_leverage)
      .def_rw("agent_leverage", &nc::Leverage::agent_leverage)
      .def("dominant_party",
           [](const nc::Leverage &l) { return nc::dominant_party(l); })
      .def("gap", [](const nc::Leverage &l) { return nc::leverage_gap(l); });

  nb::class_<nc::PressLeak>(m, "PressLeak")
      .def_ro("headline", &nc::PressLeak::headline)
      .def_ro("round", &nc::PressLeak::round)
      .def_ro("offer_amount", &nc::PressLeak::offer_amount)
      .def_ro("market_value", &nc::PressLeak::market_value);

  nb::class_<nc::ShadowAdvisorEvent>(m, "ShadowAdvisorEvent")
      .def_ro("advisor_name", &nc::ShadowAdvisorEvent::advisor_name)
      .def_ro("player_name", &nc::ShadowAdvisorEvent::player_name)
      .def_ro("demand", &nc::ShadowAdvisorEvent::demand)
      .def_ro("round", &nc::ShadowAdvisorEvent::round);

  nb::class_<nc::NegotiationSession>(m, "NegotiationSession")
      .def_ro("player_id", &nc::NegotiationSession::player_id)
      .def_ro("player_name", &nc::NegotiationSession::player_name)
      .def_ro("agent", &nc::NegotiationSession::agent)
      .def_ro("agent_mood", &nc::NegotiationSession::agent_mood)
      .def_ro("market_value", &nc::NegotiationSession::market_value)
      .def_ro("negotiation_round", &nc::NegotiationSession::negotiation_round)
      .def_ro("leverage", &nc::NegotiationSession::leverage)
      .def_ro("press_leaks", &nc::NegotiationSession::press_leaks)
      .def_ro("last_offer", &nc::NegotiationSession::last_offer)
      .def_ro("outstanding_counter",
              &nc::NegotiationSession::outstanding_counter)
      .def_prop_ro("state",
                   [](const nc::NegotiationSession &s) {
                     return std::string(nc::state_name(s.state));
                   })
      .def_prop_ro("is_locked_out", &nc::NegotiationSession::is_locked_out)
      .def_prop_ro("lockout_reason", &nc::NegotiationSession::lockout_reason)
      .def_prop_ro("phone_dead_until_round",
                   &nc::NegotiationSession::phone_dead_until_round)
      .def_prop_ro("pending_shadow_event",
                   &nc::NegotiationSession::pending_shadow_event);

  nb::class_<nc::NegotiationResponse>(m, "NegotiationResponse")
      .def_ro("accepted", &nc::NegotiationResponse::accepted)
      .def_ro("new_mood", &nc::NegotiationResponse::new_mood)
      .def_ro("message", &nc::NegotiationResponse::message)
      .def_ro("counter_offer", &nc::NegotiationResponse::counter_offer)
      .def_ro("outcome", &nc::NegotiationResponse::outcome)
      .def_ro("is_lockout", &nc::NegotiationResponse::is_lockout)
      .def_ro("phone_dead_days", &nc::NegotiationResponse::phone_dead_days)
      .def("__repr__", [](const nc::NegotiationResponse &r) {
        return fmt::format("NegotiationResponse(outcome={}, mood={}, "
                           "message={})",
                           nc::to_string(r.outcome), nc::to_string(r.new_mood),
                           r.message);
      });

  // Tunable policy
  nb::class_<nc::LeverageConfig>(m, "LeverageConfig")
      .def(nb::init<>())
      .def_rw("base", &nc::LeverageConfig::base)
      .def_rw("cap_pressure_weight", &nc::LeverageConfig::cap_pressure_weight)
      .def_rw("scarcity_weight", &nc::LeverageConfig::scarcity_weight)
      .def_rw("fatigue_per_round", &nc::LeverageConfig::fatigue_per_round)
      .def_rw("fatigue_cap", &nc::LeverageConfig::fatigue_cap)
      .def_rw("cap_margin_weight", &nc::LeverageConfig::cap_margin_weight)
      .def_rw("contender_weight", &nc::LeverageConfig::contender_weight)
      .def_rw("press_leak_weight", &nc::LeverageConfig::press_leak_weight)
      .def_rw("press_leak_cap", &nc::LeverageConfig::press_leak_cap)
      .def_rw("distrust_penalty", &nc::LeverageConfig::distrust_penalty);

  nb::class_<nc::EvaluatorConfig>(m, "EvaluatorConfig")
      .def(nb::init<>())
      .def_rw("base_threshold", &nc::EvaluatorConfig::base_threshold)
      .def_rw("leverage_weight", &nc::EvaluatorConfig::leverage_weight)
      .def_rw("excited_adjust", &nc::EvaluatorConfig::excited_adjust)
      .def_rw("interested_adjust", &nc::EvaluatorConfig::interested_adjust)
      .def_rw("angry_adjust", &nc::EvaluatorConfig::angry_adjust)
      .def_rw("guarantee_pivot", &nc::EvaluatorConfig::guarantee_pivot)
      .def_rw("guarantee_bonus_weight",
              &nc::EvaluatorConfig::guarantee_bonus_weight)
      .def_rw("min_threshold", &nc::EvaluatorConfig::min_threshold)
      .def_rw("max_threshold", &nc::EvaluatorConfig::max_threshold)
      .def_rw("near_miss_floor", &nc::EvaluatorConfig::near_miss_floor)
      .def_rw("literal_near_miss_floor",
              &nc::EvaluatorConfig::literal_near_miss_floor);

  nb::class_<nc::EventConfig>(m, "EventConfig")
      .def(nb::init<>())
      .def_rw("press_leak_min_round", &nc::EventConfig::press_leak_min_round)
      .def_rw("press_leak_round_growth",
              &nc::EventConfig::press_leak_round_growth)
      .def_rw("press_leak_round_cap", &nc::EventConfig::press_leak_round_cap)
      .def_rw("phone_dead_after_rejections",
              &nc::EventConfig::phone_dead_after_rejections)
      .def_rw("phone_dead_cooldown", &nc::EventConfig::phone_dead_cooldown)
      .def_rw("shadow_min_agent_leverage",
              &nc::EventConfig::shadow_min_agent_leverage)
      .def_rw("shadow_demand_min", &nc::EventConfig::shadow_demand_min)
      .def_rw("shadow_demand_spread", &nc::EventConfig::shadow_demand_spread)
      .def_rw("max_shadow_events", &nc::EventConfig::max_shadow_events)
      .def_rw("shadow_ignore_limit", &nc::EventConfig::shadow_ignore_limit)
      .def_rw("base_max_rounds", &nc::EventConfig::base_max_rounds)
      .def_rw("patience_round_bonus", &nc::EventConfig::patience_round_bonus);

  nb::class_<nc::NegotiationConfig>(m, "NegotiationConfig")
      .def(nb::init<>())
      .def_rw("leverage", &nc::NegotiationConfig::leverage)
      .def_rw("evaluator", &nc::NegotiationConfig::evaluator)
      .def_rw("events", &nc::NegotiationConfig::events)
      .def_rw("verbose", &nc::NegotiationConfig::verbose);

  // Engine. Sessions are returned by value so Python never holds a pointer
  // into the registry.
  nb::class_<nc::NegotiationEngine>(m, "NegotiationEngine")
      .def(nb::init<std::uint64_t, nc::NegotiationConfig>(),
           nb::arg("seed") = 0, nb::arg("config") = nc::NegotiationConfig{})
      .def("set_team_registry", &nc::NegotiationEngine::set_team_registry,
           nb::keep_alive<1, 2>())
      .def(
          "begin_negotiation",
          [](nc::NegotiationEngine &e, const nc::Player &p, double cap_space,
             int position_depth, bool is_contender,
             std::optional<double> market_value) {
            return e.begin_negotiation(p, cap_space, position_depth,
                                       is_contender, market_value);
          },
          nb::arg("player"), nb::arg("cap_space"), nb::arg("position_depth"),
          nb::arg("is_contender"), nb::arg("market_value") = nb::none())
      .def(
          "begin_negotiation_with_team",
          [](nc::NegotiationEngine &e, const nc::Player &p,
             const nc::TeamContext &team, std::optional<double> market_value) {
            return e.begin_negotiation(p, team, market_value);
          },
          nb::arg("player"), nb::arg("team"),
          nb::arg("market_value") = nb::none())
      .def("start_extension_negotiation",
           [](nc::NegotiationEngine &e,
              const nc::Player &p) -> std::optional<nc::NegotiationSession> {
             const nc::NegotiationSession *s = e.start_extension_negotiation(p);
             if (!s)
               return std::nullopt;
             return *s;
           })
      .def("submit_offer",
           nb::overload_cast<const std::string &, const nc::ContractOffer &>(
               &nc::NegotiationEngine::submit_offer))
      .def("submit_offer_with_team",
           nb::overload_cast<const std::string &, const nc::ContractOffer &,
                             const nc::TeamContext &>(
               &nc::NegotiationEngine::submit_offer))
      .def("respond_to_shadow_advisor",
           &nc::NegotiationEngine::respond_to_shadow_advisor)
      .def("get_session",
           [](const nc::NegotiationEngine &e,
              const std::string &id) -> std::optional<nc::NegotiationSession> {
             const nc::NegotiationSession *s = e.get_session(id);
             if (!s)
               return std::nullopt;
             return *s;
           })
      .def("complete_signing", &nc::NegotiationEngine::complete_signing)
      .def("abandon_negotiation", &nc::NegotiationEngine::abandon_negotiation)
      .def("close_window", &nc::NegotiationEngine::close_window)
      .def("active_sessions", &nc::NegotiationEngine::active_sessions)
      .def("session_count", &nc::NegotiationEngine::session_count);
}
