#include "negotiation_core/engine.hpp"
#include "negotiation_core/agent.hpp"
#include "negotiation_core/errors.hpp"
#include "negotiation_core/evaluator.hpp"
#include "negotiation_core/leverage.hpp"
#include "negotiation_core/market.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace negotiation_core {

const NegotiationSession &
NegotiationEngine::begin_negotiation(const Player &player, double cap_space,
                                     int position_depth, bool is_contender,
                                     std::optional<double> market_value) {
  TeamContext team;
  team.cap_space = cap_space;
  team.position_depth = position_depth;
  team.is_contender = is_contender;
  return begin_negotiation(player, team, market_value);
}

const NegotiationSession &
NegotiationEngine::begin_negotiation(const Player &player,
                                     const TeamContext &team,
                                     std::optional<double> market_value) {
  auto it = sessions_.find(player.id);
  if (it != sessions_.end())
    return it->second;

  NegotiationSession s;
  s.player_id = player.id;
  s.player_name = player.full_name();
  s.agent = create_agent(player);
  s.agent_mood = archetype_profile(s.agent.archetype).opening_mood;
  s.market_value = market_value ? *market_value : market_value_for_player(player);
  s.team = team;

  // Opening leverage is measured against a one-year deal at market value.
  const ContractOffer opening =
      ContractOffer::flat(player.id + "-opening", 1, std::max(0.0, s.market_value),
                          0.0, 0.0);
  s.leverage = compute_leverage(s, opening, team, cfg_.leverage);

  if (cfg_.verbose) {
    fmt::print("[Negotiation] Started talks with {} (agent={}, archetype={}, "
               "market={}, user={:.2f}, agent_lev={:.2f})\n",
               s.player_name, s.agent.name, to_string(s.agent.archetype),
               format_money(s.market_value), s.leverage.user_leverage,
               s.leverage.agent_leverage);
  }
  return sessions_.emplace(player.id, std::move(s)).first->second;
}

const NegotiationSession *
NegotiationEngine::start_extension_negotiation(const Player &player) {
  if (!registry_ || player.team_id.empty())
    return nullptr;
  if (!registry_->has_team(player.team_id))
    return nullptr;

  TeamContext team;
  team.team_name = registry_->team_name(player.team_id);
  team.cap_space = registry_->cap_space(player.team_id);
  team.position_depth = registry_->position_depth(player.team_id, player.position);
  team.is_contender = registry_->is_contender(player.team_id);
  return &begin_negotiation(player, team);
}

NegotiationResponse NegotiationEngine::submit_offer(const std::string &player_id,
                                                    const ContractOffer &offer) {
  const TeamContext team = require(player_id).team;
  return submit_offer(player_id, offer, team);
}

NegotiationResponse NegotiationEngine::submit_offer(const std::string &player_id,
                                                    const ContractOffer &offer,
                                                    const TeamContext &team) {
  NegotiationSession &stored = require(player_id);
  offer.validate();

  // Work on a copy; the stored session only changes once the whole
  // evaluate -> schedule pass has completed.
  NegotiationSession working = stored;
  NegotiationResponse res = evaluate(working, offer, team, cfg_);

  if (was_evaluated(res.outcome)) {
    const ScheduledEvents ev = schedule_events(working, cfg_.events, seed_);
    res.is_lockout = ev.lockout;
    if (const auto until = working.phone_dead_until_round()) {
      res.phone_dead_days =
          std::max(0, *until - working.negotiation_round) * 7;
    }
    if (cfg_.verbose) {
      fmt::print("[Negotiation] {} round {}: {} fit={:.3f} mood={} state={} "
                 "leak={} phone_dead={} shadow={} lockout={}\n",
                 working.player_name, working.negotiation_round - 1,
                 to_string(res.outcome),
                 average_per_year(offer) / std::max(1.0, working.market_value),
                 to_string(working.agent_mood), state_name(working.state),
                 ev.press_leak, ev.phone_dead, ev.shadow_advisor, ev.lockout);
    }
  }

  stored = std::move(working);
  return res;
}

void NegotiationEngine::respond_to_shadow_advisor(const std::string &player_id,
                                                  ShadowAdvisorAction action) {
  NegotiationSession &s = require(player_id);
  const auto event = s.pending_shadow_event();
  if (!event)
    return;

  s.state = Normal{};
  s.unanswered_shadow_rounds = 0;
  switch (action) {
  case ShadowAdvisorAction::Engage:
    s.market_value = std::max(s.market_value, event->demand);
    s.outstanding_counter.reset();
    break;
  case ShadowAdvisorAction::Report:
    s.agent_mood = improve(s.agent_mood);
    ++s.distrust;
    s.leverage.user_leverage = std::max(
        0.0, s.leverage.user_leverage - cfg_.leverage.distrust_penalty);
    break;
  }

  if (cfg_.verbose) {
    fmt::print("[Negotiation] {} shadow advisor {} {} (market now {})\n",
               s.player_name, event->advisor_name,
               action == ShadowAdvisorAction::Engage ? "engaged" : "reported",
               format_money(s.market_value));
  }
}

const NegotiationSession *
NegotiationEngine::get_session(const std::string &player_id) const {
  auto it = sessions_.find(player_id);
  return it == sessions_.end() ? nullptr : &it->second;
}

bool NegotiationEngine::complete_signing(const std::string &player_id) {
  NegotiationSession &s = require(player_id);
  if (!s.is_accepted())
    return false;
  sessions_.erase(player_id);
  return true;
}

bool NegotiationEngine::abandon_negotiation(const std::string &player_id) {
  return sessions_.erase(player_id) > 0;
}

std::vector<std::string> NegotiationEngine::active_sessions() const {
  std::vector<std::string> ids;
  for (const auto &kv : sessions_) {
    if (kv.second.is_active())
      ids.push_back(kv.first);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

NegotiationSession &NegotiationEngine::require(const std::string &player_id) {
  auto it = sessions_.find(player_id);
  if (it == sessions_.end())
    throw SessionNotFound(player_id);
  return it->second;
}

} // namespace negotiation_core
