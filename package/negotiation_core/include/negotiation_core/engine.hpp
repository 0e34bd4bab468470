#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "negotiation_core/config.hpp"
#include "negotiation_core/contract.hpp"
#include "negotiation_core/events.hpp"
#include "negotiation_core/player.hpp"
#include "negotiation_core/session.hpp"
#include "negotiation_core/team.hpp"

namespace negotiation_core {

// Owns one negotiation session per player. Single-threaded; every call runs
// to completion. All randomness derives from the seed given here.
class NegotiationEngine {
public:
  explicit NegotiationEngine(std::uint64_t seed = 0,
                             NegotiationConfig cfg = NegotiationConfig{})
      : seed_(seed), cfg_(cfg) {}

  // Non-owning; used by start_extension_negotiation only.
  void set_team_registry(const TeamRegistry *registry) { registry_ = registry; }

  // Opens talks for `player` unless a session already exists, in which case
  // the existing session is returned untouched. Market value defaults to
  // market_value_for_player.
  const NegotiationSession &
  begin_negotiation(const Player &player, double cap_space, int position_depth,
                    bool is_contender,
                    std::optional<double> market_value = std::nullopt);

  const NegotiationSession &
  begin_negotiation(const Player &player, const TeamContext &team,
                    std::optional<double> market_value = std::nullopt);

  // Extension talks with the player's own team, looked up in the registry.
  // Returns nullptr if there is no registry, the player has no team, or the
  // team is unknown.
  const NegotiationSession *start_extension_negotiation(const Player &player);

  // Throws SessionNotFound / InvalidOffer. Uses the team context from the
  // most recent call for this player.
  NegotiationResponse submit_offer(const std::string &player_id,
                                   const ContractOffer &offer);

  // Same, with a fresh team snapshot from the caller.
  NegotiationResponse submit_offer(const std::string &player_id,
                                   const ContractOffer &offer,
                                   const TeamContext &team);

  // Throws SessionNotFound; no-op when no shadow event is pending.
  void respond_to_shadow_advisor(const std::string &player_id,
                                 ShadowAdvisorAction action);

  const NegotiationSession *get_session(const std::string &player_id) const;

  // Caller committed the signing; drops the accepted session. Returns false
  // (and keeps the session) if the session has not reached agreement.
  bool complete_signing(const std::string &player_id);

  bool abandon_negotiation(const std::string &player_id);

  // Negotiation window closed: every session goes away.
  void close_window() { sessions_.clear(); }

  std::size_t session_count() const { return sessions_.size(); }
  std::vector<std::string> active_sessions() const;

  const NegotiationConfig &config() const { return cfg_; }
  std::uint64_t seed() const { return seed_; }

private:
  NegotiationSession &require(const std::string &player_id);

  std::uint64_t seed_{0};
  NegotiationConfig cfg_{};
  const TeamRegistry *registry_{nullptr};
  std::unordered_map<std::string, NegotiationSession> sessions_;
};

} // namespace negotiation_core
