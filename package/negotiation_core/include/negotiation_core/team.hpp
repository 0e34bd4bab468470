#pragma once

#include <string>
#include <unordered_map>
#include <utility>

#include "negotiation_core/player.hpp"

namespace negotiation_core {

enum class CashReserveTier { Wealthy, Comfortable, Tight, Crisis };

// Snapshot of the offering team, supplied by the caller on every call.
struct TeamContext {
  std::string team_name;
  double cap_space{0.0};
  int position_depth{0};
  bool is_contender{false};
  CashReserveTier cash_reserve_tier{CashReserveTier::Comfortable};
};

// Read-only view of the team/cap registry owned by the game state.
class TeamRegistry {
public:
  virtual ~TeamRegistry() = default;

  virtual bool has_team(const std::string &team_id) const = 0;
  virtual std::string team_name(const std::string &team_id) const = 0;
  virtual double cap_space(const std::string &team_id) const = 0;
  virtual double cap_hit(const std::string &team_id) const = 0;
  virtual int position_depth(const std::string &team_id,
                             Position pos) const = 0;
  virtual bool is_contender(const std::string &team_id) const = 0;
};

struct TeamRecord {
  std::string id;
  std::string name;
  double salary_cap{0.0};
  double committed_cap{0.0};
  int wins{0};
  int losses{0};
  double playoff_chances{0.0}; // percent
};

// In-memory registry over a player table and a set of teams.
class RosterTable : public TeamRegistry {
public:
  RosterTable() = default;

  void add_team(const TeamRecord &t) { teams_[t.id] = t; }
  void add_player(const Player &p) { players_.add_player(p); }

  const PlayerTable &players() const { return players_; }
  TeamRecord team(const std::string &team_id) const;

  bool has_team(const std::string &team_id) const override {
    return teams_.find(team_id) != teams_.end();
  }
  std::string team_name(const std::string &team_id) const override;
  double cap_space(const std::string &team_id) const override;
  double cap_hit(const std::string &team_id) const override;
  int position_depth(const std::string &team_id, Position pos) const override;
  bool is_contender(const std::string &team_id) const override;

private:
  PlayerTable players_;
  std::unordered_map<std::string, TeamRecord> teams_;
};

} // namespace negotiation_core
