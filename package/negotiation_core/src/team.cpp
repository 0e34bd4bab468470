#include "negotiation_core/team.hpp"

#include <stdexcept>

namespace negotiation_core {

TeamRecord RosterTable::team(const std::string &team_id) const {
  auto it = teams_.find(team_id);
  if (it == teams_.end()) {
    throw std::out_of_range("Team id not found: " + team_id);
  }
  return it->second;
}

std::string RosterTable::team_name(const std::string &team_id) const {
  return team(team_id).name;
}

double RosterTable::cap_space(const std::string &team_id) const {
  const TeamRecord t = team(team_id);
  return t.salary_cap - t.committed_cap;
}

double RosterTable::cap_hit(const std::string &team_id) const {
  return team(team_id).committed_cap;
}

int RosterTable::position_depth(const std::string &team_id,
                                Position pos) const {
  int depth = 0;
  for (const auto &p : players_.players()) {
    if (p.team_id == team_id && p.position == pos)
      ++depth;
  }
  return depth;
}

bool RosterTable::is_contender(const std::string &team_id) const {
  const TeamRecord t = team(team_id);
  const bool winning_record = t.wins + t.losses > 8 && t.wins > t.losses;
  return winning_record || t.playoff_chances > 50.0;
}

} // namespace negotiation_core
