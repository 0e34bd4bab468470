#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace negotiation_core {

enum class Position { QB, RB, WR, TE, OL, DL, LB, CB, S, K, P };

// Personality ratings on a 0-100 scale.
struct PlayerTraits {
  int leadership{50};
  int motivation{50};
  int loyalty{50};
  int marketability{50};
  int team_player{50};
  int work_ethic{50};
};

struct Player {
  // Data members
  std::string id;
  std::string first_name;
  std::string last_name;
  Position position{Position::WR};
  int age{25};
  int overall{70};
  std::string team_id; // empty for free agents
  std::optional<PlayerTraits> traits;

  Player() = default;
  Player(std::string id_, std::string first_name_, std::string last_name_,
         Position position_, int age_, int overall_)
      : id(std::move(id_)), first_name(std::move(first_name_)),
        last_name(std::move(last_name_)), position(position_), age(age_),
        overall(overall_) {}

  std::string full_name() const { return first_name + " " + last_name; }
};

class PlayerTable {
public:
  PlayerTable() = default;

  void add_player(const Player &p) {
    auto it = index_.find(p.id);
    if (it != index_.end()) {
      players_[it->second] = p;
      return;
    }
    index_[p.id] = players_.size();
    players_.push_back(p);
  }

  std::size_t size() const { return players_.size(); }

  bool has_player(const std::string &id) const {
    return index_.find(id) != index_.end();
  }

  Player get(const std::string &id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
      throw std::out_of_range("Player id not found: " + id);
    }
    return players_.at(it->second);
  }

  std::vector<Player> players() const { return players_; }

private:
  std::vector<Player> players_;
  std::unordered_map<std::string, std::size_t> index_;
};

} // namespace negotiation_core
