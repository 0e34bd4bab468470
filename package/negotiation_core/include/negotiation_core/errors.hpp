#pragma once

#include <stdexcept>
#include <string>

namespace negotiation_core {

// Structurally malformed offer; raised before any session is touched.
class InvalidOffer : public std::invalid_argument {
public:
  explicit InvalidOffer(const std::string &what)
      : std::invalid_argument("InvalidOffer: " + what) {}
};

// No negotiation is open for the requested player.
class SessionNotFound : public std::out_of_range {
public:
  explicit SessionNotFound(const std::string &player_id)
      : std::out_of_range("SessionNotFound: no negotiation for player '" +
                          player_id + "'"),
        player_id_(player_id) {}

  const std::string &player_id() const { return player_id_; }

private:
  std::string player_id_;
};

} // namespace negotiation_core
