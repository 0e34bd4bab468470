#pragma once

#include "negotiation_core/player.hpp"

namespace negotiation_core {

inline double position_multiplier(Position pos) {
  switch (pos) {
  case Position::QB:
    return 2.5;
  case Position::DL:
  case Position::CB:
  case Position::OL:
    return 2.0;
  case Position::WR:
  case Position::RB:
    return 1.5;
  case Position::TE:
    return 1.2;
  case Position::LB:
  case Position::S:
    return 1.0;
  case Position::K:
  case Position::P:
    return 0.5;
  }
  return 1.0;
}

// Annual market value: $500k per overall point, scaled by position and
// discounted or boosted by age.
inline double market_value_for_player(const Player &p) {
  double value = static_cast<double>(p.overall) * 500'000.0;
  value *= position_multiplier(p.position);
  if (p.age < 25) {
    value *= 1.3;
  } else if (p.age > 30) {
    value *= 0.6;
  }
  return value;
}

} // namespace negotiation_core
