#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "negotiation_core/mood.hpp"
#include "negotiation_core/player.hpp"

namespace negotiation_core {

enum class AgentArchetype { Shark, FamilyFriend, BrandBuilder, SelfRepresented };

const char *to_string(AgentArchetype archetype);
const char *archetype_description(AgentArchetype archetype);

// Immutable for the lifetime of a negotiation session.
struct Agent {
  std::string name;
  AgentArchetype archetype{AgentArchetype::FamilyFriend};
  double patience{0.5};        // 0..1
  int max_contract_length{10};
  double mood_volatility{0.5}; // 0..1
  int lowball_tolerance{3};    // lowball offers before walking away
  double guarantee_weight{1.0};
  double ring_weight{1.0};     // discount appetite for a contender
};

// Archetype base values before per-player jitter.
struct ArchetypeProfile {
  double patience{0.5};
  double mood_volatility{0.5};
  int min_contract_length{5};
  int max_contract_length{10};
  int lowball_tolerance{3};
  double guarantee_weight{1.0};
  double ring_weight{1.0};
  AgentMood opening_mood{AgentMood::Neutral};
};

const ArchetypeProfile &archetype_profile(AgentArchetype archetype);

// Personality-driven archetype (used when traits are known).
AgentArchetype archetype_from_traits(const PlayerTraits &traits, int age);

// Deterministic: the same player id (and traits) always yields the same
// agent. Without traits the archetype is picked from the id hash.
Agent create_agent(const std::string &player_id,
                   const std::optional<PlayerTraits> &traits = std::nullopt,
                   const std::string &player_name = "", int age = 25);

inline Agent create_agent(const Player &p) {
  return create_agent(p.id, p.traits, p.full_name(), p.age);
}

} // namespace negotiation_core
