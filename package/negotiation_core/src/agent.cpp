#include "negotiation_core/agent.hpp"
#include "negotiation_core/random.hpp"

#include <algorithm>
#include <array>
#include <random>

#include <fmt/format.h>

namespace negotiation_core {

namespace {

constexpr std::uint64_t kAgentSalt = 0xA6E47ULL;
constexpr double kJitter = 0.05;

const std::array<const char *, 3> kSharkNames = {"Drew Rosenhaus",
                                                 "Scott Boras", "Joel Segal"};
const std::array<const char *, 3> kBrandNames = {"Tom Condon", "Jimmy Sexton",
                                                 "David Mulugheta"};

std::string last_name_of(const std::string &full_name) {
  const auto pos = full_name.find_last_of(' ');
  if (pos == std::string::npos)
    return full_name;
  return full_name.substr(pos + 1);
}

std::string pick_name(AgentArchetype archetype, const std::string &player_name,
                      std::mt19937_64 &rng) {
  std::uniform_int_distribution<int> pick(0, 2);
  const int i = pick(rng);
  const std::string name = player_name.empty() ? "Player" : player_name;
  switch (archetype) {
  case AgentArchetype::Shark:
    return kSharkNames[static_cast<std::size_t>(i)];
  case AgentArchetype::BrandBuilder:
    return kBrandNames[static_cast<std::size_t>(i)];
  case AgentArchetype::FamilyFriend:
    if (i == 0)
      return fmt::format("{}'s Uncle", last_name_of(name));
    return i == 1 ? "Family Friend" : "Local Attorney";
  case AgentArchetype::SelfRepresented:
    return fmt::format("{} (Self-Rep)", name);
  }
  return name;
}

double clamp01(double v) { return std::min(1.0, std::max(0.0, v)); }

} // namespace

const char *to_string(AgentArchetype archetype) {
  switch (archetype) {
  case AgentArchetype::Shark:
    return "The Shark";
  case AgentArchetype::FamilyFriend:
    return "Uncle/Family Friend";
  case AgentArchetype::BrandBuilder:
    return "Brand Builder";
  case AgentArchetype::SelfRepresented:
    return "Self-Represented";
  }
  return "Unknown";
}

const char *archetype_description(AgentArchetype archetype) {
  switch (archetype) {
  case AgentArchetype::Shark:
    return "Maximum guaranteed money. No compromises.";
  case AgentArchetype::FamilyFriend:
    return "Prioritizes player happiness and security.";
  case AgentArchetype::BrandBuilder:
    return "Short-term deals with a winner to maximize future earnings.";
  case AgentArchetype::SelfRepresented:
    return "Reads the numbers literally. Little room for haggling.";
  }
  return "";
}

const ArchetypeProfile &archetype_profile(AgentArchetype archetype) {
  // patience, volatility, min len, max len, lowball tolerance,
  // guarantee weight, ring weight, opening mood
  static const ArchetypeProfile shark{0.25, 0.80, 7, 10, 2,
                                      1.5,  0.5,  AgentMood::Neutral};
  static const ArchetypeProfile family{0.75, 0.15, 6, 10, 4,
                                       0.8,  1.0,  AgentMood::Interested};
  static const ArchetypeProfile brand{0.50, 0.45, 2, 3, 3,
                                      1.2,  1.25, AgentMood::Neutral};
  static const ArchetypeProfile self_rep{0.90, 0.30, 6, 10, 3,
                                         1.3,  0.75, AgentMood::Neutral};
  switch (archetype) {
  case AgentArchetype::Shark:
    return shark;
  case AgentArchetype::FamilyFriend:
    return family;
  case AgentArchetype::BrandBuilder:
    return brand;
  case AgentArchetype::SelfRepresented:
    return self_rep;
  }
  return family;
}

AgentArchetype archetype_from_traits(const PlayerTraits &t, int age) {
  // Self-represented: a leader who trusts nobody else with the money
  if (t.leadership >= 75 && t.motivation >= 75 && t.loyalty < 50)
    return AgentArchetype::SelfRepresented;
  if (t.marketability >= 70 && (t.team_player < 50 || t.loyalty < 40))
    return AgentArchetype::Shark;
  if (t.marketability >= 65 && age < 27 && t.work_ethic >= 70)
    return AgentArchetype::BrandBuilder;
  return AgentArchetype::FamilyFriend;
}

Agent create_agent(const std::string &player_id,
                   const std::optional<PlayerTraits> &traits,
                   const std::string &player_name, int age) {
  const std::uint64_t seed = mix_seed(hash_id(player_id), kAgentSalt);
  std::mt19937_64 rng(seed);

  AgentArchetype archetype;
  if (traits) {
    archetype = archetype_from_traits(*traits, age);
  } else {
    const int roll = static_cast<int>(mix_seed(seed, 1) % 100ULL);
    if (roll < 25)
      archetype = AgentArchetype::Shark;
    else if (roll < 55)
      archetype = AgentArchetype::FamilyFriend;
    else if (roll < 80)
      archetype = AgentArchetype::BrandBuilder;
    else
      archetype = AgentArchetype::SelfRepresented;
  }

  const ArchetypeProfile &base = archetype_profile(archetype);
  std::uniform_real_distribution<double> jitter(-kJitter, kJitter);
  std::uniform_int_distribution<int> length(base.min_contract_length,
                                            base.max_contract_length);

  Agent a;
  a.archetype = archetype;
  a.name = pick_name(archetype, player_name, rng);
  a.patience = clamp01(base.patience + jitter(rng));
  a.mood_volatility = clamp01(base.mood_volatility + jitter(rng));
  a.max_contract_length = length(rng);
  a.lowball_tolerance = base.lowball_tolerance;
  a.guarantee_weight = base.guarantee_weight;
  a.ring_weight = base.ring_weight;
  return a;
}

} // namespace negotiation_core
