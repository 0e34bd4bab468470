#include <iostream>
#include <set>
#include <string>

#include "negotiation_core/agent.hpp"

#define NC_ASSERT(expr)                                                        \
  do {                                                                         \
    if (!(expr)) {                                                             \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":"             \
                << __LINE__ << ")\n";                                          \
      return 1;                                                                \
    }                                                                          \
  } while (0)

using namespace negotiation_core;

int test_agent_profiles() {
  // Same id, same agent.
  {
    const Agent a = create_agent("player-123");
    const Agent b = create_agent("player-123");
    NC_ASSERT(a.name == b.name);
    NC_ASSERT(a.archetype == b.archetype);
    NC_ASSERT(a.patience == b.patience);
    NC_ASSERT(a.max_contract_length == b.max_contract_length);
    NC_ASSERT(a.mood_volatility == b.mood_volatility);
  }

  // Trait-driven archetypes.
  {
    PlayerTraits shark;
    shark.marketability = 80;
    shark.team_player = 30;
    NC_ASSERT(archetype_from_traits(shark, 28) == AgentArchetype::Shark);

    PlayerTraits self_rep;
    self_rep.leadership = 80;
    self_rep.motivation = 80;
    self_rep.loyalty = 30;
    NC_ASSERT(archetype_from_traits(self_rep, 28) ==
              AgentArchetype::SelfRepresented);

    PlayerTraits brand;
    brand.marketability = 70;
    brand.team_player = 60;
    brand.work_ethic = 80;
    NC_ASSERT(archetype_from_traits(brand, 24) == AgentArchetype::BrandBuilder);
    // Too old to build a brand.
    NC_ASSERT(archetype_from_traits(brand, 29) == AgentArchetype::FamilyFriend);

    PlayerTraits family;
    family.loyalty = 85;
    family.team_player = 85;
    NC_ASSERT(archetype_from_traits(family, 30) ==
              AgentArchetype::FamilyFriend);

    const Agent s = create_agent("shark-1", shark, "Jalen Cole", 28);
    NC_ASSERT(s.archetype == AgentArchetype::Shark);
    NC_ASSERT(s.max_contract_length >= 7 && s.max_contract_length <= 10);
    NC_ASSERT(s.lowball_tolerance == 2);

    const Agent f = create_agent("family-1", family, "Sam Ortiz", 30);
    NC_ASSERT(f.archetype == AgentArchetype::FamilyFriend);
    NC_ASSERT(f.patience > s.patience);
    NC_ASSERT(f.mood_volatility < s.mood_volatility);

    const Agent b = create_agent("brand-1", brand, "Kai Young", 24);
    NC_ASSERT(b.max_contract_length >= 2 && b.max_contract_length <= 3);

    const Agent r = create_agent("self-1", self_rep, "Dre Banks", 28);
    NC_ASSERT(r.archetype == AgentArchetype::SelfRepresented);
    NC_ASSERT(r.name == "Dre Banks (Self-Rep)");
    NC_ASSERT(r.patience > f.patience - 0.2);
  }

  // Id hashing reaches every archetype; values stay in range.
  {
    std::set<AgentArchetype> seen;
    for (int i = 0; i < 200; ++i) {
      const Agent a = create_agent("p" + std::to_string(i));
      seen.insert(a.archetype);
      NC_ASSERT(a.patience >= 0.0 && a.patience <= 1.0);
      NC_ASSERT(a.mood_volatility >= 0.0 && a.mood_volatility <= 1.0);
      NC_ASSERT(a.max_contract_length >= 2 && a.max_contract_length <= 10);
      NC_ASSERT(!a.name.empty());
    }
    NC_ASSERT(seen.size() == 4);
  }
  return 0;
}
