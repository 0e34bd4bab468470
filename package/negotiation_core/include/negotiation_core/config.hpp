#pragma once

#include "negotiation_core/agent.hpp"

namespace negotiation_core {

// One tunable value per archetype.
struct ArchetypeWeights {
  double shark{0.0};
  double family_friend{0.0};
  double brand_builder{0.0};
  double self_represented{0.0};

  double of(AgentArchetype a) const {
    switch (a) {
    case AgentArchetype::Shark:
      return shark;
    case AgentArchetype::FamilyFriend:
      return family_friend;
    case AgentArchetype::BrandBuilder:
      return brand_builder;
    case AgentArchetype::SelfRepresented:
      return self_represented;
    }
    return 0.0;
  }
};

struct LeverageConfig {
  double base{0.2};
  // agent side
  double cap_pressure_weight{0.35};
  double scarcity_weight{0.30};
  // shared round fatigue
  double fatigue_per_round{0.03};
  double fatigue_cap{0.15};
  // user side
  double cap_margin_weight{0.35};
  double contender_weight{0.20};
  double press_leak_weight{0.06};
  double press_leak_cap{0.25};
  double distrust_penalty{0.05};
};

struct EvaluatorConfig {
  double base_threshold{0.95};
  double leverage_weight{0.05}; // scales (user - agent) leverage balance
  double excited_adjust{-0.03};
  double interested_adjust{-0.01};
  double angry_adjust{0.02};
  ArchetypeWeights archetype_adjust{0.0, -0.05, 0.0, 0.0};
  ArchetypeWeights contender_discount{0.0, 0.03, 0.03, 0.0};
  double guarantee_pivot{0.5};
  double guarantee_bonus_weight{0.04};
  double min_threshold{0.70};
  double max_threshold{1.25};
  double near_miss_floor{0.80};
  double literal_near_miss_floor{0.90}; // self-represented players
};

struct EventConfig {
  // press leaks
  int press_leak_min_round{3};
  ArchetypeWeights press_leak_propensity{0.45, 0.05, 0.25, 0.15};
  double press_leak_round_growth{0.05};
  double press_leak_round_cap{0.30};
  double angry_leak_factor{1.0};
  double neutral_leak_factor{0.5};
  double interested_leak_factor{0.2};
  // phone dead
  int phone_dead_after_rejections{2};
  int phone_dead_cooldown{3}; // rounds; one round is a week
  // shadow advisor
  double shadow_min_agent_leverage{0.55};
  ArchetypeWeights shadow_probability{0.15, 0.02, 0.12, 0.08};
  double shadow_demand_min{1.10}; // x market value
  double shadow_demand_spread{0.15};
  int max_shadow_events{1};
  int shadow_ignore_limit{2};
  // hard round cap = base_max_rounds + patience * patience_round_bonus
  int base_max_rounds{8};
  int patience_round_bonus{8};
};

struct NegotiationConfig {
  LeverageConfig leverage{};
  EvaluatorConfig evaluator{};
  EventConfig events{};
  bool verbose{false};
};

} // namespace negotiation_core
