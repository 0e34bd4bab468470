#pragma once

namespace negotiation_core {

// Ordered worst -> best.
enum class AgentMood { Angry = 0, Neutral = 1, Interested = 2, Excited = 3 };

inline const char *to_string(AgentMood mood) {
  switch (mood) {
  case AgentMood::Angry:
    return "Angry";
  case AgentMood::Neutral:
    return "Neutral";
  case AgentMood::Interested:
    return "Interested";
  case AgentMood::Excited:
    return "Excited";
  }
  return "Neutral";
}

// One step from `mood` toward `target`; unchanged when already there.
inline AgentMood step_toward(AgentMood mood, AgentMood target) {
  const int m = static_cast<int>(mood);
  const int t = static_cast<int>(target);
  if (m < t)
    return static_cast<AgentMood>(m + 1);
  if (m > t)
    return static_cast<AgentMood>(m - 1);
  return mood;
}

inline AgentMood improve(AgentMood mood) {
  return step_toward(mood, AgentMood::Excited);
}

inline AgentMood worsen(AgentMood mood) {
  return step_toward(mood, AgentMood::Angry);
}

} // namespace negotiation_core
