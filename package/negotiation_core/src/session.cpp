#include "negotiation_core/session.hpp"

namespace negotiation_core {

namespace {

struct StateName {
  const char *operator()(const Normal &) const { return "Normal"; }
  const char *operator()(const PhoneDead &) const { return "PhoneDead"; }
  const char *operator()(const ShadowPending &) const {
    return "ShadowPending";
  }
  const char *operator()(const LockedOut &) const { return "LockedOut"; }
  const char *operator()(const Accepted &) const { return "Accepted"; }
};

} // namespace

const char *state_name(const SessionState &state) {
  return std::visit(StateName{}, state);
}

const char *to_string(NegotiationOutcome outcome) {
  switch (outcome) {
  case NegotiationOutcome::Accepted:
    return "Accepted";
  case NegotiationOutcome::Countered:
    return "Countered";
  case NegotiationOutcome::Rejected:
    return "Rejected";
  case NegotiationOutcome::CapInfeasible:
    return "CapInfeasible";
  case NegotiationOutcome::PhoneDead:
    return "PhoneDead";
  case NegotiationOutcome::LockedOut:
    return "LockedOut";
  case NegotiationOutcome::AlreadyAgreed:
    return "AlreadyAgreed";
  }
  return "Unknown";
}

} // namespace negotiation_core
