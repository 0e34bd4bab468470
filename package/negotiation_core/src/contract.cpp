#include "negotiation_core/contract.hpp"
#include "negotiation_core/errors.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

namespace negotiation_core {

namespace {

double incentive_sum(const Eigen::VectorXd &v) {
  return v.size() > 0 ? v.sum() : 0.0;
}

int contract_seasons(const ContractOffer &offer) {
  return std::max(1, offer.years + offer.void_years);
}

// Guaranteed base salary per contract year. The guarantee is consumed by
// the signing bonus first, then by base salary in chronological order.
Eigen::VectorXd guaranteed_base_schedule(const ContractOffer &offer) {
  Eigen::VectorXd out = Eigen::VectorXd::Zero(offer.years);
  double left = std::max(0.0, offer.guaranteed_money - offer.signing_bonus);
  for (int y = 0; y < offer.years && left > 0.0; ++y) {
    const double g = std::min(offer.base_salary_per_year[y], left);
    out[y] = g;
    left -= g;
  }
  return out;
}

} // namespace

ContractOffer ContractOffer::flat(std::string id, int years, double salary,
                                  double signing_bonus,
                                  double guaranteed_money, int void_years) {
  if (years <= 0) {
    throw InvalidOffer(fmt::format("years must be positive (got {})", years));
  }
  return ContractOffer(std::move(id), Eigen::VectorXd::Constant(years, salary),
                       signing_bonus, guaranteed_money, void_years);
}

void ContractOffer::validate() const {
  if (years <= 0) {
    throw InvalidOffer(fmt::format("years must be positive (got {})", years));
  }
  if (base_salary_per_year.size() != years) {
    throw InvalidOffer(fmt::format(
        "base_salary_per_year has {} entries for a {}-year contract",
        base_salary_per_year.size(), years));
  }
  if (void_years < 0) {
    throw InvalidOffer(
        fmt::format("void_years must be >= 0 (got {})", void_years));
  }
  if (!base_salary_per_year.allFinite() ||
      (base_salary_per_year.array() < 0.0).any()) {
    throw InvalidOffer("base salaries must be finite and non-negative");
  }
  if (!std::isfinite(signing_bonus) || signing_bonus < 0.0) {
    throw InvalidOffer("signing_bonus must be finite and non-negative");
  }
  if (!std::isfinite(guaranteed_money) || guaranteed_money < 0.0) {
    throw InvalidOffer("guaranteed_money must be finite and non-negative");
  }
  if ((ltbe_incentives.size() > 0 && (ltbe_incentives.array() < 0.0).any()) ||
      (nltbe_incentives.size() > 0 && (nltbe_incentives.array() < 0.0).any())) {
    throw InvalidOffer("incentives must be non-negative");
  }
  const double total = total_value(*this);
  if (guaranteed_money > total) {
    throw InvalidOffer(fmt::format(
        "guaranteed_money {:.0f} exceeds total value {:.0f}",
        guaranteed_money, total));
  }
}

double total_value(const ContractOffer &offer) {
  return offer.base_salary_per_year.sum() + offer.signing_bonus;
}

double average_per_year(const ContractOffer &offer) {
  if (offer.years <= 0)
    return 0.0;
  return total_value(offer) / static_cast<double>(offer.years);
}

double guaranteed_percentage(const ContractOffer &offer) {
  const double total = total_value(offer);
  if (total <= 0.0)
    return 0.0;
  return std::min(1.0, std::max(0.0, offer.guaranteed_money / total));
}

double signing_bonus_proration(const ContractOffer &offer) {
  return offer.signing_bonus / static_cast<double>(contract_seasons(offer));
}

double cap_hit_year1(const ContractOffer &offer) {
  return cap_hit_for_year(offer, 0);
}

double cap_hit_for_year(const ContractOffer &offer, int year) {
  if (year < 0 || year >= offer.years + offer.void_years)
    return 0.0;
  const double base = (year < offer.base_salary_per_year.size())
                          ? offer.base_salary_per_year[year]
                          : 0.0;
  return base + signing_bonus_proration(offer);
}

double dead_cap_on_release(const ContractOffer &offer, int years_elapsed) {
  const int elapsed = std::min(std::max(0, years_elapsed), offer.years);
  const int seasons_left =
      std::max(0, offer.years + offer.void_years - elapsed);
  const double bonus_left =
      signing_bonus_proration(offer) * static_cast<double>(seasons_left);

  const Eigen::VectorXd gtd = guaranteed_base_schedule(offer);
  const double unpaid_gtd =
      (elapsed < gtd.size()) ? gtd.tail(gtd.size() - elapsed).sum() : 0.0;
  return bonus_left + unpaid_gtd;
}

double dead_cap_on_restructure(const ContractOffer &offer,
                               double converted_amount, int years_elapsed) {
  if (offer.years <= 0)
    return 0.0;
  const int y = std::min(std::max(0, years_elapsed), offer.years - 1);
  const double amount =
      std::min(std::max(0.0, converted_amount), offer.base_salary_per_year[y]);
  const int remaining =
      std::max(1, offer.years - y + offer.void_years);
  return amount - amount / static_cast<double>(remaining);
}

double dead_cap_risk(const ContractOffer &offer) {
  if (offer.void_years > 0)
    return offer.signing_bonus;
  return offer.guaranteed_money;
}

RestructureResult restructure(const ContractOffer &offer, int years_elapsed,
                              double conversion_fraction) {
  RestructureResult res;
  if (offer.years <= 0)
    return res;
  const int y = std::min(std::max(0, years_elapsed), offer.years - 1);
  const double frac = std::min(1.0, std::max(0.0, conversion_fraction));
  const double converted = frac * offer.base_salary_per_year[y];
  const int remaining = std::max(1, offer.years - y + offer.void_years);
  const double new_proration = converted / static_cast<double>(remaining);

  const Eigen::VectorXd gtd = guaranteed_base_schedule(offer);
  res.converted_amount = converted;
  res.cap_savings = converted - new_proration;
  res.new_current_year_cap = cap_hit_for_year(offer, y) - res.cap_savings;
  // Converted salary is paid as bonus, so all of it becomes accelerable;
  // the part that was already guaranteed base is counted once.
  res.new_dead_cap =
      dead_cap_on_release(offer, y) + std::max(0.0, converted - gtd[y]);
  return res;
}

std::string format_money(double amount) {
  const double a = std::abs(amount);
  if (a >= 1'000'000'000.0)
    return fmt::format("${:.2f}B", amount / 1'000'000'000.0);
  if (a >= 1'000'000.0)
    return fmt::format("${:.1f}M", amount / 1'000'000.0);
  return fmt::format("${:.0f}K", amount / 1'000.0);
}

} // namespace negotiation_core
