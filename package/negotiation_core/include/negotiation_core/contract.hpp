#pragma once

#include <string>
#include <utility>

#include <Eigen/Dense>

namespace negotiation_core {

// Proposed contract terms. All money is in dollars.
struct ContractOffer {
  std::string id;
  int years{0};
  Eigen::VectorXd base_salary_per_year; // length = years
  double signing_bonus{0.0};
  double guaranteed_money{0.0};
  Eigen::VectorXd ltbe_incentives;  // likely to be earned
  Eigen::VectorXd nltbe_incentives; // not likely to be earned
  int void_years{0};
  bool offset_language{false};

  ContractOffer() = default;
  ContractOffer(std::string id_, Eigen::VectorXd base_salary_per_year_,
                double signing_bonus_, double guaranteed_money_,
                int void_years_ = 0, bool offset_language_ = false,
                Eigen::VectorXd ltbe_incentives_ = Eigen::VectorXd(),
                Eigen::VectorXd nltbe_incentives_ = Eigen::VectorXd())
      : id(std::move(id_)),
        years(static_cast<int>(base_salary_per_year_.size())),
        base_salary_per_year(std::move(base_salary_per_year_)),
        signing_bonus(signing_bonus_), guaranteed_money(guaranteed_money_),
        ltbe_incentives(std::move(ltbe_incentives_)),
        nltbe_incentives(std::move(nltbe_incentives_)),
        void_years(void_years_), offset_language(offset_language_) {
    validate();
  }

  // Flat schedule: the same base salary every year.
  static ContractOffer flat(std::string id, int years, double salary,
                            double signing_bonus, double guaranteed_money,
                            int void_years = 0);

  // Throws InvalidOffer if the terms are not a well-formed contract.
  void validate() const;
};

// Sum of base salaries plus the signing bonus. Incentives are excluded.
double total_value(const ContractOffer &offer);

double average_per_year(const ContractOffer &offer);

// guaranteed_money / total_value, or 0 when total_value is 0.
double guaranteed_percentage(const ContractOffer &offer);

// Signing bonus spread evenly over contract and void years.
double signing_bonus_proration(const ContractOffer &offer);

double cap_hit_year1(const ContractOffer &offer);

// Cap charge for contract year `year` (0-based); void years carry only
// proration. Zero outside the contract and void seasons.
double cap_hit_for_year(const ContractOffer &offer, int year);

// Accelerated charge if the player is released after `years_elapsed`
// seasons: all remaining proration plus guaranteed base not yet paid.
// Guarantees cover the signing bonus first, then base salary front to back.
// With offset_language the figure is advisory; the release path applies
// the offset.
double dead_cap_on_release(const ContractOffer &offer, int years_elapsed);

// Future-season proration created by converting `converted_amount` of the
// current base salary into signing bonus.
double dead_cap_on_restructure(const ContractOffer &offer,
                               double converted_amount,
                               int years_elapsed = 0);

// Quick liability estimate: with void years the whole bonus accelerates,
// otherwise the guarantee is the exposure.
double dead_cap_risk(const ContractOffer &offer);

struct RestructureResult {
  double converted_amount{0.0};
  double cap_savings{0.0};
  double new_dead_cap{0.0};
  double new_current_year_cap{0.0};
};

// Convert `conversion_fraction` (clamped to [0,1]) of the current season's
// base salary into prorated bonus.
RestructureResult restructure(const ContractOffer &offer, int years_elapsed,
                              double conversion_fraction);

// "$12.5M", "$750K", "$1.20B"
std::string format_money(double amount);

} // namespace negotiation_core
