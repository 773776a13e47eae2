#pragma once
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Decimal.hpp"
#include "taxcore/types.h"

namespace TaxCore {

// One value per filing status. Accessors switch over every enumerator,
// so a new status is a compile-time gap rather than a silent default.
template <typename T>
struct StatusTable {
    T single{};
    T married_joint{};
    T married_separate{};
    T head_of_household{};
    T qualifying_widow{};

    const T& get(FilingStatus s) const {
        switch (s) {
            case FilingStatus::Single:          return single;
            case FilingStatus::MarriedJoint:    return married_joint;
            case FilingStatus::MarriedSeparate: return married_separate;
            case FilingStatus::HeadOfHousehold: return head_of_household;
            case FilingStatus::QualifyingWidow: return qualifying_widow;
        }
        throw ConfigurationError("StatusTable: unknown filing status");
    }

    T& get(FilingStatus s) {
        return const_cast<T&>(static_cast<const StatusTable&>(*this).get(s));
    }
};

inline constexpr std::array<FilingStatus, 5> kAllFilingStatuses = {
    FilingStatus::Single, FilingStatus::MarriedJoint, FilingStatus::MarriedSeparate,
    FilingStatus::HeadOfHousehold, FilingStatus::QualifyingWidow
};

// upper == nullopt marks the open-ended top bracket.
struct Bracket {
    std::optional<Decimal> upper;
    Decimal rate;
};
using BracketSchedule = std::vector<Bracket>;

struct CapitalGainsTiers {
    Decimal zero_rate_max;     // taxable income at or below: 0%
    Decimal fifteen_rate_max;  // at or below: 15%, above: 20%
};

struct EicTier {
    Decimal max_agi;
    Decimal max_credit;
};
using EicSchedule = std::array<EicTier, 4>; // indexed by min(children, 3)

struct AdditionalStandardDeduction {
    Decimal unmarried; // Single, HeadOfHousehold
    Decimal married;
};

// Named statutory constants for one tax year.
struct Provisions {
    // Adjustments
    Decimal educator_expense_cap;
    Decimal student_loan_interest_cap;
    Decimal se_tax_deductible_share;
    Decimal tips_deduction_cap;
    Decimal tips_phaseout_rate;
    Decimal overtime_deduction_cap;
    Decimal overtime_wage_cliff;

    // Deductions
    Decimal senior_deduction;
    int senior_age = 65;
    Decimal medical_agi_floor_rate;
    Decimal charitable_agi_limit_rate;
    Decimal salt_cap;
    Decimal auto_loan_interest_cap;
    Decimal qbi_rate;

    // Liability
    Decimal se_net_earnings_rate;
    Decimal social_security_wage_base;
    Decimal social_security_tax_rate;
    Decimal medicare_tax_rate;
    Decimal capital_gains_mid_rate;
    Decimal capital_gains_top_rate;
    Decimal niit_rate;
    Decimal additional_medicare_rate;

    // Credits
    Decimal ctc_per_child;
    Decimal ctc_refundable_per_child;
    Decimal ctc_phaseout_step;
    Decimal ctc_phaseout_per_step;
    Decimal odc_per_dependent;

    // Social Security benefits
    bool social_security_exempt = true;
    Decimal ss_base_threshold;
    Decimal ss_additional_threshold;
    Decimal ss_provisional_share;
    Decimal ss_base_inclusion_rate;
    Decimal ss_excess_inclusion_rate;
    Decimal ss_max_inclusion_rate;
};

// Immutable rate tables for one tax year. Built once, shared as
// std::shared_ptr<const TaxYearConfig>, read concurrently without locking.
struct TaxYearConfig {
    int tax_year = 0;
    std::string source; // "builtin" or the JSON path it was loaded from

    StatusTable<BracketSchedule> brackets;
    StatusTable<Decimal> standard_deduction;
    AdditionalStandardDeduction additional_standard;

    StatusTable<Decimal> tips_phaseout_threshold;
    StatusTable<Decimal> ctc_phaseout_threshold;
    StatusTable<Decimal> niit_threshold;
    StatusTable<Decimal> additional_medicare_threshold;
    StatusTable<Decimal> qbi_phaseout_threshold;
    StatusTable<CapitalGainsTiers> capital_gains;
    StatusTable<EicSchedule> eic;

    Provisions provisions;

    // Throws ConfigurationError when a schedule is empty, unordered, or
    // lacks an open-ended top bracket.
    void validate() const;
};

// Single/HoH take the unmarried add-on; everyone else the married one.
inline bool uses_unmarried_additional_amount(FilingStatus s) {
    switch (s) {
        case FilingStatus::Single:
        case FilingStatus::HeadOfHousehold:
            return true;
        case FilingStatus::MarriedJoint:
        case FilingStatus::MarriedSeparate:
        case FilingStatus::QualifyingWidow:
            return false;
    }
    throw ConfigurationError("uses_unmarried_additional_amount: unknown filing status");
}

namespace RateTables {

// Compiled-in tables. Throws ConfigurationError for years not shipped.
std::shared_ptr<const TaxYearConfig> builtin(int tax_year);

std::vector<int> builtin_years();

} // namespace RateTables

} // namespace TaxCore
