#pragma once
#include "../RateTables.hpp"
#include "../kernel/Rounding.hpp"
#include "../taxcore/tax_return.h"
#include "IncomeBlock.hpp"

namespace TaxCore {

struct DeductionResult {
    Decimal standard;
    Decimal itemized;        // zero when the caller supplied no itemized deductions
    Decimal amount;          // the chosen one
    DeductionKind kind = DeductionKind::Standard;
    Decimal qbi;
    bool qbi_above_phaseout_threshold = false;
};

class DeductionBlock {
public:
    static DeductionResult compute(const TaxReturn& ret, const IncomeTotals& income,
                                   const Decimal& agi, const TaxYearConfig& cfg) {
        DeductionResult r;
        r.standard = standard_deduction(ret, cfg);
        if (ret.itemized.has_value()) {
            r.itemized = itemized_deduction(*ret.itemized, agi, cfg.provisions);
        }

        // Ties go to standard.
        if (ret.itemized.has_value() && r.itemized > r.standard) {
            r.amount = r.itemized;
            r.kind = DeductionKind::Itemized;
        } else {
            r.amount = r.standard;
            r.kind = DeductionKind::Standard;
        }

        r.qbi = qbi_deduction(income, cfg.provisions);
        r.qbi_above_phaseout_threshold =
            r.qbi > Decimal(0) && agi > cfg.qbi_phaseout_threshold.get(ret.filing_status);
        return r;
    }

    // Base amount plus 65+/blind add-ons (taxpayer, and spouse on a joint
    // return) plus the senior deduction, which only exists on this path.
    static Decimal standard_deduction(const TaxReturn& ret, const TaxYearConfig& cfg) {
        const Provisions& p = cfg.provisions;
        const int year = ret.tax_year;

        Decimal add_on = uses_unmarried_additional_amount(ret.filing_status)
                             ? cfg.additional_standard.unmarried
                             : cfg.additional_standard.married;

        Decimal additional(0);
        if (ret.taxpayer.age_at_year_end(year) >= p.senior_age) additional += add_on;
        if (ret.taxpayer.is_blind) additional += add_on;

        if (ret.spouse.has_value() && ret.filing_status == FilingStatus::MarriedJoint) {
            if (ret.spouse->age_at_year_end(year) >= p.senior_age) additional += cfg.additional_standard.married;
            if (ret.spouse->is_blind) additional += cfg.additional_standard.married;
        }

        if (ret.taxpayer.age_at_year_end(year) >= p.senior_age) {
            additional += p.senior_deduction;
        }

        return round_money(cfg.standard_deduction.get(ret.filing_status) + additional);
    }

    // Schedule A total. AGI-based limits are floored at zero so a negative
    // AGI cannot turn the medical floor or charitable ceiling into a bonus.
    static Decimal itemized_deduction(const ItemizedDeductions& it, const Decimal& agi,
                                      const Provisions& p) {
        Decimal medical_floor = floor_zero(apply_rate(agi, p.medical_agi_floor_rate));
        Decimal medical = floor_zero(it.medical - medical_floor);

        Decimal charitable_limit = floor_zero(apply_rate(agi, p.charitable_agi_limit_rate));
        Decimal charitable = min(it.charitable_total(), charitable_limit);

        Decimal total = medical + it.salt_total(p.salt_cap) + it.interest_total(p.auto_loan_interest_cap) +
                        charitable + it.casualty_losses + it.gambling_losses + it.other;
        return round_money(total);
    }

    // 20% of positive Schedule C profits. The statutory high-income phaseout
    // (W-2 wage / UBIA limits) is not applied; compute() only flags the case.
    static Decimal qbi_deduction(const IncomeTotals& income, const Provisions& p) {
        if (income.se_positive_profit <= Decimal(0)) return Decimal(0);
        return apply_rate(income.se_positive_profit, p.qbi_rate);
    }
};

} // namespace TaxCore
