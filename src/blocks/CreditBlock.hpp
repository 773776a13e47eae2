#pragma once
#include <algorithm>
#include "../RateTables.hpp"
#include "../kernel/Rounding.hpp"
#include "../taxcore/tax_return.h"
#include "IncomeBlock.hpp"

namespace TaxCore {

struct ChildTaxCredit {
    Decimal total;
    Decimal refundable; // never exceeds total
};

struct CreditResult {
    ChildTaxCredit ctc;
    Decimal other_dependent;
    Decimal earned_income;
    Decimal total_nonrefundable;
    Decimal total_refundable;
};

class CreditBlock {
public:
    // CTC splits into a nonrefundable part (total - refundable) and a
    // refundable part; EIC and caller refundable items join the latter.
    static CreditResult compute(const TaxReturn& ret, const IncomeTotals& income,
                                const Decimal& agi, const TaxYearConfig& cfg) {
        CreditResult r;
        const int children = ret.qualifying_children_count();
        r.ctc = child_tax_credit(children, agi, ret.filing_status, cfg);
        r.other_dependent = other_dependent_credit(ret.other_dependents_count(), cfg.provisions);
        r.earned_income = earned_income_credit(income.earned_income(), agi, children,
                                               cfg.eic.get(ret.filing_status));

        r.total_nonrefundable = round_money((r.ctc.total - r.ctc.refundable) + r.other_dependent +
                                            ret.credits.nonrefundable_sum());
        r.total_refundable = round_money(r.ctc.refundable + r.earned_income +
                                         ret.credits.refundable_sum());
        return r;
    }

    // Reduced by a fixed amount per started step of AGI over the threshold.
    static ChildTaxCredit child_tax_credit(int children, const Decimal& agi, FilingStatus status,
                                           const TaxYearConfig& cfg) {
        ChildTaxCredit c;
        if (children <= 0) return c;
        const Provisions& p = cfg.provisions;

        Decimal total = p.ctc_per_child * Decimal(children);
        Decimal refundable = p.ctc_refundable_per_child * Decimal(children);

        Decimal threshold = cfg.ctc_phaseout_threshold.get(status);
        if (agi > threshold) {
            Decimal steps = ((agi - threshold) / p.ctc_phaseout_step).ceil_whole();
            Decimal reduction = round_money(steps * p.ctc_phaseout_per_step);
            total = floor_zero(total - reduction);
            refundable = min(refundable, total);
        }
        c.total = round_money(total);
        c.refundable = round_money(refundable);
        return c;
    }

    static Decimal other_dependent_credit(int dependents, const Provisions& p) {
        if (dependents <= 0) return Decimal(0);
        return round_money(p.odc_per_dependent * Decimal(dependents));
    }

    // Linear approximation of the IRS EIC table:
    //   credit = max_credit * (1 - AGI / ceiling) for AGI <= ceiling.
    // It is not the published lookup table and will not match it cent for cent.
    // Negative AGI is treated as zero so the credit never exceeds max_credit.
    static Decimal earned_income_credit(const Decimal& earned_income, const Decimal& agi,
                                        int children, const EicSchedule& schedule) {
        if (earned_income <= Decimal(0)) return Decimal(0);
        const EicTier& tier = schedule[static_cast<size_t>(std::min(std::max(children, 0), 3))];
        if (agi > tier.max_agi) return Decimal(0);

        return mul_div_money(tier.max_credit, tier.max_agi - floor_zero(agi), tier.max_agi);
    }
};

} // namespace TaxCore
