#pragma once
#include "../RateTables.hpp"
#include "../kernel/Rounding.hpp"
#include "../taxcore/tax_return.h"
#include "IncomeBlock.hpp"

namespace TaxCore {

struct AdjustmentResult {
    Decimal educator_expenses;
    Decimal se_tax_deduction;
    Decimal student_loan_interest;
    Decimal tips_deduction;
    Decimal overtime_deduction;
    Decimal total;
};

// Above-the-line adjustments. AGI = gross income - total.
class AdjustmentBlock {
public:
    static AdjustmentResult compute(const TaxReturn& ret, const IncomeTotals& income,
                                    const Decimal& gross_income, const Decimal& se_tax,
                                    const TaxYearConfig& cfg) {
        const Provisions& p = cfg.provisions;
        const AdjustmentInputs& in = ret.adjustments;

        AdjustmentResult r;
        r.educator_expenses = min(in.educator_expenses, p.educator_expense_cap);
        r.se_tax_deduction = apply_rate(se_tax, p.se_tax_deductible_share);
        r.student_loan_interest = min(in.student_loan_interest, p.student_loan_interest_cap);
        r.tips_deduction = tips_deduction(income.tips, gross_income, ret.filing_status, cfg);
        r.overtime_deduction = overtime_deduction(income.overtime, income.w2_wages, p);

        // HSA is taken as supplied; IRS contribution limits are not checked here.
        Decimal total = r.educator_expenses + in.hsa_deduction + r.se_tax_deduction +
                        in.self_employed_health_insurance + in.sep_simple_contributions +
                        r.student_loan_interest + in.ira_deduction + r.tips_deduction +
                        r.overtime_deduction;
        r.total = round_money(total);
        return r;
    }

    // min(tips, cap), less 10% of gross income above the status threshold.
    static Decimal tips_deduction(const Decimal& tips, const Decimal& gross_income,
                                  FilingStatus status, const TaxYearConfig& cfg) {
        if (tips <= Decimal(0)) return Decimal(0);
        const Provisions& p = cfg.provisions;

        Decimal base = min(tips, p.tips_deduction_cap);
        Decimal threshold = cfg.tips_phaseout_threshold.get(status);
        if (gross_income > threshold) {
            Decimal phaseout = apply_rate(gross_income - threshold, p.tips_phaseout_rate);
            base = floor_zero(base - phaseout);
        }
        return round_money(base);
    }

    // Hard cliff: any W-2 total at or above the wage cliff loses the whole deduction.
    static Decimal overtime_deduction(const Decimal& overtime, const Decimal& w2_wages,
                                      const Provisions& p) {
        if (overtime <= Decimal(0)) return Decimal(0);
        if (w2_wages >= p.overtime_wage_cliff) return Decimal(0);
        return round_money(min(overtime, p.overtime_deduction_cap));
    }
};

} // namespace TaxCore
