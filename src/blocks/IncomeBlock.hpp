#pragma once
#include <variant>
#include "../RateTables.hpp"
#include "../kernel/Rounding.hpp"
#include "../taxcore/tax_return.h"

namespace TaxCore {

// Per-source totals, each rounded. Later stages read these instead of
// re-walking the income records.
struct IncomeTotals {
    Decimal w2_wages;
    Decimal w2_withheld;
    Decimal interest;
    Decimal dividends;
    Decimal other_1099;
    Decimal form1099_withheld;
    Decimal se_net_profit;      // may be negative
    Decimal se_positive_profit; // QBI basis
    Decimal tips;
    Decimal overtime;
    Decimal capital_gains_short;
    Decimal capital_gains_long;
    Decimal rental;
    Decimal other;
    Decimal taxable_social_security;

    Decimal earned_income() const { return round_money(w2_wages + se_net_profit); }

    Decimal investment_income() const {
        return round_money(interest + dividends + capital_gains_short + capital_gains_long + rental);
    }

    Decimal record_withholding() const { return round_money(w2_withheld + form1099_withheld); }
};

class IncomeBlock {
public:
    // Gross income (IRC 61): every source, Social Security only when the
    // year's table does not exempt it.
    static IncomeTotals collect(const TaxReturn& ret, const Provisions& p) {
        Accumulator acc;
        for (const IncomeRecord& rec : ret.income) {
            std::visit(acc, rec);
        }

        IncomeTotals t;
        t.w2_wages = round_money(acc.w2_wages);
        t.w2_withheld = round_money(acc.w2_withheld);
        t.interest = round_money(acc.interest);
        t.dividends = round_money(acc.dividends);
        t.other_1099 = round_money(acc.other_1099);
        t.form1099_withheld = round_money(acc.form1099_withheld);
        t.se_net_profit = round_money(acc.se_net_profit);
        t.se_positive_profit = round_money(acc.se_positive_profit);
        t.tips = round_money(acc.tips);
        t.overtime = round_money(acc.overtime);
        t.capital_gains_short = round_money(acc.cg_short);
        t.capital_gains_long = round_money(acc.cg_long);
        t.rental = round_money(acc.rental);
        t.other = round_money(acc.other);

        if (!p.social_security_exempt) {
            t.taxable_social_security =
                taxable_social_security(ret.social_security_benefits, sum_sources(t), p);
        }
        return t;
    }

    static Decimal gross_income(const IncomeTotals& t) {
        return round_money(sum_sources(t) + t.taxable_social_security);
    }

    // Provisional-income method: half of benefits plus other income,
    // tested against the base and additional thresholds.
    static Decimal taxable_social_security(const Decimal& benefits, const Decimal& other_income,
                                           const Provisions& p) {
        if (benefits <= Decimal(0)) return Decimal(0);

        Decimal provisional = other_income + benefits * p.ss_provisional_share;
        if (provisional <= p.ss_base_threshold) return Decimal(0);

        if (provisional <= p.ss_additional_threshold) {
            return round_money(min((provisional - p.ss_base_threshold) * p.ss_base_inclusion_rate,
                                   benefits * p.ss_base_inclusion_rate));
        }
        Decimal taxable = (provisional - p.ss_base_threshold) * p.ss_base_inclusion_rate +
                          (provisional - p.ss_additional_threshold) * p.ss_excess_inclusion_rate;
        return round_money(min(taxable, benefits * p.ss_max_inclusion_rate));
    }

private:
    struct Accumulator {
        Decimal w2_wages, w2_withheld;
        Decimal interest, dividends, other_1099, form1099_withheld;
        Decimal se_net_profit, se_positive_profit;
        Decimal tips, overtime, cg_short, cg_long, rental, other;

        void operator()(const W2Income& w) {
            w2_wages += w.wages;
            w2_withheld += w.federal_withheld;
        }
        void operator()(const Form1099& f) {
            switch (f.type) {
                case Form1099Type::Interest: interest += f.amount; break;
                case Form1099Type::Dividend: dividends += f.amount; break;
                case Form1099Type::NonemployeeComp:
                case Form1099Type::Miscellaneous:
                case Form1099Type::Other:    other_1099 += f.amount; break;
            }
            form1099_withheld += f.federal_withheld;
        }
        void operator()(const SelfEmploymentLedger& se) {
            Decimal profit = se.net_profit();
            se_net_profit += profit;
            if (profit > Decimal(0)) se_positive_profit += profit;
        }
        void operator()(const TipIncome& t) { tips += t.amount; }
        void operator()(const OvertimeIncome& o) { overtime += o.amount; }
        void operator()(const CapitalGains& c) {
            cg_short += c.short_term;
            cg_long += c.long_term;
        }
        void operator()(const RentalIncome& r) { rental += r.amount; }
        void operator()(const OtherIncome& o) { other += o.amount; }
    };

    static Decimal sum_sources(const IncomeTotals& t) {
        return t.w2_wages + t.se_net_profit + t.tips + t.overtime + t.interest + t.dividends +
               t.other_1099 + t.capital_gains_short + t.capital_gains_long + t.rental + t.other;
    }
};

} // namespace TaxCore
