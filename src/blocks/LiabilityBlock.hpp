#pragma once
#include <optional>
#include <vector>
#include "../RateTables.hpp"
#include "../kernel/Rounding.hpp"
#include "IncomeBlock.hpp"

namespace TaxCore {

// Portion of taxable income falling inside one bracket.
struct BracketSlice {
    Decimal start;
    std::optional<Decimal> end; // nullopt for the open top bracket
    Decimal rate;
    Decimal taxable;            // income inside the bracket
    Decimal tax;                // rounded
};

struct SelfEmploymentTax {
    Decimal net_earnings;
    Decimal social_security;
    Decimal medicare;
    Decimal total;
};

struct LiabilityResult {
    Decimal bracket_tax;
    SelfEmploymentTax self_employment;
    Decimal capital_gains_tax;
    Decimal niit;
    Decimal additional_medicare;
    Decimal total;
};

class LiabilityBlock {
public:
    // The four pieces are computed independently and summed.
    static LiabilityResult compute(FilingStatus status, const IncomeTotals& income,
                                   const Decimal& taxable_income, const Decimal& agi,
                                   const TaxYearConfig& cfg) {
        LiabilityResult r;
        r.bracket_tax = bracket_tax(taxable_income, cfg.brackets.get(status));
        r.self_employment = self_employment_tax(income.se_net_profit, cfg.provisions);
        r.capital_gains_tax = capital_gains_tax(income.capital_gains_long, taxable_income,
                                                cfg.capital_gains.get(status), cfg.provisions);
        r.niit = net_investment_income_tax(income.investment_income(), agi,
                                           cfg.niit_threshold.get(status), cfg.provisions);
        r.additional_medicare = additional_medicare_tax(income.earned_income(),
                                                        cfg.additional_medicare_threshold.get(status),
                                                        cfg.provisions);
        r.total = round_money(r.bracket_tax + r.self_employment.total + r.capital_gains_tax +
                              r.niit + r.additional_medicare);
        return r;
    }

    // One slice per bracket touched by taxable income, each rounded on its own.
    static std::vector<BracketSlice> bracket_slices(const Decimal& taxable_income,
                                                    const BracketSchedule& schedule) {
        std::vector<BracketSlice> out;
        if (taxable_income <= Decimal(0)) return out;

        Decimal previous(0);
        for (const Bracket& b : schedule) {
            if (taxable_income <= previous) break;

            Decimal top = b.upper.has_value() ? min(taxable_income, *b.upper) : taxable_income;
            Decimal in_bracket = top - previous;
            if (in_bracket > Decimal(0)) {
                BracketSlice s;
                s.start = previous;
                s.end = b.upper;
                s.rate = b.rate;
                s.taxable = in_bracket;
                s.tax = apply_rate(in_bracket, b.rate);
                out.push_back(s);
            }
            if (!b.upper.has_value()) break;
            previous = *b.upper;
        }
        return out;
    }

    // Sum of per-bracket rounded amounts. Rounding only the final sum
    // differs by a cent in some cases; keep per-bracket rounding.
    static Decimal bracket_tax(const Decimal& taxable_income, const BracketSchedule& schedule) {
        Decimal tax(0);
        for (const BracketSlice& s : bracket_slices(taxable_income, schedule)) {
            tax += s.tax;
        }
        return round_money(tax);
    }

    // Rate of the bracket that holds the last dollar of taxable income.
    // Zero income reports the first bracket's rate.
    static Decimal marginal_rate(const Decimal& taxable_income, const BracketSchedule& schedule) {
        for (const Bracket& b : schedule) {
            if (!b.upper.has_value() || taxable_income <= *b.upper) return b.rate;
        }
        return schedule.empty() ? Decimal(0) : schedule.back().rate;
    }

    static SelfEmploymentTax self_employment_tax(const Decimal& se_net_profit, const Provisions& p) {
        SelfEmploymentTax t;
        if (se_net_profit <= Decimal(0)) return t;

        t.net_earnings = apply_rate(se_net_profit, p.se_net_earnings_rate);
        t.social_security = apply_rate(min(t.net_earnings, p.social_security_wage_base),
                                       p.social_security_tax_rate);
        t.medicare = apply_rate(t.net_earnings, p.medicare_tax_rate);
        t.total = round_money(t.social_security + t.medicare);
        return t;
    }

    // Step function on taxable income: the whole long-term gain is taxed
    // at the tier taxable income lands in. No blending across tiers.
    static Decimal capital_gains_tax(const Decimal& long_term_gains, const Decimal& taxable_income,
                                     const CapitalGainsTiers& tiers, const Provisions& p) {
        if (long_term_gains <= Decimal(0)) return Decimal(0);
        if (taxable_income <= tiers.zero_rate_max) return Decimal(0);
        if (taxable_income <= tiers.fifteen_rate_max) return apply_rate(long_term_gains, p.capital_gains_mid_rate);
        return apply_rate(long_term_gains, p.capital_gains_top_rate);
    }

    static Decimal net_investment_income_tax(const Decimal& investment_income, const Decimal& agi,
                                             const Decimal& threshold, const Provisions& p) {
        if (agi <= threshold) return Decimal(0);
        Decimal base = floor_zero(min(investment_income, agi - threshold));
        return apply_rate(base, p.niit_rate);
    }

    // Wages plus SE net profit above the threshold.
    static Decimal additional_medicare_tax(const Decimal& earned_income, const Decimal& threshold,
                                           const Provisions& p) {
        if (earned_income <= threshold) return Decimal(0);
        return apply_rate(earned_income - threshold, p.additional_medicare_rate);
    }
};

} // namespace TaxCore
