#ifndef TAXCORE_TAX_RETURN_H
#define TAXCORE_TAX_RETURN_H

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "types.h"
#include "../Decimal.hpp"
#include "../kernel/Rounding.hpp"

namespace TaxCore {

struct TaxpayerProfile {
    Date date_of_birth;
    bool is_blind = false;
    std::string occupation; // free text

    // Age on Dec 31 of the tax year.
    int age_at_year_end(int tax_year) const {
        Date year_end{tax_year, 12, 31};
        int age = tax_year - date_of_birth.year;
        if (year_end.month < date_of_birth.month ||
            (year_end.month == date_of_birth.month && year_end.day < date_of_birth.day)) {
            age -= 1;
        }
        return age;
    }

    // Heuristic only; feeds advisories, never an amount.
    bool occupation_suggests_educator() const;
};

struct Dependent {
    std::string name;
    Date date_of_birth;
    bool qualifies_for_ctc = false;
    bool qualifies_for_odc = false;
};

// ---------------------------------------------------------------------------
// Income records
// ---------------------------------------------------------------------------
struct W2Income {
    std::string employer;
    Decimal wages;            // box 1
    Decimal federal_withheld; // box 2
};

enum class Form1099Type { Interest, Dividend, NonemployeeComp, Miscellaneous, Other };

struct Form1099 {
    Form1099Type type = Form1099Type::Other;
    std::string payer;
    Decimal amount;
    Decimal federal_withheld;
};

struct ExpenseLine {
    std::string category;
    Decimal amount;
};

// Schedule C style ledger for one business.
struct SelfEmploymentLedger {
    std::string business_name;
    Decimal gross_receipts;
    Decimal returns_and_allowances;
    Decimal other_income;
    Decimal cost_of_goods_sold;
    std::vector<ExpenseLine> expenses;
    Decimal meals;       // 50% deductible
    Decimal home_office;

    Decimal gross_income() const {
        return round_money(gross_receipts - returns_and_allowances + other_income - cost_of_goods_sold);
    }

    Decimal total_expenses() const {
        Decimal sum;
        for (const auto& e : expenses) sum += e.amount;
        sum += meals * Decimal::parse("0.5");
        sum += home_office;
        return round_money(sum);
    }

    // May be negative (a loss flows through).
    Decimal net_profit() const {
        return round_money(gross_income() - total_expenses());
    }
};

struct TipIncome      { Decimal amount; };
struct OvertimeIncome { Decimal amount; };
struct CapitalGains   { Decimal short_term; Decimal long_term; };
struct RentalIncome   { Decimal amount; };
struct OtherIncome    { std::string description; Decimal amount; };

using IncomeRecord = std::variant<W2Income, Form1099, SelfEmploymentLedger, TipIncome,
                                  OvertimeIncome, CapitalGains, RentalIncome, OtherIncome>;

// ---------------------------------------------------------------------------
// Adjustments, deductions, credits, payments
// ---------------------------------------------------------------------------
struct AdjustmentInputs {
    Decimal educator_expenses;
    Decimal hsa_deduction;
    Decimal self_employed_health_insurance;
    Decimal sep_simple_contributions;
    Decimal student_loan_interest;
    Decimal ira_deduction;
};

struct ItemizedDeductions {
    Decimal medical;

    Decimal state_local_income_tax;
    Decimal state_local_sales_tax;
    Decimal real_estate_tax;
    Decimal personal_property_tax;

    Decimal mortgage_interest;
    Decimal mortgage_points;
    Decimal investment_interest;
    Decimal auto_loan_interest;

    Decimal cash_contributions;
    Decimal noncash_contributions;
    Decimal carryover_contributions;

    Decimal casualty_losses;
    Decimal gambling_losses;
    Decimal other;

    Decimal salt_total(const Decimal& salt_cap) const {
        return min(round_money(state_local_income_tax + state_local_sales_tax +
                               real_estate_tax + personal_property_tax), salt_cap);
    }

    Decimal interest_total(const Decimal& auto_loan_cap) const {
        return round_money(mortgage_interest + mortgage_points + investment_interest +
                           min(auto_loan_interest, auto_loan_cap));
    }

    // AGI-percentage limit is applied by the deduction stage.
    Decimal charitable_total() const {
        return round_money(cash_contributions + noncash_contributions + carryover_contributions);
    }
};

// Caller-supplied credit line items. CTC/EIC/ODC are computed by the engine.
struct TaxCredits {
    // Nonrefundable
    Decimal american_opportunity;
    Decimal lifetime_learning;
    Decimal residential_energy;
    Decimal electric_vehicle;
    Decimal foreign_tax;
    Decimal retirement_savings;
    Decimal dependent_care;
    Decimal other_nonrefundable;

    // Refundable
    Decimal american_opportunity_refundable;
    Decimal other_refundable;

    Decimal nonrefundable_sum() const {
        return round_money(american_opportunity + lifetime_learning + residential_energy +
                           electric_vehicle + foreign_tax + retirement_savings + dependent_care +
                           other_nonrefundable);
    }

    Decimal refundable_sum() const {
        return round_money(american_opportunity_refundable + other_refundable);
    }
};

struct Payments {
    Decimal federal_withheld;   // withholding not attached to a W-2 or 1099 record
    Decimal estimated_payments;
    Decimal extension_payment;
};

// Written by the engine on every recalculation; never read by it.
struct DerivedFields {
    Decimal gross_income;
    Decimal adjustments;
    Decimal adjusted_gross_income;
    Decimal deduction_amount;
    DeductionKind deduction_kind = DeductionKind::Standard;
    Decimal qbi_deduction;
    Decimal taxable_income;
    Decimal tax_liability;
    Decimal total_nonrefundable_credits;
    Decimal total_refundable_credits;
    Decimal tax_after_credits;
    Decimal total_payments;
    Decimal refund_amount;
    Decimal amount_owed;
    Decimal child_tax_credit;
    Decimal child_tax_credit_refundable;
};

struct TaxReturn {
    int tax_year = 2025;
    FilingStatus filing_status = FilingStatus::Single;

    TaxpayerProfile taxpayer;
    std::optional<TaxpayerProfile> spouse;
    std::vector<Dependent> dependents;

    std::vector<IncomeRecord> income;
    Decimal social_security_benefits;

    AdjustmentInputs adjustments;
    std::optional<ItemizedDeductions> itemized;
    TaxCredits credits;
    Payments payments;

    DerivedFields derived;

    int qualifying_children_count() const {
        int n = 0;
        for (const auto& d : dependents) if (d.qualifies_for_ctc) ++n;
        return n;
    }

    int other_dependents_count() const {
        int n = 0;
        for (const auto& d : dependents) if (d.qualifies_for_odc) ++n;
        return n;
    }
};

} // namespace TaxCore

#endif // TAXCORE_TAX_RETURN_H
