#include "engine.h"
#include <iostream>

namespace TaxCore {

namespace {

void require_non_negative(const Decimal& v, const std::string& field) {
    if (v.is_negative()) {
        throw InvalidInputError("Negative amount not allowed: " + field + " = " + v.to_string());
    }
}

// Checks that are about one income record, not about the return as a whole.
struct RecordValidator {
    size_t index = 0;

    void operator()(const W2Income& w) const {
        require_non_negative(w.federal_withheld, "income[" + std::to_string(index) + "].federal_withheld");
    }
    void operator()(const Form1099& f) const {
        require_non_negative(f.federal_withheld, "income[" + std::to_string(index) + "].federal_withheld");
    }
    void operator()(const SelfEmploymentLedger&) const {}
    void operator()(const TipIncome&) const {}
    void operator()(const OvertimeIncome&) const {}
    void operator()(const CapitalGains&) const {}
    void operator()(const RentalIncome&) const {}
    void operator()(const OtherIncome&) const {}
};

} // namespace

TaxEngine::TaxEngine(std::shared_ptr<const TaxYearConfig> config)
    : config_(std::move(config)) {
    if (!config_) {
        throw ConfigurationError("TaxEngine requires a rate table");
    }
    config_->validate();
    std::cerr << "[TaxCore::Engine] Rate tables for " << config_->tax_year
              << " (" << config_->source << ")" << std::endl;
}

TaxEngine TaxEngine::for_year(int tax_year) {
    return TaxEngine(RateTables::builtin(tax_year));
}

void TaxEngine::validate(const TaxReturn& ret) const {
    if (ret.tax_year != config_->tax_year) {
        throw InvalidInputError("Return is for tax year " + std::to_string(ret.tax_year) +
                                " but rate tables are for " + std::to_string(config_->tax_year));
    }
    if (ret.filing_status == FilingStatus::MarriedJoint && !ret.spouse.has_value()) {
        throw InvalidInputError("Filing status married_filing_jointly requires a spouse profile");
    }

    RecordValidator check;
    for (const IncomeRecord& rec : ret.income) {
        std::visit(check, rec);
        ++check.index;
    }
    require_non_negative(ret.payments.federal_withheld, "payments.federal_withheld");
    require_non_negative(ret.payments.estimated_payments, "payments.estimated_payments");
    require_non_negative(ret.payments.extension_payment, "payments.extension_payment");
}

TaxComputation TaxEngine::evaluate(const TaxReturn& ret) const {
    validate(ret);
    const TaxYearConfig& cfg = *config_;
    const Provisions& p = cfg.provisions;

    TaxComputation c;
    c.tax_year = cfg.tax_year;
    c.filing_status = ret.filing_status;

    // 1. Gross income
    c.income = IncomeBlock::collect(ret, p);
    c.gross_income = IncomeBlock::gross_income(c.income);

    // 2. Adjustments -> AGI (half of SE tax is an adjustment)
    SelfEmploymentTax se = LiabilityBlock::self_employment_tax(c.income.se_net_profit, p);
    c.adjustments = AdjustmentBlock::compute(ret, c.income, c.gross_income, se.total, cfg);
    c.adjusted_gross_income = round_money(c.gross_income - c.adjustments.total);

    // 3. Deduction and QBI -> taxable income
    c.deduction = DeductionBlock::compute(ret, c.income, c.adjusted_gross_income, cfg);
    c.taxable_income = round_money(
        floor_zero(c.adjusted_gross_income - c.deduction.amount - c.deduction.qbi));

    // 4. Liability
    c.liability = LiabilityBlock::compute(ret.filing_status, c.income, c.taxable_income,
                                          c.adjusted_gross_income, cfg);

    // 5. Credits
    c.credits = CreditBlock::compute(ret, c.income, c.adjusted_gross_income, cfg);

    // 6. Settlement
    c.settlement = SettlementBlock::compute(c.liability.total, c.credits, c.income, ret.payments);
    c.federal_withheld = round_money(c.income.record_withholding() + ret.payments.federal_withheld);
    c.estimated_payments = round_money(ret.payments.estimated_payments);

    if (ret.taxpayer.occupation_suggests_educator() &&
        ret.adjustments.educator_expenses < p.educator_expense_cap) {
        c.advisories.push_back("educator_expenses: up to " + p.educator_expense_cap.to_string() +
                               " of classroom expenses is deductible for K-12 educators");
    }
    if (c.deduction.qbi_above_phaseout_threshold) {
        c.advisories.push_back("qbi_deduction: AGI exceeds the phaseout threshold of " +
                               cfg.qbi_phaseout_threshold.get(ret.filing_status).to_string() +
                               "; the phaseout is not applied");
    }
    return c;
}

TaxComputation TaxEngine::compute(TaxReturn& ret) const {
    TaxComputation c = evaluate(ret);

    DerivedFields& d = ret.derived;
    d.gross_income = c.gross_income;
    d.adjustments = c.adjustments.total;
    d.adjusted_gross_income = c.adjusted_gross_income;
    d.deduction_amount = c.deduction.amount;
    d.deduction_kind = c.deduction.kind;
    d.qbi_deduction = c.deduction.qbi;
    d.taxable_income = c.taxable_income;
    d.tax_liability = c.liability.total;
    d.total_nonrefundable_credits = c.credits.total_nonrefundable;
    d.total_refundable_credits = c.credits.total_refundable;
    d.tax_after_credits = c.settlement.tax_after_credits;
    d.total_payments = c.settlement.total_payments;
    d.refund_amount = c.settlement.refund;
    d.amount_owed = c.settlement.owed;
    d.child_tax_credit = c.credits.ctc.total;
    d.child_tax_credit_refundable = c.credits.ctc.refundable;
    return c;
}

QuickEstimate TaxEngine::quick_estimate(const QuickEstimateRequest& req) const {
    if (req.ctc_children < 0 || req.other_dependents < 0) {
        throw InvalidInputError("Dependent counts must not be negative");
    }
    const TaxYearConfig& cfg = *config_;
    const int year = cfg.tax_year;

    TaxReturn ret;
    ret.tax_year = year;
    ret.filing_status = req.filing_status;
    int age = req.is_senior ? cfg.provisions.senior_age : 30;
    ret.taxpayer.date_of_birth = Date{year - age, 1, 1};
    if (req.filing_status == FilingStatus::MarriedJoint) {
        ret.spouse = TaxpayerProfile{Date{year - 30, 1, 1}, false, ""};
    }

    if (req.w2_wages > Decimal(0) || req.federal_withheld > Decimal(0)) {
        ret.income.push_back(W2Income{"", req.w2_wages, req.federal_withheld});
    }
    if (!req.self_employment_income.is_zero()) {
        SelfEmploymentLedger se;
        se.gross_receipts = req.self_employment_income;
        ret.income.push_back(se);
    }
    if (req.tip_income > Decimal(0)) ret.income.push_back(TipIncome{req.tip_income});
    if (req.overtime_income > Decimal(0)) ret.income.push_back(OvertimeIncome{req.overtime_income});
    if (!req.other_income.is_zero()) ret.income.push_back(OtherIncome{"", req.other_income});

    for (int i = 0; i < req.ctc_children; ++i) {
        ret.dependents.push_back(Dependent{"child " + std::to_string(i + 1), Date{year - 5, 1, 1}, true, false});
    }
    for (int i = 0; i < req.other_dependents; ++i) {
        ret.dependents.push_back(Dependent{"dependent " + std::to_string(i + 1), Date{year - 20, 1, 1}, false, true});
    }
    if (req.itemized_total > Decimal(0)) {
        ItemizedDeductions it;
        it.other = req.itemized_total;
        ret.itemized = it;
    }

    QuickEstimate q;
    q.computation = evaluate(ret);
    const TaxComputation& c = q.computation;

    if (req.is_senior && c.deduction.kind == DeductionKind::Standard) {
        q.senior_deduction = cfg.provisions.senior_deduction;
    }
    if (c.gross_income > Decimal(0)) {
        q.effective_rate = mul_div_money(c.liability.total, Decimal(100), c.gross_income);
    }
    q.marginal_rate = round_money(
        LiabilityBlock::marginal_rate(c.taxable_income, cfg.brackets.get(req.filing_status)) * Decimal(100));
    return q;
}

std::vector<BracketSlice> TaxEngine::bracket_breakdown(const Decimal& taxable_income,
                                                       FilingStatus status) const {
    return LiabilityBlock::bracket_slices(round_money(taxable_income), config_->brackets.get(status));
}

WithholdingEstimate TaxEngine::estimate_withholding(FilingStatus status, const Decimal& annual_income,
                                                    PayFrequency frequency,
                                                    const Decimal& additional_per_period,
                                                    const Decimal& pre_tax_deductions) const {
    require_non_negative(annual_income, "annual_income");
    require_non_negative(additional_per_period, "additional_withholding");
    require_non_negative(pre_tax_deductions, "pre_tax_deductions");

    WithholdingEstimate w;
    w.annual_income = round_money(annual_income);
    w.taxable_income = round_money(
        floor_zero(annual_income - pre_tax_deductions - config_->standard_deduction.get(status)));
    w.estimated_annual_tax = LiabilityBlock::bracket_tax(w.taxable_income, config_->brackets.get(status));
    w.pay_periods = pay_periods(frequency);
    w.recommended_per_period = round_money(w.estimated_annual_tax / Decimal(w.pay_periods));
    w.additional_per_period = round_money(additional_per_period);
    w.total_per_period = round_money(w.recommended_per_period + w.additional_per_period);
    return w;
}

int pay_periods(PayFrequency f) {
    switch (f) {
        case PayFrequency::Weekly:      return 52;
        case PayFrequency::Biweekly:    return 26;
        case PayFrequency::Semimonthly: return 24;
        case PayFrequency::Monthly:     return 12;
    }
    throw InvalidInputError("Unknown pay frequency value");
}

PayFrequency parse_pay_frequency(const std::string& key) {
    if (key == "weekly") return PayFrequency::Weekly;
    if (key == "biweekly") return PayFrequency::Biweekly;
    if (key == "semimonthly") return PayFrequency::Semimonthly;
    if (key == "monthly") return PayFrequency::Monthly;
    throw InvalidInputError("Unknown pay frequency: " + key);
}

std::map<std::string, std::string> TaxComputation::to_field_map() const {
    std::map<std::string, std::string> m;
    m["grossIncome"] = gross_income.to_string();
    m["adjustments"] = adjustments.total.to_string();
    m["adjustedGrossIncome"] = adjusted_gross_income.to_string();
    m["deductionAmount"] = deduction.amount.to_string();
    m["deductionKind"] = to_string(deduction.kind);
    m["qbiDeduction"] = deduction.qbi.to_string();
    m["taxableIncome"] = taxable_income.to_string();
    m["taxLiability"] = liability.total.to_string();
    m["selfEmploymentTax"] = liability.self_employment.total.to_string();
    m["totalNonrefundableCredits"] = credits.total_nonrefundable.to_string();
    m["totalRefundableCredits"] = credits.total_refundable.to_string();
    m["taxAfterCredits"] = settlement.tax_after_credits.to_string();
    m["totalPayments"] = settlement.total_payments.to_string();
    m["federalWithheld"] = federal_withheld.to_string();
    m["estimatedPayments"] = estimated_payments.to_string();
    m["refundAmount"] = settlement.refund.to_string();
    m["amountOwed"] = settlement.owed.to_string();
    m["tipsDeduction"] = adjustments.tips_deduction.to_string();
    m["overtimeDeduction"] = adjustments.overtime_deduction.to_string();
    m["childTaxCredit"] = credits.ctc.total.to_string();
    return m;
}

} // namespace TaxCore
