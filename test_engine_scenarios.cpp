#include <iostream>
#include <cassert>
#include <thread>
#include <vector>
#include "test_support.hpp"

using namespace TaxCore;
using namespace TaxCore::testing;

void test_scenario_a_single_wage_earner() {
    std::cout << "Scenario A: single, 50,000 wages..." << std::endl;
    TaxEngine engine = TaxEngine::for_year(2025);
    TaxReturn ret = wage_return(FilingStatus::Single, "50000", "6000");

    TaxComputation c = engine.compute(ret);
    assert(c.gross_income == D("50000"));
    assert(c.adjusted_gross_income == D("50000"));
    assert(c.deduction.kind == DeductionKind::Standard);
    assert(c.taxable_income == D("35400"));
    check("liability", c.liability.total, "4016.00");
    assert(c.liability.total == D("4016"));
    assert(c.settlement.refund == D("1984"));
    assert(c.settlement.owed == Decimal(0));

    assert(ret.derived.taxable_income == D("35400"));
    assert(ret.derived.refund_amount == D("1984"));

    auto fields = c.to_field_map();
    assert(fields["taxableIncome"] == "35400.00");
    assert(fields["refundAmount"] == "1984.00");
    assert(fields["amountOwed"] == "0.00");
    assert(fields["deductionKind"] == "standard");
    assert(fields["federalWithheld"] == "6000.00");
}

void test_scenario_b_self_employed() {
    std::cout << "Scenario B: self-employed, 40,000 profit..." << std::endl;
    TaxEngine engine = TaxEngine::for_year(2025);
    TaxReturn ret;
    ret.taxpayer = adult();
    SelfEmploymentLedger se;
    se.business_name = "Consulting";
    se.gross_receipts = D("40000");
    ret.income.push_back(se);

    TaxComputation c = engine.compute(ret);
    assert(c.liability.self_employment.total == D("5651.82"));
    assert(c.adjustments.se_tax_deduction == D("2825.91"));
    assert(c.adjusted_gross_income == D("37174.09"));
    assert(c.deduction.qbi == D("8000"));
    assert(c.taxable_income == D("14574.09"));
    assert(c.liability.bracket_tax == D("1516.89"));
    check("liability", c.liability.total, "7168.71");
    assert(c.liability.total == D("7168.71"));
    assert(c.settlement.owed == D("7168.71"));
    assert(c.settlement.refund == Decimal(0));
}

void test_scenario_c_joint_below_phaseout() {
    std::cout << "Scenario C: joint, 350,000 AGI, two children..." << std::endl;
    TaxEngine engine = TaxEngine::for_year(2025);
    TaxReturn ret = wage_return(FilingStatus::MarriedJoint, "350000");
    ret.dependents.push_back(child("A"));
    ret.dependents.push_back(child("B"));

    TaxComputation c = engine.compute(ret);
    assert(c.adjusted_gross_income == D("350000"));
    assert(c.credits.ctc.total == D("4400"));
    assert(c.credits.ctc.refundable == D("3400"));
    assert(ret.derived.child_tax_credit == D("4400"));
    assert(ret.derived.child_tax_credit_refundable == D("3400"));
    assert(c.to_field_map()["childTaxCredit"] == "4400.00");
}

void test_scenario_d_joint_phaseout() {
    std::cout << "Scenario D: joint, 450,000 AGI, two children..." << std::endl;
    TaxEngine engine = TaxEngine::for_year(2025);
    TaxReturn ret = wage_return(FilingStatus::MarriedJoint, "450000");
    ret.dependents.push_back(child("A"));
    ret.dependents.push_back(child("B"));

    TaxComputation c = engine.compute(ret);
    assert(c.credits.ctc.total == D("1900"));
    assert(c.credits.ctc.refundable == D("1900"));
    assert(c.credits.total_nonrefundable == Decimal(0));
    assert(c.credits.total_refundable == D("1900"));
}

void test_overtime_cliff() {
    std::cout << "Testing overtime cliff through the engine..." << std::endl;
    TaxEngine engine = TaxEngine::for_year(2025);
    TaxReturn below = wage_return(FilingStatus::Single, "99999");
    below.income.push_back(OvertimeIncome{D("5000")});
    TaxReturn at = wage_return(FilingStatus::Single, "100000");
    at.income.push_back(OvertimeIncome{D("5000")});

    assert(engine.evaluate(below).adjustments.overtime_deduction == D("5000"));
    assert(engine.evaluate(at).adjustments.overtime_deduction == Decimal(0));
}

void test_nonrefundable_floor() {
    std::cout << "Testing nonrefundable floor..." << std::endl;
    TaxEngine engine = TaxEngine::for_year(2025);
    TaxReturn ret = wage_return(FilingStatus::Single, "20000", "1500");
    ret.credits.american_opportunity = D("100000");

    TaxComputation c = engine.compute(ret);
    assert(c.settlement.tax_after_credits == Decimal(0));
    assert(c.settlement.refund == D("1500"));
    assert(ret.derived.tax_after_credits == Decimal(0));
}

void test_settlement_exclusivity() {
    std::cout << "Testing settlement exclusivity..." << std::endl;
    TaxEngine engine = TaxEngine::for_year(2025);
    const char* wages[] = {"0", "12000", "35000", "80000", "150000", "420000"};
    const char* withheld[] = {"0", "500", "4016", "20000"};
    for (FilingStatus s : kAllFilingStatuses) {
        for (const char* w : wages) {
            for (const char* h : withheld) {
                TaxReturn ret = wage_return(s, w, h);
                ret.dependents.push_back(child("A"));
                TaxComputation c = engine.compute(ret);
                assert(c.settlement.refund.is_zero() || c.settlement.owed.is_zero());
                assert(!c.settlement.refund.is_negative());
                assert(!c.settlement.owed.is_negative());
                assert(!c.settlement.tax_after_credits.is_negative());
            }
        }
    }
    Settlement even = SettlementBlock::settle(D("100"), D("100"));
    assert(even.refund.is_zero() && even.owed.is_zero());
}

void test_liability_monotone_in_wages() {
    std::cout << "Testing liability monotonicity through the engine..." << std::endl;
    TaxEngine engine = TaxEngine::for_year(2025);
    Decimal prev(0);
    for (int w = 0; w <= 400000; w += 2500) {
        TaxReturn ret = wage_return(FilingStatus::HeadOfHousehold, "0");
        ret.income.clear();
        ret.income.push_back(W2Income{"Acme", Decimal(w), Decimal(0)});
        Decimal total = engine.evaluate(ret).liability.total;
        assert(total >= prev);
        prev = total;
    }
}

void test_qualifying_widow_uses_joint_schedule() {
    std::cout << "Testing qualifying widow schedule..." << std::endl;
    TaxEngine engine = TaxEngine::for_year(2025);
    TaxReturn ret = wage_return(FilingStatus::QualifyingWidow, "100000");
    TaxComputation c = engine.evaluate(ret);
    assert(c.deduction.amount == D("29200"));
    assert(c.taxable_income == D("70800"));
    assert(c.liability.bracket_tax == D("8032"));
}

void test_validation() {
    std::cout << "Testing input validation..." << std::endl;
    TaxEngine engine = TaxEngine::for_year(2025);

    TaxReturn no_spouse = wage_return(FilingStatus::Single, "50000");
    no_spouse.filing_status = FilingStatus::MarriedJoint;
    no_spouse.derived.taxable_income = D("-1");
    assert(throws<InvalidInputError>([&] { engine.compute(no_spouse); }));
    assert(no_spouse.derived.taxable_income == D("-1"));

    TaxReturn negative = wage_return(FilingStatus::Single, "50000", "-10");
    assert(throws<InvalidInputError>([&] { engine.compute(negative); }));

    TaxReturn neg_payment = wage_return(FilingStatus::Single, "50000");
    neg_payment.payments.estimated_payments = D("-1");
    assert(throws<InvalidInputError>([&] { engine.compute(neg_payment); }));

    TaxReturn wrong_year = wage_return(FilingStatus::Single, "50000");
    wrong_year.tax_year = 2024;
    assert(throws<InvalidInputError>([&] { engine.compute(wrong_year); }));

    assert(throws<ConfigurationError>([] { RateTables::builtin(2019); }));
    assert(throws<ConfigurationError>([] { TaxEngine e(nullptr); }));
}

void test_raw_fields_untouched() {
    std::cout << "Testing raw fields are read-only..." << std::endl;
    TaxEngine engine = TaxEngine::for_year(2025);
    TaxReturn ret = wage_return(FilingStatus::Single, "50000", "6000");
    ret.income.push_back(TipIncome{D("1200")});
    TaxReturn before = ret;

    engine.compute(ret);
    engine.compute(ret);
    assert(ret.income.size() == before.income.size());
    assert(std::get<W2Income>(ret.income[0]).wages == D("50000"));
    assert(std::get<TipIncome>(ret.income[1]).amount == D("1200"));
    assert(ret.payments.federal_withheld == before.payments.federal_withheld);
    assert(ret.derived.gross_income == D("51200"));
}

void test_field_map_keys() {
    std::cout << "Testing field map keys..." << std::endl;
    TaxEngine engine = TaxEngine::for_year(2025);
    TaxReturn ret = wage_return(FilingStatus::Single, "50000", "6000");
    auto fields = engine.evaluate(ret).to_field_map();
    const char* keys[] = {"grossIncome", "adjustments", "adjustedGrossIncome", "deductionAmount",
                          "deductionKind", "taxableIncome", "taxLiability", "totalNonrefundableCredits",
                          "totalRefundableCredits", "taxAfterCredits", "totalPayments", "refundAmount",
                          "amountOwed", "tipsDeduction", "overtimeDeduction", "childTaxCredit",
                          "qbiDeduction", "selfEmploymentTax", "federalWithheld", "estimatedPayments"};
    for (const char* k : keys) {
        assert(fields.count(k) == 1);
    }
}

void test_advisories() {
    std::cout << "Testing advisories..." << std::endl;
    TaxEngine engine = TaxEngine::for_year(2025);
    TaxReturn ret = wage_return(FilingStatus::Single, "50000");
    ret.taxpayer.occupation = "Middle School TEACHER";
    TaxComputation c = engine.evaluate(ret);
    assert(c.advisories.size() == 1);
    assert(c.advisories[0].find("educator_expenses") == 0);

    ret.adjustments.educator_expenses = D("300");
    assert(engine.evaluate(ret).advisories.empty());

    ret.taxpayer.occupation = "Plumber";
    ret.adjustments.educator_expenses = Decimal(0);
    assert(engine.evaluate(ret).advisories.empty());
}

void test_shared_engine_across_threads() {
    std::cout << "Testing concurrent evaluation..." << std::endl;
    const TaxEngine engine = TaxEngine::for_year(2025);
    std::vector<Decimal> results(8);
    std::vector<std::thread> workers;
    for (size_t i = 0; i < results.size(); ++i) {
        workers.emplace_back([&engine, &results, i] {
            TaxReturn ret = wage_return(FilingStatus::Single, "50000", "6000");
            results[i] = engine.evaluate(ret).settlement.refund;
        });
    }
    for (auto& t : workers) t.join();
    for (const Decimal& r : results) assert(r == D("1984"));
}

int main() {
    test_scenario_a_single_wage_earner();
    test_scenario_b_self_employed();
    test_scenario_c_joint_below_phaseout();
    test_scenario_d_joint_phaseout();
    test_overtime_cliff();
    test_nonrefundable_floor();
    test_settlement_exclusivity();
    test_liability_monotone_in_wages();
    test_qualifying_widow_uses_joint_schedule();
    test_validation();
    test_raw_fields_untouched();
    test_field_map_keys();
    test_advisories();
    test_shared_engine_across_threads();
    std::cout << "SUCCESS: engine scenarios verified." << std::endl;
    return 0;
}
