#include <iostream>
#include <cassert>
#include "test_support.hpp"

using namespace TaxCore;
using namespace TaxCore::testing;

void test_tips_phaseout() {
    std::cout << "Testing tips deduction..." << std::endl;
    auto cfg = RateTables::builtin(2025);
    assert(AdjustmentBlock::tips_deduction(D("30000"), D("100000"), FilingStatus::Single, *cfg) == D("25000"));
    assert(AdjustmentBlock::tips_deduction(D("8000"), D("100000"), FilingStatus::Single, *cfg) == D("8000"));
    // 10% of the 10,000 over the 160,000 threshold
    assert(AdjustmentBlock::tips_deduction(D("30000"), D("170000"), FilingStatus::Single, *cfg) == D("24000"));
    assert(AdjustmentBlock::tips_deduction(D("30000"), D("500000"), FilingStatus::Single, *cfg) == Decimal(0));
    assert(AdjustmentBlock::tips_deduction(D("30000"), D("330000"), FilingStatus::MarriedJoint, *cfg) == D("24000"));
    assert(AdjustmentBlock::tips_deduction(Decimal(0), D("50000"), FilingStatus::Single, *cfg) == Decimal(0));
}

void test_overtime_cliff() {
    std::cout << "Testing overtime deduction cliff..." << std::endl;
    const Provisions& p = RateTables::builtin(2025)->provisions;
    assert(AdjustmentBlock::overtime_deduction(D("5000"), D("99999"), p) == D("5000"));
    assert(AdjustmentBlock::overtime_deduction(D("5000"), D("100000"), p) == Decimal(0));
    assert(AdjustmentBlock::overtime_deduction(D("15000"), D("50000"), p) == D("10000"));
}

void test_capped_adjustments() {
    std::cout << "Testing capped adjustments..." << std::endl;
    auto cfg = RateTables::builtin(2025);
    TaxReturn ret = wage_return(FilingStatus::Single, "60000");
    ret.adjustments.educator_expenses = D("500");
    ret.adjustments.student_loan_interest = D("3000");
    ret.adjustments.hsa_deduction = D("1000");
    ret.adjustments.ira_deduction = D("2000");

    IncomeTotals income = IncomeBlock::collect(ret, cfg->provisions);
    AdjustmentResult r = AdjustmentBlock::compute(ret, income, IncomeBlock::gross_income(income),
                                                  D("5651.82"), *cfg);
    assert(r.educator_expenses == D("300"));
    assert(r.student_loan_interest == D("2500"));
    assert(r.se_tax_deduction == D("2825.91"));
    assert(r.tips_deduction == Decimal(0));
    assert(r.overtime_deduction == Decimal(0));
    check("total", r.total, "8625.91");
    assert(r.total == D("8625.91"));
}

void test_tips_and_overtime_in_total() {
    std::cout << "Testing tips and overtime in the total..." << std::endl;
    auto cfg = RateTables::builtin(2025);
    TaxReturn ret = wage_return(FilingStatus::Single, "40000");
    ret.income.push_back(TipIncome{D("6000")});
    ret.income.push_back(OvertimeIncome{D("4000")});

    IncomeTotals income = IncomeBlock::collect(ret, cfg->provisions);
    AdjustmentResult r = AdjustmentBlock::compute(ret, income, IncomeBlock::gross_income(income),
                                                  Decimal(0), *cfg);
    assert(r.tips_deduction == D("6000"));
    assert(r.overtime_deduction == D("4000"));
    assert(r.total == D("10000"));
}

int main() {
    test_tips_phaseout();
    test_overtime_cliff();
    test_capped_adjustments();
    test_tips_and_overtime_in_total();
    std::cout << "SUCCESS: adjustments verified." << std::endl;
    return 0;
}
