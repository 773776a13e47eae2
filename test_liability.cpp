#include <iostream>
#include <cassert>
#include "test_support.hpp"

using namespace TaxCore;
using namespace TaxCore::testing;

void test_bracket_tax() {
    std::cout << "Testing bracket tax..." << std::endl;
    auto cfg = RateTables::builtin(2025);
    const BracketSchedule& single = cfg->brackets.get(FilingStatus::Single);

    assert(LiabilityBlock::bracket_tax(D("35400"), single) == D("4016"));
    assert(LiabilityBlock::bracket_tax(D("60000"), single) == D("8253"));
    assert(LiabilityBlock::bracket_tax(Decimal(0), single) == Decimal(0));
    assert(LiabilityBlock::bracket_tax(D("-500"), single) == Decimal(0));
    assert(LiabilityBlock::bracket_tax(D("11600.05"), single) == D("1160.01"));

    Decimal top = LiabilityBlock::bracket_tax(D("700000"), single);
    check("tax(700000)", top, "217187.75");
    assert(top == D("217187.75"));

    const BracketSchedule& joint = cfg->brackets.get(FilingStatus::MarriedJoint);
    assert(LiabilityBlock::bracket_tax(D("70800"), joint) == D("8032"));
}

void test_bracket_slices() {
    std::cout << "Testing bracket slices..." << std::endl;
    auto cfg = RateTables::builtin(2025);
    const BracketSchedule& single = cfg->brackets.get(FilingStatus::Single);

    std::vector<BracketSlice> slices = LiabilityBlock::bracket_slices(D("60000"), single);
    assert(slices.size() == 3);
    assert(slices[0].start == Decimal(0));
    assert(slices[0].tax == D("1160"));
    assert(slices[1].taxable == D("35550"));
    assert(slices[1].tax == D("4266"));
    assert(slices[2].start == D("47150"));
    assert(slices[2].end.has_value() && *slices[2].end == D("100525"));
    assert(slices[2].tax == D("2827"));

    std::vector<BracketSlice> all = LiabilityBlock::bracket_slices(D("700000"), single);
    assert(all.size() == 7);
    assert(!all.back().end.has_value());
    assert(all.back().taxable == D("90650"));

    assert(LiabilityBlock::bracket_slices(Decimal(0), single).empty());
}

void test_monotonicity() {
    std::cout << "Testing bracket monotonicity..." << std::endl;
    auto cfg = RateTables::builtin(2025);
    for (FilingStatus s : kAllFilingStatuses) {
        const BracketSchedule& sched = cfg->brackets.get(s);
        Decimal prev_tax(0);
        for (Decimal ti(0); ti < D("800000"); ti += D("997.13")) {
            Decimal tax = LiabilityBlock::bracket_tax(ti, sched);
            assert(tax >= prev_tax);
            if (ti > Decimal(0)) assert(tax > prev_tax);
            prev_tax = tax;
        }
    }
}

void test_marginal_rate() {
    std::cout << "Testing marginal rate..." << std::endl;
    auto cfg = RateTables::builtin(2025);
    const BracketSchedule& single = cfg->brackets.get(FilingStatus::Single);
    assert(LiabilityBlock::marginal_rate(D("35400"), single) == D("0.12"));
    assert(LiabilityBlock::marginal_rate(D("11600"), single) == D("0.10"));
    assert(LiabilityBlock::marginal_rate(Decimal(0), single) == D("0.10"));
    assert(LiabilityBlock::marginal_rate(D("1000000"), single) == D("0.37"));
}

void test_self_employment_tax() {
    std::cout << "Testing self-employment tax..." << std::endl;
    const Provisions& p = RateTables::builtin(2025)->provisions;

    SelfEmploymentTax t = LiabilityBlock::self_employment_tax(D("40000"), p);
    assert(t.net_earnings == D("36940"));
    assert(t.social_security == D("4580.56"));
    assert(t.medicare == D("1071.26"));
    assert(t.total == D("5651.82"));

    // Social Security portion stops at the wage base; Medicare does not.
    SelfEmploymentTax big = LiabilityBlock::self_employment_tax(D("200000"), p);
    assert(big.net_earnings == D("184700"));
    assert(big.social_security == D("20906.40"));
    assert(big.medicare == D("5356.30"));
    assert(big.total == D("26262.70"));

    assert(LiabilityBlock::self_employment_tax(D("-3000"), p).total == Decimal(0));
    assert(LiabilityBlock::self_employment_tax(Decimal(0), p).total == Decimal(0));
}

void test_capital_gains_tiers() {
    std::cout << "Testing capital gains tiers..." << std::endl;
    auto cfg = RateTables::builtin(2025);
    const Provisions& p = cfg->provisions;
    const CapitalGainsTiers& single = cfg->capital_gains.get(FilingStatus::Single);
    assert(LiabilityBlock::capital_gains_tax(D("10000"), D("40000"), single, p) == Decimal(0));
    assert(LiabilityBlock::capital_gains_tax(D("10000"), D("47025"), single, p) == Decimal(0));
    assert(LiabilityBlock::capital_gains_tax(D("10000"), D("100000"), single, p) == D("1500"));
    assert(LiabilityBlock::capital_gains_tax(D("10000"), D("600000"), single, p) == D("2000"));
    assert(LiabilityBlock::capital_gains_tax(D("-10000"), D("600000"), single, p) == Decimal(0));
}

void test_surtaxes() {
    std::cout << "Testing NIIT and additional Medicare..." << std::endl;
    const Provisions& p = RateTables::builtin(2025)->provisions;
    assert(LiabilityBlock::net_investment_income_tax(D("50000"), D("220000"), D("200000"), p) == D("760"));
    assert(LiabilityBlock::net_investment_income_tax(D("5000"), D("300000"), D("200000"), p) == D("190"));
    assert(LiabilityBlock::net_investment_income_tax(D("50000"), D("190000"), D("200000"), p) == Decimal(0));
    assert(LiabilityBlock::net_investment_income_tax(D("-4000"), D("300000"), D("200000"), p) == Decimal(0));

    assert(LiabilityBlock::additional_medicare_tax(D("250000"), D("200000"), p) == D("450"));
    assert(LiabilityBlock::additional_medicare_tax(D("200000"), D("200000"), p) == Decimal(0));
}

void test_total_liability() {
    std::cout << "Testing liability composition..." << std::endl;
    auto cfg = RateTables::builtin(2025);
    IncomeTotals income;
    income.w2_wages = D("250000");
    income.capital_gains_long = D("20000");

    LiabilityResult r = LiabilityBlock::compute(FilingStatus::Single, income, D("255400"), D("270000"), *cfg);
    assert(r.capital_gains_tax == D("3000"));
    assert(r.niit == D("760"));
    assert(r.additional_medicare == D("450"));
    assert(r.self_employment.total == Decimal(0));
    assert(r.total == r.bracket_tax + D("4210"));
}

int main() {
    test_bracket_tax();
    test_bracket_slices();
    test_monotonicity();
    test_marginal_rate();
    test_self_employment_tax();
    test_capital_gains_tiers();
    test_surtaxes();
    test_total_liability();
    std::cout << "SUCCESS: liability verified." << std::endl;
    return 0;
}
