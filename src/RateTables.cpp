#include "RateTables.hpp"
#include <map>

namespace TaxCore {

void TaxYearConfig::validate() const {
    for (FilingStatus s : kAllFilingStatuses) {
        const BracketSchedule& sched = brackets.get(s);
        if (sched.empty()) {
            throw ConfigurationError(std::string("Empty bracket schedule for ") + to_string(s));
        }
        Decimal prev(0);
        for (size_t i = 0; i < sched.size(); ++i) {
            const Bracket& b = sched[i];
            bool last = (i + 1 == sched.size());
            if (!b.upper.has_value()) {
                if (!last) throw ConfigurationError(std::string("Open bracket before end of schedule for ") + to_string(s));
                continue;
            }
            if (last) throw ConfigurationError(std::string("Top bracket must be open-ended for ") + to_string(s));
            if (*b.upper <= prev) throw ConfigurationError(std::string("Bracket bounds not increasing for ") + to_string(s));
            prev = *b.upper;
        }
        if (standard_deduction.get(s).is_negative()) {
            throw ConfigurationError(std::string("Negative standard deduction for ") + to_string(s));
        }
        const CapitalGainsTiers& cg = capital_gains.get(s);
        if (cg.fifteen_rate_max < cg.zero_rate_max) {
            throw ConfigurationError(std::string("Capital gains tiers out of order for ") + to_string(s));
        }
        for (const EicTier& t : eic.get(s)) {
            if (t.max_agi <= Decimal(0)) {
                throw ConfigurationError(std::string("EIC ceiling must be positive for ") + to_string(s));
            }
        }
    }
    if (provisions.ctc_phaseout_step <= Decimal(0)) {
        throw ConfigurationError("ctc_phaseout_step must be positive");
    }
}

namespace {

Decimal D(const char* text) { return Decimal::parse(text); }

BracketSchedule schedule(std::initializer_list<std::pair<const char*, const char*>> rows) {
    BracketSchedule out;
    for (const auto& [upper, rate] : rows) {
        Bracket b;
        if (upper != nullptr) b.upper = D(upper);
        b.rate = D(rate);
        out.push_back(b);
    }
    return out;
}

template <typename T>
StatusTable<T> joint_split(const T& joint, const T& others) {
    StatusTable<T> t;
    t.single = others;
    t.married_joint = joint;
    t.married_separate = others;
    t.head_of_household = others;
    t.qualifying_widow = others;
    return t;
}

template <typename T>
StatusTable<T> single_split(const T& single, const T& others) {
    StatusTable<T> t;
    t.single = single;
    t.married_joint = others;
    t.married_separate = others;
    t.head_of_household = others;
    t.qualifying_widow = others;
    return t;
}

std::shared_ptr<const TaxYearConfig> make_2025() {
    auto cfg = std::make_shared<TaxYearConfig>();
    cfg->tax_year = 2025;
    cfg->source = "builtin";

    BracketSchedule joint = schedule({
        {"23200", "0.10"}, {"94300", "0.12"}, {"201050", "0.22"}, {"383900", "0.24"},
        {"487450", "0.32"}, {"731200", "0.35"}, {nullptr, "0.37"}});
    cfg->brackets.single = schedule({
        {"11600", "0.10"}, {"47150", "0.12"}, {"100525", "0.22"}, {"191950", "0.24"},
        {"243725", "0.32"}, {"609350", "0.35"}, {nullptr, "0.37"}});
    cfg->brackets.married_joint = joint;
    cfg->brackets.married_separate = schedule({
        {"11600", "0.10"}, {"47150", "0.12"}, {"100525", "0.22"}, {"191950", "0.24"},
        {"243725", "0.32"}, {"365600", "0.35"}, {nullptr, "0.37"}});
    cfg->brackets.head_of_household = schedule({
        {"16550", "0.10"}, {"63100", "0.12"}, {"100500", "0.22"}, {"191950", "0.24"},
        {"243700", "0.32"}, {"609350", "0.35"}, {nullptr, "0.37"}});
    cfg->brackets.qualifying_widow = joint;

    cfg->standard_deduction.single = D("14600");
    cfg->standard_deduction.married_joint = D("29200");
    cfg->standard_deduction.married_separate = D("14600");
    cfg->standard_deduction.head_of_household = D("21900");
    cfg->standard_deduction.qualifying_widow = D("29200");
    cfg->additional_standard = {D("1950"), D("1550")};

    cfg->tips_phaseout_threshold = joint_split(D("320000"), D("160000"));
    cfg->ctc_phaseout_threshold = joint_split(D("400000"), D("200000"));
    cfg->niit_threshold = single_split(D("200000"), D("250000"));
    cfg->additional_medicare_threshold = single_split(D("200000"), D("250000"));
    cfg->qbi_phaseout_threshold = single_split(D("191950"), D("383900"));

    cfg->capital_gains.single = {D("47025"), D("518900")};
    cfg->capital_gains.married_joint = {D("94050"), D("583750")};
    cfg->capital_gains.married_separate = {D("47025"), D("291850")};
    cfg->capital_gains.head_of_household = {D("47025"), D("291850")};
    cfg->capital_gains.qualifying_widow = {D("47025"), D("291850")};

    EicSchedule eic_joint = {{
        {D("24210"), D("632")}, {D("53120"), D("4213")},
        {D("59478"), D("6960")}, {D("63398"), D("7830")}}};
    EicSchedule eic_other = {{
        {D("17640"), D("632")}, {D("46560"), D("4213")},
        {D("52918"), D("6960")}, {D("56838"), D("7830")}}};
    cfg->eic = joint_split(eic_joint, eic_other);

    Provisions& p = cfg->provisions;
    p.educator_expense_cap = D("300");
    p.student_loan_interest_cap = D("2500");
    p.se_tax_deductible_share = D("0.5");
    p.tips_deduction_cap = D("25000");
    p.tips_phaseout_rate = D("0.10");
    p.overtime_deduction_cap = D("10000");
    p.overtime_wage_cliff = D("100000");

    p.senior_deduction = D("6000");
    p.senior_age = 65;
    p.medical_agi_floor_rate = D("0.075");
    p.charitable_agi_limit_rate = D("0.60");
    p.salt_cap = D("40000");
    p.auto_loan_interest_cap = D("10000");
    p.qbi_rate = D("0.20");

    p.se_net_earnings_rate = D("0.9235");
    p.social_security_wage_base = D("168600");
    p.social_security_tax_rate = D("0.124");
    p.medicare_tax_rate = D("0.029");
    p.capital_gains_mid_rate = D("0.15");
    p.capital_gains_top_rate = D("0.20");
    p.niit_rate = D("0.038");
    p.additional_medicare_rate = D("0.009");

    p.ctc_per_child = D("2200");
    p.ctc_refundable_per_child = D("1700");
    p.ctc_phaseout_step = D("1000");
    p.ctc_phaseout_per_step = D("50");
    p.odc_per_dependent = D("500");

    p.social_security_exempt = true;
    p.ss_base_threshold = D("25000");
    p.ss_additional_threshold = D("34000");
    p.ss_provisional_share = D("0.5");
    p.ss_base_inclusion_rate = D("0.5");
    p.ss_excess_inclusion_rate = D("0.35");
    p.ss_max_inclusion_rate = D("0.85");

    cfg->validate();
    return cfg;
}

} // namespace

namespace RateTables {

std::shared_ptr<const TaxYearConfig> builtin(int tax_year) {
    // Built on first request; the tables are never mutated afterwards.
    static const std::map<int, std::shared_ptr<const TaxYearConfig>> tables = {
        {2025, make_2025()},
    };
    auto it = tables.find(tax_year);
    if (it == tables.end()) {
        throw ConfigurationError("Unsupported tax year: " + std::to_string(tax_year));
    }
    return it->second;
}

std::vector<int> builtin_years() {
    return {2025};
}

} // namespace RateTables

} // namespace TaxCore
