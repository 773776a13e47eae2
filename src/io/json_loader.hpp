#pragma once
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>
#include "../RateTables.hpp"
#include "../taxcore/engine.h"
#include "../taxcore/tax_return.h"

namespace TaxCore {

class JsonLoader {
public:
    using json = nlohmann::json;

    // ------------------------------------------------------------------
    // Rate tables
    // ------------------------------------------------------------------
    static std::shared_ptr<const TaxYearConfig> load_tax_year(const std::string& filepath) {
        std::ifstream f(filepath);
        if (!f.is_open()) {
            throw ConfigurationError("Could not open rate table: " + filepath);
        }

        json data;
        try {
            data = json::parse(f);
        } catch (const json::parse_error& e) {
            throw ConfigurationError("Malformed rate table " + filepath + ": " + e.what());
        }

        auto cfg = parse_tax_year(data);
        cfg->source = filepath;
        std::cerr << "[TaxCore::IO] Loaded rate tables for " << cfg->tax_year
                  << " from " << filepath << std::endl;
        return cfg;
    }

    // Wrong JSON types and out-of-range amounts surface as ConfigurationError.
    static std::shared_ptr<TaxYearConfig> parse_tax_year(const json& data) {
        try {
            return read_tax_year(data);
        } catch (const json::exception& e) {
            throw ConfigurationError(std::string("Rate table: ") + e.what());
        } catch (const std::overflow_error& e) {
            throw ConfigurationError(std::string("Rate table: ") + e.what());
        }
    }

    // ------------------------------------------------------------------
    // Returns
    // ------------------------------------------------------------------
    static TaxReturn load_return(const std::string& filepath) {
        std::ifstream f(filepath);
        if (!f.is_open()) {
            throw InvalidInputError("Could not open return: " + filepath);
        }
        json data;
        try {
            data = json::parse(f);
        } catch (const json::parse_error& e) {
            throw InvalidInputError("Malformed return " + filepath + ": " + e.what());
        }
        TaxReturn ret = parse_return(data);
        std::cerr << "[TaxCore::IO] Loaded return: " << to_string(ret.filing_status) << ", "
                  << ret.income.size() << " income record(s), " << ret.dependents.size()
                  << " dependent(s)" << std::endl;
        return ret;
    }

    // Wrong JSON types and out-of-range amounts surface as InvalidInputError.
    static TaxReturn parse_return(const json& data) {
        try {
            return read_return(data);
        } catch (const json::exception& e) {
            throw InvalidInputError(std::string("Return: ") + e.what());
        } catch (const std::overflow_error& e) {
            throw InvalidInputError(std::string("Return: ") + e.what());
        }
    }

    // ------------------------------------------------------------------
    // Results
    // ------------------------------------------------------------------
    static json to_json(const TaxComputation& c) {
        json out;
        out["tax_year"] = c.tax_year;
        out["filing_status"] = to_string(c.filing_status);
        json fields = json::object();
        for (const auto& [key, value] : c.to_field_map()) fields[key] = value;
        out["fields"] = fields;
        out["advisories"] = c.advisories;
        return out;
    }

    static json to_json(const std::vector<BracketSlice>& slices) {
        json rows = json::array();
        for (const auto& s : slices) {
            json row;
            row["start"] = s.start.to_string();
            row["end"] = s.end ? json(s.end->to_string()) : json(nullptr);
            row["rate"] = s.rate.to_string(4);
            row["taxable"] = s.taxable.to_string();
            row["tax"] = s.tax.to_string();
            rows.push_back(row);
        }
        return rows;
    }

    static json to_json(const WithholdingEstimate& w) {
        json out;
        out["annual_income"] = w.annual_income.to_string();
        out["taxable_income"] = w.taxable_income.to_string();
        out["estimated_annual_tax"] = w.estimated_annual_tax.to_string();
        out["pay_periods"] = w.pay_periods;
        out["recommended_per_period"] = w.recommended_per_period.to_string();
        out["additional_per_period"] = w.additional_per_period.to_string();
        out["total_per_period"] = w.total_per_period.to_string();
        return out;
    }

    // Strings are parsed exactly; numbers go through the nearest six-digit value.
    static Decimal to_decimal(const json& v) {
        if (v.is_string()) return Decimal::parse(v.get<std::string>());
        if (v.is_number_unsigned()) {
            const auto u = v.get<unsigned long long>();
            if (u > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
                throw std::overflow_error("Amount out of range: " + v.dump());
            }
            return Decimal(static_cast<long long>(u));
        }
        if (v.is_number_integer()) return Decimal(v.get<long long>());
        if (v.is_number_float()) return Decimal::from_double(v.get<double>());
        if (v.is_null()) return Decimal(0);
        throw std::invalid_argument("Expected a decimal amount, got " + v.dump());
    }

private:
    static std::shared_ptr<TaxYearConfig> read_tax_year(const json& data) {
        auto cfg = std::make_shared<TaxYearConfig>();
        cfg->tax_year = required(data, "tax_year").get<int>();
        cfg->source = "json";

        // 1. Brackets and standard deduction
        const json& brackets = required(data, "brackets");
        for (FilingStatus s : kAllFilingStatuses) {
            const json& rows = required(brackets, to_string(s));
            BracketSchedule& sched = cfg->brackets.get(s);
            for (const auto& row : rows) {
                Bracket b;
                const json& upper = required(row, "upper");
                if (!upper.is_null()) b.upper = config_decimal(upper, "brackets.upper");
                b.rate = config_decimal(required(row, "rate"), "brackets.rate");
                sched.push_back(b);
            }
        }
        read_status_table(required(data, "standard_deduction"), "standard_deduction",
                          cfg->standard_deduction);

        const json& add = required(data, "additional_standard_deduction");
        cfg->additional_standard.unmarried = config_decimal(required(add, "unmarried"), "unmarried");
        cfg->additional_standard.married = config_decimal(required(add, "married"), "married");

        // 2. Per-status thresholds
        const json& th = required(data, "thresholds");
        read_status_table(required(th, "tips_phaseout"), "tips_phaseout", cfg->tips_phaseout_threshold);
        read_status_table(required(th, "ctc_phaseout"), "ctc_phaseout", cfg->ctc_phaseout_threshold);
        read_status_table(required(th, "niit"), "niit", cfg->niit_threshold);
        read_status_table(required(th, "additional_medicare"), "additional_medicare",
                          cfg->additional_medicare_threshold);
        read_status_table(required(th, "qbi_phaseout"), "qbi_phaseout", cfg->qbi_phaseout_threshold);

        const json& cg = required(data, "capital_gains");
        for (FilingStatus s : kAllFilingStatuses) {
            const json& tier = required(cg, to_string(s));
            CapitalGainsTiers& t = cfg->capital_gains.get(s);
            t.zero_rate_max = config_decimal(required(tier, "zero_rate_max"), "zero_rate_max");
            t.fifteen_rate_max = config_decimal(required(tier, "fifteen_rate_max"), "fifteen_rate_max");
        }

        // 3. EIC tiers, 0/1/2/3+ children
        const json& eic = required(data, "eic");
        for (FilingStatus s : kAllFilingStatuses) {
            const json& rows = required(eic, to_string(s));
            if (!rows.is_array() || rows.size() != 4) {
                throw ConfigurationError(std::string("eic.") + to_string(s) + " must list exactly 4 tiers");
            }
            EicSchedule& sched = cfg->eic.get(s);
            for (size_t i = 0; i < 4; ++i) {
                sched[i].max_agi = config_decimal(required(rows[i], "max_agi"), "eic.max_agi");
                sched[i].max_credit = config_decimal(required(rows[i], "max_credit"), "eic.max_credit");
            }
        }

        // 4. Provisions
        const json& pj = required(data, "provisions");
        Provisions& p = cfg->provisions;
        p.educator_expense_cap       = provision(pj, "educator_expense_cap");
        p.student_loan_interest_cap  = provision(pj, "student_loan_interest_cap");
        p.se_tax_deductible_share    = provision(pj, "se_tax_deductible_share");
        p.tips_deduction_cap         = provision(pj, "tips_deduction_cap");
        p.tips_phaseout_rate         = provision(pj, "tips_phaseout_rate");
        p.overtime_deduction_cap     = provision(pj, "overtime_deduction_cap");
        p.overtime_wage_cliff        = provision(pj, "overtime_wage_cliff");
        p.senior_deduction           = provision(pj, "senior_deduction");
        p.senior_age                 = required(pj, "senior_age").get<int>();
        p.medical_agi_floor_rate     = provision(pj, "medical_agi_floor_rate");
        p.charitable_agi_limit_rate  = provision(pj, "charitable_agi_limit_rate");
        p.salt_cap                   = provision(pj, "salt_cap");
        p.auto_loan_interest_cap     = provision(pj, "auto_loan_interest_cap");
        p.qbi_rate                   = provision(pj, "qbi_rate");
        p.se_net_earnings_rate       = provision(pj, "se_net_earnings_rate");
        p.social_security_wage_base  = provision(pj, "social_security_wage_base");
        p.social_security_tax_rate   = provision(pj, "social_security_tax_rate");
        p.medicare_tax_rate          = provision(pj, "medicare_tax_rate");
        p.capital_gains_mid_rate     = provision(pj, "capital_gains_mid_rate");
        p.capital_gains_top_rate     = provision(pj, "capital_gains_top_rate");
        p.niit_rate                  = provision(pj, "niit_rate");
        p.additional_medicare_rate   = provision(pj, "additional_medicare_rate");
        p.ctc_per_child              = provision(pj, "ctc_per_child");
        p.ctc_refundable_per_child   = provision(pj, "ctc_refundable_per_child");
        p.ctc_phaseout_step          = provision(pj, "ctc_phaseout_step");
        p.ctc_phaseout_per_step      = provision(pj, "ctc_phaseout_per_step");
        p.odc_per_dependent          = provision(pj, "odc_per_dependent");
        p.social_security_exempt     = required(pj, "social_security_exempt").get<bool>();
        p.ss_base_threshold          = provision(pj, "ss_base_threshold");
        p.ss_additional_threshold    = provision(pj, "ss_additional_threshold");
        p.ss_provisional_share       = provision(pj, "ss_provisional_share");
        p.ss_base_inclusion_rate     = provision(pj, "ss_base_inclusion_rate");
        p.ss_excess_inclusion_rate   = provision(pj, "ss_excess_inclusion_rate");
        p.ss_max_inclusion_rate      = provision(pj, "ss_max_inclusion_rate");

        cfg->validate();
        return cfg;
    }

    static TaxReturn read_return(const json& data) {
        if (!data.is_object()) throw InvalidInputError("Return document must be a JSON object");
        TaxReturn ret;
        ret.tax_year = data.value("tax_year", ret.tax_year);
        if (!data.contains("filing_status")) throw InvalidInputError("Return is missing filing_status");
        ret.filing_status = parse_filing_status(data["filing_status"].get<std::string>());

        if (data.contains("taxpayer")) ret.taxpayer = parse_profile(data["taxpayer"]);
        if (data.contains("spouse") && !data["spouse"].is_null()) ret.spouse = parse_profile(data["spouse"]);

        if (data.contains("dependents")) {
            for (const auto& d : data["dependents"]) {
                Dependent dep;
                dep.name = d.value("name", std::string());
                if (d.contains("date_of_birth")) dep.date_of_birth = Date::parse(d["date_of_birth"].get<std::string>());
                dep.qualifies_for_ctc = d.value("qualifies_for_ctc", false);
                dep.qualifies_for_odc = d.value("qualifies_for_odc", false);
                ret.dependents.push_back(dep);
            }
        }

        if (data.contains("income")) {
            for (const auto& rec : data["income"]) ret.income.push_back(parse_income(rec));
        }
        ret.social_security_benefits = amount(data, "social_security_benefits");

        if (data.contains("adjustments")) {
            const json& a = data["adjustments"];
            AdjustmentInputs& adj = ret.adjustments;
            adj.educator_expenses              = amount(a, "educator_expenses");
            adj.hsa_deduction                  = amount(a, "hsa_deduction");
            adj.self_employed_health_insurance = amount(a, "self_employed_health_insurance");
            adj.sep_simple_contributions       = amount(a, "sep_simple_contributions");
            adj.student_loan_interest          = amount(a, "student_loan_interest");
            adj.ira_deduction                  = amount(a, "ira_deduction");
        }

        if (data.contains("itemized") && !data["itemized"].is_null()) {
            const json& i = data["itemized"];
            ItemizedDeductions it;
            it.medical                 = amount(i, "medical");
            it.state_local_income_tax  = amount(i, "state_local_income_tax");
            it.state_local_sales_tax   = amount(i, "state_local_sales_tax");
            it.real_estate_tax         = amount(i, "real_estate_tax");
            it.personal_property_tax   = amount(i, "personal_property_tax");
            it.mortgage_interest       = amount(i, "mortgage_interest");
            it.mortgage_points         = amount(i, "mortgage_points");
            it.investment_interest     = amount(i, "investment_interest");
            it.auto_loan_interest      = amount(i, "auto_loan_interest");
            it.cash_contributions      = amount(i, "cash_contributions");
            it.noncash_contributions   = amount(i, "noncash_contributions");
            it.carryover_contributions = amount(i, "carryover_contributions");
            it.casualty_losses         = amount(i, "casualty_losses");
            it.gambling_losses         = amount(i, "gambling_losses");
            it.other                   = amount(i, "other");
            ret.itemized = it;
        }

        if (data.contains("credits")) {
            const json& c = data["credits"];
            TaxCredits& cr = ret.credits;
            cr.american_opportunity            = amount(c, "american_opportunity");
            cr.lifetime_learning               = amount(c, "lifetime_learning");
            cr.residential_energy              = amount(c, "residential_energy");
            cr.electric_vehicle                = amount(c, "electric_vehicle");
            cr.foreign_tax                     = amount(c, "foreign_tax");
            cr.retirement_savings              = amount(c, "retirement_savings");
            cr.dependent_care                  = amount(c, "dependent_care");
            cr.other_nonrefundable             = amount(c, "other_nonrefundable");
            cr.american_opportunity_refundable = amount(c, "american_opportunity_refundable");
            cr.other_refundable                = amount(c, "other_refundable");
        }

        if (data.contains("payments")) {
            const json& p = data["payments"];
            ret.payments.federal_withheld   = amount(p, "federal_withheld");
            ret.payments.estimated_payments = amount(p, "estimated_payments");
            ret.payments.extension_payment  = amount(p, "extension_payment");
        }
        return ret;
    }

    static const json& required(const json& obj, const char* key) {
        if (!obj.is_object() || !obj.contains(key)) {
            throw ConfigurationError(std::string("Rate table is missing required entry: ") + key);
        }
        return obj.at(key);
    }

    static Decimal config_decimal(const json& v, const std::string& what) {
        try {
            return to_decimal(v);
        } catch (const std::invalid_argument& e) {
            throw ConfigurationError("Rate table entry " + what + ": " + e.what());
        }
    }

    static Decimal provision(const json& pj, const char* key) {
        return config_decimal(required(pj, key), std::string("provisions.") + key);
    }

    static void read_status_table(const json& obj, const std::string& what, StatusTable<Decimal>& out) {
        for (FilingStatus s : kAllFilingStatuses) {
            if (!obj.is_object() || !obj.contains(to_string(s))) {
                throw ConfigurationError("Rate table " + what + " is missing filing status " + to_string(s));
            }
            out.get(s) = config_decimal(obj.at(to_string(s)), what);
        }
    }

    static Decimal amount(const json& obj, const char* key) {
        if (!obj.is_object() || !obj.contains(key)) return Decimal(0);
        try {
            return to_decimal(obj.at(key));
        } catch (const std::invalid_argument& e) {
            throw InvalidInputError(std::string(key) + ": " + e.what());
        }
    }

    static TaxpayerProfile parse_profile(const json& j) {
        TaxpayerProfile p;
        if (j.contains("date_of_birth")) p.date_of_birth = Date::parse(j["date_of_birth"].get<std::string>());
        p.is_blind = j.value("is_blind", false);
        p.occupation = j.value("occupation", std::string());
        return p;
    }

    static Form1099Type parse_form_type(const std::string& form) {
        if (form == "1099-INT") return Form1099Type::Interest;
        if (form == "1099-DIV") return Form1099Type::Dividend;
        if (form == "1099-NEC") return Form1099Type::NonemployeeComp;
        if (form == "1099-MISC") return Form1099Type::Miscellaneous;
        if (form == "other") return Form1099Type::Other;
        throw InvalidInputError("Unknown 1099 form type: " + form);
    }

    static IncomeRecord parse_income(const json& rec) {
        if (!rec.contains("type")) throw InvalidInputError("Income record is missing type");
        const std::string type = rec["type"].get<std::string>();

        if (type == "w2") {
            return W2Income{rec.value("employer", std::string()), amount(rec, "wages"),
                            amount(rec, "federal_withheld")};
        }
        if (type == "1099") {
            Form1099 f;
            f.type = parse_form_type(rec.value("form", std::string("other")));
            f.payer = rec.value("payer", std::string());
            f.amount = amount(rec, "amount");
            f.federal_withheld = amount(rec, "federal_withheld");
            return f;
        }
        if (type == "self_employment") {
            SelfEmploymentLedger se;
            se.business_name = rec.value("business_name", std::string());
            se.gross_receipts = amount(rec, "gross_receipts");
            se.returns_and_allowances = amount(rec, "returns_and_allowances");
            se.other_income = amount(rec, "other_income");
            se.cost_of_goods_sold = amount(rec, "cost_of_goods_sold");
            if (rec.contains("expenses")) {
                for (const auto& e : rec["expenses"]) {
                    se.expenses.push_back(ExpenseLine{e.value("category", std::string()), amount(e, "amount")});
                }
            }
            se.meals = amount(rec, "meals");
            se.home_office = amount(rec, "home_office");
            return se;
        }
        if (type == "tips") return TipIncome{amount(rec, "amount")};
        if (type == "overtime") return OvertimeIncome{amount(rec, "amount")};
        if (type == "capital_gains") return CapitalGains{amount(rec, "short_term"), amount(rec, "long_term")};
        if (type == "rental") return RentalIncome{amount(rec, "amount")};
        if (type == "other") return OtherIncome{rec.value("description", std::string()), amount(rec, "amount")};
        throw InvalidInputError("Unknown income record type: " + type);
    }
};

} // namespace TaxCore
