#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "../io/json_loader.hpp"
#include "../taxcore/engine.h"

namespace py = pybind11;
using namespace TaxCore;

namespace {

// One engine per year, built on first use and shared afterwards.
const TaxEngine& engine_for(int year) {
    static std::map<int, std::unique_ptr<TaxEngine>> engines;
    auto it = engines.find(year);
    if (it == engines.end()) {
        it = engines.emplace(year, std::make_unique<TaxEngine>(RateTables::builtin(year))).first;
    }
    return *it->second;
}

Decimal dec(const std::string& s) { return Decimal::parse(s.empty() ? "0" : s); }

} // namespace

PYBIND11_MODULE(taxcore_py, m) {
    m.doc() = "Federal individual income tax engine";

    py::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_RuntimeError);
    py::register_exception<InvalidInputError>(m, "InvalidInputError", PyExc_ValueError);

    // Takes and returns JSON text so amounts stay as decimal strings end to end.
    m.def("compute_json",
          [](const std::string& return_json, int year) {
              TaxReturn ret = JsonLoader::parse_return(nlohmann::json::parse(return_json));
              if (year != 0) ret.tax_year = year;
              TaxComputation c = engine_for(ret.tax_year).compute(ret);
              return JsonLoader::to_json(c).dump();
          },
          py::arg("return_json"), py::arg("year") = 0);

    m.def("quick_estimate",
          [](const std::string& filing_status, const std::string& w2_wages,
             const std::string& federal_withheld, const std::string& other_income,
             const std::string& tip_income, const std::string& overtime_income,
             const std::string& self_employment_income, int ctc_children, int other_dependents,
             const std::string& itemized_total, bool is_senior, int year) {
              QuickEstimateRequest req;
              req.filing_status = parse_filing_status(filing_status);
              req.w2_wages = dec(w2_wages);
              req.federal_withheld = dec(federal_withheld);
              req.other_income = dec(other_income);
              req.tip_income = dec(tip_income);
              req.overtime_income = dec(overtime_income);
              req.self_employment_income = dec(self_employment_income);
              req.ctc_children = ctc_children;
              req.other_dependents = other_dependents;
              req.itemized_total = dec(itemized_total);
              req.is_senior = is_senior;

              QuickEstimate q = engine_for(year).quick_estimate(req);
              std::map<std::string, std::string> out = q.computation.to_field_map();
              out["seniorDeduction"] = q.senior_deduction.to_string();
              out["effectiveRate"] = q.effective_rate.to_string();
              out["marginalRate"] = q.marginal_rate.to_string();
              return out;
          },
          py::arg("filing_status"), py::arg("w2_wages") = "0", py::arg("federal_withheld") = "0",
          py::arg("other_income") = "0", py::arg("tip_income") = "0",
          py::arg("overtime_income") = "0", py::arg("self_employment_income") = "0",
          py::arg("ctc_children") = 0, py::arg("other_dependents") = 0,
          py::arg("itemized_total") = "0", py::arg("is_senior") = false, py::arg("year") = 2025);

    m.def("estimate_withholding",
          [](const std::string& filing_status, const std::string& annual_income,
             const std::string& pay_frequency, const std::string& additional_withholding,
             const std::string& pre_tax_deductions, int year) {
              WithholdingEstimate w = engine_for(year).estimate_withholding(
                  parse_filing_status(filing_status), dec(annual_income),
                  parse_pay_frequency(pay_frequency), dec(additional_withholding),
                  dec(pre_tax_deductions));
              return JsonLoader::to_json(w).dump();
          },
          py::arg("filing_status"), py::arg("annual_income"), py::arg("pay_frequency") = "biweekly",
          py::arg("additional_withholding") = "0", py::arg("pre_tax_deductions") = "0",
          py::arg("year") = 2025);
}
