#ifndef TAXCORE_ENGINE_H
#define TAXCORE_ENGINE_H

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "tax_return.h"
#include "../RateTables.hpp"
#include "../blocks/AdjustmentBlock.hpp"
#include "../blocks/CreditBlock.hpp"
#include "../blocks/DeductionBlock.hpp"
#include "../blocks/IncomeBlock.hpp"
#include "../blocks/LiabilityBlock.hpp"
#include "../blocks/SettlementBlock.hpp"

namespace TaxCore {

// Full pipeline output for one return.
struct TaxComputation {
    int tax_year = 0;
    FilingStatus filing_status = FilingStatus::Single;

    IncomeTotals income;
    Decimal gross_income;
    AdjustmentResult adjustments;
    Decimal adjusted_gross_income;
    DeductionResult deduction;
    Decimal taxable_income;
    LiabilityResult liability;
    CreditResult credits;
    Settlement settlement;
    Decimal federal_withheld;   // W-2/1099 records plus separately reported withholding
    Decimal estimated_payments;

    std::vector<std::string> advisories;

    // Flat name -> decimal string map consumed by e-file XML and HTTP layers.
    std::map<std::string, std::string> to_field_map() const;
};

// Reduced input used by the estimate endpoints.
struct QuickEstimateRequest {
    FilingStatus filing_status = FilingStatus::Single;
    Decimal w2_wages;
    Decimal federal_withheld;
    Decimal other_income;
    Decimal tip_income;
    Decimal overtime_income;
    Decimal self_employment_income;
    int ctc_children = 0;
    int other_dependents = 0;
    Decimal itemized_total;
    bool is_senior = false;
};

struct QuickEstimate {
    TaxComputation computation;
    Decimal senior_deduction;
    Decimal effective_rate; // percent of gross income
    Decimal marginal_rate;  // percent
};

enum class PayFrequency { Weekly, Biweekly, Semimonthly, Monthly };

int pay_periods(PayFrequency f);
PayFrequency parse_pay_frequency(const std::string& key);

struct WithholdingEstimate {
    Decimal annual_income;
    Decimal taxable_income;
    Decimal estimated_annual_tax;
    int pay_periods = 26;
    Decimal recommended_per_period;
    Decimal additional_per_period;
    Decimal total_per_period;
};

// Stateless between calls; safe to share across threads.
class TaxEngine {
public:
    explicit TaxEngine(std::shared_ptr<const TaxYearConfig> config);

    // Engine over the compiled-in table for `tax_year`.
    static TaxEngine for_year(int tax_year);

    int tax_year() const { return config_->tax_year; }
    const TaxYearConfig& config() const { return *config_; }

    // Runs the pipeline and overwrites ret.derived. Raw fields are not touched.
    TaxComputation compute(TaxReturn& ret) const;

    // Same pipeline without write-back.
    TaxComputation evaluate(const TaxReturn& ret) const;

    QuickEstimate quick_estimate(const QuickEstimateRequest& req) const;

    std::vector<BracketSlice> bracket_breakdown(const Decimal& taxable_income, FilingStatus status) const;

    WithholdingEstimate estimate_withholding(FilingStatus status, const Decimal& annual_income,
                                             PayFrequency frequency,
                                             const Decimal& additional_per_period,
                                             const Decimal& pre_tax_deductions) const;

    // Throws InvalidInputError on structurally impossible input.
    void validate(const TaxReturn& ret) const;

private:
    std::shared_ptr<const TaxYearConfig> config_;
};

} // namespace TaxCore

#endif // TAXCORE_ENGINE_H
