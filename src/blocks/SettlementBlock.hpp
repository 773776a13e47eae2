#pragma once
#include "../kernel/Rounding.hpp"
#include "CreditBlock.hpp"
#include "IncomeBlock.hpp"

namespace TaxCore {

struct Settlement {
    Decimal tax_after_credits;
    Decimal total_payments;
    Decimal refund;
    Decimal owed;
};

class SettlementBlock {
public:
    // Nonrefundable credits stop at zero tax; refundable credits count as payments.
    static Settlement compute(const Decimal& liability, const CreditResult& credits,
                              const IncomeTotals& income, const Payments& payments) {
        Decimal tax_after = floor_zero(round_money(liability - credits.total_nonrefundable));
        Decimal total_payments = round_money(income.record_withholding() + payments.federal_withheld +
                                             payments.estimated_payments + payments.extension_payment +
                                             credits.total_refundable);
        return settle(tax_after, total_payments);
    }

    // Exactly one of refund / owed can be nonzero.
    static Settlement settle(const Decimal& tax_after_credits, const Decimal& total_payments) {
        Settlement s;
        s.tax_after_credits = round_money(tax_after_credits);
        s.total_payments = round_money(total_payments);
        s.refund = floor_zero(s.total_payments - s.tax_after_credits);
        s.owed = floor_zero(s.tax_after_credits - s.total_payments);
        return s;
    }
};

} // namespace TaxCore
