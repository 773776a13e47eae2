#pragma once
#include "../Decimal.hpp"

namespace TaxCore {

// Money rounding: half-up to cents.
// Every stored stage value goes through here before the next stage reads it.
inline Decimal round_money(const Decimal& amount) {
    return amount.round_to(2);
}

// round_money(a * rate)
inline Decimal apply_rate(const Decimal& amount, const Decimal& rate) {
    return round_money(amount * rate);
}

// round_money(a * b / c) with a single rounding step.
inline Decimal mul_div_money(const Decimal& a, const Decimal& b, const Decimal& c) {
    return Decimal::mul_div(a, b, c, 2);
}

inline Decimal floor_zero(const Decimal& amount) {
    return max(amount, Decimal(0));
}

} // namespace TaxCore
