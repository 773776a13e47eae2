#pragma once

#include <cstdint>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace TaxCore {

// Signed fixed-point decimal with 6 fractional digits.
// Stored as an int64 count of micro-units; products and quotients go
// through __int128 and are rounded half away from zero back to 6 digits.
class Decimal {
public:
    static constexpr int kDigits = 6;
    static constexpr std::int64_t kScale = 1000000;

    Decimal() : units_(0) {}
    Decimal(int whole) : units_(static_cast<std::int64_t>(whole) * kScale) {}
    Decimal(long long whole) : units_(checked(static_cast<__int128>(whole) * kScale)) {}

    static Decimal from_units(std::int64_t units) {
        Decimal d;
        d.units_ = units;
        return d;
    }

    // JSON numbers arrive as doubles; snap to the nearest micro-unit.
    static Decimal from_double(double v) {
        if (!std::isfinite(v)) throw std::invalid_argument("Decimal: non-finite value");
        double scaled = std::round(v * static_cast<double>(kScale));
        if (std::fabs(scaled) > 9.2e18) throw std::overflow_error("Decimal: value out of range");
        return from_units(static_cast<std::int64_t>(scaled));
    }

    // Accepts [+-]digits[.digits]; more than 6 fractional digits are rounded.
    static Decimal parse(const std::string& text) {
        if (text.empty()) throw std::invalid_argument("Decimal: empty string");
        size_t pos = 0;
        bool negative = false;
        if (text[pos] == '+' || text[pos] == '-') {
            negative = (text[pos] == '-');
            ++pos;
        }
        __int128 whole = 0;
        bool any_digit = false;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            whole = whole * 10 + (text[pos] - '0');
            if (whole > static_cast<__int128>(std::numeric_limits<std::int64_t>::max()))
                throw std::overflow_error("Decimal: value out of range: " + text);
            any_digit = true;
            ++pos;
        }
        __int128 frac = 0;
        int frac_digits = 0;
        bool round_up = false;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                if (frac_digits < kDigits) {
                    frac = frac * 10 + (text[pos] - '0');
                } else if (frac_digits == kDigits) {
                    round_up = (text[pos] >= '5');
                }
                ++frac_digits;
                any_digit = true;
                ++pos;
            }
        }
        if (!any_digit || pos != text.size())
            throw std::invalid_argument("Decimal: malformed number: " + text);
        for (int i = frac_digits; i < kDigits; ++i) frac *= 10;
        __int128 units = whole * kScale + frac + (round_up ? 1 : 0);
        return from_units(checked(negative ? -units : units));
    }

    std::int64_t units() const { return units_; }
    double to_double() const { return static_cast<double>(units_) / static_cast<double>(kScale); }

    // Round half away from zero to `places` fractional digits (0..6).
    Decimal round_to(int places) const {
        if (places < 0 || places > kDigits) throw std::invalid_argument("Decimal: bad rounding precision");
        std::int64_t step = 1;
        for (int i = places; i < kDigits; ++i) step *= 10;
        return from_units(checked(div_round(static_cast<__int128>(units_), step) * step));
    }

    // Smallest whole number >= this value.
    Decimal ceil_whole() const {
        std::int64_t q = units_ / kScale;
        std::int64_t r = units_ % kScale;
        if (r > 0) ++q;
        return from_units(checked(static_cast<__int128>(q) * kScale));
    }

    bool is_zero() const { return units_ == 0; }
    bool is_negative() const { return units_ < 0; }

    // Fixed notation with exactly `places` digits after the point.
    std::string to_string(int places = 2) const {
        Decimal r = round_to(places);
        std::int64_t u = r.units_;
        bool negative = u < 0;
        unsigned long long mag = negative ? static_cast<unsigned long long>(-(u + 1)) + 1ULL
                                          : static_cast<unsigned long long>(u);
        unsigned long long whole = mag / kScale;
        unsigned long long frac = mag % kScale;
        std::string out = (negative ? "-" : "") + std::to_string(whole);
        if (places > 0) {
            std::string f = std::to_string(frac);
            f.insert(0, kDigits - f.size(), '0');
            out += "." + f.substr(0, places);
        }
        return out;
    }

    // Arithmetic
    Decimal operator+(const Decimal& o) const { return from_units(checked(static_cast<__int128>(units_) + o.units_)); }
    Decimal operator-(const Decimal& o) const { return from_units(checked(static_cast<__int128>(units_) - o.units_)); }
    Decimal operator-() const { return from_units(checked(-static_cast<__int128>(units_))); }
    Decimal operator*(const Decimal& o) const {
        __int128 prod = static_cast<__int128>(units_) * o.units_;
        return from_units(checked(div_round(prod, kScale)));
    }
    Decimal operator/(const Decimal& o) const {
        if (o.units_ == 0) throw std::domain_error("Decimal: division by zero");
        __int128 num = static_cast<__int128>(units_) * kScale;
        return from_units(checked(div_round(num, o.units_)));
    }

    // a * b / c rounded once to `places` fractional digits. The 128-bit
    // product is never truncated before the division.
    static Decimal mul_div(const Decimal& a, const Decimal& b, const Decimal& c, int places) {
        if (c.units_ == 0) throw std::domain_error("Decimal: division by zero");
        if (places < 0 || places > kDigits) throw std::invalid_argument("Decimal: bad rounding precision");
        std::int64_t step = 1;
        for (int i = places; i < kDigits; ++i) step *= 10;
        __int128 num = static_cast<__int128>(a.units_) * b.units_;
        __int128 den = static_cast<__int128>(c.units_) * step;
        return from_units(checked(div_round(num, den) * step));
    }

    Decimal& operator+=(const Decimal& o) { *this = *this + o; return *this; }
    Decimal& operator-=(const Decimal& o) { *this = *this - o; return *this; }
    Decimal& operator*=(const Decimal& o) { *this = *this * o; return *this; }

    // Comparisons
    friend bool operator==(const Decimal& a, const Decimal& b) { return a.units_ == b.units_; }
    friend bool operator!=(const Decimal& a, const Decimal& b) { return a.units_ != b.units_; }
    friend bool operator<(const Decimal& a, const Decimal& b) { return a.units_ < b.units_; }
    friend bool operator>(const Decimal& a, const Decimal& b) { return a.units_ > b.units_; }
    friend bool operator<=(const Decimal& a, const Decimal& b) { return a.units_ <= b.units_; }
    friend bool operator>=(const Decimal& a, const Decimal& b) { return a.units_ >= b.units_; }

    // Max/Min
    friend Decimal max(const Decimal& a, const Decimal& b) { return (a >= b) ? a : b; }
    friend Decimal min(const Decimal& a, const Decimal& b) { return (a <= b) ? a : b; }

    friend std::ostream& operator<<(std::ostream& os, const Decimal& d) { return os << d.to_string(2); }

private:
    std::int64_t units_;

    static std::int64_t checked(__int128 v) {
        if (v > static_cast<__int128>(std::numeric_limits<std::int64_t>::max()) ||
            v < static_cast<__int128>(std::numeric_limits<std::int64_t>::min())) {
            throw std::overflow_error("Decimal: arithmetic overflow");
        }
        return static_cast<std::int64_t>(v);
    }

    // Integer division with ties rounded away from zero.
    static __int128 div_round(__int128 num, __int128 den) {
        if (den < 0) { num = -num; den = -den; }
        __int128 q = num / den;
        __int128 r = num % den;
        if (r < 0) r = -r;
        if (2 * r >= den) q += (num < 0) ? -1 : 1;
        return q;
    }
};

} // namespace TaxCore
