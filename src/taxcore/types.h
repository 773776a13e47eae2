#ifndef TAXCORE_TYPES_H
#define TAXCORE_TYPES_H

#include <cctype>
#include <stdexcept>
#include <string>

namespace TaxCore {

// Unsupported tax year, missing or malformed rate table.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// Structurally impossible return data. Raised before any stage runs.
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what) : std::invalid_argument(what) {}
};

enum class FilingStatus {
    Single,
    MarriedJoint,
    MarriedSeparate,
    HeadOfHousehold,
    QualifyingWidow
};

enum class DeductionKind {
    Standard,
    Itemized
};

inline const char* to_string(FilingStatus s) {
    switch (s) {
        case FilingStatus::Single:          return "single";
        case FilingStatus::MarriedJoint:    return "married_filing_jointly";
        case FilingStatus::MarriedSeparate: return "married_filing_separately";
        case FilingStatus::HeadOfHousehold: return "head_of_household";
        case FilingStatus::QualifyingWidow: return "qualifying_widow";
    }
    throw InvalidInputError("Unknown filing status value");
}

inline FilingStatus parse_filing_status(const std::string& key) {
    if (key == "single") return FilingStatus::Single;
    if (key == "married_filing_jointly") return FilingStatus::MarriedJoint;
    if (key == "married_filing_separately") return FilingStatus::MarriedSeparate;
    if (key == "head_of_household") return FilingStatus::HeadOfHousehold;
    if (key == "qualifying_widow") return FilingStatus::QualifyingWidow;
    throw InvalidInputError("Unknown filing status: " + key);
}

inline const char* to_string(DeductionKind k) {
    switch (k) {
        case DeductionKind::Standard: return "standard";
        case DeductionKind::Itemized: return "itemized";
    }
    throw InvalidInputError("Unknown deduction kind value");
}

// Calendar date, no time zone.
struct Date {
    int year = 1900;
    int month = 1;
    int day = 1;

    bool operator<(const Date& o) const {
        if (year != o.year) return year < o.year;
        if (month != o.month) return month < o.month;
        return day < o.day;
    }

    static bool is_leap_year(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

    static int days_in_month(int y, int m) {
        static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (m == 2 && is_leap_year(y)) return 29;
        return kDays[m - 1];
    }

    // Strict YYYY-MM-DD; the day must exist in that month.
    static Date parse(const std::string& iso) {
        bool shape = iso.size() == 10 && iso[4] == '-' && iso[7] == '-';
        for (size_t i = 0; shape && i < iso.size(); ++i) {
            if (i != 4 && i != 7 && !std::isdigit(static_cast<unsigned char>(iso[i]))) shape = false;
        }
        if (!shape) throw InvalidInputError("Invalid date (expected YYYY-MM-DD): " + iso);

        Date d;
        d.year = std::stoi(iso.substr(0, 4));
        d.month = std::stoi(iso.substr(5, 2));
        d.day = std::stoi(iso.substr(8, 2));
        if (d.month < 1 || d.month > 12 || d.day < 1 || d.day > days_in_month(d.year, d.month)) {
            throw InvalidInputError("Invalid calendar date: " + iso);
        }
        return d;
    }
};

} // namespace TaxCore

#endif // TAXCORE_TYPES_H
