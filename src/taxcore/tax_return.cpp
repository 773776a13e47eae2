#include "tax_return.h"
#include <algorithm>
#include <cctype>

namespace TaxCore {

bool TaxpayerProfile::occupation_suggests_educator() const {
    static const char* const kKeywords[] = {
        "teacher", "educator", "instructor", "professor", "principal", "counselor", "aide"
    };
    std::string lower = occupation;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    for (const char* k : kKeywords) {
        if (lower.find(k) != std::string::npos) return true;
    }
    return false;
}

} // namespace TaxCore
