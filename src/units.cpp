// AtomArb - Unit Conversion Implementation

#include <atomarb/units.hpp>
#include <charconv>
#include <sstream>
#include <stdexcept>

namespace atomarb::units {

namespace {

// Plain decimal digits only; signs were consumed by the caller
int64_t parse_digits(std::string_view digits, std::string_view text) {
    int64_t val = 0;
    if (digits.empty()) return 0;
    for (char c : digits) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Invalid amount: '" + std::string(text) + "'");
        }
    }
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), val);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        throw std::invalid_argument("Invalid amount: '" + std::string(text) + "'");
    }
    return val;
}

}  // namespace

Amount scale(int decimals) {
    if (decimals < 0 || decimals > 18) {
        throw std::invalid_argument("Unsupported decimals: " + std::to_string(decimals));
    }
    Amount s = 1;
    for (int i = 0; i < decimals; ++i) s *= 10;
    return s;
}

Amount parse(std::string_view text, int decimals) {
    std::string_view s = text;
    bool negative = false;
    if (!s.empty() && (s[0] == '-' || s[0] == '+')) {
        negative = (s[0] == '-');
        s.remove_prefix(1);
    }
    if (s.empty()) {
        throw std::invalid_argument("Invalid amount: '" + std::string(text) + "'");
    }

    const Amount unit = scale(decimals);

    // Find decimal point
    auto dot = s.find('.');
    std::string_view int_part = (dot == std::string_view::npos) ? s : s.substr(0, dot);
    std::string_view frac_part = (dot == std::string_view::npos) ? std::string_view{} : s.substr(dot + 1);
    if (int_part.empty() && frac_part.empty()) {
        throw std::invalid_argument("Invalid amount: '" + std::string(text) + "'");
    }

    int64_t int_val = parse_digits(int_part, text);

    // Pad or truncate to `decimals` digits
    std::string frac_str(frac_part);
    if (frac_str.size() < static_cast<size_t>(decimals)) {
        frac_str.append(static_cast<size_t>(decimals) - frac_str.size(), '0');
    } else if (frac_str.size() > static_cast<size_t>(decimals)) {
        for (size_t i = static_cast<size_t>(decimals); i < frac_str.size(); ++i) {
            if (frac_str[i] < '0' || frac_str[i] > '9') {
                throw std::invalid_argument("Invalid amount: '" + std::string(text) + "'");
            }
        }
        frac_str.resize(static_cast<size_t>(decimals));
    }
    int64_t frac_val = parse_digits(frac_str, text);

    I128 result = static_cast<I128>(int_val) * unit + frac_val;
    if (result > INT64_MAX) {
        throw std::invalid_argument("Amount out of range: '" + std::string(text) + "'");
    }
    return negative ? -static_cast<Amount>(result) : static_cast<Amount>(result);
}

std::string format(Amount amount, int decimals) {
    const Amount unit = scale(decimals);
    U128 abs_val = amount < 0 ? static_cast<U128>(-static_cast<I128>(amount)) : static_cast<U128>(amount);
    auto int_part = static_cast<uint64_t>(abs_val / static_cast<U128>(unit));
    auto frac_part = static_cast<uint64_t>(abs_val % static_cast<U128>(unit));

    std::ostringstream oss;
    if (amount < 0) oss << '-';
    oss << int_part;
    if (decimals == 0) return oss.str();

    // Format fractional part with leading zeros
    std::string frac_str = std::to_string(frac_part);
    frac_str.insert(0, static_cast<size_t>(decimals) - frac_str.size(), '0');

    // Trim trailing zeros after decimal point
    size_t last_non_zero = frac_str.find_last_not_of('0');
    if (last_non_zero != std::string::npos) {
        oss << '.' << frac_str.substr(0, last_non_zero + 1);
    }
    return oss.str();
}

}  // namespace atomarb::units
