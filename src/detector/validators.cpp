#include "detector/validators.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace redactguard::validators {

namespace {

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

bool valid_ymd(int y, int m, int d) {
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (y < 1 || m < 1 || m > 12 || d < 1) return false;
    int max_day = kDays[m - 1];
    if (m == 2 && is_leap(y)) max_day = 29;
    return d <= max_day;
}

// 97 - (n mod 97) for a decimal string of arbitrary length
int mod97_check(std::string_view digits) {
    int remainder = 0;
    for (const char c : digits) {
        remainder = (remainder * 10 + (c - '0')) % 97;
    }
    return 97 - remainder;
}

} // anonymous namespace

bool luhn(std::string_view value) {
    const std::string digits = utils::digits_only(value);
    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }

    int sum = 0;
    bool double_digit = false;

    // Right to left, doubling every second digit
    for (int i = static_cast<int>(digits.size()) - 1; i >= 0; --i) {
        int digit = digits[i] - '0';
        if (double_digit) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        double_digit = !double_digit;
    }

    return (sum % 10) == 0;
}

bool iban_mod97(std::string_view value) {
    std::string compact;
    compact.reserve(value.size());
    for (const char c : value) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        compact += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (compact.size() < 15 || compact.size() > 34) return false;
    if (!std::isalpha(static_cast<unsigned char>(compact[0])) ||
        !std::isalpha(static_cast<unsigned char>(compact[1])) ||
        !std::isdigit(static_cast<unsigned char>(compact[2])) ||
        !std::isdigit(static_cast<unsigned char>(compact[3]))) {
        return false;
    }

    const std::string rearranged = compact.substr(4) + compact.substr(0, 4);

    // Piecewise mod 97; letters expand to two digits (A=10 .. Z=35)
    int remainder = 0;
    for (const char c : rearranged) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            remainder = (remainder * 10 + (c - '0')) % 97;
        } else if (c >= 'A' && c <= 'Z') {
            const int v = c - 'A' + 10;
            remainder = (remainder * 100 + v) % 97;
        } else {
            return false;
        }
    }
    return remainder == 1;
}

bool be_national_register(std::string_view value) {
    const std::string digits = utils::digits_only(value);
    if (digits.size() != 11) return false;

    const std::string base = digits.substr(0, 9);
    const auto cc = utils::try_parse_int<int>(std::string_view(digits).substr(9));
    if (!cc) return false;

    if (mod97_check(base) == *cc) return true;
    return mod97_check("2" + base) == *cc;
}

bool us_ssn(std::string_view value) {
    const std::string digits = utils::digits_only(value);
    if (digits.size() != 9) {
        return false;
    }

    const std::string_view d(digits);
    const int area = utils::try_parse_int<int>(d.substr(0, 3)).value_or(0);
    if (area == 0 || area == 666 || area >= 900) {
        return false;
    }
    if (utils::try_parse_int<int>(d.substr(3, 2)).value_or(0) == 0) {
        return false;
    }
    return utils::try_parse_int<int>(d.substr(5, 4)).value_or(0) != 0;
}

bool calendar_date(std::string_view value) {
    std::string s(value);
    for (char& c : s) {
        if (c == '/') c = '-';
    }
    const std::string_view v(s);

    // Y-m-d
    if (v.size() == 10 && v[4] == '-' && v[7] == '-') {
        const auto y = utils::try_parse_int<int>(v.substr(0, 4));
        const auto m = utils::try_parse_int<int>(v.substr(5, 2));
        const auto d = utils::try_parse_int<int>(v.substr(8, 2));
        return y && m && d && valid_ymd(*y, *m, *d);
    }
    // d-m-Y
    if (v.size() == 10 && v[2] == '-' && v[5] == '-') {
        const auto d = utils::try_parse_int<int>(v.substr(0, 2));
        const auto m = utils::try_parse_int<int>(v.substr(3, 2));
        const auto y = utils::try_parse_int<int>(v.substr(6, 4));
        return y && m && d && valid_ymd(*y, *m, *d);
    }
    return false;
}

bool ipv4(std::string_view value) {
    int octets = 0;
    size_t pos = 0;
    while (pos <= value.size()) {
        size_t dot = value.find('.', pos);
        if (dot == std::string_view::npos) dot = value.size();
        const std::string_view part = value.substr(pos, dot - pos);
        if (part.empty() || part.size() > 3) return false;
        if (part.size() > 1 && part[0] == '0') return false;
        const auto n = utils::try_parse_int<int>(part);
        if (!n || *n > 255) return false;
        ++octets;
        pos = dot + 1;
        if (dot == value.size()) break;
    }
    return octets == 4;
}

bool bic(std::string_view value) {
    static const std::unordered_set<std::string> kCountries = {
        "AT", "BE", "BG", "CH", "CY", "CZ", "DE", "DK", "EE", "ES", "FI", "FR",
        "GB", "GR", "HR", "HU", "IE", "IS", "IT", "LI", "LT", "LU", "LV", "MC",
        "MT", "NL", "NO", "PL", "PT", "RO", "SE", "SI", "SK", "US", "CA", "JP",
        "CN", "HK", "SG", "AU",
    };
    if (value.size() != 8 && value.size() != 11) return false;
    return kCountries.contains(std::string(value.substr(4, 2)));
}

std::optional<Validator> find(const std::string& name) {
    static const std::unordered_map<std::string, Validator> lookup = {
        {"none",          Validator{}},
        {"luhn",          luhn},
        {"iban_checksum", iban_mod97},
        {"be_nrn",        be_national_register},
        {"ssn",           us_ssn},
        {"date",          calendar_date},
        {"ipv4",          ipv4},
        {"bic",           bic},
    };

    const auto it = lookup.find(utils::to_lower(name));
    if (it == lookup.end()) return std::nullopt;
    return it->second;
}

} // namespace redactguard::validators
