#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace redactguard::validators {

/**
 * @brief Domain validity checks applied after a shape (regex) match
 *
 * Each validator receives the raw matched text, separators included,
 * and strips what it does not need.
 */
using Validator = std::function<bool(std::string_view)>;

/// Luhn mod-10 check over 13-19 digits
[[nodiscard]] bool luhn(std::string_view value);

/// ISO 13616 IBAN: 15-34 chars, rearranged, letters as 10..35, mod 97 == 1
[[nodiscard]] bool iban_mod97(std::string_view value);

/**
 * @brief Belgian national register number (11 digits)
 * Check digits are 97 - (first 9 digits mod 97), or computed over "2" + the
 * first 9 digits for people born from 2000 on.
 */
[[nodiscard]] bool be_national_register(std::string_view value);

/// US SSN: area not 000/666/900+, group not 00, serial not 0000
[[nodiscard]] bool us_ssn(std::string_view value);

/// Calendar-valid date in Y-m-d or d-m-Y form ('/' or '-' separated)
[[nodiscard]] bool calendar_date(std::string_view value);

/// Dotted quad with every octet in 0..255 and no leading zeros
[[nodiscard]] bool ipv4(std::string_view value);

/// 8 or 11 chars with a known ISO country code in positions 5-6
[[nodiscard]] bool bic(std::string_view value);

/**
 * @brief Lookup by name for configured rules
 * Names: none, luhn, iban_checksum, be_nrn, ssn, date, ipv4, bic.
 * "none" returns an empty function (no validation).
 * @return nullopt for unknown names
 */
[[nodiscard]] std::optional<Validator> find(const std::string& name);

} // namespace redactguard::validators
