#include "security/identifier_generator.hpp"
#include "core/digest.hpp"

#include <cctype>
#include <format>

namespace redactguard {

std::string IdentifierGenerator::generate(Tier tier, const std::string& label,
                                          std::string_view raw_value) const {
    const std::string hex = digest::sha256_hex(secret_.salt(), raw_value);
    return std::format("{}::{}::{}", tier_to_string(tier), label, hex.substr(0, kDigestChars));
}

bool IdentifierGenerator::looks_like_identifier(std::string_view token) {
    const auto first = token.find("::");
    if (first == std::string_view::npos) return false;
    if (!parse_tier(token.substr(0, first))) return false;

    const auto second = token.find("::", first + 2);
    if (second == std::string_view::npos || second == first + 2) return false;

    const auto hex = token.substr(second + 2);
    if (hex.size() != kDigestChars) return false;
    for (const char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c)) ||
            std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // namespace redactguard
