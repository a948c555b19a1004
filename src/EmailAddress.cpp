#include "EmailAddress.hpp"

#include "MaskingRules.hpp"
#include "string_utils.hpp"

#include <fmt/format.h>

namespace {

bool is_valid_domain(std::string_view domain) {
    if (domain.find('.') == std::string_view::npos)
        return false;
    // Every label either side of every dot must be non-empty: no leading, trailing or doubled dots.
    for (;;) {
        const auto dot = domain.find('.');
        if (dot == 0)
            return false;
        if (dot == std::string_view::npos)
            return !domain.empty();
        domain.remove_prefix(dot + 1);
    }
}

bool is_utf8_continuation(const char c) noexcept { return (static_cast<unsigned char>(c) & 0xc0u) == 0x80u; }

// The first and last characters of a non-empty UTF-8 string, each including any continuation bytes.
std::string_view first_character(std::string_view str) {
    std::size_t length = 1;
    while (length < str.size() && is_utf8_continuation(str[length]))
        ++length;
    return str.substr(0, length);
}

std::string_view last_character(std::string_view str) {
    auto start = str.size() - 1;
    while (start > 0 && is_utf8_continuation(str[start]))
        --start;
    return str.substr(start);
}

}

std::optional<EmailAddress> EmailAddress::try_parse(std::string_view text) {
    const auto at = text.find('@');
    if (at == std::string_view::npos || text.find('@', at + 1) != std::string_view::npos)
        return {};
    const auto local_part = text.substr(0, at);
    const auto domain = text.substr(at + 1);
    if (local_part.empty() || has_whitespace(local_part))
        return {};
    if (domain.empty() || has_whitespace(domain) || !is_valid_domain(domain))
        return {};
    return EmailAddress(local_part, domain);
}

std::string mask(const EmailAddress &email) {
    const auto local_part = lower_case(email.local_part());
    return fmt::format("{}{}{}@{}", first_character(local_part),
                       std::string(MaskingRules::EmailMaskWidth, MaskingRules::MaskChar), last_character(local_part),
                       lower_case(email.domain()));
}
