#include "PhoneNumber.hpp"

#include "MaskingRules.hpp"
#include "string_utils.hpp"

std::optional<PhoneNumber> PhoneNumber::try_parse(std::string_view text) {
    std::string digits;
    digits.reserve(text.size());
    for (std::size_t pos = 0; pos < text.size(); ++pos) {
        const auto c = text[pos];
        if (is_ascii_digit(c))
            digits.push_back(c);
        else if (c == MaskingRules::PhonePlus && pos == 0)
            continue;
        else if (c != ' ')
            return {};
    }
    if (digits.size() < MaskingRules::PhoneMinDigits)
        return {};
    return PhoneNumber(text, std::move(digits));
}

std::string mask(const PhoneNumber &phone) {
    // Digits with an index (counting digits only) below this are hidden.
    const auto first_visible = phone.digits().size() - MaskingRules::PhoneVisibleDigits;
    std::string result;
    result.reserve(phone.layout().size());
    std::size_t digit_index = 0;
    for (auto c : phone.layout()) {
        if (c == ' ')
            result.push_back(MaskingRules::PhoneSeparator);
        else if (is_ascii_digit(c))
            result.push_back(digit_index++ < first_visible ? MaskingRules::MaskChar : c);
        else
            result.push_back(c);
    }
    return result;
}
