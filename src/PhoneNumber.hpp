#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

// A phone number as typed into a form: digits separated by single or repeated spaces, with an optional leading '+',
// e.g. "+44 123 456 789". The layout is kept exactly as entered so it can be reproduced when masking.
// Only try_parse() creates these, so a held PhoneNumber always has at least MaskingRules::PhoneMinDigits digits.
class PhoneNumber {
public:
    [[nodiscard]] static std::optional<PhoneNumber> try_parse(std::string_view text);

    // The original text: digits, spaces and the leading plus, in the order entered.
    [[nodiscard]] const std::string &layout() const noexcept { return layout_; }
    // Just the digits, in order.
    [[nodiscard]] const std::string &digits() const noexcept { return digits_; }
    [[nodiscard]] bool has_leading_plus() const noexcept { return !layout_.empty() && layout_.front() == '+'; }

private:
    PhoneNumber(std::string_view layout, std::string digits) : layout_(layout), digits_(std::move(digits)) {}

    std::string layout_;
    std::string digits_;
};

// Replaces all but the last four digits with asterisks and every space with a dash, keeping any leading plus:
// "+44 123 456 789" becomes "+**-***-**6-789".
[[nodiscard]] std::string mask(const PhoneNumber &phone);
