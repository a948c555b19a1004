#pragma once

#include <cstddef>

// The fixed rules for masking contact details. The mask width doesn't depend on how much is hidden, so the output
// never reveals the length of an email's local part.
struct MaskingRules {
    static constexpr auto MaskChar = '*';
    static constexpr std::size_t EmailMaskWidth = 5u;

    static constexpr auto PhoneSeparator = '-';
    static constexpr auto PhonePlus = '+';
    static constexpr std::size_t PhoneMinDigits = 9u;
    static constexpr std::size_t PhoneVisibleDigits = 4u;
};

// Masking relies on PhoneNumber always having more digits than are left visible.
static_assert(MaskingRules::PhoneMinDigits > MaskingRules::PhoneVisibleDigits);
