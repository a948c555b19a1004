#pragma once

#include "EmailAddress.hpp"
#include "PhoneNumber.hpp"

#include <string>
#include <string_view>
#include <variant>

#include <fmt/format.h>

enum class ClassificationError {
    // Neither an email address nor a phone number.
    Unrecognized
};

template <>
struct fmt::formatter<ClassificationError> {
    constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }
    template <typename FormatContext>
    auto format(const ClassificationError, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "input is neither an email address nor a phone number");
    }
};

struct MaskedEmail {
    std::string text;
    bool operator==(const MaskedEmail &) const = default;
};

struct MaskedPhone {
    std::string text;
    bool operator==(const MaskedPhone &) const = default;
};

using Classification = std::variant<EmailAddress, PhoneNumber, ClassificationError>;
using ClassificationResult = std::variant<MaskedEmail, MaskedPhone, ClassificationError>;

// Works out whether some free-form input is an email address or a phone number. Emails are tried first, though no
// input can be both: a phone number never contains an '@'.
[[nodiscard]] Classification classify(std::string_view input);

// Classifies the input then masks it according to its kind.
[[nodiscard]] ClassificationResult classify_and_mask(std::string_view input);

// Masks an email address or phone number so it can be shown back to a user or kept in a record without revealing it in
// full:
//   "local-part@domain-name.com" -> "l*****t@domain-name.com"
//   "+44 123 456 789"            -> "+**-***-**6-789"
// Anything else is ClassificationError::Unrecognized; no partially-masked text is ever returned.
[[nodiscard]] std::variant<std::string, ClassificationError> obfuscate(std::string_view input);
