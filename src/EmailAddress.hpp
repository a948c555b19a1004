#pragma once

#include <optional>
#include <string>
#include <string_view>

// An address of the form local-part@domain. This is deliberately a much looser grammar than RFC 5322: the local part
// is anything without whitespace or '@', and the domain is one or more non-empty labels separated by dots.
// Only try_parse() creates these, so a held EmailAddress is always well-formed.
class EmailAddress {
public:
    [[nodiscard]] static std::optional<EmailAddress> try_parse(std::string_view text);

    [[nodiscard]] const std::string &local_part() const noexcept { return local_part_; }
    [[nodiscard]] const std::string &domain() const noexcept { return domain_; }

private:
    EmailAddress(std::string_view local_part, std::string_view domain) : local_part_(local_part), domain_(domain) {}

    std::string local_part_;
    std::string domain_;
};

// Lower-cases the address and replaces everything between the first and last characters of the local part with a
// fixed block of asterisks: "Local-Part@Domain.com" becomes "l*****t@domain.com". The block is inserted even if the
// local part is one or two characters long.
[[nodiscard]] std::string mask(const EmailAddress &email);
