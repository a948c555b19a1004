#include "Obfuscate.hpp"

#include "Visitor.hpp"
#include "common/Logger.hpp"

#include <magic_enum.hpp>

namespace {

enum class ContactKind { Email, Phone };

Logger &logger() {
    static auto log = logger_for("Obfuscate");
    return log;
}

void log_classified(const ContactKind kind) { logger().debug("input classified as {}", magic_enum::enum_name(kind)); }

}

Classification classify(std::string_view input) {
    if (auto email = EmailAddress::try_parse(input))
        return std::move(*email);
    if (auto phone = PhoneNumber::try_parse(input))
        return std::move(*phone);
    return ClassificationError::Unrecognized;
}

ClassificationResult classify_and_mask(std::string_view input) {
    return std::visit(Visitor{[](const EmailAddress &email) -> ClassificationResult {
                                  log_classified(ContactKind::Email);
                                  return MaskedEmail{mask(email)};
                              },
                              [](const PhoneNumber &phone) -> ClassificationResult {
                                  log_classified(ContactKind::Phone);
                                  return MaskedPhone{mask(phone)};
                              },
                              [](const ClassificationError error) -> ClassificationResult { return error; }},
                      classify(input));
}

std::variant<std::string, ClassificationError> obfuscate(std::string_view input) {
    return std::visit(
        Visitor{[](MaskedEmail &&masked) -> std::variant<std::string, ClassificationError> {
                    return std::move(masked.text);
                },
                [](MaskedPhone &&masked) -> std::variant<std::string, ClassificationError> {
                    return std::move(masked.text);
                },
                [](const ClassificationError error) -> std::variant<std::string, ClassificationError> {
                    return error;
                }},
        classify_and_mask(input));
}
