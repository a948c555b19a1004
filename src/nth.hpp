#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace impl {
template <typename T>
struct Nth {
    T value;
};
std::string_view suffix_for(std::uintmax_t value);

// The absolute value of an integer, safe for the most negative value of a signed type.
template <typename T>
constexpr std::uintmax_t magnitude(T value) noexcept {
    if constexpr (std::is_signed_v<T>) {
        if (value < 0)
            return std::uintmax_t{0} - static_cast<std::uintmax_t>(value);
    }
    return static_cast<std::uintmax_t>(value);
}
}

template <typename T>
struct fmt::formatter<impl::Nth<T>> : formatter<T> {
    // Any format spec applies to the number only, so "{:>4}" of 3 gives "   3rd".
    template <typename FormatContext>
    auto format(const impl::Nth<T> &number, FormatContext &ctx) const {
        auto out = formatter<T>::format(number.value, ctx);
        return fmt::format_to(out, "{}", impl::suffix_for(impl::magnitude(number.value)));
    }
};

// Wrap an integral value so that it outputs as nth. e.g. "3rd", "45th", "2nd", "-1st".
// The sign never affects the suffix.
template <typename T>
auto nth(T t) {
    static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool>);
    return impl::Nth<T>{t};
}

// Formats any integer as an English ordinal. Total: zero is "0th" and negatives keep their sign.
template <typename T>
[[nodiscard]] std::string format_ordinal(T value) {
    return fmt::to_string(nth(value));
}

// Returned by format_positive_ordinal() for values below one.
struct OrdinalRangeError {
    std::intmax_t value{};

    bool operator==(const OrdinalRangeError &) const = default;
};

template <>
struct fmt::formatter<OrdinalRangeError> {
    constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }
    template <typename FormatContext>
    auto format(const OrdinalRangeError &error, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "ordinal value must be greater than zero, got {}", error.value);
    }
};

// The strict flavour of format_ordinal(): only the natural numbers (1, 2, 3...) have an ordinal.
template <typename T>
[[nodiscard]] std::variant<std::string, OrdinalRangeError> format_positive_ordinal(T value) {
    static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool>);
    if (value < 1)
        return OrdinalRangeError{static_cast<std::intmax_t>(value)};
    return format_ordinal(value);
}
