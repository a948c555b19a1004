#include "nth.hpp"

std::string_view impl::suffix_for(std::uintmax_t value) {
    switch (value % 100u) {
    case 11:
    case 12:
    case 13: return "th";
    default: break;
    }

    switch (value % 10u) {
    case 1: return "st";
    case 2: return "nd";
    case 3: return "rd";
    default: break;
    }
    return "th";
}
