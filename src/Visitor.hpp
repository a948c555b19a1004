#pragma once

// Combines lambdas into a single overloaded callable for std::visit, e.g.
//   std::visit(Visitor{[](const EmailAddress &) {...}, [](const PhoneNumber &) {...}}, classification);
template <typename... Ts>
struct Visitor : Ts... {
    using Ts::operator()...;
};
