#pragma once

namespace strata::core {

// Builds a visitor for std::visit out of a set of lambdas.
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace strata::core
