#pragma once

namespace Chromaseq {

// Visitor built from a set of lambdas, for std::visit over closed variants.
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace Chromaseq
