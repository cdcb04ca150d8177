// Repository: Jukebox-controller
// Component: Overloaded
// Purpose: Builds a std::visit visitor from a set of lambdas.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_RUNTIME_OVERLOADED_HPP_
#define JUKEBOX_RUNTIME_OVERLOADED_HPP_

namespace jukebox::runtime {

// A command variant visited with Overloaded{...} fails to compile when an
// alternative has no matching lambda.
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace jukebox::runtime

#endif  // JUKEBOX_RUNTIME_OVERLOADED_HPP_
