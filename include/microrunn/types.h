#pragma once

#include <type_traits>
#include <variant>

namespace mr {

template <typename T>
class _ValueWrapper;

namespace detail {

// plain numbers that may be promoted to constant nodes
template <typename T>
inline constexpr bool is_number_v =
    std::is_arithmetic_v<T> && !std::is_same_v<T, bool>;

template <typename T>
struct type_identity {
    using type = T;
};
template <typename T>
using identity_t = typename type_identity<T>::type;

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

};  // namespace detail

/// Recorded operations ///

namespace op {

struct Leaf {};
struct Add {};
struct Mul {};
template <typename T>
struct Pow {
    T exponent;
};
struct Tanh {};

};  // namespace op

// negation, subtraction and division are composed from these five, so the
// backward pass only ever needs these local rules
template <typename T>
using Operation = std::variant<op::Leaf, op::Add, op::Mul, op::Pow<T>, op::Tanh>;

};  // namespace mr
