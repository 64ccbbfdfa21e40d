#pragma once                              // ensure this header is included only once per translation unit

#include <type_traits>   // std::true_type, std::void_t, std::is_default_constructible
#include <utility>       // std::declval

// ==========================
// Weight contract
// ==========================
// Every node weight and arc weight type must behave like a number:
// - default construction yields the additive identity (zero)
// - constructible from the literal 1 (multiplicative identity)
// - closed under + and *
// - copyable and equality comparable
// The storage layer never does arithmetic itself, but every class
// template taking a weight parameter checks this contract so callers
// can rely on it (path costs, weight updates, compact serialization).
// ==========================

namespace detail {

template <typename T, typename = void>
struct HasWeightAlgebra : std::false_type {};

template <typename T>
struct HasWeightAlgebra<T, std::void_t<
    decltype(T(std::declval<const T&>() + std::declval<const T&>())),
    decltype(T(std::declval<const T&>() * std::declval<const T&>())),
    decltype(bool(std::declval<const T&>() == std::declval<const T&>())),
    decltype(T(1))>> : std::true_type {};

} // namespace detail

// Compile-time predicate: true if T satisfies the weight contract
template <typename T>
struct IsWeight
    : std::integral_constant<bool,
                             std::is_default_constructible<T>::value &&
                             std::is_copy_constructible<T>::value &&
                             std::is_copy_assignable<T>::value &&
                             detail::HasWeightAlgebra<T>::value> {};

template <typename T>
constexpr bool IsWeightV = IsWeight<T>::value;

// Identities of a weight type
template <typename T>
struct WeightTraits {
    static_assert(IsWeightV<T>, "weight type must support +, *, zero (T{}) and one (T(1))");

    static T zero() { return T{}; }                  // additive identity
    static T one() { return T(1); }                  // multiplicative identity
    static bool isZero(const T& w) { return w == zero(); }
};
