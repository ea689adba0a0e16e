#pragma once

#include <type_traits>
#include <tuple>
#include <utility>
#include <optional>
#include <concepts>
#include <functional>
#include <boost/pfr.hpp>
#include <fixed_string.hpp>

namespace fieldkit
{

/**
 * @brief Access rights of a field as seen by the dynamic accessor
 *
 * C++ code can always read and write a Field<> member directly. The access
 * rights only restrict what the name-based accessor functions may do.
 */
enum class Access
{
    readWrite,
    readOnly,   ///< readable, ignored by every write operation
    writeOnly   ///< writable, never enumerated or read back
};

// Forward declarations needed by detail namespace
template <typename T, fixstr::fixed_string Name, Access kAccess> class Field;
template <typename T> class Fundamental;
template <typename T> class Record;
class Value;

//=============================================================================
// Implementation details - not part of the public API
//=============================================================================
namespace detail
{
/**
 * @brief Filters a tuple, keeping only elements that satisfy the Predicate
 *
 * @tparam Predicate A template that provides a ::value bool for each type
 * @param tp The tuple to filter
 * @return A new tuple containing only elements where Predicate<T>::value is true
 */
template <template<typename> class Predicate, typename Tuple>
auto filter_tuple(Tuple&& tp)
{
    return std::apply([]<typename... Ts>(Ts&&... args) {
        auto maybe_keep = []<typename T>(T&& arg) {
            if constexpr (Predicate<T>::value)
                return std::tuple<T>(std::forward<T>(arg));
            else
                return std::tuple<>();
        };
        return std::tuple_cat(maybe_keep(std::forward<Ts>(args))...);
    }, std::forward<Tuple>(tp));
}

/// Combines multiple lambdas into a single overloaded callable
template <typename... L>
struct overloaded : L...
{
    using L::operator()...;
    constexpr overloaded(L... lambda) : L(std::move(lambda))... {}
};

template <typename>
inline constexpr bool always_false = false;

//-----------------------------------------------------------------------------
// Field type detection
//-----------------------------------------------------------------------------

template <typename T> struct is_field_helper : std::false_type {};
template <typename T, fixstr::fixed_string Name, Access kAccess> struct is_field_helper<Field<T, Name, kAccess>> : std::true_type {};

/// Predicate that is true if T is a Field<> specialization
template <typename T> struct is_field { static constexpr auto value = is_field_helper<std::decay_t<T>>::value; };

/// Returns the number of Field<> members in struct T
template <typename T>
constexpr std::size_t num_fields()
{
    if constexpr (std::is_aggregate_v<T>)
        return std::tuple_size_v<decltype(filter_tuple<is_field>(boost::pfr::structure_tie(std::declval<T&>())))>;

    return 0;
}

/// Helper to decay all types in a tuple
template <typename T> struct decay_tuple;
template <typename... Types> struct decay_tuple<std::tuple<Types...>>
{
    using type = std::tuple<std::decay_t<Types>...>;
};

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};

/// True if T is one of the types listed in the tuple
template <typename T, typename Tuple> struct is_one_of;
template <typename T, typename... Types> struct is_one_of<T, std::tuple<Types...>>
    : std::bool_constant<(std::is_same_v<T, Types> || ...)> {};

//-----------------------------------------------------------------------------
// Compile-time field lookup by name
//-----------------------------------------------------------------------------

/**
 * @brief Helper to find a field by compile-time name in a parameter pack
 *
 * @tparam FieldName The compile-time string name to search for
 * @tparam TypeErasedValueT Deferred type parameter (defaults to Value) to allow
 *         this template to be defined before Value is complete
 */
template <fixstr::fixed_string FieldName, typename TypeErasedValueT = class Value>
struct FindFieldHelper
{
    /// Base case: no fields left, return invalid sentinel
    static constexpr auto& eval() { return TypeErasedValueT::kInvalid; }

    /// Recursive case: check if field0's name matches, else recurse
    template <typename Field0, typename... Fields>
    static constexpr auto&& eval(Field0 && field0, Fields && ...fields)
    {
        static auto constexpr fieldname = std::remove_cvref_t<Field0>::kName;

        return std::invoke(
            overloaded(
                [] <typename Field0_, typename... Fields_>
                (std::bool_constant<true>,  Field0_ && field0_, Fields_ && ...) -> auto&&
                { return field0_; },
                [] <typename Field0_, typename... Fields_>
                (std::bool_constant<false>, Field0_ &&        , Fields_ && ...fields_) -> auto&&
                { return FindFieldHelper::eval(std::forward<Fields_>(fields_)...); }
            ),
            std::bool_constant<fieldname == FieldName>(),
            std::forward<Field0>(field0),
            std::forward<Fields>(fields)...
        );
    }
};

/// Record<T> for structs made of Field<> members, Fundamental<T> for everything else
template <typename T>
using BaseTypeFor = std::conditional_t<num_fields<T>() >= 1, Record<T>, Fundamental<T>>;

} // namespace detail

} // namespace fieldkit
