#pragma once

#include <map>
#include <string>
#include <type_traits>

#include "value.hpp"

namespace MapFusion {

/// Declaring a member of this type switches a marshalable type to the
/// Unmapped unknown-key policy: input keys no field claims are captured here
/// during construction and written back verbatim by ToMap.
///
/// ValueT bounds what can be captured. Leftover values that do not fit are
/// stored as nil when ValueT is nilable, and fail construction otherwise.
template <class ValueT = Value>
struct Unmapped : std::map<std::string, ValueT> {
    using mapped_type = ValueT;
    using std::map<std::string, ValueT>::map;
};

template <class T>
struct is_unmapped : std::false_type {};

template <class V>
struct is_unmapped<Unmapped<V>> : std::true_type {};

template <class T>
inline constexpr bool is_unmapped_v = is_unmapped<std::remove_cvref_t<T>>::value;

} // namespace MapFusion
