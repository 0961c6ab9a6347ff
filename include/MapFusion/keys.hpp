#pragma once

#include <concepts>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>

#include "value.hpp"

namespace MapFusion {

/// Canonical string projection of an input map key. Specialize for
/// enumerations or other key types:
///
///   template<> struct MapFusion::KeyTraits<Color> {
///       static std::string to_key(Color c) { return c == Color::Red ? "red" : "blue"; }
///   };
template <class K>
struct KeyTraits;

template <class K>
    requires std::convertible_to<const K&, std::string_view>
struct KeyTraits<K> {
    static std::string to_key(const K& k) {
        return std::string(std::string_view(k));
    }
};

template <class K>
    requires (std::is_integral_v<K> && !std::is_same_v<K, bool>)
struct KeyTraits<K> {
    static std::string to_key(K k) {
        return std::to_string(k);
    }
};

template <class K>
concept KeyLike = requires (const K& k) {
    { KeyTraits<std::remove_cvref_t<K>>::to_key(k) } -> std::convertible_to<std::string>;
};

// Wide unsigned values are range checked when the input is read
template <class V>
concept ValueLike = std::constructible_from<Value, const V&> || WideUnsigned<V>;

/// Anything iterable as (key, value) pairs: std::map, std::unordered_map,
/// a vector of pairs, ...
template <class M>
concept MapLike = std::ranges::input_range<const M>
    && requires (const std::ranges::range_value_t<const M>& entry) {
        requires KeyLike<std::remove_cvref_t<decltype(entry.first)>>;
        requires ValueLike<std::remove_cvref_t<decltype(entry.second)>>;
    };

} // namespace MapFusion
