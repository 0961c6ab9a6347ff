#pragma once
#include <array>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "value.hpp"
#include "result.hpp"
#include "unmapped.hpp"
#include "options.hpp"
#include "struct_introspection.hpp"

namespace MapFusion {

namespace static_schema {

namespace detail {
template<class T>
struct always_false : std::false_type {};

template<class T>
struct is_optional : std::false_type {};
template<class T>
struct is_optional<std::optional<T>> : std::true_type {};

template<class T>
struct is_std_array : std::false_type {};
template<class T, std::size_t N>
struct is_std_array<std::array<T, N>> : std::true_type {};

template<class T>
struct is_variant : std::false_type {};
template<class... Ts>
struct is_variant<std::variant<Ts...>> : std::true_type {};
}

template<class T>
inline constexpr bool is_optional_v = detail::is_optional<std::remove_cvref_t<T>>::value;

template<class T>
inline constexpr bool is_variant_v = detail::is_variant<std::remove_cvref_t<T>>::value;


// ============================================================================
// Leaf values: a type check against the Value variant and the way back
// ============================================================================

template<class T>
struct value_traits;

template<>
struct value_traits<bool> {
    static constexpr std::string_view name = "Bool";
    static std::optional<bool> match(const Value& v) {
        if(const bool * b = v.getIf<bool>()) return *b;
        return std::nullopt;
    }
    static Value to_value(bool b) { return Value(b); }
};

// Integers are stored as int64; narrower fields accept them when in range.
template<StorableInt I>
struct value_traits<I> {
    static constexpr std::string_view name = "Int";
    static std::optional<I> match(const Value& v) {
        if(const std::int64_t * i = v.getIf<std::int64_t>()) {
            if(std::in_range<I>(*i)) return static_cast<I>(*i);
        }
        return std::nullopt;
    }
    static Value to_value(I i) { return Value(static_cast<std::int64_t>(i)); }
};

// Floating fields also take integers. Finite values beyond the field's
// range do not match; infinities and NaN carry over.
template<class F>
    requires std::is_floating_point_v<F>
struct value_traits<F> {
    static constexpr std::string_view name = "Float";
    static std::optional<F> match(const Value& v) {
        if(const double * d = v.getIf<double>()) {
            if(std::isfinite(*d) && std::fabs(*d) > static_cast<double>(std::numeric_limits<F>::max())) {
                return std::nullopt;
            }
            return static_cast<F>(*d);
        }
        if(const std::int64_t * i = v.getIf<std::int64_t>()) return static_cast<F>(*i);
        return std::nullopt;
    }
    static Value to_value(F f) { return Value(static_cast<double>(f)); }
};

template<>
struct value_traits<std::string> {
    static constexpr std::string_view name = "String";
    static std::optional<std::string> match(const Value& v) {
        if(const std::string * s = v.getIf<std::string>()) return *s;
        return std::nullopt;
    }
    static Value to_value(const std::string & s) { return Value(s); }
};

template<>
struct value_traits<Timestamp> {
    static constexpr std::string_view name = "Timestamp";
    static std::optional<Timestamp> match(const Value& v) {
        if(const Timestamp * t = v.getIf<Timestamp>()) return *t;
        return std::nullopt;
    }
    static Value to_value(Timestamp t) { return Value(t); }
};

template<>
struct value_traits<Array> {
    static constexpr std::string_view name = "Array";
    static std::optional<Array> match(const Value& v) {
        if(const Array * a = v.getIf<Array>()) return *a;
        return std::nullopt;
    }
    static Value to_value(const Array & a) { return Value(a); }
};

// A raw sub-map, kept as is
template<>
struct value_traits<Map> {
    static constexpr std::string_view name = "Map";
    static std::optional<Map> match(const Value& v) {
        if(const Map * m = v.getIf<Map>()) return *m;
        return std::nullopt;
    }
    static Value to_value(const Map & m) { return Value(m); }
};

// Any value, nil included
template<>
struct value_traits<Value> {
    static constexpr std::string_view name = "Value";
    static std::optional<Value> match(const Value& v) {
        return v;
    }
    static Value to_value(const Value & v) { return v; }
};


template<class T>
concept LeafValue = requires (const Value & v, const T & t) {
    { value_traits<T>::name } -> std::convertible_to<std::string_view>;
    { value_traits<T>::match(v) } -> std::same_as<std::optional<T>>;
    { value_traits<T>::to_value(t) } -> std::same_as<Value>;
};


// ============================================================================
// Marshalable objects
// ============================================================================

// Types implementing the capability by hand
template<class T>
concept CustomMarshalable = std::is_class_v<T> && requires (const T & t, const Map & m) {
    { T::from_map(m) } -> std::same_as<FromMapResult<T>>;
    { t.to_map() } -> std::convertible_to<Map>;
};

// Types whose fields are enumerated by PFR or registered through StructMeta
template<class T>
concept ReflectedObject = std::is_class_v<T>
    && !LeafValue<T>
    && !CustomMarshalable<T>
    && !is_optional_v<T>
    && !is_unmapped_v<T>
    && !std::same_as<T, std::monostate>
    && !detail::is_std_array<T>::value
    && (std::is_aggregate_v<T> || introspection::has_struct_meta_specialization<T>);

template<class T>
concept MarshalableObject = ReflectedObject<T> || CustomMarshalable<T>;


// ============================================================================
// Unions: std::variant over leaves and objects, std::monostate standing for nil
// ============================================================================

template<class T>
concept UnionAlternative = std::same_as<T, std::monostate> || LeafValue<T> || MarshalableObject<T>;

template<class A>
constexpr std::string_view alternative_name() {
    if constexpr (std::same_as<A, std::monostate>) {
        return "Nil";
    } else if constexpr (LeafValue<A>) {
        return value_traits<A>::name;
    } else {
        return "Map";
    }
}

// "Nil | String | Int"
template<class... Ts>
struct union_name {
    static constexpr std::size_t length =
        (alternative_name<Ts>().size() + ...) + 3 * (sizeof...(Ts) - 1);

    static constexpr std::array<char, length> chars = [] {
        std::array<char, length> out{};
        std::size_t pos = 0;
        auto append = [&](std::string_view part) {
            for(char c : part) out[pos++] = c;
        };
        ((append(pos == 0 ? std::string_view{} : std::string_view{" | "}), append(alternative_name<Ts>())), ...);
        return out;
    }();

    static constexpr std::string_view value{chars.data(), length};
};

template<class T>
struct union_traits {
    static constexpr bool valid = false;
};

template<class... Ts>
struct union_traits<std::variant<Ts...>> {
    static constexpr bool valid      = (UnionAlternative<Ts> && ...);
    static constexpr bool nilable    = (std::same_as<Ts, std::monostate> || ...);
    static constexpr bool has_object = (MarshalableObject<Ts> || ...);
    static constexpr std::string_view name = union_name<Ts...>::value;
};

template<class T>
concept UnionValue = union_traits<T>::valid;

// Unions with an object alternative are parsed field by field, not matched
template<class T>
concept ObjectUnion = UnionValue<T> && union_traits<T>::has_object;

// Leaf-only unions: alternatives are tried in declaration order
template<class... Ts>
    requires ((std::same_as<Ts, std::monostate> || LeafValue<Ts>) && ...)
struct value_traits<std::variant<Ts...>> {
    using V = std::variant<Ts...>;
    static constexpr std::string_view name = union_name<Ts...>::value;

    static std::optional<V> match(const Value& v) {
        std::optional<V> out;
        (matchAlternative<Ts>(v, out), ...);
        return out;
    }
    static Value to_value(const V & u) {
        return std::visit([](const auto & alt) -> Value {
            using A = std::remove_cvref_t<decltype(alt)>;
            if constexpr (std::same_as<A, std::monostate>) {
                return Value{};
            } else {
                return value_traits<A>::to_value(alt);
            }
        }, u);
    }

private:
    template<class A>
    static void matchAlternative(const Value& v, std::optional<V> & out) {
        if(out) return;
        if constexpr (std::same_as<A, std::monostate>) {
            if(v.isNil()) out.emplace(std::in_place_type<A>);
        } else if(std::optional<A> m = value_traits<A>::match(v)) {
            out.emplace(std::in_place_type<A>, std::move(*m));
        }
    }
};


template<class T>
concept NonNullFieldValue = LeafValue<T> || MarshalableObject<T> || UnionValue<T>;

template<class T>
concept NullableFieldValue = std::same_as<T, Value>
    || (is_optional_v<T>
        && NonNullFieldValue<typename T::value_type>
        && !std::same_as<typename T::value_type, Value>)
    || (UnionValue<T> && union_traits<T>::nilable);

template<class T>
concept FieldValue = NonNullFieldValue<T> || NullableFieldValue<T>;


// Declared type with nilability stripped
template<class T>
struct strip_nullable {
    using type = T;
};
template<class T>
struct strip_nullable<std::optional<T>> {
    using type = T;
};
template<class T>
using strip_nullable_t = typename strip_nullable<T>::type;


template<class T>
constexpr std::string_view expected_type_name() {
    using U = strip_nullable_t<T>;
    if constexpr (LeafValue<U>) {
        return value_traits<U>::name;
    } else if constexpr (UnionValue<U>) {
        return union_traits<U>::name;
    } else {
        return "Map";
    }
}


template<class Field>
using AnnotatedValue = typename options::detail::annotation_meta_getter<Field>::value_t;


template<NullableFieldValue T>
void setNull(T & v) {
    if constexpr (std::same_as<T, Value>) {
        v = Value{};
    } else if constexpr (is_variant_v<T>) {
        v.template emplace<std::monostate>();
    } else {
        v.reset();
    }
}

} // namespace static_schema

} // namespace MapFusion
