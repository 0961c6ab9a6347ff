#pragma once

#include <bitset>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "static_schema.hpp"
#include "options.hpp"
#include "casts.hpp"
#include "keys.hpp"
#include "errors.hpp"
#include "result.hpp"
#include "path.hpp"
#include "unmapped.hpp"
#include "struct_introspection.hpp"
#include "struct_fields_helper.hpp"

namespace MapFusion {

namespace from_map_details {

using EntryOrder = std::vector<const Map::value_type*>;

class DeserializationContext {
    ErrorInfo info;
    path::Path currentPath;

public:
    struct PathGuard {
        DeserializationContext & ctx;

        ~PathGuard() {
            if(ctx.info.error == MarshalError::NO_ERROR)
                ctx.currentPath.pop();
        }
    };

    bool withError(MarshalError err,
                   std::string_view typeName,
                   std::string_view field,
                   std::string_view key,
                   std::string_view expectedType = {},
                   const Value & offending = Value{}) {
        info.error          = err;
        info.typeName       = typeName;
        info.field          = field;
        info.key            = key;
        info.expectedType   = expectedType;
        info.offendingValue = offending;
        return false;
    }

    // Error reported by a hand-written from_map: its path continues ours
    bool withNestedError(ErrorInfo nested) {
        for(auto & el : nested.path.storage) {
            currentPath.push_child(el);
        }
        nested.path = path::Path{};
        info = std::move(nested);
        return false;
    }

    MarshalError currentError() const {return info.error;}

    ErrorInfo takeError() {
        info.path = currentPath;
        return std::move(info);
    }

    PathGuard getKeyGuard(std::string_view key) {
        currentPath.push_child(key);
        return PathGuard{*this};
    }
};


template<class StructT, std::size_t StructIndex>
using StructFieldMeta = options::detail::annotation_meta_getter<
    introspection::structureElementTypeByIndex<StructIndex, StructT>
>;

template<class StructT, std::size_t StructIndex>
decltype(auto) fieldRef(StructT & obj) {
    return StructFieldMeta<StructT, StructIndex>::getRef(
        introspection::getStructElementByIndex<StructIndex>(obj));
}


template <class ObjT>
    requires static_schema::ReflectedObject<ObjT>
bool ParseObject(ObjT & obj, const Map & input, const EntryOrder * order, DeserializationContext & ctx);

template <class ObjT>
    requires static_schema::CustomMarshalable<ObjT>
bool ParseObject(ObjT & obj, const Map & input, const EntryOrder *, DeserializationContext & ctx) {
    FromMapResult<ObjT> r = ObjT::from_map(input);
    if(!r) {
        return ctx.withNestedError(std::move(r).errorInfo());
    }
    obj = std::move(r).value();
    return true;
}


template <class Opts, class Field>
void ApplyDefault(Field & field) {
    using DefaultOpt = typename Opts::template get_option<options::detail::default_tag>;
    if constexpr (DefaultOpt::has_provider) {
        field = DefaultOpt::provider();
    }
    // otherwise the staging object still holds the member initializer's value
}

// No usable value for the field: default, then nil, then the given error
template <class Opts, class Field>
bool Rescue(Field & field, DeserializationContext & ctx, MarshalError err,
            const FieldDescriptor & d, std::string_view typeName, const Value & offending) {
    if constexpr (Opts::template has_option<options::detail::default_tag>) {
        ApplyDefault<Opts>(field);
        return true;
    } else if constexpr (static_schema::NullableFieldValue<Field>) {
        static_schema::setNull(field);
        return true;
    } else {
        return ctx.withError(err, typeName, d.name, d.key, d.declaredType, offending);
    }
}

// A Map goes to the first alternative accepting one (objects parse with full
// error context), anything else to the first leaf alternative it matches
template <class Alt, class U>
bool ParseUnionAlternative(U & out, const Value & v, bool & matched, DeserializationContext & ctx) {
    if(matched) {
        return true;
    }
    if constexpr (std::same_as<Alt, std::monostate>) {
        if(v.isNil()) {
            out.template emplace<std::monostate>();
            matched = true;
        }
    } else if constexpr (static_schema::MarshalableObject<Alt>) {
        if(const Map * sub = v.getIf<Map>()) {
            matched = true;
            Alt nested{};
            if(!ParseObject(nested, *sub, nullptr, ctx)) {
                return false;
            }
            out.template emplace<Alt>(std::move(nested));
        }
    } else {
        if(std::optional<Alt> m = static_schema::value_traits<Alt>::match(v)) {
            out.template emplace<Alt>(std::move(*m));
            matched = true;
        }
    }
    return true;
}

template <class... Ts>
bool ParseUnion(std::variant<Ts...> & out, const Value & v, bool & matched, DeserializationContext & ctx) {
    return (ParseUnionAlternative<Ts>(out, v, matched, ctx) && ...);
}

template <class Opts, class Field>
bool CoerceValue(Field & field, const Value & raw, DeserializationContext & ctx,
                 const FieldDescriptor & d, std::string_view typeName) {
    using U = static_schema::strip_nullable_t<Field>;

    std::optional<Value> casted;
    const Value * candidate = &raw;
    if constexpr (Opts::template has_option<options::detail::cast_tag>) {
        casted = casts::apply<typename Opts::template get_option<options::detail::cast_tag>>(raw);
        candidate = casted ? &*casted : nullptr;
    }

    if(candidate != nullptr) {
        if constexpr (static_schema::MarshalableObject<U>) {
            if(const Map * sub = candidate->getIf<Map>()) {
                U nested{};
                if(!ParseObject(nested, *sub, nullptr, ctx)) {
                    return false;
                }
                field = std::move(nested);
                return true;
            }
        } else if constexpr (static_schema::ObjectUnion<U>) {
            U chosen{};
            bool matched = false;
            if(!ParseUnion(chosen, *candidate, matched, ctx)) {
                return false;
            }
            if(matched) {
                field = std::move(chosen);
                return true;
            }
        } else {
            if(std::optional<U> v = static_schema::value_traits<U>::match(*candidate)) {
                field = std::move(*v);
                return true;
            }
        }

        // present but nil counts as missing for required fields
        if constexpr (!static_schema::NullableFieldValue<Field>
                      && !Opts::template has_option<options::detail::default_tag>) {
            if(candidate->isNil()) {
                return ctx.withError(MarshalError::MISSING_REQUIRED_FIELD, typeName, d.name, d.key, d.declaredType, raw);
            }
        }
    }
    return Rescue<Opts>(field, ctx, MarshalError::TYPE_MISMATCH, d, typeName, raw);
}


template <std::size_t I, class ObjT, std::size_t N>
bool ParseStructField(ObjT & obj, const Map & input, DeserializationContext & ctx, std::bitset<N> & found) {
    using FH   = struct_fields_helper::FieldsHelper<ObjT>;
    using Opts = options::detail::aggregate_field_opts_getter<ObjT, I>;
    static constexpr FieldDescriptor d = FH::descriptors[I];

    if constexpr (!d.readable()) {
        return true;
    } else {
        auto & field = fieldRef<ObjT, I>(obj);

        auto guard = ctx.getKeyGuard(d.key);
        bool ok;
        if(auto it = input.find(std::string(d.key)); it != input.end()) {
            found.set(I);
            ok = CoerceValue<Opts>(field, it->second, ctx, d, FH::typeName);
        } else {
            ok = Rescue<Opts>(field, ctx, MarshalError::MISSING_REQUIRED_FIELD, d, FH::typeName, Value{});
        }
        if(!ok) {
            return false;
        }

        if constexpr (d.presence) {
            fieldRef<ObjT, d.presenceIndex>(obj) = found.test(I);
        }
        return true;
    }
}


template <class ObjT>
bool CaptureUnmapped(ObjT & obj, const std::string & key, const Value & value, DeserializationContext & ctx) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    auto & store = fieldRef<ObjT, FH::unmappedStoreIndex>(obj);
    using V = typename std::remove_cvref_t<decltype(store)>::mapped_type;

    if constexpr (static_schema::is_optional_v<V>) {
        using Inner = typename V::value_type;
        static_assert(static_schema::LeafValue<Inner>, "[[[ MapFusion ]]] Unmapped<> value type must be a leaf value, a leaf union, or std::optional of a leaf value");
        std::optional<Inner> m = static_schema::value_traits<Inner>::match(value);
        store.insert_or_assign(key, m ? V(std::move(*m)) : V{});
        return true;
    } else {
        static_assert(static_schema::LeafValue<V>, "[[[ MapFusion ]]] Unmapped<> value type must be a leaf value, a leaf union, or std::optional of a leaf value");
        if(std::optional<V> m = static_schema::value_traits<V>::match(value)) {
            store.insert_or_assign(key, std::move(*m));
            return true;
        }
        if constexpr (std::same_as<V, Value>) {
            return true; // unreachable, Value matches anything
        } else if constexpr (static_schema::NullableFieldValue<V>) {
            // union with std::monostate: values fitting no alternative are kept as nil
            store.insert_or_assign(key, V{std::in_place_type<std::monostate>});
            return true;
        } else {
            auto guard = ctx.getKeyGuard(key);
            return ctx.withError(MarshalError::TYPE_MISMATCH, FH::typeName, key, key,
                                 static_schema::value_traits<V>::name, value);
        }
    }
}

template <class ObjT>
bool ApplyUnknownKeyPolicy(ObjT & obj, const Map::value_type & entry, DeserializationContext & ctx) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    if(FH::indexOfReadableKey(entry.first) != NOT_A_FIELD) {
        return true;
    }
    if constexpr (FH::policy == UnknownKeyPolicy::strict) {
        auto guard = ctx.getKeyGuard(entry.first);
        return ctx.withError(MarshalError::UNKNOWN_KEY, FH::typeName, entry.first, entry.first, {}, entry.second);
    } else if constexpr (FH::policy == UnknownKeyPolicy::unmapped) {
        return CaptureUnmapped(obj, entry.first, entry.second, ctx);
    } else {
        return true;
    }
}


template <class ObjT>
    requires static_schema::ReflectedObject<ObjT>
bool ParseObject(ObjT & obj, const Map & input, const EntryOrder * order, DeserializationContext & ctx) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    static_assert(FH::validate());

    std::bitset<FH::fieldsCount> found{};

    bool ok = [&]<std::size_t... I>(std::index_sequence<I...>) {
        return (ParseStructField<I>(obj, input, ctx, found) && ...);
    }(std::make_index_sequence<FH::fieldsCount>{});
    if(!ok) {
        return false;
    }

    if constexpr (FH::policy != UnknownKeyPolicy::ignore) {
        if(order != nullptr) {
            for(const Map::value_type * entry : *order) {
                if(!ApplyUnknownKeyPolicy(obj, *entry, ctx)) return false;
            }
        } else {
            for(const auto & entry : input) {
                if(!ApplyUnknownKeyPolicy(obj, entry, ctx)) return false;
            }
        }
    }
    return true;
}


// Reduces any KeyLike-keyed input to the canonical Map, remembering input order
template <MapLike M>
bool NormalizeInput(const M & input, Map & out, EntryOrder & order,
                    DeserializationContext & ctx, std::string_view typeName) {
    using K = std::remove_cvref_t<decltype(std::ranges::begin(input)->first)>;
    using V = std::remove_cvref_t<decltype(std::ranges::begin(input)->second)>;
    for(const auto & entry : input) {
        std::string key = KeyTraits<K>::to_key(entry.first);
        Value value;
        if constexpr (WideUnsigned<V>) {
            std::optional<Value> narrowed = value_from_unsigned(entry.second);
            if(!narrowed) {
                auto guard = ctx.getKeyGuard(key);
                return ctx.withError(MarshalError::TYPE_MISMATCH, typeName, key, key, "Int",
                                     Value(std::to_string(entry.second)));
            }
            value = std::move(*narrowed);
        } else {
            value = Value(entry.second);
        }
        auto [it, inserted] = out.try_emplace(std::move(key), value);
        if(!inserted) {
            auto guard = ctx.getKeyGuard(it->first);
            return ctx.withError(MarshalError::DUPLICATE_KEY, typeName, it->first, it->first, {}, std::move(value));
        }
        order.push_back(&*it);
    }
    return true;
}

template <class ObjT, MapLike M>
bool ParseInput(ObjT & staging, const M & input, DeserializationContext & ctx) {
    if constexpr (std::same_as<M, Map>) {
        return ParseObject(staging, input, nullptr, ctx);
    } else {
        Map normalized;
        EntryOrder order;
        if(!NormalizeInput(input, normalized, order, ctx, type_display_name<ObjT>())) {
            return false;
        }
        return ParseObject(staging, normalized, &order, ctx);
    }
}

} // namespace from_map_details


/// Builds a T from a map. All-or-nothing: the result holds either a fully
/// populated T or the first error encountered.
template <static_schema::MarshalableObject T, MapLike M>
FromMapResult<T> FromMap(const M & input) {
    from_map_details::DeserializationContext ctx;
    T staging{};
    if(!from_map_details::ParseInput(staging, input, ctx)) {
        return FromMapResult<T>(ctx.takeError());
    }
    return FromMapResult<T>(std::move(staging));
}

/// Same as FromMap<T>(input), assigning obj only on success
template <static_schema::MarshalableObject T, MapLike M>
FromMapResult<void> FromMap(T & obj, const M & input) {
    from_map_details::DeserializationContext ctx;
    T staging{};
    if(!from_map_details::ParseInput(staging, input, ctx)) {
        return FromMapResult<void>(ctx.takeError());
    }
    obj = std::move(staging);
    return {};
}

/// Entry point for an arbitrary value: anything but a map fails with NOT_A_MAP
template <static_schema::MarshalableObject T>
FromMapResult<T> FromValue(const Value & input) {
    if(const Map * m = input.getIf<Map>()) {
        return FromMap<T>(*m);
    }
    from_map_details::DeserializationContext ctx;
    ctx.withError(MarshalError::NOT_A_MAP, type_display_name<T>(), {}, {}, "Map", input);
    return FromMapResult<T>(ctx.takeError());
}


template <class T, class M>
    requires (!static_schema::MarshalableObject<T> || !MapLike<M>)
auto FromMap(const M &) {
    static_assert(static_schema::detail::always_false<T>::value,
                  "[[[ MapFusion ]]] FromMap<T>(input) requires a marshalable T (aggregate, StructMeta "
                  "registered or providing from_map/to_map) and a range of (KeyLike, Value-convertible) pairs");
}

} // namespace MapFusion
