#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "static_schema.hpp"
#include "options.hpp"
#include "unmapped.hpp"
#include "struct_introspection.hpp"
#include "struct_fields_helper.hpp"

namespace MapFusion {

namespace serializer_details {

template<class StructT, std::size_t StructIndex>
using StructFieldMeta = options::detail::annotation_meta_getter<
    introspection::structureElementTypeByIndex<StructIndex, StructT>
>;

template<class StructT, std::size_t StructIndex>
decltype(auto) fieldRef(const StructT & obj) {
    return StructFieldMeta<StructT, StructIndex>::getRef(
        introspection::getStructElementByIndex<StructIndex>(obj));
}


template <class ObjT>
    requires static_schema::ReflectedObject<ObjT>
Map SerializeObject(const ObjT & obj);

template <class ObjT>
    requires static_schema::CustomMarshalable<ObjT>
Map SerializeObject(const ObjT & obj) {
    return obj.to_map();
}


template <static_schema::FieldValue Field>
Value SerializeValue(const Field & field) {
    if constexpr (std::same_as<Field, Value>) {
        return field;
    } else if constexpr (static_schema::is_optional_v<Field>) {
        if(!field.has_value()) {
            return Value{};
        }
        return SerializeValue(*field);
    } else if constexpr (static_schema::is_variant_v<Field>) {
        return std::visit([](const auto & alt) -> Value {
            using A = std::remove_cvref_t<decltype(alt)>;
            if constexpr (std::same_as<A, std::monostate>) {
                return Value{};
            } else {
                return SerializeValue(alt);
            }
        }, field);
    } else if constexpr (static_schema::MarshalableObject<Field>) {
        return Value(SerializeObject(field));
    } else {
        return static_schema::value_traits<Field>::to_value(field);
    }
}


template <std::size_t I, class ObjT>
void SerializeStructField(const ObjT & obj, Map & out) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    static constexpr FieldDescriptor d = FH::descriptors[I];

    if constexpr (d.writable()) {
        out.insert_or_assign(std::string(d.key), SerializeValue(fieldRef<ObjT, I>(obj)));
    }
}

// Captured keys go back in; declared keys win on collision
template <class ObjT>
void MergeUnmapped(const ObjT & obj, Map & out) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    const auto & store = fieldRef<ObjT, FH::unmappedStoreIndex>(obj);
    for(const auto & [key, v] : store) {
        out.try_emplace(key, SerializeValue(v));
    }
}

template <class ObjT>
    requires static_schema::ReflectedObject<ObjT>
Map SerializeObject(const ObjT & obj) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    static_assert(FH::validate());

    Map out;
    [&]<std::size_t... I>(std::index_sequence<I...>) {
        (SerializeStructField<I>(obj, out), ...);
    }(std::make_index_sequence<FH::fieldsCount>{});

    if constexpr (FH::policy == UnknownKeyPolicy::unmapped) {
        MergeUnmapped(obj, out);
    }
    return out;
}

} // namespace serializer_details


/// Exports every writable field under its key, nested objects as sub-maps,
/// empty optionals as nil, plus any captured unmapped keys.
template <static_schema::MarshalableObject T>
Map ToMap(const T & obj) {
    return serializer_details::SerializeObject(obj);
}

template <static_schema::MarshalableObject T>
Value ToValue(const T & obj) {
    return Value(ToMap(obj));
}


template <class T>
    requires (!static_schema::MarshalableObject<T>)
auto ToMap(const T &) {
    static_assert(static_schema::detail::always_false<T>::value,
                  "[[[ MapFusion ]]] ToMap(obj) requires a marshalable type (aggregate, StructMeta "
                  "registered or providing from_map/to_map)");
}

} // namespace MapFusion
