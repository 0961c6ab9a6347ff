#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

#include "static_schema.hpp"
#include "options.hpp"
#include "casts.hpp"
#include "errors.hpp"
#include "type_name.hpp"
#include "struct_introspection.hpp"

namespace MapFusion {

enum class FieldRole : std::uint8_t {
    data,           // bound to a map key
    presence_flag,  // companion bool of a presence-tracked field
    unmapped_store  // Unmapped<V> capture of leftover keys
};

enum class UnknownKeyPolicy : std::uint8_t {
    ignore,
    strict,
    unmapped
};

constexpr std::size_t NOT_A_FIELD = static_cast<std::size_t>(-1);

struct FieldDescriptor {
    std::string_view name;
    std::string_view key;
    std::string_view declaredType;   // nilability stripped
    std::size_t      index         = NOT_A_FIELD;
    FieldRole        role          = FieldRole::data;
    bool             nilable       = false;
    bool             hasDefault    = false;
    bool             presence      = false;
    std::size_t      presenceIndex = NOT_A_FIELD;
    bool             hasCast       = false;
    bool             ignore        = false;
    bool             ignoreOnRead  = false;
    bool             ignoreOnWrite = false;
    bool             nested        = false;

    constexpr bool readable() const {
        return role == FieldRole::data && !ignore && !ignoreOnRead;
    }
    constexpr bool writable() const {
        return role == FieldRole::data && !ignore && !ignoreOnWrite;
    }
};

/// Name reported in errors: the type_name option, else the compiler's name for T
template<class T>
consteval std::string_view type_display_name() {
    using TypeOpts = options::detail::type_opts_getter<T>;
    if constexpr (TypeOpts::template has_option<options::detail::type_name_tag>) {
        return TypeOpts::template get_option<options::detail::type_name_tag>::desc.toStringView();
    } else {
        return MapFusion::type_name<T>();
    }
}

namespace struct_fields_helper {

template<class T, std::size_t I>
using FieldOpts = options::detail::aggregate_field_opts_getter<T, I>;

template<class T, std::size_t I>
using FieldValueT = static_schema::AnnotatedValue<introspection::structureElementTypeByIndex<I, T>>;

template<class T, std::size_t I>
consteval std::string_view fieldName() {
    return introspection::structureElementNameByIndex<I, T>;
}

template<class T, std::size_t I>
consteval std::string_view fieldKey() {
    using Opts    = FieldOpts<T, I>;
    if constexpr (Opts::template has_option<options::detail::key_tag>) {
        using KeyOpt = typename Opts::template get_option<options::detail::key_tag>;
        return KeyOpt::desc.toStringView();
    } else {
        return fieldName<T, I>();
    }
}

template<class T, std::size_t I>
consteval bool fieldIsUnmappedStore() {
    return is_unmapped_v<FieldValueT<T, I>>;
}

// Does field J carry the presence flag of field I?
template<class T, std::size_t I, std::size_t J>
consteval bool isPresenceFlagOf() {
    using Opts = FieldOpts<T, I>;
    if constexpr (!Opts::template has_option<options::detail::presence_tag> || I == J) {
        return false;
    } else {
        using PresenceOpt = typename Opts::template get_option<options::detail::presence_tag>;
        constexpr std::string_view candidate = fieldName<T, J>();
        if constexpr (PresenceOpt::flag.empty()) {
            constexpr std::string_view owner = fieldName<T, I>();
            constexpr std::string_view suffix = "_present";
            return candidate.size() == owner.size() + suffix.size()
                && candidate.starts_with(owner)
                && candidate.ends_with(suffix);
        } else {
            return candidate == PresenceOpt::flag.toStringView();
        }
    }
}


template<class T>
struct FieldsHelper {
    static constexpr std::size_t fieldsCount = introspection::structureElementsCount<T>;

    using TypeOpts = options::detail::type_opts_getter<T>;

    static constexpr std::string_view typeName = type_display_name<T>();

    template<std::size_t I>
    static consteval std::size_t presenceIndex() {
        std::size_t found = NOT_A_FIELD;
        [&]<std::size_t... J>(std::index_sequence<J...>) consteval {
            ((isPresenceFlagOf<T, I, J>() && found == NOT_A_FIELD ? (found = J, 0) : 0), ...);
        }(std::make_index_sequence<fieldsCount>{});
        return found;
    }

    template<std::size_t J>
    static consteval bool fieldIsPresenceFlag() {
        return []<std::size_t... I>(std::index_sequence<I...>) consteval {
            return (isPresenceFlagOf<T, I, J>() || ...);
        }(std::make_index_sequence<fieldsCount>{});
    }

    template<std::size_t I>
    static consteval FieldDescriptor describe() {
        using Opts = FieldOpts<T, I>;
        using V    = FieldValueT<T, I>;

        FieldDescriptor d;
        d.name  = fieldName<T, I>();
        d.key   = fieldKey<T, I>();
        d.index = I;

        if constexpr (fieldIsUnmappedStore<T, I>()) {
            d.role   = FieldRole::unmapped_store;
            d.ignore = true;
            return d;
        } else if constexpr (fieldIsPresenceFlag<I>()) {
            d.role   = FieldRole::presence_flag;
            d.ignore = true;
            return d;
        } else {
            d.ignore        = Opts::template has_option<options::detail::ignore_tag>;
            d.ignoreOnRead  = Opts::template has_option<options::detail::ignore_on_read_tag>;
            d.ignoreOnWrite = Opts::template has_option<options::detail::ignore_on_write_tag>;
            d.hasDefault    = Opts::template has_option<options::detail::default_tag>;
            d.hasCast       = Opts::template has_option<options::detail::cast_tag>;
            d.presence      = Opts::template has_option<options::detail::presence_tag>;
            if (d.presence) {
                d.presenceIndex = presenceIndex<I>();
            }
            if constexpr (static_schema::FieldValue<V>) {
                d.nilable      = static_schema::NullableFieldValue<V>;
                d.declaredType = static_schema::expected_type_name<V>();
                d.nested       = static_schema::MarshalableObject<static_schema::strip_nullable_t<V>>
                                 || static_schema::ObjectUnion<static_schema::strip_nullable_t<V>>;
            }
            return d;
        }
    }

    static constexpr std::array<FieldDescriptor, fieldsCount> descriptors =
        []<std::size_t... I>(std::index_sequence<I...>) consteval {
            return std::array<FieldDescriptor, fieldsCount>{ describe<I>()... };
        }(std::make_index_sequence<fieldsCount>{});

    static constexpr std::size_t unmappedStoreCount = []() consteval {
        std::size_t n = 0;
        for(const auto & d : descriptors) {
            if(d.role == FieldRole::unmapped_store) n ++;
        }
        return n;
    }();

    static constexpr std::size_t unmappedStoreIndex = []() consteval {
        for(const auto & d : descriptors) {
            if(d.role == FieldRole::unmapped_store) return d.index;
        }
        return NOT_A_FIELD;
    }();

    static constexpr bool isStrict = TypeOpts::template has_option<options::detail::strict_tag>;

    static constexpr UnknownKeyPolicy policy =
        isStrict ? UnknownKeyPolicy::strict
                 : (unmappedStoreCount > 0 ? UnknownKeyPolicy::unmapped : UnknownKeyPolicy::ignore);

    template<std::size_t I>
    static consteval bool castIsResolvable() {
        using Opts = FieldOpts<T, I>;
        if constexpr (Opts::template has_option<options::detail::cast_tag>) {
            return casts::is_resolvable<typename Opts::template get_option<options::detail::cast_tag>>();
        } else {
            return true;
        }
    }

    static constexpr bool castsAreResolvable = []<std::size_t... I>(std::index_sequence<I...>) consteval {
        return (castIsResolvable<I>() && ...);
    }(std::make_index_sequence<fieldsCount>{});

    template<std::size_t I>
    static consteval bool presenceFlagIsBool() {
        constexpr FieldDescriptor d = descriptors[I];
        if constexpr (d.presence && d.presenceIndex != NOT_A_FIELD) {
            return std::is_same_v<FieldValueT<T, d.presenceIndex>, bool>;
        } else {
            return true;
        }
    }

    static constexpr bool presenceFlagsAreBool = []<std::size_t... I>(std::index_sequence<I...>) consteval {
        return (presenceFlagIsBool<I>() && ...);
    }(std::make_index_sequence<fieldsCount>{});

    static constexpr bool presenceFlagsExist = []() consteval {
        for(const auto & d : descriptors) {
            if(d.presence && d.presenceIndex == NOT_A_FIELD) return false;
        }
        return true;
    }();

    static constexpr bool keysAreUnique = []() consteval {
        std::array<std::string_view, fieldsCount> keys{};
        std::size_t n = 0;
        for(const auto & d : descriptors) {
            if(d.role == FieldRole::data && !d.ignore) keys[n++] = d.key;
        }
        std::sort(keys.begin(), keys.begin() + n);
        return std::adjacent_find(keys.begin(), keys.begin() + n) == keys.begin() + n;
    }();

    static constexpr SchemaConfigError configError = []() consteval {
        if(unmappedStoreCount > 1 || (unmappedStoreCount == 1 && isStrict)) {
            return SchemaConfigError::conflicting_unknown_key_policies;
        }
        if(!castsAreResolvable) {
            return SchemaConfigError::unresolved_cast;
        }
        if(!presenceFlagsExist) {
            return SchemaConfigError::missing_presence_field;
        }
        if(!presenceFlagsAreBool) {
            return SchemaConfigError::presence_field_not_bool;
        }
        if(!keysAreUnique) {
            return SchemaConfigError::duplicate_key;
        }
        return SchemaConfigError::none;
    }();

    template<std::size_t I>
    static consteval bool fieldTypeIsSupported() {
        constexpr FieldDescriptor d = descriptors[I];
        if constexpr (d.role != FieldRole::data || d.ignore) {
            return true;
        } else {
            return static_schema::FieldValue<FieldValueT<T, I>>;
        }
    }

    static constexpr bool fieldTypesAreSupported = []<std::size_t... I>(std::index_sequence<I...>) consteval {
        return (fieldTypeIsSupported<I>() && ...);
    }(std::make_index_sequence<fieldsCount>{});

    // Keys consulted while constructing; everything else is a leftover
    static constexpr std::size_t indexOfReadableKey(std::string_view key) {
        for(const auto & d : descriptors) {
            if(d.readable() && d.key == key) return d.index;
        }
        return NOT_A_FIELD;
    }

    static constexpr bool validate() {
        static_assert(fieldTypesAreSupported,
                      "[[[ MapFusion ]]] A field type is not marshalable. "
                      "See the FieldValue concept for supported types");
        static_assert(configError != SchemaConfigError::duplicate_key,
                      "[[[ MapFusion ]]] Two fields bind to the same map key");
        static_assert(configError != SchemaConfigError::conflicting_unknown_key_policies,
                      "[[[ MapFusion ]]] strict and Unmapped<> cannot be combined, and only one Unmapped<> member is allowed");
        static_assert(configError != SchemaConfigError::unresolved_cast,
                      "[[[ MapFusion ]]] Cast option names an unknown cast or a callable not taking const Value&");
        static_assert(configError != SchemaConfigError::missing_presence_field,
                      "[[[ MapFusion ]]] presence<> option without a matching companion member");
        static_assert(configError != SchemaConfigError::presence_field_not_bool,
                      "[[[ MapFusion ]]] presence<> companion member must be bool");
        return true;
    }
};
}

/// Field table of a marshalable type, built once at compile time
template<class T>
constexpr const std::array<FieldDescriptor, struct_fields_helper::FieldsHelper<T>::fieldsCount> & field_descriptors() {
    return struct_fields_helper::FieldsHelper<T>::descriptors;
}

template<class T>
inline constexpr SchemaConfigError schema_config_error = struct_fields_helper::FieldsHelper<T>::configError;

template<class T>
inline constexpr UnknownKeyPolicy unknown_key_policy = struct_fields_helper::FieldsHelper<T>::policy;

}
