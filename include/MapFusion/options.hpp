#pragma once
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <optional>
#include <memory>
#include "annotated.hpp"
#include "const_string.hpp"
#include "struct_introspection.hpp"

namespace MapFusion {


namespace options {



namespace detail {

struct key_tag{};
struct ignore_tag{};
struct ignore_on_read_tag{};
struct ignore_on_write_tag{};
struct default_tag{};
struct presence_tag{};
struct cast_tag{};

struct strict_tag{};
struct type_name_tag{};
}

template<ConstString Desc>
struct key {
    static_assert(Desc.check(), "[[[ MapFusion ]]] key contains control characters");
    using tag = detail::key_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "key";
    }
};

struct ignore {
    using tag = detail::ignore_tag;
    static constexpr std::string_view to_string() {
        return "ignore";
    }
};

struct ignore_on_read {
    using tag = detail::ignore_on_read_tag;
    static constexpr std::string_view to_string() {
        return "ignore_on_read";
    }
};

struct ignore_on_write {
    using tag = detail::ignore_on_write_tag;
    static constexpr std::string_view to_string() {
        return "ignore_on_write";
    }
};

// Absent key keeps whatever the C++ default member initializer produced
struct defaulted {
    using tag = detail::default_tag;
    static constexpr bool has_provider = false;
    static constexpr std::string_view to_string() {
        return "defaulted";
    }
};

// Absent key materializes Provider(), evaluated per construction
template<auto Provider>
struct default_from {
    using tag = detail::default_tag;
    static constexpr bool has_provider = true;
    static constexpr auto provider = Provider;
    static constexpr std::string_view to_string() {
        return "default_from";
    }
};

// Companion bool member set to whether the key was present (even when nil).
// Empty name means "<field name>_present".
template<ConstString Flag = "">
struct presence {
    using tag = detail::presence_tag;
    static constexpr auto flag = Flag;
    static constexpr std::string_view to_string() {
        return "presence";
    }
};

// Named cast applied to the raw value: "to_i", "to_f", "to_s", "to_b"
template<ConstString Name>
struct cast {
    using tag = detail::cast_tag;
    static constexpr bool is_named = true;
    static constexpr auto name = Name;
    static constexpr std::string_view to_string() {
        return "cast";
    }
};

// Callable cast: Fn(const Value&) -> V or std::optional<V>, V convertible to Value.
// An empty optional is a failed cast.
template<auto Fn>
struct cast_fn {
    using tag = detail::cast_tag;
    static constexpr bool is_named = false;
    static constexpr auto fn = Fn;
    static constexpr std::string_view to_string() {
        return "cast_fn";
    }
};

// Type option: keys without a field fail construction
struct strict {
    using tag = detail::strict_tag;
    static constexpr std::string_view to_string() {
        return "strict";
    }
};

// Type option: name reported in error messages
template<ConstString Desc>
struct type_name {
    using tag = detail::type_name_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "type_name";
    }
};

namespace detail {


template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};


// === find_option_by_tag ===

template<class Tag, class... Opts>
struct find_option_by_tag;

// Base case: no options -> void
template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

// Recursive case: check First::tag (if present), otherwise continue
template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
private:
    using next = typename find_option_by_tag<Tag, Rest...>::type;

public:
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        next
        >;
};

struct no_options {
    template<class Tag>
    static constexpr bool has_option = false;

    template<class Tag>
    using get_option = void;
};

template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {

    template<class Tag>
    using option_type = typename detail::find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<option_type<Tag>>;

    template<class Tag>
    using get_option = option_type<Tag>;

};



template<class T>
struct is_options_pack : std::false_type {};

template<class... Opts>
struct is_options_pack<OptionsPack<Opts...>> : std::true_type {};

template<class T>
inline constexpr bool is_options_pack_v = is_options_pack<T>::value;


template<class T, class = void>
struct has_annotation_specialization_impl : std::false_type {};

template<class T>
struct has_annotation_specialization_impl<T,
                                          std::void_t<typename Annotated<T>::Options>
                                          > : std::bool_constant<
                                                                 is_options_pack_v<typename Annotated<T>::Options>
                                                                    && (Annotated<T>::Options::Count > 0)
                                                                 > {};

template<class T>
inline constexpr bool has_annotation_specialization =
    has_annotation_specialization_impl<T>::value;

template<class Field>
struct annotation_meta{};

// Base: non-annotated
template<class T>
    requires (!has_annotation_specialization<T>)
struct annotation_meta<T> {
    using value_t = T;
    using options      = no_options;
    using OptionsP = OptionsPack<>;
    static constexpr decltype(auto) getRef(T & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }
};

template<class T, class... Opts>
struct annotation_meta<std::optional<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ MapFusion ]]] Use Annotated<std::optional<T>, ...> instead of std::optional<Annotated<T, ...>>");
};


template <class P1, class P2> struct merge_options;
template <class ... Opts1, class ... Opts2> struct merge_options<OptionsPack<Opts1...>, OptionsPack<Opts2...>> {
    using type = OptionsPack<Opts1..., Opts2...>;
};


// Annotated<T, Opts...>
template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using OptionsP = OptionsPack<Opts...>;

    using value_t = T;
    using options      = field_options<
        OptionsPack<Opts...>
        >;

    static constexpr decltype(auto) getRef(Annotated<T, Opts...> & f) {
        return (f.value);
    }
    static constexpr decltype(auto) getRef(const Annotated<T, Opts...> & f) {
        return (f.value);
    }

    // StructMeta-registered fields: options are virtual, the member is a bare T
    static constexpr decltype(auto) getRef(T & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }
};



// Externally Annotated<T>
template<class T> requires has_annotation_specialization<T>
struct annotation_meta<T> {
    using value_t = T;
    using options      = field_options<typename Annotated<T>::Options>;

    using OptionsP = Annotated<T>::Options;

    static constexpr decltype(auto) getRef(T & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }

};

// Entry point with decay
template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};



template<class T, std::size_t I, class = void>
struct has_field_annotation_specialization_impl : std::false_type {
    using Options = OptionsPack<>;
};

template<class T, std::size_t I>
struct has_field_annotation_specialization_impl<T, I,
                                          std::void_t<typename AnnotatedField<T, I>::Options>
                                          > : std::bool_constant<
                                                  is_options_pack_v<typename AnnotatedField<T, I>::Options>
                                                  && (AnnotatedField<T, I>::Options::Count > 0)
                                                  > {
    using Options = AnnotatedField<T, I>::Options;
};

// Field options = external AnnotatedField<T, I> options + Annotated<> wrapper options.
// Type-level options of the field's own type (strict, type_name) stay with that type.
template<class AggregateT, std::size_t Index>
struct aggregate_field_opts {
    using Field   = introspection::structureElementTypeByIndex<Index, AggregateT>;
    using FieldOptionsP = std::conditional_t<has_annotation_specialization<std::remove_cvref_t<Field>>,
                                             OptionsPack<>,
                                             typename annotation_meta_getter<Field>::OptionsP>;
    using ExternalOpts = typename has_field_annotation_specialization_impl<AggregateT, Index>::Options;
    using options      = field_options<
        typename merge_options<ExternalOpts, FieldOptionsP>::type
    >;
};

template<class AggregateT, std::size_t Index>
using aggregate_field_opts_getter =  aggregate_field_opts<std::remove_cvref_t<AggregateT>, Index>::options;

// Options attached to a marshalable type itself
template<class T>
using type_opts_getter = annotation_meta_getter<T>::options;


} // namespace detail


} //namespace options


} // namespace MapFusion
