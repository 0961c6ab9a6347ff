#pragma once

#include <cstddef>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

#include "const_string.hpp"
#include "annotated.hpp"

namespace MapFusion {

// Explicit field registration, for types PFR cannot enumerate (non-aggregates,
// private members) or when field names should not come from the member names:
//
//   template<> struct MapFusion::StructMeta<Point> {
//       using Fields = StructFields<
//           Field<&Point::x_, "x">,
//           Field<&Point::y_, "y", options::defaulted>
//       >;
//   };
template <class ... Flds>
struct StructMeta {};

template <auto MPtr, ConstString name, class ... Opts>
struct Field;

template <typename C, typename T, T C::*MPtr, ConstString name, class ... Opts>
struct Field<MPtr, name, Opts...> {
    using ClassT   = C;
    using ValueT   = T;
    using OptionsP = OptionsPack<Opts...>;
    static constexpr ConstString Name    = name;
    static constexpr T C::*      MemberP = MPtr;
};

template <class ... F>
struct StructFields {
    using FieldsTuple = std::tuple<F...>;
};


namespace introspection {

namespace detail {

template<class T>
struct is_struct_fields : std::false_type {};

template<class... F>
struct is_struct_fields<StructFields<F...>> : std::true_type {};

template<class T, class = void>
struct is_registered : std::false_type {};

template<class T>
struct is_registered<T, std::void_t<typename StructMeta<T>::Fields>>
    : is_struct_fields<typename StructMeta<T>::Fields> {};


// Options of a registered field, presented as the Annotated<> wrapper a
// member declaration would have used
template <class T, class OptPack> struct as_annotated;
template <class T, class ...Opts> struct as_annotated<T, OptionsPack<Opts...>> {
    using type = Annotated<T, Opts...>;
};
template <class T> struct as_annotated<T, OptionsPack<>> {
    using type = T;
};


// Aggregates: members in declaration order, names from PFR
template<class StructT>
struct PfrFieldSource {
    static constexpr std::size_t count = pfr::tuple_size_v<StructT>;

    template<std::size_t I>
    using element_type = pfr::tuple_element_t<I, StructT>;

    template<std::size_t I>
    static constexpr std::string_view name = pfr::get_name<I, StructT>();

    template<std::size_t I, class Obj>
    static constexpr decltype(auto) element(Obj & s) {
        return (pfr::get<I>(s));
    }
};

// StructMeta<T>: members and names as registered, bare members in storage
template<class StructT>
struct RegisteredFieldSource {
    using Fields = typename StructMeta<StructT>::Fields::FieldsTuple;

    template<std::size_t I>
    using FieldAt = std::tuple_element_t<I, Fields>;

    static constexpr std::size_t count = std::tuple_size_v<Fields>;

    template<std::size_t I>
    using element_type = typename as_annotated<typename FieldAt<I>::ValueT,
                                               typename FieldAt<I>::OptionsP>::type;

    template<std::size_t I>
    static constexpr std::string_view name = FieldAt<I>::Name.toStringView();

    template<std::size_t I, class Obj>
    static constexpr decltype(auto) element(Obj & s) {
        return (s.*(FieldAt<I>::MemberP));
    }
};

template<class T>
using FieldSource = std::conditional_t<is_registered<T>::value,
                                       RegisteredFieldSource<T>,
                                       PfrFieldSource<T>>;

} // namespace detail


template<class T>
inline constexpr bool has_struct_meta_specialization =
    detail::is_registered<std::remove_cv_t<T>>::value;

template<class StructT>
inline constexpr std::size_t structureElementsCount = detail::FieldSource<std::remove_cv_t<StructT>>::count;

// Declared type of field Index: Annotated<> when options are attached
template<std::size_t Index, class StructT>
using structureElementTypeByIndex =
    typename detail::FieldSource<std::remove_cv_t<StructT>>::template element_type<Index>;

template<std::size_t Index, class StructT>
inline constexpr std::string_view structureElementNameByIndex =
    detail::FieldSource<std::remove_cv_t<StructT>>::template name<Index>;

// Reference to the stored member (the wrapper itself for Annotated<> members)
template<std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(StructT & s) {
    return (detail::FieldSource<std::remove_cv_t<StructT>>::template element<Index>(s));
}

} // namespace introspection
} // namespace MapFusion
