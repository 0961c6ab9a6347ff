#pragma once

#include <string_view>

namespace MapFusion {
namespace type_name_detail {

template <class T>
constexpr std::string_view raw() {
#if defined(__clang__) || defined(__GNUC__)
    return __PRETTY_FUNCTION__;
#elif defined(_MSC_VER)
    return __FUNCSIG__;
#else
    return "";
#endif
}

// GCC:   "constexpr std::string_view MapFusion::type_name_detail::raw() [with T = House; std::string_view = ...]"
// Clang: "std::string_view MapFusion::type_name_detail::raw() [T = House]"
// MSVC:  "... MapFusion::type_name_detail::raw<struct House>(void)"
constexpr std::string_view extract(std::string_view fn) {
#if defined(__clang__) || defined(__GNUC__)
    constexpr std::string_view marker = "T = ";
    auto b = fn.find(marker);
    if(b == std::string_view::npos) return "?";
    b += marker.size();
    std::size_t depth = 0;
    std::size_t e = b;
    for(; e < fn.size(); e ++) {
        char c = fn[e];
        if(c == '<' || c == '(' || c == '[') depth ++;
        else if(depth > 0 && (c == '>' || c == ')' || c == ']')) depth --;
        else if(depth == 0 && (c == ';' || c == ']')) break;
    }
    return fn.substr(b, e - b);
#elif defined(_MSC_VER)
    auto b = fn.find("raw<");
    if(b == std::string_view::npos) return "?";
    b += 4;
    auto e = fn.rfind(">(void)");
    std::string_view s = fn.substr(b, e - b);
    for(std::string_view prefix : {std::string_view("struct "), std::string_view("class ")}) {
        if(s.starts_with(prefix)) s.remove_prefix(prefix.size());
    }
    return s;
#else
    return fn;
#endif
}

} // namespace type_name_detail

/// Compiler-derived name of T, e.g. "House" or "app::Config"
template <class T>
constexpr std::string_view type_name() {
    return type_name_detail::extract(type_name_detail::raw<T>());
}

} // namespace MapFusion
