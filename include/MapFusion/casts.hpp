#pragma once

#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include "value.hpp"
#include "options.hpp"

namespace MapFusion {

namespace casts {

enum class NamedCast : std::uint8_t {
    to_i,
    to_f,
    to_s,
    to_b,
    unresolved
};

constexpr NamedCast find_named_cast(std::string_view name) {
    if(name == "to_i") return NamedCast::to_i;
    if(name == "to_f") return NamedCast::to_f;
    if(name == "to_s") return NamedCast::to_s;
    if(name == "to_b") return NamedCast::to_b;
    return NamedCast::unresolved;
}

// from_chars takes no '+'; one leading '+' is dropped, a second sign rejected
inline bool strip_plus_sign(std::string_view & s) {
    if(s.empty() || s.front() != '+') return true;
    s.remove_prefix(1);
    return s.empty() || (s.front() != '-' && s.front() != '+');
}

inline std::optional<Value> to_i(const Value & v) {
    switch(v.kind()) {
    case ValueKind::INT:
        return v;
    case ValueKind::FLOAT: {
        double d = std::trunc(v.asFloat());
        if(!std::isfinite(d)
            || d < static_cast<double>(std::numeric_limits<std::int64_t>::min())
            || d >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return Value(static_cast<std::int64_t>(d));
    }
    case ValueKind::STRING: {
        std::string_view s = v.asString();
        if(!strip_plus_sign(s)) return std::nullopt;
        std::int64_t out = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
        if(ec != std::errc{} || ptr != s.data() + s.size() || s.empty()) return std::nullopt;
        return Value(out);
    }
    default:
        return std::nullopt;
    }
}

inline std::optional<Value> to_f(const Value & v) {
    switch(v.kind()) {
    case ValueKind::FLOAT:
        return v;
    case ValueKind::INT:
        return Value(static_cast<double>(v.asInt()));
    case ValueKind::STRING: {
        std::string_view s = v.asString();
        if(!strip_plus_sign(s)) return std::nullopt;
        double out = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
        if(ec != std::errc{} || ptr != s.data() + s.size() || s.empty()) return std::nullopt;
        return Value(out);
    }
    default:
        return std::nullopt;
    }
}

inline std::optional<Value> to_s(const Value & v) {
    switch(v.kind()) {
    case ValueKind::NIL:
        return Value(std::string{});
    case ValueKind::BOOL:
        return Value(std::string(v.asBool() ? "true" : "false"));
    case ValueKind::INT:
        return Value(std::to_string(v.asInt()));
    case ValueKind::FLOAT: {
        char buf[32];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v.asFloat());
        if(ec != std::errc{}) return std::nullopt;
        return Value(std::string(buf, ptr));
    }
    case ValueKind::STRING:
        return v;
    case ValueKind::TIMESTAMP:
        return Value(timestamp_to_string(v.asTimestamp()));
    default:
        return Value(to_string(v));
    }
}

inline std::optional<Value> to_b(const Value & v) {
    switch(v.kind()) {
    case ValueKind::BOOL:
        return v;
    case ValueKind::INT:
        return Value(v.asInt() != 0);
    case ValueKind::STRING:
        if(v.asString() == "true") return Value(true);
        if(v.asString() == "false") return Value(false);
        return std::nullopt;
    default:
        return std::nullopt;
    }
}

namespace detail {

template<class R>
std::optional<Value> to_cast_value(R r) {
    if constexpr (WideUnsigned<R>) {
        return value_from_unsigned(r);
    } else {
        return Value(std::move(r));
    }
}

template<class R>
struct cast_result {
    static std::optional<Value> wrap(R r) {
        return to_cast_value(std::move(r));
    }
};

template<class U>
struct cast_result<std::optional<U>> {
    static std::optional<Value> wrap(std::optional<U> r) {
        if(!r) return std::nullopt;
        return to_cast_value(std::move(*r));
    }
};

}

// Runs a field's cast option on the raw value; empty result means the cast failed
template<class CastOpt>
std::optional<Value> apply(const Value & raw) {
    if constexpr (CastOpt::is_named) {
        constexpr NamedCast which = find_named_cast(CastOpt::name.toStringView());
        static_assert(which != NamedCast::unresolved, "[[[ MapFusion ]]] Unknown named cast");
        if constexpr (which == NamedCast::to_i) {
            return to_i(raw);
        } else if constexpr (which == NamedCast::to_f) {
            return to_f(raw);
        } else if constexpr (which == NamedCast::to_s) {
            return to_s(raw);
        } else {
            return to_b(raw);
        }
    } else {
        using R = std::remove_cvref_t<decltype(CastOpt::fn(raw))>;
        return detail::cast_result<R>::wrap(CastOpt::fn(raw));
    }
}

template<class CastOpt>
constexpr bool is_resolvable() {
    if constexpr (CastOpt::is_named) {
        return find_named_cast(CastOpt::name.toStringView()) != NamedCast::unresolved;
    } else {
        return std::is_invocable_v<decltype(CastOpt::fn), const Value &>;
    }
}

} // namespace casts

} // namespace MapFusion
