#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace MapFusion {

struct Value;

using Map       = std::map<std::string, Value>;
using Array     = std::vector<Value>;
using Timestamp = std::chrono::system_clock::time_point;
using Nil       = std::nullptr_t;

enum class ValueKind : std::uint8_t {
    NIL,
    BOOL,
    INT,
    FLOAT,
    STRING,
    TIMESTAMP,
    ARRAY,
    MAP
};

constexpr std::string_view kind_to_string(ValueKind k) {
    switch(k) {
    case ValueKind::NIL: return "Nil"; break;
    case ValueKind::BOOL: return "Bool"; break;
    case ValueKind::INT: return "Int"; break;
    case ValueKind::FLOAT: return "Float"; break;
    case ValueKind::STRING: return "String"; break;
    case ValueKind::TIMESTAMP: return "Timestamp"; break;
    case ValueKind::ARRAY: return "Array"; break;
    case ValueKind::MAP: return "Map"; break;
    }
    return "N/A";
}

// Integers the int64 storage holds without loss
template<class I>
concept StorableInt = std::is_integral_v<I> && !std::is_same_v<I, bool>
    && (std::is_signed_v<I> || sizeof(I) < sizeof(std::int64_t));

// Unsigned integers at least as wide as the storage; they fit only when in range
template<class I>
concept WideUnsigned = std::is_integral_v<I> && !std::is_same_v<I, bool>
    && std::is_unsigned_v<I> && sizeof(I) >= sizeof(std::int64_t);

/// The closed set of value kinds a map can hold. The alternative order
/// matches ValueKind.
struct Value {
    using Storage = std::variant<Nil, bool, std::int64_t, double, std::string, Timestamp, Array, Map>;
    Storage storage{nullptr};

    Value() = default;
    Value(Nil) {}
    Value(bool b) : storage(b) {}

    template<StorableInt I>
    Value(I i) : storage(static_cast<std::int64_t>(i)) {}

    template<class F>
        requires std::is_floating_point_v<F>
    Value(F f) : storage(static_cast<double>(f)) {}

    Value(const char* s) : storage(std::string(s)) {}
    Value(std::string_view s) : storage(std::string(s)) {}
    Value(std::string s) : storage(std::move(s)) {}
    Value(Timestamp t) : storage(t) {}
    Value(Array a) : storage(std::move(a)) {}
    Value(Map m) : storage(std::move(m)) {}

    ValueKind kind() const noexcept { return static_cast<ValueKind>(storage.index()); }

    bool isNil() const noexcept       { return kind() == ValueKind::NIL; }
    bool isBool() const noexcept      { return kind() == ValueKind::BOOL; }
    bool isInt() const noexcept       { return kind() == ValueKind::INT; }
    bool isFloat() const noexcept     { return kind() == ValueKind::FLOAT; }
    bool isString() const noexcept    { return kind() == ValueKind::STRING; }
    bool isTimestamp() const noexcept { return kind() == ValueKind::TIMESTAMP; }
    bool isArray() const noexcept     { return kind() == ValueKind::ARRAY; }
    bool isMap() const noexcept       { return kind() == ValueKind::MAP; }

    template<class T>
    const T* getIf() const noexcept { return std::get_if<T>(&storage); }
    template<class T>
    T* getIf() noexcept { return std::get_if<T>(&storage); }

    bool asBool() const                       { return std::get<bool>(storage); }
    std::int64_t asInt() const                { return std::get<std::int64_t>(storage); }
    double asFloat() const                    { return std::get<double>(storage); }
    const std::string& asString() const       { return std::get<std::string>(storage); }
    Timestamp asTimestamp() const             { return std::get<Timestamp>(storage); }
    const Array& asArray() const              { return std::get<Array>(storage); }
    const Map& asMap() const                  { return std::get<Map>(storage); }
    Map& asMap()                              { return std::get<Map>(storage); }

    template<class Visitor>
    decltype(auto) visit(Visitor&& v) const {
        return std::visit(std::forward<Visitor>(v), storage);
    }

    friend bool operator==(const Value& a, const Value& b) {
        return a.storage == b.storage;
    }
};

inline std::string timestamp_to_string(Timestamp t);

/// Wide unsigned integers above the int64 range have no Value
template<WideUnsigned U>
std::optional<Value> value_from_unsigned(U u) {
    if(!std::in_range<std::int64_t>(u)) return std::nullopt;
    return Value(static_cast<std::int64_t>(u));
}

namespace value_detail {

inline std::string two_digits(unsigned v) {
    std::string s = std::to_string(v);
    return s.size() < 2 ? "0" + s : s;
}

inline void render(const Value& v, std::string& out);

inline void render_string(const std::string& s, std::string& out) {
    out += '"';
    for(char c : s) {
        switch(c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        default: out += c;
        }
    }
    out += '"';
}

inline void render(const Value& v, std::string& out) {
    switch(v.kind()) {
    case ValueKind::NIL:
        out += "nil";
        break;
    case ValueKind::BOOL:
        out += v.asBool() ? "true" : "false";
        break;
    case ValueKind::INT:
        out += std::to_string(v.asInt());
        break;
    case ValueKind::FLOAT:
        out += std::to_string(v.asFloat());
        break;
    case ValueKind::STRING:
        render_string(v.asString(), out);
        break;
    case ValueKind::TIMESTAMP:
        out += timestamp_to_string(v.asTimestamp());
        break;
    case ValueKind::ARRAY: {
        out += '[';
        bool first = true;
        for(const auto& item : v.asArray()) {
            if(!first) out += ", ";
            first = false;
            render(item, out);
        }
        out += ']';
        break;
    }
    case ValueKind::MAP: {
        out += '{';
        bool first = true;
        for(const auto& [k, item] : v.asMap()) {
            if(!first) out += ", ";
            first = false;
            render_string(k, out);
            out += " => ";
            render(item, out);
        }
        out += '}';
        break;
    }
    }
}

} // namespace value_detail

/// ISO-8601, UTC, microsecond precision: 2024-03-01T12:00:00.000000Z
inline std::string timestamp_to_string(Timestamp t) {
    using namespace std::chrono;
    auto dayPoint = floor<days>(t);
    year_month_day ymd{dayPoint};
    hh_mm_ss<microseconds> hms{floor<microseconds>(t - dayPoint)};

    std::string micros = std::to_string(hms.subseconds().count());
    micros.insert(0, 6 - micros.size(), '0');

    return std::to_string(static_cast<int>(ymd.year())) + "-"
        + value_detail::two_digits(static_cast<unsigned>(ymd.month())) + "-"
        + value_detail::two_digits(static_cast<unsigned>(ymd.day())) + "T"
        + value_detail::two_digits(static_cast<unsigned>(hms.hours().count())) + ":"
        + value_detail::two_digits(static_cast<unsigned>(hms.minutes().count())) + ":"
        + value_detail::two_digits(static_cast<unsigned>(hms.seconds().count())) + "."
        + micros + "Z";
}

/// Human-readable rendering used in error messages
inline std::string to_string(const Value& v) {
    std::string out;
    value_detail::render(v, out);
    return out;
}

} // namespace MapFusion
