#include <optional>
#include <string>

#include <MapFusion/casts.hpp>
#include <MapFusion/options.hpp>

using namespace MapFusion;
using namespace MapFusion::options;

namespace casts_test {

inline std::optional<std::string> upper_initial(const Value & v) {
    if(!v.isString() || v.asString().empty()) return std::nullopt;
    std::string s = v.asString();
    s[0] = static_cast<char>(s[0] - 32);
    return s;
}

inline double half(const Value & v) {
    return v.isInt() ? static_cast<double>(v.asInt()) / 2 : 0.0;
}

inline double wants_double(double d) { return d; }

}

static_assert(casts::find_named_cast("to_i") == casts::NamedCast::to_i);
static_assert(casts::find_named_cast("to_f") == casts::NamedCast::to_f);
static_assert(casts::find_named_cast("to_s") == casts::NamedCast::to_s);
static_assert(casts::find_named_cast("to_b") == casts::NamedCast::to_b);
static_assert(casts::find_named_cast("to_sym") == casts::NamedCast::unresolved);
static_assert(casts::find_named_cast("") == casts::NamedCast::unresolved);

static_assert(casts::is_resolvable<cast<"to_i">>());
static_assert(!casts::is_resolvable<cast<"upcase">>());

static_assert(casts::is_resolvable<cast_fn<&casts_test::upper_initial>>(), "optional-returning callable");
static_assert(casts::is_resolvable<cast_fn<&casts_test::half>>(), "plain callable");
static_assert(!casts::is_resolvable<cast_fn<&casts_test::wants_double>>(), "Value is not a double");

static_assert(casts::is_resolvable<cast_fn<[](const Value & v) { return v.isNil(); }>>(), "captureless lambda");
