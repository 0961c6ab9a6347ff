#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "test_helpers.hpp"

using namespace MapFusion;
using namespace MapFusion::options;
using namespace TestHelpers;

struct RequestParams {
    Annotated<int, cast<"to_i">>                       user_id;
    Annotated<std::optional<double>, cast<"to_f">>     score;
    Annotated<std::string, cast<"to_s">, defaulted>    label = "none";
    Annotated<std::optional<bool>, cast<"to_b">>       verbose;
};

inline std::optional<std::int64_t> squared(const Value & v) {
    std::optional<Value> i = casts::to_i(v);
    if(!i) return std::nullopt;
    return i->asInt() * i->asInt();
}

inline Timestamp from_epoch(const Value & v) {
    return Timestamp{std::chrono::seconds{v.isInt() ? v.asInt() : 0}};
}

// Reinterprets the stored int64 as unsigned
inline std::optional<std::uint64_t> as_unsigned(const Value & v) {
    if(!v.isInt()) return std::nullopt;
    return static_cast<std::uint64_t>(v.asInt());
}

struct Ticket {
    Annotated<std::int64_t, cast_fn<&as_unsigned>> serial;
};

struct Derived {
    Annotated<std::int64_t, key<"number">, cast_fn<&squared>> square;
    Annotated<Timestamp, cast_fn<&from_epoch>>                created;
};

int main() {
    std::cout << "=== Cast Tests ===\n\n";

    // Test 1: Named casts
    {
        std::cout << "Test 1: String parameters to typed fields... ";
        auto r = FromMap<RequestParams>(Map{
            {"user_id", "123"},
            {"score", "2.5"},
            {"label", 7},
            {"verbose", "true"},
        });
        assert(r);
        assert(r->user_id == 123);
        assert(*r->score.value == 2.5);
        assert(r->label == "7");
        assert(*r->verbose.value == true);
        std::cout << "PASSED\n";
    }

    // Test 2: Failed casts are type mismatches, rescued like any other
    {
        std::cout << "Test 2: Failing casts... ";
        auto bad = FromMap<RequestParams>(Map{{"user_id", "12abc"}});
        assert(!bad);
        assert(bad.error() == MarshalError::TYPE_MISMATCH);
        assert(bad.field() == "user_id");
        assert(bad.offendingValue() == Value("12abc"));

        auto rescued = FromMap<RequestParams>(Map{{"user_id", 4.9}, {"score", "high"}, {"verbose", "maybe"}});
        assert(rescued);
        assert(rescued->user_id == 4);
        assert(!rescued->score->has_value());
        assert(!rescued->verbose->has_value());
        assert(rescued->label == "none");
        std::cout << "PASSED\n";
    }

    // Test 3: nil through a cast
    {
        std::cout << "Test 3: nil input... ";
        auto r = FromMap<RequestParams>(Map{{"user_id", nullptr}});
        assert(!r);
        assert(r.error() == MarshalError::TYPE_MISMATCH);

        // to_s turns nil into ""
        auto s = FromMap<RequestParams>(Map{{"user_id", 1}, {"label", nullptr}});
        assert(s && s->label == "");
        std::cout << "PASSED\n";
    }

    // Test 4: Callable casts
    {
        std::cout << "Test 4: cast_fn... ";
        auto r = FromMap<Derived>(Map{{"number", "12"}, {"created", 60}});
        assert(r);
        assert(r->square == 144);
        assert(r->created.value == Timestamp{std::chrono::seconds{60}});

        // no cast back on export
        assert(ExportsAs(*r, Map{{"number", 144}, {"created", Timestamp{std::chrono::seconds{60}}}}));

        assert(ConstructFailsAt<Derived>(Map{{"number", true}, {"created", 0}},
                                         MarshalError::TYPE_MISMATCH, "square"));
        std::cout << "PASSED\n";
    }

    // Test 5: Named cast helpers
    {
        std::cout << "Test 5: to_i / to_f / to_s / to_b... ";
        assert(casts::to_i(Value("+42")) == Value(42));
        assert(casts::to_i(Value("-7")) == Value(-7));
        assert(!casts::to_i(Value("+-5")));
        assert(!casts::to_i(Value("++5")));
        assert(!casts::to_i(Value("+")));
        assert(!casts::to_i(Value("")));
        assert(!casts::to_i(Value(true)));
        assert(casts::to_i(Value(-3.7)) == Value(-3));
        assert(!casts::to_i(Value(1e300)));

        assert(casts::to_f(Value(3)) == Value(3.0));
        assert(casts::to_f(Value("1e3")) == Value(1000.0));
        assert(!casts::to_f(Value("1.5x")));
        assert(casts::to_f(Value("+0.5")) == Value(0.5));
        assert(!casts::to_f(Value("+-1")));

        assert(casts::to_s(Value(false)) == Value("false"));
        assert(casts::to_s(Value(12)) == Value("12"));
        assert(casts::to_s(Value(0.5)) == Value("0.5"));

        assert(casts::to_b(Value(0)) == Value(false));
        assert(casts::to_b(Value("false")) == Value(false));
        assert(!casts::to_b(Value("yes")));
        std::cout << "PASSED\n";
    }

    // Test 6: Unsigned cast results must fit the int64 storage
    {
        std::cout << "Test 6: cast_fn returning uint64... ";
        auto r = FromMap<Ticket>(Map{{"serial", 5}});
        assert(r);
        assert(r->serial == 5);

        auto wrapped = FromMap<Ticket>(Map{{"serial", -1}});
        assert(!wrapped);
        assert(wrapped.error() == MarshalError::TYPE_MISMATCH);
        assert(wrapped.field() == "serial");
        assert(wrapped.offendingValue() == Value(-1));
        assert(ConstructFails<Ticket>(Map{{"serial", "5"}}));
        std::cout << "PASSED\n";
    }

    std::cout << "\nAll cast tests passed!\n";
    return 0;
}
