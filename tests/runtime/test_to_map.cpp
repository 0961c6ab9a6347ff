#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>

#include "test_helpers.hpp"

using namespace MapFusion;
using namespace MapFusion::options;
using namespace TestHelpers;

struct Engine {
    Annotated<int, key<"hp">> horsepower = 0;
    std::optional<std::string> model;
};

struct Car {
    std::string                             make;
    Engine                                  engine;
    std::optional<Engine>                   spare;
    Annotated<std::string, ignore_on_write> password;
    Annotated<int, ignore>                  cachedHash = 0;
    Annotated<bool, key<"is-electric">>     electric = false;
};

struct Event {
    std::string name;
    Timestamp   at;
    Array       tags;
};

struct Tagged {
    int        a = 0;
    Unmapped<> rest;
};

int main() {
    std::cout << "=== ToMap Tests ===\n\n";

    // Test 1: Keys, nesting, nil
    {
        std::cout << "Test 1: Export shape... ";
        Car car;
        car.make = "Volvo";
        car.engine.horsepower = 250;
        car.password = "hunter2";
        car.cachedHash = 17;

        Map expected{
            {"make", "Volvo"},
            {"engine", Map{{"hp", 250}, {"model", nullptr}}},
            {"spare", nullptr},
            {"is-electric", false},
        };
        assert(ExportsAs(car, expected));
        std::cout << "PASSED\n";
    }

    // Test 2: Output keys are exactly the writable ones
    {
        std::cout << "Test 2: Key set... ";
        Car car;
        car.spare = Engine{300, "V8"};
        Map out = ToMap(car);
        assert(out.size() == 4);
        assert(!out.contains("password"));
        assert(!out.contains("cachedHash"));
        assert(out.at("spare") == Value(Map{{"hp", 300}, {"model", "V8"}}));
        std::cout << "PASSED\n";
    }

    // Test 3: Round trip
    {
        std::cout << "Test 3: FromMap(ToMap(obj)) == obj... ";
        Engine e{120, "I4"};
        assert(RoundTrips(e));

        Event ev{"launch", Timestamp{std::chrono::seconds{1700000000}}, Array{"a", 1}};
        assert(RoundTrips(ev));

        Car car;
        car.make = "Saab";
        car.spare = Engine{90, std::nullopt};
        car.electric = true;
        assert(RoundTrips(car, [](const Car & a, const Car & b) {
            return a.make == b.make
                && pfr::eq_fields(a.engine, b.engine)
                && a.spare.has_value() == b.spare.has_value()
                && pfr::eq_fields(*a.spare, *b.spare)
                && a.electric == b.electric;
        }));
        std::cout << "PASSED\n";
    }

    // Test 4: Declared keys win over captured ones
    {
        std::cout << "Test 4: Unmapped merge precedence... ";
        Tagged t;
        t.a = 1;
        t.rest["a"] = 99;
        t.rest["b"] = 2;
        assert(ExportsAs(t, Map{{"a", 1}, {"b", 2}}));
        std::cout << "PASSED\n";
    }

    // Test 5: ToValue
    {
        std::cout << "Test 5: ToValue... ";
        Engine e{1, "x"};
        Value v = ToValue(e);
        assert(v.isMap());
        assert(v.asMap() == ToMap(e));
        assert(to_string(v) == R"({"hp" => 1, "model" => "x"})");
        std::cout << "PASSED\n";
    }

    std::cout << "\nAll ToMap tests passed!\n";
    return 0;
}
