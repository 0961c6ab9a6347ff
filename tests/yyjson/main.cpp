#include "MapFusion/yyjson.hpp"
#include "MapFusion/from_map.hpp"
#include "MapFusion/to_map.hpp"
#include "MapFusion/error_formatting.hpp"
#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <string>

using namespace MapFusion;
using namespace MapFusion::options;

struct Endpoint {
    std::string host;
    Annotated<int, defaulted> port = 80;
};

struct Deployment {
    std::string                 name;
    Endpoint                    primary;
    std::optional<Endpoint>     fallback;
    Array                       tags;
    double                      weight = 0;
    Unmapped<>                  extra;
};

int main() {
    std::cout << "=== yyjson Bridge Tests ===\n\n";

    // Test 1: JSON object to struct
    {
        std::cout << "Test 1: Read JSON object... ";
        const char* json = R"({
            "name": "api",
            "primary": {"host": "10.0.0.1", "port": 8080},
            "fallback": null,
            "tags": ["blue", 2, 1.5, false],
            "weight": 1,
            "region": "eu-west"
        })";
        Value doc;
        auto read = ReadJson(json, doc);
        assert(read);

        auto d = FromValue<Deployment>(doc);
        assert(d);
        assert(d->name == "api");
        assert(d->primary.host == "10.0.0.1");
        assert(d->primary.port == 8080);
        assert(!d->fallback.has_value());
        assert(d->tags.size() == 4);
        assert(d->tags[1] == Value(2));
        assert(d->tags[2] == Value(1.5));
        assert(d->weight == 1.0);
        assert(d->extra.at("region") == Value("eu-west"));
        std::cout << "PASSED\n";
    }

    // Test 2: Construction errors through a document
    {
        std::cout << "Test 2: Error path from JSON... ";
        Value doc;
        assert(ReadJson(R"({"name": "api", "primary": {"port": 1}, "tags": [], "weight": 0})", doc));
        auto d = FromValue<Deployment>(doc);
        assert(!d);
        assert(d.error() == MarshalError::MISSING_REQUIRED_FIELD);
        assert(d.errorPath().toString() == "$.primary.host");
        assert(ResultToString(d) ==
               "Value for key host is not present, and this field is not nilable and has no default.\n"
               "  parsing Endpoint#host");
        std::cout << "PASSED\n";
    }

    // Test 3: Integer range
    {
        std::cout << "Test 3: Integer limits... ";
        Value doc;
        assert(ReadJson("[9223372036854775807, -9223372036854775808]", doc));
        assert(doc.asArray()[0] == Value(std::numeric_limits<std::int64_t>::max()));
        assert(doc.asArray()[1] == Value(std::numeric_limits<std::int64_t>::min()));

        auto big = ReadJson("[18446744073709551615]", doc);
        assert(!big);
        assert(big.error() == DocumentError::UNSUPPORTED_VALUE);
        std::cout << "PASSED\n";
    }

    // Test 4: Malformed input
    {
        std::cout << "Test 4: Malformed JSON... ";
        Value doc = Value(1);
        auto r = ReadJson(R"({"a": 1,})", doc);
        assert(!r);
        assert(r.error() == DocumentError::ILLFORMED_DOCUMENT);
        assert(!r.message().empty());
        assert(doc == Value(1));
        std::cout << "PASSED\n";
    }

    // Test 5: Compact writer output
    {
        std::cout << "Test 5: Write JSON... ";
        std::string out;
        auto w = WriteJson(Value(Map{{"b", Array{true, nullptr}}, {"a", 1}, {"c", "x\"y"}}), out);
        assert(w);
        assert(out == R"({"a":1,"b":[true,null],"c":"x\"y"})");

        Value stamp = Value(Map{{"at", Timestamp{}}});
        assert(WriteJson(stamp, out));
        assert(out == R"({"at":"1970-01-01T00:00:00.000000Z"})");
        std::cout << "PASSED\n";
    }

    // Test 6: Struct -> JSON -> struct
    {
        std::cout << "Test 6: Document round trip... ";
        Deployment d;
        d.name = "batch";
        d.primary.host = "h";
        d.fallback = Endpoint{"f", 9};
        d.tags = Array{"x", 2.5};
        d.weight = 0.25;
        d.extra["owner"] = "ops";

        std::string out;
        assert(WriteJson(ToValue(d), out, true));

        Value doc;
        assert(ReadJson(out, doc));
        assert(doc == ToValue(d));

        auto back = FromValue<Deployment>(doc);
        assert(back);
        assert(back->fallback->port == 9);
        assert(back->extra.at("owner") == Value("ops"));
        std::cout << "PASSED\n";
    }

    // Test 7: Values JSON cannot carry
    {
        std::cout << "Test 7: Non-finite floats... ";
        std::string out;
        auto r = WriteJson(Value(Array{std::numeric_limits<double>::quiet_NaN()}), out);
        assert(!r);
        assert(r.error() == DocumentError::UNSUPPORTED_VALUE);
        std::cout << "PASSED\n";
    }

    std::cout << "\nAll yyjson tests passed!\n";
    return 0;
}
