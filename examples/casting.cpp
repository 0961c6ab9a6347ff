// Coercing loosely typed input (query strings, form data) into typed fields
// Compile: g++ -std=c++23 -I../include casting.cpp -o casting

#include <MapFusion/from_map.hpp>
#include <MapFusion/error_formatting.hpp>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <optional>
#include <string>

using namespace MapFusion;
using namespace MapFusion::options;

// Custom cast: upper-cases strings, rejects everything else
inline std::optional<std::string> upper(const Value & v) {
    const std::string * s = v.getIf<std::string>();
    if (!s) return std::nullopt;
    std::string ret = *s;
    std::transform(ret.begin(), ret.end(), ret.begin(), [](unsigned char c) { return std::toupper(c); });
    return ret;
}

struct SearchQuery {
    Annotated<std::string, cast_fn<&upper>>         country;
    Annotated<int, cast<"to_i">, defaulted>         page = 1;
    Annotated<std::optional<double>, cast<"to_f">>  min_price;
    Annotated<bool, cast<"to_b">, defaulted>        in_stock = false;
};

int main() {
    // everything arrives as strings
    Map params{
        {"country", "se"},
        {"page", "3"},
        {"min_price", "19.90"},
        {"in_stock", "true"},
    };

    auto q = FromMap<SearchQuery>(params);
    if (!q) {
        std::cout << ResultToString(q) << std::endl;
        return 1;
    }
    std::cout << "country=" << q->country.value
              << " page=" << q->page.value
              << " min_price=" << q->min_price->value_or(0)
              << " in_stock=" << std::boolalpha << q->in_stock.value << std::endl;

    // unparsable values fall back to defaults or nil
    auto sloppy = FromMap<SearchQuery>(Map{{"country", "no"}, {"page", "two"}, {"min_price", "cheap"}});
    if (!sloppy) {
        std::cout << ResultToString(sloppy) << std::endl;
        return 1;
    }
    std::cout << "sloppy: page=" << sloppy->page.value
              << " min_price set=" << sloppy->min_price->has_value() << std::endl;

    // a required field whose cast fails is a type mismatch
    auto bad = FromMap<SearchQuery>(Map{{"country", 46}});
    std::cout << "\n" << ResultToString(bad) << std::endl;
    return 0;
}
